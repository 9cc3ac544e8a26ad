#include "model/CaseData.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <vector>

using namespace transdist;

TEST(CaseDataTest, MakeCaseTableAssignsIds) {
    CaseTable cases = makeCaseTable({1, 2, 3}, {4, 5, 6}, {0, 2, 1});
    ASSERT_EQ(cases.size(), 3u);
    EXPECT_EQ(cases[2].id, 2);
    EXPECT_DOUBLE_EQ(cases[1].y, 5.0);
    EXPECT_THROW(makeCaseTable({1, 2}, {1}, {1, 2}), ShapeMismatchError);
}

TEST(CaseDataTest, UniqueTimesAndBuckets) {
    CaseTable cases = makeCaseTable({0, 0, 0, 0}, {0, 0, 0, 0}, {3, 1, 3, 2});
    const std::vector<double> times = uniqueOnsetTimes(cases);
    EXPECT_EQ(times, (std::vector<double>{1, 2, 3}));
    EXPECT_EQ(timeBucketIndices(cases, times), (std::vector<int>{2, 0, 2, 1}));
    EXPECT_THROW(timeBucketIndices(cases, std::vector<double>{1, 2}), ShapeMismatchError);
}

TEST(CaseDataTest, Filters) {
    CaseTable cases = makeCaseTable({0, 1, 2, 3}, {0, 0, 0, 0}, {3, 1, 3, 2});
    CaseTable from = filterCasesFrom(cases, 2.0);
    ASSERT_EQ(from.size(), 3u);
    EXPECT_EQ(from[0].id, 0);
    EXPECT_EQ(from[1].id, 2);
    CaseTable upto = filterCasesUpTo(cases, 2.0);
    ASSERT_EQ(upto.size(), 2u);
    EXPECT_EQ(upto[0].id, 1);
    EXPECT_EQ(upto[1].id, 3);
}

TEST(CaseDataTest, ValidateRejectsNonFinite) {
    CaseTable cases = makeCaseTable({0, 1}, {0, 0}, {0, 1});
    EXPECT_NO_THROW(validateCaseTable(cases, "test"));
    cases[1].t = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validateCaseTable(cases, "test"), DomainError);
}

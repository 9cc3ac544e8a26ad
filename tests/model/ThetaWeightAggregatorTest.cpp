#include "model/ThetaWeightAggregator.hpp"
#include "exceptions/Exceptions.hpp"
#include "OutbreakSimulator.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace transdist;

class ThetaWeightAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::OutbreakConfig config;
        config.min_cases = 30;
        config.max_cases = 120;
        cases_ = test::simulateOutbreak(config, 2024);
    }

    CaseTable cases_;
    GenerationTimeDistribution one_step_ = GenerationTimeDistribution::fromVector({0.0, 1.0});
};

TEST_F(ThetaWeightAggregatorTest, SameSeedGivesIdenticalTensor) {
    ThetaWeightAggregator aggregator(20, 10);
    ThetaTensor a = aggregator.aggregate(cases_, one_step_, true, 99);
    ThetaTensor b = aggregator.aggregate(cases_, one_step_, true, 99);
    for (int theta = 1; theta <= 10; ++theta) {
        EXPECT_TRUE(a.layer(theta) == b.layer(theta)) << "theta " << theta;
    }
}

TEST_F(ThetaWeightAggregatorTest, ParallelMatchesSequential) {
    // More repetitions than one block of draws.
    ThetaWeightAggregator aggregator(70, 10);
    ThetaTensor sequential = aggregator.aggregate(cases_, one_step_, true, 5, WorkerPool::sequential());
    ThetaTensor parallel = aggregator.aggregate(cases_, one_step_, true, 5, WorkerPool(ParallelConfig{true, 4}));
    for (int theta = 1; theta <= 10; ++theta) {
        EXPECT_TRUE(sequential.layer(theta) == parallel.layer(theta)) << "theta " << theta;
    }
}

TEST_F(ThetaWeightAggregatorTest, DefinedSlicesSumToOne) {
    ThetaWeightAggregator aggregator(15, 6);
    ThetaTensor theta = aggregator.aggregate(cases_, one_step_, true, 11);
    int defined = 0;
    for (int i = 0; i < theta.numTimes(); ++i) {
        for (int j = 0; j < theta.numTimes(); ++j) {
            const double s = theta.sliceSum(i, j);
            EXPECT_TRUE(s == 0.0 || std::abs(s - 1.0) < 1e-9) << "slice (" << i << ", " << j << ") sums to " << s;
            if (s > 0.0) ++defined;
        }
    }
    EXPECT_GT(defined, 0);
}

TEST_F(ThetaWeightAggregatorTest, DifferentSeedsDiffer) {
    ThetaWeightAggregator aggregator(3, 20);
    ThetaTensor a = aggregator.aggregate(cases_, one_step_, true, 1);
    ThetaTensor b = aggregator.aggregate(cases_, one_step_, true, 2);
    bool any_difference = false;
    for (int theta = 1; theta <= 20; ++theta) {
        if (!(a.layer(theta) == b.layer(theta))) any_difference = true;
    }
    EXPECT_TRUE(any_difference);
}

TEST_F(ThetaWeightAggregatorTest, SuppliedWeightsMustMatchTimes) {
    ThetaWeightAggregator aggregator(2, 5);
    WallingaTeunisMatrix wrong({0.0, 1.0}, Eigen::MatrixXd::Zero(2, 2));
    EXPECT_THROW(aggregator.aggregate(cases_, one_step_, true, 1, WorkerPool(), wrong), ShapeMismatchError);
}

TEST(ThetaWeightAggregatorConstruction, InvalidArgumentsThrow) {
    EXPECT_THROW(ThetaWeightAggregator(0, 5), InvalidParameterException);
    EXPECT_THROW(ThetaWeightAggregator(5, 0), InvalidParameterException);
}

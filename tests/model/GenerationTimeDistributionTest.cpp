#include "model/GenerationTimeDistribution.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace transdist;

TEST(GenerationTimeDistributionTest, FromVectorNormalizes) {
    auto g = GenerationTimeDistribution::fromVector({0.0, 2.0, 1.0, 1.0});
    EXPECT_EQ(g.maxLag(), 3);
    EXPECT_DOUBLE_EQ(g.density(0), 0.0);
    EXPECT_DOUBLE_EQ(g.density(1), 0.5);
    EXPECT_DOUBLE_EQ(g.density(2), 0.25);
    EXPECT_NEAR(g.getProbabilities().sum(), 1.0, 1e-12);
}

TEST(GenerationTimeDistributionTest, DensityOutsideSupportIsZero) {
    auto g = GenerationTimeDistribution::fromVector({0.2, 0.8});
    EXPECT_DOUBLE_EQ(g.density(-1), 0.0);
    EXPECT_DOUBLE_EQ(g.density(2), 0.0);
    EXPECT_DOUBLE_EQ(g.densityAt(0.9), 0.8);
    EXPECT_DOUBLE_EQ(g.densityAt(5.0), 0.0);
}

TEST(GenerationTimeDistributionTest, RejectsInvalidVectors) {
    EXPECT_THROW(GenerationTimeDistribution::fromVector({}), DomainError);
    EXPECT_THROW(GenerationTimeDistribution::fromVector({0.0, 0.0}), DomainError);
    EXPECT_THROW(GenerationTimeDistribution::fromVector({0.5, -0.1}), DomainError);
    EXPECT_THROW(GenerationTimeDistribution::fromVector({0.5, std::numeric_limits<double>::quiet_NaN()}), DomainError);
}

TEST(GenerationTimeDistributionTest, FromMeanSdGammaMatchesMoments) {
    auto g = GenerationTimeDistribution::fromMeanSd(7.0, 2.0, GenerationTimeFamily::Gamma);
    EXPECT_EQ(g.maxLag(), 27);
    EXPECT_NEAR(g.getProbabilities().sum(), 1.0, 1e-12);
    // Binning on [k-0.5, k+0.5) keeps the mean close to the continuous one.
    EXPECT_NEAR(g.mean(), 7.0, 0.1);
    EXPECT_GE(g.getProbabilities().minCoeff(), 0.0);
}

TEST(GenerationTimeDistributionTest, FromMeanSdNormalIsSymmetricAroundMean) {
    auto g = GenerationTimeDistribution::fromMeanSd(5.0, 1.0, GenerationTimeFamily::Normal);
    EXPECT_NEAR(g.density(4), g.density(6), 1e-12);
    EXPECT_GT(g.density(5), g.density(4));
    EXPECT_NEAR(g.mean(), 5.0, 1e-4);
}

TEST(GenerationTimeDistributionTest, FromMeanSdRejectsNonPositive) {
    EXPECT_THROW(GenerationTimeDistribution::fromMeanSd(0.0, 1.0), DomainError);
    EXPECT_THROW(GenerationTimeDistribution::fromMeanSd(3.0, -1.0), DomainError);
    EXPECT_THROW(GenerationTimeDistribution::fromMeanSd(std::numeric_limits<double>::infinity(), 1.0), DomainError);
}

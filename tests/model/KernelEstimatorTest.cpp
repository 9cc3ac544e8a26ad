#include "model/KernelEstimator.hpp"
#include "model/ThetaWeightAggregator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "OutbreakSimulator.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using namespace transdist;

namespace {

const double kSqrt2Pi = std::sqrt(2.0 * M_PI);

double sampleSd(const std::vector<double>& values) {
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());
    double ss = 0.0;
    for (double v : values) ss += (v - mean) * (v - mean);
    return std::sqrt(ss / static_cast<double>(values.size() - 1));
}

} // namespace

class KernelEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        settings_.max_sep = 5;
        settings_.n_transtree_reps = 4;
    }

    KernelEstimator makeEstimator() const {
        return KernelEstimator(one_step_, settings_);
    }

    // A chain 0 -> 1 -> 2 along the x axis, one unit per step.
    CaseTable chain_ = makeCaseTable({0, 1, 2}, {0, 0, 0}, {0, 1, 2});
    GenerationTimeDistribution one_step_ = GenerationTimeDistribution::fromVector({0.0, 1.0});
    TransdistSettings settings_;
};

TEST_F(KernelEstimatorTest, ChainEstimate) {
    KernelEstimate e = makeEstimator().estimate(chain_, 1, WorkerPool());
    // Pairs (0,1) and (1,2): theta = 1, d = 1. Pair (0,2): theta = 2, d = 2.
    const double expected = (2.0 * 1.0 / kSqrt2Pi + 2.0 * 1.0 / kSqrt2Pi + 2.0 * 2.0 / std::sqrt(4.0 * M_PI)) / 3.0;
    EXPECT_NEAR(e.mu, expected, 1e-12);
    EXPECT_DOUBLE_EQ(e.sigma, e.mu);
    EXPECT_EQ(e.n_pairs, 3);
    EXPECT_EQ(e.n_cases, 3);
    EXPECT_DOUBLE_EQ(e.t_start, 0.0);
    EXPECT_DOUBLE_EQ(e.t_end, 2.0);
    ASSERT_TRUE(e.mu_bound.has_value());
    ASSERT_TRUE(e.sigma_bound.has_value());
    EXPECT_NEAR(*e.mu_bound, std::sqrt(2.0) * e.mu, 1e-12);
    EXPECT_NEAR(*e.sigma_bound, std::sqrt(2.0) * e.sigma, 1e-12);
}

TEST_F(KernelEstimatorTest, MaxDistExcludesFarPairs) {
    settings_.max_dist = 1.5;
    KernelEstimate e = makeEstimator().estimate(chain_, 1, WorkerPool());
    EXPECT_EQ(e.n_pairs, 2);
    EXPECT_NEAR(e.mu, 2.0 / kSqrt2Pi, 1e-12);
}

TEST_F(KernelEstimatorTest, MaxSepExcludesDistantGenerations) {
    settings_.max_sep = 1;
    KernelEstimate e = makeEstimator().estimate(chain_, 1, WorkerPool());
    EXPECT_EQ(e.n_pairs, 2);
    EXPECT_NEAR(e.mu, 2.0 / kSqrt2Pi, 1e-12);
}

TEST_F(KernelEstimatorTest, MeanEqualsSdDropsBounds) {
    settings_.mean_equals_sd = true;
    KernelEstimate e = makeEstimator().estimate(chain_, 1, WorkerPool());
    EXPECT_FALSE(e.mu_bound.has_value());
    EXPECT_FALSE(e.sigma_bound.has_value());
}

TEST_F(KernelEstimatorTest, T1FiltersEarlyCases) {
    settings_.t1 = 1.0;
    KernelEstimator estimator = makeEstimator();
    EXPECT_EQ(estimator.selectCases(chain_).size(), 2u);
    KernelEstimate e = estimator.estimate(chain_, 1, WorkerPool());
    EXPECT_EQ(e.n_cases, 2);
    EXPECT_EQ(e.n_pairs, 1);
    EXPECT_DOUBLE_EQ(e.t_start, 1.0);
    EXPECT_NEAR(e.mu, 2.0 / kSqrt2Pi, 1e-12);
}

TEST_F(KernelEstimatorTest, CopiesOfOneCaseAreNotPaired) {
    // Case 0 appears twice, as a bootstrap resample would produce.
    CaseTable cases = {chain_[0], chain_[0], chain_[1], chain_[2]};
    KernelEstimate e = makeEstimator().estimate(cases, 3, WorkerPool());
    EXPECT_EQ(e.n_pairs, 5);
    const double expected = (2.0 * (1.0 + 1.0) / kSqrt2Pi + 2.0 * 1.0 / kSqrt2Pi +
                             2.0 * (2.0 + 2.0) / std::sqrt(4.0 * M_PI)) / 5.0;
    EXPECT_NEAR(e.mu, expected, 1e-12);
}

TEST_F(KernelEstimatorTest, InsufficientData) {
    KernelEstimator estimator = makeEstimator();
    CaseTable single_time = makeCaseTable({0, 1, 2}, {0, 0, 0}, {4, 4, 4});
    EXPECT_THROW(estimator.estimate(single_time, 1, WorkerPool()), InsufficientDataError);
    EXPECT_THROW(estimator.estimate(CaseTable{}, 1, WorkerPool()), InsufficientDataError);

    settings_.max_dist = 0.5;
    EXPECT_THROW(makeEstimator().estimate(chain_, 1, WorkerPool()), InsufficientDataError);

    // Lag 2 is outside the support: no case has an infector, no pair is linked.
    CaseTable unlinked = makeCaseTable({0, 1}, {0, 0}, {0, 2});
    EXPECT_THROW(estimator.estimate(unlinked, 1, WorkerPool()), InsufficientDataError);
}

TEST_F(KernelEstimatorTest, InvalidSettingsThrow) {
    settings_.max_dist = -1.0;
    EXPECT_THROW(makeEstimator(), DomainError);
    settings_.max_dist = 10.0;
    settings_.n_transtree_reps = 0;
    EXPECT_THROW(makeEstimator(), InvalidParameterException);
}

TEST_F(KernelEstimatorTest, NonFiniteCoordinatesThrow) {
    CaseTable cases = chain_;
    cases[1].x = std::nan("");
    EXPECT_THROW(makeEstimator().estimate(cases, 1, WorkerPool()), DomainError);
}

TEST_F(KernelEstimatorTest, PrecomputedThetaIsUsed) {
    KernelEstimator estimator = makeEstimator();
    ThetaTensor theta({0.0, 1.0, 2.0}, 5);
    theta.at(0, 1, 1) = 1.0;
    theta.at(1, 0, 1) = 1.0;
    KernelEstimate e = estimator.estimateWithTheta(chain_, theta);
    EXPECT_EQ(e.n_pairs, 1);
    EXPECT_NEAR(e.mu, 2.0 / kSqrt2Pi, 1e-12);

    ThetaTensor mismatched({0.0, 1.0}, 5);
    EXPECT_THROW(estimator.estimateWithTheta(chain_, mismatched), ShapeMismatchError);
}

TEST_F(KernelEstimatorTest, SuppliedWeightMatrixMustMatch) {
    KernelEstimator estimator = makeEstimator();
    auto weights = WallingaTeunisMatrix::build(onsetTimes(chain_), one_step_);
    KernelEstimate with_weights = estimator.estimate(chain_, 1, WorkerPool(), weights);
    KernelEstimate without = estimator.estimate(chain_, 1, WorkerPool());
    EXPECT_EQ(with_weights.mu, without.mu);

    WallingaTeunisMatrix wrong({0.0, 1.0}, Eigen::MatrixXd::Zero(2, 2));
    EXPECT_THROW(estimator.estimate(chain_, 1, WorkerPool(), wrong), ShapeMismatchError);
}

class KernelEstimatorOutbreakTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        settings_.max_sep = 25;
        settings_.n_transtree_reps = 10;
    }

    static CaseTable outbreak(unsigned long seed, int max_cases) {
        test::OutbreakConfig config;
        config.max_cases = max_cases;
        return test::simulateOutbreak(config, seed);
    }

    GenerationTimeDistribution one_step_ = GenerationTimeDistribution::fromVector({0.0, 1.0});
    TransdistSettings settings_;
};

TEST_F(KernelEstimatorOutbreakTest, SameSeedIsBitIdentical) {
    const CaseTable cases = outbreak(17, 200);
    KernelEstimator estimator(one_step_, settings_);
    KernelEstimate a = estimator.estimate(cases, 123, WorkerPool());
    KernelEstimate b = estimator.estimate(cases, 123, WorkerPool());
    EXPECT_EQ(a.mu, b.mu);
    EXPECT_EQ(a.n_pairs, b.n_pairs);

    KernelEstimate parallel = estimator.estimate(cases, 123, WorkerPool(ParallelConfig{true, 3}));
    EXPECT_EQ(a.mu, parallel.mu);
}

TEST_F(KernelEstimatorOutbreakTest, MoreRepetitionsReduceSpread) {
    const CaseTable cases = outbreak(31, 150);
    auto spread = [&](int reps) {
        settings_.n_transtree_reps = reps;
        KernelEstimator estimator(one_step_, settings_);
        std::vector<double> mus;
        for (unsigned long seed = 1; seed <= 8; ++seed) {
            mus.push_back(estimator.estimate(cases, seed, WorkerPool()).mu);
        }
        return sampleSd(mus);
    };
    const double few = spread(2);
    const double many = spread(50);
    EXPECT_LT(many, few);
}

TEST_F(KernelEstimatorOutbreakTest, RecoversSimulatedKernel) {
    // Per-axis displacement sd 1, Poisson(1.5) offspring, one step per generation.
    settings_.n_transtree_reps = 50;
    KernelEstimator estimator(one_step_, settings_);
    const WorkerPool pool(ParallelConfig{true, 0});
    double total = 0.0;
    const int n_outbreaks = 4;
    for (int k = 0; k < n_outbreaks; ++k) {
        const CaseTable cases = outbreak(100 + k, 600);
        ASSERT_GE(cases.size(), 100u);
        total += estimator.estimate(cases, 7 + k, pool).mu;
    }
    EXPECT_NEAR(total / n_outbreaks, 1.0, 0.2);
}

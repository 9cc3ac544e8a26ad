#include "model/BootstrapEstimator.hpp"
#include "model/KernelEstimator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "FakeKernelEstimator.hpp"
#include "OutbreakSimulator.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <set>

using namespace transdist;

class BootstrapEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::WARNING);
        // x = 0..99 over ten onset times: the mean of x is 49.5.
        std::vector<double> x, y, t;
        for (int i = 0; i < 100; ++i) {
            x.push_back(i);
            y.push_back(0.0);
            t.push_back(i % 10);
        }
        cases_ = makeCaseTable(x, y, t);
        fake_ = std::make_shared<test::FakeKernelEstimator>();
    }

    CaseTable cases_;
    std::shared_ptr<test::FakeKernelEstimator> fake_;
};

TEST_F(BootstrapEstimatorTest, IntervalBracketsPointEstimate) {
    BootstrapEstimator bootstrap(fake_, 200, 0.025, 0.975);
    BootstrapResult r = bootstrap.run(cases_, 1);
    EXPECT_DOUBLE_EQ(r.estimate.mu, 49.5);
    EXPECT_EQ(r.iterations, 200);
    EXPECT_EQ(r.mu_replicates.size(), 200u);
    EXPECT_LE(r.mu_ci_low, r.estimate.mu);
    EXPECT_GE(r.mu_ci_high, r.estimate.mu);
    EXPECT_LE(r.sigma_ci_low, r.estimate.sigma);
    EXPECT_GE(r.sigma_ci_high, r.estimate.sigma);
    // Standard error of the mean of 0..99 is about 2.9.
    EXPECT_NEAR(r.mu_replicate_mean, 49.5, 1.5);
    EXPECT_NEAR(r.mu_replicate_sd, 2.9, 1.0);
    // One point estimate plus one per resample.
    EXPECT_EQ(fake_->calls.load(), 201);
}

TEST_F(BootstrapEstimatorTest, ResamplesKeepIdsAndSize) {
    CaseTable sample = BootstrapEstimator::resample(cases_, 9, 0);
    ASSERT_EQ(sample.size(), cases_.size());
    std::set<int> distinct;
    for (const auto& c : sample) {
        ASSERT_GE(c.id, 0);
        ASSERT_LT(c.id, 100);
        EXPECT_DOUBLE_EQ(c.x, cases_[c.id].x);
        EXPECT_DOUBLE_EQ(c.t, cases_[c.id].t);
        distinct.insert(c.id);
    }
    // Sampling with replacement repeats some cases.
    EXPECT_LT(distinct.size(), cases_.size());

    CaseTable again = BootstrapEstimator::resample(cases_, 9, 0);
    CaseTable other = BootstrapEstimator::resample(cases_, 9, 1);
    bool same = true, differs = false;
    for (size_t k = 0; k < sample.size(); ++k) {
        same = same && sample[k].id == again[k].id;
        differs = differs || sample[k].id != other[k].id;
    }
    EXPECT_TRUE(same);
    EXPECT_TRUE(differs);
}

TEST_F(BootstrapEstimatorTest, ParallelMatchesSequential) {
    BootstrapEstimator bootstrap(fake_, 50, 0.1, 0.9);
    BootstrapResult sequential = bootstrap.run(cases_, 4, WorkerPool::sequential());
    BootstrapResult parallel = bootstrap.run(cases_, 4, WorkerPool(ParallelConfig{true, 4}));
    EXPECT_EQ(sequential.mu_replicates, parallel.mu_replicates);
    EXPECT_EQ(sequential.mu_ci_low, parallel.mu_ci_low);
    EXPECT_EQ(sequential.mu_ci_high, parallel.mu_ci_high);
}

TEST_F(BootstrapEstimatorTest, ResampleOnlySelectedCases) {
    fake_->t1 = 5.0;
    BootstrapEstimator bootstrap(fake_, 20, 0.025, 0.975);
    fake_->hook = [](const CaseTable& selected) {
        for (const auto& c : selected) {
            if (c.t < 5.0) throw DomainError("hook", "case before t1 reached the estimator");
        }
    };
    BootstrapResult r = bootstrap.run(cases_, 2);
    EXPECT_EQ(r.estimate.n_cases, 50);
    for (double mu : r.mu_replicates) {
        EXPECT_GE(mu, 5.0);
    }
}

TEST_F(BootstrapEstimatorTest, FailingIterationFailsTheCall) {
    BootstrapEstimator bootstrap(fake_, 30, 0.025, 0.975);
    // The point estimate sees every id; a resample missing id 0 fails.
    fake_->hook = [](const CaseTable& selected) {
        const bool has_zero = std::any_of(selected.begin(), selected.end(), [](const Case& c) { return c.id == 0; });
        if (!has_zero) THROW_INSUFFICIENT_DATA("hook", "id 0 missing");
    };
    EXPECT_THROW(bootstrap.run(cases_, 1), InsufficientDataError);
    EXPECT_THROW(bootstrap.run(cases_, 1, WorkerPool(ParallelConfig{true, 2})), InsufficientDataError);
}

TEST_F(BootstrapEstimatorTest, InvalidConfigurationThrows) {
    EXPECT_THROW(BootstrapEstimator(nullptr, 10, 0.025, 0.975), InvalidParameterException);
    EXPECT_THROW(BootstrapEstimator(fake_, 0, 0.025, 0.975), InvalidParameterException);
    EXPECT_THROW(BootstrapEstimator(fake_, 10, 0.9, 0.1), InvalidParameterException);
    EXPECT_THROW(BootstrapEstimator(fake_, 10, -0.1, 0.5), InvalidParameterException);
    EXPECT_THROW(BootstrapEstimator(fake_, 10, 0.5, 1.5), InvalidParameterException);
}

TEST(EmpiricalQuantileTest, InterpolatesBetweenOrderStatistics) {
    EXPECT_DOUBLE_EQ(empiricalQuantile({3.0, 1.0, 2.0, 4.0}, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(empiricalQuantile({3.0, 1.0, 2.0, 4.0}, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(empiricalQuantile({3.0, 1.0, 2.0, 4.0}, 0.5), 2.5);
    EXPECT_THROW(empiricalQuantile({}, 0.5), InsufficientDataError);
}

TEST(BootstrapKernelTest, IntervalAroundKernelEstimate) {
    Logger::getInstance().setLogLevel(LogLevel::WARNING);
    test::OutbreakConfig config;
    config.max_cases = 150;
    const CaseTable cases = test::simulateOutbreak(config, 77);

    TransdistSettings settings;
    settings.max_sep = 25;
    settings.n_transtree_reps = 5;
    auto estimator = std::make_shared<KernelEstimator>(GenerationTimeDistribution::fromVector({0.0, 1.0}), settings);
    BootstrapEstimator bootstrap(estimator, 20, 0.025, 0.975);
    BootstrapResult r = bootstrap.run(cases, 3, WorkerPool(ParallelConfig{true, 0}));

    EXPECT_EQ(r.iterations, 20);
    EXPECT_TRUE(std::isfinite(r.mu_ci_low));
    EXPECT_TRUE(std::isfinite(r.mu_ci_high));
    EXPECT_LE(r.mu_ci_low, r.mu_ci_high);
    EXPECT_GT(r.mu_ci_low, 0.0);
    EXPECT_GE(r.mu_replicate_sd, 0.0);
}

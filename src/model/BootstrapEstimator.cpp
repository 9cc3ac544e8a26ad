#include "model/BootstrapEstimator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/RandomUtils.hpp"

#include <gsl/gsl_statistics_double.h>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace transdist {

namespace {

struct ReplicateSummary {
    double mean = 0.0;
    double sd = 0.0;
};

ReplicateSummary summarize(const std::vector<double>& values) {
    namespace ba = boost::accumulators;
    ba::accumulator_set<double, ba::stats<ba::tag::mean, ba::tag::variance>> acc;
    for (double v : values) {
        acc(v);
    }
    ReplicateSummary summary;
    summary.mean = ba::mean(acc);
    const double n = static_cast<double>(values.size());
    // Sample standard deviation; the accumulator's variance divides by n.
    summary.sd = n > 1.0 ? std::sqrt(ba::variance(acc) * n / (n - 1.0)) : 0.0;
    return summary;
}

} // namespace

double empiricalQuantile(std::vector<double> values, double probability) {
    if (values.empty()) {
        THROW_INSUFFICIENT_DATA("empiricalQuantile", "No values to take a quantile of.");
    }
    std::sort(values.begin(), values.end());
    return gsl_stats_quantile_from_sorted_data(values.data(), 1, values.size(), probability);
}

BootstrapEstimator::BootstrapEstimator(std::shared_ptr<const IKernelEstimator> estimator,
                                       int boot_iter, double ci_low, double ci_high)
    : estimator_(std::move(estimator)), boot_iter_(boot_iter), ci_low_(ci_low), ci_high_(ci_high)
{
    const std::string funcName = "BootstrapEstimator::BootstrapEstimator";
    if (!estimator_) {
        THROW_INVALID_PARAM(funcName, "Kernel estimator cannot be null.");
    }
    if (boot_iter_ < 1) {
        THROW_INVALID_PARAM(funcName, "boot_iter must be at least 1, got " + std::to_string(boot_iter_) + ".");
    }
    if (!(ci_low_ >= 0.0 && ci_high_ <= 1.0 && ci_low_ <= ci_high_)) {
        THROW_INVALID_PARAM(funcName, "ci_low and ci_high must satisfy 0 <= ci_low <= ci_high <= 1.");
    }
}

CaseTable BootstrapEstimator::resample(const CaseTable& selected, unsigned long seed, int iteration) {
    GslRng rng(deriveSeed(seed, SeedStream::BootstrapResample, static_cast<std::size_t>(iteration)));
    const unsigned long n = selected.size();
    CaseTable sample;
    sample.reserve(selected.size());
    for (unsigned long k = 0; k < n; ++k) {
        sample.push_back(selected[rng.uniformInt(n)]);
    }
    return sample;
}

BootstrapResult BootstrapEstimator::run(const CaseTable& cases, unsigned long seed, const WorkerPool& pool) const {
    const std::string funcName = "BootstrapEstimator::run";
    Logger& logger = Logger::getInstance();

    BootstrapResult result;
    result.estimate = estimator_->estimate(cases, seed, pool);

    const CaseTable selected = estimator_->selectCases(cases);
    const WorkerPool inner = pool.nested();
    result.mu_replicates.assign(static_cast<size_t>(boot_iter_), 0.0);
    result.sigma_replicates.assign(static_cast<size_t>(boot_iter_), 0.0);

    logger.debug(funcName, "Running " + std::to_string(boot_iter_) + " resamples of " +
        std::to_string(selected.size()) + " cases.");
    try {
        pool.forEach(boot_iter_, [&](int i) {
            const CaseTable sample = resample(selected, seed, i);
            const KernelEstimate replicate = estimator_->estimate(
                sample, deriveSeed(seed, SeedStream::BootstrapEstimate, static_cast<std::size_t>(i)), inner);
            result.mu_replicates[i] = replicate.mu;
            result.sigma_replicates[i] = replicate.sigma;
        });
    } catch (const TransdistException& e) {
        logger.error(funcName, std::string("Bootstrap aborted: ") + e.what());
        throw;
    }

    result.iterations = boot_iter_;
    result.mu_ci_low = empiricalQuantile(result.mu_replicates, ci_low_);
    result.mu_ci_high = empiricalQuantile(result.mu_replicates, ci_high_);
    result.sigma_ci_low = empiricalQuantile(result.sigma_replicates, ci_low_);
    result.sigma_ci_high = empiricalQuantile(result.sigma_replicates, ci_high_);

    const ReplicateSummary mu_summary = summarize(result.mu_replicates);
    const ReplicateSummary sigma_summary = summarize(result.sigma_replicates);
    result.mu_replicate_mean = mu_summary.mean;
    result.mu_replicate_sd = mu_summary.sd;
    result.sigma_replicate_mean = sigma_summary.mean;
    result.sigma_replicate_sd = sigma_summary.sd;

    logger.info(funcName, "mu = " + std::to_string(result.estimate.mu) + " [" +
        std::to_string(result.mu_ci_low) + ", " + std::to_string(result.mu_ci_high) + "] from " +
        std::to_string(boot_iter_) + " resamples.");
    return result;
}

} // namespace transdist

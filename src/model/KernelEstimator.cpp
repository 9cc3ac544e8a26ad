#include "model/KernelEstimator.hpp"
#include "model/ThetaWeightAggregator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace transdist {

KernelEstimator::KernelEstimator(GenerationTimeDistribution generation_time, const TransdistSettings& settings)
    : generation_time_(std::move(generation_time)), settings_(settings)
{
    settings_.validate();
}

CaseTable KernelEstimator::selectCases(const CaseTable& cases) const {
    return filterCasesFrom(cases, settings_.t1);
}

CaseTable KernelEstimator::prepare(const CaseTable& cases, const std::string& caller) const {
    validateCaseTable(cases, caller);
    CaseTable selected = selectCases(cases);
    const size_t n_times = uniqueOnsetTimes(selected).size();
    if (n_times < 2) {
        THROW_INSUFFICIENT_DATA(caller, "At least two unique onset times are required, got " +
            std::to_string(n_times) + " among " + std::to_string(selected.size()) + " cases.");
    }
    return selected;
}

ThetaTensor KernelEstimator::computeThetaWeights(const CaseTable& cases, unsigned long seed, const WorkerPool& pool,
                                                 const std::optional<WallingaTeunisMatrix>& weights) const {
    const CaseTable selected = prepare(cases, "KernelEstimator::computeThetaWeights");
    const ThetaWeightAggregator aggregator(settings_.n_transtree_reps, settings_.max_sep);
    return aggregator.aggregate(selected, generation_time_, settings_.strict_precedence, seed, pool, weights);
}

KernelEstimate KernelEstimator::estimate(const CaseTable& cases, unsigned long seed, const WorkerPool& pool) const {
    return estimateWithTheta(cases, computeThetaWeights(cases, seed, pool));
}

KernelEstimate KernelEstimator::estimate(const CaseTable& cases, unsigned long seed, const WorkerPool& pool,
                                         const WallingaTeunisMatrix& weights) const {
    return estimateWithTheta(cases, computeThetaWeights(cases, seed, pool, weights));
}

KernelEstimate KernelEstimator::estimateWithTheta(const CaseTable& cases, const ThetaTensor& theta) const {
    const std::string funcName = "KernelEstimator::estimateWithTheta";
    const CaseTable selected = prepare(cases, funcName);
    const std::vector<double> times = uniqueOnsetTimes(selected);
    theta.requireTimes(times, funcName);

    const std::vector<int> buckets = timeBucketIndices(selected, times);
    const int n_times = static_cast<int>(times.size());
    const int n = static_cast<int>(selected.size());

    // Upper triangle: distance sums and pair counts per (earlier, later) time pair.
    Eigen::MatrixXd distance_sum = Eigen::MatrixXd::Zero(n_times, n_times);
    Eigen::MatrixXd pair_count = Eigen::MatrixXd::Zero(n_times, n_times);
    long n_pairs = 0;

    for (int a = 0; a < n; ++a) {
        for (int b = a + 1; b < n; ++b) {
            if (selected[a].id == selected[b].id) continue;
            const double d = std::hypot(selected[a].x - selected[b].x, selected[a].y - selected[b].y);
            if (d > settings_.max_dist) continue;
            const int lo = std::min(buckets[a], buckets[b]);
            const int hi = std::max(buckets[a], buckets[b]);
            if (!theta.isDefined(lo, hi)) continue;
            distance_sum(lo, hi) += d;
            pair_count(lo, hi) += 1.0;
            ++n_pairs;
        }
    }

    if (n_pairs == 0) {
        THROW_INSUFFICIENT_DATA(funcName, "No case pair within max_dist and max_sep among " +
            std::to_string(n) + " cases.");
    }

    const Eigen::MatrixXd scale = theta.expectedSqrtSeparation();
    double weighted_sum = 0.0;
    for (int i = 0; i < n_times; ++i) {
        for (int j = i; j < n_times; ++j) {
            if (pair_count(i, j) == 0.0) continue;
            // mu_obs * n_ij == distance_sum
            weighted_sum += 2.0 * distance_sum(i, j) / scale(i, j);
        }
    }

    KernelEstimate result;
    result.mu = weighted_sum / static_cast<double>(n_pairs);
    if (!std::isfinite(result.mu)) {
        THROW_DOMAIN_ERROR(funcName, "Kernel estimate is not finite.");
    }
    result.sigma = result.mu;
    if (!settings_.mean_equals_sd) {
        result.mu_bound = std::sqrt(2.0) * result.mu;
        result.sigma_bound = std::sqrt(2.0) * result.sigma;
    }
    result.n_pairs = n_pairs;
    result.n_cases = n;
    result.t_start = times.front();
    result.t_end = times.back();

    Logger::getInstance().debug(funcName, "mu = " + std::to_string(result.mu) + " from " +
        std::to_string(n_pairs) + " pairs over [" + std::to_string(result.t_start) + ", " +
        std::to_string(result.t_end) + "].");
    return result;
}

} // namespace transdist

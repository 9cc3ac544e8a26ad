#ifndef TRANSDIST_SETTINGS_HPP
#define TRANSDIST_SETTINGS_HPP

#include "model/GenerationTimeDistribution.hpp"
#include "utils/WorkerPool.hpp"
#include <limits>
#include <vector>

namespace transdist {

/**
 * @brief Options of the estimation pipeline, as read from a settings file.
 */
struct TransdistSettings {
    // Generation time
    double gen_t_mean = 0.0;
    double gen_t_sd = 0.0;
    GenerationTimeFamily gen_t_family = GenerationTimeFamily::Gamma;
    std::vector<double> gen_t_pmf;  ///< Explicit PMF over lags 0..k; overrides mean/sd when set.
    bool strict_precedence = true;

    // Kernel estimator
    double t1 = -std::numeric_limits<double>::infinity();
    int max_sep = 20;
    double max_dist = std::numeric_limits<double>::infinity();
    int n_transtree_reps = 10;
    bool mean_equals_sd = false;

    // Bootstrap
    int boot_iter = 100;
    double ci_low = 0.025;
    double ci_high = 0.975;

    // Temporal windows
    int min_cases = 10;

    // Execution
    bool use_parallel = false;
    int num_workers = 0;
    unsigned long seed = 1;

    /**
     * @brief Checks ranges of the estimator, bootstrap and execution options.
     * @throws InvalidParameterException on the first out-of-range value.
     * @throws DomainError if max_dist is negative or NaN.
     */
    void validate() const;

    /**
     * @brief The generation-time distribution: gen_t_pmf if given, otherwise
     * the discretized gen_t_family with gen_t_mean / gen_t_sd.
     * @throws DomainError on an invalid PMF or non-positive mean / sd.
     */
    GenerationTimeDistribution generationTime() const;

    ParallelConfig parallelConfig() const { return ParallelConfig{use_parallel, num_workers}; }
};

} // namespace transdist

#endif // TRANSDIST_SETTINGS_HPP

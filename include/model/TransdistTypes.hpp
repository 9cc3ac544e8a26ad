#ifndef TRANSDIST_TYPES_HPP
#define TRANSDIST_TYPES_HPP

#include <optional>
#include <vector>

namespace transdist {

/**
 * @brief Point estimate of the transmission kernel over [t_start, t_end].
 *
 * The estimator assumes the kernel mean equals its standard deviation, so
 * `mu == sigma`. The bounds (sqrt(2) times each) are reported only when that
 * assumption is not imposed.
 */
struct KernelEstimate {
    double mu = 0.0;
    double sigma = 0.0;
    std::optional<double> mu_bound;
    std::optional<double> sigma_bound;
    long n_pairs = 0;     ///< Case pairs entering the weighted sum.
    int n_cases = 0;      ///< Cases remaining after the t1 filter.
    double t_start = 0.0;
    double t_end = 0.0;
};

/**
 * @brief Bootstrap confidence intervals around a kernel estimate.
 */
struct BootstrapResult {
    KernelEstimate estimate;
    double mu_ci_low = 0.0;
    double mu_ci_high = 0.0;
    double sigma_ci_low = 0.0;
    double sigma_ci_high = 0.0;
    double mu_replicate_mean = 0.0;
    double mu_replicate_sd = 0.0;
    double sigma_replicate_mean = 0.0;
    double sigma_replicate_sd = 0.0;
    int iterations = 0;
    std::vector<double> mu_replicates;
    std::vector<double> sigma_replicates;
};

/**
 * @brief One step of a temporal series: the estimate over all cases up to `time`,
 * or nothing when that window holds too few cases or too little structure.
 */
template <typename T>
struct TemporalEntry {
    double time = 0.0;
    int n_cases = 0;
    std::optional<T> value;
};

using TemporalSeries = std::vector<TemporalEntry<KernelEstimate>>;
using TemporalBootstrapSeries = std::vector<TemporalEntry<BootstrapResult>>;

} // namespace transdist

#endif // TRANSDIST_TYPES_HPP

#ifndef BOOTSTRAP_ESTIMATOR_HPP
#define BOOTSTRAP_ESTIMATOR_HPP

#include "model/interfaces/IKernelEstimator.hpp"
#include "model/TransdistTypes.hpp"
#include "utils/WorkerPool.hpp"
#include <memory>
#include <vector>

namespace transdist {

/**
 * @class BootstrapEstimator
 * @brief Confidence intervals for a kernel estimate by case resampling.
 *
 * Each iteration draws the selected cases with replacement to the same size
 * and reruns the wrapped estimator from scratch. Copies keep the id of the
 * case they were drawn from. A failing iteration fails the whole call.
 */
class BootstrapEstimator {
public:
    /**
     * @param estimator Point estimator rerun on every resample.
     * @param boot_iter Number of resamples.
     * @param ci_low Lower quantile of the interval.
     * @param ci_high Upper quantile of the interval.
     * @throws InvalidParameterException if estimator is null, boot_iter < 1,
     *         or the quantiles are not 0 <= ci_low <= ci_high <= 1.
     */
    BootstrapEstimator(std::shared_ptr<const IKernelEstimator> estimator,
                       int boot_iter, double ci_low, double ci_high);

    /**
     * @brief Point estimate on `cases` plus quantiles of the resampled estimates.
     *
     * Iterations run on `pool`; each estimate inside an iteration runs on the
     * pool's nested pool. Resample i is drawn from seed stream
     * (seed, BootstrapResample, i) and estimated with (seed, BootstrapEstimate, i).
     */
    BootstrapResult run(const CaseTable& cases, unsigned long seed,
                        const WorkerPool& pool = WorkerPool()) const;

    /** @brief The i-th resample of `selected`, reproducible from the seed. */
    static CaseTable resample(const CaseTable& selected, unsigned long seed, int iteration);

    int getIterations() const { return boot_iter_; }
    double getCiLow() const { return ci_low_; }
    double getCiHigh() const { return ci_high_; }

private:
    std::shared_ptr<const IKernelEstimator> estimator_;
    int boot_iter_;
    double ci_low_;
    double ci_high_;
};

/**
 * @brief Empirical quantile with linear interpolation between order statistics.
 * @throws InsufficientDataError if `values` is empty.
 */
double empiricalQuantile(std::vector<double> values, double probability);

} // namespace transdist

#endif // BOOTSTRAP_ESTIMATOR_HPP

#ifndef I_KERNEL_ESTIMATOR_HPP
#define I_KERNEL_ESTIMATOR_HPP

#include "model/CaseData.hpp"
#include "model/TransdistTypes.hpp"
#include "utils/WorkerPool.hpp"

namespace transdist {

/**
 * @brief A pure function from a case table to a kernel estimate.
 *
 * The bootstrap and temporal wrappers only choose which cases are passed in;
 * every estimate is recomputed from scratch.
 */
class IKernelEstimator {
public:
    virtual ~IKernelEstimator() = default;

    /**
     * @brief The cases the estimate is computed from (e.g. those with t >= t1).
     * Resampling wrappers draw from this subset.
     */
    virtual CaseTable selectCases(const CaseTable& cases) const = 0;

    /**
     * @brief Estimates the kernel from `cases`.
     * @param seed Base seed for all random draws of this estimate.
     * @param pool Worker pool for the estimator's own parallel stages.
     * @throws InsufficientDataError if the selected cases cannot support an estimate.
     */
    virtual KernelEstimate estimate(const CaseTable& cases, unsigned long seed, const WorkerPool& pool) const = 0;
};

} // namespace transdist

#endif // I_KERNEL_ESTIMATOR_HPP

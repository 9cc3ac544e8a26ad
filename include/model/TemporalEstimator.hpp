#ifndef TEMPORAL_ESTIMATOR_HPP
#define TEMPORAL_ESTIMATOR_HPP

#include "model/BootstrapEstimator.hpp"
#include "model/interfaces/IKernelEstimator.hpp"
#include "model/TransdistTypes.hpp"
#include "utils/WorkerPool.hpp"
#include <functional>
#include <memory>

namespace transdist {

/**
 * @class TemporalEstimator
 * @brief Kernel estimates over cumulative windows ending at each onset time.
 *
 * The series has one entry per unique onset time of the selected cases, in
 * ascending order. Entry k is computed from the cases with t <= tau_k. It is
 * absent when the window holds fewer than `min_cases` cases, or when the
 * estimator reports insufficient data for it. Other failures propagate.
 */
class TemporalEstimator {
public:
    /**
     * @throws InvalidParameterException if estimator is null or min_cases is negative.
     */
    TemporalEstimator(std::shared_ptr<const IKernelEstimator> estimator, int min_cases);

    /** @brief Point estimate for every window. Window k is seeded from (seed, TemporalWindow, k). */
    TemporalSeries run(const CaseTable& cases, unsigned long seed,
                       const WorkerPool& pool = WorkerPool()) const;

    /** @brief Bootstrap interval for every window. */
    TemporalBootstrapSeries run(const CaseTable& cases, const BootstrapEstimator& bootstrap,
                                unsigned long seed, const WorkerPool& pool = WorkerPool()) const;

    int getMinCases() const { return min_cases_; }

private:
    template <typename T>
    std::vector<TemporalEntry<T>> sweep(
        const CaseTable& cases, unsigned long seed, const WorkerPool& pool,
        const std::function<T(const CaseTable&, unsigned long, const WorkerPool&)>& estimate_window) const;

    std::shared_ptr<const IKernelEstimator> estimator_;
    int min_cases_;
};

} // namespace transdist

#endif // TEMPORAL_ESTIMATOR_HPP

#ifndef KERNEL_ESTIMATOR_HPP
#define KERNEL_ESTIMATOR_HPP

#include "model/interfaces/IKernelEstimator.hpp"
#include "model/GenerationTimeDistribution.hpp"
#include "model/ThetaTensor.hpp"
#include "model/WallingaTeunisMatrix.hpp"
#include "model/parameters/TransdistSettings.hpp"
#include <optional>
#include <string>

namespace transdist {

/**
 * @class KernelEstimator
 * @brief Estimates the mean and standard deviation of the transmission kernel
 * from case locations and onset times.
 *
 * For every pair of onset times (t_i, t_j) the observed mean distance
 * mu_obs between case pairs at those times is related to the per-generation
 * kernel through the theta weights:
 *
 *   mu_k = sum_ij [ 2 * mu_obs(t_i, t_j) * n_ij / sum_theta w(theta, t_i, t_j) sqrt(2 pi theta) ] / sum_ij n_ij
 *
 * which assumes mu_k = sigma_k. Only pairs no further apart than max_dist,
 * at time pairs with a chain of at most max_sep generations, and not formed by
 * two copies of the same case id, enter the sums.
 */
class KernelEstimator : public IKernelEstimator {
public:
    /**
     * @param generation_time Generation-time distribution in onset time steps.
     * @param settings Pipeline options; the estimator uses t1, max_sep,
     *        max_dist, n_transtree_reps, mean_equals_sd and strict_precedence.
     * @throws InvalidParameterException, DomainError from settings.validate().
     */
    KernelEstimator(GenerationTimeDistribution generation_time, const TransdistSettings& settings);

    CaseTable selectCases(const CaseTable& cases) const override;

    KernelEstimate estimate(const CaseTable& cases, unsigned long seed, const WorkerPool& pool) const override;

    /**
     * @brief Estimate with a caller-supplied Wallinga-Teunis matrix for the
     * selected cases, skipping its recomputation.
     * @throws ShapeMismatchError if `weights` does not match the selected onset times.
     */
    KernelEstimate estimate(const CaseTable& cases, unsigned long seed, const WorkerPool& pool,
                            const WallingaTeunisMatrix& weights) const;

    /**
     * @brief Deterministic final step: combines distances with precomputed theta weights.
     * @throws ShapeMismatchError if `theta` does not match the selected onset times.
     * @throws InsufficientDataError if fewer than two onset times or no valid pair remain.
     */
    KernelEstimate estimateWithTheta(const CaseTable& cases, const ThetaTensor& theta) const;

    /** @brief Theta tensor the estimator would use for `cases` (after selection). */
    ThetaTensor computeThetaWeights(const CaseTable& cases, unsigned long seed, const WorkerPool& pool,
                                    const std::optional<WallingaTeunisMatrix>& weights = std::nullopt) const;

    const GenerationTimeDistribution& getGenerationTime() const { return generation_time_; }
    const TransdistSettings& getSettings() const { return settings_; }

private:
    CaseTable prepare(const CaseTable& cases, const std::string& caller) const;

    GenerationTimeDistribution generation_time_;
    TransdistSettings settings_;
};

} // namespace transdist

#endif // KERNEL_ESTIMATOR_HPP

#ifndef THETA_WEIGHT_AGGREGATOR_HPP
#define THETA_WEIGHT_AGGREGATOR_HPP

#include "model/CaseData.hpp"
#include "model/GenerationTimeDistribution.hpp"
#include "model/PairwiseInfectorMatrix.hpp"
#include "model/ThetaTensor.hpp"
#include "utils/WorkerPool.hpp"
#include <optional>

namespace transdist {

/**
 * @brief Averages independent ThetaSampler draws into a stable theta tensor.
 *
 * Draw r is seeded from (seed, ThetaRepetition, r). Draws are computed in
 * blocks on the worker pool and summed in draw order, so the result for a
 * given seed does not depend on the degree of parallelism. Each slice is
 * averaged over the draws in which it is defined.
 */
class ThetaWeightAggregator {
public:
    /**
     * @param n_reps Number of sampled transmission forests.
     * @param max_sep Largest separation tabulated.
     * @throws InvalidParameterException if n_reps < 1 or max_sep < 1.
     */
    ThetaWeightAggregator(int n_reps, int max_sep);

    ThetaTensor aggregate(const PairwiseInfectorMatrix& pairwise,
                          unsigned long seed,
                          const WorkerPool& pool = WorkerPool()) const;

    /**
     * @brief Builds the weight and pairwise matrices for `cases`, then aggregates.
     * @param supplied_weights Optional precomputed weight matrix for the unique times of `cases`.
     */
    ThetaTensor aggregate(const CaseTable& cases,
                          const GenerationTimeDistribution& generation_time,
                          bool strict_precedence,
                          unsigned long seed,
                          const WorkerPool& pool = WorkerPool(),
                          const std::optional<WallingaTeunisMatrix>& supplied_weights = std::nullopt) const;

    int getRepetitions() const { return n_reps_; }
    int getMaxSep() const { return max_sep_; }

private:
    int n_reps_;
    int max_sep_;
};

} // namespace transdist

#endif // THETA_WEIGHT_AGGREGATOR_HPP

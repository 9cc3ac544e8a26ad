#include "model/ThetaWeightAggregator.hpp"
#include "model/ThetaSampler.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace transdist {

namespace {
// Draws held in memory at once.
constexpr int kDrawBlockSize = 32;
}

ThetaWeightAggregator::ThetaWeightAggregator(int n_reps, int max_sep)
    : n_reps_(n_reps), max_sep_(max_sep)
{
    if (n_reps_ < 1) {
        THROW_INVALID_PARAM("ThetaWeightAggregator::ThetaWeightAggregator", "n_transtree_reps must be at least 1, got " + std::to_string(n_reps_) + ".");
    }
    if (max_sep_ < 1) {
        THROW_INVALID_PARAM("ThetaWeightAggregator::ThetaWeightAggregator", "max_sep must be at least 1, got " + std::to_string(max_sep_) + ".");
    }
}

ThetaTensor ThetaWeightAggregator::aggregate(const PairwiseInfectorMatrix& pairwise,
                                             unsigned long seed,
                                             const WorkerPool& pool) const {
    const ThetaSampler sampler(pairwise, max_sep_);
    const int n_times = pairwise.numTimes();

    ThetaTensor total(pairwise.getTimes(), max_sep_);
    Eigen::MatrixXd defined_draws = Eigen::MatrixXd::Zero(n_times, n_times);

    for (int start = 0; start < n_reps_; start += kDrawBlockSize) {
        const int block = std::min(kDrawBlockSize, n_reps_ - start);
        std::vector<ThetaTensor> draws(static_cast<size_t>(block), ThetaTensor(pairwise.getTimes(), max_sep_));

        pool.forEach(block, [&](int k) {
            GslRng rng(deriveSeed(seed, SeedStream::ThetaRepetition, static_cast<std::size_t>(start + k)));
            draws[k] = sampler.sample(rng.get());
        });

        for (const auto& draw : draws) {
            for (int i = 0; i < n_times; ++i) {
                for (int j = 0; j < n_times; ++j) {
                    if (!draw.isDefined(i, j)) continue;
                    defined_draws(i, j) += 1.0;
                    for (int theta = 1; theta <= max_sep_; ++theta) {
                        total.at(i, j, theta) += draw.at(i, j, theta);
                    }
                }
            }
        }
    }

    for (int i = 0; i < n_times; ++i) {
        for (int j = 0; j < n_times; ++j) {
            if (defined_draws(i, j) == 0.0) continue;
            for (int theta = 1; theta <= max_sep_; ++theta) {
                total.at(i, j, theta) /= defined_draws(i, j);
            }
        }
    }

    Logger::getInstance().debug("ThetaWeightAggregator::aggregate",
        "Averaged " + std::to_string(n_reps_) + " transmission forests over " +
        std::to_string(pairwise.numCases()) + " cases and " + std::to_string(n_times) + " onset times.");
    return total;
}

ThetaTensor ThetaWeightAggregator::aggregate(const CaseTable& cases,
                                             const GenerationTimeDistribution& generation_time,
                                             bool strict_precedence,
                                             unsigned long seed,
                                             const WorkerPool& pool,
                                             const std::optional<WallingaTeunisMatrix>& supplied_weights) const {
    PairwiseInfectorMatrix pairwise = PairwiseInfectorMatrix::build(cases, generation_time, strict_precedence, supplied_weights);
    return aggregate(pairwise, seed, pool);
}

} // namespace transdist

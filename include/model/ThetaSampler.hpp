#ifndef THETA_SAMPLER_HPP
#define THETA_SAMPLER_HPP

#include "model/PairwiseInfectorMatrix.hpp"
#include "model/ThetaTensor.hpp"
#include <gsl/gsl_rng.h>
#include <vector>

namespace transdist {

/**
 * @brief Draws one transmission forest from the pairwise infector matrix and
 * tabulates the generation separation of every case pair by onset times.
 *
 * Each case with a candidate infector receives exactly one parent, drawn with
 * the probabilities of its column; cases without one are roots. Since parents
 * always precede their infectees, the parent pointers form a forest. Two cases
 * in the same tree are separated by the number of transmission steps on the
 * path through their lowest common ancestor; pairs in different trees, or
 * further apart than max_sep, contribute nothing.
 *
 * The sampler is immutable after construction and may be shared by
 * concurrent draws, each with its own generator.
 */
class ThetaSampler {
public:
    /**
     * @param pairwise Case-level infector probabilities.
     * @param max_sep Largest separation tabulated.
     * @throws InvalidParameterException if max_sep < 1.
     */
    ThetaSampler(const PairwiseInfectorMatrix& pairwise, int max_sep);

    /**
     * @brief Samples one infector per case.
     * @return Parent index for every case, -1 for roots.
     */
    std::vector<int> sampleInfectors(gsl_rng* rng) const;

    /**
     * @brief Tabulates pair separations of a given forest by onset time,
     * normalized within each (t_i, t_j) slice.
     */
    ThetaTensor tabulate(const std::vector<int>& parents) const;

    /** @brief One full draw: sampleInfectors() followed by tabulate(). */
    ThetaTensor sample(gsl_rng* rng) const;

    /**
     * @brief Number of transmission steps between cases a and b in a forest.
     * @param depth Distance of every case from its root.
     * @return The separation, or 0 if the cases are in different trees or
     *         further apart than max_sep.
     */
    int separation(const std::vector<int>& parents, const std::vector<int>& depth, int a, int b) const;

    int numCases() const { return static_cast<int>(buckets_.size()); }
    int maxSep() const { return max_sep_; }

private:
    std::vector<double> times_;
    std::vector<int> buckets_;
    int max_sep_;
    // Cases sorted by (onset bucket, table index); parents precede children.
    std::vector<int> order_;
    // Per destination case: candidate infectors and their cumulative probabilities.
    std::vector<std::vector<int>> candidates_;
    std::vector<std::vector<double>> cumulative_;
};

} // namespace transdist

#endif // THETA_SAMPLER_HPP

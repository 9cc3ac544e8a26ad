#ifndef GENERATION_TIME_DISTRIBUTION_HPP
#define GENERATION_TIME_DISTRIBUTION_HPP

#include <Eigen/Dense>
#include <vector>

namespace transdist {

/**
 * @brief Parametric families available for discretizing the generation time.
 */
enum class GenerationTimeFamily {
    Gamma,  ///< shape mean^2/sd^2, scale sd^2/mean
    Normal  ///< truncated at zero
};

/**
 * @brief Probability mass function of the generation time over integer lags 0..L.
 *
 * Instances are immutable and always normalized to sum 1.
 */
class GenerationTimeDistribution {
public:
    /**
     * @brief Wraps an explicit probability vector aligned to lags 0..k.
     * @param pmf Non-negative finite weights; normalized on construction.
     * @throws DomainError if `pmf` is empty, has a negative or non-finite
     *         entry, or does not sum to a positive value.
     */
    static GenerationTimeDistribution fromVector(const std::vector<double>& pmf);

    /**
     * @brief Discretizes a continuous distribution with the given mean and sd.
     *
     * Lag k receives the mass of [k-0.5, k+0.5) (lag 0 receives [0, 0.5)),
     * over lags 0..ceil(mean + 10 sd).
     * @throws DomainError if mean or sd is not positive and finite.
     */
    static GenerationTimeDistribution fromMeanSd(double mean, double sd,
                                                 GenerationTimeFamily family = GenerationTimeFamily::Gamma);

    /** @return g(lag); zero for negative lags and lags beyond the support. */
    double density(int lag) const;

    /** @brief density() at a binned time difference, rounded to the nearest step. */
    double densityAt(double time_difference) const;

    int maxLag() const { return static_cast<int>(pmf_.size()) - 1; }

    /** @return Mean lag of the discretized distribution. */
    double mean() const;

    const Eigen::VectorXd& getProbabilities() const { return pmf_; }

private:
    explicit GenerationTimeDistribution(Eigen::VectorXd pmf);

    Eigen::VectorXd pmf_;
};

} // namespace transdist

#endif // GENERATION_TIME_DISTRIBUTION_HPP

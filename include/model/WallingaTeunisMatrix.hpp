#ifndef WALLINGA_TEUNIS_MATRIX_HPP
#define WALLINGA_TEUNIS_MATRIX_HPP

#include "model/GenerationTimeDistribution.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace transdist {

/**
 * @brief Relative infector likelihoods between unique onset times.
 *
 * Rows and columns are indexed by the sorted unique onset times. Entry (a, b)
 * is the relative likelihood that a case at time a infected a case at time b,
 * proportional to g(t_b - t_a) and normalized over the candidate rows of
 * column b. A column with no candidate infector time (the earliest time, or
 * a time no lag in the support can reach) is left at zero.
 */
class WallingaTeunisMatrix {
public:
    /**
     * @brief Builds the matrix from case onset times.
     *
     * @param case_times Onset times, duplicates allowed, any order.
     * @param generation_time Generation-time PMF over integer lags.
     * @param strict_precedence If true, only t_a < t_b contributes; otherwise
     *        t_a == t_b contributes with weight g(0).
     * @throws InsufficientDataError if `case_times` is empty.
     */
    static WallingaTeunisMatrix build(const std::vector<double>& case_times,
                                      const GenerationTimeDistribution& generation_time,
                                      bool strict_precedence = true);

    /**
     * @brief Wraps an externally supplied matrix.
     * @throws ShapeMismatchError if `weights` is not square or its size differs from `unique_times`,
     *         or if `unique_times` is not strictly increasing.
     * @throws DomainError if an entry is negative or non-finite, or if a later
     *         time carries weight as infector of an earlier one.
     */
    WallingaTeunisMatrix(std::vector<double> unique_times, Eigen::MatrixXd weights);

    const std::vector<double>& getTimes() const { return times_; }
    const Eigen::MatrixXd& getWeights() const { return weights_; }
    int size() const { return static_cast<int>(times_.size()); }

    /** @return True if column `b` has at least one candidate infector time. */
    bool hasInfector(int b) const;

    /** @return True if any time carries weight as its own infector time (diagonal entry). */
    bool hasSameTimeWeight() const;

    /**
     * @brief Checks that the matrix is indexed by exactly `unique_times`.
     * @throws ShapeMismatchError on any difference.
     */
    void requireTimes(const std::vector<double>& unique_times, const std::string& caller) const;

private:
    std::vector<double> times_;
    Eigen::MatrixXd weights_;
};

} // namespace transdist

#endif // WALLINGA_TEUNIS_MATRIX_HPP

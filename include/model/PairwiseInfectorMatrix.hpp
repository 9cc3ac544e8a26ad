#ifndef PAIRWISE_INFECTOR_MATRIX_HPP
#define PAIRWISE_INFECTOR_MATRIX_HPP

#include "model/CaseData.hpp"
#include "model/GenerationTimeDistribution.hpp"
#include "model/WallingaTeunisMatrix.hpp"
#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace transdist {

/**
 * @brief Case-by-case infector probabilities.
 *
 * Entry (i, j) is the probability that case i infected case j. Every
 * candidate source case takes the weight of its time bucket from the
 * Wallinga-Teunis matrix, and each destination column is renormalized over
 * all candidate cases. A time bucket with more cases therefore attracts
 * proportionally more of the column. Columns of cases without a candidate
 * infector are zero.
 */
class PairwiseInfectorMatrix {
public:
    /**
     * @brief Expands a time-indexed weight matrix to the cases of `cases`.
     *
     * @param cases Case table; its table order is the matrix index order.
     * @param weights Weight matrix indexed by the unique onset times of `cases`.
     * @param strict_precedence Must match the strictness `weights` was built
     *        with. When false, a case may infect a same-time case only if it
     *        comes earlier in the table.
     * @throws ShapeMismatchError if `weights` is not indexed by the unique times of `cases`.
     * @throws DomainError if `strict_precedence` is set and `weights` has a nonzero diagonal.
     */
    static PairwiseInfectorMatrix expand(const CaseTable& cases,
                                         const WallingaTeunisMatrix& weights,
                                         bool strict_precedence = true);

    /**
     * @brief Builds the weight matrix (unless one is supplied) and expands it.
     * @throws DomainError, ShapeMismatchError, InsufficientDataError
     */
    static PairwiseInfectorMatrix build(const CaseTable& cases,
                                        const GenerationTimeDistribution& generation_time,
                                        bool strict_precedence = true,
                                        const std::optional<WallingaTeunisMatrix>& supplied_weights = std::nullopt);

    const Eigen::MatrixXd& getProbabilities() const { return probabilities_; }
    /** @return Unique onset times, ascending. */
    const std::vector<double>& getTimes() const { return times_; }
    /** @return Time-bucket index of every case. */
    const std::vector<int>& getTimeBuckets() const { return buckets_; }
    int numCases() const { return static_cast<int>(buckets_.size()); }
    int numTimes() const { return static_cast<int>(times_.size()); }

    /** @return True if case j has at least one candidate infector. */
    bool hasInfector(int j) const;

private:
    PairwiseInfectorMatrix(std::vector<double> times, std::vector<int> buckets, Eigen::MatrixXd probabilities);

    std::vector<double> times_;
    std::vector<int> buckets_;
    Eigen::MatrixXd probabilities_;
};

} // namespace transdist

#endif // PAIRWISE_INFECTOR_MATRIX_HPP

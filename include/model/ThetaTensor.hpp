#ifndef THETA_TENSOR_HPP
#define THETA_TENSOR_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace transdist {

/**
 * @brief Probability that two cases at onset times (t_i, t_j) are separated by
 * exactly theta transmission generations, theta = 1..max_sep.
 *
 * Stored as one symmetric time-by-time layer per theta. A slice (i, j) is
 * defined when its values are positive, in which case they sum to 1 across
 * theta; an undefined slice (no chain within max_sep) is all zero.
 */
class ThetaTensor {
public:
    ThetaTensor(std::vector<double> times, int max_sep);

    /** @param theta Generation count, 1-based. */
    double& at(int i, int j, int theta) { return layers_[theta - 1](i, j); }
    double at(int i, int j, int theta) const { return layers_[theta - 1](i, j); }

    const Eigen::MatrixXd& layer(int theta) const { return layers_[theta - 1]; }

    int numTimes() const { return static_cast<int>(times_.size()); }
    int maxSep() const { return max_sep_; }
    const std::vector<double>& getTimes() const { return times_; }

    double sliceSum(int i, int j) const;
    bool isDefined(int i, int j) const { return sliceSum(i, j) > 0.0; }

    /** @brief Scales every defined slice to sum 1 across theta. */
    void normalizeSlices();

    /**
     * @brief Sum over theta of w(theta, i, j) * sqrt(2 pi theta), the expected
     * distance scale of slice (i, j) in units of the per-generation kernel.
     */
    Eigen::MatrixXd expectedSqrtSeparation() const;

    /**
     * @brief Checks that the tensor is indexed by exactly `unique_times`.
     * @throws ShapeMismatchError on any difference.
     */
    void requireTimes(const std::vector<double>& unique_times, const std::string& caller) const;

private:
    std::vector<double> times_;
    int max_sep_;
    std::vector<Eigen::MatrixXd> layers_;
};

} // namespace transdist

#endif // THETA_TENSOR_HPP

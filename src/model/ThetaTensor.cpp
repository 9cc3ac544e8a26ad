#include "model/ThetaTensor.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace transdist {

ThetaTensor::ThetaTensor(std::vector<double> times, int max_sep)
    : times_(std::move(times)), max_sep_(max_sep)
{
    if (max_sep_ < 1) {
        THROW_INVALID_PARAM("ThetaTensor::ThetaTensor", "max_sep must be at least 1, got " + std::to_string(max_sep_) + ".");
    }
    const Eigen::Index n = static_cast<Eigen::Index>(times_.size());
    layers_.assign(static_cast<size_t>(max_sep_), Eigen::MatrixXd::Zero(n, n));
}

double ThetaTensor::sliceSum(int i, int j) const {
    double s = 0.0;
    for (const auto& layer : layers_) {
        s += layer(i, j);
    }
    return s;
}

void ThetaTensor::normalizeSlices() {
    const int n = numTimes();
    Eigen::MatrixXd totals = Eigen::MatrixXd::Zero(n, n);
    for (const auto& layer : layers_) {
        totals += layer;
    }
    // Undefined slices are divided by 1 and stay zero.
    Eigen::ArrayXXd divisor = (totals.array() > 0.0).select(totals.array(), 1.0);
    for (auto& layer : layers_) {
        layer.array() /= divisor;
    }
}

Eigen::MatrixXd ThetaTensor::expectedSqrtSeparation() const {
    const int n = numTimes();
    Eigen::MatrixXd d = Eigen::MatrixXd::Zero(n, n);
    for (int theta = 1; theta <= max_sep_; ++theta) {
        d += layers_[theta - 1] * std::sqrt(2.0 * M_PI * theta);
    }
    return d;
}

void ThetaTensor::requireTimes(const std::vector<double>& unique_times, const std::string& caller) const {
    if (unique_times != times_) {
        THROW_SHAPE_MISMATCH(caller, "Theta tensor covers " + std::to_string(times_.size()) +
            " onset times that do not match the " + std::to_string(unique_times.size()) +
            " unique onset times of the case table.");
    }
}

} // namespace transdist

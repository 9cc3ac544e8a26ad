#include "model/WallingaTeunisMatrix.hpp"
#include "model/CaseData.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <string>

namespace transdist {

WallingaTeunisMatrix::WallingaTeunisMatrix(std::vector<double> unique_times, Eigen::MatrixXd weights)
    : times_(std::move(unique_times)), weights_(std::move(weights))
{
    const std::string funcName = "WallingaTeunisMatrix::WallingaTeunisMatrix";
    const Eigen::Index n = static_cast<Eigen::Index>(times_.size());
    if (weights_.rows() != weights_.cols() || weights_.rows() != n) {
        THROW_SHAPE_MISMATCH(funcName, "Weight matrix is " + std::to_string(weights_.rows()) + "x" +
            std::to_string(weights_.cols()) + " but " + std::to_string(n) + " unique times were given.");
    }
    for (size_t i = 1; i < times_.size(); ++i) {
        if (!(times_[i] > times_[i - 1])) {
            THROW_SHAPE_MISMATCH(funcName, "Unique times must be strictly increasing.");
        }
    }
    if (!weights_.allFinite() || (n > 0 && weights_.minCoeff() < 0.0)) {
        THROW_DOMAIN_ERROR(funcName, "Weights must be finite and non-negative.");
    }
    // An infector time must not come after its infectee time.
    for (Eigen::Index b = 0; b < n; ++b) {
        for (Eigen::Index a = b + 1; a < n; ++a) {
            if (weights_(a, b) > 0.0) {
                THROW_DOMAIN_ERROR(funcName, "Positive weight from time " + std::to_string(times_[a]) +
                    " to earlier time " + std::to_string(times_[b]) + ".");
            }
        }
    }
}

bool WallingaTeunisMatrix::hasSameTimeWeight() const {
    return size() > 0 && weights_.diagonal().maxCoeff() > 0.0;
}

WallingaTeunisMatrix WallingaTeunisMatrix::build(const std::vector<double>& case_times,
                                                 const GenerationTimeDistribution& generation_time,
                                                 bool strict_precedence) {
    if (case_times.empty()) {
        THROW_INSUFFICIENT_DATA("WallingaTeunisMatrix::build", "No onset times supplied.");
    }
    std::vector<double> times = uniqueOnsetTimes(case_times);
    const int n = static_cast<int>(times.size());
    Eigen::MatrixXd w = Eigen::MatrixXd::Zero(n, n);

    for (int b = 0; b < n; ++b) {
        for (int a = 0; a < n; ++a) {
            const bool precedes = strict_precedence ? (times[a] < times[b]) : (times[a] <= times[b]);
            if (precedes) {
                w(a, b) = generation_time.densityAt(times[b] - times[a]);
            }
        }
        const double column_sum = w.col(b).sum();
        if (column_sum > 0.0) {
            w.col(b) /= column_sum;
        }
    }

    Logger::getInstance().debug("WallingaTeunisMatrix::build",
        "Built " + std::to_string(n) + "x" + std::to_string(n) + " weight matrix from " +
        std::to_string(case_times.size()) + " onset times.");
    return WallingaTeunisMatrix(std::move(times), std::move(w));
}

bool WallingaTeunisMatrix::hasInfector(int b) const {
    return weights_.col(b).sum() > 0.0;
}

void WallingaTeunisMatrix::requireTimes(const std::vector<double>& unique_times, const std::string& caller) const {
    if (unique_times.size() != times_.size()) {
        THROW_SHAPE_MISMATCH(caller, "Weight matrix covers " + std::to_string(times_.size()) +
            " onset times but the case table has " + std::to_string(unique_times.size()) + ".");
    }
    for (size_t i = 0; i < times_.size(); ++i) {
        if (times_[i] != unique_times[i]) {
            THROW_SHAPE_MISMATCH(caller, "Weight matrix time " + std::to_string(times_[i]) +
                " at position " + std::to_string(i) + " does not match case time " +
                std::to_string(unique_times[i]) + ".");
        }
    }
}

} // namespace transdist

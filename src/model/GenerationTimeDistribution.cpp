#include "model/GenerationTimeDistribution.hpp"
#include "exceptions/Exceptions.hpp"
#include <gsl/gsl_cdf.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include <string>
#include <utility>

namespace transdist {

GenerationTimeDistribution::GenerationTimeDistribution(Eigen::VectorXd pmf)
    : pmf_(std::move(pmf)) {}

GenerationTimeDistribution GenerationTimeDistribution::fromVector(const std::vector<double>& pmf) {
    const std::string funcName = "GenerationTimeDistribution::fromVector";
    if (pmf.empty()) {
        THROW_DOMAIN_ERROR(funcName, "Generation-time vector is empty.");
    }
    double total = 0.0;
    for (size_t k = 0; k < pmf.size(); ++k) {
        if (!std::isfinite(pmf[k]) || pmf[k] < 0.0) {
            THROW_DOMAIN_ERROR(funcName, "Entry for lag " + std::to_string(k) +
                " must be finite and non-negative, got " + std::to_string(pmf[k]) + ".");
        }
        total += pmf[k];
    }
    if (!(total > 0.0) || !std::isfinite(total)) {
        THROW_DOMAIN_ERROR(funcName, "Generation-time vector must sum to a positive finite value.");
    }
    Eigen::VectorXd normalized = Eigen::Map<const Eigen::VectorXd>(pmf.data(), static_cast<Eigen::Index>(pmf.size())) / total;
    return GenerationTimeDistribution(std::move(normalized));
}

GenerationTimeDistribution GenerationTimeDistribution::fromMeanSd(double mean, double sd, GenerationTimeFamily family) {
    const std::string funcName = "GenerationTimeDistribution::fromMeanSd";
    if (!std::isfinite(mean) || mean <= 0.0) {
        THROW_DOMAIN_ERROR(funcName, "Generation-time mean must be positive, got " + std::to_string(mean) + ".");
    }
    if (!std::isfinite(sd) || sd <= 0.0) {
        THROW_DOMAIN_ERROR(funcName, "Generation-time sd must be positive, got " + std::to_string(sd) + ".");
    }

    std::function<double(double)> cdf;
    if (family == GenerationTimeFamily::Gamma) {
        const double shape = (mean * mean) / (sd * sd);
        const double scale = (sd * sd) / mean;
        cdf = [shape, scale](double x) { return gsl_cdf_gamma_P(x, shape, scale); };
    } else {
        cdf = [mean, sd](double x) { return gsl_cdf_gaussian_P(x - mean, sd); };
    }

    const int max_lag = static_cast<int>(std::ceil(mean + 10.0 * sd));
    std::vector<double> pmf(static_cast<size_t>(max_lag) + 1, 0.0);
    for (int k = 0; k <= max_lag; ++k) {
        const double lower = std::max(0.0, k - 0.5);
        const double upper = k + 0.5;
        pmf[k] = std::max(0.0, cdf(upper) - cdf(lower));
    }
    return fromVector(pmf);
}

double GenerationTimeDistribution::density(int lag) const {
    if (lag < 0 || lag > maxLag()) {
        return 0.0;
    }
    return pmf_(lag);
}

double GenerationTimeDistribution::densityAt(double time_difference) const {
    return density(static_cast<int>(std::lround(time_difference)));
}

double GenerationTimeDistribution::mean() const {
    double m = 0.0;
    for (Eigen::Index k = 0; k < pmf_.size(); ++k) {
        m += static_cast<double>(k) * pmf_(k);
    }
    return m;
}

} // namespace transdist

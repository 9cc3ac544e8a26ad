#include "model/parameters/TransdistSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <string>

namespace transdist {

void TransdistSettings::validate() const {
    const std::string funcName = "TransdistSettings::validate";
    if (max_sep < 1) {
        THROW_INVALID_PARAM(funcName, "max_sep must be at least 1, got " + std::to_string(max_sep) + ".");
    }
    if (std::isnan(max_dist) || max_dist < 0.0) {
        THROW_DOMAIN_ERROR(funcName, "max_dist must be a non-negative distance, got " + std::to_string(max_dist) + ".");
    }
    if (n_transtree_reps < 1) {
        THROW_INVALID_PARAM(funcName, "n_transtree_reps must be at least 1, got " + std::to_string(n_transtree_reps) + ".");
    }
    if (boot_iter < 1) {
        THROW_INVALID_PARAM(funcName, "boot_iter must be at least 1, got " + std::to_string(boot_iter) + ".");
    }
    if (!(ci_low >= 0.0 && ci_low <= 1.0) || !(ci_high >= 0.0 && ci_high <= 1.0) || ci_low > ci_high) {
        THROW_INVALID_PARAM(funcName, "ci_low and ci_high must satisfy 0 <= ci_low <= ci_high <= 1.");
    }
    if (min_cases < 0) {
        THROW_INVALID_PARAM(funcName, "min_cases cannot be negative.");
    }
    if (num_workers < 0) {
        THROW_INVALID_PARAM(funcName, "num_workers cannot be negative.");
    }
    if (std::isnan(t1)) {
        THROW_INVALID_PARAM(funcName, "t1 cannot be NaN.");
    }
}

GenerationTimeDistribution TransdistSettings::generationTime() const {
    if (!gen_t_pmf.empty()) {
        return GenerationTimeDistribution::fromVector(gen_t_pmf);
    }
    return GenerationTimeDistribution::fromMeanSd(gen_t_mean, gen_t_sd, gen_t_family);
}

} // namespace transdist

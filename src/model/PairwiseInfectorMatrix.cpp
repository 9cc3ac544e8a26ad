#include "model/PairwiseInfectorMatrix.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <string>

namespace transdist {

PairwiseInfectorMatrix::PairwiseInfectorMatrix(std::vector<double> times, std::vector<int> buckets, Eigen::MatrixXd probabilities)
    : times_(std::move(times)), buckets_(std::move(buckets)), probabilities_(std::move(probabilities)) {}

PairwiseInfectorMatrix PairwiseInfectorMatrix::expand(const CaseTable& cases,
                                                      const WallingaTeunisMatrix& weights,
                                                      bool strict_precedence) {
    const std::string funcName = "PairwiseInfectorMatrix::expand";
    std::vector<double> times = uniqueOnsetTimes(cases);
    weights.requireTimes(times, funcName);
    if (strict_precedence && weights.hasSameTimeWeight()) {
        THROW_DOMAIN_ERROR(funcName, "Weight matrix has same-time weight but strict precedence is set.");
    }
    std::vector<int> buckets = timeBucketIndices(cases, times);

    const int n = static_cast<int>(cases.size());
    const Eigen::MatrixXd& w = weights.getWeights();
    Eigen::MatrixXd p = Eigen::MatrixXd::Zero(n, n);

    for (int j = 0; j < n; ++j) {
        const int tb = buckets[j];
        for (int i = 0; i < n; ++i) {
            if (i == j) continue;
            const int ta = buckets[i];
            if (ta == tb && (strict_precedence || i > j)) continue;
            p(i, j) = w(ta, tb);
        }
        const double column_sum = p.col(j).sum();
        if (column_sum > 0.0) {
            p.col(j) /= column_sum;
        }
    }

    Logger::getInstance().debug(funcName, "Expanded " + std::to_string(weights.size()) +
        " onset times to " + std::to_string(n) + " cases.");
    return PairwiseInfectorMatrix(std::move(times), std::move(buckets), std::move(p));
}

PairwiseInfectorMatrix PairwiseInfectorMatrix::build(const CaseTable& cases,
                                                     const GenerationTimeDistribution& generation_time,
                                                     bool strict_precedence,
                                                     const std::optional<WallingaTeunisMatrix>& supplied_weights) {
    if (supplied_weights) {
        return expand(cases, *supplied_weights, strict_precedence);
    }
    WallingaTeunisMatrix weights = WallingaTeunisMatrix::build(onsetTimes(cases), generation_time, strict_precedence);
    return expand(cases, weights, strict_precedence);
}

bool PairwiseInfectorMatrix::hasInfector(int j) const {
    return probabilities_.col(j).sum() > 0.0;
}

} // namespace transdist

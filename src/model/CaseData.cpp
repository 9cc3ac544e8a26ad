#include "model/CaseData.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace transdist {

CaseTable makeCaseTable(const std::vector<double>& x,
                        const std::vector<double>& y,
                        const std::vector<double>& t) {
    if (x.size() != y.size() || x.size() != t.size()) {
        THROW_SHAPE_MISMATCH("makeCaseTable", "x, y and t must have equal length (got " +
            std::to_string(x.size()) + ", " + std::to_string(y.size()) + ", " + std::to_string(t.size()) + ").");
    }
    CaseTable cases(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        cases[i] = Case{x[i], y[i], t[i], static_cast<int>(i)};
    }
    return cases;
}

std::vector<double> onsetTimes(const CaseTable& cases) {
    std::vector<double> times;
    times.reserve(cases.size());
    for (const auto& c : cases) {
        times.push_back(c.t);
    }
    return times;
}

std::vector<double> uniqueOnsetTimes(const std::vector<double>& times) {
    std::vector<double> unique_times(times);
    std::sort(unique_times.begin(), unique_times.end());
    unique_times.erase(std::unique(unique_times.begin(), unique_times.end()), unique_times.end());
    return unique_times;
}

std::vector<double> uniqueOnsetTimes(const CaseTable& cases) {
    return uniqueOnsetTimes(onsetTimes(cases));
}

CaseTable filterCasesFrom(const CaseTable& cases, double t1) {
    CaseTable out;
    std::copy_if(cases.begin(), cases.end(), std::back_inserter(out),
                 [t1](const Case& c) { return c.t >= t1; });
    return out;
}

CaseTable filterCasesUpTo(const CaseTable& cases, double tau) {
    CaseTable out;
    std::copy_if(cases.begin(), cases.end(), std::back_inserter(out),
                 [tau](const Case& c) { return c.t <= tau; });
    return out;
}

std::vector<int> timeBucketIndices(const std::vector<double>& times, const std::vector<double>& unique_times) {
    std::vector<int> buckets(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        auto it = std::lower_bound(unique_times.begin(), unique_times.end(), times[i]);
        if (it == unique_times.end() || *it != times[i]) {
            THROW_SHAPE_MISMATCH("timeBucketIndices", "Onset time " + std::to_string(times[i]) +
                " of case " + std::to_string(i) + " is not among the supplied unique times.");
        }
        buckets[i] = static_cast<int>(it - unique_times.begin());
    }
    return buckets;
}

std::vector<int> timeBucketIndices(const CaseTable& cases, const std::vector<double>& unique_times) {
    return timeBucketIndices(onsetTimes(cases), unique_times);
}

void validateCaseTable(const CaseTable& cases, const std::string& caller) {
    for (size_t i = 0; i < cases.size(); ++i) {
        const Case& c = cases[i];
        if (!std::isfinite(c.x) || !std::isfinite(c.y) || !std::isfinite(c.t)) {
            THROW_DOMAIN_ERROR(caller, "Case " + std::to_string(i) + " (id " + std::to_string(c.id) +
                ") has a non-finite coordinate or onset time.");
        }
    }
}

} // namespace transdist

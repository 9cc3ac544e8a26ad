#ifndef CASE_DATA_HPP
#define CASE_DATA_HPP

#include <string>
#include <vector>

namespace transdist {

/**
 * @brief An observed infection event.
 *
 * `t` is the binned onset time step. `id` is the stable index of the case in
 * the table it was loaded from; bootstrap copies keep the id of their source.
 */
struct Case {
    double x = 0.0;
    double y = 0.0;
    double t = 0.0;
    int id = 0;
};

using CaseTable = std::vector<Case>;

/**
 * @brief Builds a case table from parallel coordinate and time vectors,
 * assigning ids 0..n-1.
 * @throws ShapeMismatchError if the vectors differ in length.
 */
CaseTable makeCaseTable(const std::vector<double>& x,
                        const std::vector<double>& y,
                        const std::vector<double>& t);

/** @return Onset times of the cases, in table order. */
std::vector<double> onsetTimes(const CaseTable& cases);

/** @return Sorted unique onset times present in `cases`. */
std::vector<double> uniqueOnsetTimes(const CaseTable& cases);
std::vector<double> uniqueOnsetTimes(const std::vector<double>& times);

/** @return Cases with t >= t1, in table order. */
CaseTable filterCasesFrom(const CaseTable& cases, double t1);

/** @return Cases with t <= tau, in table order. */
CaseTable filterCasesUpTo(const CaseTable& cases, double tau);

/**
 * @brief Maps every case to the position of its onset time in `unique_times`.
 * @throws ShapeMismatchError if a case time is not present in `unique_times`.
 */
std::vector<int> timeBucketIndices(const CaseTable& cases, const std::vector<double>& unique_times);
std::vector<int> timeBucketIndices(const std::vector<double>& times, const std::vector<double>& unique_times);

/**
 * @brief Rejects cases with non-finite coordinates or times.
 * @throws DomainError naming the first offending case.
 */
void validateCaseTable(const CaseTable& cases, const std::string& caller);

} // namespace transdist

#endif // CASE_DATA_HPP

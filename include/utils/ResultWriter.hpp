#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP

#include "model/TransdistTypes.hpp"
#include <string>

namespace transdist {

/**
 * @brief CSV writers for estimation results.
 *
 * Each writer emits a header row followed by one row per estimate. Missing
 * optional values (bounds when mean_equals_sd is set, absent temporal
 * windows) are written as NA.
 *
 * @throws FileIOException if `filename` cannot be opened for writing.
 */
void writeKernelEstimate(const std::string& filename, const KernelEstimate& estimate);
void writeBootstrapResult(const std::string& filename, const BootstrapResult& result);
void writeTemporalSeries(const std::string& filename, const TemporalSeries& series);
void writeTemporalSeries(const std::string& filename, const TemporalBootstrapSeries& series);

} // namespace transdist

#endif // RESULT_WRITER_HPP

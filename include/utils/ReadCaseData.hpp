#ifndef READ_CASE_DATA_HPP
#define READ_CASE_DATA_HPP

#include "model/CaseData.hpp"
#include "exceptions/CSVReadException.hpp"
#include <string>

namespace transdist {

/**
 * @brief Reads a case table from a CSV file with a header row.
 *
 * The header must name columns `x`, `y` and `t` (any order, surrounding
 * whitespace and quotes ignored); other columns are skipped. Blank lines are
 * ignored. Case ids are the zero-based data row indices.
 *
 * @throws CSVReadException::FileOpenError If the file cannot be opened
 * @throws CSVReadException::MissingColumn If x, y or t is absent from the header
 * @throws CSVReadException::NotEnoughRows If the file has no data rows
 * @throws CSVReadException::NotEnoughColumns If a row ends before a required column
 * @throws CSVReadException::InvalidNumberFormat If a required cell is not a number
 */
CaseTable readCaseTable(const std::string& filename);

} // namespace transdist

#endif // READ_CASE_DATA_HPP

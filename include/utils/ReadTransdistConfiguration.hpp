#ifndef READ_TRANSDIST_CONFIGURATION_HPP
#define READ_TRANSDIST_CONFIGURATION_HPP

#include "model/parameters/TransdistSettings.hpp"
#include <map>
#include <string>
#include <vector>

namespace transdist {

/**
 * @brief Reads a settings file of `<name> <value> [<value> ...]` lines.
 *
 * Leading/trailing whitespace is trimmed; blank lines and lines starting with
 * '#' are ignored. Values are parsed with std::stod, so `inf` and `-inf` are
 * accepted.
 *
 * @param filename Path to the settings file.
 * @param calling_function_name Name used in log lines and exceptions.
 * @return Map of setting names to their values, in file order of last occurrence.
 *
 * @throws FileIOException if the file cannot be opened.
 * @throws DataFormatException if a line has no value or a value is not a number.
 */
std::map<std::string, std::vector<double>> readSettingsFile(const std::string& filename,
                                                            const std::string& calling_function_name);

/**
 * @brief Reads the estimation pipeline settings.
 *
 * Recognized keys are the fields of TransdistSettings. `gen_t_pmf` takes one
 * or more values, every other key exactly one. Unknown keys are logged as
 * warnings and ignored. The result is validated before it is returned.
 *
 * @throws FileIOException if the file cannot be opened.
 * @throws DataFormatException on a malformed line, a wrong value count,
 *         a fractional integer value, or a missing gen_t_mean / gen_t_sd
 *         when no gen_t_pmf is given.
 * @throws InvalidParameterException, DomainError from TransdistSettings::validate().
 */
TransdistSettings readTransdistSettings(const std::string& filename);

} // namespace transdist

#endif // READ_TRANSDIST_CONFIGURATION_HPP

#ifndef CSV_READ_EXCEPTION_HPP
#define CSV_READ_EXCEPTION_HPP

#include "exceptions/Exceptions.hpp"
#include <string>

namespace transdist {

/**
 * @brief Exception class for errors while reading a case table CSV.
 *
 * Covers file access problems, a header without the required x/y/t columns,
 * short rows and cells that cannot be parsed as numbers.
 */
class CSVReadException : public DataFormatException {
public:
    /**
     * @brief Types of CSV reading errors that can occur
     */
    enum class ErrorType {
        FileOpenError,      ///< Failed to open the CSV file
        MissingColumn,      ///< Header lacks one of the required columns
        NotEnoughColumns,   ///< Row has fewer columns than the header
        NotEnoughRows,      ///< File has no data rows
        InvalidNumberFormat ///< Could not parse a value as a number
    };

    /**
     * @brief Constructs a new CSV read exception
     *
     * @param type The specific type of error that occurred
     * @param functionName Function raising the error
     * @param details Additional information about the error (file, row, column)
     */
    CSVReadException(ErrorType type, const std::string& functionName, const std::string& details);

    /** @return ErrorType The error type */
    ErrorType getErrorType() const noexcept;

private:
    ErrorType errorType_;

    static std::string createMessage(ErrorType type, const std::string& details);
};

} // namespace transdist

#endif // CSV_READ_EXCEPTION_HPP

#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace transdist {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the transmission distance pipeline.
 */
class TransdistException : public std::runtime_error {
public:
    /**
     * @brief Construct a TransdistException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    TransdistException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    TransdistException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Malformed probability inputs: a generation-time vector that is empty,
 * negative or does not sum to a positive value, or a negative distance.
 */
class DomainError : public TransdistException {
public:
    DomainError(const std::string& functionName, const std::string& message)
        : TransdistException(functionName, "Domain Error: " + message) {}
    DomainError(const char* file, int line, const std::string& functionName, const std::string& message)
        : TransdistException(file, line, functionName, "Domain Error", message) {}
};

/**
 * @brief A caller-supplied matrix or tensor does not match the case-time structure.
 */
class ShapeMismatchError : public TransdistException {
public:
    ShapeMismatchError(const std::string& functionName, const std::string& message)
        : TransdistException(functionName, "Shape Mismatch: " + message) {}
    ShapeMismatchError(const char* file, int line, const std::string& functionName, const std::string& message)
        : TransdistException(file, line, functionName, "Shape Mismatch", message) {}
};

/**
 * @brief Too few unique onset times or case pairs to compute an estimate.
 */
class InsufficientDataError : public TransdistException {
public:
    InsufficientDataError(const std::string& functionName, const std::string& message)
        : TransdistException(functionName, "Insufficient Data: " + message) {}
    InsufficientDataError(const char* file, int line, const std::string& functionName, const std::string& message)
        : TransdistException(file, line, functionName, "Insufficient Data", message) {}
};

/**
 * @brief Exception for invalid configuration or method parameters.
 */
class InvalidParameterException : public TransdistException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : TransdistException(functionName, "Invalid Parameter: " + message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : TransdistException(file, line, functionName, "Invalid Parameter", message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public TransdistException {
public:
    /**
     * @brief Construct a FileIOException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the file I/O error.
     */
    FileIOException(const std::string& functionName, const std::string& message)
        : TransdistException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public TransdistException {
public:
    /**
     * @brief Construct a DataFormatException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the formatting error.
     */
    DataFormatException(const std::string& functionName, const std::string& message)
        : TransdistException(functionName, "Data Format Error: " + message) {}
};

} // namespace transdist

#define THROW_DOMAIN_ERROR(func, msg) throw transdist::DomainError(__FILE__, __LINE__, func, msg)
#define THROW_SHAPE_MISMATCH(func, msg) throw transdist::ShapeMismatchError(__FILE__, __LINE__, func, msg)
#define THROW_INSUFFICIENT_DATA(func, msg) throw transdist::InsufficientDataError(__FILE__, __LINE__, func, msg)
#define THROW_INVALID_PARAM(func, msg) throw transdist::InvalidParameterException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP

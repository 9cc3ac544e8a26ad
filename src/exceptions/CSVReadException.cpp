#include "exceptions/CSVReadException.hpp"
#include <string>

namespace transdist {

    CSVReadException::CSVReadException(ErrorType type, const std::string& functionName, const std::string& details)
    : DataFormatException(functionName, createMessage(type, details)),
      errorType_(type) {}

    CSVReadException::ErrorType CSVReadException::getErrorType() const noexcept {
        return errorType_;
    }

    std::string CSVReadException::createMessage(ErrorType type, const std::string& details) {
        std::string baseMsg;
        switch (type) {
            case ErrorType::FileOpenError:
                baseMsg = "Could not open case table";
                break;
            case ErrorType::MissingColumn:
                baseMsg = "Required column missing from header";
                break;
            case ErrorType::NotEnoughColumns:
                baseMsg = "Row shorter than header";
                break;
            case ErrorType::NotEnoughRows:
                baseMsg = "No case rows";
                break;
            case ErrorType::InvalidNumberFormat:
                baseMsg = "Invalid number format";
                break;
            default:
                baseMsg = "Unknown CSV error";
                break;
        }
        return baseMsg + (details.empty() ? "" : ": " + details);
    }

} // namespace transdist

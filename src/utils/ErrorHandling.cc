#include "chronicle/utils/ErrorHandling.hh"

#include "chronicle/core/Log.hh"

namespace chronicle {

ChronicleException::ChronicleException(std::string message) : message_(std::move(message)) {}

const char* ChronicleException::what() const noexcept {
    return message_.c_str();
}

FormatError::FormatError(int line, const std::string& message)
    : ChronicleException("Line " + std::to_string(line) + ": " + message), line_(line) {}

void throwError(const std::string& message) {
    CHRONICLE_LOG_ERROR("{}", message);
    throw ChronicleException(message);
}

void throwStoreError(const std::string& message) {
    CHRONICLE_STORE_LOG_WARN("{}", message);
    throw StoreError(message);
}

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok:
        return "Ok";
    case ErrorCode::InvalidState:
        return "InvalidState";
    case ErrorCode::NotFound:
        return "NotFound";
    case ErrorCode::AlreadyExists:
        return "AlreadyExists";
    case ErrorCode::TypeMismatch:
        return "TypeMismatch";
    case ErrorCode::OutOfRange:
        return "OutOfRange";
    case ErrorCode::ParseFailure:
        return "ParseFailure";
    case ErrorCode::IoFailure:
        return "IoFailure";
    case ErrorCode::Internal:
        return "Internal";
    }
    return "Unknown";
}

} // namespace chronicle

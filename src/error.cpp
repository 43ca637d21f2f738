#include "error.h"
#include <sstream>

namespace dsvkit {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_DIALECT: return "INVALID_DIALECT";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::FIELD_TOO_LARGE: return "FIELD_TOO_LARGE";
        case ErrorCode::WRITE_ERROR: return "WRITE_ERROR";
        default: return "UNKNOWN";
    }
}

const char* error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string ParseError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_severity_to_string(severity) << "] "
       << error_code_to_string(code) << " at byte " << byte_offset
       << ": " << message;
    return ss.str();
}

} // namespace dsvkit

#ifndef DSVKIT_ERROR_H
#define DSVKIT_ERROR_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dsvkit {

// Error codes reported by the tokenizer, the writer and dialect validation
enum class ErrorCode {
    NONE = 0,

    // Configuration errors
    INVALID_DIALECT,   // Conflicting separator/quote/escape/comment bytes

    // Source errors (sticky, terminal)
    IO_ERROR,          // The underlying stream failed while reading
    FIELD_TOO_LARGE,   // A piece exceeded the configured maximum size

    // Sink errors (sticky)
    WRITE_ERROR        // The underlying stream failed while writing
};

// Error severity levels
enum class ErrorSeverity {
    ERROR,      // Rejected configuration, nothing was read or written
    FATAL       // Unrecoverable error, no further output is produced
};

// Detailed error information
struct ParseError {
    ErrorCode code;
    ErrorSeverity severity;

    size_t byte_offset;   // Byte offset in the stream where the error was detected

    std::string message;  // Human-readable error message

    ParseError(ErrorCode c, ErrorSeverity s, size_t offset, const std::string& msg)
        : code(c), severity(s), byte_offset(offset), message(msg) {}

    // Convert error to string
    std::string to_string() const;
};

// Exception thrown for configuration errors detected before any read
class ParseException : public std::runtime_error {
public:
    explicit ParseException(const ParseError& error)
        : std::runtime_error(error.message), error_(error) {}

    const ParseError& error() const { return error_; }

private:
    ParseError error_;
};

// Helper functions
const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace dsvkit

#endif // DSVKIT_ERROR_H

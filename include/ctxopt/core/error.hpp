#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace ctxopt {

enum class ErrorCode {
    Unknown = 1,
    InvalidArgument,
    InvalidConfig,
    NotFound,
    IoError,
    Unsupported,
    ParseError,
    SerializationError,
    SubprocessError,
    SecurityBlocked,
    PathRejected,
    Timeout,
    MemoryLimit,
    RuntimeError,
    OutputTooLarge,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Stable upper-case name for an ErrorCode, used in logs and tool results.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::Unsupported: return "UNSUPPORTED";
        case ErrorCode::ParseError: return "PARSE_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::SubprocessError: return "SUBPROCESS_ERROR";
        case ErrorCode::SecurityBlocked: return "SECURITY_BLOCKED";
        case ErrorCode::PathRejected: return "PATH_REJECTED";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::MemoryLimit: return "MEMORY_LIMIT";
        case ErrorCode::RuntimeError: return "RUNTIME_ERROR";
        case ErrorCode::OutputTooLarge: return "OUTPUT_TOO_LARGE";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// Use return ok_result() instead of return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace ctxopt

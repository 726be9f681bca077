#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace dentassist {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    AlreadyExists,
    Timeout,
    Cancelled,
    ConnectionFailed,
    ConnectionClosed,
    ProtocolError,
    SerializationError,
    IoError,
    DatabaseError,
    ProviderError,
    EmbeddingUnavailable,
    GenerationUnavailable,
    InvalidEntryState,
    DimensionMismatch,
    SessionError,
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

    /// False for failures caused by the request itself; repeating it cannot help.
    [[nodiscard]] auto retryable() const noexcept -> bool {
        switch (code_) {
            case ErrorCode::InvalidArgument:
            case ErrorCode::InvalidConfig:
            case ErrorCode::NotFound:
            case ErrorCode::AlreadyExists:
            case ErrorCode::DimensionMismatch:
            case ErrorCode::Cancelled:
                return false;
            default:
                return true;
        }
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

/// Wire name of an error code, as sent in gateway error frames.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::DatabaseError: return "DATABASE_ERROR";
        case ErrorCode::ProviderError: return "PROVIDER_ERROR";
        case ErrorCode::EmbeddingUnavailable: return "EMBEDDING_UNAVAILABLE";
        case ErrorCode::GenerationUnavailable: return "GENERATION_UNAVAILABLE";
        case ErrorCode::InvalidEntryState: return "INVALID_ENTRY_STATE";
        case ErrorCode::DimensionMismatch: return "DIMENSION_MISMATCH";
        case ErrorCode::SessionError: return "SESSION_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// The conversion to std::expected happens in a user-defined conversion
// operator, outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace dentassist

#pragma once

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tgwire {

enum class ErrorCode {
    Unknown = 1,
    InvalidArgument,
    InvalidConfig,
    SerializationError,
    KindNotRecognized,
    InvalidEndpoint,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    Error(ErrorCode code, std::string message, std::string detail, std::string subject)
        : code_(code)
        , message_(std::move(message))
        , detail_(std::move(detail))
        , subject_(std::move(subject)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// Name of the thing the error is about, e.g. the union kind that
    /// failed to resolve. Empty when not applicable.
    [[nodiscard]] auto subject() const noexcept -> std::string_view { return subject_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::string subject_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Convert ErrorCode to its stable string form.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::KindNotRecognized: return "KIND_NOT_RECOGNIZED";
        case ErrorCode::InvalidEndpoint: return "INVALID_ENDPOINT";
        default: return "UNKNOWN";
    }
}

/// Carries an Error out of nlohmann from_json hooks, which can only
/// report failure by throwing. Public decode entry points catch it and
/// hand the wrapped Error back as a Result.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(Error error)
        : std::runtime_error(error.what()), error_(std::move(error)) {}

    [[nodiscard]] auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

} // namespace tgwire

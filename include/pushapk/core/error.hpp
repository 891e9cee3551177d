#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace pushapk {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    InvalidTask,
    InvalidPayload,
    ScopeValidation,
    ChannelNotConfigured,
    UnsupportedChannel,
    ConflictingCommitSignal,
    IoError,
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

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Convert ErrorCode to the name reported in task failure output.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidTask: return "INVALID_TASK";
        case ErrorCode::InvalidPayload: return "INVALID_PAYLOAD";
        case ErrorCode::ScopeValidation: return "SCOPE_VALIDATION_ERROR";
        case ErrorCode::ChannelNotConfigured: return "CHANNEL_NOT_CONFIGURED";
        case ErrorCode::UnsupportedChannel: return "UNSUPPORTED_CHANNEL";
        case ErrorCode::ConflictingCommitSignal: return "CONFLICTING_COMMIT_SIGNAL";
        case ErrorCode::IoError: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace pushapk

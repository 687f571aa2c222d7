// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolchat
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ModelLoadError,
    BackendError,
    TransportError,
    ProtocolError,
    TimeoutError,
    ConnectionError,
    NotConnected,
    NotReady,
    UnknownTool,
    ToolInvocationError,
    MalformedStream,
    TurnLimitExceeded,
    Cancelled,
};

/// @brief Returns the symbolic name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ModelLoadError: return "ModelLoadError";
        case ErrorCode::BackendError: return "BackendError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::NotReady: return "NotReady";
        case ErrorCode::UnknownTool: return "UnknownTool";
        case ErrorCode::ToolInvocationError: return "ToolInvocationError";
        case ErrorCode::MalformedStream: return "MalformedStream";
        case ErrorCode::TurnLimitExceeded: return "TurnLimitExceeded";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Re-wraps an existing error under a different code, keeping the original as context.
[[nodiscard]] inline auto wrapError(ErrorCode code, std::string_view context, const Error& cause)
    -> std::unexpected<Error>
{
    return makeError(code, std::format("{}: {}", context, cause.message));
}

} // namespace toolchat

template <>
struct std::formatter<toolchat::Error>: std::formatter<std::string>
{
    auto format(const toolchat::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolchat::errorCodeName(error.code), error.message), ctx);
    }
};

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolrelay
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    ProtocolError,
    TimeoutError,
    Cancelled,

    // Tool-server and streaming failures.
    LaunchFailure,
    HandshakeTimeout,
    NotConnected,
    UnknownCapability,
    InvocationFailed,
    TransportDroppedEvent,
    StaleSelection,
};

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

/// @brief Returns a stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::LaunchFailure: return "LaunchFailure";
        case ErrorCode::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::UnknownCapability: return "UnknownCapability";
        case ErrorCode::InvocationFailed: return "InvocationFailed";
        case ErrorCode::TransportDroppedEvent: return "TransportDroppedEvent";
        case ErrorCode::StaleSelection: return "StaleSelection";
    }
    return "Unknown";
}

/// @brief Returns true for conditions that are reported to the user.
///
/// Everything else is internal bookkeeping and only shows up in the log.
[[nodiscard]] constexpr auto isUserVisible(ErrorCode code) -> bool
{
    return code == ErrorCode::LaunchFailure || code == ErrorCode::HandshakeTimeout
           || code == ErrorCode::InvocationFailed;
}

} // namespace toolrelay

template <>
struct std::formatter<toolrelay::Error>: std::formatter<std::string>
{
    auto format(const toolrelay::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolrelay::errorCodeName(error.code), error.message), ctx);
    }
};

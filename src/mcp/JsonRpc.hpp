// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace toolrelay::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 message received from a provider.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Method name when the message is a server-initiated request or notification.
    std::optional<std::string> method;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Returns true if this message is not a reply to one of our requests.
    [[nodiscard]] auto isServerMessage() const -> bool { return method.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID, used as correlation token for the reply.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Returns the numeric correlation id of a message, if it carries one.
///
/// Accepts integer ids as well as decimal strings, since some providers echo ids as strings.
[[nodiscard]] auto idOf(const nlohmann::json& id) -> std::optional<int64_t>;

} // namespace toolrelay::jsonrpc

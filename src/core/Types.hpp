// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace toolrelay
{

/// @brief Identity and launch description of one tool-provider process.
///
/// Replaced as a whole record on edit; never patched field by field.
struct ServerConfig
{
    std::string id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled = true;

    auto operator==(const ServerConfig&) const -> bool = default;
};

/// @brief Connectivity of a tool-provider connection.
enum class ConnectionStatus
{
    Disconnected,
    Connecting,
    Connected,
    Errored,
};

/// @brief Converts a ConnectionStatus to its display string.
[[nodiscard]] constexpr auto statusToString(ConnectionStatus status) -> std::string_view
{
    switch (status)
    {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Errored: return "errored";
    }
    return "unknown";
}

/// @brief A named, schema-described operation exposed by one tool provider.
///
/// Identity is (serverId, name); names are only unique within a server.
struct Capability
{
    std::string serverId;
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Identity of a capability, without its descriptor.
struct CapabilityRef
{
    std::string serverId;
    std::string name;

    auto operator==(const CapabilityRef&) const -> bool = default;
    auto operator<=>(const CapabilityRef&) const = default;
};

/// @brief Tool invocation extracted from a model response.
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

/// @brief The result of executing a tool call.
struct ToolResult
{
    std::string callId;
    std::string content;
    bool isError = false;
};

} // namespace toolrelay

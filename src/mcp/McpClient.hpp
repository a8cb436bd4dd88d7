// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace toolrelay
{

/// @brief Provider identity and capabilities reported during initialization.
struct McpServerInfo
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

/// @brief Bounds a single request: how long to wait and how to cancel it.
struct CallOptions
{
    std::chrono::milliseconds timeout { 30'000 };
    std::stop_token stop;
};

/// @brief Client for the Model Context Protocol (MCP) over one transport.
///
/// Handles the MCP lifecycle: initialize, list tools, call tools.
/// Every request carries a fresh JSON-RPC id; replies are matched by that id, so a reply that
/// arrives after its request timed out or was cancelled is recognized and discarded.
/// Not thread-safe; the owner serializes access.
class McpClient
{
  public:
    /// @brief Constructs an McpClient with the given transport.
    /// @param serverId Identifier of the provider, stamped onto discovered capabilities.
    /// @param transport The transport to use for communication.
    McpClient(std::string serverId, std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the MCP initialize handshake.
    /// @return The provider's identity and capabilities or an error.
    [[nodiscard]] auto initialize(const CallOptions& options) -> Result<McpServerInfo>;

    /// @brief Queries the provider's capability manifest.
    /// @return The discovered capabilities or an error.
    [[nodiscard]] auto listTools(const CallOptions& options) -> Result<std::vector<Capability>>;

    /// @brief Calls a tool on the provider.
    ///
    /// A tool that ran but reported failure yields a ToolResult with isError set;
    /// an Error is returned only if the call itself did not complete.
    /// @param name The tool name.
    /// @param arguments The tool arguments.
    /// @return The tool result or an error.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments, const CallOptions& options)
        -> Result<ToolResult>;

    /// @brief Closes the underlying transport.
    void close();

    /// @brief Returns the provider info (valid after initialize).
    [[nodiscard]] auto serverInfo() const -> const McpServerInfo&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Returns true while the transport is open.
    [[nodiscard]] auto isConnected() const -> bool;

  private:
    std::string _serverId;
    std::unique_ptr<Transport> _transport;
    McpServerInfo _serverInfo;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params, const CallOptions& options)
        -> Result<nlohmann::json>;

    void answerServerRequest(const nlohmann::json& id, const std::string& method, const CallOptions& options);
};

} // namespace toolrelay

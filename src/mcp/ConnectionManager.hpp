// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/CapabilityCatalog.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolrelay
{

/// @brief Creates the private channel to a provider, launching its process.
using TransportFactory = std::function<Result<std::unique_ptr<Transport>>(const ServerConfig& config)>;

/// @brief Default factory: spawns the provider over stdio with sanitized arguments.
[[nodiscard]] auto launchStdioTransport(const ServerConfig& config) -> Result<std::unique_ptr<Transport>>;

/// @brief Timeouts applied to provider traffic.
struct ConnectionManagerConfig
{
    /// @brief Upper bound for process launch, initialize handshake and capability discovery.
    std::chrono::milliseconds handshakeTimeout { 10'000 };

    /// @brief Upper bound for a single tool invocation.
    std::chrono::milliseconds invokeTimeout { 60'000 };
};

/// @brief Read-only copy of one connection's state.
struct ConnectionSnapshot
{
    std::string serverId;
    std::string name;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::optional<Error> lastError;
    std::vector<Capability> capabilities;
};

/// @brief Supervises tool-provider processes and routes capability traffic to them.
///
/// Keeps at most one connection per server id. Each connection is an independently supervised
/// entry with its own channel lock, so a slow or hung provider only ever delays calls to itself.
/// Connection state can be read at any time without waiting on pending provider traffic.
///
/// Operations never throw; all failures are returned as typed results.
class ConnectionManager: public CapabilityCatalog
{
  public:
    /// @brief Constructs a manager.
    /// @param config Timeouts for provider traffic.
    /// @param factory Channel factory; defaults to launchStdioTransport().
    explicit ConnectionManager(ConnectionManagerConfig config = {}, TransportFactory factory = {});
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Launches the provider and discovers its capabilities.
    ///
    /// Stores @p config as the server's current record. An existing connection for the same id is
    /// torn down first. Failures leave the connection in ConnectionStatus::Errored with the cause
    /// recorded; nothing is retried automatically.
    /// @return Success, or LaunchFailure, HandshakeTimeout, ProtocolError, InvalidArgument (disabled
    ///         config) or Cancelled (abandoned while pending).
    [[nodiscard]] auto connect(const ServerConfig& config) -> VoidResult;

    /// @brief Terminates the provider and forgets its capabilities. No-op if not connected.
    void disconnect(std::string_view serverId);

    /// @brief Disconnects and connects again using the stored config.
    [[nodiscard]] auto reconnect(std::string_view serverId) -> VoidResult;

    /// @brief Invokes a capability on a connected provider.
    /// @return The tool result, or NotConnected, UnknownCapability, InvocationFailed or Cancelled.
    [[nodiscard]] auto invoke(std::string_view serverId, std::string_view capabilityName, const nlohmann::json& arguments)
        -> Result<ToolResult>;

    /// @brief Abandons the pending calls of a server.
    ///
    /// Abandoned calls return ErrorCode::Cancelled and leave connection state untouched.
    /// Replies that arrive later are discarded.
    void abandon(std::string_view serverId);

    /// @brief Disconnects a server and drops its stored config.
    void removeServer(std::string_view serverId);

    /// @brief Reconciles live connections with a full list of server records.
    ///
    /// Enabled records that are new, changed or not connected are (re)connected concurrently;
    /// disabled or missing records are disconnected. Errored connections with an unchanged record
    /// are left alone.
    /// @return The servers that failed to connect, with their errors.
    [[nodiscard]] auto applyConfigs(std::span<const ServerConfig> configs)
        -> std::vector<std::pair<std::string, Error>>;

    [[nodiscard]] auto listCapabilities(std::string_view serverId) const -> std::vector<Capability> override;

    /// @brief Returns the capabilities of every connected server, ordered by server id.
    [[nodiscard]] auto listAllConnected() const -> std::vector<Capability>;

    [[nodiscard]] auto status(std::string_view serverId) const -> ConnectionStatus;
    [[nodiscard]] auto snapshot(std::string_view serverId) const -> std::optional<ConnectionSnapshot>;
    [[nodiscard]] auto snapshots() const -> std::vector<ConnectionSnapshot>;

    /// @brief Returns the stored config of a server, if any.
    [[nodiscard]] auto storedConfig(std::string_view serverId) const -> std::optional<ServerConfig>;

    [[nodiscard]] auto connectedCount() const -> size_t;

    /// @brief Disconnects every server.
    void shutdown();

  private:
    struct Entry;

    ConnectionManagerConfig _config;
    TransportFactory _factory;

    mutable std::mutex _tableMutex;
    std::map<std::string, std::shared_ptr<Entry>, std::less<>> _entries;
    std::map<std::string, ServerConfig, std::less<>> _configs;

    [[nodiscard]] auto find(std::string_view serverId) const -> std::shared_ptr<Entry>;
    [[nodiscard]] auto takeEntry(std::string_view serverId) -> std::shared_ptr<Entry>;
    static void teardown(Entry& entry);
};

} // namespace toolrelay

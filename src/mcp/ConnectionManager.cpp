// SPDX-License-Identifier: Apache-2.0
#include "ConnectionManager.hpp"

#include <core/Log.hpp>
#include <mcp/ArgumentSanitizer.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/StdioTransport.hpp>

#include <algorithm>
#include <format>
#include <stop_token>
#include <thread>

namespace toolrelay
{

namespace
{
    using Clock = std::chrono::steady_clock;

    auto remainingUntil(Clock::time_point deadline) -> std::chrono::milliseconds
    {
        return std::max(std::chrono::milliseconds(0),
                        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()));
    }

    /// @brief Maps a handshake failure onto the connection error taxonomy.
    auto handshakeError(const ServerConfig& config, const Error& error) -> Error
    {
        switch (error.code)
        {
            case ErrorCode::TimeoutError:
                return Error { ErrorCode::HandshakeTimeout,
                               std::format("Provider '{}' did not complete the handshake: {}",
                                           config.name,
                                           error.message) };
            case ErrorCode::TransportError:
                return Error { ErrorCode::LaunchFailure,
                               std::format("Provider '{}' exited during startup: {}", config.name, error.message) };
            default: return error;
        }
    }
} // namespace

auto launchStdioTransport(const ServerConfig& config) -> Result<std::unique_ptr<Transport>>
{
    auto transport = std::make_unique<StdioTransport>();

    auto const started = transport->start(StdioTransportConfig {
        .command = config.command,
        .args = sanitizeArguments(config.args),
        .env = config.env,
    });
    if (!started)
        return std::unexpected(started.error());

    return std::unique_ptr<Transport>(std::move(transport));
}

/// @brief One supervised connection.
///
/// ioMutex serializes traffic on the channel and may be held for as long as a call is pending.
/// stateMutex guards everything readers look at and is never held across I/O.
struct ConnectionManager::Entry
{
    std::mutex ioMutex;
    std::unique_ptr<McpClient> client;

    mutable std::mutex stateMutex;
    ServerConfig config;
    ConnectionStatus status = ConnectionStatus::Connecting;
    std::optional<Error> lastError;
    std::vector<Capability> capabilities;
    std::stop_source pending;

    explicit Entry(ServerConfig cfg): config(std::move(cfg)) {}

    auto token() const -> std::stop_token
    {
        auto const lock = std::lock_guard(stateMutex);
        return pending.get_token();
    }

    void abandonPending()
    {
        auto const lock = std::lock_guard(stateMutex);
        pending.request_stop();
        pending = std::stop_source {};
    }

    /// @brief Applies a state change unless the call that produced it was abandoned.
    template <typename F>
    auto commit(const std::stop_token& stop, F&& apply) -> bool
    {
        auto const lock = std::lock_guard(stateMutex);
        if (stop.stop_requested())
            return false;
        apply();
        return true;
    }

    auto toSnapshot() const -> ConnectionSnapshot
    {
        auto const lock = std::lock_guard(stateMutex);
        return ConnectionSnapshot {
            .serverId = config.id,
            .name = config.name,
            .status = status,
            .lastError = lastError,
            .capabilities = status == ConnectionStatus::Connected ? capabilities : std::vector<Capability> {},
        };
    }
};

ConnectionManager::ConnectionManager(ConnectionManagerConfig config, TransportFactory factory):
    _config(config), _factory(factory ? std::move(factory) : TransportFactory(launchStdioTransport))
{
}

ConnectionManager::~ConnectionManager()
{
    shutdown();
}

auto ConnectionManager::connect(const ServerConfig& config) -> VoidResult
{
    if (config.id.empty())
        return makeError(ErrorCode::InvalidArgument, "Server config has no id");
    if (!config.enabled)
        return makeError(ErrorCode::InvalidArgument, std::format("Server '{}' is disabled", config.id));

    auto entry = std::make_shared<Entry>(config);
    auto previous = std::shared_ptr<Entry> {};
    {
        auto const lock = std::lock_guard(_tableMutex);
        _configs.insert_or_assign(config.id, config);
        if (auto it = _entries.find(config.id); it != _entries.end())
            previous = std::move(it->second);
        _entries.insert_or_assign(config.id, entry);
    }

    if (previous)
    {
        log::debug("[{}] replacing existing connection", config.id);
        previous->abandonPending();
        teardown(*previous);
    }

    auto const stop = entry->token();
    auto const deadline = Clock::now() + _config.handshakeTimeout;
    auto const io = std::lock_guard(entry->ioMutex);

    auto fail = [&](Error error) -> VoidResult {
        if (entry->client)
        {
            entry->client->close();
            entry->client.reset();
        }
        if (!entry->commit(stop, [&] {
                entry->status = ConnectionStatus::Errored;
                entry->lastError = error;
                entry->capabilities.clear();
            }))
        {
            return makeError(ErrorCode::Cancelled, std::format("Connect to '{}' abandoned", config.id));
        }
        log::error("[{}] {}", config.id, error.message);
        return std::unexpected(std::move(error));
    };

    log::info("[{}] connecting to '{}' ({})", config.id, config.name, config.command);

    auto transport = _factory(config);
    if (!transport)
    {
        auto error = transport.error();
        if (error.code != ErrorCode::LaunchFailure)
            error = Error { ErrorCode::LaunchFailure, error.message };
        return fail(std::move(error));
    }

    entry->client = std::make_unique<McpClient>(config.id, std::move(*transport));

    auto const info = entry->client->initialize(CallOptions { .timeout = remainingUntil(deadline), .stop = stop });
    if (!info)
        return fail(handshakeError(config, info.error()));

    auto capabilities = std::vector<Capability> {};
    if (info->hasTools)
    {
        auto tools = entry->client->listTools(CallOptions { .timeout = remainingUntil(deadline), .stop = stop });
        if (tools)
            capabilities = std::move(*tools);
        else if (tools.error().code == ErrorCode::ProtocolError)
            log::warning("[{}] failed to list tools: {}", config.id, tools.error().message);
        else
            return fail(handshakeError(config, tools.error()));
    }

    auto const count = capabilities.size();
    if (!entry->commit(stop, [&] {
            entry->status = ConnectionStatus::Connected;
            entry->lastError.reset();
            entry->capabilities = std::move(capabilities);
        }))
    {
        entry->client->close();
        entry->client.reset();
        return makeError(ErrorCode::Cancelled, std::format("Connect to '{}' abandoned", config.id));
    }

    log::info("[{}] connected with {} capabilities", config.id, count);
    return {};
}

void ConnectionManager::disconnect(std::string_view serverId)
{
    auto entry = takeEntry(serverId);
    if (!entry)
    {
        log::debug("[{}] disconnect: not connected", serverId);
        return;
    }

    entry->abandonPending();
    teardown(*entry);
    log::info("[{}] disconnected", serverId);
}

auto ConnectionManager::reconnect(std::string_view serverId) -> VoidResult
{
    auto config = storedConfig(serverId);
    if (!config)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", serverId));

    disconnect(serverId);
    return connect(*config);
}

auto ConnectionManager::invoke(std::string_view serverId,
                               std::string_view capabilityName,
                               const nlohmann::json& arguments) -> Result<ToolResult>
{
    auto entry = find(serverId);
    if (!entry)
        return makeError(ErrorCode::NotConnected, std::format("Server '{}' is not connected", serverId));

    {
        auto const lock = std::lock_guard(entry->stateMutex);
        if (entry->status != ConnectionStatus::Connected)
            return makeError(ErrorCode::NotConnected,
                             std::format("Server '{}' is {}", serverId, statusToString(entry->status)));

        auto const known = std::ranges::any_of(
            entry->capabilities, [&](const Capability& capability) { return capability.name == capabilityName; });
        if (!known)
            return makeError(ErrorCode::UnknownCapability,
                             std::format("Server '{}' has no capability '{}'", serverId, capabilityName));
    }

    auto const stop = entry->token();
    auto const io = std::lock_guard(entry->ioMutex);

    if (stop.stop_requested())
        return makeError(ErrorCode::Cancelled, std::format("Call to '{}' abandoned", capabilityName));
    if (!entry->client)
        return makeError(ErrorCode::NotConnected, std::format("Server '{}' is not connected", serverId));

    log::debug("[{}] invoking '{}'", serverId, capabilityName);
    auto result = entry->client->callTool(
        capabilityName, arguments, CallOptions { .timeout = _config.invokeTimeout, .stop = stop });
    if (result)
        return result;

    auto const& error = result.error();
    if (error.code == ErrorCode::Cancelled)
        return std::unexpected(error);

    if (error.code == ErrorCode::TransportError)
    {
        // The provider went away; nothing on this channel can succeed any more.
        entry->client->close();
        entry->client.reset();
        entry->commit(stop, [&] {
            entry->status = ConnectionStatus::Errored;
            entry->lastError = Error { ErrorCode::TransportError, error.message };
            entry->capabilities.clear();
        });
    }

    log::error("[{}] '{}' failed: {}", serverId, capabilityName, error.message);
    return makeError(ErrorCode::InvocationFailed, std::format("{}: {}", capabilityName, error.message));
}

void ConnectionManager::abandon(std::string_view serverId)
{
    if (auto entry = find(serverId))
    {
        entry->abandonPending();
        log::debug("[{}] pending calls abandoned", serverId);
    }
}

void ConnectionManager::removeServer(std::string_view serverId)
{
    disconnect(serverId);

    auto const lock = std::lock_guard(_tableMutex);
    if (auto it = _configs.find(serverId); it != _configs.end())
        _configs.erase(it);
}

auto ConnectionManager::applyConfigs(std::span<const ServerConfig> configs)
    -> std::vector<std::pair<std::string, Error>>
{
    auto toConnect = std::vector<ServerConfig> {};
    auto toDisconnect = std::vector<std::string> {};
    auto toRemove = std::vector<std::string> {};

    {
        auto const lock = std::lock_guard(_tableMutex);

        for (const auto& [id, stored]: _configs)
        {
            auto const listed = std::ranges::any_of(configs, [&](const ServerConfig& c) { return c.id == id; });
            if (!listed)
                toRemove.push_back(id);
        }

        for (const auto& config: configs)
        {
            if (!config.enabled)
            {
                toDisconnect.push_back(config.id);
                continue;
            }

            auto const stored = _configs.find(config.id);
            auto const entry = _entries.find(config.id);
            auto const changed = stored == _configs.end() || stored->second != config;
            if (changed || entry == _entries.end())
                toConnect.push_back(config);
        }
    }

    for (const auto& id: toRemove)
        removeServer(id);

    for (const auto& id: toDisconnect)
        disconnect(id);

    {
        // Disabled records are remembered so a later enable can reconnect them.
        auto const lock = std::lock_guard(_tableMutex);
        for (const auto& config: configs)
        {
            if (!config.enabled)
                _configs.insert_or_assign(config.id, config);
        }
    }

    auto results = std::vector<VoidResult>(toConnect.size());
    {
        auto workers = std::vector<std::jthread> {};
        workers.reserve(toConnect.size());
        for (size_t i = 0; i < toConnect.size(); ++i)
            workers.emplace_back([this, &toConnect, &results, i] { results[i] = connect(toConnect[i]); });
    }

    auto failures = std::vector<std::pair<std::string, Error>> {};
    for (size_t i = 0; i < toConnect.size(); ++i)
    {
        if (!results[i])
            failures.emplace_back(toConnect[i].id, results[i].error());
    }
    return failures;
}

auto ConnectionManager::listCapabilities(std::string_view serverId) const -> std::vector<Capability>
{
    auto entry = find(serverId);
    if (!entry)
        return {};

    auto const lock = std::lock_guard(entry->stateMutex);
    if (entry->status != ConnectionStatus::Connected)
        return {};
    return entry->capabilities;
}

auto ConnectionManager::listAllConnected() const -> std::vector<Capability>
{
    auto result = std::vector<Capability> {};
    for (auto const& snap: snapshots())
    {
        for (auto const& capability: snap.capabilities)
            result.push_back(capability);
    }
    return result;
}

auto ConnectionManager::status(std::string_view serverId) const -> ConnectionStatus
{
    auto entry = find(serverId);
    if (!entry)
        return ConnectionStatus::Disconnected;

    auto const lock = std::lock_guard(entry->stateMutex);
    return entry->status;
}

auto ConnectionManager::snapshot(std::string_view serverId) const -> std::optional<ConnectionSnapshot>
{
    auto entry = find(serverId);
    if (!entry)
        return std::nullopt;
    return entry->toSnapshot();
}

auto ConnectionManager::snapshots() const -> std::vector<ConnectionSnapshot>
{
    auto entries = std::vector<std::shared_ptr<Entry>> {};
    {
        auto const lock = std::lock_guard(_tableMutex);
        for (const auto& [id, entry]: _entries)
            entries.push_back(entry);
    }

    auto result = std::vector<ConnectionSnapshot> {};
    result.reserve(entries.size());
    for (const auto& entry: entries)
        result.push_back(entry->toSnapshot());
    return result;
}

auto ConnectionManager::storedConfig(std::string_view serverId) const -> std::optional<ServerConfig>
{
    auto const lock = std::lock_guard(_tableMutex);
    if (auto it = _configs.find(serverId); it != _configs.end())
        return it->second;
    return std::nullopt;
}

auto ConnectionManager::connectedCount() const -> size_t
{
    auto const all = snapshots();
    return static_cast<size_t>(std::ranges::count_if(
        all, [](const ConnectionSnapshot& s) { return s.status == ConnectionStatus::Connected; }));
}

void ConnectionManager::shutdown()
{
    auto entries = std::map<std::string, std::shared_ptr<Entry>, std::less<>> {};
    {
        auto const lock = std::lock_guard(_tableMutex);
        entries.swap(_entries);
    }

    // Abandon everything first so no teardown waits on another provider's pending call.
    for (auto& [id, entry]: entries)
        entry->abandonPending();

    for (auto& [id, entry]: entries)
        teardown(*entry);

    if (!entries.empty())
        log::info("Shut down {} tool provider connection(s)", entries.size());
}

auto ConnectionManager::find(std::string_view serverId) const -> std::shared_ptr<Entry>
{
    auto const lock = std::lock_guard(_tableMutex);
    if (auto it = _entries.find(serverId); it != _entries.end())
        return it->second;
    return nullptr;
}

auto ConnectionManager::takeEntry(std::string_view serverId) -> std::shared_ptr<Entry>
{
    auto const lock = std::lock_guard(_tableMutex);
    auto it = _entries.find(serverId);
    if (it == _entries.end())
        return nullptr;

    auto entry = std::move(it->second);
    _entries.erase(it);
    return entry;
}

void ConnectionManager::teardown(Entry& entry)
{
    {
        auto const io = std::lock_guard(entry.ioMutex);
        if (entry.client)
        {
            entry.client->close();
            entry.client.reset();
        }
    }

    auto const lock = std::lock_guard(entry.stateMutex);
    entry.status = ConnectionStatus::Disconnected;
    entry.capabilities.clear();
}

} // namespace toolrelay

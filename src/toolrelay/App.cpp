// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/ToolDispatcher.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <stream/BackendEventTranslator.hpp>
#include <stream/EventChannel.hpp>
#include <stream/ResponseAssembler.hpp>
#include <tools/SelectionRegistry.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <ostream>
#include <thread>

namespace toolrelay
{

namespace
{
    constexpr auto BlockKindsInDisplayOrder = std::array {
        BlockKind::Reasoning,
        BlockKind::ToolInvocation,
        BlockKind::ToolResult,
        BlockKind::Text,
    };

    auto managerConfig(const TimeoutConfig& timeouts) -> ConnectionManagerConfig
    {
        return ConnectionManagerConfig {
            .handshakeTimeout = std::chrono::milliseconds(timeouts.handshakeMs),
            .invokeTimeout = std::chrono::milliseconds(timeouts.invokeMs),
        };
    }

    auto selectionBadge(SelectionStatus status) -> std::string_view
    {
        switch (status)
        {
            case SelectionStatus::None: return "[ ]";
            case SelectionStatus::Partial: return "[~]";
            case SelectionStatus::Full: return "[x]";
        }
        return "[?]";
    }

    auto firstLine(std::string_view text) -> std::string_view
    {
        return text.substr(0, text.find('\n'));
    }

    auto isBlank(std::string_view line) -> bool
    {
        return line.find_first_not_of(" \t\r") == std::string_view::npos;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::string configPath;
    std::ostream& out;
    ConnectionManager connections;

    Impl(AppConfig cfg, std::string path, std::ostream& output, TransportFactory factory):
        config(std::move(cfg)),
        configPath(std::move(path)),
        out(output),
        connections(managerConfig(config.timeouts), std::move(factory))
    {
    }

    /// @brief Writes the configuration back to its file. Logs and returns false on failure.
    auto persist() -> bool
    {
        if (auto saved = saveConfigToFile(configPath, config); !saved)
        {
            log::error("Failed to save config: {}", saved.error().message);
            return false;
        }
        return true;
    }

    void printServer(const ServerConfig& server)
    {
        auto commandLine = server.command;
        for (const auto& arg: server.args)
            commandLine += " " + arg;
        out << std::format("{:<16} {:<24} {:<8} {}\n",
                           server.id,
                           server.name,
                           server.enabled ? "enabled" : "disabled",
                           commandLine);
    }

    /// @brief Brings live connections in line with the configuration. Returns the number of failures.
    auto connectConfigured() -> size_t
    {
        auto const failures = connections.applyConfigs(config.mcpServers);
        for (const auto& [serverId, error]: failures)
            log::error("Server '{}': {}", serverId, error);
        return failures.size();
    }

    void printAssembled(const ResponseAssembler& assembler, const ToolDispatcher& dispatcher)
    {
        for (auto const kind: BlockKindsInDisplayOrder)
        {
            for (const auto& block: assembler.blocks(kind))
            {
                out << std::format("[{} #{}]{}\n", blockKindToString(kind), block.index, block.isClosed() ? "" : " (open)");
                if (!block.text.empty())
                    out << block.text << '\n';
                if (block.payload.is_object() && !block.payload.empty())
                    out << block.payload.dump() << '\n';
            }
        }

        if (!assembler.runningText().empty())
            out << "\n" << assembler.runningText() << '\n';

        out << std::format("-- {} tool call(s) executed, {} event(s) dropped{}\n",
                           dispatcher.executedCount(),
                           assembler.droppedEventCount(),
                           assembler.wasAborted() ? ", response aborted" : "");
    }
};

App::App(AppConfig config, std::string configPath, std::ostream& out, TransportFactory factory):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath), out, std::move(factory)))
{
}

App::~App() = default;

auto App::listServers() -> int
{
    if (_impl->config.mcpServers.empty())
    {
        _impl->out << "No servers configured.\n";
        return 0;
    }

    for (const auto& server: _impl->config.mcpServers)
        _impl->printServer(server);
    return 0;
}

auto App::addServer(std::string_view name, std::string_view command, std::string_view argsText) -> int
{
    auto added = toolrelay::addServer(_impl->config, name, command, argsText);
    if (!added)
    {
        log::error("{}", added.error().message);
        return 1;
    }
    if (!_impl->persist())
        return 1;

    _impl->out << std::format("Added server '{}' as {}\n", added->name, added->id);
    return 0;
}

auto App::editServer(std::string_view id, std::string_view name, std::string_view command, std::string_view argsText)
    -> int
{
    auto updated = toolrelay::updateServer(_impl->config, id, name, command, argsText);
    if (!updated)
    {
        log::error("{}", updated.error().message);
        return 1;
    }
    if (!_impl->persist())
        return 1;

    _impl->printServer(*updated);
    return 0;
}

auto App::removeServer(std::string_view id) -> int
{
    if (!toolrelay::removeServer(_impl->config, id))
    {
        log::error("Unknown server: {}", id);
        return 1;
    }
    _impl->connections.removeServer(id);
    if (!_impl->persist())
        return 1;

    _impl->out << std::format("Removed server {}\n", id);
    return 0;
}

auto App::toggleServer(std::string_view id) -> int
{
    auto toggled = toolrelay::toggleServer(_impl->config, id);
    if (!toggled)
    {
        log::error("{}", toggled.error().message);
        return 1;
    }
    if (!_impl->persist())
        return 1;

    _impl->printServer(*toggled);
    return 0;
}

auto App::listTools(const ToolSelectionRequest& selection) -> int
{
    auto const failures = _impl->connectConfigured();

    auto registry = SelectionRegistry(_impl->connections);
    for (const auto& serverId: selection.servers)
        registry.selectServer(serverId);
    for (const auto& qualified: selection.capabilities)
    {
        auto const ref = splitQualifiedName(qualified);
        if (!ref)
        {
            log::warning("'{}' is not a qualified tool name (expected <server>{}<tool>)",
                         qualified,
                         QualifiedNameSeparator);
            continue;
        }
        registry.selectCapability(ref->serverId, ref->name);
    }

    auto const snapshots = _impl->connections.snapshots();
    if (snapshots.empty())
        _impl->out << "No servers connected.\n";

    for (const auto& snapshot: snapshots)
    {
        _impl->out << std::format("{} {} ({}) {} {}/{}\n",
                                  selectionBadge(registry.selectionStatus(snapshot.serverId)),
                                  snapshot.name,
                                  snapshot.serverId,
                                  statusToString(snapshot.status),
                                  registry.selectedCount(snapshot.serverId),
                                  snapshot.capabilities.size());
        if (snapshot.lastError)
            _impl->out << std::format("    error: {}\n", *snapshot.lastError);

        for (const auto& capability: snapshot.capabilities)
        {
            _impl->out << std::format("    {} {}  {}\n",
                                      registry.isSelected(capability.serverId, capability.name) ? "*" : " ",
                                      capability.name,
                                      firstLine(capability.description));
        }
    }

    if (selection.printRequestTools)
    {
        auto const resolved = registry.resolve();
        _impl->out << buildRequestTools(resolved, _impl->connections).dump(2) << '\n';
    }

    return failures == 0 ? 0 : 1;
}

auto App::callTool(std::string_view serverId, std::string_view toolName, std::string_view argumentsJson) -> int
{
    auto const server = findServer(_impl->config, serverId);
    if (!server)
    {
        log::error("Unknown server: {}", serverId);
        return 1;
    }
    if (!server->enabled)
    {
        log::error("Server '{}' is disabled", serverId);
        return 1;
    }

    auto arguments = nlohmann::json::object();
    if (!isBlank(argumentsJson))
    {
        auto parsed = json::parse(argumentsJson);
        if (!parsed || !parsed->is_object())
        {
            log::error("Tool arguments must be a JSON object");
            return 1;
        }
        arguments = std::move(*parsed);
    }

    if (auto connected = _impl->connections.connect(*server); !connected)
    {
        log::error("Failed to connect '{}': {}", serverId, connected.error());
        return 1;
    }

    auto result = _impl->connections.invoke(serverId, toolName, arguments);
    if (!result)
    {
        log::error("{}", result.error());
        return 1;
    }

    _impl->out << result->content << '\n';
    return result->isError ? 1 : 0;
}

auto App::replay(std::string_view path) -> int
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
    {
        log::error("Cannot open event file: {}", path);
        return 1;
    }

    // Decode the whole file up front so a malformed line fails before any tool runs.
    auto events = std::vector<StreamEvent> {};
    auto translator = BackendEventTranslator {};
    auto line = std::string {};
    auto lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        if (isBlank(line))
            continue;

        auto record = json::parse(line);
        if (!record)
        {
            log::error("{}:{}: {}", path, lineNumber, record.error().message);
            return 1;
        }

        if (record->is_object() && record->contains("eventType"))
        {
            auto event = parseStreamEvent(*record);
            if (!event)
            {
                log::error("{}:{}: {}", path, lineNumber, event.error().message);
                return 1;
            }
            events.push_back(std::move(*event));
            continue;
        }

        for (auto& event: translator.translate(*record))
            events.push_back(std::move(event));
    }

    auto const invokesTools = std::ranges::any_of(events, [](const StreamEvent& event) {
        return event.type == EventType::Open && event.kind == BlockKind::ToolInvocation;
    });
    if (invokesTools)
        _impl->connectConfigured();

    auto channel = EventChannel {};
    auto assembler = ResponseAssembler {};
    auto dispatcher = ToolDispatcher(_impl->connections);

    auto producer = std::jthread([&channel, &events] {
        for (auto& event: events)
        {
            if (!channel.push(std::move(event)))
                break;
        }
        channel.close();
    });

    consume(channel, assembler, dispatcher.handler());
    producer.join();

    _impl->printAssembled(assembler, dispatcher);
    return assembler.wasAborted() ? 1 : 0;
}

auto App::config() const -> const AppConfig&
{
    return _impl->config;
}

} // namespace toolrelay

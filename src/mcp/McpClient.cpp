// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>
#include <set>

namespace toolrelay
{

namespace
{
    using Clock = std::chrono::steady_clock;

    constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

    /// @brief Longest single blocking receive; cancellation is observed between slices.
    constexpr auto PollSlice = std::chrono::milliseconds(50);

    /// @brief Upper bound on tools/list pages followed for one manifest.
    constexpr auto MaxToolPages = 64;
} // namespace

McpClient::McpClient(std::string serverId, std::unique_ptr<Transport> transport):
    _serverId(std::move(serverId)), _transport(std::move(transport))
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize(const CallOptions& options) -> Result<McpServerInfo>
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "toolrelay" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params), options)
        .and_then([this, &options](const nlohmann::json& result) -> Result<McpServerInfo> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError,
                                 std::format("initialize returned a {} instead of an object", result.type_name()));

            auto const serverInfo = result.contains("serverInfo") ? result["serverInfo"] : nlohmann::json::object();
            _serverInfo.serverName = json::getStringOr(serverInfo, "name", "unknown");
            _serverInfo.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
            _serverInfo.protocolVersion = json::getStringOr(result, "protocolVersion", "");

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                _serverInfo.hasTools = caps.contains("tools");
                _serverInfo.hasResources = caps.contains("resources");
                _serverInfo.hasPrompts = caps.contains("prompts");
            }

            auto const notified =
                _transport->send(jsonrpc::makeNotification("notifications/initialized"), options.timeout, options.stop);
            if (!notified)
                return std::unexpected(notified.error());

            _initialized = true;
            log::info("[{}] provider initialized: {} v{}",
                      _serverId,
                      _serverInfo.serverName,
                      _serverInfo.serverVersion);

            return _serverInfo;
        });
}

auto McpClient::listTools(const CallOptions& options) -> Result<std::vector<Capability>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<Capability> {};
    auto names = std::set<std::string> {};
    auto cursors = std::set<std::string> {};
    auto cursor = std::string {};
    auto const deadline = Clock::now() + options.timeout;

    // The manifest may be paginated; follow nextCursor until exhausted. All pages share one budget.
    for (auto page = 0; page < MaxToolPages; ++page)
    {
        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("tools/list timed out after {} ms ({} pages)", options.timeout.count(), page));

        auto params = cursor.empty() ? nlohmann::json(nullptr) : nlohmann::json { { "cursor", cursor } };
        auto result =
            sendRequest("tools/list", std::move(params), CallOptions { .timeout = remaining, .stop = options.stop });
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("tools") && (*result)["tools"].is_array())
        {
            for (const auto& toolJson: (*result)["tools"])
            {
                auto name = json::getStringOr(toolJson, "name", "");
                if (name.empty())
                {
                    log::warning("[{}] skipping tool without a name", _serverId);
                    continue;
                }
                if (!names.insert(name).second)
                {
                    log::warning("[{}] skipping duplicate tool '{}'", _serverId, name);
                    continue;
                }
                tools.push_back(Capability {
                    .serverId = _serverId,
                    .name = std::move(name),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .inputSchema = toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object()
                                       ? toolJson["inputSchema"]
                                       : nlohmann::json::object(),
                });
            }
        }

        cursor = json::getStringOr(*result, "nextCursor", "");
        if (cursor.empty())
            return tools;

        if (!cursors.insert(cursor).second)
        {
            log::warning("[{}] tools/list repeated cursor '{}', stopping", _serverId, cursor);
            return tools;
        }
    }

    log::warning("[{}] tools/list still paginating after {} pages, stopping", _serverId, MaxToolPages);
    return tools;
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments, const CallOptions& options)
    -> Result<ToolResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return sendRequest("tools/call", std::move(params), options)
        .and_then([this, name](const nlohmann::json& result) -> Result<ToolResult> {
            auto toolResult = ToolResult {};
            toolResult.isError = json::getBoolOr(result, "isError", false);

            if (result.contains("content") && result["content"].is_array())
            {
                for (const auto& item: result["content"])
                {
                    if (json::getStringOr(item, "type", "") != "text")
                        continue;
                    if (!toolResult.content.empty())
                        toolResult.content += "\n";
                    toolResult.content += json::getStringOr(item, "text", "");
                }
            }

            log::debug("[{}] tool '{}' returned {} bytes (isError: {})",
                       _serverId,
                       name,
                       toolResult.content.size(),
                       toolResult.isError);
            return toolResult;
        });
}

void McpClient::close()
{
    _transport->close();
    _initialized = false;
}

auto McpClient::serverInfo() const -> const McpServerInfo&
{
    return _serverInfo;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::isConnected() const -> bool
{
    return _transport->isConnected();
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, const CallOptions& options)
    -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto const deadline = Clock::now() + options.timeout;

    auto const sent =
        _transport->send(jsonrpc::makeRequest(id, method, std::move(params)), options.timeout, options.stop);
    if (!sent)
        return std::unexpected(sent.error());

    while (true)
    {
        if (options.stop.stop_requested())
            return makeError(ErrorCode::Cancelled, std::format("Request '{}' abandoned", method));

        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError,
                             std::format("Request '{}' timed out after {} ms", method, options.timeout.count()));

        auto message = _transport->receive(std::min(remaining, PollSlice));
        if (!message)
        {
            if (message.error().code == ErrorCode::TimeoutError)
                continue;
            if (message.error().code == ErrorCode::ProtocolError)
            {
                log::warning("[{}] ignoring unparsable output: {}", _serverId, message.error().message);
                continue;
            }
            return std::unexpected(message.error());
        }

        auto response = jsonrpc::parseResponse(*message);
        if (!response)
        {
            log::warning("[{}] ignoring malformed message: {}", _serverId, response.error().message);
            continue;
        }

        if (response->isServerMessage())
        {
            if (!response->id.is_null())
                answerServerRequest(
                    response->id, *response->method, CallOptions { .timeout = remaining, .stop = options.stop });
            else
                log::trace("[{}] notification: {}", _serverId, *response->method);
            continue;
        }

        if (jsonrpc::idOf(response->id) != id)
        {
            log::debug("[{}] discarding reply with stale id {}", _serverId, response->id.dump());
            continue;
        }

        if (response->error)
        {
            return makeError(ErrorCode::ProtocolError,
                             std::format("RPC error {}: {}", response->error->code, response->error->message));
        }
        return response->result.value_or(nlohmann::json::object());
    }
}

void McpClient::answerServerRequest(const nlohmann::json& id, const std::string& method, const CallOptions& options)
{
    auto reply = nlohmann::json { { "jsonrpc", "2.0" }, { "id", id } };
    if (method == "ping")
        reply["result"] = nlohmann::json::object();
    else
        reply["error"] = { { "code", -32601 }, { "message", std::format("Method not found: {}", method) } };

    if (auto const sent = _transport->send(reply, options.timeout, options.stop); !sent)
        log::warning("[{}] failed to answer '{}': {}", _serverId, method, sent.error().message);
}

} // namespace toolrelay

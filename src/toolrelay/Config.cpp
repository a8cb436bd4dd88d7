// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <mcp/ArgumentSanitizer.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

namespace toolrelay
{

namespace
{

    auto trimmed(std::string_view text) -> std::string
    {
        auto const isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        while (!text.empty() && isSpace(text.front()))
            text.remove_prefix(1);
        while (!text.empty() && isSpace(text.back()))
            text.remove_suffix(1);
        return std::string(text);
    }

    /// Lowercase alphanumerics, everything else collapsed into single dashes.
    /// Underscores are folded too, so ids never contain the qualified-name separator.
    auto slugify(std::string_view name) -> std::string
    {
        auto slug = std::string {};
        for (auto const c: name)
        {
            if (std::isalnum(static_cast<unsigned char>(c)))
                slug += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            else if (!slug.empty() && slug.back() != '-')
                slug += '-';
        }
        while (!slug.empty() && slug.back() == '-')
            slug.pop_back();
        return slug.empty() ? std::string("server") : slug;
    }

    auto uniqueId(std::string_view name, const std::set<std::string, std::less<>>& taken) -> std::string
    {
        auto const base = slugify(name);
        if (!taken.contains(base))
            return base;
        for (auto n = 2;; ++n)
        {
            auto candidate = std::format("{}-{}", base, n);
            if (!taken.contains(candidate))
                return candidate;
        }
    }

    auto takenIds(const AppConfig& config) -> std::set<std::string, std::less<>>
    {
        auto ids = std::set<std::string, std::less<>> {};
        for (const auto& server: config.mcpServers)
            ids.insert(server.id);
        return ids;
    }

    auto findRecord(AppConfig& config, std::string_view id) -> ServerConfig*
    {
        auto const it = std::ranges::find(config.mcpServers, id, &ServerConfig::id);
        return it != config.mcpServers.end() ? &*it : nullptr;
    }

    auto validateRecordFields(std::string_view name, std::string_view command) -> VoidResult
    {
        if (name.empty())
            return makeError(ErrorCode::InvalidArgument, "Server name must not be empty");
        if (command.empty())
            return makeError(ErrorCode::InvalidArgument, "Server command must not be empty");
        return {};
    }

    auto serverToJson(const ServerConfig& server) -> nlohmann::json
    {
        auto record = nlohmann::json::object();
        record["id"] = server.id;
        record["name"] = server.name;
        record["command"] = server.command;
        record["args"] = server.args;
        if (!server.env.empty())
        {
            auto env = nlohmann::json::object();
            for (const auto& [key, value]: server.env)
                env[key] = value;
            record["env"] = std::move(env);
        }
        record["enabled"] = server.enabled;
        return record;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\toolrelay";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/toolrelay";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/toolrelay";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/toolrelay";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top-level value must be an object", path));

    auto config = AppConfig {};

    // MCP servers section
    if (root.contains("mcpServers") && root["mcpServers"].is_array())
    {
        auto ids = std::set<std::string, std::less<>> {};
        for (const auto& serverJson: root["mcpServers"])
        {
            auto server = ServerConfig {
                .id = json::getStringOr(serverJson, "id", ""),
                .name = json::getStringOr(serverJson, "name", ""),
                .command = json::getStringOr(serverJson, "command", ""),
                .args = json::getStringArray(serverJson, "args"),
                .env = json::getStringMap(serverJson, "env"),
                .enabled = json::getBoolOr(serverJson, "enabled", true),
            };

            if (server.command.empty())
            {
                log::warning("Skipping server record '{}' without command",
                             server.name.empty() ? server.id : server.name);
                continue;
            }

            if (server.name.empty())
                server.name = server.id.empty() ? server.command : server.id;

            if (server.id.empty() || server.id.contains("__") || ids.contains(server.id))
            {
                auto const replacement = uniqueId(server.name, ids);
                if (!server.id.empty())
                    log::warning("Server id '{}' is unusable, using '{}'", server.id, replacement);
                server.id = replacement;
            }

            ids.insert(server.id);
            config.mcpServers.push_back(std::move(server));
        }
    }

    // Timeouts section
    if (root.contains("timeouts"))
    {
        auto const& timeouts = root["timeouts"];
        config.timeouts.handshakeMs = json::getIntOr(timeouts, "handshakeMs", config.timeouts.handshakeMs);
        config.timeouts.invokeMs = json::getIntOr(timeouts, "invokeMs", config.timeouts.invokeMs);
        if (config.timeouts.handshakeMs <= 0)
            config.timeouts.handshakeMs = TimeoutConfig {}.handshakeMs;
        if (config.timeouts.invokeMs <= 0)
            config.timeouts.invokeMs = TimeoutConfig {}.invokeMs;
    }

    auto const levelName = json::getStringOr(root, "logLevel", "info");
    if (auto const level = log::levelFromString(levelName))
        config.logLevel = *level;
    else
        log::warning("Unknown log level '{}', using info", levelName);

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto servers = nlohmann::json::array();
    for (const auto& server: config.mcpServers)
        servers.push_back(serverToJson(server));
    root["mcpServers"] = std::move(servers);

    root["timeouts"] = nlohmann::json {
        { "handshakeMs", config.timeouts.handshakeMs },
        { "invokeMs", config.timeouts.invokeMs },
    };
    root["logLevel"] = std::string(log::levelToString(config.logLevel));

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed writing config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto addServer(AppConfig& config, std::string_view name, std::string_view command, std::string_view argsText)
    -> Result<ServerConfig>
{
    auto const cleanName = trimmed(name);
    auto const cleanCommand = trimmed(command);
    if (auto valid = validateRecordFields(cleanName, cleanCommand); !valid)
        return std::unexpected(valid.error());

    auto server = ServerConfig {
        .id = uniqueId(cleanName, takenIds(config)),
        .name = cleanName,
        .command = cleanCommand,
        .args = splitArgumentList(argsText),
        .env = {},
        .enabled = true,
    };
    config.mcpServers.push_back(server);
    log::debug("Added server '{}' as '{}'", server.name, server.id);
    return server;
}

auto updateServer(AppConfig& config,
                  std::string_view id,
                  std::string_view name,
                  std::string_view command,
                  std::string_view argsText) -> Result<ServerConfig>
{
    auto* const record = findRecord(config, id);
    if (!record)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", id));

    auto const cleanName = trimmed(name);
    auto const cleanCommand = trimmed(command);
    if (auto valid = validateRecordFields(cleanName, cleanCommand); !valid)
        return std::unexpected(valid.error());

    // Whole-record replacement; consumers compare records, not fields.
    auto replacement = *record;
    replacement.name = cleanName;
    replacement.command = cleanCommand;
    replacement.args = splitArgumentList(argsText);
    *record = replacement;
    return replacement;
}

auto removeServer(AppConfig& config, std::string_view id) -> bool
{
    auto const removed = std::erase_if(config.mcpServers, [id](const ServerConfig& s) { return s.id == id; });
    return removed > 0;
}

auto toggleServer(AppConfig& config, std::string_view id) -> Result<ServerConfig>
{
    auto* const record = findRecord(config, id);
    if (!record)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", id));

    record->enabled = !record->enabled;
    return *record;
}

auto findServer(const AppConfig& config, std::string_view id) -> std::optional<ServerConfig>
{
    auto const it = std::ranges::find(config.mcpServers, id, &ServerConfig::id);
    if (it == config.mcpServers.end())
        return std::nullopt;
    return *it;
}

auto enabledServers(const AppConfig& config) -> std::vector<ServerConfig>
{
    auto servers = std::vector<ServerConfig> {};
    std::ranges::copy_if(config.mcpServers, std::back_inserter(servers), &ServerConfig::enabled);
    return servers;
}

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolrelay
{

/// @brief Timeouts for provider traffic, in milliseconds.
struct TimeoutConfig
{
    int handshakeMs = 10'000;
    int invokeMs = 60'000;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    std::vector<ServerConfig> mcpServers;
    TimeoutConfig timeouts;
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Adds a new, enabled server record.
///
/// The id is derived from the name and made unique within @p config.
/// @param argsText Comma-separated launch arguments.
/// @return The new record, or InvalidArgument if name or command is blank.
[[nodiscard]] auto addServer(AppConfig& config, std::string_view name, std::string_view command, std::string_view argsText)
    -> Result<ServerConfig>;

/// @brief Replaces name, command and arguments of an existing record.
///
/// Id, environment and enabled flag are kept.
/// @return The updated record, or InvalidArgument for an unknown id or blank name/command.
[[nodiscard]] auto updateServer(AppConfig& config,
                                std::string_view id,
                                std::string_view name,
                                std::string_view command,
                                std::string_view argsText) -> Result<ServerConfig>;

/// @brief Removes a record. Returns false if the id is unknown.
auto removeServer(AppConfig& config, std::string_view id) -> bool;

/// @brief Flips the enabled flag of a record.
/// @return The updated record, or InvalidArgument for an unknown id.
[[nodiscard]] auto toggleServer(AppConfig& config, std::string_view id) -> Result<ServerConfig>;

/// @brief Looks up a record by id.
[[nodiscard]] auto findServer(const AppConfig& config, std::string_view id) -> std::optional<ServerConfig>;

/// @brief Returns the enabled records, in configuration order.
[[nodiscard]] auto enabledServers(const AppConfig& config) -> std::vector<ServerConfig>;

} // namespace toolrelay

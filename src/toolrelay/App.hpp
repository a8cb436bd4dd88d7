// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/ConnectionManager.hpp>
#include <toolrelay/Config.hpp>

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace toolrelay
{

/// @brief Which capabilities the `tools` command enables before printing.
struct ToolSelectionRequest
{
    /// @brief Server ids whose currently discovered capabilities are all enabled.
    std::vector<std::string> servers;
    /// @brief Individual capabilities, by qualified name.
    std::vector<std::string> capabilities;
    /// @brief Also print the request tool list built from the selection.
    bool printRequestTools = false;
};

/// @brief Command-line front end: wires the settings store, connections, selection and streaming.
///
/// Every command returns a process exit code; results go to the output stream, diagnostics to the
/// log.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The loaded configuration.
    /// @param configPath Where settings-store commands persist the configuration.
    /// @param out Destination of command output.
    /// @param factory Channel factory for provider connections; defaults to stdio processes.
    App(AppConfig config, std::string configPath, std::ostream& out, TransportFactory factory = {});
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    [[nodiscard]] auto listServers() -> int;
    [[nodiscard]] auto addServer(std::string_view name, std::string_view command, std::string_view argsText) -> int;
    [[nodiscard]] auto editServer(std::string_view id,
                                  std::string_view name,
                                  std::string_view command,
                                  std::string_view argsText) -> int;
    [[nodiscard]] auto removeServer(std::string_view id) -> int;
    [[nodiscard]] auto toggleServer(std::string_view id) -> int;

    /// @brief Connects the enabled servers and prints their capabilities with selection badges.
    [[nodiscard]] auto listTools(const ToolSelectionRequest& selection) -> int;

    /// @brief Connects one server and invokes one of its capabilities.
    /// @param argumentsJson JSON object text with the call arguments; empty means {}.
    [[nodiscard]] auto callTool(std::string_view serverId, std::string_view toolName, std::string_view argumentsJson)
        -> int;

    /// @brief Streams a JSONL event file through the assembler, executing tool invocations.
    ///
    /// Lines holding an "eventType" member are stream event records; any other line is taken as a
    /// backend event. Blank lines are skipped.
    [[nodiscard]] auto replay(std::string_view path) -> int;

    /// @brief Returns the configuration including unsaved changes.
    [[nodiscard]] auto config() const -> const AppConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolrelay/App.hpp>
#include <toolrelay/Config.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolrelay - tool-server orchestration over MCP" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    auto handshakeTimeoutMs = 0;
    auto invokeTimeoutMs = 0;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--handshake-timeout", handshakeTimeoutMs, "Handshake timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--invoke-timeout", invokeTimeoutMs, "Tool invocation timeout in milliseconds")
        ->check(CLI::PositiveNumber);

    auto* const serversCmd = app.add_subcommand("servers", "List configured tool servers");

    auto name = std::string {};
    auto command = std::string {};
    auto argsText = std::string {};
    auto* const addCmd = app.add_subcommand("add", "Add a tool server");
    addCmd->add_option("name", name, "Display name")->required();
    addCmd->add_option("command", command, "Executable to launch")->required();
    addCmd->add_option("--args", argsText, "Comma-separated launch arguments");

    auto serverId = std::string {};
    auto* const editCmd = app.add_subcommand("edit", "Replace name, command and arguments of a tool server");
    editCmd->add_option("id", serverId, "Server id")->required();
    editCmd->add_option("name", name, "Display name")->required();
    editCmd->add_option("command", command, "Executable to launch")->required();
    editCmd->add_option("--args", argsText, "Comma-separated launch arguments");

    auto* const removeCmd = app.add_subcommand("remove", "Remove a tool server");
    removeCmd->add_option("id", serverId, "Server id")->required();

    auto* const toggleCmd = app.add_subcommand("toggle", "Enable or disable a tool server");
    toggleCmd->add_option("id", serverId, "Server id")->required();

    auto selection = toolrelay::ToolSelectionRequest {};
    auto* const toolsCmd = app.add_subcommand("tools", "Connect enabled servers and list their tools");
    toolsCmd->add_option("--select", selection.servers, "Enable all tools of a server");
    toolsCmd->add_option("--tool", selection.capabilities, "Enable one tool by qualified name (<server>__<tool>)");
    toolsCmd->add_flag("--request", selection.printRequestTools, "Print the request tool list of the selection");

    auto toolName = std::string {};
    auto argumentsJson = std::string {};
    auto* const callCmd = app.add_subcommand("call", "Invoke a tool on one server");
    callCmd->add_option("server", serverId, "Server id")->required();
    callCmd->add_option("tool", toolName, "Tool name")->required();
    callCmd->add_option("--args", argumentsJson, "Arguments as a JSON object");

    auto eventsPath = std::string {};
    auto* const replayCmd = app.add_subcommand("replay", "Assemble a recorded response stream and run its tool calls");
    replayCmd->add_option("file", eventsPath, "JSONL event file")->required()->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        toolrelay::log::setLevel(toolrelay::log::Level::Debug);

    // Load config; an explicit path that does not exist yet starts from defaults so `add` can create it.
    auto configResult = [&]() -> toolrelay::Result<toolrelay::AppConfig> {
        if (configPath.empty())
            return toolrelay::loadConfig();
        if (!std::filesystem::exists(configPath))
        {
            toolrelay::log::info("No config file found at {}, using defaults", configPath);
            return toolrelay::AppConfig {};
        }
        return toolrelay::loadConfigFromFile(configPath);
    }();

    if (!configResult)
    {
        toolrelay::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    if (!verbose)
        toolrelay::log::setLevel(config.logLevel);

    // Apply CLI overrides; only commands that talk to servers use them, so they never get persisted.
    auto const connects = *toolsCmd || *callCmd || *replayCmd;
    if (connects && handshakeTimeoutMs > 0)
        config.timeouts.handshakeMs = handshakeTimeoutMs;
    if (connects && invokeTimeoutMs > 0)
        config.timeouts.invokeMs = invokeTimeoutMs;

    auto application = toolrelay::App(
        std::move(config), configPath.empty() ? toolrelay::defaultConfigPath() : configPath, std::cout);

    if (*serversCmd)
        return application.listServers();
    if (*addCmd)
        return application.addServer(name, command, argsText);
    if (*editCmd)
        return application.editServer(serverId, name, command, argsText);
    if (*removeCmd)
        return application.removeServer(serverId);
    if (*toggleCmd)
        return application.toggleServer(serverId);
    if (*toolsCmd)
        return application.listTools(selection);
    if (*callCmd)
        return application.callTool(serverId, toolName, argumentsJson);
    if (*replayCmd)
        return application.replay(eventsPath);

    return 0;
}

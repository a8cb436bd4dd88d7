// SPDX-License-Identifier: Apache-2.0
#include <toolrelay/App.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

#include "MockTransport.hpp"

using namespace toolrelay;

namespace
{
/// @brief Private scratch directory for config and event files.
class Workspace
{
  public:
    explicit Workspace(std::string_view name):
        _dir(std::filesystem::temp_directory_path() / std::format("toolrelay_app_{}", name))
    {
        std::filesystem::remove_all(_dir);
        std::filesystem::create_directories(_dir);
    }

    ~Workspace() { std::filesystem::remove_all(_dir); }

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    [[nodiscard]] auto configPath() const -> std::string { return (_dir / "config.json").string(); }

    auto writeFile(std::string_view name, std::string_view content) const -> std::string
    {
        auto const path = (_dir / name).string();
        auto file = std::ofstream(path);
        file << content;
        return path;
    }

  private:
    std::filesystem::path _dir;
};

/// @brief Every server is a mock provider exposing the tools named by its args.
auto mockFactory() -> TransportFactory
{
    return [](const ServerConfig& config) -> Result<std::unique_ptr<Transport>> {
        if (config.command == "missing")
            return makeError(ErrorCode::LaunchFailure, "No such file or directory");
        return std::unique_ptr<Transport>(std::make_unique<test::MockTransport>(test::fakeProvider(config.args)));
    };
}

auto fastTimeouts() -> AppConfig
{
    auto config = AppConfig {};
    config.timeouts = TimeoutConfig { .handshakeMs = 2000, .invokeMs = 2000 };
    return config;
}

auto configWith(std::vector<ServerConfig> servers) -> AppConfig
{
    auto config = fastTimeouts();
    config.mcpServers = std::move(servers);
    return config;
}

auto server(std::string id, std::vector<std::string> tools, std::string command = "provider") -> ServerConfig
{
    return ServerConfig {
        .id = id,
        .name = id,
        .command = std::move(command),
        .args = std::move(tools),
        .env = {},
        .enabled = true,
    };
}
} // namespace

TEST_CASE("App lists an empty configuration", "[app]")
{
    auto const workspace = Workspace("empty");
    auto out = std::ostringstream {};
    auto app = App(fastTimeouts(), workspace.configPath(), out, mockFactory());

    CHECK(app.listServers() == 0);
    CHECK(out.str() == "No servers configured.\n");
}

TEST_CASE("App settings commands persist the configuration", "[app]")
{
    auto const workspace = Workspace("settings");
    auto out = std::ostringstream {};
    auto app = App(fastTimeouts(), workspace.configPath(), out, mockFactory());

    REQUIRE(app.addServer("My Files", "files-server", "--root, /srv") == 0);
    CHECK(out.str() == "Added server 'My Files' as my-files\n");

    auto saved = loadConfigFromFile(workspace.configPath());
    REQUIRE(saved.has_value());
    REQUIRE(saved->mcpServers.size() == 1);
    CHECK(saved->mcpServers[0].args == std::vector<std::string> { "--root", "/srv" });

    out.str({});
    REQUIRE(app.toggleServer("my-files") == 0);
    CHECK(out.str().contains("disabled"));
    saved = loadConfigFromFile(workspace.configPath());
    REQUIRE(saved.has_value());
    CHECK(!saved->mcpServers[0].enabled);

    out.str({});
    REQUIRE(app.editServer("my-files", "Files", "other-server", "") == 0);
    CHECK(out.str().contains("other-server"));
    CHECK(app.config().mcpServers[0].name == "Files");

    out.str({});
    CHECK(app.listServers() == 0);
    CHECK(out.str().starts_with("my-files"));

    out.str({});
    REQUIRE(app.removeServer("my-files") == 0);
    CHECK(out.str() == "Removed server my-files\n");
    saved = loadConfigFromFile(workspace.configPath());
    REQUIRE(saved.has_value());
    CHECK(saved->mcpServers.empty());
}

TEST_CASE("App settings commands reject invalid input", "[app]")
{
    auto const workspace = Workspace("invalid");
    auto out = std::ostringstream {};
    auto app = App(fastTimeouts(), workspace.configPath(), out, mockFactory());

    CHECK(app.addServer("", "cmd", "") == 1);
    CHECK(app.editServer("nowhere", "n", "c", "") == 1);
    CHECK(app.removeServer("nowhere") == 1);
    CHECK(app.toggleServer("nowhere") == 1);
    CHECK(out.str().empty());
    CHECK(!std::filesystem::exists(workspace.configPath()));
}

TEST_CASE("App listTools shows capabilities with selection badges", "[app]")
{
    auto const workspace = Workspace("tools");
    auto out = std::ostringstream {};
    auto app = App(configWith({ server("files", { "read", "write" }), server("web", { "fetch" }) }),
                   workspace.configPath(),
                   out,
                   mockFactory());

    auto const selection = ToolSelectionRequest {
        .servers = { "files" },
        .capabilities = {},
        .printRequestTools = true,
    };
    REQUIRE(app.listTools(selection) == 0);

    auto const text = out.str();
    CHECK(text.contains("[x] files (files) connected 2/2\n"));
    CHECK(text.contains("    * read  read tool\n"));
    CHECK(text.contains("[ ] web (web) connected 0/1\n"));
    CHECK(text.contains("      fetch  fetch tool\n"));
    CHECK(text.contains("\"name\": \"files__read\""));
    CHECK(!text.contains("web__fetch\""));
}

TEST_CASE("App listTools selects individual capabilities", "[app]")
{
    auto const workspace = Workspace("tools_single");
    auto out = std::ostringstream {};
    auto app =
        App(configWith({ server("files", { "read", "write" }) }), workspace.configPath(), out, mockFactory());

    auto const selection = ToolSelectionRequest {
        .servers = {},
        .capabilities = { "files__write", "not-qualified" },
        .printRequestTools = false,
    };
    REQUIRE(app.listTools(selection) == 0);
    CHECK(out.str().contains("[~] files (files) connected 1/2\n"));
    CHECK(out.str().contains("    * write  write tool\n"));
}

TEST_CASE("App listTools reports failed connections", "[app]")
{
    auto const workspace = Workspace("tools_failed");
    auto out = std::ostringstream {};
    auto app = App(configWith({ server("files", { "read" }), server("broken", {}, "missing") }),
                   workspace.configPath(),
                   out,
                   mockFactory());

    CHECK(app.listTools(ToolSelectionRequest {}) == 1);
    CHECK(out.str().contains("broken (broken) errored 0/0\n"));
    CHECK(out.str().contains("    error: [LaunchFailure]"));
    CHECK(out.str().contains("files (files) connected 0/1\n"));
}

TEST_CASE("App callTool invokes a capability", "[app]")
{
    auto const workspace = Workspace("call");
    auto out = std::ostringstream {};
    auto disabled = server("off", { "read" });
    disabled.enabled = false;
    auto app = App(configWith({ server("files", { "read", "tool_error" }), disabled }),
                   workspace.configPath(),
                   out,
                   mockFactory());

    SECTION("success")
    {
        CHECK(app.callTool("files", "read", R"({"path":"/tmp"})") == 0);
        CHECK(out.str() == "read:{\"path\":\"/tmp\"}\n");
    }

    SECTION("blank arguments mean an empty object")
    {
        CHECK(app.callTool("files", "read", "  ") == 0);
        CHECK(out.str() == "read:{}\n");
    }

    SECTION("tool error")
    {
        CHECK(app.callTool("files", "tool_error", "") == 1);
        CHECK(out.str() == "bad input\n");
    }

    SECTION("rejected calls")
    {
        CHECK(app.callTool("nowhere", "read", "") == 1);
        CHECK(app.callTool("off", "read", "") == 1);
        CHECK(app.callTool("files", "read", "[1, 2]") == 1);
        CHECK(app.callTool("files", "read", "{broken") == 1);
        CHECK(app.callTool("files", "delete", "") == 1);
        CHECK(out.str().empty());
    }
}

TEST_CASE("App replay assembles stream event records", "[app]")
{
    auto const workspace = Workspace("replay_records");
    auto out = std::ostringstream {};
    auto app = App(fastTimeouts(), workspace.configPath(), out, mockFactory());

    auto const path = workspace.writeFile("events.jsonl",
                                          R"({"eventType":"open","kind":"text","index":0}
{"eventType":"append","kind":"text","index":0,"payload":"Hello"}

{"eventType":"append","kind":"text","index":3,"payload":"lost"}
{"eventType":"append","kind":"text","index":0,"payload":" world"}
{"eventType":"close","kind":"text","index":0}
{"eventType":"finalize"}
)");

    REQUIRE(app.replay(path) == 0);
    auto const text = out.str();
    CHECK(text.contains("[text #0]\nHello world\n"));
    CHECK(text.contains("\nHello world\n-- 0 tool call(s) executed, 1 event(s) dropped\n"));
}

TEST_CASE("App replay executes tool invocations from backend events", "[app]")
{
    auto const workspace = Workspace("replay_backend");
    auto out = std::ostringstream {};
    auto app = App(configWith({ server("files", { "read" }) }), workspace.configPath(), out, mockFactory());

    auto const path = workspace.writeFile(
        "backend.jsonl",
        R"({"type":"message_start","message":{"id":"msg_1"}}
{"type":"content_block_start","index":0,"content_block":{"type":"text","text":""}}
{"type":"content_block_delta","index":0,"delta":{"type":"text_delta","text":"Reading."}}
{"type":"content_block_stop","index":0}
{"type":"content_block_start","index":1,"content_block":{"type":"tool_use","id":"toolu_1","name":"files__read","input":{}}}
{"type":"content_block_delta","index":1,"delta":{"type":"input_json_delta","partial_json":"{\"path\":\"/tmp\"}"}}
{"type":"content_block_stop","index":1}
{"type":"message_stop"}
)");

    REQUIRE(app.replay(path) == 0);
    auto const text = out.str();
    CHECK(text.contains("[tool_invocation #1]\n"));
    CHECK(text.contains("[tool_result #1]\n"));
    CHECK(text.contains(R"("content":"read:{\"path\":\"/tmp\"}")"));
    CHECK(text.contains("-- 1 tool call(s) executed, 0 event(s) dropped\n"));
}

TEST_CASE("App replay reports aborted and malformed streams", "[app]")
{
    auto const workspace = Workspace("replay_errors");
    auto out = std::ostringstream {};
    auto app = App(fastTimeouts(), workspace.configPath(), out, mockFactory());

    SECTION("stream ends without finalize")
    {
        auto const path = workspace.writeFile("cut.jsonl",
                                              R"({"eventType":"open","kind":"text","index":0}
{"eventType":"append","kind":"text","index":0,"payload":"partial"}
)");
        CHECK(app.replay(path) == 1);
        CHECK(out.str().contains("response aborted"));
        CHECK(out.str().contains("partial"));
    }

    SECTION("malformed line")
    {
        auto const path = workspace.writeFile("bad.jsonl", "{\"eventType\":\"open\"}\n");
        CHECK(app.replay(path) == 1);
        CHECK(out.str().empty());
    }

    SECTION("missing file")
    {
        CHECK(app.replay("/nonexistent/events.jsonl") == 1);
    }
}

// SPDX-License-Identifier: Apache-2.0
#include <agent/ToolDispatcher.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "MockTransport.hpp"

using namespace toolrelay;
using namespace std::chrono_literals;

namespace
{
auto mockFactory() -> TransportFactory
{
    return [](const ServerConfig& config) -> Result<std::unique_ptr<Transport>> {
        return std::unique_ptr<Transport>(std::make_unique<test::MockTransport>(test::fakeProvider(config.args)));
    };
}

auto connectedManager() -> std::unique_ptr<ConnectionManager>
{
    auto manager = std::make_unique<ConnectionManager>(
        ConnectionManagerConfig { .handshakeTimeout = 2s, .invokeTimeout = 2s }, mockFactory());
    auto const connected = manager->connect(ServerConfig {
        .id = "files",
        .name = "Files",
        .command = "files-server",
        .args = { "read", "rpc_error", "tool_error" },
        .env = {},
        .enabled = true,
    });
    REQUIRE(connected.has_value());
    return manager;
}

auto invocationBlock(int64_t index, nlohmann::json payload, std::string text = "") -> StreamingBlock
{
    return StreamingBlock {
        .index = index,
        .kind = BlockKind::ToolInvocation,
        .state = BlockState::Closed,
        .text = std::move(text),
        .payload = std::move(payload),
    };
}
} // namespace

TEST_CASE("toolCallFromBlock reads the input from the payload", "[dispatcher]")
{
    auto const block =
        invocationBlock(2, { { "id", "call_a" }, { "name", "files__read" }, { "input", { { "path", "/tmp" } } } });

    auto call = toolCallFromBlock(block);
    REQUIRE(call.has_value());
    CHECK(call->id == "call_a");
    CHECK(call->name == "files__read");
    CHECK(call->arguments["path"] == "/tmp");
}

TEST_CASE("toolCallFromBlock decodes streamed input text", "[dispatcher]")
{
    auto const block = invocationBlock(3, { { "name", "files__read" } }, R"({"path":"/etc"})");

    auto call = toolCallFromBlock(block);
    REQUIRE(call.has_value());
    CHECK(call->id == "call_3");
    CHECK(call->arguments == nlohmann::json { { "path", "/etc" } });
}

TEST_CASE("toolCallFromBlock defaults to empty arguments", "[dispatcher]")
{
    auto call = toolCallFromBlock(invocationBlock(0, { { "name", "files__read" } }));
    REQUIRE(call.has_value());
    CHECK(call->arguments == nlohmann::json::object());

    // Whole payload decoded from text: no separate input.
    auto const decoded = nlohmann::json { { "name", "files__read" } };
    auto fromText = toolCallFromBlock(invocationBlock(0, decoded, decoded.dump()));
    REQUIRE(fromText.has_value());
    CHECK(fromText->arguments == nlohmann::json::object());
}

TEST_CASE("toolCallFromBlock rejects unusable blocks", "[dispatcher]")
{
    SECTION("missing name")
    {
        auto call = toolCallFromBlock(invocationBlock(0, { { "id", "x" } }));
        REQUIRE(!call.has_value());
        CHECK(call.error().code == ErrorCode::ProtocolError);
    }

    SECTION("malformed input text")
    {
        auto call = toolCallFromBlock(invocationBlock(0, { { "name", "files__read" } }, "{\"path\":"));
        REQUIRE(!call.has_value());
        CHECK(call.error().code == ErrorCode::ProtocolError);
    }

    SECTION("open block")
    {
        auto block = invocationBlock(0, { { "name", "files__read" } });
        block.state = BlockState::Open;
        CHECK(!toolCallFromBlock(block).has_value());
    }

    SECTION("wrong kind")
    {
        auto block = invocationBlock(0, { { "name", "files__read" } });
        block.kind = BlockKind::Text;
        CHECK(!toolCallFromBlock(block).has_value());
    }
}

TEST_CASE("toolResultEvents builds a complete result block", "[dispatcher]")
{
    auto const events = toolResultEvents(4, ToolResult { .callId = "call_a", .content = "done", .isError = false });

    REQUIRE(events.size() == 3);
    CHECK(events[0].type == EventType::Open);
    CHECK(events[1].type == EventType::Append);
    CHECK(events[2].type == EventType::Close);
    for (const auto& event: events)
    {
        CHECK(event.kind == BlockKind::ToolResult);
        CHECK(event.index == 4);
    }
    CHECK(events[1].payload["tool_use_id"] == "call_a");
    CHECK(events[1].payload["content"] == "done");
    CHECK(events[1].payload["is_error"] == false);
}

TEST_CASE("ToolDispatcher routes qualified names to their server", "[dispatcher]")
{
    auto manager = connectedManager();
    auto dispatcher = ToolDispatcher(*manager);

    auto const result = dispatcher.execute(
        ToolCall { .id = "call_1", .name = "files__read", .arguments = nlohmann::json { { "path", "/tmp" } } });

    CHECK(result.callId == "call_1");
    CHECK(!result.isError);
    CHECK(result.content == "read:{\"path\":\"/tmp\"}");
    CHECK(dispatcher.executedCount() == 1);
}

TEST_CASE("ToolDispatcher turns failures into error results", "[dispatcher]")
{
    auto manager = connectedManager();
    auto dispatcher = ToolDispatcher(*manager);

    auto const execute = [&](std::string name) {
        return dispatcher.execute(ToolCall { .id = "c", .name = std::move(name), .arguments = nlohmann::json::object() });
    };

    SECTION("unqualified name")
    {
        auto const result = execute("read");
        CHECK(result.isError);
        CHECK(result.content.starts_with("Error: unknown tool"));
    }

    SECTION("unknown server")
    {
        auto const result = execute("web__fetch");
        CHECK(result.isError);
        CHECK(result.content.starts_with("Error: "));
    }

    SECTION("unknown capability")
    {
        auto const result = execute("files__delete");
        CHECK(result.isError);
    }

    SECTION("provider error")
    {
        auto const result = execute("files__rpc_error");
        CHECK(result.isError);
        CHECK(result.content.contains("tool exploded"));
    }

    SECTION("tool-level error keeps the provider text")
    {
        auto const result = execute("files__tool_error");
        CHECK(result.isError);
        CHECK(result.content == "bad input");
        CHECK(result.callId == "c");
    }
}

TEST_CASE("ToolDispatcher answers closed invocations with result blocks", "[dispatcher]")
{
    auto manager = connectedManager();
    auto dispatcher = ToolDispatcher(*manager);

    auto const block = invocationBlock(1, { { "id", "call_9" }, { "name", "files__read" } }, R"({"path":"/"})");
    auto const events = dispatcher.onBlockClosed(block, false);

    REQUIRE(events.size() == 3);
    CHECK(events[0].index == 1);
    CHECK(events[1].payload["tool_use_id"] == "call_9");
    CHECK(events[1].payload["content"] == "read:{\"path\":\"/\"}");
    CHECK(events[1].payload["is_error"] == false);
}

TEST_CASE("ToolDispatcher reports malformed invocations without executing them", "[dispatcher]")
{
    auto manager = connectedManager();
    auto dispatcher = ToolDispatcher(*manager);

    auto const events = dispatcher.onBlockClosed(invocationBlock(0, { { "id", "call_x" } }), false);
    REQUIRE(events.size() == 3);
    CHECK(events[1].payload["tool_use_id"] == "call_x");
    CHECK(events[1].payload["is_error"] == true);
    CHECK(dispatcher.executedCount() == 0);
}

TEST_CASE("ToolDispatcher skips force-closed and non-invocation blocks", "[dispatcher]")
{
    auto manager = connectedManager();
    auto dispatcher = ToolDispatcher(*manager);

    auto const invocation = invocationBlock(0, { { "name", "files__read" } });
    CHECK(dispatcher.onBlockClosed(invocation, true).empty());

    auto text = invocation;
    text.kind = BlockKind::Text;
    CHECK(dispatcher.onBlockClosed(text, false).empty());

    CHECK(dispatcher.executedCount() == 0);
}

TEST_CASE("ToolDispatcher executes tool calls during a streamed response", "[dispatcher]")
{
    auto manager = connectedManager();
    auto dispatcher = ToolDispatcher(*manager);

    auto channel = EventChannel {};
    channel.push(StreamEvent { .type = EventType::Open, .kind = BlockKind::ToolInvocation, .index = 0 });
    channel.push(StreamEvent { .type = EventType::Append,
                               .kind = BlockKind::ToolInvocation,
                               .index = 0,
                               .payload = nlohmann::json { { "id", "call_1" }, { "name", "files__read" } } });
    channel.push(
        StreamEvent { .type = EventType::Append, .kind = BlockKind::ToolInvocation, .index = 0, .payload = "{}" });
    channel.push(StreamEvent { .type = EventType::Close, .kind = BlockKind::ToolInvocation, .index = 0 });
    channel.push(StreamEvent { .type = EventType::Open, .kind = BlockKind::ToolInvocation, .index = 1 });
    channel.push(StreamEvent { .type = EventType::Finalize });

    auto assembler = ResponseAssembler {};
    consume(channel, assembler, dispatcher.handler());

    CHECK(dispatcher.executedCount() == 1);

    auto const* result = assembler.block(BlockKind::ToolResult, 0);
    REQUIRE(result != nullptr);
    CHECK(result->isClosed());
    CHECK(result->payload["content"] == "read:{}");

    // The invocation cut off by finalize produced no result.
    CHECK(assembler.block(BlockKind::ToolResult, 1) == nullptr);
}

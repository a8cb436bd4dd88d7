// SPDX-License-Identifier: Apache-2.0
#include <stream/StreamEvent.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolrelay;

TEST_CASE("parseStreamEvent decodes block events", "[stream]")
{
    auto const record = nlohmann::json {
        { "eventType", "append" },
        { "kind", "tool_invocation" },
        { "index", 2 },
        { "payload", { { "name", "files__read" } } },
    };

    auto event = parseStreamEvent(record);
    REQUIRE(event.has_value());
    CHECK(event->type == EventType::Append);
    CHECK(event->kind == BlockKind::ToolInvocation);
    CHECK(event->index == 2);
    CHECK(event->payload["name"] == "files__read");
}

TEST_CASE("parseStreamEvent does not need kind or index for finalize and abort", "[stream]")
{
    auto finalize = parseStreamEvent(nlohmann::json { { "eventType", "finalize" } });
    REQUIRE(finalize.has_value());
    CHECK(finalize->type == EventType::Finalize);

    auto abort = parseStreamEvent(nlohmann::json { { "eventType", "abort" } });
    REQUIRE(abort.has_value());
    CHECK(abort->type == EventType::Abort);
}

TEST_CASE("parseStreamEvent rejects malformed records", "[stream]")
{
    auto const rejects = [](const nlohmann::json& record) {
        auto event = parseStreamEvent(record);
        return !event.has_value() && event.error().code == ErrorCode::ProtocolError;
    };

    CHECK(rejects(nlohmann::json::array()));
    CHECK(rejects(nlohmann::json { { "kind", "text" }, { "index", 0 } }));
    CHECK(rejects(nlohmann::json { { "eventType", "explode" }, { "kind", "text" }, { "index", 0 } }));
    CHECK(rejects(nlohmann::json { { "eventType", "open" }, { "kind", "image" }, { "index", 0 } }));
    CHECK(rejects(nlohmann::json { { "eventType", "open" }, { "kind", "text" } }));
    CHECK(rejects(nlohmann::json { { "eventType", "open" }, { "kind", "text" }, { "index", "0" } }));
}

TEST_CASE("toJson produces records parseStreamEvent accepts", "[stream]")
{
    auto const event = StreamEvent { .type = EventType::Open, .kind = BlockKind::Reasoning, .index = 5 };
    auto const record = toJson(event);
    CHECK(record == nlohmann::json { { "eventType", "open" }, { "kind", "reasoning" }, { "index", 5 } });

    CHECK(toJson(StreamEvent { .type = EventType::Finalize }) == nlohmann::json { { "eventType", "finalize" } });
}

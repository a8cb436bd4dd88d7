// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace toolrelay
{

/// @brief Kind of content a streamed block carries.
enum class BlockKind
{
    Reasoning,
    ToolInvocation,
    ToolResult,
    Text,
};

/// @brief What a stream event does to its block, or to the response as a whole.
enum class EventType
{
    Open,
    Append,
    Close,
    Finalize,
    Abort,
};

/// @brief One record of the streaming event contract.
///
/// Finalize and Abort apply to the whole response; their kind and index are ignored.
struct StreamEvent
{
    EventType type = EventType::Append;
    BlockKind kind = BlockKind::Text;
    int64_t index = 0;
    nlohmann::json payload;
};

[[nodiscard]] constexpr auto blockKindToString(BlockKind kind) -> std::string_view
{
    switch (kind)
    {
        case BlockKind::Reasoning: return "reasoning";
        case BlockKind::ToolInvocation: return "tool_invocation";
        case BlockKind::ToolResult: return "tool_result";
        case BlockKind::Text: return "text";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto blockKindFromString(std::string_view str) -> std::optional<BlockKind>
{
    if (str == "reasoning")
        return BlockKind::Reasoning;
    if (str == "tool_invocation")
        return BlockKind::ToolInvocation;
    if (str == "tool_result")
        return BlockKind::ToolResult;
    if (str == "text")
        return BlockKind::Text;
    return std::nullopt;
}

[[nodiscard]] constexpr auto eventTypeToString(EventType type) -> std::string_view
{
    switch (type)
    {
        case EventType::Open: return "open";
        case EventType::Append: return "append";
        case EventType::Close: return "close";
        case EventType::Finalize: return "finalize";
        case EventType::Abort: return "abort";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto eventTypeFromString(std::string_view str) -> std::optional<EventType>
{
    if (str == "open")
        return EventType::Open;
    if (str == "append")
        return EventType::Append;
    if (str == "close")
        return EventType::Close;
    if (str == "finalize")
        return EventType::Finalize;
    if (str == "abort")
        return EventType::Abort;
    return std::nullopt;
}

/// @brief Decodes one event record: {"eventType", "kind", "index", "payload"}.
///
/// "kind" and "index" are only required for block events.
/// @return The event, or ErrorCode::ProtocolError for a malformed record.
[[nodiscard]] auto parseStreamEvent(const nlohmann::json& record) -> Result<StreamEvent>;

/// @brief Encodes an event into the record form accepted by parseStreamEvent().
[[nodiscard]] auto toJson(const StreamEvent& event) -> nlohmann::json;

} // namespace toolrelay

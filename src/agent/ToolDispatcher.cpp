// SPDX-License-Identifier: Apache-2.0
#include "ToolDispatcher.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <tools/SelectionRegistry.hpp>

#include <format>

namespace toolrelay
{

auto toolCallFromBlock(const StreamingBlock& block) -> Result<ToolCall>
{
    if (block.kind != BlockKind::ToolInvocation)
        return makeError(ErrorCode::InvalidArgument, "Block is not a tool invocation");
    if (!block.isClosed())
        return makeError(ErrorCode::InvalidArgument, "Tool invocation block is still open");

    auto const name = json::getString(block.payload, "name");
    if (!name)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Tool invocation #{} does not name a tool", block.index));

    auto call = ToolCall {
        .id = json::getStringOr(block.payload, "id", std::format("call_{}", block.index)),
        .name = *name,
        .arguments = nlohmann::json::object(),
    };

    if (block.payload.contains("input"))
    {
        call.arguments = block.payload["input"];
    }
    else if (!block.text.empty())
    {
        auto parsed = json::parse(block.text);
        if (!parsed)
            return makeError(ErrorCode::ProtocolError,
                             std::format("Tool invocation #{} has malformed input: {}",
                                         block.index,
                                         parsed.error().message));
        // When the whole payload was decoded from the text, there is no separate input.
        if (parsed->is_object() && *parsed != block.payload)
            call.arguments = std::move(*parsed);
    }

    return call;
}

auto toolResultEvents(int64_t index, const ToolResult& result) -> std::vector<StreamEvent>
{
    auto payload = nlohmann::json {
        { "tool_use_id", result.callId },
        { "content", result.content },
        { "is_error", result.isError },
    };

    return {
        StreamEvent { .type = EventType::Open, .kind = BlockKind::ToolResult, .index = index },
        StreamEvent {
            .type = EventType::Append, .kind = BlockKind::ToolResult, .index = index, .payload = std::move(payload) },
        StreamEvent { .type = EventType::Close, .kind = BlockKind::ToolResult, .index = index },
    };
}

ToolDispatcher::ToolDispatcher(ConnectionManager& connections): _connections(connections)
{
}

auto ToolDispatcher::execute(const ToolCall& call) -> ToolResult
{
    ++_executed;

    auto const target = splitQualifiedName(call.name);
    if (!target)
    {
        log::error("Tool call '{}' does not name a server capability", call.name);
        return ToolResult {
            .callId = call.id,
            .content = std::format("Error: unknown tool '{}'", call.name),
            .isError = true,
        };
    }

    log::info("Executing tool: {} on '{}' (id: {})", target->name, target->serverId, call.id);

    auto result = _connections.invoke(target->serverId, target->name, call.arguments);
    if (!result)
    {
        log::error("Tool call failed: {}", result.error());
        return ToolResult {
            .callId = call.id,
            .content = std::format("Error: {}", result.error().message),
            .isError = true,
        };
    }

    result->callId = call.id;
    return std::move(*result);
}

auto ToolDispatcher::onBlockClosed(const StreamingBlock& block, bool forced) -> std::vector<StreamEvent>
{
    if (block.kind != BlockKind::ToolInvocation)
        return {};

    if (forced)
    {
        log::debug("Skipping tool invocation #{} closed by end of response", block.index);
        return {};
    }

    auto call = toolCallFromBlock(block);
    if (!call)
    {
        log::error("{}", call.error().message);
        return toolResultEvents(block.index,
                                ToolResult {
                                    .callId = json::getStringOr(block.payload, "id", ""),
                                    .content = std::format("Error: {}", call.error().message),
                                    .isError = true,
                                });
    }

    return toolResultEvents(block.index, execute(*call));
}

auto ToolDispatcher::handler() -> BlockClosedHandler
{
    return [this](const StreamingBlock& block, bool forced) { return onBlockClosed(block, forced); };
}

auto ToolDispatcher::executedCount() const -> size_t
{
    return _executed;
}

} // namespace toolrelay

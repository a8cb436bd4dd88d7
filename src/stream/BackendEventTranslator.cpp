// SPDX-License-Identifier: Apache-2.0
#include "BackendEventTranslator.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <optional>

namespace toolrelay
{

namespace
{
    auto kindOfBlockType(std::string_view type) -> std::optional<BlockKind>
    {
        if (type == "text")
            return BlockKind::Text;
        if (type == "thinking" || type == "redacted_thinking")
            return BlockKind::Reasoning;
        if (type == "tool_use" || type == "server_tool_use")
            return BlockKind::ToolInvocation;
        if (type == "tool_result" || type.ends_with("_tool_result"))
            return BlockKind::ToolResult;
        return std::nullopt;
    }

    auto blockEvent(EventType type, BlockKind kind, int64_t index, nlohmann::json payload = nullptr) -> StreamEvent
    {
        return StreamEvent { .type = type, .kind = kind, .index = index, .payload = std::move(payload) };
    }
} // namespace

auto BackendEventTranslator::translate(const nlohmann::json& event) -> std::vector<StreamEvent>
{
    auto const type = json::getStringOr(event, "type", "");

    if (type == "message_stop")
        return { StreamEvent { .type = EventType::Finalize } };

    if (type == "error")
    {
        log::warning("Backend reported stream error: {}",
                     json::getStringOr(event.value("error", nlohmann::json::object()), "message", "unknown"));
        return { StreamEvent { .type = EventType::Abort } };
    }

    if (type != "content_block_start" && type != "content_block_delta" && type != "content_block_stop")
        return {};

    if (!event.contains("index") || !event["index"].is_number_integer())
    {
        log::warning("Backend event '{}' without index ignored", type);
        return {};
    }
    auto const index = event["index"].get<int64_t>();

    if (type == "content_block_start")
        return onBlockStart(index, event.value("content_block", nlohmann::json::object()));

    if (type == "content_block_delta")
        return onBlockDelta(index, event.value("delta", nlohmann::json::object()));

    auto const it = _kinds.find(index);
    if (it == _kinds.end())
        return {};
    return { blockEvent(EventType::Close, it->second, index) };
}

void BackendEventTranslator::reset()
{
    _kinds.clear();
}

auto BackendEventTranslator::onBlockStart(int64_t index, const nlohmann::json& block) -> std::vector<StreamEvent>
{
    auto const blockType = json::getStringOr(block, "type", "");
    auto const kind = kindOfBlockType(blockType);
    if (!kind)
    {
        log::debug("Ignoring block #{} of unsupported type '{}'", index, blockType);
        return {};
    }

    _kinds[index] = *kind;
    auto events = std::vector<StreamEvent> { blockEvent(EventType::Open, *kind, index) };

    switch (*kind)
    {
        case BlockKind::Text:
            if (auto text = json::getStringOr(block, "text", ""); !text.empty())
                events.push_back(blockEvent(EventType::Append, *kind, index, std::move(text)));
            break;
        case BlockKind::Reasoning:
            if (auto text = json::getStringOr(block, "thinking", ""); !text.empty())
                events.push_back(blockEvent(EventType::Append, *kind, index, std::move(text)));
            break;
        case BlockKind::ToolInvocation:
        case BlockKind::ToolResult: {
            // Identity fields arrive up front; the input itself usually streams as JSON text.
            auto header = block;
            header.erase("type");
            if (header.contains("input") && header["input"].is_object() && header["input"].empty())
                header.erase("input");
            if (!header.empty())
                events.push_back(blockEvent(EventType::Append, *kind, index, std::move(header)));
            break;
        }
    }

    return events;
}

auto BackendEventTranslator::onBlockDelta(int64_t index, const nlohmann::json& delta) -> std::vector<StreamEvent>
{
    auto const it = _kinds.find(index);
    if (it == _kinds.end())
    {
        log::debug("Delta for unknown block #{} ignored", index);
        return {};
    }

    auto const deltaType = json::getStringOr(delta, "type", "");
    auto fragment = std::string {};
    if (deltaType == "text_delta")
        fragment = json::getStringOr(delta, "text", "");
    else if (deltaType == "thinking_delta")
        fragment = json::getStringOr(delta, "thinking", "");
    else if (deltaType == "input_json_delta")
        fragment = json::getStringOr(delta, "partial_json", "");
    else
        return {};

    if (fragment.empty())
        return {};
    return { blockEvent(EventType::Append, it->second, index, std::move(fragment)) };
}

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#include "ResponseAssembler.hpp"

#include <core/Log.hpp>

namespace toolrelay
{

namespace
{
    auto isStructured(BlockKind kind) -> bool
    {
        return kind == BlockKind::ToolInvocation || kind == BlockKind::ToolResult;
    }
} // namespace

void ResponseAssembler::reset()
{
    for (auto& blocks: _blocks)
        blocks.clear();
    _runningText.clear();
    _state = AssemblerState::Idle;
    _dropped = 0;
    _aborted = false;
}

auto ResponseAssembler::open(BlockKind kind, int64_t index) -> bool
{
    if (!beginEvent("open", kind, index))
        return false;

    auto& blocks = collection(kind);
    if (auto it = blocks.find(index); it != blocks.end())
    {
        if (it->second.isClosed())
            drop("open", kind, index, "block already closed");
        else
            log::trace("Duplicate open for {} #{}", blockKindToString(kind), index);
        return false;
    }

    blocks.emplace(index, StreamingBlock { .index = index, .kind = kind, .state = BlockState::Open });
    return true;
}

auto ResponseAssembler::append(BlockKind kind, int64_t index, const nlohmann::json& fragment) -> bool
{
    if (!beginEvent("append", kind, index))
        return false;

    auto& blocks = collection(kind);
    auto it = blocks.find(index);
    if (it == blocks.end())
    {
        drop("append", kind, index, "block not open");
        return false;
    }

    auto& block = it->second;
    if (block.isClosed())
    {
        drop("append", kind, index, "block already closed");
        return false;
    }

    auto textFragment = std::string {};
    if (fragment.is_string())
    {
        textFragment = fragment.get<std::string>();
    }
    else if (fragment.is_object() && !isStructured(kind) && fragment.contains("text")
             && fragment["text"].is_string())
    {
        textFragment = fragment["text"].get<std::string>();
    }
    else if (fragment.is_object())
    {
        if (!block.payload.is_object())
            block.payload = nlohmann::json::object();
        block.payload.update(fragment);
        return true;
    }
    else if (!fragment.is_null())
    {
        textFragment = fragment.dump();
    }

    block.text += textFragment;
    if (kind == BlockKind::Text)
        _runningText += textFragment;
    return true;
}

auto ResponseAssembler::close(BlockKind kind, int64_t index) -> bool
{
    if (!beginEvent("close", kind, index))
        return false;

    auto& blocks = collection(kind);
    auto it = blocks.find(index);
    if (it == blocks.end())
    {
        drop("close", kind, index, "block not open");
        return false;
    }
    if (it->second.isClosed())
    {
        drop("close", kind, index, "block already closed");
        return false;
    }

    seal(it->second);
    return true;
}

auto ResponseAssembler::finalize() -> std::vector<StreamingBlock>
{
    return closeBlocks(false);
}

auto ResponseAssembler::abort() -> std::vector<StreamingBlock>
{
    return closeBlocks(true);
}

auto ResponseAssembler::apply(const StreamEvent& event) -> std::vector<StreamingBlock>
{
    switch (event.type)
    {
        case EventType::Open: open(event.kind, event.index); return {};
        case EventType::Append: append(event.kind, event.index, event.payload); return {};
        case EventType::Close:
            if (close(event.kind, event.index))
                return { *block(event.kind, event.index) };
            return {};
        case EventType::Finalize: return finalize();
        case EventType::Abort: return abort();
    }
    return {};
}

auto ResponseAssembler::blocks(BlockKind kind) const -> std::vector<StreamingBlock>
{
    auto result = std::vector<StreamingBlock> {};
    for (const auto& [index, block]: collection(kind))
        result.push_back(block);
    return result;
}

auto ResponseAssembler::block(BlockKind kind, int64_t index) const -> const StreamingBlock*
{
    auto const& blocks = collection(kind);
    auto const it = blocks.find(index);
    return it != blocks.end() ? &it->second : nullptr;
}

auto ResponseAssembler::closedToolInvocations() const -> std::vector<StreamingBlock>
{
    auto result = std::vector<StreamingBlock> {};
    for (const auto& [index, block]: collection(BlockKind::ToolInvocation))
    {
        if (block.isClosed())
            result.push_back(block);
    }
    return result;
}

auto ResponseAssembler::runningText() const -> const std::string&
{
    return _runningText;
}

auto ResponseAssembler::state() const -> AssemblerState
{
    return _state;
}

auto ResponseAssembler::droppedEventCount() const -> size_t
{
    return _dropped;
}

auto ResponseAssembler::wasAborted() const -> bool
{
    return _aborted;
}

auto ResponseAssembler::collection(BlockKind kind) -> BlockMap&
{
    return _blocks[static_cast<size_t>(kind)];
}

auto ResponseAssembler::collection(BlockKind kind) const -> const BlockMap&
{
    return _blocks[static_cast<size_t>(kind)];
}

auto ResponseAssembler::beginEvent(std::string_view what, BlockKind kind, int64_t index) -> bool
{
    if (_state == AssemblerState::Finalized)
    {
        drop(what, kind, index, "response already finalized");
        return false;
    }
    _state = AssemblerState::Streaming;
    return true;
}

void ResponseAssembler::drop(std::string_view what, BlockKind kind, int64_t index, std::string_view reason)
{
    ++_dropped;
    log::debug("Dropped {} for {} #{}: {}", what, blockKindToString(kind), index, reason);
}

auto ResponseAssembler::closeBlocks(bool aborted) -> std::vector<StreamingBlock>
{
    auto closed = std::vector<StreamingBlock> {};
    if (_state == AssemblerState::Finalized)
        return closed;

    for (auto& blocks: _blocks)
    {
        for (auto& [index, block]: blocks)
        {
            if (block.isClosed())
                continue;
            seal(block);
            closed.push_back(block);
        }
    }

    if (!closed.empty())
        log::debug("{} closed {} open block(s)", aborted ? "Abort" : "Finalize", closed.size());

    _state = AssemblerState::Finalized;
    _aborted = aborted;
    return closed;
}

void ResponseAssembler::seal(StreamingBlock& block)
{
    block.state = BlockState::Closed;

    // Structured blocks may stream their payload as JSON text; decode it once complete.
    if (!isStructured(block.kind) || block.text.empty() || block.payload.is_object())
        return;

    auto parsed = nlohmann::json::parse(block.text, nullptr, false);
    if (parsed.is_object())
        block.payload = std::move(parsed);
}

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/StreamEvent.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace toolrelay
{

/// @brief Lifecycle of one streamed block.
enum class BlockState
{
    Open,
    Closed,
};

/// @brief Lifecycle of the response being assembled.
enum class AssemblerState
{
    Idle,
    Streaming,
    Finalized,
};

/// @brief One unit of model output under construction.
struct StreamingBlock
{
    int64_t index = 0;
    BlockKind kind = BlockKind::Text;
    BlockState state = BlockState::Open;

    /// @brief Concatenation of all string fragments, in arrival order.
    std::string text;

    /// @brief Merge of all object fragments; null until one arrives.
    nlohmann::json payload;

    [[nodiscard]] auto isClosed() const -> bool { return state == BlockState::Closed; }
};

/// @brief Rebuilds the blocks of one in-flight model response from its event stream.
///
/// Blocks are kept per kind, keyed by the producer-assigned index. Malformed sequences never
/// raise: duplicate opens are ignored, and events that target a missing or closed block (or
/// arrive after finalize) are dropped and counted. Closed blocks are immutable.
///
/// Text blocks additionally feed one running buffer holding all narrative text of the response.
class ResponseAssembler
{
  public:
    /// @brief Discards all block state and returns to AssemblerState::Idle. Safe to call at any time.
    void reset();

    /// @brief Opens a block. Re-opening an open block is a no-op.
    /// @return True if the block was created.
    auto open(BlockKind kind, int64_t index) -> bool;

    /// @brief Appends a fragment to an open block.
    ///
    /// String fragments extend the block text; object fragments merge into the block payload.
    /// @return False if the event was dropped.
    auto append(BlockKind kind, int64_t index, const nlohmann::json& fragment) -> bool;

    /// @brief Closes an open block.
    /// @return False if the event was dropped.
    auto close(BlockKind kind, int64_t index) -> bool;

    /// @brief Ends the response, force-closing open blocks with whatever content they hold.
    /// @return The blocks closed by this call, in kind then index order.
    auto finalize() -> std::vector<StreamingBlock>;

    /// @brief Cancels the response. Same as finalize(), but marks the response as aborted.
    auto abort() -> std::vector<StreamingBlock>;

    /// @brief Applies one stream event.
    /// @return The blocks this event closed.
    auto apply(const StreamEvent& event) -> std::vector<StreamingBlock>;

    /// @brief Returns the blocks of one kind in index order.
    [[nodiscard]] auto blocks(BlockKind kind) const -> std::vector<StreamingBlock>;

    /// @brief Returns one block, or nullptr if it was never opened.
    [[nodiscard]] auto block(BlockKind kind, int64_t index) const -> const StreamingBlock*;

    /// @brief Returns the closed tool invocation blocks in index order.
    [[nodiscard]] auto closedToolInvocations() const -> std::vector<StreamingBlock>;

    /// @brief All text appended to text blocks so far.
    [[nodiscard]] auto runningText() const -> const std::string&;

    [[nodiscard]] auto state() const -> AssemblerState;
    [[nodiscard]] auto droppedEventCount() const -> size_t;
    [[nodiscard]] auto wasAborted() const -> bool;

  private:
    using BlockMap = std::map<int64_t, StreamingBlock>;

    std::array<BlockMap, 4> _blocks;
    std::string _runningText;
    AssemblerState _state = AssemblerState::Idle;
    size_t _dropped = 0;
    bool _aborted = false;

    auto collection(BlockKind kind) -> BlockMap&;
    [[nodiscard]] auto collection(BlockKind kind) const -> const BlockMap&;

    /// @brief Returns false (and counts a drop) once the response is finalized.
    auto beginEvent(std::string_view what, BlockKind kind, int64_t index) -> bool;
    void drop(std::string_view what, BlockKind kind, int64_t index, std::string_view reason);
    auto closeBlocks(bool aborted) -> std::vector<StreamingBlock>;
    static void seal(StreamingBlock& block);
};

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ConnectionManager.hpp>
#include <stream/EventChannel.hpp>
#include <stream/ResponseAssembler.hpp>

#include <cstdint>
#include <vector>

namespace toolrelay
{

/// @brief Extracts the tool call carried by a closed tool invocation block.
///
/// The block payload provides "id" and "name"; the input comes from the payload's "input" member
/// or, when it streamed as JSON text, from the block text.
[[nodiscard]] auto toolCallFromBlock(const StreamingBlock& block) -> Result<ToolCall>;

/// @brief Builds the open/append/close events of a tool result block at @p index.
[[nodiscard]] auto toolResultEvents(int64_t index, const ToolResult& result) -> std::vector<StreamEvent>;

/// @brief Executes tool invocations found in a streamed response.
///
/// Invocation blocks name capabilities by their qualified request name; the dispatcher routes them
/// to the owning connection and turns the outcome into a tool result block with the same index.
/// Failures become error results, never exceptions.
class ToolDispatcher
{
  public:
    /// @brief Constructs a dispatcher.
    /// @param connections The manager that owns the provider connections.
    explicit ToolDispatcher(ConnectionManager& connections);

    /// @brief Executes one tool call.
    [[nodiscard]] auto execute(const ToolCall& call) -> ToolResult;

    /// @brief Reacts to a closed block; suitable as a BlockClosedHandler.
    ///
    /// Only invocation blocks closed by their own close event are executed. Blocks force-closed by
    /// finalize or abort may hold partial input and are skipped.
    [[nodiscard]] auto onBlockClosed(const StreamingBlock& block, bool forced) -> std::vector<StreamEvent>;

    /// @brief Returns a handler bound to this dispatcher.
    [[nodiscard]] auto handler() -> BlockClosedHandler;

    /// @brief Number of tool calls executed so far.
    [[nodiscard]] auto executedCount() const -> size_t;

  private:
    ConnectionManager& _connections;
    size_t _executed = 0;
};

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/ResponseAssembler.hpp>
#include <stream/StreamEvent.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace toolrelay
{

/// @brief Queue of stream events belonging to one response.
///
/// Any thread may push; a single consumer pops. A fresh channel is used per response, so no
/// event of one response can leak into the next.
class EventChannel
{
  public:
    /// @brief Enqueues an event. Ignored once the channel is closed.
    /// @return False if the channel was closed.
    auto push(StreamEvent event) -> bool;

    /// @brief Stops accepting events. Queued events can still be popped.
    void close();

    /// @brief Waits for the next event.
    /// @return The event, or nullopt once the channel is closed and drained, or on stop request.
    [[nodiscard]] auto pop(std::stop_token stop) -> std::optional<StreamEvent>;

    /// @brief Returns the next event if one is queued, without waiting.
    [[nodiscard]] auto tryPop() -> std::optional<StreamEvent>;

    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto pending() const -> size_t;

  private:
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<StreamEvent> _queue;
    bool _closed = false;
};

/// @brief Reacts to a block as soon as the assembler closes it.
///
/// @p forced is true for blocks closed by finalize or abort rather than by their own close event.
/// The returned events (for instance the result of a tool invocation) are applied to the same
/// response before the next queued event.
using BlockClosedHandler = std::function<std::vector<StreamEvent>(const StreamingBlock& block, bool forced)>;

/// @brief Runs the consumer loop of one response.
///
/// Pops events from @p channel and applies them to @p assembler until the response is finalized or
/// aborted, the channel is closed and drained, or @p stop is requested. A stop request or a closed
/// channel before the end of the response aborts it, preserving partial content.
/// @param onClosed Invoked for every block closed along the way, including force-closed ones.
void consume(EventChannel& channel,
             ResponseAssembler& assembler,
             const BlockClosedHandler& onClosed,
             std::stop_token stop = {});

} // namespace toolrelay

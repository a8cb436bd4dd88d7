// SPDX-License-Identifier: Apache-2.0
#include "EventChannel.hpp"

#include <core/Log.hpp>

namespace toolrelay
{

auto EventChannel::push(StreamEvent event) -> bool
{
    {
        auto const lock = std::lock_guard(_mutex);
        if (_closed)
            return false;
        _queue.push_back(std::move(event));
    }
    _cv.notify_one();
    return true;
}

void EventChannel::close()
{
    {
        auto const lock = std::lock_guard(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

auto EventChannel::pop(std::stop_token stop) -> std::optional<StreamEvent>
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait(lock, stop, [this] { return !_queue.empty() || _closed; });

    if (_queue.empty() || stop.stop_requested())
        return std::nullopt;

    auto event = std::move(_queue.front());
    _queue.pop_front();
    return event;
}

auto EventChannel::tryPop() -> std::optional<StreamEvent>
{
    auto const lock = std::lock_guard(_mutex);
    if (_queue.empty())
        return std::nullopt;

    auto event = std::move(_queue.front());
    _queue.pop_front();
    return event;
}

auto EventChannel::isClosed() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _closed;
}

auto EventChannel::pending() const -> size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _queue.size();
}

void consume(EventChannel& channel,
             ResponseAssembler& assembler,
             const BlockClosedHandler& onClosed,
             std::stop_token stop)
{
    auto pending = std::deque<StreamEvent> {};

    auto report = [&](const std::vector<StreamingBlock>& closed, bool forced) {
        if (!onClosed)
            return;
        for (const auto& block: closed)
        {
            for (auto& followUp: onClosed(block, forced))
                pending.push_back(std::move(followUp));
        }
    };

    while (assembler.state() != AssemblerState::Finalized)
    {
        if (!pending.empty())
        {
            auto const event = std::move(pending.front());
            pending.pop_front();
            report(assembler.apply(event), false);
            continue;
        }

        auto event = channel.pop(stop);
        if (!event)
        {
            log::debug("Response stream ended before finalize ({}), aborting",
                       stop.stop_requested() ? "cancelled" : "channel closed");
            report(assembler.abort(), true);
            return;
        }

        auto const forced = event->type == EventType::Finalize || event->type == EventType::Abort;
        report(assembler.apply(*event), forced);
    }
}

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <print>
#include <string>

namespace toolrelay::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelToString(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "info";
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace toolrelay::log

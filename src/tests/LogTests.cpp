// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

using namespace toolrelay;

namespace
{
/// @brief Restores the global log level and sink when a test is done with them.
class LogScope
{
  public:
    LogScope(): _level(log::getLevel()) {}
    ~LogScope()
    {
        log::setCallback({});
        log::setLevel(_level);
    }

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

  private:
    log::Level _level;
};
} // namespace

TEST_CASE("log level names convert both ways", "[log]")
{
    auto const levels = {
        log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug, log::Level::Trace,
    };
    for (auto const level: levels)
        CHECK(log::levelFromString(log::levelToString(level)) == level);

    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(!log::levelFromString("chatty").has_value());
}

TEST_CASE("log messages below the level are dropped", "[log]")
{
    auto const scope = LogScope {};
    auto captured = std::vector<std::pair<log::Level, std::string>> {};
    log::setCallback([&](log::Level level, std::string_view message) { captured.emplace_back(level, message); });
    log::setLevel(log::Level::Warning);

    log::error("disk {} full", "/srv");
    log::warning("slow provider: {} ms", 1500);
    log::info("not shown");
    log::debug("not shown either");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0] == std::pair { log::Level::Error, std::string("disk /srv full") });
    CHECK(captured[1] == std::pair { log::Level::Warning, std::string("slow provider: 1500 ms") });
}

TEST_CASE("log writes to stderr without a callback", "[log]")
{
    auto const scope = LogScope {};
    log::setCallback({});
    log::setLevel(log::Level::Trace);

    // Exercises the default sink; every level gets its own prefix.
    log::error("stderr sink {}", 1);
    log::trace("stderr sink {}", 2);
    CHECK(log::getLevel() == log::Level::Trace);
}

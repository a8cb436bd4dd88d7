// SPDX-License-Identifier: Apache-2.0
#include <mcp/StdioTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <thread>

using namespace toolrelay;
using namespace std::chrono_literals;

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = StdioTransport();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.send(nlohmann::json { { "test", true } }, 1s, {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport receive fails when not connected", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.receive(100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport rejects an empty command", "[transport]")
{
    auto transport = StdioTransport();
    auto result = transport.start(StdioTransportConfig { .command = "" });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::LaunchFailure);
}

#ifndef _WIN32
TEST_CASE("StdioTransport can spawn and communicate with a simple process", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "cat",
        .args = {},
        .env = {},
    };

    auto startResult = transport.start(config);
    REQUIRE(startResult.has_value());
    CHECK(transport.isConnected());

    // Send a JSON message
    auto msg = nlohmann::json { { "test", "hello" } };
    auto sendResult = transport.send(msg, 2s, {});
    REQUIRE(sendResult.has_value());

    // Read it back (cat echoes stdin to stdout)
    auto recvResult = transport.receive(2s);
    REQUIRE(recvResult.has_value());
    CHECK((*recvResult)["test"] == "hello");

    transport.close();
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport receive times out without output", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "cat" }).has_value());

    auto const started = std::chrono::steady_clock::now();
    auto result = transport.receive(100ms);
    auto const elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(elapsed >= 100ms);
    CHECK(transport.isConnected());
}

TEST_CASE("StdioTransport reports process exit as TransportError", "[transport]")
{
    auto transport = StdioTransport();
    REQUIRE(transport.start(StdioTransportConfig { .command = "true" }).has_value());

    auto result = transport.receive(2s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport passes arguments and environment overrides", "[transport]")
{
    auto transport = StdioTransport();
    auto config = StdioTransportConfig {
        .command = "sh",
        .args = { "-c", "printf '{\"value\":\"%s\"}\\n' \"$TOOLRELAY_TEST_VALUE\"" },
        .env = { { "TOOLRELAY_TEST_VALUE", "from-env" } },
    };
    REQUIRE(transport.start(config).has_value());

    auto result = transport.receive(2s);
    REQUIRE(result.has_value());
    CHECK((*result)["value"] == "from-env");
}

TEST_CASE("StdioTransport splits and reassembles newline-delimited messages", "[transport]")
{
    auto transport = StdioTransport();
    auto config = StdioTransportConfig {
        .command = "sh",
        .args = { "-c", "printf '{\"n\":1}\\r\\n\\n{\"n\":2}\\n'" },
    };
    REQUIRE(transport.start(config).has_value());

    auto first = transport.receive(2s);
    REQUIRE(first.has_value());
    CHECK((*first)["n"] == 1);

    auto second = transport.receive(2s);
    REQUIRE(second.has_value());
    CHECK((*second)["n"] == 2);
}

TEST_CASE("StdioTransport close terminates a provider that ignores stdin", "[transport]")
{
    auto transport = StdioTransport();
    auto config = StdioTransportConfig {
        .command = "sleep",
        .args = { "30" },
        .terminateGrace = 100ms,
    };
    REQUIRE(transport.start(config).has_value());

    auto const started = std::chrono::steady_clock::now();
    transport.close();
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport send gives up on a provider that stops reading", "[transport]")
{
    auto transport = StdioTransport();
    auto config = StdioTransportConfig {
        .command = "sleep",
        .args = { "30" },
        .terminateGrace = 100ms,
    };
    REQUIRE(transport.start(config).has_value());

    // Far larger than any pipe buffer, so the write cannot complete.
    auto const payload = nlohmann::json { { "blob", std::string(4 * 1024 * 1024, 'x') } };

    SECTION("timeout")
    {
        auto const started = std::chrono::steady_clock::now();
        auto const result = transport.send(payload, 200ms, {});
        auto const elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::TransportError);
        CHECK(elapsed >= 200ms);
        CHECK(elapsed < 3s);
    }

    SECTION("stop request")
    {
        auto source = std::stop_source {};
        auto const stopper = std::jthread([&source] {
            std::this_thread::sleep_for(100ms);
            source.request_stop();
        });

        auto const started = std::chrono::steady_clock::now();
        auto const result = transport.send(payload, 30s, source.get_token());

        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::TransportError);
        CHECK(std::chrono::steady_clock::now() - started < 3s);
    }

    // The torn message leaves the channel unusable.
    CHECK(!transport.isConnected());

    auto const started = std::chrono::steady_clock::now();
    transport.close();
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}
#endif

TEST_CASE("StdioTransport fails to start invalid command", "[transport]")
{
    auto transport = StdioTransport();

    auto config = StdioTransportConfig {
        .command = "/nonexistent/command/that/does/not/exist",
        .args = {},
        .env = {},
    };

    auto result = transport.start(config);
    // posix_spawnp may succeed even for non-existent commands on some systems,
    // but the process will fail immediately. We check that either start fails
    // or subsequent operations fail.
    if (result.has_value())
    {
        auto recvResult = transport.receive(2s);
        CHECK(!recvResult.has_value());
    }
    else
    {
        CHECK(result.error().code == ErrorCode::LaunchFailure);
    }
}

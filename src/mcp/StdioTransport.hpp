// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolrelay
{

/// @brief Configuration for spawning a tool-provider process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief How long close() waits for the process to exit before escalating the signal.
    std::chrono::milliseconds terminateGrace { 500 };
};

/// @brief Transport that communicates with a tool provider via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited JSON over its stdin/stdout.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the provider process.
    /// @param config The process configuration.
    /// @return Success or an error.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message,
                            std::chrono::milliseconds timeout,
                            std::stop_token stop) -> VoidResult override;
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolrelay

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <stop_token>

namespace toolrelay
{

/// @brief Abstract interface for the private channel to one tool provider.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the provider.
    ///
    /// Waits at most @p timeout for the provider to accept the message, and gives up early once
    /// @p stop is requested. Fails with ErrorCode::TimeoutError or ErrorCode::Cancelled when nothing
    /// was written, and with ErrorCode::TransportError once a partial message broke the framing.
    /// @param message The JSON message to send.
    /// @param timeout Upper bound on the wait.
    /// @param stop Abandons the write.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message,
                                    std::chrono::milliseconds timeout,
                                    std::stop_token stop) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the provider.
    ///
    /// Waits at most @p timeout. Fails with ErrorCode::TimeoutError when nothing arrived in time,
    /// and with ErrorCode::TransportError when the channel is closed.
    /// @param timeout Upper bound on the wait.
    /// @return The received JSON message or an error.
    [[nodiscard]] virtual auto receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json> = 0;

    /// @brief Closes the channel and terminates the provider.
    virtual void close() = 0;

    /// @brief Returns true if the channel is open.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolrelay

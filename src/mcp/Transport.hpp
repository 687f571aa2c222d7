// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace toolchat
{

/// @brief Receive timeout; a negative value waits indefinitely.
using Timeout = std::chrono::milliseconds;

inline constexpr auto InfiniteTimeout = Timeout { -1 };

/// @brief Abstract interface for line-delimited JSON-RPC communication with a tool server.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the server.
    /// @param timeout How long to wait for a complete message.
    /// @return The received message, or a TimeoutError / TransportError.
    [[nodiscard]] virtual auto receive(Timeout timeout = InfiniteTimeout) -> Result<nlohmann::json> = 0;

    /// @brief Closes the connection and releases all resources. Idempotent.
    /// @return An error if the peer had to be terminated forcibly; resources are released regardless.
    virtual auto close() -> VoidResult = 0;

    /// @brief Makes a receive() that is blocked on another thread fail promptly.
    ///
    /// Unlike the other members this one may be called concurrently. The peer is not expected
    /// to survive it; close() still has to be called afterwards. The default does nothing.
    virtual void interrupt() {}

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolchat

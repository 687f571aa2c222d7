// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief Configuration for spawning a tool server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief How long close() waits for the child to exit on its own before signalling it.
    Timeout shutdownGrace = Timeout { 500 };
};

/// @brief Transport that talks to a tool server over the stdin/stdout pipes of a child process.
///
/// Messages are newline-delimited JSON. The child's stderr is inherited.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Spawns the server process.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive(Timeout timeout = InfiniteTimeout) -> Result<nlohmann::json> override;
    auto close() -> VoidResult override;
    void interrupt() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child's process id, or -1 when not running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolchat

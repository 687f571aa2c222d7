// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief How to launch one tool server.
struct ToolServerConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Timeouts applied by a ToolConnection.
struct ConnectionOptions
{
    /// @brief Upper bound for each handshake step (initialize, tools/list).
    Timeout handshakeTimeout = Timeout { 30'000 };

    /// @brief Upper bound for a single tool call.
    Timeout callTimeout = InfiniteTimeout;
};

/// @brief Lifecycle state of a ToolConnection.
enum class Liveness
{
    Disconnected,
    Connected,
    Failed,
    Closed,
};

[[nodiscard]] constexpr auto livenessToString(Liveness liveness) -> std::string_view
{
    switch (liveness)
    {
        case Liveness::Disconnected: return "disconnected";
        case Liveness::Connected: return "connected";
        case Liveness::Failed: return "failed";
        case Liveness::Closed: return "closed";
    }
    return "unknown";
}

/// @brief Creates the transport for a server. Injected so that tests can substitute in-memory servers.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(std::string_view serverId, const ToolServerConfig& config)>;

/// @brief Returns a factory that spawns each server as a child process speaking over stdio.
[[nodiscard]] auto makeStdioTransportFactory() -> TransportFactory;

/// @brief Owns one tool server: its process, its MCP session and its tool catalog.
///
/// The tool list is fetched once by connect() and never refreshed. Calls are serialized by a
/// per-connection lock, so one connection may be shared by concurrent chat sessions.
/// The server is shut down by close() or, at the latest, by the destructor.
class ToolConnection
{
  public:
    ToolConnection(std::string serverId,
                   ToolServerConfig config,
                   TransportFactory transportFactory,
                   ConnectionOptions options = {});
    ~ToolConnection();

    ToolConnection(const ToolConnection&) = delete;
    ToolConnection& operator=(const ToolConnection&) = delete;

    /// @brief Launches the server, performs the handshake and caches the tool list.
    /// @return ConnectionError if any step fails or times out.
    [[nodiscard]] auto connect() -> VoidResult;

    /// @brief Returns the cached tool list.
    /// @return NotConnected unless connect() succeeded.
    [[nodiscard]] auto listTools() const -> Result<std::vector<ToolDefinition>>;

    /// @brief Invokes a tool by its server-local name.
    /// @return The server's result, or ToolInvocationError wrapping whatever went wrong.
    [[nodiscard]] auto callTool(std::string_view originalName, const nlohmann::json& arguments)
        -> Result<ToolResult>;

    /// @brief Shuts the server down. Idempotent and valid in every state.
    ///
    /// A call that is still waiting for its response is interrupted (the server is killed) and
    /// fails, so close() never waits on an unresponsive server.
    /// @return An error if the server had to be killed; the connection is Closed either way.
    auto close() -> VoidResult;

    [[nodiscard]] auto serverId() const -> const std::string& { return _serverId; }
    [[nodiscard]] auto config() const -> const ToolServerConfig& { return _config; }
    [[nodiscard]] auto liveness() const -> Liveness { return _liveness.load(); }

  private:
    std::string _serverId;
    ToolServerConfig _config;
    TransportFactory _transportFactory;
    ConnectionOptions _options;

    mutable std::mutex _mutex;
    std::unique_ptr<McpClient> _client;
    std::vector<ToolDefinition> _cachedTools;
    std::atomic<Liveness> _liveness = Liveness::Disconnected;

    // The live client's transport, reachable without _mutex so that close() can interrupt a call.
    std::mutex _transportMutex;
    Transport* _transport = nullptr;
    std::atomic<bool> _closing = false;

    [[nodiscard]] auto handshake(McpClient& client) -> Result<std::vector<ToolDefinition>>;
};

} // namespace toolchat

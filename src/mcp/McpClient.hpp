// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
};

/// @brief Client side of a Model Context Protocol session over a Transport.
///
/// Handles the MCP lifecycle: initialize, list tools, call tools. Not thread-safe; callers
/// serialize access (see ToolConnection).
class McpClient
{
  public:
    static constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };

    explicit McpClient(std::unique_ptr<Transport> transport);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the initialize handshake and sends @c notifications/initialized.
    /// @param timeout Maximum time to wait for the server's reply.
    [[nodiscard]] auto initialize(Timeout timeout = InfiniteTimeout) -> Result<McpServerCapabilities>;

    /// @brief Lists all tools of the server, following pagination cursors.
    [[nodiscard]] auto listTools(Timeout timeout = InfiniteTimeout) -> Result<std::vector<ToolDefinition>>;

    /// @brief Calls a tool on the server.
    /// @return The tool's result (which may itself be flagged @c isError), or a transport/protocol error.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                Timeout timeout = InfiniteTimeout) -> Result<ToolResult>;

    /// @brief Closes the underlying transport.
    [[nodiscard]] auto close() -> VoidResult;

    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;
    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    std::unique_ptr<Transport> _transport;
    McpServerCapabilities _capabilities;
    int64_t _nextId = 1;
    bool _initialized = false;

    [[nodiscard]] auto sendRequest(std::string_view method, nlohmann::json params, Timeout timeout)
        -> Result<nlohmann::json>;

    /// @brief Answers a request the server sent while we were waiting: @c ping gets an empty
    /// result, everything else "method not found".
    [[nodiscard]] auto answerServerRequest(const jsonrpc::Response& request) -> VoidResult;
};

/// @brief Flattens the @c content array of a @c tools/call result into text.
[[nodiscard]] auto extractToolText(const nlohmann::json& result) -> std::string;

} // namespace toolchat

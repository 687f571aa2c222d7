// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/ToolConnection.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolchat
{

/// @brief Separator between server id and tool name in a qualified tool name.
inline constexpr auto QualifiedNameSeparator = '_';

/// @brief Builds the catalog name of a tool: @c <serverId>_<toolName>.
[[nodiscard]] auto qualifyToolName(std::string_view serverId, std::string_view toolName) -> std::string;

/// @brief Where a qualified tool name routes to.
struct ToolRoute
{
    std::string serverId;
    std::string originalName;

    auto operator==(const ToolRoute&) const -> bool = default;
};

/// @brief Outcome of connecting one server during connectAll().
struct ConnectReport
{
    std::string serverId;
    VoidResult status;
};

/// @brief One entry of a callTools() batch.
struct ToolInvocation
{
    std::string qualifiedName;
    nlohmann::json arguments;
};

/// @brief Owns all tool server connections and presents them as one namespaced catalog.
///
/// Lifecycle: construct with the server configurations, call connectAll() once, then share the
/// manager between any number of sessions. The catalog and the routing table are built when
/// connectAll() finishes and are read-only afterwards.
class ConnectionManager
{
  public:
    /// @param servers Server id to launch configuration. Ids must not be empty.
    /// @param transportFactory How to open the transport of each server.
    /// @param options Timeouts applied to every connection.
    explicit ConnectionManager(std::map<std::string, ToolServerConfig> servers,
                               TransportFactory transportFactory = makeStdioTransportFactory(),
                               ConnectionOptions options = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Connects every configured server, each independently and in parallel.
    ///
    /// Failures are logged and reported but never abort the pass; only servers that connected
    /// contribute tools. The manager is ready afterwards regardless of how many servers failed.
    /// @return One report per configured server, in server id order.
    auto connectAll() -> std::vector<ConnectReport>;

    /// @brief Returns the namespaced union of all connected servers' tools.
    /// @return NotReady before connectAll().
    [[nodiscard]] auto listAllTools() const -> Result<std::vector<ToolDescriptor>>;

    /// @brief Resolves a qualified name to its server and original tool name.
    /// @return UnknownTool if no connected server provides it.
    [[nodiscard]] auto resolve(std::string_view qualifiedName) const -> Result<ToolRoute>;

    /// @brief Routes a call to the server owning @p qualifiedName.
    /// @return UnknownTool for names not in the catalog, otherwise whatever the connection returns.
    [[nodiscard]] auto callTool(std::string_view qualifiedName, const nlohmann::json& arguments)
        -> Result<ToolResult>;

    /// @brief Executes calls in order; a failing call never prevents the following ones.
    [[nodiscard]] auto callTools(const std::vector<ToolInvocation>& batch) -> std::vector<Result<ToolResult>>;

    /// @brief Closes every connection, continuing past failures.
    /// @return The first close error (with a count of all failures), or success.
    auto closeAll() -> VoidResult;

    [[nodiscard]] auto isReady() const -> bool { return _ready.load(); }
    [[nodiscard]] auto serverCount() const -> size_t { return _connections.size(); }
    [[nodiscard]] auto connectedServerCount() const -> size_t;

    /// @brief Returns the connection of @p serverId, or nullptr if it is not configured.
    [[nodiscard]] auto connection(std::string_view serverId) const -> const ToolConnection*;

  private:
    std::vector<std::unique_ptr<ToolConnection>> _connections;
    std::vector<ToolDescriptor> _catalog;
    std::map<std::string, std::pair<ToolConnection*, std::string>, std::less<>> _routes;
    std::atomic<bool> _ready = false;

    void buildCatalog();
};

} // namespace toolchat

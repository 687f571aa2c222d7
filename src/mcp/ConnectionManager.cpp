// SPDX-License-Identifier: Apache-2.0
#include "ConnectionManager.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace toolchat
{

auto qualifyToolName(std::string_view serverId, std::string_view toolName) -> std::string
{
    return std::format("{}{}{}", serverId, QualifiedNameSeparator, toolName);
}

ConnectionManager::ConnectionManager(std::map<std::string, ToolServerConfig> servers,
                                     TransportFactory transportFactory,
                                     ConnectionOptions options)
{
    _connections.reserve(servers.size());
    for (auto& [serverId, config]: servers)
    {
        if (serverId.empty())
        {
            log::error("Ignoring tool server with an empty id ({})", config.command);
            continue;
        }
        _connections.push_back(
            std::make_unique<ToolConnection>(serverId, std::move(config), transportFactory, options));
    }
}

ConnectionManager::~ConnectionManager()
{
    if (auto closed = closeAll(); !closed)
        log::warning("{}", closed.error().message);
}

auto ConnectionManager::connectAll() -> std::vector<ConnectReport>
{
    auto reports = std::vector<ConnectReport>(_connections.size());

    if (_ready)
    {
        log::warning("connectAll() called twice; keeping the existing catalog");
        for (auto i = size_t { 0 }; i < _connections.size(); ++i)
        {
            auto const& conn = *_connections[i];
            reports[i].serverId = conn.serverId();
            if (conn.liveness() != Liveness::Connected)
                reports[i].status = makeError(ErrorCode::ConnectionError,
                                              std::format("Server '{}' is {}", conn.serverId(),
                                                          livenessToString(conn.liveness())));
        }
        return reports;
    }

    {
        // One worker per server; a slow or hanging server delays only the join, not its peers.
        auto workers = std::vector<std::jthread> {};
        workers.reserve(_connections.size());
        for (auto i = size_t { 0 }; i < _connections.size(); ++i)
        {
            workers.emplace_back([this, i, &reports] {
                reports[i] = ConnectReport {
                    .serverId = _connections[i]->serverId(),
                    .status = _connections[i]->connect(),
                };
            });
        }
    }

    for (const auto& report: reports)
    {
        if (!report.status)
            log::warning("Tool server '{}' unavailable: {}", report.serverId, report.status.error().message);
    }

    buildCatalog();
    _ready = true;

    log::info("{} of {} tool server(s) connected, {} tool(s) available",
              connectedServerCount(),
              _connections.size(),
              _catalog.size());
    return reports;
}

void ConnectionManager::buildCatalog()
{
    _catalog.clear();
    _routes.clear();

    for (const auto& conn: _connections)
    {
        auto tools = conn->listTools();
        if (!tools)
            continue;

        for (auto& tool: *tools)
        {
            auto qualifiedName = qualifyToolName(conn->serverId(), tool.name);
            if (_routes.contains(qualifiedName))
            {
                // Only possible when server ids themselves contain the separator.
                log::warning("Tool name '{}' from server '{}' collides with an existing tool; skipped",
                             qualifiedName,
                             conn->serverId());
                continue;
            }

            log::debug("  Tool registered: {}", qualifiedName);
            _routes.emplace(qualifiedName, std::pair { conn.get(), tool.name });
            _catalog.push_back(ToolDescriptor {
                .qualifiedName = std::move(qualifiedName),
                .description = std::move(tool.description),
                .inputSchema = std::move(tool.inputSchema),
            });
        }
    }
}

auto ConnectionManager::listAllTools() const -> Result<std::vector<ToolDescriptor>>
{
    if (!_ready)
        return makeError(ErrorCode::NotReady, "Tool catalog requested before connectAll()");
    return _catalog;
}

auto ConnectionManager::resolve(std::string_view qualifiedName) const -> Result<ToolRoute>
{
    if (!_ready)
        return makeError(ErrorCode::NotReady, "Tool lookup before connectAll()");

    auto const it = _routes.find(qualifiedName);
    if (it == _routes.end())
        return makeError(ErrorCode::UnknownTool, std::format("Unknown tool: {}", qualifiedName));

    return ToolRoute {
        .serverId = it->second.first->serverId(),
        .originalName = it->second.second,
    };
}

auto ConnectionManager::callTool(std::string_view qualifiedName, const nlohmann::json& arguments)
    -> Result<ToolResult>
{
    if (!_ready)
        return makeError(ErrorCode::NotReady, "Tool call before connectAll()");

    auto const it = _routes.find(qualifiedName);
    if (it == _routes.end())
        return makeError(ErrorCode::UnknownTool, std::format("Unknown tool: {}", qualifiedName));

    auto& [connection, originalName] = it->second;
    return connection->callTool(originalName, arguments);
}

auto ConnectionManager::callTools(const std::vector<ToolInvocation>& batch) -> std::vector<Result<ToolResult>>
{
    auto results = std::vector<Result<ToolResult>> {};
    results.reserve(batch.size());
    for (const auto& invocation: batch)
        results.push_back(callTool(invocation.qualifiedName, invocation.arguments));
    return results;
}

auto ConnectionManager::closeAll() -> VoidResult
{
    auto failures = std::vector<Error> {};
    for (auto& conn: _connections)
    {
        if (auto closed = conn->close(); !closed)
            failures.push_back(closed.error());
    }

    if (failures.empty())
        return {};

    return makeError(ErrorCode::ConnectionError,
                     std::format("{} of {} connection(s) did not close cleanly; first: {}",
                                 failures.size(),
                                 _connections.size(),
                                 failures.front().message));
}

auto ConnectionManager::connectedServerCount() const -> size_t
{
    return static_cast<size_t>(std::ranges::count_if(
        _connections, [](const auto& conn) { return conn->liveness() == Liveness::Connected; }));
}

auto ConnectionManager::connection(std::string_view serverId) const -> const ToolConnection*
{
    auto const it = std::ranges::find_if(_connections, [&](const auto& conn) { return conn->serverId() == serverId; });
    return it == _connections.end() ? nullptr : it->get();
}

} // namespace toolchat

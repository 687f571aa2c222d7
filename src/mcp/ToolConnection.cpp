// SPDX-License-Identifier: Apache-2.0
#include "ToolConnection.hpp"

#include <core/Log.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace toolchat
{

auto makeStdioTransportFactory() -> TransportFactory
{
    return [](std::string_view serverId, const ToolServerConfig& config) -> Result<std::unique_ptr<Transport>> {
        auto transport = std::make_unique<StdioTransport>();
        auto started = transport->start(StdioTransportConfig {
            .command = config.command,
            .args = config.args,
            .env = config.env,
        });
        if (!started)
            return wrapError(ErrorCode::TransportError, std::format("Cannot start '{}'", serverId), started.error());
        return std::unique_ptr<Transport>(std::move(transport));
    };
}

ToolConnection::ToolConnection(std::string serverId,
                               ToolServerConfig config,
                               TransportFactory transportFactory,
                               ConnectionOptions options):
    _serverId(std::move(serverId)),
    _config(std::move(config)),
    _transportFactory(std::move(transportFactory)),
    _options(options)
{
}

ToolConnection::~ToolConnection()
{
    if (auto closed = close(); !closed)
        log::warning("{}", closed.error().message);
}

auto ToolConnection::connect() -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);

    if (_liveness == Liveness::Connected)
        return {};
    if (_liveness == Liveness::Closed)
        return makeError(ErrorCode::ConnectionError, std::format("Connection '{}' is closed", _serverId));

    log::info("Connecting to tool server '{}' ({})", _serverId, _config.command);

    auto transport = _transportFactory(_serverId, _config);
    if (!transport)
    {
        _liveness = Liveness::Failed;
        return wrapError(ErrorCode::ConnectionError, std::format("Server '{}'", _serverId), transport.error());
    }

    // The client owns the transport from here on; destroying it on any failure path below
    // shuts the server process down.
    auto* const rawTransport = transport->get();
    auto client = std::make_unique<McpClient>(std::move(*transport));

    auto tools = handshake(*client);
    if (!tools)
    {
        _liveness = Liveness::Failed;
        if (auto closed = client->close(); !closed)
            log::debug("{}", closed.error().message);
        return wrapError(ErrorCode::ConnectionError, std::format("Server '{}'", _serverId), tools.error());
    }

    _client = std::move(client);
    {
        auto const guard = std::lock_guard(_transportMutex);
        _transport = rawTransport;
    }
    _cachedTools = std::move(*tools);
    _liveness = Liveness::Connected;

    log::info("Tool server '{}' connected with {} tool(s)", _serverId, _cachedTools.size());
    return {};
}

auto ToolConnection::handshake(McpClient& client) -> Result<std::vector<ToolDefinition>>
{
    auto capabilities = client.initialize(_options.handshakeTimeout);
    if (!capabilities)
        return std::unexpected(capabilities.error());

    if (!capabilities->hasTools)
        log::debug("Server '{}' does not advertise the tools capability", _serverId);

    return client.listTools(_options.handshakeTimeout);
}

auto ToolConnection::listTools() const -> Result<std::vector<ToolDefinition>>
{
    if (_liveness != Liveness::Connected)
        return makeError(ErrorCode::NotConnected,
                         std::format("Server '{}' is {}", _serverId, livenessToString(_liveness)));

    auto const lock = std::lock_guard(_mutex);
    return _cachedTools;
}

auto ToolConnection::callTool(std::string_view originalName, const nlohmann::json& arguments)
    -> Result<ToolResult>
{
    if (!arguments.is_object())
        return makeError(ErrorCode::ToolInvocationError,
                         std::format("Arguments for '{}' must be a JSON object, got {}", originalName,
                                     arguments.type_name()));

    auto const lock = std::lock_guard(_mutex);

    if (_closing)
        return makeError(ErrorCode::ToolInvocationError,
                         std::format("Cannot call '{}': server '{}' is closing", originalName, _serverId));
    if (_liveness != Liveness::Connected || !_client)
        return makeError(ErrorCode::ToolInvocationError,
                         std::format("Cannot call '{}': server '{}' is {}", originalName, _serverId,
                                     livenessToString(_liveness)));

    log::debug("Calling '{}' on server '{}'", originalName, _serverId);

    auto result = _client->callTool(originalName, arguments, _options.callTimeout);
    if (!result)
    {
        // A transport failure leaves the session in an unknown state; stop routing to it.
        if (result.error().code == ErrorCode::TransportError || result.error().code == ErrorCode::TimeoutError)
        {
            log::error("Server '{}' failed during '{}': {}", _serverId, originalName, result.error().message);
            _liveness = Liveness::Failed;
        }
        return wrapError(ErrorCode::ToolInvocationError,
                         std::format("Tool '{}' on server '{}'", originalName, _serverId), result.error());
    }

    if (result->isError)
        return makeError(ErrorCode::ToolInvocationError,
                         result->content.empty() ? std::format("Tool '{}' reported an error", originalName)
                                                 : result->content);

    return result;
}

auto ToolConnection::close() -> VoidResult
{
    _closing = true;
    auto lock = std::unique_lock(_mutex, std::try_to_lock);
    if (!lock.owns_lock())
    {
        // A call (or the handshake) is running. The handshake has its own timeout; a call may not.
        {
            auto const guard = std::lock_guard(_transportMutex);
            if (_transport)
            {
                log::warning("Closing '{}' while a tool call is in flight; interrupting it", _serverId);
                _transport->interrupt();
            }
        }
        lock.lock();
    }

    auto const previous = _liveness.exchange(Liveness::Closed);
    if (previous == Liveness::Closed || !_client)
        return {};

    {
        auto const guard = std::lock_guard(_transportMutex);
        _transport = nullptr;
    }
    auto client = std::move(_client);
    auto closed = client->close();
    log::debug("Tool server '{}' closed", _serverId);

    if (!closed)
        return wrapError(ErrorCode::ConnectionError, std::format("Closing '{}'", _serverId), closed.error());
    return {};
}

} // namespace toolchat

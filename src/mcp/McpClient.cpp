// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <chrono>
#include <format>

namespace toolchat
{

namespace
{
    constexpr auto MaxToolPages = 64;

    auto remainingTime(std::chrono::steady_clock::time_point deadline, Timeout timeout) -> Timeout
    {
        if (timeout.count() < 0)
            return InfiniteTimeout;
        auto const left = std::chrono::duration_cast<Timeout>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : Timeout { 0 };
    }
} // namespace

McpClient::McpClient(std::unique_ptr<Transport> transport): _transport(std::move(transport))
{
}

McpClient::~McpClient() = default;

auto McpClient::initialize(Timeout timeout) -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", std::string(ProtocolVersion) },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "toolchat" },
              { "version", "0.1.0" },
          } },
    };

    return sendRequest("initialize", std::move(params), timeout)
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            auto const serverInfo = result.contains("serverInfo") ? result["serverInfo"] : nlohmann::json::object();
            _capabilities.serverName = json::getStringOr(serverInfo, "name", "unknown");
            _capabilities.serverVersion = json::getStringOr(serverInfo, "version", "unknown");
            _capabilities.protocolVersion = json::getStringOr(result, "protocolVersion", "");

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
            }

            return _transport->send(jsonrpc::makeNotification("notifications/initialized"))
                .transform([this]() {
                    _initialized = true;
                    log::debug("MCP server initialized: {} v{} (protocol {})",
                               _capabilities.serverName,
                               _capabilities.serverVersion,
                               _capabilities.protocolVersion);
                    return _capabilities;
                });
        });
}

auto McpClient::listTools(Timeout timeout) -> Result<std::vector<ToolDefinition>>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto tools = std::vector<ToolDefinition> {};
    auto cursor = std::string {};

    for (auto page = 0; page < MaxToolPages; ++page)
    {
        auto params = cursor.empty() ? nlohmann::json {} : nlohmann::json { { "cursor", cursor } };
        auto result = sendRequest("tools/list", std::move(params), timeout);
        if (!result)
            return std::unexpected(result.error());

        if (result->contains("tools") && (*result)["tools"].is_array())
        {
            for (const auto& toolJson: (*result)["tools"])
            {
                auto name = json::getStringOr(toolJson, "name", "");
                if (name.empty())
                {
                    log::warning("Ignoring unnamed tool advertised by '{}'", _capabilities.serverName);
                    continue;
                }
                tools.push_back(ToolDefinition {
                    .name = std::move(name),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
                });
            }
        }

        cursor = json::getStringOr(*result, "nextCursor", "");
        if (cursor.empty())
            return tools;
    }

    return makeError(ErrorCode::ProtocolError,
                     std::format("Server '{}' returned more than {} pages of tools", _capabilities.serverName,
                                 MaxToolPages));
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments, Timeout timeout)
    -> Result<ToolResult>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments },
    };

    return sendRequest("tools/call", std::move(params), timeout)
        .transform([name](const nlohmann::json& result) {
            auto toolResult = ToolResult {
                .content = extractToolText(result),
                .raw = result,
                .isError = json::getBoolOr(result, "isError", false),
            };
            log::debug("Tool '{}' returned {} bytes (isError: {})", name, toolResult.content.size(),
                       toolResult.isError);
            return toolResult;
        });
}

auto McpClient::close() -> VoidResult
{
    _initialized = false;
    return _transport->close();
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto McpClient::sendRequest(std::string_view method, nlohmann::json params, Timeout timeout)
    -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    auto sent = _transport->send(jsonrpc::makeRequest(id, method, std::move(params)));
    if (!sent)
        return std::unexpected(sent.error());

    // Skip server-initiated notifications and stale replies until our response arrives.
    while (true)
    {
        auto message = _transport->receive(remainingTime(deadline, timeout));
        if (!message)
            return std::unexpected(message.error());

        auto response = jsonrpc::parseResponse(*message);
        if (!response)
            return std::unexpected(response.error());

        if (response->isServerRequest())
        {
            if (auto answered = answerServerRequest(*response); !answered)
                return std::unexpected(answered.error());
            continue;
        }
        if (response->isServerMessage())
        {
            log::trace("Ignoring server message '{}' while waiting for '{}'", *response->method, method);
            continue;
        }
        if (!jsonrpc::matchesId(*response, id))
        {
            log::debug("Discarding response with unexpected id {} (waiting for {})", response->id.dump(), id);
            continue;
        }

        if (response->error)
            return makeError(ErrorCode::ProtocolError,
                             std::format("RPC error {} in '{}': {}", response->error->code, method,
                                         response->error->message));
        return response->result.value_or(nlohmann::json::object());
    }
}

auto McpClient::answerServerRequest(const jsonrpc::Response& request) -> VoidResult
{
    if (*request.method == "ping")
    {
        log::trace("Answering server ping {}", request.id.dump());
        return _transport->send(jsonrpc::makeResult(request.id, nlohmann::json::object()));
    }

    log::debug("Rejecting server request '{}'", *request.method);
    return _transport->send(jsonrpc::makeErrorResponse(
        request.id, jsonrpc::MethodNotFound, std::format("Method not found: {}", *request.method)));
}

auto extractToolText(const nlohmann::json& result) -> std::string
{
    auto text = std::string {};
    if (!result.contains("content") || !result["content"].is_array())
        return text;

    for (const auto& item: result["content"])
    {
        auto const type = json::getStringOr(item, "type", "");
        auto piece = std::string {};
        if (type == "text")
            piece = json::getStringOr(item, "text", "");
        else if (type == "resource" && item.contains("resource"))
            piece = json::getStringOr(item["resource"], "text", "");
        else if (!type.empty())
            piece = std::format("[{} content]", type);

        if (piece.empty())
            continue;
        if (!text.empty())
            text += "\n";
        text += piece;
    }
    return text;
}

} // namespace toolchat

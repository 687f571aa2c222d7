// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolchat::jsonrpc
{

namespace
{
    auto makeMessage(std::string_view method, nlohmann::json params) -> nlohmann::json
    {
        auto msg = nlohmann::json {
            { "jsonrpc", "2.0" },
            { "method", method },
        };
        if (!params.is_null())
            msg["params"] = std::move(params);
        return msg;
    }
} // namespace

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = makeMessage(method, std::move(params));
    msg["id"] = id;
    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return makeMessage(method, std::move(params));
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json { { "jsonrpc", "2.0" }, { "id", id }, { "result", std::move(result) } };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", std::string(message) } } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || json::getStringOr(message, "jsonrpc", "") != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }
    else if (message.contains("method") && message["method"].is_string())
    {
        response.method = message["method"].get<std::string>();
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto matchesId(const Response& response, int64_t id) -> bool
{
    if (response.isServerMessage())
        return false;
    if (response.id.is_number_integer())
        return response.id.get<int64_t>() == id;
    // Some servers echo ids back as strings.
    if (response.id.is_string())
        return response.id.get<std::string>() == std::to_string(id);
    return false;
}

} // namespace toolchat::jsonrpc

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace toolchat::jsonrpc
{

/// @brief A JSON-RPC 2.0 error object.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief A parsed JSON-RPC 2.0 message received from a server.
///
/// Exactly one of @c result, @c error or @c method is set; @c method marks a server-initiated
/// notification or request.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
    std::optional<std::string> method;

    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
    [[nodiscard]] auto isServerMessage() const -> bool { return method.has_value(); }

    /// @brief A server message that carries an id and therefore expects an answer.
    [[nodiscard]] auto isServerRequest() const -> bool { return method.has_value() && !id.is_null(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Standard error code for a method the receiver does not implement.
inline constexpr auto MethodNotFound = -32601;

/// @brief Builds the successful answer to a request the server sent us.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds the error answer to a request the server sent us.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 message.
/// @return The parsed message, or a ProtocolError if it is not valid JSON-RPC 2.0.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Returns true if @p response answers the request with the given id.
[[nodiscard]] auto matchesId(const Response& response, int64_t id) -> bool;

} // namespace toolchat::jsonrpc

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief The role of a message participant in a chat conversation.
enum class Role
{
    System,
    User,
    Assistant,
    Tool,
};

/// @brief Converts a Role enum to its string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "system")
        return Role::System;
    if (str == "assistant")
        return Role::Assistant;
    if (str == "tool")
        return Role::Tool;
    return Role::User;
}

/// @brief A tool invocation requested by the model, as assembled from the fragment stream.
///
/// @c argumentText is kept verbatim (the concatenation of all argument fragments); it is only
/// parsed as JSON when the call is executed.
struct ToolCallRecord
{
    std::string id;
    std::string qualifiedName;
    std::string argumentText;
};

/// @brief A tool as advertised by a server. @c name is the server-local name.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A tool in the global catalog, named @c <serverId>_<originalName>.
struct ToolDescriptor
{
    std::string qualifiedName;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief The payload returned by a tool server for one call.
struct ToolResult
{
    std::string content;
    nlohmann::json raw;
    bool isError = false;
};

/// @brief A single message in a chat conversation.
struct ChatMessage
{
    Role role = Role::User;
    std::string content;
    std::vector<ToolCallRecord> toolCalls;
    std::string toolCallId; // For Role::Tool messages
};

} // namespace toolchat

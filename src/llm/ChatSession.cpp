// SPDX-License-Identifier: Apache-2.0
#include "ChatSession.hpp"

#include <utility>

namespace toolchat
{

ChatSession::ChatSession(std::string systemPrompt)
{
    if (!systemPrompt.empty())
    {
        append(Role::System, std::move(systemPrompt), {}, {});
        _conversationStart = 1;
    }
}

void ChatSession::append(Role role, std::string content, std::vector<ToolCallRecord> toolCalls, std::string toolCallId)
{
    _messages.push_back(ChatMessage {
        .role = role,
        .content = std::move(content),
        .toolCalls = std::move(toolCalls),
        .toolCallId = std::move(toolCallId),
    });
}

void ChatSession::addUserMessage(std::string content)
{
    append(Role::User, std::move(content), {}, {});
}

void ChatSession::addAssistantMessage(std::string content, std::vector<ToolCallRecord> toolCalls)
{
    append(Role::Assistant, std::move(content), std::move(toolCalls), {});
}

void ChatSession::addToolResult(std::string callId, std::string content)
{
    append(Role::Tool, std::move(content), {}, std::move(callId));
}

auto ChatSession::messages() const -> const std::vector<ChatMessage>&
{
    return _messages;
}

auto ChatSession::conversation() const -> std::span<const ChatMessage>
{
    return std::span<const ChatMessage> { _messages }.subspan(_conversationStart);
}

void ChatSession::restore(std::vector<ChatMessage> messages)
{
    clear();
    _messages.reserve(_conversationStart + messages.size());
    for (auto& message: messages)
        if (message.role != Role::System)
            _messages.push_back(std::move(message));
}

void ChatSession::clear()
{
    _messages.resize(_conversationStart);
}

auto ChatSession::messageCount() const -> size_t
{
    return _messages.size() - _conversationStart;
}

} // namespace toolchat

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <span>
#include <string>
#include <vector>

namespace toolchat
{

/// @brief The ordered message history of one conversation.
///
/// A non-empty system prompt is fixed at construction and stays the first message. Apart from
/// clear() and restore(), the history is append-only.
class ChatSession
{
  public:
    explicit ChatSession(std::string systemPrompt = "");

    void addUserMessage(std::string content);

    /// @brief Appends an assistant message, optionally carrying the tool calls it requested.
    void addAssistantMessage(std::string content, std::vector<ToolCallRecord> toolCalls = {});

    /// @brief Appends the result (or error text) of the tool call @p callId.
    void addToolResult(std::string callId, std::string content);

    /// @brief Returns all messages, including the system prompt.
    [[nodiscard]] auto messages() const -> const std::vector<ChatMessage>&;

    /// @brief Returns the messages after the system prompt.
    [[nodiscard]] auto conversation() const -> std::span<const ChatMessage>;

    /// @brief Replaces the conversation with @p messages, keeping the current system prompt.
    ///
    /// System messages in @p messages are dropped.
    void restore(std::vector<ChatMessage> messages);

    /// @brief Clears all messages except the system prompt.
    void clear();

    /// @brief Returns the number of messages (excluding system prompt).
    [[nodiscard]] auto messageCount() const -> size_t;

  private:
    void append(Role role, std::string content, std::vector<ToolCallRecord> toolCalls, std::string toolCallId);

    std::vector<ChatMessage> _messages;
    size_t _conversationStart = 0; ///< 1 when _messages[0] is the system prompt.
};

} // namespace toolchat

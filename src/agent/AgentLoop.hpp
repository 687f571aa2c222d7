// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/TurnEvent.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/ChatSession.hpp>
#include <llm/Fragment.hpp>
#include <mcp/ConnectionManager.hpp>

#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief What to do with a tool call whose argument text is empty.
enum class EmptyArgumentsPolicy
{
    EmptyObject, ///< Send @c {} to the tool.
    Reject,      ///< Fail the call; the model sees an error tool message.
};

[[nodiscard]] auto emptyArgumentsPolicyFromString(std::string_view name) -> std::optional<EmptyArgumentsPolicy>;

/// @brief Configuration for the agent loop.
struct AgentConfig
{
    int maxTurns = 10; // model turns per user message; 0 means unbounded
    EmptyArgumentsPolicy emptyArguments = EmptyArgumentsPolicy::EmptyObject;
};

/// @brief Drives model turns and tool execution until the model answers without calling tools.
///
/// Each iteration streams one model turn. Text is forwarded to the sink as it arrives; tool calls
/// are collected, then executed one after another in the order they were requested. Every call
/// produces exactly one tool message in the history, whether it succeeded or not, and the loop
/// repeats with the extended history.
///
/// Tool failures never abort the loop. Backend and stream failures, the turn limit and
/// cancellation do: the sink receives an events::Error and the error is returned. The history is
/// left consistent in all of these cases, so the conversation can go on.
class AgentLoop
{
  public:
    AgentLoop(ModelBackend& backend, ConnectionManager& tools, ChatSession& session, AgentConfig config);

    /// @brief Appends @p userMessage and runs the turn sequence with the manager's catalog.
    /// @return The final assistant text or an error.
    [[nodiscard]] auto processMessage(std::string_view userMessage,
                                      const EventSink& sink,
                                      std::stop_token stopToken = {}) -> Result<std::string>;

    /// @brief Runs the turn sequence on the current history.
    /// @return The final assistant text or an error.
    [[nodiscard]] auto runTurn(std::span<const ToolDescriptor> catalog,
                               const EventSink& sink,
                               std::stop_token stopToken = {}) -> Result<std::string>;

    [[nodiscard]] auto config() const -> const AgentConfig&;

  private:
    struct AssistantTurn
    {
        std::string text;
        std::vector<ToolCallRecord> calls;
    };

    ModelBackend& _backend;
    ConnectionManager& _tools;
    ChatSession& _session;
    AgentConfig _config;

    [[nodiscard]] auto streamAssistantTurn(std::span<const ToolDescriptor> catalog,
                                           const EventSink& sink,
                                           std::stop_token stopToken) -> Result<AssistantTurn>;

    /// @brief Executes one call and returns the content of its tool message.
    [[nodiscard]] auto executeToolCall(const ToolCallRecord& call) -> std::string;

    [[nodiscard]] auto resolveArguments(const ToolCallRecord& call) const -> Result<nlohmann::json>;
};

} // namespace toolchat

// SPDX-License-Identifier: Apache-2.0
#include "AgentLoop.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <llm/StreamDecoder.hpp>

#include <format>
#include <utility>

namespace toolchat
{

namespace
{
    auto isBlank(std::string_view text) -> bool
    {
        return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
    }

    auto cancelled() -> std::unexpected<Error>
    {
        return makeError(ErrorCode::Cancelled, "Turn cancelled");
    }

    /// @brief Reports @p error to the sink as the terminal event and hands it back.
    auto abortTurn(const EventSink& sink, Error error) -> std::unexpected<Error>
    {
        log::error("Turn aborted: {}", error);
        sink(events::Error { .message = error.message });
        return std::unexpected(std::move(error));
    }
} // namespace

auto emptyArgumentsPolicyFromString(std::string_view name) -> std::optional<EmptyArgumentsPolicy>
{
    if (name == "empty-object")
        return EmptyArgumentsPolicy::EmptyObject;
    if (name == "reject")
        return EmptyArgumentsPolicy::Reject;
    return std::nullopt;
}

AgentLoop::AgentLoop(ModelBackend& backend, ConnectionManager& tools, ChatSession& session, AgentConfig config):
    _backend(backend), _tools(tools), _session(session), _config(config)
{
}

auto AgentLoop::processMessage(std::string_view userMessage, const EventSink& sink, std::stop_token stopToken)
    -> Result<std::string>
{
    auto catalog = _tools.listAllTools();
    if (!catalog)
        return abortTurn(sink, catalog.error());

    _session.addUserMessage(std::string(userMessage));
    return runTurn(*catalog, sink, std::move(stopToken));
}

auto AgentLoop::runTurn(std::span<const ToolDescriptor> catalog, const EventSink& sink, std::stop_token stopToken)
    -> Result<std::string>
{
    for (auto turn = 1;; ++turn)
    {
        if (_config.maxTurns > 0 && turn > _config.maxTurns)
        {
            return abortTurn(sink,
                             Error { ErrorCode::TurnLimitExceeded,
                                     std::format("Model kept calling tools after {} turns", _config.maxTurns) });
        }

        if (stopToken.stop_requested())
            return abortTurn(sink, cancelled().error());

        log::debug("Model turn {} ({} tools available)", turn, catalog.size());

        auto assistant = streamAssistantTurn(catalog, sink, stopToken);
        if (!assistant)
            return abortTurn(sink, std::move(assistant.error()));

        if (assistant->calls.empty())
        {
            _session.addAssistantMessage(assistant->text);
            sink(events::Done {});
            return std::move(assistant->text);
        }

        log::info("Model requested {} tool call(s)", assistant->calls.size());
        _session.addAssistantMessage(assistant->text, assistant->calls);

        for (const auto& call: assistant->calls)
        {
            // Every requested call needs a tool message, even when the rest of the batch is skipped.
            if (stopToken.stop_requested())
            {
                _session.addToolResult(call.id, "Error: cancelled before execution");
                continue;
            }

            sink(events::ToolCallStarted { .name = call.qualifiedName, .arguments = call.argumentText });
            auto content = executeToolCall(call);
            _session.addToolResult(call.id, content);
            sink(events::ToolResult { .name = call.qualifiedName, .content = std::move(content) });
        }

        if (stopToken.stop_requested())
            return abortTurn(sink, cancelled().error());
    }
}

auto AgentLoop::config() const -> const AgentConfig&
{
    return _config;
}

auto AgentLoop::streamAssistantTurn(std::span<const ToolDescriptor> catalog,
                                    const EventSink& sink,
                                    std::stop_token stopToken) -> Result<AssistantTurn>
{
    auto stream = _backend.streamTurn(_session.messages(), catalog);
    if (!stream)
        return std::unexpected(stream.error());

    auto decoder = StreamDecoder { **stream };
    auto turn = AssistantTurn {};

    while (true)
    {
        if (stopToken.stop_requested())
        {
            // Keep what the user has already seen.
            if (!turn.text.empty())
                _session.addAssistantMessage(std::move(turn.text));
            return cancelled();
        }

        auto event = decoder.next();
        if (!event)
            return std::unexpected(event.error());
        if (!event->has_value())
            break;

        if (auto* text = std::get_if<TextFragment>(&**event))
        {
            turn.text += text->text;
            sink(*text);
        }
        else if (auto* request = std::get_if<ToolCallRequest>(&**event))
        {
            log::debug("Tool call requested: {} {}", request->record.qualifiedName, request->record.argumentText);
            turn.calls.push_back(std::move(request->record));
        }
    }

    return turn;
}

auto AgentLoop::executeToolCall(const ToolCallRecord& call) -> std::string
{
    auto arguments = resolveArguments(call);
    if (!arguments)
    {
        log::warning("Tool call {} ({}) rejected: {}", call.id, call.qualifiedName, arguments.error());
        return std::format("Error: {}", arguments.error().message);
    }

    log::info("Executing tool: {} (id: {})", call.qualifiedName, call.id);
    auto result = _tools.callTool(call.qualifiedName, *arguments);
    if (!result)
    {
        log::warning("Tool call {} ({}) failed: {}", call.id, call.qualifiedName, result.error());
        return std::format("Error: {}", result.error().message);
    }
    return std::move(result->content);
}

auto AgentLoop::resolveArguments(const ToolCallRecord& call) const -> Result<nlohmann::json>
{
    if (isBlank(call.argumentText))
    {
        if (_config.emptyArguments == EmptyArgumentsPolicy::Reject)
            return makeError(ErrorCode::ToolInvocationError,
                             std::format("Tool call '{}' has no arguments", call.qualifiedName));
        return nlohmann::json::object();
    }

    auto parsed = json::parse(call.argumentText, ErrorCode::InvalidArgument);
    if (!parsed)
        return wrapError(ErrorCode::InvalidArgument,
                         std::format("Invalid arguments for '{}'", call.qualifiedName),
                         parsed.error());
    return parsed;
}

} // namespace toolchat

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/StreamDecoder.hpp>

#include <functional>
#include <string>
#include <variant>

namespace toolchat
{

namespace events
{
    /// @brief Assistant text, forwarded as soon as the model produced it.
    using TextFragment = toolchat::TextFragment;

    /// @brief A tool call is about to be executed. @c arguments is the raw argument text.
    struct ToolCallStarted
    {
        std::string name;
        std::string arguments;
    };

    /// @brief A tool call finished; @c content is what was appended to the history.
    struct ToolResult
    {
        std::string name;
        std::string content;
    };

    /// @brief The turn sequence was aborted. Always the last event.
    struct Error
    {
        std::string message;
    };

    /// @brief The assistant produced its final answer. Always the last event.
    struct Done
    {
    };
} // namespace events

using TurnEvent = std::variant<events::TextFragment,
                               events::ToolCallStarted,
                               events::ToolResult,
                               events::Error,
                               events::Done>;

/// @brief Receives the events of a turn sequence, in order, on the calling thread.
using EventSink = std::function<void(const TurnEvent&)>;

} // namespace toolchat

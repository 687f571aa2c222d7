// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/Fragment.hpp>

#include <optional>
#include <string>
#include <variant>

namespace toolchat
{

/// @brief Text to forward to the user as soon as it arrives.
struct TextFragment
{
    std::string text;
};

/// @brief A fully assembled tool call.
struct ToolCallRequest
{
    ToolCallRecord record;
};

using DecodedEvent = std::variant<TextFragment, ToolCallRequest>;

/// @brief Turns the fragment stream of one model turn into text and complete tool calls.
///
/// The protocol has no end-of-call marker: a call is complete when the next call id arrives or
/// the stream ends. The decoder therefore keeps exactly one open call slot.
///
/// Single use: construct one decoder per turn and pull events with next() until it yields
/// std::nullopt.
class StreamDecoder
{
  public:
    explicit StreamDecoder(FragmentStream& stream);

    /// @brief Returns the next event.
    /// @return An event, std::nullopt once the turn is over, or an error (MalformedStream or a
    ///         backend error) after which the decoder is finished.
    [[nodiscard]] auto next() -> Result<std::optional<DecodedEvent>>;

    /// @brief Returns true once the stream has been fully consumed or failed.
    [[nodiscard]] auto finished() const -> bool { return _state == State::Finished; }

  private:
    enum class State
    {
        Idle,     ///< No call open.
        InCall,   ///< A call id was seen; name and arguments accumulate into _open.
        Finished, ///< End of stream reached (or an error occurred).
    };

    FragmentStream& _stream;
    State _state = State::Idle;
    ToolCallRecord _open;
    bool _openHasName = false;

    [[nodiscard]] auto finalizeOpenCall() -> std::optional<DecodedEvent>;
    [[nodiscard]] auto fail(std::string message) -> Result<std::optional<DecodedEvent>>;
};

} // namespace toolchat

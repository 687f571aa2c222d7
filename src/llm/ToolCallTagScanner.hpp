// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/Fragment.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief Splits generated text into fragments, recognizing
/// @c <tool_call>{"name": ..., "arguments": ...}</tool_call> spans.
///
/// Text outside the tags is passed through as soon as it cannot be the beginning of an opening
/// tag. Each complete tag becomes a CallId, Name and ArgsDelta fragment; call ids are
/// @c <prefix>_0, @c <prefix>_1, ... per scanner. Malformed tag bodies are dropped with a warning.
class ToolCallTagScanner
{
  public:
    static constexpr auto OpenTag = std::string_view { "<tool_call>" };
    static constexpr auto CloseTag = std::string_view { "</tool_call>" };

    explicit ToolCallTagScanner(std::string idPrefix = "call");

    /// @brief Returns a prefix of the form @c call_<8 hex digits>.
    ///
    /// Stored histories outlive the process, so the ids of one turn must not repeat those of
    /// earlier turns, including turns from a previous run.
    [[nodiscard]] static auto randomIdPrefix() -> std::string;

    /// @brief Consumes a piece of generated text.
    /// @return The fragments that became complete.
    [[nodiscard]] auto feed(std::string_view piece) -> std::vector<Fragment>;

    /// @brief Flushes held-back text at the end of generation.
    ///
    /// An unterminated tag whose body is valid JSON is still treated as a call.
    [[nodiscard]] auto finish() -> std::vector<Fragment>;

    [[nodiscard]] auto callCount() const -> int { return _callCount; }

  private:
    std::string _idPrefix;
    std::string _buffer;
    bool _insideTag = false;
    int _callCount = 0;

    void emitCall(std::string_view body, std::vector<Fragment>& out);
};

} // namespace toolchat

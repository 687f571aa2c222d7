// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <variant>

namespace toolchat
{

/// @brief Text the model produced for the user.
struct ContentFragment
{
    std::string text;
};

/// @brief Marks the start of a new tool call.
struct CallIdFragment
{
    std::string id;
};

/// @brief The (qualified) name of the tool call most recently opened.
struct NameFragment
{
    std::string name;
};

/// @brief A piece of the JSON argument text of the open tool call.
struct ArgsDeltaFragment
{
    std::string text;
};

/// @brief One incremental unit of a model turn.
using Fragment = std::variant<ContentFragment, CallIdFragment, NameFragment, ArgsDeltaFragment>;

/// @brief The fragments of one model turn, delivered in order.
class FragmentStream
{
  public:
    virtual ~FragmentStream() = default;

    /// @brief Blocks until the next fragment is available.
    /// @return The next fragment, std::nullopt at the end of the turn, or a backend error.
    [[nodiscard]] virtual auto next() -> Result<std::optional<Fragment>> = 0;
};

/// @brief A language model that can stream one assistant turn.
class ModelBackend
{
  public:
    virtual ~ModelBackend() = default;

    /// @brief Starts a turn for the given conversation and tool catalog.
    [[nodiscard]] virtual auto streamTurn(std::span<const ChatMessage> messages,
                                          std::span<const ToolDescriptor> tools)
        -> Result<std::unique_ptr<FragmentStream>> = 0;
};

} // namespace toolchat

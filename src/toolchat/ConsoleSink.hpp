// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/TurnEvent.hpp>

#include <cstdio>

namespace toolchat
{

/// @brief Returns a sink that renders turn events on @p out.
///
/// Assistant text is streamed as it arrives, tool activity is shown as dimmed lines and errors in
/// red. Colors are only used when @p out is a terminal.
[[nodiscard]] auto makeConsoleSink(std::FILE* out = stdout) -> EventSink;

} // namespace toolchat

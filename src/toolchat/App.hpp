// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolchat/Config.hpp>

#include <memory>
#include <string>

namespace toolchat
{

/// @brief Per-invocation options that are not part of the config file.
struct AppOptions
{
    std::string chatId;  ///< Persist the conversation under this id.
    std::string prompt;  ///< Answer this single prompt and exit.
    bool listTools = false;
    bool listChats = false;
};

/// @brief Wires the model, the tool servers and the agent loop together and runs the console UI.
class App
{
  public:
    App(AppConfig config, AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Connects the tool servers, loads the model and restores the chat.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the selected mode: a listing, a one-shot prompt or the interactive loop.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolchat

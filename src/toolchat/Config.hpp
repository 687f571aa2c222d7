// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentLoop.hpp>
#include <core/Error.hpp>
#include <llm/LlmEngine.hpp>
#include <mcp/ToolConnection.hpp>

#include <map>
#include <string>
#include <string_view>

namespace toolchat
{

/// @brief LLM configuration section.
struct LlmConfig
{
    LlmEngineConfig engine;
    std::string systemPrompt = "You are a helpful assistant with access to tools.";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlmConfig llm;
    AgentConfig agent;
    ConnectionOptions connection;
    std::string chatsDir; // empty means <defaultDataDir>/chats
    std::map<std::string, ToolServerConfig> mcpServers;
};

/// @brief Loads only the @c mcpServers section of a config file.
///
/// A missing file, invalid JSON, a server without @c command, or an invalid server id are all
/// reported as ConfigError.
[[nodiscard]] auto loadMcpServers(std::string_view path) -> Result<std::map<std::string, ToolServerConfig>>;

/// @brief Loads the application configuration from the default config path.
///
/// Returns the defaults when no config file exists.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/toolchat or ~/.config/toolchat
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief $XDG_DATA_HOME/toolchat or ~/.local/share/toolchat
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the configured chats directory, or the default one under defaultDataDir().
[[nodiscard]] auto effectiveChatsDir(const AppConfig& config) -> std::string;

} // namespace toolchat

// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace toolchat
{

namespace
{

    auto readConfigFile(std::string_view path) -> Result<nlohmann::json>
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();

        auto parsed = json::parse(ss.str(), ErrorCode::ConfigError);
        if (!parsed)
            return wrapError(ErrorCode::ConfigError, path, parsed.error());
        if (!parsed->is_object())
            return makeError(ErrorCode::ConfigError, std::format("{}: top-level value must be an object", path));
        return parsed;
    }

    auto isValidServerId(std::string_view id) -> bool
    {
        return !id.empty() && std::ranges::none_of(id, [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
    }

    auto parseMcpServers(const nlohmann::json& root) -> Result<std::map<std::string, ToolServerConfig>>
    {
        auto servers = std::map<std::string, ToolServerConfig> {};

        auto const it = root.find("mcpServers");
        if (it == root.end())
            return servers;
        if (!it->is_object())
            return makeError(ErrorCode::ConfigError, "'mcpServers' must be an object");

        for (const auto& [id, serverJson]: it->items())
        {
            if (!isValidServerId(id))
                return makeError(ErrorCode::ConfigError, std::format("Invalid server id '{}'", id));

            auto command = json::getStringOr(serverJson, "command", "");
            if (command.empty())
                return makeError(ErrorCode::ConfigError, std::format("Server '{}' has no command", id));

            servers[id] = ToolServerConfig {
                .command = std::move(command),
                .args = json::getStringArray(serverJson, "args"),
                .env = json::getStringMap(serverJson, "env"),
            };
        }
        return servers;
    }

    auto timeoutFromMillis(int millis, Timeout fallback) -> Timeout
    {
        if (millis < 0)
            return fallback;
        return millis == 0 ? InfiniteTimeout : Timeout { millis };
    }

    auto timeoutToMillis(Timeout timeout) -> int64_t
    {
        return timeout == InfiniteTimeout ? 0 : timeout.count();
    }

    auto emptyArgumentsPolicyName(EmptyArgumentsPolicy policy) -> std::string_view
    {
        return policy == EmptyArgumentsPolicy::Reject ? "reject" : "empty-object";
    }

    auto xdgDir(char const* xdgVariable, std::string_view homeFallback) -> std::string
    {
        if (auto const* const xdg = std::getenv(xdgVariable); xdg && *xdg)
            return std::format("{}/toolchat", xdg);
        if (auto const* const home = std::getenv("HOME"))
            return std::format("{}/{}/toolchat", home, homeFallback);
        return ".";
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultDataDir() -> std::string
{
    return xdgDir("XDG_DATA_HOME", ".local/share");
}

auto effectiveChatsDir(const AppConfig& config) -> std::string
{
    return config.chatsDir.empty() ? defaultDataDir() + "/chats" : config.chatsDir;
}

auto loadMcpServers(std::string_view path) -> Result<std::map<std::string, ToolServerConfig>>
{
    return readConfigFile(path).and_then(parseMcpServers);
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto parseResult = readConfigFile(path);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    auto config = AppConfig {};

    // LLM section
    if (auto const it = root.find("llm"); it != root.end())
    {
        auto const& llm = *it;
        auto& engine = config.llm.engine;
        engine.modelPath = json::getStringOr(llm, "modelPath", "");
        engine.contextSize = json::getIntOr(llm, "contextSize", engine.contextSize);
        engine.gpuLayers = json::getIntOr(llm, "gpuLayers", engine.gpuLayers);
        engine.threads = json::getIntOr(llm, "threads", engine.threads);
        engine.temperature = json::getFloatOr(llm, "temperature", engine.temperature);
        engine.topP = json::getFloatOr(llm, "topP", engine.topP);
        engine.topK = json::getIntOr(llm, "topK", engine.topK);
        engine.seed = json::getIntOr(llm, "seed", static_cast<int>(engine.seed));
        engine.maxTokens = json::getIntOr(llm, "maxTokens", engine.maxTokens);
        config.llm.systemPrompt = json::getStringOr(llm, "systemPrompt", config.llm.systemPrompt);
    }

    // Agent section
    if (auto const it = root.find("agent"); it != root.end())
    {
        auto const& agent = *it;
        config.agent.maxTurns = json::getIntOr(agent, "maxTurns", config.agent.maxTurns);
        if (config.agent.maxTurns < 0)
            return makeError(ErrorCode::ConfigError, "agent.maxTurns must not be negative");

        auto const policyName = json::getStringOr(agent, "emptyArguments", "empty-object");
        auto const policy = emptyArgumentsPolicyFromString(policyName);
        if (!policy)
            return makeError(ErrorCode::ConfigError,
                             std::format("agent.emptyArguments must be 'empty-object' or 'reject', not '{}'",
                                         policyName));
        config.agent.emptyArguments = *policy;

        config.connection.handshakeTimeout =
            timeoutFromMillis(json::getIntOr(agent, "handshakeTimeoutMs", -1), config.connection.handshakeTimeout);
        config.connection.callTimeout =
            timeoutFromMillis(json::getIntOr(agent, "callTimeoutMs", -1), config.connection.callTimeout);
    }

    config.chatsDir = json::getStringOr(root, "chatsDir", "");

    auto servers = parseMcpServers(root);
    if (!servers)
        return std::unexpected(servers.error());
    config.mcpServers = std::move(*servers);

    log::debug("Loaded config from {} ({} tool server(s))", path, config.mcpServers.size());
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // LLM section
    auto const& engine = config.llm.engine;
    auto llm = nlohmann::json::object();
    if (!engine.modelPath.empty())
        llm["modelPath"] = engine.modelPath;
    llm["contextSize"] = engine.contextSize;
    llm["gpuLayers"] = engine.gpuLayers;
    llm["threads"] = engine.threads;
    llm["temperature"] = engine.temperature;
    llm["topP"] = engine.topP;
    llm["topK"] = engine.topK;
    llm["seed"] = engine.seed;
    llm["maxTokens"] = engine.maxTokens;
    llm["systemPrompt"] = config.llm.systemPrompt;
    root["llm"] = std::move(llm);

    // Agent section
    auto agent = nlohmann::json::object();
    agent["maxTurns"] = config.agent.maxTurns;
    agent["emptyArguments"] = std::string(emptyArgumentsPolicyName(config.agent.emptyArguments));
    agent["handshakeTimeoutMs"] = timeoutToMillis(config.connection.handshakeTimeout);
    agent["callTimeoutMs"] = timeoutToMillis(config.connection.callTimeout);
    root["agent"] = std::move(agent);

    if (!config.chatsDir.empty())
        root["chatsDir"] = config.chatsDir;

    // MCP servers section
    auto servers = nlohmann::json::object();
    for (const auto& [id, serverConfig]: config.mcpServers)
    {
        auto server = nlohmann::json::object();
        server["command"] = serverConfig.command;
        if (!serverConfig.args.empty())
            server["args"] = serverConfig.args;
        if (!serverConfig.env.empty())
            server["env"] = serverConfig.env;
        servers[id] = std::move(server);
    }
    root["mcpServers"] = std::move(servers);

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace toolchat

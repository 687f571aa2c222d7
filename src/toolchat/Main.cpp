// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolchat/App.hpp>
#include <toolchat/ChatStore.hpp>
#include <toolchat/Config.hpp>

#include <CLI/CLI.hpp>

#include <optional>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolchat - chat with a local LLM that can call MCP tool servers" };

    auto configPath = std::string {};
    auto modelPath = std::string {};
    auto maxTurns = std::optional<int> {};
    auto verbose = false;
    auto logLevel = std::string {};
    auto options = toolchat::AppOptions {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-m,--model", modelPath, "Path to GGUF model file");
    app.add_option("--chat", options.chatId, "Persist the conversation under this id")
        ->check([](const std::string& id) {
            if (toolchat::ChatStore::isValidId(id))
                return std::string {};
            return std::string { "chat ids may only contain [A-Za-z0-9_-]" };
        });
    app.add_option("-p,--prompt", options.prompt, "Answer a single prompt and exit");
    app.add_flag("--list-tools", options.listTools, "Connect all tool servers and print the tool catalog");
    app.add_flag("--list-chats", options.listChats, "Print the stored chats, newest first");
    app.add_option("--max-turns", maxTurns, "Maximum model turns per message (0 = unbounded)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (error, warning, info, debug, trace)")
        ->check([](const std::string& name) {
            if (toolchat::log::levelFromString(name))
                return std::string {};
            return std::string { "unknown log level" };
        })
        ->excludes("--verbose");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        toolchat::log::setLevel(toolchat::log::Level::Debug);
    else if (auto const level = toolchat::log::levelFromString(logLevel))
        toolchat::log::setLevel(*level);

    auto configResult = configPath.empty() ? toolchat::loadConfig() : toolchat::loadConfigFromFile(configPath);
    if (!configResult)
    {
        toolchat::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    if (!modelPath.empty())
        config.llm.engine.modelPath = modelPath;
    if (maxTurns)
        config.agent.maxTurns = *maxTurns;

    auto application = toolchat::App(std::move(config), std::move(options));
    if (auto initResult = application.initialize(); !initResult)
    {
        toolchat::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}

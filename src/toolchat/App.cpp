// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/AgentLoop.hpp>
#include <core/Log.hpp>
#include <llm/ChatSession.hpp>
#include <llm/LlmEngine.hpp>
#include <mcp/ConnectionManager.hpp>
#include <toolchat/ChatStore.hpp>
#include <toolchat/ConsoleSink.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <print>
#include <string>

namespace toolchat
{

namespace
{
    auto catalogToJson(std::span<const ToolDescriptor> tools) -> nlohmann::json
    {
        auto out = nlohmann::json::array();
        for (const auto& tool: tools)
        {
            out.push_back({
                { "name", tool.qualifiedName },
                { "description", tool.description },
                { "inputSchema", tool.inputSchema },
            });
        }
        return out;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        return text.substr(first, text.find_last_not_of(" \t\r\n") - first + 1);
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    AppOptions options;
    LlmEngine engine;
    ChatSession session;
    std::unique_ptr<ConnectionManager> tools;
    std::unique_ptr<AgentLoop> agent;
    std::optional<ChatStore> store;
    StoredChat chat;
    EventSink sink = makeConsoleSink();

    Impl(AppConfig cfg, AppOptions opts):
        config(std::move(cfg)), options(std::move(opts)), session(config.llm.systemPrompt)
    {
    }

    ~Impl()
    {
        if (!tools)
            return;
        if (auto closed = tools->closeAll(); !closed)
            log::warning("{}", closed.error().message);
    }

    void connectTools()
    {
        tools = std::make_unique<ConnectionManager>(config.mcpServers, makeStdioTransportFactory(), config.connection);
        (void) tools->connectAll(); // failures are logged by the manager and leave the rest usable
    }

    auto restoreChat() -> VoidResult
    {
        if (options.chatId.empty())
            return {};

        store.emplace(effectiveChatsDir(config));
        auto loaded = store->load(options.chatId);
        if (!loaded)
            return std::unexpected(loaded.error());

        chat = std::move(*loaded);
        session.restore(chat.messages);
        log::info("Chat '{}' restored with {} message(s)", chat.id, session.messageCount());
        return {};
    }

    void saveChat()
    {
        if (!store)
            return;
        chat.messages.assign(session.conversation().begin(), session.conversation().end());
        if (auto saved = store->save(chat); !saved)
            log::error("Failed to save chat: {}", saved.error());
    }

    auto exchange(std::string_view userText) -> bool
    {
        auto answer = agent->processMessage(userText, sink);
        saveChat();
        return answer.has_value();
    }

    auto printTools() -> int
    {
        auto catalog = tools->listAllTools();
        if (!catalog)
        {
            log::error("{}", catalog.error());
            return 1;
        }
        std::println("{}", catalogToJson(*catalog).dump(2));
        return 0;
    }

    auto printChats() -> int
    {
        auto chats = ChatStore(effectiveChatsDir(config)).list();
        if (!chats)
        {
            log::error("{}", chats.error());
            return 1;
        }
        for (const auto& summary: *chats)
            std::println("{}  {}  {}", summary.id, summary.createdAt, summary.preview);
        return 0;
    }

    auto interactive() -> int
    {
        std::println("toolchat: {} tool(s) available. Type /exit to quit, /tools to list tools, /clear to reset.",
                     tools->listAllTools().value_or(std::vector<ToolDescriptor> {}).size());

        auto line = std::string {};
        while (true)
        {
            std::print("> ");
            std::fflush(stdout);
            if (!std::getline(std::cin, line))
                break;

            auto const input = trim(line);
            if (input.empty())
                continue;
            if (input == "/exit" || input == "/quit")
                break;
            if (input == "/tools")
            {
                (void) printTools();
                continue;
            }
            if (input == "/clear")
            {
                session.clear();
                saveChat();
                std::println("Conversation cleared.");
                continue;
            }

            (void) exchange(input);
        }
        return 0;
    }
};

App::App(AppConfig config, AppOptions options):
    _impl(std::make_unique<Impl>(std::move(config), std::move(options)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (_impl->options.listChats)
        return {};

    _impl->connectTools();

    if (_impl->options.listTools)
        return {};

    if (_impl->config.llm.engine.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "No model configured (set llm.modelPath or pass --model)");

    if (auto loaded = _impl->engine.load(_impl->config.llm.engine); !loaded)
        return loaded;

    if (auto restored = _impl->restoreChat(); !restored)
        return restored;

    _impl->agent =
        std::make_unique<AgentLoop>(_impl->engine, *_impl->tools, _impl->session, _impl->config.agent);
    return {};
}

auto App::run() -> int
{
    if (_impl->options.listChats)
        return _impl->printChats();
    if (_impl->options.listTools)
        return _impl->printTools();

    if (!_impl->options.prompt.empty())
        return _impl->exchange(_impl->options.prompt) ? 0 : 1;

    return _impl->interactive();
}

} // namespace toolchat

// SPDX-License-Identifier: Apache-2.0
#include "ChatStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>
#include <sstream>

namespace toolchat
{

namespace
{
    auto currentTimestamp() -> std::string
    {
        return std::format("{:%FT%T}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
    }

    /// @brief The first @p maxChars code points of @p text. Invalid bytes count as one character each.
    auto utf8Prefix(std::string_view text, size_t maxChars) -> std::string
    {
        auto chars = size_t { 0 };
        for (auto i = size_t { 0 }; i < text.size(); ++i)
        {
            auto const isContinuation = (static_cast<unsigned char>(text[i]) & 0xC0) == 0x80;
            if (!isContinuation && chars++ == maxChars)
                return std::string(text.substr(0, i));
        }
        return std::string(text);
    }

    auto readJsonFile(const std::filesystem::path& path) -> Result<nlohmann::json>
    {
        auto file = std::ifstream(path);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open {}", path.string()));

        auto ss = std::stringstream {};
        ss << file.rdbuf();
        return json::parse(ss.str(), ErrorCode::IoError);
    }
} // namespace

auto messageToJson(const ChatMessage& message) -> nlohmann::json
{
    auto value = nlohmann::json {
        { "role", std::string(roleToString(message.role)) },
        { "content", message.content },
    };

    if (!message.toolCalls.empty())
    {
        auto calls = nlohmann::json::array();
        for (const auto& call: message.toolCalls)
            calls.push_back({ { "id", call.id }, { "name", call.qualifiedName }, { "arguments", call.argumentText } });
        value["toolCalls"] = std::move(calls);
    }
    if (!message.toolCallId.empty())
        value["toolCallId"] = message.toolCallId;
    return value;
}

auto messageFromJson(const nlohmann::json& value) -> Result<ChatMessage>
{
    auto role = json::getString(value, "role");
    if (!role)
        return std::unexpected(role.error());

    auto message = ChatMessage {
        .role = roleFromString(*role),
        .content = json::getStringOr(value, "content", ""),
        .toolCalls = {},
        .toolCallId = json::getStringOr(value, "toolCallId", ""),
    };

    if (auto const it = value.find("toolCalls"); it != value.end() && it->is_array())
    {
        for (const auto& call: *it)
        {
            message.toolCalls.push_back(ToolCallRecord {
                .id = json::getStringOr(call, "id", ""),
                .qualifiedName = json::getStringOr(call, "name", ""),
                .argumentText = json::getStringOr(call, "arguments", ""),
            });
        }
    }
    return message;
}

ChatStore::ChatStore(std::filesystem::path directory): _directory(std::move(directory))
{
}

auto ChatStore::isValidId(std::string_view id) -> bool
{
    return !id.empty() && std::ranges::all_of(id, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

auto ChatStore::pathFor(std::string_view id) const -> std::filesystem::path
{
    return _directory / std::format("{}.json", id);
}

auto ChatStore::load(std::string_view id) const -> Result<StoredChat>
{
    if (!isValidId(id))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid chat id '{}'", id));

    auto const path = pathFor(id);
    if (!std::filesystem::exists(path))
    {
        log::debug("Chat {} not found, starting a new one", id);
        return StoredChat { .id = std::string(id), .createdAt = currentTimestamp(), .messages = {} };
    }

    auto root = readJsonFile(path);
    if (!root)
        return wrapError(ErrorCode::IoError, std::format("Failed to load chat {}", id), root.error());

    auto chat = StoredChat {
        .id = std::string(id),
        .createdAt = json::getStringOr(*root, "createdAt", ""),
        .messages = {},
    };

    if (auto const it = root->find("messages"); it != root->end() && it->is_array())
    {
        for (const auto& item: *it)
        {
            auto message = messageFromJson(item);
            if (!message)
                return wrapError(ErrorCode::IoError, std::format("Chat {} is corrupt", id), message.error());
            chat.messages.push_back(std::move(*message));
        }
    }
    return chat;
}

auto ChatStore::save(const StoredChat& chat) const -> VoidResult
{
    if (!isValidId(chat.id))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid chat id '{}'", chat.id));

    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create chats directory '{}': {}", _directory.string(), ec.message()));

    auto messages = nlohmann::json::array();
    for (const auto& message: chat.messages)
        messages.push_back(messageToJson(message));

    auto const root = nlohmann::json {
        { "id", chat.id },
        { "createdAt", chat.createdAt },
        { "messages", std::move(messages) },
    };

    auto const path = pathFor(chat.id);
    auto file = std::ofstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write {}", path.string()));
    // Generation can stop inside a multi-byte character; store U+FFFD rather than fail.
    file << root.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write {}", path.string()));

    log::debug("Chat {} saved ({} messages)", chat.id, chat.messages.size());
    return {};
}

auto ChatStore::list() const -> Result<std::vector<ChatSummary>>
{
    auto chats = std::vector<ChatSummary> {};
    if (!std::filesystem::exists(_directory))
        return chats;

    auto ec = std::error_code {};
    auto iter = std::filesystem::directory_iterator(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot list chats in '{}': {}", _directory.string(), ec.message()));

    for (const auto& entry: iter)
    {
        if (!entry.is_regular_file() || entry.path().extension() != ".json")
            continue;

        auto root = readJsonFile(entry.path());
        if (!root || !root->is_object())
        {
            log::warning("Skipping unreadable chat file {}", entry.path().string());
            continue;
        }

        auto preview = std::string { "New chat" };
        if (auto const it = root->find("messages"); it != root->end() && it->is_array() && !it->empty())
            preview = utf8Prefix(json::getStringOr(it->front(), "content", ""), PreviewLength);

        chats.push_back(ChatSummary {
            .id = json::getStringOr(*root, "id", entry.path().stem().string()),
            .createdAt = json::getStringOr(*root, "createdAt", ""),
            .preview = std::move(preview),
        });
    }

    std::ranges::sort(chats, std::ranges::greater {}, &ChatSummary::createdAt);
    return chats;
}

} // namespace toolchat

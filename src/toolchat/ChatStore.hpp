// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace toolchat
{

/// @brief A persisted conversation (without the system prompt).
struct StoredChat
{
    std::string id;
    std::string createdAt; // ISO 8601, UTC
    std::vector<ChatMessage> messages;
};

/// @brief One entry of ChatStore::list().
struct ChatSummary
{
    std::string id;
    std::string createdAt;
    std::string preview;
};

[[nodiscard]] auto messageToJson(const ChatMessage& message) -> nlohmann::json;
[[nodiscard]] auto messageFromJson(const nlohmann::json& value) -> Result<ChatMessage>;

/// @brief Stores conversations as @c <directory>/<id>.json.
class ChatStore
{
  public:
    static constexpr auto PreviewLength = size_t { 50 };

    explicit ChatStore(std::filesystem::path directory);

    /// @brief Loads chat @p id; an unknown id yields a new, empty chat.
    [[nodiscard]] auto load(std::string_view id) const -> Result<StoredChat>;

    [[nodiscard]] auto save(const StoredChat& chat) const -> VoidResult;

    /// @brief Lists all stored chats, newest first. Unreadable files are skipped.
    [[nodiscard]] auto list() const -> Result<std::vector<ChatSummary>>;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return _directory; }

    /// @brief Chat ids are non-empty and limited to [A-Za-z0-9_-].
    [[nodiscard]] static auto isValidId(std::string_view id) -> bool;

  private:
    std::filesystem::path _directory;

    [[nodiscard]] auto pathFor(std::string_view id) const -> std::filesystem::path;
};

} // namespace toolchat

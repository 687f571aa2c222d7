// SPDX-License-Identifier: Apache-2.0
#include <llm/LlmEngine.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <vector>

using namespace toolchat;

TEST_CASE("renderToolPrompt lists every tool as a function signature", "[llm]")
{
    auto const tools = std::vector<ToolDescriptor> {
        { .qualifiedName = "fs_list_dir",
          .description = "Lists a directory",
          .inputSchema = { { "type", "object" }, { "properties", { { "path", { { "type", "string" } } } } } } },
        { .qualifiedName = "web_fetch", .description = "Fetches a URL", .inputSchema = nullptr },
    };

    auto const prompt = renderToolPrompt(tools);

    CHECK(prompt.starts_with("# Tools"));
    CHECK(prompt.contains("<tool_call>"));

    // One JSON line per tool between the <tools> tags.
    auto const begin = prompt.find("<tools>\n") + 8;
    auto const end = prompt.find("</tools>");
    REQUIRE(end > begin);
    auto lines = std::istringstream(prompt.substr(begin, end - begin));
    auto entries = std::vector<nlohmann::json> {};
    for (auto line = std::string {}; std::getline(lines, line);)
        entries.push_back(nlohmann::json::parse(line));

    REQUIRE(entries.size() == 2);
    CHECK(entries[0]["function"]["name"] == "fs_list_dir");
    CHECK(entries[0]["function"]["parameters"]["properties"].contains("path"));
    CHECK(entries[1]["function"]["name"] == "web_fetch");
    CHECK(entries[1]["function"]["parameters"] == nlohmann::json::object());
}

TEST_CASE("LlmEngine refuses to stream before a model is loaded", "[llm]")
{
    auto engine = LlmEngine {};
    CHECK_FALSE(engine.isLoaded());

    auto const messages = std::vector<ChatMessage> { { .role = Role::User, .content = "Hi", .toolCalls = {}, .toolCallId = {} } };
    auto stream = engine.streamTurn(messages, {});
    REQUIRE(!stream.has_value());
    CHECK(stream.error().code == ErrorCode::BackendError);
}

TEST_CASE("LlmEngine::load reports a missing model file", "[llm]")
{
    auto engine = LlmEngine {};
    auto loaded = engine.load(LlmEngineConfig { .modelPath = "/nonexistent/model.gguf" });
    REQUIRE(!loaded.has_value());
    CHECK(loaded.error().code == ErrorCode::ModelLoadError);
    CHECK_FALSE(engine.isLoaded());
}

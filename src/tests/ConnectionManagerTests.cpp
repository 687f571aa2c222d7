// SPDX-License-Identifier: Apache-2.0
#include <mcp/ConnectionManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"

#include <algorithm>

using namespace toolchat;

namespace
{

auto replyTool(std::string name, std::string reply) -> test::FakeTool
{
    return test::FakeTool {
        .name = std::move(name),
        .description = "replies with a fixed text",
        .handler = [reply = std::move(reply)](const nlohmann::json&) { return test::textResult(reply); },
    };
}

auto names(const std::vector<ToolDescriptor>& tools) -> std::vector<std::string>
{
    auto out = std::vector<std::string> {};
    for (const auto& tool: tools)
        out.push_back(tool.qualifiedName);
    return out;
}

} // namespace

TEST_CASE("qualifyToolName joins server id and tool name", "[manager]")
{
    CHECK(qualifyToolName("fs", "list_dir") == "fs_list_dir");
    CHECK(qualifyToolName("web", "fetch") == "web_fetch");
}

TEST_CASE("ConnectionManager is not ready before connectAll", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("fs", { replyTool("list_dir", "a.txt") });
    auto manager = ConnectionManager(farm.configs(), farm.factory());

    CHECK(!manager.isReady());
    CHECK(manager.listAllTools().error().code == ErrorCode::NotReady);
    CHECK(manager.resolve("fs_list_dir").error().code == ErrorCode::NotReady);
    CHECK(manager.callTool("fs_list_dir", nlohmann::json::object()).error().code == ErrorCode::NotReady);
}

TEST_CASE("ConnectionManager namespaces the tools of every server", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("fs", { replyTool("list_dir", "a.txt"), replyTool("read_file", "content") });
    farm.add("web", { replyTool("fetch", "<html>") });
    auto manager = ConnectionManager(farm.configs(), farm.factory());

    auto const reports = manager.connectAll();
    REQUIRE(reports.size() == 2);
    CHECK(std::ranges::all_of(reports, [](const ConnectReport& r) { return r.status.has_value(); }));
    CHECK(manager.isReady());

    auto tools = manager.listAllTools();
    REQUIRE(tools.has_value());
    CHECK(names(*tools) == std::vector<std::string> { "fs_list_dir", "fs_read_file", "web_fetch" });

    // resolve() inverts qualifyToolName() for every catalog entry
    for (const auto& tool: *tools)
    {
        auto route = manager.resolve(tool.qualifiedName);
        REQUIRE(route.has_value());
        CHECK(qualifyToolName(route->serverId, route->originalName) == tool.qualifiedName);
    }
    CHECK(manager.resolve("fs_read_file").value() == ToolRoute { .serverId = "fs", .originalName = "read_file" });
}

TEST_CASE("ConnectionManager tolerates servers that fail to connect", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("good", { replyTool("ping", "pong") });
    farm.add("launchless", { replyTool("never", "") })->failLaunch = true;
    farm.add("refusing", { replyTool("nope", "") })->failInitialize = true;
    auto manager = ConnectionManager(farm.configs(), farm.factory());

    auto const reports = manager.connectAll();
    REQUIRE(reports.size() == 3);
    for (const auto& report: reports)
    {
        if (report.serverId == "good")
            CHECK(report.status.has_value());
        else
            CHECK(report.status.error().code == ErrorCode::ConnectionError);
    }

    CHECK(manager.isReady());
    CHECK(manager.serverCount() == 3);
    CHECK(manager.connectedServerCount() == 1);
    CHECK(names(manager.listAllTools().value()) == std::vector<std::string> { "good_ping" });

    auto missing = manager.callTool("refusing_nope", nlohmann::json::object());
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::UnknownTool);

    auto result = manager.callTool("good_ping", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(result->content == "pong");
}

TEST_CASE("ConnectionManager reports unknown tools", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("fs", { replyTool("list_dir", "a.txt") });
    auto manager = ConnectionManager(farm.configs(), farm.factory());
    (void) manager.connectAll();

    auto route = manager.resolve("fs_delete_everything");
    REQUIRE(!route.has_value());
    CHECK(route.error().code == ErrorCode::UnknownTool);

    auto call = manager.callTool("list_dir", nlohmann::json::object());
    REQUIRE(!call.has_value());
    CHECK(call.error().code == ErrorCode::UnknownTool);
}

TEST_CASE("ConnectionManager keeps the first of colliding qualified names", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("a", { replyTool("b_c", "from a") });
    farm.add("a_b", { replyTool("c", "from a_b"), replyTool("d", "only a_b") });
    auto manager = ConnectionManager(farm.configs(), farm.factory());
    (void) manager.connectAll();

    CHECK(names(manager.listAllTools().value()) == std::vector<std::string> { "a_b_c", "a_b_d" });
    CHECK(manager.callTool("a_b_c", nlohmann::json::object())->content == "from a");
    CHECK(manager.callTool("a_b_d", nlohmann::json::object())->content == "only a_b");
}

TEST_CASE("ConnectionManager callTools returns results in batch order", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("x", { replyTool("one", "1"), replyTool("two", "2") });
    auto manager = ConnectionManager(farm.configs(), farm.factory());
    (void) manager.connectAll();

    auto const results = manager.callTools({
        ToolInvocation { .qualifiedName = "x_two", .arguments = nlohmann::json::object() },
        ToolInvocation { .qualifiedName = "x_three", .arguments = nlohmann::json::object() },
        ToolInvocation { .qualifiedName = "x_one", .arguments = nlohmann::json::object() },
    });

    REQUIRE(results.size() == 3);
    CHECK(results[0]->content == "2");
    CHECK(results[1].error().code == ErrorCode::UnknownTool);
    CHECK(results[2]->content == "1");
}

TEST_CASE("ConnectionManager connectAll runs only once", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("good", { replyTool("ping", "pong") });
    farm.add("bad")->failLaunch = true;
    auto manager = ConnectionManager(farm.configs(), farm.factory());

    (void) manager.connectAll();
    auto const again = manager.connectAll();

    REQUIRE(again.size() == 2);
    CHECK(again[0].serverId == "bad");
    CHECK(!again[0].status.has_value());
    CHECK(again[1].serverId == "good");
    CHECK(again[1].status.has_value());
    CHECK(names(manager.listAllTools().value()) == std::vector<std::string> { "good_ping" });
}

TEST_CASE("ConnectionManager closeAll shuts down every connection", "[manager]")
{
    auto farm = test::FakeServerFarm {};
    auto first = farm.add("first", { replyTool("a", "") });
    auto second = farm.add("second", { replyTool("b", "") });

    {
        auto manager = ConnectionManager(farm.configs(), farm.factory());
        (void) manager.connectAll();
        CHECK(manager.closeAll().has_value());
        CHECK(manager.connection("first")->liveness() == Liveness::Closed);
        CHECK(manager.connection("second")->liveness() == Liveness::Closed);
        CHECK(manager.connection("third") == nullptr);
    }

    // the destructor does not close twice
    CHECK(first->closeCount == 1);
    CHECK(second->closeCount == 1);
}

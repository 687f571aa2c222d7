// SPDX-License-Identifier: Apache-2.0
#include <mcp/ToolConnection.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

using namespace toolchat;

namespace
{

auto echoTool() -> test::FakeTool
{
    return test::FakeTool {
        .name = "echo",
        .description = "Echoes its input",
        .handler = [](const nlohmann::json& args) { return test::textResult(args.value("text", "")); },
    };
}

auto makeConnection(test::FakeServerFarm& farm, std::string serverId, ConnectionOptions options = {})
    -> std::unique_ptr<ToolConnection>
{
    auto configs = farm.configs();
    auto config = configs[serverId];
    return std::make_unique<ToolConnection>(std::move(serverId), std::move(config), farm.factory(), options);
}

} // namespace

TEST_CASE("ToolConnection connects and caches the tool list", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("util", { echoTool() });
    auto connection = makeConnection(farm, "util");

    CHECK(connection->liveness() == Liveness::Disconnected);
    REQUIRE(connection->connect().has_value());
    CHECK(connection->liveness() == Liveness::Connected);

    auto tools = connection->listTools();
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "echo");
    CHECK((*tools)[0].description == "Echoes its input");
}

TEST_CASE("ToolConnection listTools requires a connection", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("util", { echoTool() });
    auto connection = makeConnection(farm, "util");

    auto tools = connection->listTools();
    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::NotConnected);
}

TEST_CASE("ToolConnection reports launch failures as connection errors", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("broken")->failLaunch = true;
    auto connection = makeConnection(farm, "broken");

    auto result = connection->connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);
    CHECK(result.error().message.find("broken") != std::string::npos);
    CHECK(connection->liveness() == Liveness::Failed);
}

TEST_CASE("ToolConnection reports a refused handshake as a connection error", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    auto server = farm.add("grumpy", { echoTool() });
    server->failInitialize = true;
    auto connection = makeConnection(farm, "grumpy");

    auto result = connection->connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);
    CHECK(connection->liveness() == Liveness::Failed);
    CHECK(server->closeCount == 1);
}

TEST_CASE("ToolConnection gives up on a silent server", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("mute", { echoTool() })->silent = true;
    auto connection = makeConnection(farm, "mute", ConnectionOptions { .handshakeTimeout = Timeout { 20 } });

    auto result = connection->connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);
    CHECK(connection->liveness() == Liveness::Failed);
}

TEST_CASE("ToolConnection callTool forwards the original name and arguments", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    auto server = farm.add("util", { echoTool() });
    auto connection = makeConnection(farm, "util");
    REQUIRE(connection->connect().has_value());

    auto result = connection->callTool("echo", { { "text", "ping" } });
    REQUIRE(result.has_value());
    CHECK(result->content == "ping");
    CHECK(!result->isError);

    REQUIRE(server->callCount() == 1);
    CHECK(server->calls[0].first == "echo");
    CHECK(server->calls[0].second["text"] == "ping");
}

TEST_CASE("ToolConnection callTool rejects non-object arguments", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    auto server = farm.add("util", { echoTool() });
    auto connection = makeConnection(farm, "util");
    REQUIRE(connection->connect().has_value());

    auto result = connection->callTool("echo", nlohmann::json::array({ 1, 2 }));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolInvocationError);
    CHECK(server->callCount() == 0);
}

TEST_CASE("ToolConnection turns tool-reported errors into invocation errors", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    farm.add("fs",
             { test::FakeTool {
                 .name = "read",
                 .description = "",
                 .handler = [](const nlohmann::json&) { return test::textResult("permission denied", true); },
             } });
    auto connection = makeConnection(farm, "fs");
    REQUIRE(connection->connect().has_value());

    auto result = connection->callTool("read", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolInvocationError);
    CHECK(result.error().message == "permission denied");
    CHECK(connection->liveness() == Liveness::Connected);
}

TEST_CASE("ToolConnection callTool fails once closed", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    auto server = farm.add("util", { echoTool() });
    auto connection = makeConnection(farm, "util");
    REQUIRE(connection->connect().has_value());

    CHECK(connection->close().has_value());
    CHECK(connection->liveness() == Liveness::Closed);
    CHECK(server->closeCount == 1);

    auto result = connection->callTool("echo", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ToolInvocationError);

    // close is idempotent
    CHECK(connection->close().has_value());
    CHECK(server->closeCount == 1);

    auto reconnect = connection->connect();
    REQUIRE(!reconnect.has_value());
    CHECK(reconnect.error().code == ErrorCode::ConnectionError);
}

TEST_CASE("ToolConnection runs calls from several threads one at a time", "[connection]")
{
    auto active = std::atomic<int> { 0 };
    auto maxActive = std::atomic<int> { 0 };

    auto farm = test::FakeServerFarm {};
    auto server = farm.add("util",
                           { test::FakeTool {
                               .name = "count",
                               .description = "",
                               .handler =
                                   [&](const nlohmann::json& args) {
                                       auto const now = ++active;
                                       auto seen = maxActive.load();
                                       while (now > seen && !maxActive.compare_exchange_weak(seen, now))
                                           ;
                                       std::this_thread::yield();
                                       --active;
                                       return test::textResult(args["n"].dump());
                                   },
                           } });
    auto connection = makeConnection(farm, "util");
    REQUIRE(connection->connect().has_value());

    constexpr auto ThreadCount = 8;
    constexpr auto CallsPerThread = 25;
    auto mismatches = std::atomic<int> { 0 };
    {
        auto workers = std::vector<std::jthread> {};
        for (auto t = 0; t < ThreadCount; ++t)
            workers.emplace_back([&, t] {
                for (auto i = 0; i < CallsPerThread; ++i)
                {
                    auto const n = t * CallsPerThread + i;
                    auto result = connection->callTool("count", { { "n", n } });
                    if (!result || result->content != std::to_string(n))
                        ++mismatches;
                }
            });
    }

    CHECK(mismatches == 0);
    CHECK(maxActive == 1);
    CHECK(server->callCount() == ThreadCount * CallsPerThread);
    CHECK(connection->liveness() == Liveness::Connected);
}

TEST_CASE("ToolConnection close interrupts a call that never returns", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    auto server = farm.add("util", { echoTool() });
    server->hangingTool = "slow";
    auto connection = makeConnection(farm, "util", ConnectionOptions { .callTimeout = InfiniteTimeout });
    REQUIRE(connection->connect().has_value());

    auto callResult = std::optional<Result<ToolResult>> {};
    auto caller = std::jthread([&] { callResult = connection->callTool("slow", nlohmann::json::object()); });

    while (server->callCount() == 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    CHECK(connection->close().has_value());
    caller.join();

    REQUIRE(callResult.has_value());
    REQUIRE(!callResult->has_value());
    CHECK(callResult->error().code == ErrorCode::ToolInvocationError);
    CHECK(connection->liveness() == Liveness::Closed);
    CHECK(server->interruptCount == 1);
    CHECK(server->closeCount == 1);

    auto late = connection->callTool("echo", nlohmann::json::object());
    REQUIRE(!late.has_value());
    CHECK(late.error().code == ErrorCode::ToolInvocationError);
}

TEST_CASE("ToolConnection close does not interrupt an idle connection", "[connection]")
{
    auto farm = test::FakeServerFarm {};
    auto server = farm.add("util", { echoTool() });
    auto connection = makeConnection(farm, "util");
    REQUIRE(connection->connect().has_value());

    CHECK(connection->close().has_value());
    CHECK(server->interruptCount == 0);
}

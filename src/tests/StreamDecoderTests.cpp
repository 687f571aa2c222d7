// SPDX-License-Identifier: Apache-2.0
#include <llm/StreamDecoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"

using namespace toolchat;
using namespace toolchat::test;

namespace
{

auto decodeAll(std::vector<Fragment> fragments, std::optional<Error> trailingError = std::nullopt)
    -> Result<std::vector<DecodedEvent>>
{
    auto stream = VectorFragmentStream(std::move(fragments), std::move(trailingError));
    auto decoder = StreamDecoder(stream);
    return drain(decoder);
}

auto callAt(const std::vector<DecodedEvent>& events, size_t index) -> const ToolCallRecord&
{
    return std::get<ToolCallRequest>(events.at(index)).record;
}

} // namespace

TEST_CASE("StreamDecoder passes text through", "[decoder]")
{
    auto events = decodeAll({ content("Hello"), content(""), content(", world") });
    REQUIRE(events.has_value());
    REQUIRE(events->size() == 2);
    CHECK(std::get<TextFragment>((*events)[0]).text == "Hello");
    CHECK(std::get<TextFragment>((*events)[1]).text == ", world");
}

TEST_CASE("StreamDecoder assembles a call from its fragments", "[decoder]")
{
    auto events = decodeAll({
        callId("call_1"),
        toolName("fs_list_dir"),
        argsDelta(R"({"pa)"),
        argsDelta(R"(th": "/tm)"),
        argsDelta(R"(p"})"),
    });

    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    auto const& call = callAt(*events, 0);
    CHECK(call.id == "call_1");
    CHECK(call.qualifiedName == "fs_list_dir");
    CHECK(call.argumentText == R"({"path": "/tmp"})");
}

TEST_CASE("StreamDecoder emits k calls in call id order", "[decoder]")
{
    auto events = decodeAll({
        content("Let me check."),
        callId("a"),
        toolName("fs_list_dir"),
        argsDelta("{}"),
        callId("b"),
        toolName("fs_read_file"),
        argsDelta(R"({"path":"x"})"),
        callId("c"),
        toolName("web_fetch"),
    });

    REQUIRE(events.has_value());
    REQUIRE(events->size() == 4);
    CHECK(std::get<TextFragment>((*events)[0]).text == "Let me check.");
    CHECK(callAt(*events, 1).id == "a");
    CHECK(callAt(*events, 1).argumentText == "{}");
    CHECK(callAt(*events, 2).id == "b");
    CHECK(callAt(*events, 2).qualifiedName == "fs_read_file");
    CHECK(callAt(*events, 3).id == "c");
    CHECK(callAt(*events, 3).argumentText.empty());
}

TEST_CASE("StreamDecoder forwards text that arrives while a call is open", "[decoder]")
{
    auto events = decodeAll({ callId("a"), toolName("x_y"), content("thinking..."), argsDelta("{}") });

    REQUIRE(events.has_value());
    REQUIRE(events->size() == 2);
    CHECK(std::get<TextFragment>((*events)[0]).text == "thinking...");
    CHECK(callAt(*events, 1).argumentText == "{}");
}

TEST_CASE("StreamDecoder keeps invalid argument JSON verbatim", "[decoder]")
{
    auto events = decodeAll({ callId("a"), toolName("x_y"), argsDelta("{not json") });

    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    CHECK(callAt(*events, 0).argumentText == "{not json");
}

TEST_CASE("StreamDecoder discards a call that never got a name", "[decoder]")
{
    auto events = decodeAll({ callId("nameless"), argsDelta("{}"), callId("named"), toolName("x_y") });

    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    CHECK(callAt(*events, 0).id == "named");
}

TEST_CASE("StreamDecoder rejects a name without a call id", "[decoder]")
{
    auto events = decodeAll({ content("hi"), toolName("x_y") });
    REQUIRE(!events.has_value());
    CHECK(events.error().code == ErrorCode::MalformedStream);
}

TEST_CASE("StreamDecoder rejects renaming an open call", "[decoder]")
{
    auto events = decodeAll({ callId("a"), toolName("x_y"), toolName("x_z") });
    REQUIRE(!events.has_value());
    CHECK(events.error().code == ErrorCode::MalformedStream);
}

TEST_CASE("StreamDecoder rejects arguments without a call id", "[decoder]")
{
    auto events = decodeAll({ argsDelta("{}") });
    REQUIRE(!events.has_value());
    CHECK(events.error().code == ErrorCode::MalformedStream);
}

TEST_CASE("StreamDecoder propagates backend errors and stops", "[decoder]")
{
    auto stream = VectorFragmentStream({ content("partial") }, Error { ErrorCode::BackendError, "connection reset" });
    auto decoder = StreamDecoder(stream);

    auto first = decoder.next();
    REQUIRE(first.has_value());
    CHECK(std::get<TextFragment>(first->value()).text == "partial");

    auto second = decoder.next();
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::BackendError);
    CHECK(decoder.finished());

    auto third = decoder.next();
    REQUIRE(third.has_value());
    CHECK(!third->has_value());
}

TEST_CASE("StreamDecoder is exhausted after the end of the stream", "[decoder]")
{
    auto stream = VectorFragmentStream({ callId("a"), toolName("x_y") });
    auto decoder = StreamDecoder(stream);

    auto call = decoder.next();
    REQUIRE(call.has_value());
    REQUIRE(call->has_value());
    CHECK(decoder.finished());

    auto end = decoder.next();
    REQUIRE(end.has_value());
    CHECK(!end->has_value());
}

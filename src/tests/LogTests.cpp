// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <llm/ToolCallTagScanner.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace toolchat;

namespace
{

/// Captures log output for the lifetime of the object and restores the previous level afterwards.
class LogCapture
{
  public:
    explicit LogCapture(log::Level level): _previousLevel(log::getLevel())
    {
        log::setLevel(level);
        log::setCallback([this](log::Level lvl, std::string_view message) { lines.emplace_back(lvl, message); });
    }

    ~LogCapture()
    {
        log::setCallback({});
        log::setLevel(_previousLevel);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::pair<log::Level, std::string>> lines;

  private:
    log::Level _previousLevel;
};

} // namespace

TEST_CASE("log filters messages above the configured level", "[log]")
{
    auto capture = LogCapture { log::Level::Warning };

    log::error("disk {}", "full");
    log::warning("low memory");
    log::info("hidden");
    log::debug("hidden too");

    REQUIRE(capture.lines.size() == 2);
    CHECK(capture.lines[0] == std::pair { log::Level::Error, std::string { "disk full" } });
    CHECK(capture.lines[1].first == log::Level::Warning);
}

TEST_CASE("log::levelFromString", "[log]")
{
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK_FALSE(log::levelFromString("loud").has_value());
}

TEST_CASE("ToolCallTagScanner warns about a malformed call body", "[log][llm]")
{
    auto capture = LogCapture { log::Level::Warning };
    auto scanner = ToolCallTagScanner {};

    auto fragments = scanner.feed("<tool_call>{not json}</tool_call>");
    auto const rest = scanner.finish();
    fragments.insert(fragments.end(), rest.begin(), rest.end());

    CHECK(scanner.callCount() == 0);
    REQUIRE(capture.lines.size() == 1);
    CHECK(capture.lines[0].first == log::Level::Warning);
}

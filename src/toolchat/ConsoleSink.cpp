// SPDX-License-Identifier: Apache-2.0
#include "ConsoleSink.hpp"

#include <print>
#include <string_view>
#include <variant>

#include <unistd.h>

namespace toolchat
{

namespace
{
    constexpr auto MaxShownResultLength = size_t { 200 };

    struct Style
    {
        std::string_view dim;
        std::string_view red;
        std::string_view reset;
    };

    auto shorten(std::string_view text) -> std::string
    {
        auto line = std::string(text.substr(0, MaxShownResultLength));
        for (auto& c: line)
        {
            if (c == '\n' || c == '\r')
                c = ' ';
        }
        if (text.size() > MaxShownResultLength)
            line += "...";
        return line;
    }
} // namespace

auto makeConsoleSink(std::FILE* out) -> EventSink
{
    auto const colored = ::isatty(::fileno(out)) != 0;
    auto const style = colored ? Style { .dim = "\033[2m", .red = "\033[31m", .reset = "\033[0m" } : Style {};

    return [out, style](const TurnEvent& event) {
        if (auto const* text = std::get_if<events::TextFragment>(&event))
        {
            std::print(out, "{}", text->text);
            std::fflush(out);
        }
        else if (auto const* started = std::get_if<events::ToolCallStarted>(&event))
        {
            std::println(out, "\n{}[tool] {} {}{}", style.dim, started->name, started->arguments, style.reset);
        }
        else if (auto const* result = std::get_if<events::ToolResult>(&event))
        {
            std::println(out, "{}[result] {}: {}{}", style.dim, result->name, shorten(result->content), style.reset);
        }
        else if (auto const* error = std::get_if<events::Error>(&event))
        {
            std::println(out, "\n{}Error: {}{}", style.red, error->message, style.reset);
        }
        else if (std::holds_alternative<events::Done>(event))
        {
            std::println(out, "");
        }
    };
}

} // namespace toolchat

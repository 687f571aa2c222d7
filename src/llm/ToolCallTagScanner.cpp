// SPDX-License-Identifier: Apache-2.0
#include "ToolCallTagScanner.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cstdint>
#include <format>
#include <random>

namespace toolchat
{

namespace
{
    /// @brief Length of the longest suffix of @p text that is a proper prefix of @p tag.
    auto partialTagLength(std::string_view text, std::string_view tag) -> size_t
    {
        for (auto len = std::min(text.size(), tag.size() - 1); len > 0; --len)
        {
            if (text.substr(text.size() - len) == tag.substr(0, len))
                return len;
        }
        return 0;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }
} // namespace

ToolCallTagScanner::ToolCallTagScanner(std::string idPrefix): _idPrefix(std::move(idPrefix))
{
}

auto ToolCallTagScanner::randomIdPrefix() -> std::string
{
    thread_local auto engine = std::mt19937 { std::random_device {}() };
    return std::format("call_{:08x}", std::uniform_int_distribution<uint32_t> {}(engine));
}

auto ToolCallTagScanner::feed(std::string_view piece) -> std::vector<Fragment>
{
    auto out = std::vector<Fragment> {};
    _buffer += piece;

    while (!_buffer.empty())
    {
        if (!_insideTag)
        {
            auto const open = _buffer.find(OpenTag);
            if (open != std::string::npos)
            {
                if (open > 0)
                    out.emplace_back(ContentFragment { _buffer.substr(0, open) });
                _buffer.erase(0, open + OpenTag.size());
                _insideTag = true;
                continue;
            }

            auto const keep = partialTagLength(_buffer, OpenTag);
            if (_buffer.size() > keep)
            {
                out.emplace_back(ContentFragment { _buffer.substr(0, _buffer.size() - keep) });
                _buffer.erase(0, _buffer.size() - keep);
            }
            break;
        }

        auto const close = _buffer.find(CloseTag);
        if (close == std::string::npos)
            break;

        emitCall(std::string_view { _buffer }.substr(0, close), out);
        _buffer.erase(0, close + CloseTag.size());
        _insideTag = false;
    }

    return out;
}

auto ToolCallTagScanner::finish() -> std::vector<Fragment>
{
    auto out = std::vector<Fragment> {};
    if (_insideTag)
    {
        auto body = json::parse(trim(_buffer));
        if (body && body->is_object())
            emitCall(_buffer, out);
        else
            out.emplace_back(ContentFragment { std::format("{}{}", OpenTag, _buffer) });
    }
    else if (!_buffer.empty())
    {
        out.emplace_back(ContentFragment { _buffer });
    }
    _buffer.clear();
    _insideTag = false;
    return out;
}

void ToolCallTagScanner::emitCall(std::string_view body, std::vector<Fragment>& out)
{
    auto parsed = json::parse(trim(body));
    if (!parsed || !parsed->is_object())
    {
        log::warning("Skipping malformed tool call: {}", trim(body));
        return;
    }

    auto name = json::getStringOr(*parsed, "name", "");
    if (name.empty())
    {
        log::warning("Skipping tool call without a name: {}", trim(body));
        return;
    }

    // Arguments are forwarded verbatim; some models emit them as an already-encoded string.
    auto arguments = std::string {};
    if (parsed->contains("arguments"))
    {
        auto const& value = (*parsed)["arguments"];
        arguments = value.is_string() ? value.get<std::string>() : value.dump();
    }

    out.emplace_back(CallIdFragment { std::format("{}_{}", _idPrefix, _callCount++) });
    out.emplace_back(NameFragment { std::move(name) });
    if (!arguments.empty())
        out.emplace_back(ArgsDeltaFragment { std::move(arguments) });
}

} // namespace toolchat

// SPDX-License-Identifier: Apache-2.0
#include "StreamDecoder.hpp"

#include <core/Log.hpp>

#include <format>

namespace toolchat
{

StreamDecoder::StreamDecoder(FragmentStream& stream): _stream(stream)
{
}

auto StreamDecoder::next() -> Result<std::optional<DecodedEvent>>
{
    while (_state != State::Finished)
    {
        auto fragment = _stream.next();
        if (!fragment)
        {
            _state = State::Finished;
            return std::unexpected(fragment.error());
        }

        if (!fragment->has_value())
        {
            auto const wasInCall = _state == State::InCall;
            _state = State::Finished;
            if (wasInCall)
                return finalizeOpenCall();
            return std::nullopt;
        }

        auto& current = **fragment;

        if (auto* content = std::get_if<ContentFragment>(&current))
        {
            if (content->text.empty())
                continue;
            return DecodedEvent { TextFragment { std::move(content->text) } };
        }

        if (auto* callId = std::get_if<CallIdFragment>(&current))
        {
            auto completed = _state == State::InCall ? finalizeOpenCall() : std::nullopt;
            _open = ToolCallRecord { .id = std::move(callId->id), .qualifiedName = {}, .argumentText = {} };
            _openHasName = false;
            _state = State::InCall;
            if (completed)
                return completed;
            continue;
        }

        if (auto* name = std::get_if<NameFragment>(&current))
        {
            if (_state != State::InCall)
                return fail(std::format("Tool name '{}' arrived without a preceding call id", name->name));
            if (_openHasName)
                return fail(std::format("Tool call '{}' was renamed from '{}' to '{}'", _open.id,
                                        _open.qualifiedName, name->name));
            _open.qualifiedName = std::move(name->name);
            _openHasName = true;
            continue;
        }

        if (auto* args = std::get_if<ArgsDeltaFragment>(&current))
        {
            if (_state != State::InCall)
                return fail("Tool arguments arrived without a preceding call id");
            _open.argumentText += args->text;
            continue;
        }
    }

    return std::nullopt;
}

auto StreamDecoder::finalizeOpenCall() -> std::optional<DecodedEvent>
{
    auto record = std::move(_open);
    _open = {};

    if (!_openHasName)
    {
        log::warning("Discarding tool call '{}' that never received a name", record.id);
        return std::nullopt;
    }
    _openHasName = false;

    log::debug("Decoded tool call {} -> {} ({} argument bytes)",
               record.id,
               record.qualifiedName,
               record.argumentText.size());
    return DecodedEvent { ToolCallRequest { std::move(record) } };
}

auto StreamDecoder::fail(std::string message) -> Result<std::optional<DecodedEvent>>
{
    _state = State::Finished;
    return makeError(ErrorCode::MalformedStream, std::move(message));
}

} // namespace toolchat

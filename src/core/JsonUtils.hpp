// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace toolchat::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @param code The error code reported when @p input is not valid JSON.
/// @return The parsed JSON value or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::ProtocolError)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
}

/// @brief Extracts an optional string field, falling back to @p defaultValue.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    if (!obj.is_object())
        return std::string(defaultValue);
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field, falling back to @p defaultValue.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional float field, falling back to @p defaultValue.
[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue)
    -> float
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number())
        return it->get<float>();
    return defaultValue;
}

/// @brief Extracts an optional boolean field, falling back to @p defaultValue.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    if (!obj.is_object())
        return defaultValue;
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_boolean())
        return it->get<bool>();
    return defaultValue;
}

/// @brief Collects the string elements of an array field. Non-string elements are skipped.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto values = std::vector<std::string> {};
    if (!obj.is_object())
        return values;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return values;
    for (const auto& item: *it)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

/// @brief Collects the string members of an object field. Non-string members are skipped.
[[nodiscard]] inline auto getStringMap(const nlohmann::json& obj, std::string_view key)
    -> std::map<std::string, std::string>
{
    auto values = std::map<std::string, std::string> {};
    if (!obj.is_object())
        return values;
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_object())
        return values;
    for (const auto& [name, value]: it->items())
    {
        if (value.is_string())
            values[name] = value.get<std::string>();
    }
    return values;
}

} // namespace toolchat::json

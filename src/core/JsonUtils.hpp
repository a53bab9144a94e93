// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "Error.hpp"

namespace speakstream::json
{

/// @brief Parses a JSON document, returning a Result.
/// @param input The JSON text.
/// @param origin Where the text came from (a file path), used in the error message.
/// @return The parsed document or a ConfigError.
[[nodiscard]] inline auto parse(std::string_view input, std::string_view origin) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("{}: JSON parse error: {}", origin, e.what()));
    }
}

/// @brief Returns true if value can be read as a T without conversion surprises.
template <typename T>
[[nodiscard]] auto holds(const nlohmann::json& value) -> bool
{
    if constexpr (std::is_same_v<T, bool>)
        return value.is_boolean();
    else if constexpr (std::is_integral_v<T>)
        return value.is_number_integer();
    else if constexpr (std::is_same_v<T, std::string>)
        return value.is_string();
    else if constexpr (std::is_same_v<T, std::vector<std::string>>)
        return value.is_array()
               && std::ranges::all_of(value, [](const nlohmann::json& element) { return element.is_string(); });
    else
        static_assert(sizeof(T) == 0, "unsupported config value type");
}

/// @brief Reads an optional field of an object.
///
/// Missing fields and fields of the wrong type yield the default.
/// A string list containing anything but strings counts as the wrong type.
template <typename T>
[[nodiscard]] auto valueOr(const nlohmann::json& obj,
                           std::string_view key,
                           const std::type_identity_t<T>& defaultValue) -> T
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !holds<T>(*it))
        return defaultValue;
    return it->template get<T>();
}

/// @brief Returns the object stored under key, or an empty object if missing.
[[nodiscard]] inline auto sectionOf(const nlohmann::json& obj, std::string_view key) -> nlohmann::json
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_object())
        return *it;
    return nlohmann::json::object();
}

} // namespace speakstream::json

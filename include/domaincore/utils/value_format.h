/**
 * @file value_format.h
 * @brief Text and JSON rendering of supported values
 *
 * formatValue() produces the text form of a primitive (text verbatim,
 * booleans as true/false, numbers in shortest round-trip form, timestamps
 * as ISO 8601 with milliseconds). toJson() produces the structural JSON form
 * of sequences, maps and user structs. User structs take part by providing
 * an ADL-visible `Json::Value toJson(const T&)`.
 *
 * @version 1.0.0
 */

#pragma once

#include "domaincore/utils/predicates.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <json/json.h>

namespace domaincore {
namespace utils {

/**
 * @brief Write JSON compactly (no indentation, no trailing newline)
 */
std::string toJsonString(const Json::Value& value);

/**
 * @brief Shortest round-trip text form of a floating point number
 *
 * Large and tiny magnitudes switch to exponent notation (1e+20).
 */
std::string formatNumber(double value);

/**
 * @brief Text form of a primitive Json::Value
 *
 * Strings are returned without quotes; arrays and objects are written as
 * compact JSON.
 */
std::string formatValue(const Json::Value& value);

std::string formatValue(const Timestamp& value);

inline std::string formatValue(std::nullopt_t) { return std::string(kUndefinedLiteral); }
inline std::string formatValue(std::nullptr_t) { return "null"; }
inline std::string formatValue(const std::string& value) { return value; }
inline std::string formatValue(std::string_view value) { return std::string(value); }

inline std::string formatValue(const char* value) {
    return value ? std::string(value) : std::string("null");
}

inline std::string formatValue(char* value) {
    return formatValue(static_cast<const char*>(value));
}

template <typename T>
std::string formatValue(const std::optional<T>& value);

template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
std::string formatValue(T value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_floating_point_v<T>) {
        return formatNumber(static_cast<double>(value));
    } else {
        return std::to_string(value);
    }
}

template <typename T>
std::string formatValue(const std::optional<T>& value) {
    if (!value.has_value()) {
        return std::string(kUndefinedLiteral);
    }
    return formatValue(*value);
}

// -----------------------------------------------------------------------------
// toJson
// -----------------------------------------------------------------------------

inline Json::Value toJson(const Json::Value& value) { return value; }
Json::Value toJson(const Timestamp& value);
inline Json::Value toJson(std::nullopt_t) { return Json::Value(Json::nullValue); }
inline Json::Value toJson(std::nullptr_t) { return Json::Value(Json::nullValue); }
inline Json::Value toJson(const std::string& value) { return Json::Value(value); }
inline Json::Value toJson(std::string_view value) { return Json::Value(std::string(value)); }

inline Json::Value toJson(const char* value) {
    return value ? Json::Value(value) : Json::Value(Json::nullValue);
}

inline Json::Value toJson(char* value) {
    return toJson(static_cast<const char*>(value));
}

template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
Json::Value toJson(T value) {
    if constexpr (std::is_same_v<T, bool>) {
        return Json::Value(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return Json::Value(static_cast<double>(value));
    } else if constexpr (std::is_signed_v<T>) {
        return Json::Value(static_cast<Json::Int64>(value));
    } else {
        return Json::Value(static_cast<Json::UInt64>(value));
    }
}

template <typename T>
Json::Value toJson(const std::optional<T>& value);

template <typename T, typename Alloc>
Json::Value toJson(const std::vector<T, Alloc>& values);

template <typename V, typename Compare, typename Alloc>
Json::Value toJson(const std::map<std::string, V, Compare, Alloc>& values);

template <typename T>
Json::Value toJson(const std::optional<T>& value) {
    if (!value.has_value()) {
        return Json::Value(Json::nullValue);
    }
    return toJson(*value);
}

template <typename T, typename Alloc>
Json::Value toJson(const std::vector<T, Alloc>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : values) {
        array.append(toJson(item));
    }
    return array;
}

template <typename V, typename Compare, typename Alloc>
Json::Value toJson(const std::map<std::string, V, Compare, Alloc>& values) {
    Json::Value object(Json::objectValue);
    for (const auto& [key, item] : values) {
        object[key] = toJson(item);
    }
    return object;
}

namespace detail {

template <typename T, typename = void>
struct has_to_json : std::false_type {};

template <typename T>
struct has_to_json<T, std::void_t<decltype(toJson(std::declval<const T&>()))>>
    : std::true_type {};

} // namespace detail

/**
 * @brief Whether a type can be rendered with toJson (built-in or ADL)
 */
template <typename T>
inline constexpr bool has_to_json_v = detail::has_to_json<std::decay_t<T>>::value;

} // namespace utils
} // namespace domaincore

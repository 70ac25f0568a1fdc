/**
 * @file predicates.h
 * @brief Nullish, emptiness and primitive classification of values
 *
 * The value model covers the statically typed C++ kinds (text, numbers,
 * booleans, std::optional, calendar timestamps, std::vector, std::map, user
 * structs) plus Json::Value, whose kind is only known at runtime.
 *
 * Emptiness rules:
 *   - numbers and booleans are never empty
 *   - nullish values (absent, null, the text "undefined") are empty
 *   - calendar timestamps are never empty
 *   - a structure with zero own keys is empty (shallow check); keyed
 *     containers (std::map, std::unordered_map, std::set, ...) count as
 *     structures
 *   - a sequence is empty when it has no elements or every element is empty;
 *     any other range (std::vector, std::list, std::deque, std::array, ...)
 *     counts as a sequence
 *   - the empty text is empty
 *
 * @version 1.0.0
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <json/json.h>

namespace domaincore {
namespace utils {

/// Calendar timestamp kind
using Timestamp = std::chrono::system_clock::time_point;

/// Text treated as a nullish placeholder (stringified absent value)
inline constexpr std::string_view kUndefinedLiteral = "undefined";

/**
 * @brief Compile-time primitive check for statically typed values
 *
 * Text, booleans, numbers, absent/null values and timestamps are primitive.
 * Json::Value is not covered here because its kind is a runtime property;
 * use isPrimitive(const Json::Value&) instead.
 */
template <typename T>
struct is_primitive : std::disjunction<
    std::is_arithmetic<T>,
    std::is_same<T, std::string>,
    std::is_same<T, std::string_view>,
    std::is_same<T, const char*>,
    std::is_same<T, char*>,
    std::is_same<T, std::nullptr_t>,
    std::is_same<T, std::nullopt_t>,
    std::is_same<T, Timestamp>
> {};

template <typename T>
struct is_primitive<std::optional<T>> : is_primitive<T> {};

template <typename T>
inline constexpr bool is_primitive_v = is_primitive<std::decay_t<T>>::value;

/**
 * @brief Text kinds that point at characters owned by someone else
 */
template <typename T>
struct is_borrowed_text : std::disjunction<
    std::is_same<T, std::string_view>,
    std::is_same<T, const char*>,
    std::is_same<T, char*>
> {};

template <typename T>
struct is_borrowed_text<std::optional<T>> : is_borrowed_text<T> {};

template <typename T>
inline constexpr bool is_borrowed_text_v = is_borrowed_text<std::decay_t<T>>::value;

namespace detail {

template <typename T, typename = void>
struct is_range : std::false_type {};

template <typename T>
struct is_range<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                               decltype(std::end(std::declval<const T&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_key_type : std::false_type {};

template <typename T>
struct has_key_type<T, std::void_t<typename T::key_type>> : std::true_type {};

} // namespace detail

// -----------------------------------------------------------------------------
// isNullish
// -----------------------------------------------------------------------------

/**
 * @brief Check whether a value is absent, null or the text "undefined"
 */
bool isNullish(const Json::Value& value) noexcept;

inline bool isNullish(std::nullopt_t) noexcept { return true; }
inline bool isNullish(std::nullptr_t) noexcept { return true; }

inline bool isNullish(std::string_view value) noexcept {
    return value == kUndefinedLiteral;
}

inline bool isNullish(const std::string& value) noexcept {
    return value == kUndefinedLiteral;
}

inline bool isNullish(const char* value) noexcept {
    return value == nullptr || kUndefinedLiteral == value;
}

inline bool isNullish(char* value) noexcept {
    return isNullish(static_cast<const char*>(value));
}

template <typename T>
bool isNullish(const std::optional<T>& value) noexcept;

template <typename T>
bool isNullish(const T& value) noexcept;

template <typename T>
bool isNullish(const std::optional<T>& value) noexcept {
    return !value.has_value() || isNullish(*value);
}

template <typename T>
bool isNullish(const T&) noexcept {
    return false;
}

// -----------------------------------------------------------------------------
// isEmpty
// -----------------------------------------------------------------------------

/**
 * @brief Check whether a Json::Value is empty
 *
 * Arrays are checked element-wise, objects by key count only.
 */
bool isEmpty(const Json::Value& value) noexcept;

inline bool isEmpty(std::nullopt_t) noexcept { return true; }
inline bool isEmpty(std::nullptr_t) noexcept { return true; }

inline bool isEmpty(std::string_view value) noexcept {
    return value.empty() || isNullish(value);
}

inline bool isEmpty(const std::string& value) noexcept {
    return value.empty() || isNullish(value);
}

inline bool isEmpty(const char* value) noexcept {
    return isNullish(value) || *value == '\0';
}

inline bool isEmpty(char* value) noexcept {
    return isEmpty(static_cast<const char*>(value));
}

/// Timestamps are never empty, whatever instant they hold
inline bool isEmpty(const Timestamp&) noexcept { return false; }

template <typename T>
bool isEmpty(const std::optional<T>& value) noexcept;

template <typename T>
bool isEmpty(const T& value) noexcept;

template <typename T>
bool isEmpty(const std::optional<T>& value) noexcept {
    return !value.has_value() || isEmpty(*value);
}

/**
 * @brief Fallback for numbers, booleans, containers and user structs
 *
 * Keyed containers are checked by key count only. Other ranges are empty
 * when every element is (vacuously true for zero elements). A user struct
 * counts as a structure whose own keys are its data members, so only a
 * struct without members is empty.
 */
template <typename T>
bool isEmpty([[maybe_unused]] const T& value) noexcept {
    if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>) {
        return false;
    } else if constexpr (detail::has_key_type<T>::value) {
        return value.empty();
    } else if constexpr (detail::is_range<T>::value) {
        return std::all_of(std::begin(value), std::end(value),
                           [](const auto& item) { return isEmpty(item); });
    } else if constexpr (std::is_class_v<T>) {
        return std::is_empty_v<T>;
    } else {
        return false;
    }
}

// -----------------------------------------------------------------------------
// isPrimitive
// -----------------------------------------------------------------------------

/**
 * @brief Check whether a Json::Value holds a primitive
 * @return false for arrays and objects
 */
bool isPrimitive(const Json::Value& value) noexcept;

template <typename T>
constexpr bool isPrimitive(const T&) noexcept {
    return is_primitive_v<T>;
}

} // namespace utils
} // namespace domaincore

/**
 * @file serialized_exception.h
 * @brief Plain serialized shape of a domain exception
 */

#pragma once

#include <optional>
#include <string>
#include <json/json.h>

namespace domaincore {
namespace exception {

/**
 * @brief Serialized form of an exception, safe to log or transmit
 *
 * Optional fields that are absent are omitted from the JSON form rather
 * than written as null.
 *
 * @warning metadata may appear in logs and must not carry sensitive data.
 */
struct SerializedException {
    std::string message;
    std::string code;
    std::optional<std::string> stack;       ///< Diagnostics only, not stable across runs
    std::optional<std::string> cause;       ///< Compact JSON of the underlying error
    std::optional<Json::Value> metadata;

    /**
     * @brief Convert to a JSON object
     */
    Json::Value toJson() const;

    /**
     * @brief Convert to compact JSON text
     */
    std::string toJsonString() const;
};

} // namespace exception
} // namespace domaincore

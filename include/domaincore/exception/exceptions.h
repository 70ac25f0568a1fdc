/**
 * @file exceptions.h
 * @brief Concrete domain exception variants
 *
 * Each variant fixes a stable code used for programmatic branching.
 */

#pragma once

#include "domaincore/exception/exception_base.h"

namespace domaincore {
namespace exception {

/**
 * @brief A required argument was missing or empty
 *
 * Thrown by value objects constructed from empty input.
 */
class ArgumentNotProvidedException : public ExceptionBase {
public:
    static constexpr const char* kCode = "generic_argument_not_provided";

    explicit ArgumentNotProvidedException(std::string message,
                                          std::optional<Json::Value> metadata = std::nullopt,
                                          std::exception_ptr cause = nullptr)
        : ExceptionBase(std::move(message), std::move(metadata), std::move(cause)) {}

    [[nodiscard]] const char* getCode() const noexcept override {
        return kCode;
    }
};

/**
 * @brief An argument was provided but is not acceptable
 */
class ArgumentInvalidException : public ExceptionBase {
public:
    static constexpr const char* kCode = "generic_argument_invalid";

    explicit ArgumentInvalidException(std::string message,
                                      std::optional<Json::Value> metadata = std::nullopt,
                                      std::exception_ptr cause = nullptr)
        : ExceptionBase(std::move(message), std::move(metadata), std::move(cause)) {}

    [[nodiscard]] const char* getCode() const noexcept override {
        return kCode;
    }
};

/**
 * @brief An argument lies outside its permitted range
 */
class ArgumentOutOfRangeException : public ExceptionBase {
public:
    static constexpr const char* kCode = "generic_argument_out_of_range";

    explicit ArgumentOutOfRangeException(std::string message,
                                         std::optional<Json::Value> metadata = std::nullopt,
                                         std::exception_ptr cause = nullptr)
        : ExceptionBase(std::move(message), std::move(metadata), std::move(cause)) {}

    [[nodiscard]] const char* getCode() const noexcept override {
        return kCode;
    }
};

} // namespace exception
} // namespace domaincore

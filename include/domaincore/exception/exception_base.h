/**
 * @file exception_base.h
 * @brief Base class for typed domain exceptions
 */

#pragma once

#include "domaincore/exception/serialized_exception.h"
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <json/json.h>

namespace domaincore {
namespace exception {

/**
 * @brief Base class for domain exceptions with a stable machine-readable code
 *
 * Each concrete variant fixes its code at declaration time:
 * @code
 * class UserNotFoundException : public ExceptionBase {
 * public:
 *     static constexpr const char* kCode = "user_not_found";
 *     using ExceptionBase::ExceptionBase;
 *     const char* getCode() const noexcept override { return kCode; }
 * };
 * @endcode
 *
 * A best-effort backtrace is captured at construction unless stack capture
 * has been disabled process-wide.
 */
class ExceptionBase : public std::runtime_error {
private:
    std::string message_;
    std::optional<Json::Value> metadata_;
    std::exception_ptr cause_;
    std::optional<std::string> stack_;

public:
    /**
     * @brief Construct a new exception
     * @param message Human-readable error message, stored verbatim
     * @param metadata Optional extra information for debugging
     * @param cause Optional underlying error (e.g. std::current_exception())
     *
     * @warning Do not include sensitive data in metadata. It may appear in logs.
     */
    explicit ExceptionBase(std::string message,
                           std::optional<Json::Value> metadata = std::nullopt,
                           std::exception_ptr cause = nullptr);

    ~ExceptionBase() override = default;

    /**
     * @brief Get the error code of the concrete variant
     */
    [[nodiscard]] virtual const char* getCode() const noexcept = 0;

    /**
     * @brief Get the error message
     */
    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }

    [[nodiscard]] const std::optional<Json::Value>& getMetadata() const noexcept {
        return metadata_;
    }

    [[nodiscard]] std::exception_ptr getCause() const noexcept {
        return cause_;
    }

    /**
     * @brief Get the backtrace captured at construction, if any
     */
    [[nodiscard]] const std::optional<std::string>& getStack() const noexcept {
        return stack_;
    }

    /**
     * @brief Serialize to a plain structure for logging or transmission
     *
     * The cause, when present, is rendered as compact JSON text.
     */
    [[nodiscard]] SerializedException serialize() const;

    /**
     * @brief Enable or disable backtrace capture for exceptions created afterwards
     */
    static void setStackCaptureEnabled(bool enabled) noexcept;

    static bool isStackCaptureEnabled() noexcept;
};

/**
 * @brief Render an exception as compact JSON text of its own fields
 *
 * ExceptionBase instances render their serialized form; other
 * std::exception types render {"message": what()}. An empty cause renders
 * as null.
 */
std::string renderCause(const std::exception_ptr& cause);

} // namespace exception
} // namespace domaincore

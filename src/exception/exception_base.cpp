/**
 * @file exception_base.cpp
 * @brief ExceptionBase implementation
 */

#include "domaincore/exception/exception_base.h"
#include "domaincore/utils/value_format.h"
#include <atomic>
#include <boost/stacktrace.hpp>

namespace domaincore {
namespace exception {

namespace {

constexpr std::size_t kMaxStackFrames = 64;

std::atomic<bool> stackCaptureEnabled{true};

std::optional<std::string> captureStack() {
    if (!stackCaptureEnabled.load(std::memory_order_relaxed)) {
        return std::nullopt;
    }

    // Skip this helper and the ExceptionBase constructor
    boost::stacktrace::stacktrace trace(2, kMaxStackFrames);
    if (trace.empty()) {
        return std::nullopt;
    }
    return boost::stacktrace::to_string(trace);
}

} // anonymous namespace

ExceptionBase::ExceptionBase(std::string message,
                             std::optional<Json::Value> metadata,
                             std::exception_ptr cause)
    : std::runtime_error(message),
      message_(std::move(message)),
      metadata_(std::move(metadata)),
      cause_(std::move(cause)),
      stack_(captureStack()) {}

SerializedException ExceptionBase::serialize() const {
    SerializedException serialized;
    serialized.message = message_;
    serialized.code = getCode();
    serialized.stack = stack_;
    if (cause_) {
        serialized.cause = renderCause(cause_);
    }
    serialized.metadata = metadata_;
    return serialized;
}

void ExceptionBase::setStackCaptureEnabled(bool enabled) noexcept {
    stackCaptureEnabled.store(enabled, std::memory_order_relaxed);
}

bool ExceptionBase::isStackCaptureEnabled() noexcept {
    return stackCaptureEnabled.load(std::memory_order_relaxed);
}

std::string renderCause(const std::exception_ptr& cause) {
    if (!cause) {
        return utils::toJsonString(Json::Value(Json::nullValue));
    }

    Json::Value rendered(Json::objectValue);
    try {
        std::rethrow_exception(cause);
    } catch (const ExceptionBase& e) {
        rendered = e.serialize().toJson();
    } catch (const std::exception& e) {
        rendered["message"] = e.what();
    } catch (...) {
        // Not derived from std::exception: nothing inspectable
        rendered["message"] = "unknown error";
    }
    return utils::toJsonString(rendered);
}

} // namespace exception
} // namespace domaincore

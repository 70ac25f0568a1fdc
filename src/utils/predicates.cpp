/**
 * @file predicates.cpp
 * @brief Json::Value overloads of the value predicates
 */

#include "domaincore/utils/predicates.h"

namespace domaincore {
namespace utils {

namespace {

std::string_view stringView(const Json::Value& value) noexcept {
    const char* begin = nullptr;
    const char* end = nullptr;
    if (!value.getString(&begin, &end)) {
        return {};
    }
    return std::string_view(begin, static_cast<size_t>(end - begin));
}

} // anonymous namespace

bool isNullish(const Json::Value& value) noexcept {
    if (value.isNull()) {
        return true;
    }
    return value.isString() && stringView(value) == kUndefinedLiteral;
}

bool isEmpty(const Json::Value& value) noexcept {
    switch (value.type()) {
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue:
        case Json::booleanValue:
            return false;
        case Json::nullValue:
            return true;
        case Json::stringValue: {
            std::string_view text = stringView(value);
            return text.empty() || text == kUndefinedLiteral;
        }
        case Json::arrayValue:
            for (const auto& item : value) {
                if (!isEmpty(item)) {
                    return false;
                }
            }
            return true;
        case Json::objectValue:
            // Shallow: nested members are not inspected
            return value.size() == 0;
    }
    return false;
}

bool isPrimitive(const Json::Value& value) noexcept {
    return !value.isArray() && !value.isObject();
}

} // namespace utils
} // namespace domaincore

/**
 * @file value_format.cpp
 * @brief Text and JSON rendering implementation
 */

#include "domaincore/utils/value_format.h"
#include "domaincore/utils/time_utils.h"
#include <spdlog/fmt/fmt.h>

namespace domaincore {
namespace utils {

std::string toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

std::string formatNumber(double value) {
    return fmt::format("{}", value);
}

std::string formatValue(const Json::Value& value) {
    switch (value.type()) {
        case Json::nullValue:
            return "null";
        case Json::stringValue:
            return value.asString();
        case Json::booleanValue:
            return value.asBool() ? "true" : "false";
        case Json::intValue:
            return std::to_string(value.asInt64());
        case Json::uintValue:
            return std::to_string(value.asUInt64());
        case Json::realValue:
            return formatNumber(value.asDouble());
        case Json::arrayValue:
        case Json::objectValue:
            return toJsonString(value);
    }
    return toJsonString(value);
}

std::string formatValue(const Timestamp& value) {
    return formatIso8601(value, true);
}

Json::Value toJson(const Timestamp& value) {
    return Json::Value(formatIso8601(value, true));
}

} // namespace utils
} // namespace domaincore

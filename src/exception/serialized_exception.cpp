/**
 * @file serialized_exception.cpp
 */

#include "domaincore/exception/serialized_exception.h"
#include "domaincore/utils/value_format.h"

namespace domaincore {
namespace exception {

Json::Value SerializedException::toJson() const {
    Json::Value json(Json::objectValue);
    json["message"] = message;
    json["code"] = code;
    if (stack) {
        json["stack"] = *stack;
    }
    if (cause) {
        json["cause"] = *cause;
    }
    if (metadata) {
        json["metadata"] = *metadata;
    }
    return json;
}

std::string SerializedException::toJsonString() const {
    return utils::toJsonString(toJson());
}

} // namespace exception
} // namespace domaincore

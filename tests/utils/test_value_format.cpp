/**
 * @file test_value_format.cpp
 * @brief Unit tests for text and JSON rendering of values
 */

#include <gtest/gtest.h>
#include <domaincore/utils/value_format.h>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace domaincore::utils;

TEST(ValueFormatTest, Primitives) {
    EXPECT_EQ(formatValue(std::string("a@b.com")), "a@b.com");
    EXPECT_EQ(formatValue("text"), "text");
    EXPECT_EQ(formatValue(true), "true");
    EXPECT_EQ(formatValue(false), "false");
    EXPECT_EQ(formatValue(42), "42");
    EXPECT_EQ(formatValue(-7L), "-7");
    EXPECT_EQ(formatValue(2.5), "2.5");
    EXPECT_EQ(formatValue(nullptr), "null");
    EXPECT_EQ(formatValue(std::optional<int>{}), "undefined");
    EXPECT_EQ(formatValue(std::optional<int>(5)), "5");
}

TEST(ValueFormatTest, MutableCharBuffers) {
    char text[] = "buffer";
    char* none = nullptr;

    EXPECT_EQ(formatValue(text), "buffer");
    EXPECT_EQ(formatValue(none), "null");
    EXPECT_EQ(toJson(text), Json::Value("buffer"));
    EXPECT_TRUE(toJson(none).isNull());
}

TEST(ValueFormatTest, LargeNumbersUseExponentForm) {
    EXPECT_EQ(formatNumber(1e20), "1e+20");
    EXPECT_EQ(formatNumber(123456.5), "123456.5");
}

TEST(ValueFormatTest, Timestamp) {
    auto tp = Timestamp(std::chrono::seconds(1700000000)) + std::chrono::milliseconds(42);
    EXPECT_EQ(formatValue(tp), "2023-11-14T22:13:20.042Z");
}

TEST(ValueFormatTest, JsonPrimitives) {
    EXPECT_EQ(formatValue(Json::Value("text")), "text");
    EXPECT_EQ(formatValue(Json::Value(3)), "3");
    EXPECT_EQ(formatValue(Json::Value(2.5)), "2.5");
    EXPECT_EQ(formatValue(Json::Value(true)), "true");
    EXPECT_EQ(formatValue(Json::Value()), "null");
}

TEST(ValueFormatTest, ToJsonStringIsCompact) {
    Json::Value object(Json::objectValue);
    object["b"] = 2;
    object["a"] = "x";
    EXPECT_EQ(toJsonString(object), R"({"a":"x","b":2})");

    Json::Value array(Json::arrayValue);
    array.append(1);
    array.append("two");
    EXPECT_EQ(toJsonString(array), R"([1,"two"])");
}

TEST(ValueFormatTest, ContainersToJson) {
    std::vector<std::string> tags{"red", "green"};
    EXPECT_EQ(toJsonString(toJson(tags)), R"(["red","green"])");

    std::map<std::string, int> counts{{"apples", 3}, {"pears", 0}};
    EXPECT_EQ(toJsonString(toJson(counts)), R"({"apples":3,"pears":0})");

    std::vector<std::optional<int>> sparse{1, std::nullopt};
    EXPECT_EQ(toJsonString(toJson(sparse)), "[1,null]");
}

TEST(ValueFormatTest, ToJsonDetection) {
    static_assert(has_to_json_v<std::string>);
    static_assert(has_to_json_v<std::vector<int>>);
    static_assert(has_to_json_v<Json::Value>);
    SUCCEED();
}

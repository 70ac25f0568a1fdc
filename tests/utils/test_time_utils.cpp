/**
 * @file test_time_utils.cpp
 * @brief Unit tests for time utility functions
 */

#include <gtest/gtest.h>
#include <domaincore/utils/time_utils.h>

using namespace domaincore::utils;
using namespace std::chrono;

TEST(TimeUtilsTest, FormatIso8601_Epoch) {
    EXPECT_EQ(formatIso8601(system_clock::time_point{}), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatIso8601(system_clock::time_point{}, true), "1970-01-01T00:00:00.000Z");
}

TEST(TimeUtilsTest, FormatIso8601_Milliseconds) {
    auto tp = system_clock::time_point(seconds(1700000000)) + milliseconds(123);
    EXPECT_EQ(formatIso8601(tp), "2023-11-14T22:13:20Z");
    EXPECT_EQ(formatIso8601(tp, true), "2023-11-14T22:13:20.123Z");
}

TEST(TimeUtilsTest, FormatIso8601_BeforeEpoch) {
    auto tp = system_clock::time_point{} - milliseconds(500);
    EXPECT_EQ(formatIso8601(tp, true), "1969-12-31T23:59:59.500Z");
}

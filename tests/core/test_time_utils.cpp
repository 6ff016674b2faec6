#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include <thread>
#include <vector>
#include "renewfolio/core/time_utils.hpp"

using namespace renewfolio;
using namespace renewfolio::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    std::tm* ret = safe_gmtime(&now, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_GE(result.tm_year, 100);
    EXPECT_GE(result.tm_mon, 0);
    EXPECT_LE(result.tm_mon, 11);
    EXPECT_GE(result.tm_hour, 0);
    EXPECT_LE(result.tm_hour, 23);
}

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    ASSERT_NE(safe_gmtime(&epoch, &result), nullptr);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeLocaltimeThreadSafety) {
    std::vector<std::thread> threads;
    std::vector<int> years(8, 0);

    for (size_t i = 0; i < years.size(); ++i) {
        threads.emplace_back([&years, i]() {
            std::time_t t = 86400 * 365 * 30;
            std::tm result;
            if (safe_localtime(&t, &result) != nullptr) {
                years[i] = result.tm_year;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int year : years) {
        EXPECT_EQ(year, years.front());
        EXPECT_GE(year, 99);
    }
}

TEST_F(TimeUtilsTest, ParseDateAndDateTime) {
    auto date = parse_utc_timestamp("2024-01-01");
    ASSERT_TRUE(date.is_ok());
    EXPECT_EQ(format_utc_timestamp(date.value()), "2024-01-01T00:00:00Z");

    auto full = parse_utc_timestamp("2023-07-15T13:45:10Z");
    ASSERT_TRUE(full.is_ok());
    EXPECT_EQ(format_utc_timestamp(full.value()), "2023-07-15T13:45:10Z");

    auto no_zone = parse_utc_timestamp("2023-07-15T13:45:10");
    ASSERT_TRUE(no_zone.is_ok());
    EXPECT_EQ(no_zone.value(), full.value());
}

TEST_F(TimeUtilsTest, ParseRejectsMalformedText) {
    auto garbage = parse_utc_timestamp("last tuesday");
    ASSERT_TRUE(garbage.is_error());
    EXPECT_EQ(garbage.error()->code(), ErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE(parse_utc_timestamp("2024-13-01").is_error());
    EXPECT_TRUE(parse_utc_timestamp("2024-01-01T25:00:00Z").is_error());
}

TEST_F(TimeUtilsTest, CalendarAccessors) {
    // 2024-01-01 is a Monday
    auto monday = parse_utc_timestamp("2024-01-01T05:00:00Z").value();
    EXPECT_EQ(hour_of_day(monday), 5);
    EXPECT_EQ(day_of_week(monday), 0);
    EXPECT_EQ(day_of_year(monday), 1);
    EXPECT_EQ(month_of_year(monday), 1);
    EXPECT_FALSE(is_weekend(monday));

    auto saturday = parse_utc_timestamp("2024-01-06T12:00:00Z").value();
    EXPECT_EQ(day_of_week(saturday), 5);
    EXPECT_TRUE(is_weekend(saturday));

    // Leap year: March 1st is day 61
    auto march = parse_utc_timestamp("2024-03-01").value();
    EXPECT_EQ(day_of_year(march), 61);
    EXPECT_EQ(month_of_year(march), 3);
}

TEST_F(TimeUtilsTest, DaysFromCivil) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(1970, 1, 2), 1);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
}

TEST_F(TimeUtilsTest, GetFormattedTimeMatchesPattern) {
    std::string formatted = get_formatted_time("%Y-%m-%d %H:%M:%S", false);
    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    EXPECT_TRUE(std::regex_match(formatted, pattern)) << formatted;
}

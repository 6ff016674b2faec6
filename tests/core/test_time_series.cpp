#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "renewfolio/core/time_series.hpp"
#include "renewfolio/core/time_utils.hpp"

using namespace renewfolio;

class TimeSeriesTest : public ::testing::Test {
protected:
    Timestamp start = core::parse_utc_timestamp("2024-01-01T00:00:00Z").value();
};

TEST_F(TimeSeriesTest, HourlyBuildsContiguousTimestamps) {
    auto series = TimeSeries::hourly(start, {1.0, 2.0, 3.0});
    ASSERT_TRUE(series.is_ok());

    const auto& s = series.value();
    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s.start(), start);
    EXPECT_EQ(s.end(), start + std::chrono::hours(2));
    EXPECT_DOUBLE_EQ(s[1], 2.0);
}

TEST_F(TimeSeriesTest, CreateRejectsGap) {
    std::vector<Timestamp> ts{start, start + std::chrono::hours(1), start + std::chrono::hours(3)};
    auto series = TimeSeries::create(ts, {1.0, 2.0, 3.0});
    ASSERT_TRUE(series.is_error());
    EXPECT_EQ(series.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(TimeSeriesTest, CreateRejectsDecreasingTimestamps) {
    std::vector<Timestamp> ts{start + std::chrono::hours(1), start};
    EXPECT_TRUE(TimeSeries::create(ts, {1.0, 2.0}).is_error());
}

TEST_F(TimeSeriesTest, CreateRejectsLengthMismatch) {
    auto series = TimeSeries::create(hourly_timestamps(start, 3), {1.0, 2.0});
    ASSERT_TRUE(series.is_error());
    EXPECT_EQ(series.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(TimeSeriesTest, CreateRejectsNonFiniteValues) {
    auto nan = TimeSeries::hourly(start, {1.0, std::nan(""), 3.0});
    EXPECT_TRUE(nan.is_error());

    auto inf = TimeSeries::hourly(start, {std::numeric_limits<double>::infinity()});
    EXPECT_TRUE(inf.is_error());
}

TEST_F(TimeSeriesTest, SliceKeepsTimestamps) {
    auto series = TimeSeries::hourly(start, {1.0, 2.0, 3.0, 4.0}).value();

    auto middle = series.slice(1, 2);
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(middle.value().size(), 2u);
    EXPECT_EQ(middle.value().start(), start + std::chrono::hours(1));
    EXPECT_DOUBLE_EQ(middle.value()[1], 3.0);

    auto out_of_range = series.slice(3, 2);
    ASSERT_TRUE(out_of_range.is_error());
    EXPECT_EQ(out_of_range.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(TimeSeriesTest, AlignmentAndMap) {
    auto a = TimeSeries::hourly(start, {1.0, 2.0}).value();
    auto b = TimeSeries::hourly(start, {5.0, 6.0}).value();
    auto c = TimeSeries::hourly(start + std::chrono::hours(1), {5.0, 6.0}).value();

    EXPECT_TRUE(a.aligned_with(b));
    EXPECT_FALSE(a.aligned_with(c));

    auto doubled = a.map([](double v) { return 2.0 * v; });
    ASSERT_TRUE(doubled.is_ok());
    EXPECT_TRUE(doubled.value().aligned_with(a));
    EXPECT_DOUBLE_EQ(doubled.value()[1], 4.0);

    auto broken = a.map([](double) { return std::nan(""); });
    EXPECT_TRUE(broken.is_error());
}

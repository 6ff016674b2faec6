//===== test_base.hpp =====
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include <vector>
#include "renewfolio/core/logger.hpp"
#include "renewfolio/core/time_series.hpp"
#include "renewfolio/core/time_utils.hpp"

namespace renewfolio {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = LogLevel::ERR;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }

    static Timestamp start_time() {
        return core::parse_utc_timestamp("2024-01-01T00:00:00Z").value();
    }

    static TimeSeries hourly_series(const std::vector<double>& values) {
        return TimeSeries::hourly(start_time(), values).value();
    }
};

}  // namespace testing
}  // namespace renewfolio

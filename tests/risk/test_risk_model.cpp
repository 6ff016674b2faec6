#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include "renewfolio/risk/risk_model.hpp"
#include "../core/test_base.hpp"

using namespace renewfolio;
using namespace renewfolio::testing;
using ::testing::_;
using ::testing::Invoke;

namespace {

class MockVolatilityModel : public VolatilityModel {
public:
    MOCK_METHOD(Result<void>, fit, (const TimeSeries& prices), (override));
    MOCK_METHOD(Result<TimeSeries>, forecast, (int horizon), (const, override));
    MOCK_METHOD(Result<double>, get_current_volatility, (), (const, override));
    MOCK_METHOD(Result<double>, unconditional_variance, (), (const, override));
    MOCK_METHOD(Result<void>, update, (double new_price), (override));
    MOCK_METHOD(bool, is_fitted, (), (const, override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

}  // namespace

class RiskModelTest : public TestBase {
protected:
    TimeSeries noisy_prices(size_t n) {
        std::vector<double> prices;
        for (size_t i = 0; i < n; ++i) {
            prices.push_back(40.0 + 3.0 * std::sin(0.7 * static_cast<double>(i)) +
                             static_cast<double>(i % 5));
        }
        return hourly_series(prices);
    }
};

TEST_F(RiskModelTest, FallsBackWhenPrimaryFitFails) {
    auto mock = std::make_unique<MockVolatilityModel>();
    EXPECT_CALL(*mock, fit(_)).WillOnce(Invoke([](const TimeSeries&) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR, "did not converge", "Mock");
    }));
    EXPECT_CALL(*mock, name()).WillRepeatedly(Invoke([]() { return std::string("Mock"); }));

    RiskModel model(RiskModelConfig{}, std::move(mock));
    auto fit = model.fit(noisy_prices(200));
    ASSERT_TRUE(fit.is_ok()) << fit.error()->what();

    EXPECT_TRUE(model.is_fitted());
    EXPECT_TRUE(model.used_fallback());
    EXPECT_EQ(model.active_model_name(), "SampleVariance");

    auto ratio = model.variance_ratio(100);
    ASSERT_TRUE(ratio.is_ok());
    EXPECT_NEAR(ratio.value(), 1.0, 1e-12);
}

TEST_F(RiskModelTest, InsufficientDataPropagates) {
    auto mock = std::make_unique<MockVolatilityModel>();
    EXPECT_CALL(*mock, fit(_)).WillOnce(Invoke([](const TimeSeries&) {
        return make_error<void>(ErrorCode::INSUFFICIENT_DATA, "too short", "Mock");
    }));

    RiskModel model(RiskModelConfig{}, std::move(mock));
    auto fit = model.fit(noisy_prices(10));
    ASSERT_TRUE(fit.is_error());
    EXPECT_EQ(fit.error()->code(), ErrorCode::INSUFFICIENT_DATA);
    EXPECT_FALSE(model.is_fitted());
    EXPECT_EQ(model.active_model_name(), "none");
}

TEST_F(RiskModelTest, FallbackCanBeDisabled) {
    RiskModelConfig config;
    config.fallback_to_sample_variance = false;
    config.garch.max_iterations = 1;

    RiskModel model(config);
    auto fit = model.fit(noisy_prices(300));
    ASSERT_TRUE(fit.is_error());
    EXPECT_EQ(fit.error()->code(), ErrorCode::MODEL_FIT_ERROR);
    EXPECT_FALSE(model.used_fallback());
}

TEST_F(RiskModelTest, GarchNonConvergenceUsesSampleVariance) {
    RiskModelConfig config;
    config.garch.max_iterations = 1;

    RiskModel model(config);
    auto fit = model.fit(noisy_prices(300));
    ASSERT_TRUE(fit.is_ok()) << fit.error()->what();
    EXPECT_TRUE(model.used_fallback());

    auto forecast = model.forecast(24);
    ASSERT_TRUE(forecast.is_ok());
    EXPECT_EQ(forecast.value().size(), 24u);
    EXPECT_EQ(forecast.value().start(), start_time() + SERIES_STEP * 300L);
}

TEST_F(RiskModelTest, ConstantPricesHaveNoUsableVariance) {
    RiskModel model(RiskModelConfig{});
    ASSERT_TRUE(model.fit(hourly_series(std::vector<double>(100, 25.0))).is_ok());
    EXPECT_TRUE(model.used_fallback());

    auto ratio = model.variance_ratio(10);
    ASSERT_TRUE(ratio.is_error());
    EXPECT_EQ(ratio.error()->code(), ErrorCode::MODEL_FIT_ERROR);
}

TEST_F(RiskModelTest, UnfittedModel) {
    RiskModel model(RiskModelConfig{});
    EXPECT_EQ(model.forecast(5).error()->code(), ErrorCode::NOT_INITIALIZED);
    EXPECT_EQ(model.variance_ratio(5).error()->code(), ErrorCode::NOT_INITIALIZED);
}

TEST_F(RiskModelTest, FallbackWarningCarriesRiskModelTag) {
    RiskModelConfig config;
    config.garch.max_iterations = 1;
    RiskModel model(config);
    Logger::instance().set_level(LogLevel::WARNING);
    Logger::register_component("caller");

    std::stringstream captured;
    std::streambuf* original = std::cout.rdbuf(captured.rdbuf());
    auto fit = model.fit(noisy_prices(300));
    std::cout.rdbuf(original);
    ASSERT_TRUE(fit.is_ok()) << fit.error()->what();

    std::string line;
    bool found = false;
    while (std::getline(captured, line)) {
        if (line.find("falling back") != std::string::npos) {
            found = true;
            EXPECT_NE(line.find("[RiskModel]"), std::string::npos) << line;
        }
    }
    EXPECT_TRUE(found) << captured.str();
}

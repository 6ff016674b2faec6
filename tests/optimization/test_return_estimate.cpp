#include <gtest/gtest.h>
#include "renewfolio/optimization/return_estimate.hpp"
#include "../core/test_base.hpp"

namespace renewfolio {

class ReturnEstimateTest : public testing::TestBase {};

TEST_F(ReturnEstimateTest, FromHistoryAnnualizesMoments) {
    ReturnPanel panel;
    panel.assets = {"wind", "solar"};
    panel.returns = {hourly_series({0.001, 0.003, 0.002, 0.002}),
                     hourly_series({0.002, 0.000, 0.001, 0.001})};

    auto result = ReturnEstimate::from_history(panel, 100.0);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& estimate = result.value();

    EXPECT_EQ(estimate.observations, 4u);
    EXPECT_DOUBLE_EQ(estimate.periods_per_year, 100.0);
    EXPECT_NEAR(estimate.expected_returns(0), 0.2, 1e-12);
    EXPECT_NEAR(estimate.expected_returns(1), 0.1, 1e-12);

    // Deviations (-1, 1, 0, 0)e-3 and (1, -1, 0, 0)e-3 over 3 degrees of freedom
    EXPECT_NEAR(estimate.covariance(0, 0), 100.0 * 2e-6 / 3.0, 1e-15);
    EXPECT_NEAR(estimate.covariance(0, 1), -100.0 * 2e-6 / 3.0, 1e-15);
    EXPECT_DOUBLE_EQ(estimate.covariance(0, 1), estimate.covariance(1, 0));
}

TEST_F(ReturnEstimateTest, FromHistoryNeedsTwoAlignedPeriods) {
    ReturnPanel panel;
    panel.assets = {"wind", "solar"};
    panel.returns = {hourly_series({0.001}), hourly_series({0.002})};
    EXPECT_EQ(ReturnEstimate::from_history(panel, 8760.0).error()->code(),
              ErrorCode::INSUFFICIENT_DATA);

    panel.returns = {hourly_series({0.001, 0.002}), hourly_series({0.002, 0.001, 0.0})};
    EXPECT_EQ(ReturnEstimate::from_history(panel, 8760.0).error()->code(),
              ErrorCode::SERIES_MISMATCH);
}

TEST_F(ReturnEstimateTest, FromScenariosUsesEnsembleMoments) {
    AssetProfile wind = AssetProfile::default_wind();
    wind.capacity_mw = 1.0;
    wind.capex_per_mw = 1000.0;
    wind.fixed_om_per_mw_year = 0.0;
    RevenueModel revenue({wind});

    ScenarioSet set;
    set.assets = {"wind"};
    set.timestamps = hourly_timestamps(start_time(), 2);
    for (double price : {10.0, 20.0, 30.0}) {
        Realization realization;
        realization.price = {price, price};
        realization.generation_mw = {{1.0, 1.0}};
        set.realizations.push_back(realization);
    }

    auto result = ReturnEstimate::from_scenarios(set, revenue, 10.0);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    // Hourly returns 0.01, 0.02, 0.03 annualized with 10 periods
    EXPECT_NEAR(result.value().expected_returns(0), 0.2, 1e-12);
    EXPECT_NEAR(result.value().covariance(0, 0), 0.01, 1e-12);
    EXPECT_EQ(result.value().observations, 3u);

    set.assets = {"solar"};
    EXPECT_EQ(ReturnEstimate::from_scenarios(set, revenue, 10.0).error()->code(),
              ErrorCode::SERIES_MISMATCH);

    set.assets = {"wind"};
    set.realizations.resize(1);
    EXPECT_EQ(ReturnEstimate::from_scenarios(set, revenue, 10.0).error()->code(),
              ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(ReturnEstimateTest, ValidationAndScaling) {
    ReturnEstimate estimate;
    estimate.assets = {"a", "b"};
    estimate.expected_returns = Eigen::Vector2d(0.1, 0.05);
    estimate.covariance = Eigen::Matrix2d::Identity() * 0.04;
    EXPECT_TRUE(estimate.validate().is_ok());

    ASSERT_TRUE(estimate.scale_covariance(1.5).is_ok());
    EXPECT_NEAR(estimate.covariance(0, 0), 0.06, 1e-15);
    EXPECT_EQ(estimate.scale_covariance(0.0).error()->code(), ErrorCode::INVALID_ARGUMENT);

    estimate.covariance(0, 1) = 0.01;
    EXPECT_EQ(estimate.validate().error()->code(), ErrorCode::INVALID_DATA);

    estimate.covariance.resize(3, 3);
    EXPECT_EQ(estimate.validate().error()->code(), ErrorCode::INVALID_DATA);

    EXPECT_EQ(ReturnEstimate().validate().error()->code(), ErrorCode::INVALID_DATA);
}

}  // namespace renewfolio

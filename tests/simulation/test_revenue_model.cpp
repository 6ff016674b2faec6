#include <gtest/gtest.h>
#include "renewfolio/simulation/revenue_model.hpp"
#include "../core/test_base.hpp"

using namespace renewfolio;
using namespace renewfolio::testing;

class RevenueModelTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        wind = AssetProfile::default_wind();
        wind.capacity_mw = 10.0;
        wind.capex_per_mw = 1000.0;
        wind.fixed_om_per_mw_year = 8760.0;  // 1 $/MW/hour
        solar = AssetProfile::default_solar();
        solar.capacity_mw = 20.0;
        solar.capex_per_mw = 500.0;
        solar.fixed_om_per_mw_year = 0.0;
    }

    MarketInputs inputs(const std::vector<double>& price, const std::vector<double>& wind_mw,
                        const std::vector<double>& solar_mw) {
        MarketInputs in;
        in.price = hourly_series(price);
        in.assets = {"wind", "solar"};
        in.generation_mw = {hourly_series(wind_mw), hourly_series(solar_mw)};
        return in;
    }

    AssetProfile wind;
    AssetProfile solar;
};

TEST_F(RevenueModelTest, HourlyReturnOnInvestedCapital) {
    RevenueModel model({wind, solar});
    auto result = model.hourly_returns(inputs({50.0, 0.0}, {4.0, 10.0}, {20.0, 0.0}));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& panel = result.value();
    ASSERT_EQ(panel.assets.size(), 2u);
    EXPECT_EQ(panel.periods(), 2u);
    EXPECT_TRUE(panel.validate().is_ok());

    // (4 MW * 50 $ - 10 $ O&M) / 10,000 $
    EXPECT_NEAR(panel.returns[0][0], 0.019, 1e-15);
    // Zero price leaves only the O&M charge
    EXPECT_NEAR(panel.returns[0][1], -0.001, 1e-15);
    EXPECT_NEAR(panel.returns[1][0], 0.1, 1e-15);
    EXPECT_DOUBLE_EQ(panel.returns[1][1], 0.0);
}

TEST_F(RevenueModelTest, RejectsMismatchedInputs) {
    RevenueModel model({wind, solar});

    auto swapped = inputs({50.0}, {1.0}, {1.0});
    swapped.assets = {"solar", "wind"};
    EXPECT_EQ(model.hourly_returns(swapped).error()->code(), ErrorCode::SERIES_MISMATCH);

    auto missing = inputs({50.0}, {1.0}, {1.0});
    missing.generation_mw.pop_back();
    EXPECT_EQ(model.hourly_returns(missing).error()->code(), ErrorCode::SERIES_MISMATCH);

    auto misaligned = inputs({50.0, 40.0}, {1.0}, {1.0, 2.0});
    EXPECT_EQ(model.hourly_returns(misaligned).error()->code(), ErrorCode::SERIES_MISMATCH);
}

TEST_F(RevenueModelTest, AnnualizedReturnsPerRealization) {
    RevenueModel model({wind, solar});
    Realization realization;
    realization.price = {50.0, 0.0};
    realization.generation_mw = {{4.0, 10.0}, {20.0, 0.0}};

    auto annual = model.annualized_returns(realization, 8760.0);
    ASSERT_EQ(annual.size(), 2u);
    EXPECT_NEAR(annual[0], (0.019 - 0.001) / 2.0 * 8760.0, 1e-9);
    EXPECT_NEAR(annual[1], 0.05 * 8760.0, 1e-9);
}

TEST_F(RevenueModelTest, InputsFromFleetHistory) {
    std::vector<HourlyObservation> observations(3);
    for (size_t i = 0; i < observations.size(); ++i) {
        observations[i].timestamp = start_time() + SERIES_STEP * static_cast<long>(i);
        observations[i].price = 30.0;
        observations[i].load_mw = 1000.0;
    }
    observations[0].wind_mw = 500.0;
    observations[1].wind_mw = 1500.0;  // Above the stated fleet size, clamped
    observations[2].solar_mw = 250.0;
    auto dataset = MarketDataset::create(observations).value();

    RevenueModel model({wind, solar});
    auto result = model.inputs_from_dataset(dataset, 1000.0, 500.0);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& in = result.value();
    EXPECT_EQ(in.assets, (std::vector<std::string>{"wind", "solar"}));
    EXPECT_DOUBLE_EQ(in.generation_mw[0][0], 5.0);
    EXPECT_DOUBLE_EQ(in.generation_mw[0][1], 10.0);
    EXPECT_DOUBLE_EQ(in.generation_mw[1][2], 10.0);
    EXPECT_TRUE(model.hourly_returns(in).is_ok());

    EXPECT_EQ(model.inputs_from_dataset(dataset, 0.0, 500.0).error()->code(),
              ErrorCode::CONFIGURATION_ERROR);
}

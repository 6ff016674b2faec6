#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>
#include "renewfolio/simulation/power_models.hpp"
#include "renewfolio/simulation/price_model.hpp"
#include "../core/test_base.hpp"

using namespace renewfolio;
using namespace renewfolio::testing;

class PowerModelsTest : public TestBase {};

TEST_F(PowerModelsTest, WindPowerCurveShape) {
    WindParameters params;
    WindPowerCurve curve(params);

    EXPECT_DOUBLE_EQ(curve.capacity_fraction(0.0), 0.0);
    EXPECT_DOUBLE_EQ(curve.capacity_fraction(2.9), 0.0);
    EXPECT_DOUBLE_EQ(curve.capacity_fraction(3.0), 0.0);
    EXPECT_DOUBLE_EQ(curve.capacity_fraction(12.0), 1.0);
    EXPECT_DOUBLE_EQ(curve.capacity_fraction(20.0), 1.0);
    EXPECT_DOUBLE_EQ(curve.capacity_fraction(25.0), 0.0);
    EXPECT_DOUBLE_EQ(curve.capacity_fraction(40.0), 0.0);

    double expected = (std::pow(8.0, 3) - 27.0) / (std::pow(12.0, 3) - 27.0);
    EXPECT_NEAR(curve.capacity_fraction(8.0), expected, 1e-12);

    double previous = 0.0;
    for (double speed = 3.0; speed < 12.0; speed += 0.5) {
        double fraction = curve.capacity_fraction(speed);
        EXPECT_GE(fraction, previous);
        previous = fraction;
    }
}

TEST_F(PowerModelsTest, InverseCdfs) {
    // Median of Weibull(k, lambda) is lambda * ln(2)^(1/k)
    EXPECT_NEAR(weibull_quantile(0.5, 2.0, 8.0), 8.0 * std::sqrt(std::log(2.0)), 1e-12);
    EXPECT_TRUE(std::isfinite(weibull_quantile(1.0, 2.0, 8.0)));
    EXPECT_GE(weibull_quantile(0.0, 2.0, 8.0), 0.0);

    // Kumaraswamy(1, 1) is uniform
    EXPECT_NEAR(kumaraswamy_quantile(0.3, 1.0, 1.0), 0.3, 1e-12);
    for (double u : {0.0, 0.01, 0.5, 0.99, 1.0}) {
        double x = kumaraswamy_quantile(u, 0.8, 1.5);
        EXPECT_GE(x, 0.0);
        EXPECT_LE(x, 1.0);
    }
}

TEST_F(PowerModelsTest, ClearSkyIsZeroOutsideDaylight) {
    SolarParameters params;
    for (int day : {1, 80, 172, 355}) {
        EXPECT_EQ(clear_sky_fraction(params, 0, day), 0.0);
        EXPECT_EQ(clear_sky_fraction(params, 3, day), 0.0);
        EXPECT_EQ(clear_sky_fraction(params, 22, day), 0.0);
        double noon = clear_sky_fraction(params, 12, day);
        EXPECT_GT(noon, 0.0);
        EXPECT_LE(noon, params.clear_sky_peak);
    }
    // Longer and brighter days in summer
    EXPECT_GT(clear_sky_fraction(params, 12, 172), clear_sky_fraction(params, 12, 355));
}

TEST_F(PowerModelsTest, TemperatureDerate) {
    SolarParameters params;
    EXPECT_DOUBLE_EQ(temperature_derate(params, 25.0), 1.0);
    EXPECT_NEAR(temperature_derate(params, 50.0), 0.9, 1e-12);
    // Cold panels never exceed nameplate
    EXPECT_DOUBLE_EQ(temperature_derate(params, -10.0), 1.0);
}

TEST_F(PowerModelsTest, WeibullScaleModulation) {
    WindParameters params;
    double peak = modulated_weibull_scale(params, 22, 60);
    double trough = modulated_weibull_scale(params, 10, 242);
    EXPECT_NEAR(peak, params.weibull_scale * 1.15 * 1.10, 1e-9);
    EXPECT_LT(trough, params.weibull_scale);
}

TEST_F(PowerModelsTest, PriceModelValidation) {
    PriceModelConfig config;
    EXPECT_TRUE(PriceModel(config).validate().is_ok());

    config.ar_coefficient = 1.0;
    EXPECT_EQ(PriceModel(config).validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);

    config.ar_coefficient = 0.5;
    config.noise_std = -1.0;
    EXPECT_EQ(PriceModel(config).validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);

    config.noise_std = 1.0;
    config.spike_probability = 2.0;
    EXPECT_EQ(PriceModel(config).validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(PowerModelsTest, PriceModelFloorsAtZero) {
    PriceModelConfig config;
    config.base_level = 0.0;
    config.seasonal_amplitude = 0.0;
    config.diurnal_amplitude = 0.0;
    config.weekend_discount = 0.0;
    config.noise_std = 20.0;
    PriceModel model(config);

    auto rng = make_engine(5, RandomStream::PRICE, 0);
    auto prices = model.generate(hourly_timestamps(start_time(), 500), 1.0, rng);
    ASSERT_EQ(prices.size(), 500u);

    size_t zeros = 0;
    for (double p : prices) {
        EXPECT_GE(p, 0.0);
        if (p == 0.0) ++zeros;
    }
    EXPECT_GT(zeros, 0u);
}

TEST_F(PowerModelsTest, PriceLevelShape) {
    PriceModelConfig config;
    PriceModel model(config);
    // Monday 2024-01-01: noon sits at the top of the diurnal cycle
    auto monday_noon = start_time() + SERIES_STEP * 12L;
    auto saturday_noon = start_time() + SERIES_STEP * (12L + 5 * 24);
    EXPECT_GT(model.level(monday_noon), model.level(start_time()));
    EXPECT_NEAR(model.level(monday_noon) - model.level(saturday_noon), config.weekend_discount,
                1.5);
}

TEST_F(PowerModelsTest, PriceSpikesAreMultiplicative) {
    PriceModelConfig config;
    config.noise_std = 0.0;
    config.spike_probability = 0.0;
    const auto timestamps = hourly_timestamps(start_time(), 500);

    auto calm_rng = make_engine(11, RandomStream::PRICE, 0);
    auto calm = PriceModel(config).generate(timestamps, 1.0, calm_rng);
    for (size_t t = 0; t < timestamps.size(); ++t) {
        EXPECT_DOUBLE_EQ(calm[t], std::max(PriceModel(config).level(timestamps[t]), 0.0));
    }

    config.spike_probability = 1.0;
    PriceModel model(config);
    auto rng = make_engine(11, RandomStream::PRICE, 0);
    auto spiked = model.generate(timestamps, 1.0, rng);

    // Jump multiplier is 1 + exp(N(mean, sigma)); four sigmas below the mean bounds it
    const double floor_multiplier =
        1.0 + std::exp(config.spike_log_mean - 4.0 * config.spike_log_sigma);
    double largest_multiplier = 0.0;
    for (size_t t = 0; t < timestamps.size(); ++t) {
        const double level = model.level(timestamps[t]);
        EXPECT_GE(spiked[t], level * floor_multiplier - 1e-9);
        if (level > 1.0) {
            largest_multiplier = std::max(largest_multiplier, spiked[t] / level);
        }
    }
    // Heavy right tail: some hour jumps well past a doubling
    EXPECT_GT(largest_multiplier, 4.0);
}

TEST_F(PowerModelsTest, PriceDeviationsArePersistent) {
    PriceModelConfig config;
    config.base_level = 1000.0;
    config.seasonal_amplitude = 0.0;
    config.diurnal_amplitude = 0.0;
    config.weekend_discount = 0.0;
    config.spike_probability = 0.0;
    config.ar_coefficient = 0.9;
    config.noise_std = 5.0;
    PriceModel model(config);

    auto rng = make_engine(3, RandomStream::PRICE, 0);
    auto prices = model.generate(hourly_timestamps(start_time(), 5000), 1.0, rng);

    std::vector<double> deviation;
    deviation.reserve(prices.size());
    for (double p : prices) deviation.push_back(p - config.base_level);

    double m = 0.0;
    for (double d : deviation) m += d;
    m /= static_cast<double>(deviation.size());
    double lagged = 0.0, total = 0.0;
    for (size_t t = 0; t < deviation.size(); ++t) {
        total += (deviation[t] - m) * (deviation[t] - m);
        if (t > 0) lagged += (deviation[t] - m) * (deviation[t - 1] - m);
    }
    EXPECT_NEAR(lagged / total, 0.9, 0.03);
}

#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include "renewfolio/core/random_utils.hpp"
#include "renewfolio/core/time_utils.hpp"
#include "renewfolio/simulation/power_models.hpp"
#include "renewfolio/simulation/scenario_simulator.hpp"
#include "../core/test_base.hpp"

using namespace renewfolio;
using namespace renewfolio::testing;

class ScenarioSimulatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        profiles = {AssetProfile::default_wind(), AssetProfile::default_solar()};
        config.n_realizations = 20;
        config.horizon_hours = 24 * 14;
        config.seed = 42;
    }

    ScenarioSimulator make_simulator() const {
        return ScenarioSimulator(profiles, PriceModelConfig(), config);
    }

    std::vector<AssetProfile> profiles;
    SimulationConfig config;
};

TEST_F(ScenarioSimulatorTest, GenerationStaysWithinCapacity) {
    auto result = make_simulator().simulate();
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& set = result.value();
    ASSERT_EQ(set.size(), config.n_realizations);
    ASSERT_EQ(set.horizon(), static_cast<size_t>(config.horizon_hours));
    ASSERT_EQ(set.assets.size(), 2u);

    for (const auto& realization : set.realizations) {
        ASSERT_EQ(realization.generation_mw.size(), 2u);
        for (size_t a = 0; a < profiles.size(); ++a) {
            for (double mw : realization.generation_mw[a]) {
                EXPECT_GE(mw, 0.0);
                EXPECT_LE(mw, profiles[a].capacity_mw);
            }
        }
        for (double price : realization.price) {
            EXPECT_GE(price, 0.0);
        }
    }
}

TEST_F(ScenarioSimulatorTest, SolarIsZeroAtNight) {
    auto result = make_simulator().simulate();
    ASSERT_TRUE(result.is_ok());
    const auto& set = result.value();

    for (size_t t = 0; t < set.horizon(); ++t) {
        const int hour = core::hour_of_day(set.timestamps[t]);
        if (hour <= 4 || hour >= 19) {
            for (const auto& realization : set.realizations) {
                EXPECT_EQ(realization.generation_mw[1][t], 0.0) << "hour " << hour;
            }
        }
    }

    // Some daylight output somewhere in two weeks of scenarios
    double total = 0.0;
    for (const auto& realization : set.realizations) {
        for (double mw : realization.generation_mw[1]) total += mw;
    }
    EXPECT_GT(total, 0.0);
}

TEST_F(ScenarioSimulatorTest, SameSeedIsBitIdentical) {
    auto first = make_simulator().simulate();
    auto second = make_simulator().simulate();
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    for (size_t i = 0; i < config.n_realizations; ++i) {
        const auto& a = first.value().realizations[i];
        const auto& b = second.value().realizations[i];
        EXPECT_EQ(a.price, b.price);
        EXPECT_EQ(a.generation_mw, b.generation_mw);
    }

    config.seed = 43;
    auto other = make_simulator().simulate();
    ASSERT_TRUE(other.is_ok());
    EXPECT_NE(other.value().realizations[0].price, first.value().realizations[0].price);
}

TEST_F(ScenarioSimulatorTest, RealizationDoesNotDependOnEnsembleSize) {
    auto large = make_simulator().simulate();
    config.n_realizations = 3;
    auto small = make_simulator().simulate();
    ASSERT_TRUE(large.is_ok());
    ASSERT_TRUE(small.is_ok());

    EXPECT_EQ(small.value().realizations[2].price, large.value().realizations[2].price);
    EXPECT_EQ(small.value().realizations[2].generation_mw,
              large.value().realizations[2].generation_mw);
}

TEST_F(ScenarioSimulatorTest, RejectsNonPsdCorrelation) {
    profiles.push_back(AssetProfile::default_wind());
    profiles.back().name = "wind_b";
    config.correlation_matrix = {{1.0, 0.9, -0.9}, {0.9, 1.0, 0.9}, {-0.9, 0.9, 1.0}};

    auto result = make_simulator().simulate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(ScenarioSimulatorTest, RejectsMalformedCorrelation) {
    config.correlation_matrix = {{1.0, 0.3}};
    EXPECT_EQ(make_simulator().validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);

    config.correlation_matrix = {{1.0, 1.2}, {1.2, 1.0}};
    EXPECT_EQ(make_simulator().validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);

    config.correlation_matrix = {{0.5, 0.0}, {0.0, 1.0}};
    EXPECT_EQ(make_simulator().validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(ScenarioSimulatorTest, AcceptsPerfectCorrelation) {
    config.correlation_matrix = {{1.0, 1.0}, {1.0, 1.0}};
    auto result = make_simulator().simulate();
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
}

namespace {

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const double n = static_cast<double>(x.size());
    double mx = 0.0, my = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        mx += x[i];
        my += y[i];
    }
    mx /= n;
    my /= n;
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        sxy += (x[i] - mx) * (y[i] - my);
        sxx += (x[i] - mx) * (x[i] - mx);
        syy += (y[i] - my) * (y[i] - my);
    }
    return sxy / std::sqrt(sxx * syy);
}

}  // namespace

TEST_F(ScenarioSimulatorTest, GenerationFollowsTargetCorrelation) {
    AssetProfile north = AssetProfile::default_wind();
    north.name = "wind_north";
    north.resource_uncertainty = 0.0;
    AssetProfile south = north;
    south.name = "wind_south";
    profiles = {north, south};

    config.n_realizations = 1;
    config.horizon_hours = 4000;
    config.seed = 7;

    auto generation_correlation = [&](double rho) {
        config.correlation_matrix = {{1.0, rho}, {rho, 1.0}};
        auto result = make_simulator().simulate();
        EXPECT_TRUE(result.is_ok()) << result.error()->what();
        const auto& realization = result.value().realizations[0];
        return pearson(realization.generation_mw[0], realization.generation_mw[1]);
    };

    // The power curve is nonlinear, so generation correlation is weaker than the shock correlation
    EXPECT_GT(generation_correlation(0.9), 0.6);
    EXPECT_LT(generation_correlation(-0.9), -0.5);
    EXPECT_NEAR(generation_correlation(0.0), 0.0, 0.1);
}

TEST_F(ScenarioSimulatorTest, WeatherShocksComeOnlyFromWeatherStream) {
    // A single asset leaves an odd number of parameter draws before the weather loop
    AssetProfile wind = AssetProfile::default_wind();
    wind.resource_uncertainty = 0.0;
    profiles = {wind};
    config.n_realizations = 1;
    config.horizon_hours = 24;

    auto result = make_simulator().simulate();
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& set = result.value();

    auto rng = make_engine(config.seed, RandomStream::WEATHER, 0);
    std::normal_distribution<double> normal(0.0, 1.0);
    const double shock = normal(rng);
    const double scale = modulated_weibull_scale(wind.wind, core::hour_of_day(set.timestamps[0]),
                                                 core::day_of_year(set.timestamps[0]));
    const double speed = weibull_quantile(normal_cdf(shock), wind.wind.weibull_shape, scale);
    const double expected = WindPowerCurve(wind.wind).capacity_fraction(speed) * wind.capacity_mw;

    EXPECT_NEAR(set.realizations[0].generation_mw[0][0], expected, 1e-9);
}

TEST_F(ScenarioSimulatorTest, DefaultCorrelationFollowsWeatherLoadings) {
    auto corr = make_simulator().correlation();
    ASSERT_TRUE(corr.is_ok());
    EXPECT_NEAR(corr.value()(0, 1), 0.5 * -0.4, 1e-12);
    EXPECT_DOUBLE_EQ(corr.value()(0, 0), 1.0);
}

TEST_F(ScenarioSimulatorTest, RejectsBadStaticParameters) {
    profiles[0].capacity_mw = 0.0;
    auto zero_capacity = make_simulator().simulate();
    ASSERT_TRUE(zero_capacity.is_error());
    EXPECT_EQ(zero_capacity.error()->code(), ErrorCode::CONFIGURATION_ERROR);

    profiles[0].capacity_mw = 100.0;
    config.horizon_hours = 0;
    EXPECT_EQ(make_simulator().simulate().error()->code(), ErrorCode::CONFIGURATION_ERROR);

    config.horizon_hours = -5;
    EXPECT_EQ(make_simulator().validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);

    config.horizon_hours = 24;
    config.n_realizations = 0;
    EXPECT_EQ(make_simulator().validate().error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(ScenarioSimulatorTest, QuantileBandsAreOrdered) {
    auto set = make_simulator().simulate();
    ASSERT_TRUE(set.is_ok());

    auto summary = ScenarioSimulator::summarize(set.value());
    ASSERT_TRUE(summary.is_ok()) << summary.error()->what();
    const auto& s = summary.value();
    ASSERT_EQ(s.generation.size(), 2u);

    auto check = [](const QuantileBands& bands) {
        ASSERT_EQ(bands.p10.size(), bands.p90.size());
        for (size_t t = 0; t < bands.p50.size(); ++t) {
            EXPECT_LE(bands.p10[t], bands.p50[t]);
            EXPECT_LE(bands.p50[t], bands.p90[t]);
        }
    };
    check(s.price);
    check(s.generation[0]);
    check(s.generation[1]);

    auto j = s.to_json();
    EXPECT_EQ(j["timestamps"].size(), static_cast<size_t>(config.horizon_hours));
    EXPECT_TRUE(j["generation_mw"].contains("solar"));

    EXPECT_EQ(ScenarioSimulator::summarize(ScenarioSet()).error()->code(),
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ScenarioSimulatorTest, MarketInputsForRealization) {
    auto set = make_simulator().simulate();
    ASSERT_TRUE(set.is_ok());

    auto inputs = set.value().market_inputs(3);
    ASSERT_TRUE(inputs.is_ok());
    EXPECT_EQ(inputs.value().assets, set.value().assets);
    EXPECT_TRUE(inputs.value().generation_mw[0].aligned_with(inputs.value().price));
    EXPECT_EQ(inputs.value().price.values(), set.value().realizations[3].price);

    EXPECT_EQ(set.value().market_inputs(config.n_realizations).error()->code(),
              ErrorCode::INVALID_ARGUMENT);
}

// src/data/synthetic_market.cpp

#include "renewfolio/data/synthetic_market.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include "renewfolio/core/logger.hpp"
#include "renewfolio/core/random_utils.hpp"
#include "renewfolio/core/time_utils.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace renewfolio {

SyntheticMarketGenerator::SyntheticMarketGenerator(SyntheticMarketConfig config)
    : config_(std::move(config)) {
    Logger::register_component("SyntheticMarket");
}

Result<void> SyntheticMarketGenerator::validate_config() const {
    if (config_.hours == 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Synthetic history needs at least one hour",
                                "SyntheticMarketGenerator");
    }
    if (config_.wind_fleet_capacity_mw <= 0.0 || config_.solar_fleet_capacity_mw <= 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Fleet capacities must be positive, got wind=" +
                                    std::to_string(config_.wind_fleet_capacity_mw) +
                                    " solar=" + std::to_string(config_.solar_fleet_capacity_mw),
                                "SyntheticMarketGenerator");
    }
    if (config_.spike_probability < 0.0 || config_.spike_probability > 1.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Spike probability must lie in [0, 1], got " +
                                    std::to_string(config_.spike_probability),
                                "SyntheticMarketGenerator");
    }
    return Result<void>();
}

Result<MarketDataset> SyntheticMarketGenerator::generate() const {
    Logger::register_component("SyntheticMarket");
    auto valid = validate_config();
    if (valid.is_error()) {
        return forward_error<MarketDataset>(valid.error());
    }

    auto start_result = core::parse_utc_timestamp(config_.start);
    if (start_result.is_error()) {
        return make_error<MarketDataset>(ErrorCode::CONFIGURATION_ERROR,
                                         start_result.error()->what(),
                                         "SyntheticMarketGenerator");
    }
    const Timestamp start = start_result.value();

    auto price_rng = make_engine(config_.seed, RandomStream::MARKET_PRICE);
    auto load_rng = make_engine(config_.seed, RandomStream::MARKET_LOAD);
    auto renewable_rng = make_engine(config_.seed, RandomStream::MARKET_RENEWABLE);
    auto weather_rng = make_engine(config_.seed, RandomStream::MARKET_WEATHER);

    std::normal_distribution<double> price_noise(0.0, config_.noise_std);
    std::bernoulli_distribution spike(config_.spike_probability);
    std::normal_distribution<double> load_noise(0.0, 2000.0);
    std::uniform_real_distribution<double> wind_variation(0.8, 1.0);
    std::uniform_real_distribution<double> cloud_variation(0.7, 1.0);
    std::normal_distribution<double> temperature_noise(0.0, 3.0);
    std::uniform_real_distribution<double> irradiance_variation(0.8, 1.0);
    std::exponential_distribution<double> gust(0.5);  // mean 2 m/s

    std::vector<HourlyObservation> observations;
    observations.reserve(config_.hours);

    for (size_t i = 0; i < config_.hours; ++i) {
        HourlyObservation obs;
        obs.timestamp = start + SERIES_STEP * static_cast<long>(i);

        const double hour = core::hour_of_day(obs.timestamp);
        const double doy = core::day_of_year(obs.timestamp);
        const bool weekend = core::is_weekend(obs.timestamp);

        // Price: seasonal + diurnal shape, weekend discount, noise and rare spikes
        double price = config_.base_price +
                       config_.seasonal_amplitude * std::sin(2.0 * M_PI * doy / 365.0) +
                       config_.diurnal_amplitude * std::sin(2.0 * M_PI * (hour - 6.0) / 24.0) -
                       (weekend ? config_.weekend_discount : 0.0) + price_noise(price_rng);
        if (spike(price_rng)) {
            price += config_.spike_size;
        }
        obs.price = std::max(price, 0.0);

        // Load peaks in summer and winter
        double load = 50000.0 + 15000.0 * std::abs(std::sin(2.0 * M_PI * doy / 365.0)) +
                      10000.0 * std::sin(2.0 * M_PI * (hour - 6.0) / 24.0);
        load *= weekend ? 0.9 : 1.0;
        obs.load_mw = std::max(load + load_noise(load_rng), 0.0);

        // Wind is stronger in winter and spring, solar in summer daylight
        double wind_seasonal = 0.4 + 0.3 * std::sin(2.0 * M_PI * (doy - 90.0) / 365.0);
        obs.wind_mw = config_.wind_fleet_capacity_mw * wind_seasonal *
                      wind_variation(renewable_rng);

        double solar_shape = std::max(0.0, std::sin(M_PI * (hour - 6.0) / 12.0));
        double solar_seasonal = 0.5 + 0.3 * std::sin(2.0 * M_PI * (doy - 172.0) / 365.0);
        obs.solar_mw = config_.solar_fleet_capacity_mw * solar_shape * solar_seasonal *
                       cloud_variation(renewable_rng);

        // Weather covariates
        obs.temperature_f = 60.0 + 30.0 * std::sin(2.0 * M_PI * (doy - 90.0) / 365.0) +
                            10.0 * std::sin(2.0 * M_PI * (hour - 12.0) / 24.0) +
                            temperature_noise(weather_rng);
        double irradiance_seasonal = 0.5 + 0.5 * std::sin(2.0 * M_PI * (doy - 172.0) / 365.0);
        obs.irradiance_w_m2 = 1000.0 * solar_shape * irradiance_seasonal *
                              irradiance_variation(weather_rng);
        double wind_base = 5.0 + 3.0 * std::sin(2.0 * M_PI * doy / 365.0);
        obs.wind_speed_ms = std::min(wind_base + gust(weather_rng), 25.0);

        observations.push_back(obs);
    }

    INFO("Generated " << observations.size() << " hours of synthetic market data from "
                      << config_.start);
    return MarketDataset::create(std::move(observations));
}

}  // namespace renewfolio

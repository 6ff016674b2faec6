// src/simulation/price_model.cpp

#include "renewfolio/simulation/price_model.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include "renewfolio/core/time_utils.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace renewfolio {

PriceModel::PriceModel(PriceModelConfig config) : config_(std::move(config)) {}

Result<void> PriceModel::validate() const {
    if (!(std::abs(config_.ar_coefficient) < 1.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Price AR coefficient must satisfy |phi| < 1, got " +
                                    std::to_string(config_.ar_coefficient),
                                "PriceModel");
    }
    if (config_.noise_std < 0.0 || config_.spike_log_sigma < 0.0 ||
        config_.level_uncertainty < 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Price model standard deviations must be non-negative",
                                "PriceModel");
    }
    if (config_.spike_probability < 0.0 || config_.spike_probability > 1.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Spike probability must lie in [0, 1], got " +
                                    std::to_string(config_.spike_probability),
                                "PriceModel");
    }
    return Result<void>();
}

double PriceModel::level(const Timestamp& ts) const {
    const double hour = core::hour_of_day(ts);
    const double doy = core::day_of_year(ts);
    double value = config_.base_level +
                   config_.seasonal_amplitude * std::sin(2.0 * M_PI * doy / 365.0) +
                   config_.diurnal_amplitude * std::sin(2.0 * M_PI * (hour - 6.0) / 24.0);
    if (core::is_weekend(ts)) {
        value -= config_.weekend_discount;
    }
    return value;
}

double PriceModel::draw_level_factor(RandomEngine& rng) const {
    const double sigma = config_.level_uncertainty;
    std::normal_distribution<double> normal(0.0, 1.0);
    return std::exp(sigma * normal(rng) - 0.5 * sigma * sigma);
}

std::vector<double> PriceModel::generate(const std::vector<Timestamp>& timestamps,
                                         double level_factor, RandomEngine& rng) const {
    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    const double phi = config_.ar_coefficient;
    // Start the deviation from its stationary distribution
    double deviation = config_.noise_std / std::sqrt(1.0 - phi * phi) * normal(rng);

    std::vector<double> prices;
    prices.reserve(timestamps.size());

    for (size_t t = 0; t < timestamps.size(); ++t) {
        if (t > 0) {
            deviation = phi * deviation + config_.noise_std * normal(rng);
        }
        double price = level(timestamps[t]) * level_factor + deviation;

        // Both draws are taken every hour so the stream stays aligned across configs
        const double spike_draw = uniform(rng);
        const double jump_draw = normal(rng);
        if (spike_draw < config_.spike_probability) {
            price *= 1.0 + std::exp(config_.spike_log_mean + config_.spike_log_sigma * jump_draw);
        }

        prices.push_back(std::max(price, 0.0));
    }

    return prices;
}

}  // namespace renewfolio

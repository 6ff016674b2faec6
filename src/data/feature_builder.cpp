// src/data/feature_builder.cpp

#include "renewfolio/data/feature_builder.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "renewfolio/core/time_utils.hpp"

namespace renewfolio {

constexpr size_t FeatureBuilder::LONGEST_LAG;
constexpr size_t FeatureBuilder::ROLLING_WINDOW;

Result<std::vector<FeatureRow>> FeatureBuilder::build(const MarketDataset& dataset) const {
    const auto& obs = dataset.observations();
    if (obs.size() <= LONGEST_LAG) {
        return make_error<std::vector<FeatureRow>>(
            ErrorCode::INSUFFICIENT_DATA,
            "Feature construction needs more than " + std::to_string(LONGEST_LAG) +
                " hours, got " + std::to_string(obs.size()),
            "FeatureBuilder");
    }

    std::vector<FeatureRow> rows;
    rows.reserve(obs.size() - LONGEST_LAG);

    // Running sums over the trailing window ending at t (inclusive)
    double window_sum = 0.0;
    double window_sq_sum = 0.0;
    for (size_t t = LONGEST_LAG + 1 - ROLLING_WINDOW; t < LONGEST_LAG; ++t) {
        window_sum += obs[t].price;
        window_sq_sum += obs[t].price * obs[t].price;
    }

    for (size_t t = LONGEST_LAG; t < obs.size(); ++t) {
        window_sum += obs[t].price;
        window_sq_sum += obs[t].price * obs[t].price;
        if (t >= LONGEST_LAG + 1) {
            const double leaving = obs[t - ROLLING_WINDOW].price;
            window_sum -= leaving;
            window_sq_sum -= leaving * leaving;
        }

        FeatureRow row;
        row.timestamp = obs[t].timestamp;
        row.hour = core::hour_of_day(row.timestamp);
        row.day_of_week = core::day_of_week(row.timestamp);
        row.month = core::month_of_year(row.timestamp);
        row.is_weekend = row.day_of_week >= 5;
        row.price = obs[t].price;
        row.price_lag_1h = obs[t - 1].price;
        row.price_lag_24h = obs[t - 24].price;
        row.price_lag_168h = obs[t - LONGEST_LAG].price;

        const double n = static_cast<double>(ROLLING_WINDOW);
        row.price_ma_24h = window_sum / n;
        double var = (window_sq_sum - n * row.price_ma_24h * row.price_ma_24h) / (n - 1.0);
        row.price_std_24h = std::sqrt(std::max(var, 0.0));

        const double renewable = obs[t].wind_mw + obs[t].solar_mw;
        row.renewable_penetration = obs[t].load_mw > 0.0
                                        ? renewable / obs[t].load_mw
                                        : std::numeric_limits<double>::quiet_NaN();
        if (!std::isfinite(row.renewable_penetration)) {
            return make_error<std::vector<FeatureRow>>(
                ErrorCode::INVALID_DATA,
                "Renewable penetration undefined with zero load at " +
                    core::format_utc_timestamp(row.timestamp),
                "FeatureBuilder");
        }

        rows.push_back(row);
    }

    return rows;
}

}  // namespace renewfolio

// src/data/market_data.cpp

#include "renewfolio/data/market_data.hpp"
#include <cmath>
#include "renewfolio/core/time_utils.hpp"

namespace renewfolio {

std::string market_column_to_string(MarketColumn column) {
    switch (column) {
        case MarketColumn::PRICE:
            return "price";
        case MarketColumn::LOAD:
            return "load_mw";
        case MarketColumn::WIND:
            return "wind_mw";
        case MarketColumn::SOLAR:
            return "solar_mw";
        case MarketColumn::TEMPERATURE:
            return "temperature_f";
        case MarketColumn::IRRADIANCE:
            return "irradiance_w_m2";
        case MarketColumn::WIND_SPEED:
            return "wind_speed_ms";
        default:
            return "unknown";
    }
}

namespace {

double field(const HourlyObservation& obs, MarketColumn column) {
    switch (column) {
        case MarketColumn::PRICE:
            return obs.price;
        case MarketColumn::LOAD:
            return obs.load_mw;
        case MarketColumn::WIND:
            return obs.wind_mw;
        case MarketColumn::SOLAR:
            return obs.solar_mw;
        case MarketColumn::TEMPERATURE:
            return obs.temperature_f;
        case MarketColumn::IRRADIANCE:
            return obs.irradiance_w_m2;
        case MarketColumn::WIND_SPEED:
            return obs.wind_speed_ms;
    }
    return 0.0;
}

const MarketColumn ALL_COLUMNS[] = {MarketColumn::PRICE,       MarketColumn::LOAD,
                                    MarketColumn::WIND,        MarketColumn::SOLAR,
                                    MarketColumn::TEMPERATURE, MarketColumn::IRRADIANCE,
                                    MarketColumn::WIND_SPEED};

}  // namespace

Result<MarketDataset> MarketDataset::create(std::vector<HourlyObservation> observations) {
    if (observations.empty()) {
        return make_error<MarketDataset>(ErrorCode::INVALID_DATA, "Market dataset is empty",
                                         "MarketDataset");
    }

    for (size_t i = 0; i < observations.size(); ++i) {
        const auto& obs = observations[i];

        if (i > 0 && obs.timestamp - observations[i - 1].timestamp != SERIES_STEP) {
            return make_error<MarketDataset>(
                ErrorCode::INVALID_DATA,
                "Gap or disorder in hourly data at " +
                    core::format_utc_timestamp(obs.timestamp),
                "MarketDataset");
        }

        for (MarketColumn column : ALL_COLUMNS) {
            if (!std::isfinite(field(obs, column))) {
                return make_error<MarketDataset>(
                    ErrorCode::INVALID_DATA,
                    "Non-finite " + market_column_to_string(column) + " at " +
                        core::format_utc_timestamp(obs.timestamp),
                    "MarketDataset");
            }
        }

        if (obs.wind_mw < 0.0 || obs.solar_mw < 0.0 || obs.load_mw < 0.0) {
            return make_error<MarketDataset>(
                ErrorCode::INVALID_DATA,
                "Negative generation or load at " + core::format_utc_timestamp(obs.timestamp),
                "MarketDataset");
        }
    }

    return MarketDataset(std::move(observations));
}

Result<TimeSeries> MarketDataset::column(MarketColumn column) const {
    std::vector<Timestamp> timestamps;
    std::vector<double> values;
    timestamps.reserve(observations_.size());
    values.reserve(observations_.size());

    for (const auto& obs : observations_) {
        timestamps.push_back(obs.timestamp);
        values.push_back(field(obs, column));
    }
    return TimeSeries::create(std::move(timestamps), std::move(values));
}

Result<std::vector<MarketDataset>> MarketDataset::split(double train_fraction) const {
    if (!(train_fraction > 0.0 && train_fraction < 1.0)) {
        return make_error<std::vector<MarketDataset>>(
            ErrorCode::INVALID_ARGUMENT,
            "Train fraction must lie in (0, 1), got " + std::to_string(train_fraction),
            "MarketDataset");
    }

    size_t n_train = static_cast<size_t>(std::floor(train_fraction * observations_.size()));
    if (n_train == 0 || n_train >= observations_.size()) {
        return make_error<std::vector<MarketDataset>>(
            ErrorCode::INVALID_ARGUMENT,
            "Split of " + std::to_string(observations_.size()) + " rows at " +
                std::to_string(train_fraction) + " leaves an empty part",
            "MarketDataset");
    }

    std::vector<MarketDataset> parts;
    parts.push_back(MarketDataset(std::vector<HourlyObservation>(
        observations_.begin(), observations_.begin() + n_train)));
    parts.push_back(MarketDataset(
        std::vector<HourlyObservation>(observations_.begin() + n_train, observations_.end())));
    return parts;
}

}  // namespace renewfolio

// include/renewfolio/data/market_data.hpp
#pragma once

#include <string>
#include <vector>
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/time_series.hpp"
#include "renewfolio/core/types.hpp"

namespace renewfolio {

/**
 * @brief One cleaned hour of market and weather data
 */
struct HourlyObservation {
    Timestamp timestamp;
    double price{0.0};           // $/MWh
    double load_mw{0.0};         // System load
    double wind_mw{0.0};         // Fleet wind generation
    double solar_mw{0.0};        // Fleet solar generation
    double temperature_f{0.0};   // Ambient temperature
    double irradiance_w_m2{0.0};
    double wind_speed_ms{0.0};
};

/**
 * @brief Column selector for MarketDataset::column
 */
enum class MarketColumn {
    PRICE,
    LOAD,
    WIND,
    SOLAR,
    TEMPERATURE,
    IRRADIANCE,
    WIND_SPEED
};

std::string market_column_to_string(MarketColumn column);

/**
 * @brief Aligned price and per-asset generation series feeding the revenue model
 */
struct MarketInputs {
    TimeSeries price;
    std::vector<std::string> assets;
    std::vector<TimeSeries> generation_mw;  // One per asset, aligned with price
};

/**
 * @brief Validated, contiguous hourly market table
 */
class MarketDataset {
public:
    MarketDataset() = default;

    /**
     * @brief Validate and wrap observations
     * @return INVALID_DATA for an empty table, a gap, a non-finite field or negative
     *         generation or load
     */
    static Result<MarketDataset> create(std::vector<HourlyObservation> observations);

    size_t size() const {
        return observations_.size();
    }
    bool empty() const {
        return observations_.empty();
    }
    const std::vector<HourlyObservation>& observations() const {
        return observations_;
    }

    Result<TimeSeries> column(MarketColumn column) const;

    /**
     * @brief Chronological split, the first train_fraction of hours go to train
     * @return INVALID_ARGUMENT unless both parts are non-empty
     */
    Result<std::vector<MarketDataset>> split(double train_fraction) const;

private:
    explicit MarketDataset(std::vector<HourlyObservation> observations)
        : observations_(std::move(observations)) {}

    std::vector<HourlyObservation> observations_;
};

}  // namespace renewfolio

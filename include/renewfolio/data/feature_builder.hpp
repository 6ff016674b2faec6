// include/renewfolio/data/feature_builder.hpp
#pragma once

#include <vector>
#include "renewfolio/core/error.hpp"
#include "renewfolio/data/market_data.hpp"

namespace renewfolio {

/**
 * @brief Calendar, lag and rolling features for one hour
 */
struct FeatureRow {
    Timestamp timestamp;
    int hour{0};
    int day_of_week{0};  // Monday = 0
    int month{1};
    bool is_weekend{false};
    double price{0.0};
    double price_lag_1h{0.0};
    double price_lag_24h{0.0};
    double price_lag_168h{0.0};
    double price_ma_24h{0.0};
    double price_std_24h{0.0};        // Sample standard deviation
    double renewable_penetration{0.0};  // (wind + solar) / load
};

/**
 * @brief Derives model features from a market dataset
 *
 * Rows start at the first hour for which the longest lag is available, so every
 * field is defined.
 */
class FeatureBuilder {
public:
    static constexpr size_t LONGEST_LAG = 168;
    static constexpr size_t ROLLING_WINDOW = 24;

    /**
     * @brief Build feature rows
     * @return INSUFFICIENT_DATA when the dataset is not longer than the longest lag
     */
    Result<std::vector<FeatureRow>> build(const MarketDataset& dataset) const;
};

}  // namespace renewfolio

// include/renewfolio/simulation/revenue_model.hpp
#pragma once

#include <string>
#include <vector>
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/time_series.hpp"
#include "renewfolio/data/market_data.hpp"
#include "renewfolio/simulation/asset_profile.hpp"
#include "renewfolio/simulation/scenario_simulator.hpp"

namespace renewfolio {

/**
 * @brief Aligned per-asset return series
 */
struct ReturnPanel {
    std::vector<std::string> assets;
    std::vector<TimeSeries> returns;  // One per asset, identical timestamps

    size_t periods() const {
        return returns.empty() ? 0 : returns.front().size();
    }

    /**
     * @return SERIES_MISMATCH when names and series disagree in count or the series
     *         are not aligned
     */
    Result<void> validate() const;
};

/**
 * @brief Converts generation and price into return on invested capital
 *
 * Hourly return of an asset is (generation x price - fixed O&M for the hour)
 * divided by capacity x capex. O&M accrues evenly over the 8760 hours of a year.
 */
class RevenueModel {
public:
    explicit RevenueModel(std::vector<AssetProfile> profiles);

    /**
     * @brief Hourly returns for every asset
     * @return SERIES_MISMATCH if the inputs do not carry exactly the profiled assets
     *         in order, or generation and price are not aligned
     */
    Result<ReturnPanel> hourly_returns(const MarketInputs& inputs) const;

    /**
     * @brief Annualized mean return per asset for one realization
     */
    std::vector<double> annualized_returns(const Realization& realization,
                                           double periods_per_year) const;

    /**
     * @brief Scale fleet-level history to each asset's capacity
     *
     * Wind assets follow the dataset's wind capacity factor and solar assets its
     * solar capacity factor.
     *
     * @return CONFIGURATION_ERROR for non-positive fleet capacities
     */
    Result<MarketInputs> inputs_from_dataset(const MarketDataset& dataset,
                                             double wind_fleet_capacity_mw,
                                             double solar_fleet_capacity_mw) const;

    const std::vector<AssetProfile>& get_profiles() const {
        return profiles_;
    }

private:
    double hourly_return(const AssetProfile& profile, double generation_mw, double price) const;

    std::vector<AssetProfile> profiles_;
};

}  // namespace renewfolio

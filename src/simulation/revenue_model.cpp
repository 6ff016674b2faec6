// src/simulation/revenue_model.cpp

#include "renewfolio/simulation/revenue_model.hpp"
#include <algorithm>
#include <cmath>

namespace renewfolio {

Result<void> ReturnPanel::validate() const {
    if (assets.size() != returns.size()) {
        return make_error<void>(ErrorCode::SERIES_MISMATCH,
                                std::to_string(assets.size()) + " asset names for " +
                                    std::to_string(returns.size()) + " return series",
                                "ReturnPanel");
    }
    for (size_t a = 1; a < returns.size(); ++a) {
        if (!returns[a].aligned_with(returns.front())) {
            return make_error<void>(ErrorCode::SERIES_MISMATCH,
                                    "Return series for '" + assets[a] +
                                        "' is not aligned with '" + assets.front() + "' (" +
                                        std::to_string(returns[a].size()) + " vs " +
                                        std::to_string(returns.front().size()) + " periods)",
                                    "ReturnPanel");
        }
    }
    return Result<void>();
}

RevenueModel::RevenueModel(std::vector<AssetProfile> profiles) : profiles_(std::move(profiles)) {}

double RevenueModel::hourly_return(const AssetProfile& profile, double generation_mw,
                                   double price) const {
    const double om_per_hour = profile.fixed_om_per_mw_year * profile.capacity_mw / HOURS_PER_YEAR;
    return (generation_mw * price - om_per_hour) / profile.invested_capital();
}

Result<ReturnPanel> RevenueModel::hourly_returns(const MarketInputs& inputs) const {
    if (inputs.assets.size() != profiles_.size() ||
        inputs.generation_mw.size() != profiles_.size()) {
        return make_error<ReturnPanel>(ErrorCode::SERIES_MISMATCH,
                                       "Market inputs carry " +
                                           std::to_string(inputs.generation_mw.size()) +
                                           " generation series for " +
                                           std::to_string(profiles_.size()) + " assets",
                                       "RevenueModel");
    }

    ReturnPanel panel;
    for (size_t a = 0; a < profiles_.size(); ++a) {
        const auto& profile = profiles_[a];
        if (inputs.assets[a] != profile.name) {
            return make_error<ReturnPanel>(ErrorCode::SERIES_MISMATCH,
                                           "Expected asset '" + profile.name + "' at position " +
                                               std::to_string(a) + ", got '" +
                                               inputs.assets[a] + "'",
                                           "RevenueModel");
        }

        const auto& generation = inputs.generation_mw[a];
        if (!generation.aligned_with(inputs.price)) {
            return make_error<ReturnPanel>(ErrorCode::SERIES_MISMATCH,
                                           "Generation for '" + profile.name +
                                               "' is not aligned with the price series",
                                           "RevenueModel");
        }

        std::vector<double> values(generation.size());
        for (size_t t = 0; t < generation.size(); ++t) {
            values[t] = hourly_return(profile, generation[t], inputs.price[t]);
        }

        auto series = TimeSeries::create(generation.timestamps(), std::move(values));
        if (series.is_error()) {
            return forward_error<ReturnPanel>(series.error());
        }
        panel.assets.push_back(profile.name);
        panel.returns.push_back(series.value());
    }

    return panel;
}

std::vector<double> RevenueModel::annualized_returns(const Realization& realization,
                                                     double periods_per_year) const {
    std::vector<double> annual(profiles_.size(), 0.0);
    const auto& price = realization.price;
    if (price.empty()) {
        return annual;
    }

    for (size_t a = 0; a < profiles_.size() && a < realization.generation_mw.size(); ++a) {
        const auto& generation = realization.generation_mw[a];
        double total = 0.0;
        for (size_t t = 0; t < price.size(); ++t) {
            total += hourly_return(profiles_[a], generation[t], price[t]);
        }
        annual[a] = total / static_cast<double>(price.size()) * periods_per_year;
    }
    return annual;
}

Result<MarketInputs> RevenueModel::inputs_from_dataset(const MarketDataset& dataset,
                                                       double wind_fleet_capacity_mw,
                                                       double solar_fleet_capacity_mw) const {
    if (!(wind_fleet_capacity_mw > 0.0) || !(solar_fleet_capacity_mw > 0.0)) {
        return make_error<MarketInputs>(ErrorCode::CONFIGURATION_ERROR,
                                        "Fleet capacities must be positive", "RevenueModel");
    }

    auto price = dataset.column(MarketColumn::PRICE);
    auto wind = dataset.column(MarketColumn::WIND);
    auto solar = dataset.column(MarketColumn::SOLAR);
    if (price.is_error()) return forward_error<MarketInputs>(price.error());
    if (wind.is_error()) return forward_error<MarketInputs>(wind.error());
    if (solar.is_error()) return forward_error<MarketInputs>(solar.error());

    MarketInputs inputs;
    inputs.price = price.value();

    for (const auto& profile : profiles_) {
        const bool is_wind = profile.kind == AssetKind::WIND;
        const TimeSeries& fleet = is_wind ? wind.value() : solar.value();
        const double fleet_capacity = is_wind ? wind_fleet_capacity_mw : solar_fleet_capacity_mw;
        const double capacity = profile.capacity_mw;

        auto scaled = fleet.map([&](double mw) {
            return std::min(std::max(mw / fleet_capacity, 0.0), 1.0) * capacity;
        });
        if (scaled.is_error()) {
            return forward_error<MarketInputs>(scaled.error());
        }
        inputs.assets.push_back(profile.name);
        inputs.generation_mw.push_back(scaled.value());
    }

    return inputs;
}

}  // namespace renewfolio

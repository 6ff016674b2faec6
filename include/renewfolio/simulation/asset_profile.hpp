// include/renewfolio/simulation/asset_profile.hpp
#pragma once

#include <string>
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/types.hpp"

namespace renewfolio {

/**
 * @brief Wind resource and turbine parameters
 */
struct WindParameters {
    double weibull_shape{2.0};
    double weibull_scale{8.5};         // m/s
    double seasonal_amplitude{0.15};   // Relative swing of the Weibull scale over the year
    double seasonal_peak_day{60.0};    // Windiest day of year
    double diurnal_amplitude{0.10};    // Relative swing of the scale over the day
    double diurnal_peak_hour{22.0};
    double cut_in_speed{3.0};
    double rated_speed{12.0};
    double cut_out_speed{25.0};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Solar resource and panel parameters
 */
struct SolarParameters {
    double clear_sky_peak{0.9};          // Capacity factor at solar noon on the longest day
    double seasonal_amplitude{0.2};      // Relative clear-sky swing over the year
    double daylength_amplitude{2.0};     // Hours of day-length swing around 12h
    double cloud_alpha{0.8};             // Kumaraswamy shape of cloud-cover fraction
    double cloud_beta{1.5};
    double cloud_derate{0.75};           // Output lost under full cloud cover
    double temperature_coefficient{-0.004};  // Per degree C above reference
    double reference_temperature_c{25.0};
    double ambient_mean_c{22.0};
    double ambient_seasonal_amplitude_c{8.0};
    double ambient_diurnal_amplitude_c{6.0};
    double ambient_noise_std_c{2.0};
    double irradiance_heating_c{25.0};   // Cell heating above ambient at full sun

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Per-asset generation and economics, fixed once loaded
 */
struct AssetProfile : public ConfigBase {
    std::string name{"wind"};
    AssetKind kind{AssetKind::WIND};
    double capacity_mw{100.0};
    double capex_per_mw{1400000.0};            // $ invested per MW
    double fixed_om_per_mw_year{40000.0};      // $ per MW per year
    double weather_loading{0.5};               // Loading on the shared weather driver
    double resource_uncertainty{0.08};         // Lognormal sigma of the inter-annual factor

    WindParameters wind;
    SolarParameters solar;

    std::string version{"1.0.0"};

    static AssetProfile default_wind();
    static AssetProfile default_solar();

    /**
     * @brief Check the static parameters
     * @return CONFIGURATION_ERROR naming the offending field and value
     */
    Result<void> validate() const;

    /**
     * @brief Invested capital, the return denominator
     */
    double invested_capital() const {
        return capacity_mw * capex_per_mw;
    }

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace renewfolio

// src/simulation/asset_profile.cpp

#include "renewfolio/simulation/asset_profile.hpp"
#include <cmath>

namespace renewfolio {

nlohmann::json WindParameters::to_json() const {
    nlohmann::json j;
    j["weibull_shape"] = weibull_shape;
    j["weibull_scale"] = weibull_scale;
    j["seasonal_amplitude"] = seasonal_amplitude;
    j["seasonal_peak_day"] = seasonal_peak_day;
    j["diurnal_amplitude"] = diurnal_amplitude;
    j["diurnal_peak_hour"] = diurnal_peak_hour;
    j["cut_in_speed"] = cut_in_speed;
    j["rated_speed"] = rated_speed;
    j["cut_out_speed"] = cut_out_speed;
    return j;
}

void WindParameters::from_json(const nlohmann::json& j) {
    if (j.contains("weibull_shape")) weibull_shape = j.at("weibull_shape").get<double>();
    if (j.contains("weibull_scale")) weibull_scale = j.at("weibull_scale").get<double>();
    if (j.contains("seasonal_amplitude")) {
        seasonal_amplitude = j.at("seasonal_amplitude").get<double>();
    }
    if (j.contains("seasonal_peak_day")) {
        seasonal_peak_day = j.at("seasonal_peak_day").get<double>();
    }
    if (j.contains("diurnal_amplitude")) {
        diurnal_amplitude = j.at("diurnal_amplitude").get<double>();
    }
    if (j.contains("diurnal_peak_hour")) {
        diurnal_peak_hour = j.at("diurnal_peak_hour").get<double>();
    }
    if (j.contains("cut_in_speed")) cut_in_speed = j.at("cut_in_speed").get<double>();
    if (j.contains("rated_speed")) rated_speed = j.at("rated_speed").get<double>();
    if (j.contains("cut_out_speed")) cut_out_speed = j.at("cut_out_speed").get<double>();
}

nlohmann::json SolarParameters::to_json() const {
    nlohmann::json j;
    j["clear_sky_peak"] = clear_sky_peak;
    j["seasonal_amplitude"] = seasonal_amplitude;
    j["daylength_amplitude"] = daylength_amplitude;
    j["cloud_alpha"] = cloud_alpha;
    j["cloud_beta"] = cloud_beta;
    j["cloud_derate"] = cloud_derate;
    j["temperature_coefficient"] = temperature_coefficient;
    j["reference_temperature_c"] = reference_temperature_c;
    j["ambient_mean_c"] = ambient_mean_c;
    j["ambient_seasonal_amplitude_c"] = ambient_seasonal_amplitude_c;
    j["ambient_diurnal_amplitude_c"] = ambient_diurnal_amplitude_c;
    j["ambient_noise_std_c"] = ambient_noise_std_c;
    j["irradiance_heating_c"] = irradiance_heating_c;
    return j;
}

void SolarParameters::from_json(const nlohmann::json& j) {
    if (j.contains("clear_sky_peak")) clear_sky_peak = j.at("clear_sky_peak").get<double>();
    if (j.contains("seasonal_amplitude")) {
        seasonal_amplitude = j.at("seasonal_amplitude").get<double>();
    }
    if (j.contains("daylength_amplitude")) {
        daylength_amplitude = j.at("daylength_amplitude").get<double>();
    }
    if (j.contains("cloud_alpha")) cloud_alpha = j.at("cloud_alpha").get<double>();
    if (j.contains("cloud_beta")) cloud_beta = j.at("cloud_beta").get<double>();
    if (j.contains("cloud_derate")) cloud_derate = j.at("cloud_derate").get<double>();
    if (j.contains("temperature_coefficient")) {
        temperature_coefficient = j.at("temperature_coefficient").get<double>();
    }
    if (j.contains("reference_temperature_c")) {
        reference_temperature_c = j.at("reference_temperature_c").get<double>();
    }
    if (j.contains("ambient_mean_c")) ambient_mean_c = j.at("ambient_mean_c").get<double>();
    if (j.contains("ambient_seasonal_amplitude_c")) {
        ambient_seasonal_amplitude_c = j.at("ambient_seasonal_amplitude_c").get<double>();
    }
    if (j.contains("ambient_diurnal_amplitude_c")) {
        ambient_diurnal_amplitude_c = j.at("ambient_diurnal_amplitude_c").get<double>();
    }
    if (j.contains("ambient_noise_std_c")) {
        ambient_noise_std_c = j.at("ambient_noise_std_c").get<double>();
    }
    if (j.contains("irradiance_heating_c")) {
        irradiance_heating_c = j.at("irradiance_heating_c").get<double>();
    }
}

AssetProfile AssetProfile::default_wind() {
    AssetProfile profile;
    profile.name = "wind";
    profile.kind = AssetKind::WIND;
    profile.capacity_mw = 100.0;
    profile.capex_per_mw = 1400000.0;
    profile.fixed_om_per_mw_year = 40000.0;
    profile.weather_loading = 0.5;
    profile.resource_uncertainty = 0.08;
    return profile;
}

AssetProfile AssetProfile::default_solar() {
    AssetProfile profile;
    profile.name = "solar";
    profile.kind = AssetKind::SOLAR;
    profile.capacity_mw = 100.0;
    profile.capex_per_mw = 1100000.0;
    profile.fixed_om_per_mw_year = 20000.0;
    profile.weather_loading = -0.4;
    profile.resource_uncertainty = 0.05;
    return profile;
}

Result<void> AssetProfile::validate() const {
    auto fail = [this](const std::string& what) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Asset '" + name + "': " + what, "AssetProfile");
    };

    if (name.empty()) {
        return fail("name must not be empty");
    }
    if (!(capacity_mw > 0.0)) {
        return fail("capacity_mw must be positive, got " + std::to_string(capacity_mw));
    }
    if (!(capex_per_mw > 0.0)) {
        return fail("capex_per_mw must be positive, got " + std::to_string(capex_per_mw));
    }
    if (fixed_om_per_mw_year < 0.0 || !std::isfinite(fixed_om_per_mw_year)) {
        return fail("fixed_om_per_mw_year must be non-negative, got " +
                    std::to_string(fixed_om_per_mw_year));
    }
    if (std::abs(weather_loading) > 1.0) {
        return fail("weather_loading must lie in [-1, 1], got " +
                    std::to_string(weather_loading));
    }
    if (resource_uncertainty < 0.0) {
        return fail("resource_uncertainty must be non-negative, got " +
                    std::to_string(resource_uncertainty));
    }

    if (kind == AssetKind::WIND) {
        if (!(wind.weibull_shape > 0.0) || !(wind.weibull_scale > 0.0)) {
            return fail("Weibull shape and scale must be positive");
        }
        if (!(0.0 <= wind.cut_in_speed && wind.cut_in_speed < wind.rated_speed &&
              wind.rated_speed < wind.cut_out_speed)) {
            return fail("power curve requires 0 <= cut_in < rated < cut_out, got " +
                        std::to_string(wind.cut_in_speed) + "/" +
                        std::to_string(wind.rated_speed) + "/" +
                        std::to_string(wind.cut_out_speed));
        }
        if (std::abs(wind.seasonal_amplitude) >= 1.0 || std::abs(wind.diurnal_amplitude) >= 1.0) {
            return fail("wind modulation amplitudes must be below 1 in magnitude");
        }
    } else {
        if (solar.clear_sky_peak <= 0.0 || solar.clear_sky_peak > 1.0) {
            return fail("clear_sky_peak must lie in (0, 1], got " +
                        std::to_string(solar.clear_sky_peak));
        }
        if (solar.seasonal_amplitude < 0.0 || solar.seasonal_amplitude >= 1.0) {
            return fail("solar seasonal_amplitude must lie in [0, 1)");
        }
        if (solar.daylength_amplitude < 0.0 || solar.daylength_amplitude >= 12.0) {
            return fail("daylength_amplitude must lie in [0, 12)");
        }
        if (!(solar.cloud_alpha > 0.0) || !(solar.cloud_beta > 0.0)) {
            return fail("cloud distribution shapes must be positive");
        }
        if (solar.cloud_derate < 0.0 || solar.cloud_derate > 1.0) {
            return fail("cloud_derate must lie in [0, 1], got " +
                        std::to_string(solar.cloud_derate));
        }
    }

    return Result<void>();
}

nlohmann::json AssetProfile::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["kind"] = asset_kind_to_string(kind);
    j["capacity_mw"] = capacity_mw;
    j["capex_per_mw"] = capex_per_mw;
    j["fixed_om_per_mw_year"] = fixed_om_per_mw_year;
    j["weather_loading"] = weather_loading;
    j["resource_uncertainty"] = resource_uncertainty;
    if (kind == AssetKind::WIND) {
        j["wind"] = wind.to_json();
    } else {
        j["solar"] = solar.to_json();
    }
    j["version"] = version;
    return j;
}

void AssetProfile::from_json(const nlohmann::json& j) {
    if (j.contains("name")) name = j.at("name").get<std::string>();
    if (j.contains("kind")) {
        std::string kind_str = j.at("kind").get<std::string>();
        if (kind_str == "WIND")
            kind = AssetKind::WIND;
        else if (kind_str == "SOLAR")
            kind = AssetKind::SOLAR;
    }
    if (j.contains("capacity_mw")) capacity_mw = j.at("capacity_mw").get<double>();
    if (j.contains("capex_per_mw")) capex_per_mw = j.at("capex_per_mw").get<double>();
    if (j.contains("fixed_om_per_mw_year")) {
        fixed_om_per_mw_year = j.at("fixed_om_per_mw_year").get<double>();
    }
    if (j.contains("weather_loading")) weather_loading = j.at("weather_loading").get<double>();
    if (j.contains("resource_uncertainty")) {
        resource_uncertainty = j.at("resource_uncertainty").get<double>();
    }
    if (j.contains("wind")) wind.from_json(j.at("wind"));
    if (j.contains("solar")) solar.from_json(j.at("solar"));
    if (j.contains("version")) version = j.at("version").get<std::string>();
}

}  // namespace renewfolio

// include/renewfolio/data/synthetic_market.hpp
#pragma once

#include <cstdint>
#include <string>
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/data/market_data.hpp"

namespace renewfolio {

/**
 * @brief Parameters of the synthetic ERCOT-like market history
 */
struct SyntheticMarketConfig : public ConfigBase {
    std::string start{"2023-01-01T00:00:00Z"};
    size_t hours{17544};  // 2023 and 2024
    uint64_t seed{42};

    // Price shape ($/MWh)
    double base_price{30.0};
    double seasonal_amplitude{10.0};
    double diurnal_amplitude{15.0};
    double weekend_discount{5.0};
    double noise_std{5.0};
    double spike_probability{0.02};
    double spike_size{50.0};

    // Fleet sizes used to scale generation (MW)
    double wind_fleet_capacity_mw{30000.0};
    double solar_fleet_capacity_mw{15000.0};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["start"] = start;
        j["hours"] = hours;
        j["seed"] = seed;
        j["base_price"] = base_price;
        j["seasonal_amplitude"] = seasonal_amplitude;
        j["diurnal_amplitude"] = diurnal_amplitude;
        j["weekend_discount"] = weekend_discount;
        j["noise_std"] = noise_std;
        j["spike_probability"] = spike_probability;
        j["spike_size"] = spike_size;
        j["wind_fleet_capacity_mw"] = wind_fleet_capacity_mw;
        j["solar_fleet_capacity_mw"] = solar_fleet_capacity_mw;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("start")) start = j.at("start").get<std::string>();
        if (j.contains("hours")) hours = j.at("hours").get<size_t>();
        if (j.contains("seed")) seed = j.at("seed").get<uint64_t>();
        if (j.contains("base_price")) base_price = j.at("base_price").get<double>();
        if (j.contains("seasonal_amplitude")) {
            seasonal_amplitude = j.at("seasonal_amplitude").get<double>();
        }
        if (j.contains("diurnal_amplitude")) {
            diurnal_amplitude = j.at("diurnal_amplitude").get<double>();
        }
        if (j.contains("weekend_discount")) {
            weekend_discount = j.at("weekend_discount").get<double>();
        }
        if (j.contains("noise_std")) noise_std = j.at("noise_std").get<double>();
        if (j.contains("spike_probability")) {
            spike_probability = j.at("spike_probability").get<double>();
        }
        if (j.contains("spike_size")) spike_size = j.at("spike_size").get<double>();
        if (j.contains("wind_fleet_capacity_mw")) {
            wind_fleet_capacity_mw = j.at("wind_fleet_capacity_mw").get<double>();
        }
        if (j.contains("solar_fleet_capacity_mw")) {
            solar_fleet_capacity_mw = j.at("solar_fleet_capacity_mw").get<double>();
        }
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Generates a plausible hourly market history for offline runs
 *
 * Stands in for the external data supplier. Each column is driven by its own
 * derived random stream so changing one component leaves the others unchanged.
 */
class SyntheticMarketGenerator {
public:
    explicit SyntheticMarketGenerator(SyntheticMarketConfig config);

    /**
     * @brief Generate the configured history
     * @return CONFIGURATION_ERROR for an unparsable start, zero hours, non-positive
     *         fleet capacity or a spike probability outside [0, 1]
     */
    Result<MarketDataset> generate() const;

    const SyntheticMarketConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_config() const;

    SyntheticMarketConfig config_;
};

}  // namespace renewfolio

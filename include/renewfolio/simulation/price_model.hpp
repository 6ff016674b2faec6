// include/renewfolio/simulation/price_model.hpp
#pragma once

#include <vector>
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/random_utils.hpp"
#include "renewfolio/core/types.hpp"

namespace renewfolio {

/**
 * @brief Configuration for the stochastic hourly price model
 */
struct PriceModelConfig : public ConfigBase {
    double base_level{30.0};            // $/MWh
    double seasonal_amplitude{10.0};
    double diurnal_amplitude{15.0};     // Peaks at noon
    double weekend_discount{5.0};
    double ar_coefficient{0.7};         // Persistence of hourly deviations
    double noise_std{5.0};              // Innovation standard deviation
    double spike_probability{0.02};     // Per-hour scarcity event probability
    double spike_log_mean{0.0};         // Jump multiplier is 1 + exp(N(mean, sigma))
    double spike_log_sigma{0.75};
    double level_uncertainty{0.10};     // Lognormal sigma of the per-realization level

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["base_level"] = base_level;
        j["seasonal_amplitude"] = seasonal_amplitude;
        j["diurnal_amplitude"] = diurnal_amplitude;
        j["weekend_discount"] = weekend_discount;
        j["ar_coefficient"] = ar_coefficient;
        j["noise_std"] = noise_std;
        j["spike_probability"] = spike_probability;
        j["spike_log_mean"] = spike_log_mean;
        j["spike_log_sigma"] = spike_log_sigma;
        j["level_uncertainty"] = level_uncertainty;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("base_level")) base_level = j.at("base_level").get<double>();
        if (j.contains("seasonal_amplitude")) {
            seasonal_amplitude = j.at("seasonal_amplitude").get<double>();
        }
        if (j.contains("diurnal_amplitude")) {
            diurnal_amplitude = j.at("diurnal_amplitude").get<double>();
        }
        if (j.contains("weekend_discount")) {
            weekend_discount = j.at("weekend_discount").get<double>();
        }
        if (j.contains("ar_coefficient")) ar_coefficient = j.at("ar_coefficient").get<double>();
        if (j.contains("noise_std")) noise_std = j.at("noise_std").get<double>();
        if (j.contains("spike_probability")) {
            spike_probability = j.at("spike_probability").get<double>();
        }
        if (j.contains("spike_log_mean")) spike_log_mean = j.at("spike_log_mean").get<double>();
        if (j.contains("spike_log_sigma")) {
            spike_log_sigma = j.at("spike_log_sigma").get<double>();
        }
        if (j.contains("level_uncertainty")) {
            level_uncertainty = j.at("level_uncertainty").get<double>();
        }
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Seasonal/diurnal level plus AR(1) deviations and multiplicative spikes
 *
 * Prices are floored at zero. The generator is supplied by the caller, the model
 * holds no random state.
 */
class PriceModel {
public:
    explicit PriceModel(PriceModelConfig config);

    /**
     * @return CONFIGURATION_ERROR when |ar_coefficient| >= 1, a standard deviation is
     *         negative or the spike probability is outside [0, 1]
     */
    Result<void> validate() const;

    /**
     * @brief Deterministic mean level at a timestamp
     */
    double level(const Timestamp& ts) const;

    /**
     * @brief Mean-one lognormal factor scaling a whole realization's level
     */
    double draw_level_factor(RandomEngine& rng) const;

    /**
     * @brief Hourly prices for the given timestamps
     */
    std::vector<double> generate(const std::vector<Timestamp>& timestamps, double level_factor,
                                 RandomEngine& rng) const;

    const PriceModelConfig& get_config() const {
        return config_;
    }

private:
    PriceModelConfig config_;
};

}  // namespace renewfolio

// include/renewfolio/risk/risk_model.hpp
#pragma once

#include <memory>
#include <string>
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/logger.hpp"
#include "renewfolio/risk/garch_model.hpp"
#include "renewfolio/risk/sample_variance_model.hpp"

namespace renewfolio {

/**
 * @brief Configuration for the price risk model
 */
struct RiskModelConfig : public ConfigBase {
    GarchConfig garch;
    bool fallback_to_sample_variance{true};
    int forecast_horizon{8760};  // Steps averaged by variance_ratio

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["garch"] = garch.to_json();
        j["fallback_to_sample_variance"] = fallback_to_sample_variance;
        j["forecast_horizon"] = forecast_horizon;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("garch")) garch.from_json(j.at("garch"));
        if (j.contains("fallback_to_sample_variance")) {
            fallback_to_sample_variance = j.at("fallback_to_sample_variance").get<bool>();
        }
        if (j.contains("forecast_horizon")) {
            forecast_horizon = j.at("forecast_horizon").get<int>();
        }
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Fits a conditional volatility model to prices, with a sample-variance fallback
 *
 * A MODEL_FIT_ERROR from the primary model is logged and replaced by the
 * unconditional sample variance. INSUFFICIENT_DATA and input errors propagate.
 */
class RiskModel {
public:
    /**
     * @brief Use GARCH(1,1) as the primary model
     */
    explicit RiskModel(RiskModelConfig config);

    /**
     * @brief Use a caller-supplied primary model
     */
    RiskModel(RiskModelConfig config, std::unique_ptr<VolatilityModel> primary);

    Result<void> fit(const TimeSeries& prices);

    /**
     * @brief Per-step volatility forecast from the active model
     */
    Result<TimeSeries> forecast(int horizon) const;

    /**
     * @brief Mean forecast variance over the horizon divided by the long-run variance
     *
     * Above 1 when current conditions are more volatile than average. Exactly 1 for
     * the sample-variance fallback.
     */
    Result<double> variance_ratio(int horizon) const;

    bool is_fitted() const {
        return active_ != nullptr;
    }
    bool used_fallback() const {
        return used_fallback_;
    }
    std::string active_model_name() const {
        return active_ ? active_->name() : "none";
    }
    const VolatilityModel* active_model() const {
        return active_;
    }

    const RiskModelConfig& get_config() const {
        return config_;
    }

private:
    RiskModelConfig config_;
    std::unique_ptr<VolatilityModel> primary_;
    std::unique_ptr<SampleVarianceModel> fallback_;
    const VolatilityModel* active_{nullptr};
    bool used_fallback_{false};
};

}  // namespace renewfolio

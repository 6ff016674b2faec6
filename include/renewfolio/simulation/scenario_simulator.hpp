// include/renewfolio/simulation/scenario_simulator.hpp
#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/logger.hpp"
#include "renewfolio/core/time_series.hpp"
#include "renewfolio/data/market_data.hpp"
#include "renewfolio/simulation/asset_profile.hpp"
#include "renewfolio/simulation/price_model.hpp"

namespace renewfolio {

/**
 * @brief Configuration for the Monte Carlo ensemble
 */
struct SimulationConfig : public ConfigBase {
    size_t n_realizations{1000};
    int horizon_hours{8760};
    uint64_t seed{42};
    std::string start{"2025-01-01T00:00:00Z"};

    // Target correlation of the weather drivers. Empty means the one-factor matrix
    // implied by each profile's weather_loading.
    std::vector<std::vector<double>> correlation_matrix;

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["n_realizations"] = n_realizations;
        j["horizon_hours"] = horizon_hours;
        j["seed"] = seed;
        j["start"] = start;
        j["correlation_matrix"] = correlation_matrix;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("n_realizations")) n_realizations = j.at("n_realizations").get<size_t>();
        if (j.contains("horizon_hours")) horizon_hours = j.at("horizon_hours").get<int>();
        if (j.contains("seed")) seed = j.at("seed").get<uint64_t>();
        if (j.contains("start")) start = j.at("start").get<std::string>();
        if (j.contains("correlation_matrix")) {
            correlation_matrix = j.at("correlation_matrix").get<std::vector<std::vector<double>>>();
        }
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief One simulated year (or horizon) of generation and price
 */
struct Realization {
    std::vector<std::vector<double>> generation_mw;  // [asset][hour]
    std::vector<double> price;                       // [hour]
    std::vector<double> resource_factors;            // Inter-annual factor per asset
    double price_level_factor{1.0};
};

/**
 * @brief Ensemble of realizations sharing one timestamp grid
 */
struct ScenarioSet {
    std::vector<std::string> assets;
    std::vector<Timestamp> timestamps;
    std::vector<Realization> realizations;

    size_t size() const {
        return realizations.size();
    }
    size_t horizon() const {
        return timestamps.size();
    }

    /**
     * @brief Realization as validated series for the revenue model
     * @return INVALID_ARGUMENT for an out-of-range index
     */
    Result<MarketInputs> market_inputs(size_t index) const;
};

/**
 * @brief Per-timestamp ensemble quantiles of one series
 */
struct QuantileBands {
    TimeSeries p10;
    TimeSeries p50;
    TimeSeries p90;
};

struct ScenarioSummary {
    std::vector<std::string> assets;
    std::vector<QuantileBands> generation;  // One per asset
    QuantileBands price;

    nlohmann::json to_json() const;
};

/**
 * @brief Generates correlated wind, solar and price scenarios
 *
 * Weather drivers are correlated standard normals obtained from a Cholesky-type
 * factor of the target correlation matrix, mapped through the normal CDF and each
 * asset's inverse marginal (Weibull wind speed, Kumaraswamy cloud cover). Each
 * realization seeds its own generators from (seed, stream, index), so the output
 * is bit-identical for identical inputs.
 */
class ScenarioSimulator {
public:
    ScenarioSimulator(std::vector<AssetProfile> profiles, PriceModelConfig price_config,
                      SimulationConfig config);

    /**
     * @brief Validate profiles, horizon and correlation structure
     * @return CONFIGURATION_ERROR for non-positive capacity or horizon, an empty
     *         ensemble, or a correlation matrix that is malformed or not PSD
     */
    Result<void> validate() const;

    /**
     * @brief Draw the full ensemble
     */
    Result<ScenarioSet> simulate() const;

    /**
     * @brief P10/P50/P90 across realizations at every timestamp
     * @return INVALID_ARGUMENT for an empty set
     */
    static Result<ScenarioSummary> summarize(const ScenarioSet& set);

    /**
     * @brief Symmetrized target correlation matrix after validation
     */
    Result<Eigen::MatrixXd> correlation() const;

    const std::vector<AssetProfile>& get_profiles() const {
        return profiles_;
    }
    const SimulationConfig& get_config() const {
        return config_;
    }

private:
    Result<Eigen::MatrixXd> correlation_factor() const;
    Realization simulate_realization(size_t index, const Eigen::MatrixXd& factor,
                                     const std::vector<Timestamp>& timestamps,
                                     const std::vector<int>& hours,
                                     const std::vector<int>& days) const;

    std::vector<AssetProfile> profiles_;
    PriceModel price_model_;
    SimulationConfig config_;
};

}  // namespace renewfolio

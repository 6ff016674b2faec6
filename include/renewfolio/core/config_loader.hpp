// include/renewfolio/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "renewfolio/backtest/backtest_engine.hpp"
#include "renewfolio/backtest/stress_tester.hpp"
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/logger.hpp"
#include "renewfolio/data/synthetic_market.hpp"
#include "renewfolio/optimization/portfolio_optimizer.hpp"
#include "renewfolio/risk/risk_model.hpp"
#include "renewfolio/simulation/asset_profile.hpp"
#include "renewfolio/simulation/price_model.hpp"
#include "renewfolio/simulation/scenario_simulator.hpp"

namespace renewfolio {

/**
 * @brief Consolidated application configuration
 *
 * Every section falls back to its component defaults when absent.
 */
struct AppConfig : public ConfigBase {
    LoggerConfig logging;
    SyntheticMarketConfig market;
    SimulationConfig simulation;
    PriceModelConfig price;
    std::vector<AssetProfile> assets{AssetProfile::default_wind(), AssetProfile::default_solar()};
    RiskModelConfig risk;
    OptimizerConfig optimizer;
    BacktestConfig backtest;
    std::vector<StressScenario> stress = StressTester::default_scenarios();

    double train_fraction{0.5};  // Share of history used for estimation
    std::string output_directory{"results"};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Loads AppConfig from a JSON file layered over the built-in defaults
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a single file
     * @param config_file_path Path to a JSON file (e.g., "./config/allocation.json")
     * @return Result containing AppConfig or error: FILE_NOT_FOUND, JSON_PARSE_ERROR
     *         or CONFIGURATION_ERROR
     */
    static Result<AppConfig> load(const std::filesystem::path& config_file_path);

    /**
     * @brief Build configuration from already-parsed JSON overrides
     */
    static Result<AppConfig> from_overrides(const nlohmann::json& overrides);

    /**
     * @brief Recursively merge JSON objects
     * @param target Target JSON object (modified in place)
     * @param source Source JSON object to merge from
     *
     * For nested objects, performs deep merge. For other types, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

    /**
     * @brief Validate cross-section consistency and every component's parameters
     */
    static Result<void> validate_config(const AppConfig& config);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
    static Result<AppConfig> extract_config(const nlohmann::json& merged);
    static void log_config_summary(const AppConfig& config);
};

}  // namespace renewfolio

// include/renewfolio/backtest/stress_tester.hpp
#pragma once

#include <string>
#include <vector>
#include "renewfolio/backtest/backtest_engine.hpp"
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/data/market_data.hpp"
#include "renewfolio/simulation/revenue_model.hpp"

namespace renewfolio {

/**
 * @brief A perturbation of market inputs
 *
 * Stressed price = max(0, price x price_multiplier + price_shift). Stressed
 * generation = generation x multiplier, capped at the asset's capacity.
 */
struct StressScenario : public ConfigBase {
    std::string name{"baseline"};
    double price_shift{0.0};                   // $/MWh
    double price_multiplier{1.0};
    double generation_multiplier{1.0};         // Applied to every asset without an override
    std::vector<double> generation_multipliers;  // Per-asset overrides, empty for none

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["price_shift"] = price_shift;
        j["price_multiplier"] = price_multiplier;
        j["generation_multiplier"] = generation_multiplier;
        j["generation_multipliers"] = generation_multipliers;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name")) name = j.at("name").get<std::string>();
        if (j.contains("price_shift")) price_shift = j.at("price_shift").get<double>();
        if (j.contains("price_multiplier")) {
            price_multiplier = j.at("price_multiplier").get<double>();
        }
        if (j.contains("generation_multiplier")) {
            generation_multiplier = j.at("generation_multiplier").get<double>();
        }
        if (j.contains("generation_multipliers")) {
            generation_multipliers = j.at("generation_multipliers").get<std::vector<double>>();
        }
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

struct StressResult {
    StressScenario scenario;
    BacktestResult backtest;

    nlohmann::json to_json() const;
};

/**
 * @brief Replays an allocation against perturbed market inputs
 *
 * Perturbed inputs go through the same RevenueModel and BacktestEngine as the
 * unperturbed replay.
 */
class StressTester {
public:
    StressTester(BacktestEngine engine, RevenueModel revenue);

    /**
     * @return CONFIGURATION_ERROR for negative multipliers or mis-sized overrides
     */
    Result<MarketInputs> apply(const StressScenario& scenario, const MarketInputs& inputs) const;

    Result<StressResult> run(const Portfolio& portfolio, const MarketInputs& inputs,
                             const StressScenario& scenario) const;

    Result<std::vector<StressResult>> run_all(const Portfolio& portfolio,
                                              const MarketInputs& inputs,
                                              const std::vector<StressScenario>& scenarios) const;

    /**
     * @brief Baseline, price -20%, generation -15% and both combined
     */
    static std::vector<StressScenario> default_scenarios();

private:
    BacktestEngine engine_;
    RevenueModel revenue_;
};

}  // namespace renewfolio

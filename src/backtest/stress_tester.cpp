// src/backtest/stress_tester.cpp

#include "renewfolio/backtest/stress_tester.hpp"
#include <algorithm>
#include <cmath>

namespace renewfolio {

nlohmann::json StressResult::to_json() const {
    nlohmann::json j;
    j["scenario"] = scenario.to_json();
    j["backtest"] = backtest.to_json();
    return j;
}

StressTester::StressTester(BacktestEngine engine, RevenueModel revenue)
    : engine_(std::move(engine)), revenue_(std::move(revenue)) {
    Logger::register_component("StressTester");
}

Result<MarketInputs> StressTester::apply(const StressScenario& scenario,
                                         const MarketInputs& inputs) const {
    const auto& profiles = revenue_.get_profiles();
    if (!scenario.generation_multipliers.empty() &&
        scenario.generation_multipliers.size() != inputs.generation_mw.size()) {
        return make_error<MarketInputs>(ErrorCode::CONFIGURATION_ERROR,
                                        "Stress scenario '" + scenario.name + "' has " +
                                            std::to_string(scenario.generation_multipliers.size()) +
                                            " generation multipliers for " +
                                            std::to_string(inputs.generation_mw.size()) +
                                            " assets",
                                        "StressTester");
    }
    if (inputs.generation_mw.size() != profiles.size()) {
        return make_error<MarketInputs>(ErrorCode::SERIES_MISMATCH,
                                        "Market inputs carry " +
                                            std::to_string(inputs.generation_mw.size()) +
                                            " assets, expected " +
                                            std::to_string(profiles.size()),
                                        "StressTester");
    }
    if (scenario.price_multiplier < 0.0 || scenario.generation_multiplier < 0.0 ||
        std::any_of(scenario.generation_multipliers.begin(),
                    scenario.generation_multipliers.end(), [](double m) { return m < 0.0; })) {
        return make_error<MarketInputs>(ErrorCode::CONFIGURATION_ERROR,
                                        "Stress scenario '" + scenario.name +
                                            "' has a negative multiplier",
                                        "StressTester");
    }

    MarketInputs stressed;
    stressed.assets = inputs.assets;

    auto price = inputs.price.map([&](double p) {
        return std::max(0.0, p * scenario.price_multiplier + scenario.price_shift);
    });
    if (price.is_error()) {
        return forward_error<MarketInputs>(price.error());
    }
    stressed.price = price.value();

    for (size_t a = 0; a < inputs.generation_mw.size(); ++a) {
        const double multiplier = scenario.generation_multipliers.empty()
                                      ? scenario.generation_multiplier
                                      : scenario.generation_multipliers[a];
        const double capacity = profiles[a].capacity_mw;
        auto generation = inputs.generation_mw[a].map(
            [&](double mw) { return std::min(mw * multiplier, capacity); });
        if (generation.is_error()) {
            return forward_error<MarketInputs>(generation.error());
        }
        stressed.generation_mw.push_back(generation.value());
    }
    return stressed;
}

Result<StressResult> StressTester::run(const Portfolio& portfolio, const MarketInputs& inputs,
                                       const StressScenario& scenario) const {
    auto stressed = apply(scenario, inputs);
    if (stressed.is_error()) {
        return forward_error<StressResult>(stressed.error());
    }
    auto panel = revenue_.hourly_returns(stressed.value());
    if (panel.is_error()) {
        return forward_error<StressResult>(panel.error());
    }
    auto replay = engine_.run(portfolio, panel.value(), scenario.name);
    Logger::register_component("StressTester");
    if (replay.is_error()) {
        return forward_error<StressResult>(replay.error());
    }

    StressResult result;
    result.scenario = scenario;
    result.backtest = replay.value();
    INFO("Stress '" << scenario.name << "': annualized return "
                    << result.backtest.summary.annualized_return << ", max drawdown "
                    << result.backtest.summary.max_drawdown);
    return result;
}

Result<std::vector<StressResult>> StressTester::run_all(
    const Portfolio& portfolio, const MarketInputs& inputs,
    const std::vector<StressScenario>& scenarios) const {
    std::vector<StressResult> results;
    results.reserve(scenarios.size());
    for (const auto& scenario : scenarios) {
        auto result = run(portfolio, inputs, scenario);
        if (result.is_error()) {
            return forward_error<std::vector<StressResult>>(result.error());
        }
        results.push_back(result.value());
    }
    return results;
}

std::vector<StressScenario> StressTester::default_scenarios() {
    StressScenario baseline;

    StressScenario price_drop;
    price_drop.name = "price_down_20pct";
    price_drop.price_multiplier = 0.8;

    StressScenario low_resource;
    low_resource.name = "generation_down_15pct";
    low_resource.generation_multiplier = 0.85;

    StressScenario combined;
    combined.name = "price_and_generation_down";
    combined.price_multiplier = 0.8;
    combined.generation_multiplier = 0.85;

    return {baseline, price_drop, low_resource, combined};
}

}  // namespace renewfolio

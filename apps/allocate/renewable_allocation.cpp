// apps/allocate/renewable_allocation.cpp

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include "renewfolio/backtest/backtest_engine.hpp"
#include "renewfolio/backtest/stress_tester.hpp"
#include "renewfolio/core/config_loader.hpp"
#include "renewfolio/core/logger.hpp"
#include "renewfolio/core/time_utils.hpp"
#include "renewfolio/data/synthetic_market.hpp"
#include "renewfolio/optimization/portfolio_optimizer.hpp"
#include "renewfolio/optimization/return_estimate.hpp"
#include "renewfolio/risk/risk_model.hpp"
#include "renewfolio/simulation/revenue_model.hpp"
#include "renewfolio/simulation/scenario_simulator.hpp"

using namespace renewfolio;

namespace {

int fail(const std::string& stage, const RenewfolioError* error) {
    Logger::register_component("renewable_allocation");
    ERROR(stage << " failed: " << error->to_string());
    std::cerr << stage << " failed: " << error->what() << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        // Configuration: built-in defaults unless a file is given
        Result<AppConfig> config_result =
            argc > 1 ? ConfigLoader::load(argv[1]) : ConfigLoader::from_overrides(nlohmann::json::object());
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->what()
                      << std::endl;
            return 1;
        }
        const AppConfig& config = config_result.value();

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("renewable_allocation");

        const std::filesystem::path output_dir = argc > 2 ? argv[2] : config.output_directory;
        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            std::cerr << "Failed to create " << output_dir << ": " << ec.message() << std::endl;
            return 1;
        }
        INFO("Run started at " << core::get_formatted_time("%Y-%m-%d %H:%M:%S", false)
                               << ", writing to " << output_dir.string());

        // Market history, split chronologically
        SyntheticMarketGenerator generator(config.market);
        auto history = generator.generate();
        if (history.is_error()) return fail("Market generation", history.error());

        auto parts = history.value().split(config.train_fraction);
        if (parts.is_error()) return fail("Train/test split", parts.error());
        const MarketDataset& train = parts.value()[0];
        const MarketDataset& test = parts.value()[1];
        Logger::register_component("renewable_allocation");
        INFO("History: " << train.size() << " training hours, " << test.size() << " test hours");

        RevenueModel revenue(config.assets);

        // Price risk on the training window
        auto train_prices = train.column(MarketColumn::PRICE);
        if (train_prices.is_error()) return fail("Price extraction", train_prices.error());

        RiskModel risk(config.risk);
        auto fitted = risk.fit(train_prices.value());
        if (fitted.is_error()) return fail("Risk model fit", fitted.error());
        auto variance_ratio = risk.variance_ratio(config.risk.forecast_horizon);
        if (variance_ratio.is_error()) return fail("Variance forecast", variance_ratio.error());
        Logger::register_component("renewable_allocation");
        INFO("Risk model " << risk.active_model_name() << ": variance ratio "
                           << variance_ratio.value());

        // Scenario ensemble
        ScenarioSimulator simulator(config.assets, config.price, config.simulation);
        auto scenarios = simulator.simulate();
        if (scenarios.is_error()) return fail("Scenario simulation", scenarios.error());
        auto summary = ScenarioSimulator::summarize(scenarios.value());
        if (summary.is_error()) return fail("Scenario summary", summary.error());

        // Estimate and optimize
        auto estimate = ReturnEstimate::from_scenarios(scenarios.value(), revenue,
                                                       config.optimizer.periods_per_year);
        if (estimate.is_error()) return fail("Return estimation", estimate.error());
        ReturnEstimate scaled = estimate.value();
        auto scaled_ok = scaled.scale_covariance(variance_ratio.value());
        if (scaled_ok.is_error()) return fail("Covariance scaling", scaled_ok.error());

        PortfolioOptimizer optimizer(config.optimizer);
        auto optimized = optimizer.optimize(scaled);
        if (optimized.is_error()) return fail("Optimization", optimized.error());
        const auto& allocation = optimized.value().max_sharpe;

        // Out-of-sample replay
        auto test_inputs = revenue.inputs_from_dataset(test, config.market.wind_fleet_capacity_mw,
                                                       config.market.solar_fleet_capacity_mw);
        if (test_inputs.is_error()) return fail("Test inputs", test_inputs.error());
        auto test_panel = revenue.hourly_returns(test_inputs.value());
        if (test_panel.is_error()) return fail("Test returns", test_panel.error());

        BacktestEngine engine(config.backtest);
        auto backtest = engine.run(allocation, test_panel.value(), "max_sharpe");
        if (backtest.is_error()) return fail("Backtest", backtest.error());
        auto benchmarks = engine.run_benchmarks(test_panel.value());
        if (benchmarks.is_error()) return fail("Benchmarks", benchmarks.error());

        StressTester stress(engine, revenue);
        auto stressed = stress.run_all(allocation, test_inputs.value(), config.stress);
        if (stressed.is_error()) return fail("Stress tests", stressed.error());

        auto ensemble = engine.run_ensemble(allocation, scenarios.value(), revenue);
        if (ensemble.is_error()) return fail("Ensemble replay", ensemble.error());

        Logger::register_component("renewable_allocation");
        const auto& result = backtest.value().summary;
        INFO("Backtest: annualized return " << result.annualized_return << ", volatility "
                                            << result.annualized_volatility << ", Sharpe "
                                            << result.sharpe_ratio << ", max drawdown "
                                            << result.max_drawdown);

        // Artifacts
        nlohmann::json frontier_json = nlohmann::json::array();
        for (const auto& point : optimized.value().frontier) {
            frontier_json.push_back(point.to_json());
        }

        nlohmann::json allocation_json = optimized.value().to_json();
        allocation_json.erase("frontier");
        allocation_json["estimate"] = scaled.to_json();
        allocation_json["risk_model"] = {{"model", risk.active_model_name()},
                                         {"used_fallback", risk.used_fallback()},
                                         {"variance_ratio", variance_ratio.value()}};

        nlohmann::json backtest_json;
        backtest_json["portfolio"] = backtest.value().to_json();
        backtest_json["benchmarks"] = nlohmann::json::array();
        for (const auto& bench : benchmarks.value()) {
            backtest_json["benchmarks"].push_back(bench.to_json());
        }
        backtest_json["stress"] = nlohmann::json::array();
        for (const auto& s : stressed.value()) {
            backtest_json["stress"].push_back(s.to_json());
        }
        backtest_json["ensemble"] = ensemble.value().to_json();

        for (const auto& [name, payload] :
             {std::make_pair(std::string("frontier.json"), frontier_json),
              std::make_pair(std::string("allocation.json"), allocation_json),
              std::make_pair(std::string("backtest.json"), backtest_json),
              std::make_pair(std::string("scenarios_summary.json"), summary.value().to_json())}) {
            auto written = write_json_file(output_dir / name, payload, "renewable_allocation");
            if (written.is_error()) return fail("Writing " + name, written.error());
            INFO("Wrote " << (output_dir / name).string());
        }

        std::cout << "Allocation:";
        for (size_t i = 0; i < allocation.assets.size(); ++i) {
            std::cout << " " << allocation.assets[i] << "=" << allocation.weights[i];
        }
        std::cout << " (Sharpe " << allocation.sharpe << ")" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}

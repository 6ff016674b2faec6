// include/renewfolio/backtest/backtest_engine.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "renewfolio/backtest/metrics_calculator.hpp"
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/logger.hpp"
#include "renewfolio/core/time_series.hpp"
#include "renewfolio/optimization/portfolio_optimizer.hpp"
#include "renewfolio/simulation/revenue_model.hpp"
#include "renewfolio/simulation/scenario_simulator.hpp"

namespace renewfolio {

/**
 * @brief Configuration for allocation replay
 */
struct BacktestConfig : public ConfigBase {
    double periods_per_year{HOURS_PER_YEAR};
    double var_confidence{0.95};
    double risk_free_rate{0.02};     // Annual
    double initial_capital{1.0};
    int rebalance_period{0};         // Periods between resets to target weights, 0 = fixed weights
    size_t expected_periods{0};      // Required replay length, 0 accepts any

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["periods_per_year"] = periods_per_year;
        j["var_confidence"] = var_confidence;
        j["risk_free_rate"] = risk_free_rate;
        j["initial_capital"] = initial_capital;
        j["rebalance_period"] = rebalance_period;
        j["expected_periods"] = expected_periods;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("periods_per_year")) {
            periods_per_year = j.at("periods_per_year").get<double>();
        }
        if (j.contains("var_confidence")) var_confidence = j.at("var_confidence").get<double>();
        if (j.contains("risk_free_rate")) risk_free_rate = j.at("risk_free_rate").get<double>();
        if (j.contains("initial_capital")) {
            initial_capital = j.at("initial_capital").get<double>();
        }
        if (j.contains("rebalance_period")) {
            rebalance_period = j.at("rebalance_period").get<int>();
        }
        if (j.contains("expected_periods")) {
            expected_periods = j.at("expected_periods").get<size_t>();
        }
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Summary statistics of one replay
 */
struct PerformanceSummary {
    double total_return{0.0};
    double annualized_return{0.0};
    double annualized_volatility{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double calmar_ratio{0.0};
    double max_drawdown{0.0};  // Signed, <= 0
    double var{0.0};           // Per-period return quantile, signed
    double cvar{0.0};
    size_t periods{0};

    nlohmann::json to_json() const;

    // Named fields for ensemble aggregation
    std::map<std::string, double> to_map() const;
};

struct BacktestResult {
    std::string label;
    std::vector<std::string> assets;
    std::vector<double> weights;
    TimeSeries returns;    // Portfolio return per period
    TimeSeries equity;
    TimeSeries drawdown;
    PerformanceSummary summary;

    nlohmann::json to_json(bool include_paths = false) const;
};

struct MetricBands {
    double p10{0.0};
    double p50{0.0};
    double p90{0.0};
};

/**
 * @brief Distribution of summary statistics across a scenario ensemble
 */
struct EnsembleBacktest {
    size_t realizations{0};
    std::map<std::string, MetricBands> metrics;

    nlohmann::json to_json() const;
};

/**
 * @brief Replays a fixed allocation against realized per-asset returns
 *
 * Portfolio return per period is the weighted sum of asset returns. With a
 * positive rebalance_period the asset sleeves drift with their own returns and
 * are reset to the target weights every rebalance_period periods.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config);

    /**
     * @return SERIES_MISMATCH if the panel is unaligned, its assets differ from the
     *         portfolio's or its length differs from expected_periods;
     *         INSUFFICIENT_DATA for an empty panel; INVALID_ARGUMENT for weights
     *         that do not sum to one
     */
    Result<BacktestResult> run(const Portfolio& portfolio, const ReturnPanel& panel,
                               const std::string& label = "portfolio") const;

    /**
     * @brief Single-asset and equal-weight benchmarks over the same panel
     */
    Result<std::vector<BacktestResult>> run_benchmarks(const ReturnPanel& panel) const;

    /**
     * @brief Replay against every realization and aggregate P10/P50/P90 of the statistics
     */
    Result<EnsembleBacktest> run_ensemble(const Portfolio& portfolio, const ScenarioSet& scenarios,
                                          const RevenueModel& revenue) const;

    /**
     * @brief Statistics of an arbitrary per-period return path
     */
    PerformanceSummary summarize(const std::vector<double>& returns) const;

    const BacktestConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_config() const;
    std::vector<double> portfolio_returns(const std::vector<double>& weights,
                                          const ReturnPanel& panel) const;

    BacktestConfig config_;
    MetricsCalculator metrics_;
};

}  // namespace renewfolio

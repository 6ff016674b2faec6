// src/backtest/backtest_engine.cpp

#include "renewfolio/backtest/backtest_engine.hpp"
#include <cmath>
#include "renewfolio/core/statistics.hpp"

namespace renewfolio {

nlohmann::json PerformanceSummary::to_json() const {
    nlohmann::json j;
    for (const auto& [name, value] : to_map()) {
        j[name] = value;
    }
    j["periods"] = periods;
    return j;
}

std::map<std::string, double> PerformanceSummary::to_map() const {
    return {{"total_return", total_return},
            {"annualized_return", annualized_return},
            {"annualized_volatility", annualized_volatility},
            {"sharpe_ratio", sharpe_ratio},
            {"sortino_ratio", sortino_ratio},
            {"calmar_ratio", calmar_ratio},
            {"max_drawdown", max_drawdown},
            {"var", var},
            {"cvar", cvar}};
}

nlohmann::json BacktestResult::to_json(bool include_paths) const {
    nlohmann::json j;
    j["label"] = label;
    j["assets"] = assets;
    j["weights"] = weights;
    j["summary"] = summary.to_json();
    if (include_paths) {
        j["returns"] = returns.values();
        j["equity"] = equity.values();
        j["drawdown"] = drawdown.values();
    }
    return j;
}

nlohmann::json EnsembleBacktest::to_json() const {
    nlohmann::json j;
    j["realizations"] = realizations;
    for (const auto& [name, bands] : metrics) {
        j["metrics"][name] = {{"p10", bands.p10}, {"p50", bands.p50}, {"p90", bands.p90}};
    }
    return j;
}

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config)), metrics_(config_.periods_per_year) {
    Logger::register_component("BacktestEngine");
}

Result<void> BacktestEngine::validate_config() const {
    if (!(config_.periods_per_year > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "periods_per_year must be positive", "BacktestEngine");
    }
    if (!(config_.var_confidence > 0.0 && config_.var_confidence < 1.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "var_confidence must be in (0, 1), got " +
                                    std::to_string(config_.var_confidence),
                                "BacktestEngine");
    }
    if (!(config_.initial_capital > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "initial_capital must be positive", "BacktestEngine");
    }
    if (config_.rebalance_period < 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "rebalance_period must be non-negative", "BacktestEngine");
    }
    return Result<void>();
}

std::vector<double> BacktestEngine::portfolio_returns(const std::vector<double>& weights,
                                                      const ReturnPanel& panel) const {
    const size_t periods = panel.periods();
    const size_t n = weights.size();
    std::vector<double> result(periods, 0.0);

    if (config_.rebalance_period == 0) {
        for (size_t t = 0; t < periods; ++t) {
            for (size_t a = 0; a < n; ++a) {
                result[t] += weights[a] * panel.returns[a][t];
            }
        }
        return result;
    }

    // Sleeve values drift between rebalances
    std::vector<double> sleeves = weights;
    for (size_t t = 0; t < periods; ++t) {
        double before = 0.0;
        double after = 0.0;
        for (size_t a = 0; a < n; ++a) {
            before += sleeves[a];
            sleeves[a] *= 1.0 + panel.returns[a][t];
            after += sleeves[a];
        }
        result[t] = before != 0.0 ? after / before - 1.0 : 0.0;

        if ((t + 1) % static_cast<size_t>(config_.rebalance_period) == 0) {
            for (size_t a = 0; a < n; ++a) {
                sleeves[a] = weights[a] * after;
            }
        }
    }
    return result;
}

PerformanceSummary BacktestEngine::summarize(const std::vector<double>& returns) const {
    PerformanceSummary summary;
    summary.periods = returns.size();
    if (returns.empty()) {
        return summary;
    }

    const auto equity = metrics_.equity_curve(returns, config_.initial_capital);
    const auto drawdowns = metrics_.drawdowns(equity, config_.initial_capital);

    summary.total_return = metrics_.total_return(config_.initial_capital, equity.back());
    summary.annualized_return = metrics_.annualized_return(returns);
    summary.annualized_volatility = metrics_.annualized_volatility(returns);
    summary.sharpe_ratio = metrics_.sharpe_ratio(returns, config_.risk_free_rate);
    summary.sortino_ratio = metrics_.sortino_ratio(returns, config_.risk_free_rate);
    summary.max_drawdown = metrics_.max_drawdown(drawdowns);
    summary.calmar_ratio = metrics_.calmar_ratio(summary.annualized_return, summary.max_drawdown);
    summary.var = metrics_.value_at_risk(returns, config_.var_confidence);
    summary.cvar = metrics_.conditional_value_at_risk(returns, config_.var_confidence);
    return summary;
}

Result<BacktestResult> BacktestEngine::run(const Portfolio& portfolio, const ReturnPanel& panel,
                                           const std::string& label) const {
    Logger::register_component("BacktestEngine");
    auto config_ok = validate_config();
    if (config_ok.is_error()) {
        return forward_error<BacktestResult>(config_ok.error());
    }

    auto aligned = panel.validate();
    if (aligned.is_error()) {
        return forward_error<BacktestResult>(aligned.error());
    }
    if (portfolio.weights.size() != panel.assets.size() ||
        (!portfolio.assets.empty() && portfolio.assets != panel.assets)) {
        return make_error<BacktestResult>(ErrorCode::SERIES_MISMATCH,
                                          "Portfolio with " +
                                              std::to_string(portfolio.weights.size()) +
                                              " weights does not match the " +
                                              std::to_string(panel.assets.size()) +
                                              " assets of the replay series",
                                          "BacktestEngine");
    }
    if (panel.periods() == 0) {
        return make_error<BacktestResult>(ErrorCode::INSUFFICIENT_DATA,
                                          "Replay series are empty", "BacktestEngine");
    }
    if (config_.expected_periods > 0 && panel.periods() != config_.expected_periods) {
        return make_error<BacktestResult>(ErrorCode::SERIES_MISMATCH,
                                          "Replay series have " +
                                              std::to_string(panel.periods()) +
                                              " periods, expected " +
                                              std::to_string(config_.expected_periods),
                                          "BacktestEngine");
    }

    double weight_sum = 0.0;
    for (double w : portfolio.weights) {
        if (!std::isfinite(w) || w < 0.0) {
            return make_error<BacktestResult>(ErrorCode::INVALID_ARGUMENT,
                                              "Weights must be finite and non-negative, got " +
                                                  std::to_string(w),
                                              "BacktestEngine");
        }
        weight_sum += w;
    }
    if (std::abs(weight_sum - 1.0) > 1e-9) {
        return make_error<BacktestResult>(ErrorCode::INVALID_ARGUMENT,
                                          "Weights sum to " + std::to_string(weight_sum),
                                          "BacktestEngine");
    }

    const auto& timestamps = panel.returns.front().timestamps();
    auto path = portfolio_returns(portfolio.weights, panel);
    const auto equity = metrics_.equity_curve(path, config_.initial_capital);
    const auto drawdowns = metrics_.drawdowns(equity, config_.initial_capital);

    BacktestResult result;
    result.label = label;
    result.assets = panel.assets;
    result.weights = portfolio.weights;
    result.summary = summarize(path);

    auto returns_series = TimeSeries::create(timestamps, std::move(path));
    auto equity_series = TimeSeries::create(timestamps, equity);
    auto drawdown_series = TimeSeries::create(timestamps, drawdowns);
    if (returns_series.is_error()) return forward_error<BacktestResult>(returns_series.error());
    if (equity_series.is_error()) return forward_error<BacktestResult>(equity_series.error());
    if (drawdown_series.is_error()) return forward_error<BacktestResult>(drawdown_series.error());
    result.returns = returns_series.value();
    result.equity = equity_series.value();
    result.drawdown = drawdown_series.value();

    DEBUG("Backtest '" << label << "': " << result.summary.periods
                       << " periods, sharpe=" << result.summary.sharpe_ratio
                       << " max_dd=" << result.summary.max_drawdown);
    return result;
}

Result<std::vector<BacktestResult>> BacktestEngine::run_benchmarks(const ReturnPanel& panel) const {
    std::vector<BacktestResult> results;
    const size_t n = panel.assets.size();
    if (n == 0) {
        return make_error<std::vector<BacktestResult>>(ErrorCode::INSUFFICIENT_DATA,
                                                       "No assets to benchmark", "BacktestEngine");
    }

    for (size_t a = 0; a < n; ++a) {
        Portfolio single;
        single.assets = panel.assets;
        single.weights.assign(n, 0.0);
        single.weights[a] = 1.0;
        auto replay = run(single, panel, panel.assets[a] + "_only");
        if (replay.is_error()) {
            return forward_error<std::vector<BacktestResult>>(replay.error());
        }
        results.push_back(replay.value());
    }

    Portfolio equal;
    equal.assets = panel.assets;
    equal.weights.assign(n, 1.0 / static_cast<double>(n));
    auto replay = run(equal, panel, "equal_weight");
    if (replay.is_error()) {
        return forward_error<std::vector<BacktestResult>>(replay.error());
    }
    results.push_back(replay.value());
    return results;
}

Result<EnsembleBacktest> BacktestEngine::run_ensemble(const Portfolio& portfolio,
                                                      const ScenarioSet& scenarios,
                                                      const RevenueModel& revenue) const {
    Logger::register_component("BacktestEngine");
    if (scenarios.size() == 0) {
        return make_error<EnsembleBacktest>(ErrorCode::INSUFFICIENT_DATA,
                                            "Scenario set is empty", "BacktestEngine");
    }

    std::map<std::string, std::vector<double>> samples;
    for (size_t i = 0; i < scenarios.size(); ++i) {
        auto inputs = scenarios.market_inputs(i);
        if (inputs.is_error()) {
            return forward_error<EnsembleBacktest>(inputs.error());
        }
        auto panel = revenue.hourly_returns(inputs.value());
        if (panel.is_error()) {
            return forward_error<EnsembleBacktest>(panel.error());
        }
        auto replay = run(portfolio, panel.value(), "realization_" + std::to_string(i));
        if (replay.is_error()) {
            return forward_error<EnsembleBacktest>(replay.error());
        }
        for (const auto& [name, value] : replay.value().summary.to_map()) {
            samples[name].push_back(value);
        }
    }

    EnsembleBacktest ensemble;
    ensemble.realizations = scenarios.size();
    for (const auto& [name, values] : samples) {
        MetricBands bands;
        bands.p10 = statistics::quantile(values, 0.10);
        bands.p50 = statistics::quantile(values, 0.50);
        bands.p90 = statistics::quantile(values, 0.90);
        ensemble.metrics[name] = bands;
    }

    INFO("Replayed allocation across " << ensemble.realizations << " realizations");
    return ensemble;
}

}  // namespace renewfolio

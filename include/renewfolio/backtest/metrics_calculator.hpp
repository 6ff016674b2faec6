// include/renewfolio/backtest/metrics_calculator.hpp
#pragma once

#include <vector>
#include "renewfolio/core/types.hpp"

namespace renewfolio {

/**
 * @brief Stateless performance and risk statistics of a per-period return path
 *
 * All annualization uses the same periods_per_year: mean returns are scaled by
 * it and volatilities by its square root. Drawdowns are signed, so a 10% fall
 * from the running peak is -0.10 and the maximum drawdown is the minimum.
 */
class MetricsCalculator {
public:
    explicit MetricsCalculator(double periods_per_year = HOURS_PER_YEAR);

    // ========== Return Calculations ==========

    /**
     * @brief Compounded equity after each period
     * @param initial_capital Equity before the first period
     */
    std::vector<double> equity_curve(const std::vector<double>& returns,
                                     double initial_capital) const;

    /**
     * @brief Total return as decimal (0.10 = 10%)
     */
    double total_return(double start_value, double end_value) const;

    /**
     * @brief Mean per-period return times periods per year
     */
    double annualized_return(const std::vector<double>& returns) const;

    // ========== Volatility Metrics ==========

    /**
     * @brief Sample standard deviation times sqrt(periods per year)
     */
    double annualized_volatility(const std::vector<double>& returns) const;

    /**
     * @brief Annualized root mean square shortfall over returns below target
     * @param target Per-period target return
     */
    double downside_deviation(const std::vector<double>& returns, double target) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @param risk_free_rate Annual rate
     */
    double sharpe_ratio(const std::vector<double>& returns, double risk_free_rate) const;
    double sortino_ratio(const std::vector<double>& returns, double risk_free_rate) const;

    /**
     * @brief Annualized return over |maximum drawdown|, 0 without a drawdown
     */
    double calmar_ratio(double annualized_return, double max_drawdown) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief equity / running peak - 1, with the peak starting at initial_capital
     */
    std::vector<double> drawdowns(const std::vector<double>& equity, double initial_capital) const;

    double max_drawdown(const std::vector<double>& drawdowns) const;

    // ========== Risk Metrics ==========

    /**
     * @brief The (1 - confidence) quantile of returns, signed (losses are negative)
     */
    double value_at_risk(const std::vector<double>& returns, double confidence) const;

    /**
     * @brief Mean of the returns at or below value_at_risk
     */
    double conditional_value_at_risk(const std::vector<double>& returns, double confidence) const;

    double periods_per_year() const {
        return periods_per_year_;
    }

private:
    double periods_per_year_;
};

}  // namespace renewfolio

// src/backtest/metrics_calculator.cpp

#include "renewfolio/backtest/metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include "renewfolio/core/statistics.hpp"

namespace renewfolio {

namespace {

// Sortino reported when no period falls below the target
constexpr double SORTINO_CAP = 999.0;

}  // namespace

MetricsCalculator::MetricsCalculator(double periods_per_year)
    : periods_per_year_(periods_per_year) {}

std::vector<double> MetricsCalculator::equity_curve(const std::vector<double>& returns,
                                                    double initial_capital) const {
    std::vector<double> equity;
    equity.reserve(returns.size());
    double value = initial_capital;
    for (double r : returns) {
        value *= 1.0 + r;
        equity.push_back(value);
    }
    return equity;
}

double MetricsCalculator::total_return(double start_value, double end_value) const {
    if (start_value == 0.0) {
        return 0.0;
    }
    return end_value / start_value - 1.0;
}

double MetricsCalculator::annualized_return(const std::vector<double>& returns) const {
    return statistics::mean(returns) * periods_per_year_;
}

double MetricsCalculator::annualized_volatility(const std::vector<double>& returns) const {
    return statistics::sample_std(returns) * std::sqrt(periods_per_year_);
}

double MetricsCalculator::downside_deviation(const std::vector<double>& returns,
                                             double target) const {
    double downside_sum = 0.0;
    int downside_count = 0;

    for (double ret : returns) {
        if (ret < target) {
            double deviation = ret - target;
            downside_sum += deviation * deviation;
            downside_count++;
        }
    }

    if (downside_count <= 0) {
        return 0.0;
    }
    return std::sqrt(downside_sum / downside_count) * std::sqrt(periods_per_year_);
}

double MetricsCalculator::sharpe_ratio(const std::vector<double>& returns,
                                       double risk_free_rate) const {
    const double vol = annualized_volatility(returns);
    if (returns.empty() || vol <= 0.0) {
        return 0.0;
    }
    return (annualized_return(returns) - risk_free_rate) / vol;
}

double MetricsCalculator::sortino_ratio(const std::vector<double>& returns,
                                        double risk_free_rate) const {
    if (returns.empty()) {
        return 0.0;
    }

    const double excess = annualized_return(returns) - risk_free_rate;
    const double downside = downside_deviation(returns, risk_free_rate / periods_per_year_);
    if (downside <= 0.0) {
        return excess >= 0.0 ? SORTINO_CAP : 0.0;
    }
    return excess / downside;
}

double MetricsCalculator::calmar_ratio(double annualized_return, double max_drawdown) const {
    if (max_drawdown == 0.0) {
        return 0.0;
    }
    return annualized_return / std::abs(max_drawdown);
}

std::vector<double> MetricsCalculator::drawdowns(const std::vector<double>& equity,
                                                 double initial_capital) const {
    std::vector<double> result;
    result.reserve(equity.size());

    double peak = initial_capital;
    for (double value : equity) {
        peak = std::max(peak, value);
        result.push_back(peak > 0.0 ? value / peak - 1.0 : 0.0);
    }
    return result;
}

double MetricsCalculator::max_drawdown(const std::vector<double>& drawdowns) const {
    if (drawdowns.empty()) {
        return 0.0;
    }
    return std::min(0.0, *std::min_element(drawdowns.begin(), drawdowns.end()));
}

double MetricsCalculator::value_at_risk(const std::vector<double>& returns,
                                        double confidence) const {
    if (returns.empty()) {
        return 0.0;
    }
    return statistics::quantile(returns, 1.0 - confidence);
}

double MetricsCalculator::conditional_value_at_risk(const std::vector<double>& returns,
                                                    double confidence) const {
    if (returns.empty()) {
        return 0.0;
    }

    const double var = value_at_risk(returns, confidence);
    double tail_sum = 0.0;
    size_t tail_count = 0;
    for (double r : returns) {
        if (r <= var) {
            tail_sum += r;
            ++tail_count;
        }
    }
    return tail_count > 0 ? tail_sum / static_cast<double>(tail_count) : var;
}

}  // namespace renewfolio

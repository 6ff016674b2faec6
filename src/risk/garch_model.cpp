// src/risk/garch_model.cpp

#include "renewfolio/risk/garch_model.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include "renewfolio/core/logger.hpp"
#include "renewfolio/core/statistics.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace renewfolio {

namespace {

using Params = std::array<double, 3>;  // omega, alpha, beta

bool feasible(const Params& x) {
    return x[0] > 0.0 && x[1] >= 0.0 && x[2] >= 0.0 && x[1] + x[2] < 1.0;
}

}  // namespace

GarchModel::GarchModel(GarchConfig config) : config_(std::move(config)) {
    Logger::register_component("GARCH");
}

Result<void> GarchModel::fit(const TimeSeries& prices) {
    Logger::register_component("GARCH");
    std::lock_guard<std::mutex> lock(mutex_);
    fitted_ = false;

    if (config_.p != 1 || config_.q != 1) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Only GARCH(1,1) is supported, got (" + std::to_string(config_.p) +
                                    "," + std::to_string(config_.q) + ")",
                                "GARCH");
    }

    auto returns_result = compute_returns(prices, config_.return_type);
    if (returns_result.is_error()) {
        return forward_error<void>(returns_result.error());
    }
    const auto& returns = returns_result.value();

    if (returns.size() < config_.min_observations) {
        return make_error<void>(ErrorCode::INSUFFICIENT_DATA,
                                "GARCH needs at least " + std::to_string(config_.min_observations) +
                                    " returns, got " + std::to_string(returns.size()),
                                "GARCH");
    }

    mean_return_ = statistics::mean(returns);
    const double sample_var = statistics::sample_variance(returns, mean_return_);
    if (!std::isfinite(sample_var) || sample_var <= 0.0) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Return variance is " + std::to_string(sample_var) +
                                    "; cannot fit a conditional variance",
                                "GARCH");
    }

    residuals_.resize(returns.size());
    std::vector<double> standardized(returns.size());
    const double scale = std::sqrt(sample_var);
    for (size_t i = 0; i < returns.size(); ++i) {
        residuals_[i] = returns[i] - mean_return_;
        standardized[i] = residuals_[i] / scale;
    }

    auto estimate = estimate_parameters(standardized);
    if (estimate.is_error()) {
        return estimate;
    }

    // Back to the scale of the original returns
    omega_ *= sample_var;

    conditional_variances_.resize(residuals_.size());
    conditional_variances_[0] = sample_var;
    for (size_t t = 1; t < residuals_.size(); ++t) {
        conditional_variances_[t] = omega_ + alpha_ * residuals_[t - 1] * residuals_[t - 1] +
                                    beta_ * conditional_variances_[t - 1];
        if (!std::isfinite(conditional_variances_[t]) || conditional_variances_[t] <= 0.0) {
            return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                    "Conditional variance became " +
                                        std::to_string(conditional_variances_[t]) + " at step " +
                                        std::to_string(t),
                                    "GARCH");
        }
    }

    last_price_ = prices[prices.size() - 1];
    last_timestamp_ = prices.end();
    fitted_ = true;

    DEBUG("GARCH fit: omega=" << omega_ << " alpha=" << alpha_ << " beta=" << beta_
                              << " loglik=" << log_likelihood_ << " iterations=" << iterations_);
    return Result<void>();
}

Result<void> GarchModel::estimate_parameters(const std::vector<double>& standardized) {
    // Grid search for a starting point, variance-targeted so omega = 1 - alpha - beta
    Params best{1.0 - config_.alpha - config_.beta, config_.alpha, config_.beta};
    if (!feasible(best)) {
        best = {0.05, 0.1, 0.85};
    }
    double best_ll = log_likelihood(standardized, best[0], best[1], best[2]);

    for (double a = 0.05; a <= 0.3; a += 0.05) {
        for (double b = 0.6; b <= 0.9; b += 0.05) {
            if (a + b < 0.995) {
                double w = 1.0 - a - b;
                double ll = log_likelihood(standardized, w, a, b);
                if (ll > best_ll) {
                    best_ll = ll;
                    best = {w, a, b};
                }
            }
        }
    }

    // Nelder-Mead on the negative mean log-likelihood
    const double n = static_cast<double>(standardized.size());
    auto objective = [&](const Params& x) {
        if (!feasible(x)) {
            return std::numeric_limits<double>::infinity();
        }
        double ll = log_likelihood(standardized, x[0], x[1], x[2]);
        return std::isfinite(ll) ? -ll / n : std::numeric_limits<double>::infinity();
    };

    std::array<Params, 4> simplex;
    simplex[0] = best;
    simplex[1] = {best[0] * 1.5, best[1], best[2]};
    simplex[2] = {best[0], best[1] + (best[1] + best[2] + 0.05 < 1.0 ? 0.05 : -0.5 * best[1]),
                  best[2]};
    simplex[3] = {best[0], best[1], best[2] * 0.95};

    std::array<double, 4> values;
    for (size_t i = 0; i < simplex.size(); ++i) {
        values[i] = objective(simplex[i]);
    }

    bool converged = false;
    int iteration = 0;
    for (; iteration < config_.max_iterations; ++iteration) {
        std::array<size_t, 4> order{0, 1, 2, 3};
        std::sort(order.begin(), order.end(),
                  [&](size_t a, size_t b) { return values[a] < values[b]; });
        std::array<Params, 4> sorted_simplex;
        std::array<double, 4> sorted_values;
        for (size_t i = 0; i < 4; ++i) {
            sorted_simplex[i] = simplex[order[i]];
            sorted_values[i] = values[order[i]];
        }
        simplex = sorted_simplex;
        values = sorted_values;

        double spread = 0.0;
        for (size_t i = 1; i < 4; ++i) {
            for (size_t k = 0; k < 3; ++k) {
                spread = std::max(spread, std::abs(simplex[i][k] - simplex[0][k]));
            }
        }
        if (std::isfinite(values[3]) && values[3] - values[0] <= config_.tolerance &&
            spread <= 1e-4) {
            converged = true;
            break;
        }

        Params centroid{0.0, 0.0, 0.0};
        for (size_t i = 0; i < 3; ++i) {
            for (size_t k = 0; k < 3; ++k) {
                centroid[k] += simplex[i][k] / 3.0;
            }
        }

        auto along = [&](double coefficient) {
            Params p;
            for (size_t k = 0; k < 3; ++k) {
                p[k] = centroid[k] + coefficient * (simplex[3][k] - centroid[k]);
            }
            return p;
        };

        Params reflected = along(-1.0);
        double f_reflected = objective(reflected);

        if (f_reflected < values[0]) {
            Params expanded = along(-2.0);
            double f_expanded = objective(expanded);
            if (f_expanded < f_reflected) {
                simplex[3] = expanded;
                values[3] = f_expanded;
            } else {
                simplex[3] = reflected;
                values[3] = f_reflected;
            }
        } else if (f_reflected < values[2]) {
            simplex[3] = reflected;
            values[3] = f_reflected;
        } else {
            const bool outside = f_reflected < values[3];
            Params contracted = along(outside ? -0.5 : 0.5);
            double f_contracted = objective(contracted);
            if (f_contracted < std::min(f_reflected, values[3])) {
                simplex[3] = contracted;
                values[3] = f_contracted;
            } else {
                // Shrink towards the best vertex
                for (size_t i = 1; i < 4; ++i) {
                    for (size_t k = 0; k < 3; ++k) {
                        simplex[i][k] = simplex[0][k] + 0.5 * (simplex[i][k] - simplex[0][k]);
                    }
                    values[i] = objective(simplex[i]);
                }
            }
        }
    }

    iterations_ = iteration;

    if (!converged) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Likelihood maximization did not converge after " +
                                    std::to_string(config_.max_iterations) + " iterations",
                                "GARCH");
    }

    const Params& x = simplex[0];
    if (!feasible(x) || !std::isfinite(values[0])) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Estimated parameters violate stationarity: alpha + beta = " +
                                    std::to_string(x[1] + x[2]),
                                "GARCH");
    }

    omega_ = x[0];
    alpha_ = x[1];
    beta_ = x[2];
    log_likelihood_ = -values[0] * n;
    return Result<void>();
}

double GarchModel::log_likelihood(const std::vector<double>& residuals, double omega,
                                  double alpha, double beta) const {
    double var = statistics::sample_variance(residuals, 0.0);
    if (var <= 0.0) return -std::numeric_limits<double>::infinity();

    double ll = -0.5 * (std::log(2.0 * M_PI) + std::log(var) + residuals[0] * residuals[0] / var);

    for (size_t t = 1; t < residuals.size(); ++t) {
        var = omega + alpha * residuals[t - 1] * residuals[t - 1] + beta * var;
        if (var <= 0.0) return -std::numeric_limits<double>::infinity();
        ll += -0.5 * (std::log(2.0 * M_PI) + std::log(var) + residuals[t] * residuals[t] / var);
    }

    return ll;
}

Result<TimeSeries> GarchModel::forecast(int horizon) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!fitted_) {
        return make_error<TimeSeries>(ErrorCode::NOT_INITIALIZED,
                                      "GARCH model has not been fitted", "GARCH");
    }
    if (horizon <= 0) {
        return make_error<TimeSeries>(ErrorCode::INVALID_ARGUMENT,
                                      "Forecast horizon must be positive, got " +
                                          std::to_string(horizon),
                                      "GARCH");
    }

    std::vector<double> forecasts(static_cast<size_t>(horizon));

    // Seeded with the last observed shock and variance
    const double last_shock = residuals_.back();
    double h = omega_ + alpha_ * last_shock * last_shock + beta_ * conditional_variances_.back();

    for (int i = 0; i < horizon; ++i) {
        if (i > 0) {
            h = omega_ + (alpha_ + beta_) * h;
        }
        forecasts[static_cast<size_t>(i)] = std::sqrt(h);
    }

    return TimeSeries::hourly(last_timestamp_ + SERIES_STEP, std::move(forecasts));
}

Result<double> GarchModel::get_current_volatility() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!fitted_) {
        return make_error<double>(ErrorCode::NOT_INITIALIZED, "GARCH model has not been fitted",
                                  "GARCH");
    }
    return std::sqrt(conditional_variances_.back());
}

Result<double> GarchModel::unconditional_variance() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!fitted_) {
        return make_error<double>(ErrorCode::NOT_INITIALIZED, "GARCH model has not been fitted",
                                  "GARCH");
    }
    return omega_ / (1.0 - alpha_ - beta_);
}

Result<void> GarchModel::update(double new_price) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!fitted_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "GARCH model has not been fitted",
                                "GARCH");
    }

    auto r = compute_return(last_price_, new_price, config_.return_type);
    if (r.is_error()) {
        return forward_error<void>(r.error());
    }

    const double previous_shock = residuals_.back();
    const double new_var =
        omega_ + alpha_ * previous_shock * previous_shock + beta_ * conditional_variances_.back();
    if (!std::isfinite(new_var)) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Conditional variance update is not finite", "GARCH");
    }

    residuals_.push_back(r.value() - mean_return_);
    conditional_variances_.push_back(new_var);
    last_price_ = new_price;
    last_timestamp_ += SERIES_STEP;

    return Result<void>();
}

}  // namespace renewfolio

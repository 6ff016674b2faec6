// src/optimization/return_estimate.cpp

#include "renewfolio/optimization/return_estimate.hpp"
#include <algorithm>
#include <cmath>

namespace renewfolio {

namespace {

// Column means and unbiased covariance of an observations x assets matrix
void sample_moments(const Eigen::MatrixXd& samples, Eigen::VectorXd& mean, Eigen::MatrixXd& cov) {
    mean = samples.colwise().mean().transpose();
    Eigen::MatrixXd centered = samples.rowwise() - mean.transpose();
    cov = (centered.transpose() * centered) / static_cast<double>(samples.rows() - 1);
    cov = 0.5 * (cov + cov.transpose());
}

}  // namespace

Result<void> ReturnEstimate::validate() const {
    const Eigen::Index n = static_cast<Eigen::Index>(assets.size());
    if (n == 0) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Return estimate has no assets",
                                "ReturnEstimate");
    }
    if (expected_returns.size() != n || covariance.rows() != n || covariance.cols() != n) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Return estimate shape mismatch: " + std::to_string(n) +
                                    " assets, " + std::to_string(expected_returns.size()) +
                                    " returns, " + std::to_string(covariance.rows()) + "x" +
                                    std::to_string(covariance.cols()) + " covariance",
                                "ReturnEstimate");
    }
    if (!expected_returns.allFinite() || !covariance.allFinite()) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Return estimate contains NaN or infinite values",
                                "ReturnEstimate");
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double scale = std::max(1.0, std::abs(covariance(i, j)));
            if (std::abs(covariance(i, j) - covariance(j, i)) > 1e-12 * scale) {
                return make_error<void>(ErrorCode::INVALID_DATA,
                                        "Covariance is not symmetric at (" + std::to_string(i) +
                                            "," + std::to_string(j) + ")",
                                        "ReturnEstimate");
            }
        }
    }
    return Result<void>();
}

Result<void> ReturnEstimate::scale_covariance(double variance_ratio) {
    if (!(variance_ratio > 0.0) || !std::isfinite(variance_ratio)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Variance ratio must be positive and finite, got " +
                                    std::to_string(variance_ratio),
                                "ReturnEstimate");
    }
    covariance *= variance_ratio;
    return Result<void>();
}

nlohmann::json ReturnEstimate::to_json() const {
    nlohmann::json j;
    j["assets"] = assets;
    j["periods_per_year"] = periods_per_year;
    j["observations"] = observations;

    std::vector<double> returns(expected_returns.data(),
                                expected_returns.data() + expected_returns.size());
    j["expected_returns"] = returns;

    nlohmann::json cov = nlohmann::json::array();
    for (Eigen::Index i = 0; i < covariance.rows(); ++i) {
        std::vector<double> row;
        for (Eigen::Index k = 0; k < covariance.cols(); ++k) {
            row.push_back(covariance(i, k));
        }
        cov.push_back(row);
    }
    j["covariance"] = cov;
    return j;
}

Result<ReturnEstimate> ReturnEstimate::from_scenarios(const ScenarioSet& scenarios,
                                                      const RevenueModel& revenue,
                                                      double periods_per_year) {
    if (scenarios.size() < 2) {
        return make_error<ReturnEstimate>(ErrorCode::INSUFFICIENT_DATA,
                                          "Need at least 2 realizations, got " +
                                              std::to_string(scenarios.size()),
                                          "ReturnEstimate");
    }
    const auto& profiles = revenue.get_profiles();
    if (scenarios.assets.size() != profiles.size()) {
        return make_error<ReturnEstimate>(ErrorCode::SERIES_MISMATCH,
                                          "Scenario set has " +
                                              std::to_string(scenarios.assets.size()) +
                                              " assets, revenue model has " +
                                              std::to_string(profiles.size()),
                                          "ReturnEstimate");
    }
    for (size_t a = 0; a < profiles.size(); ++a) {
        if (scenarios.assets[a] != profiles[a].name) {
            return make_error<ReturnEstimate>(ErrorCode::SERIES_MISMATCH,
                                              "Scenario asset '" + scenarios.assets[a] +
                                                  "' does not match profile '" +
                                                  profiles[a].name + "'",
                                              "ReturnEstimate");
        }
    }

    const Eigen::Index n_assets = static_cast<Eigen::Index>(profiles.size());
    Eigen::MatrixXd samples(static_cast<Eigen::Index>(scenarios.size()), n_assets);
    for (size_t i = 0; i < scenarios.size(); ++i) {
        const auto& realization = scenarios.realizations[i];
        if (realization.price.size() != scenarios.horizon() ||
            realization.generation_mw.size() != profiles.size()) {
            return make_error<ReturnEstimate>(ErrorCode::SERIES_MISMATCH,
                                              "Realization " + std::to_string(i) +
                                                  " does not match the scenario horizon",
                                              "ReturnEstimate");
        }
        auto annual = revenue.annualized_returns(realization, periods_per_year);
        for (Eigen::Index a = 0; a < n_assets; ++a) {
            samples(static_cast<Eigen::Index>(i), a) = annual[static_cast<size_t>(a)];
        }
    }

    ReturnEstimate estimate;
    estimate.assets = scenarios.assets;
    estimate.periods_per_year = periods_per_year;
    estimate.observations = scenarios.size();
    sample_moments(samples, estimate.expected_returns, estimate.covariance);

    auto valid = estimate.validate();
    if (valid.is_error()) {
        return forward_error<ReturnEstimate>(valid.error());
    }
    return estimate;
}

Result<ReturnEstimate> ReturnEstimate::from_history(const ReturnPanel& panel,
                                                    double periods_per_year) {
    auto aligned = panel.validate();
    if (aligned.is_error()) {
        return forward_error<ReturnEstimate>(aligned.error());
    }
    if (panel.periods() < 2) {
        return make_error<ReturnEstimate>(ErrorCode::INSUFFICIENT_DATA,
                                          "Need at least 2 return periods, got " +
                                              std::to_string(panel.periods()),
                                          "ReturnEstimate");
    }

    const Eigen::Index n_assets = static_cast<Eigen::Index>(panel.assets.size());
    const Eigen::Index periods = static_cast<Eigen::Index>(panel.periods());
    Eigen::MatrixXd samples(periods, n_assets);
    for (Eigen::Index a = 0; a < n_assets; ++a) {
        const auto& values = panel.returns[static_cast<size_t>(a)].values();
        for (Eigen::Index t = 0; t < periods; ++t) {
            samples(t, a) = values[static_cast<size_t>(t)];
        }
    }

    ReturnEstimate estimate;
    estimate.assets = panel.assets;
    estimate.periods_per_year = periods_per_year;
    estimate.observations = panel.periods();
    sample_moments(samples, estimate.expected_returns, estimate.covariance);
    estimate.expected_returns *= periods_per_year;
    estimate.covariance *= periods_per_year;

    auto valid = estimate.validate();
    if (valid.is_error()) {
        return forward_error<ReturnEstimate>(valid.error());
    }
    return estimate;
}

}  // namespace renewfolio

// src/simulation/scenario_simulator.cpp

#include "renewfolio/simulation/scenario_simulator.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include "renewfolio/core/random_utils.hpp"
#include "renewfolio/core/statistics.hpp"
#include "renewfolio/core/time_utils.hpp"
#include "renewfolio/simulation/power_models.hpp"

namespace renewfolio {

namespace {

// Smallest eigenvalue accepted for a positive semi-definite correlation matrix
constexpr double PSD_TOLERANCE = 1e-8;
constexpr double UNIT_DIAGONAL_TOLERANCE = 1e-9;

Result<QuantileBands> bands_for(const std::vector<Timestamp>& timestamps,
                                const std::vector<std::vector<double>>& columns) {
    std::vector<double> p10, p50, p90;
    p10.reserve(columns.size());
    p50.reserve(columns.size());
    p90.reserve(columns.size());

    for (auto column : columns) {
        std::sort(column.begin(), column.end());
        p10.push_back(statistics::quantile_sorted(column, 0.10));
        p50.push_back(statistics::quantile_sorted(column, 0.50));
        p90.push_back(statistics::quantile_sorted(column, 0.90));
    }

    auto s10 = TimeSeries::create(timestamps, std::move(p10));
    auto s50 = TimeSeries::create(timestamps, std::move(p50));
    auto s90 = TimeSeries::create(timestamps, std::move(p90));
    if (s10.is_error()) return forward_error<QuantileBands>(s10.error());
    if (s50.is_error()) return forward_error<QuantileBands>(s50.error());
    if (s90.is_error()) return forward_error<QuantileBands>(s90.error());

    QuantileBands bands;
    bands.p10 = s10.value();
    bands.p50 = s50.value();
    bands.p90 = s90.value();
    return bands;
}

nlohmann::json bands_to_json(const QuantileBands& bands) {
    nlohmann::json j;
    j["p10"] = bands.p10.values();
    j["p50"] = bands.p50.values();
    j["p90"] = bands.p90.values();
    return j;
}

}  // namespace

Result<MarketInputs> ScenarioSet::market_inputs(size_t index) const {
    if (index >= realizations.size()) {
        return make_error<MarketInputs>(ErrorCode::INVALID_ARGUMENT,
                                        "Realization " + std::to_string(index) +
                                            " out of range for ensemble of " +
                                            std::to_string(realizations.size()),
                                        "ScenarioSet");
    }

    const auto& realization = realizations[index];
    MarketInputs inputs;
    inputs.assets = assets;

    auto price = TimeSeries::create(timestamps, realization.price);
    if (price.is_error()) {
        return forward_error<MarketInputs>(price.error());
    }
    inputs.price = price.value();

    for (const auto& generation : realization.generation_mw) {
        auto series = TimeSeries::create(timestamps, generation);
        if (series.is_error()) {
            return forward_error<MarketInputs>(series.error());
        }
        inputs.generation_mw.push_back(series.value());
    }
    return inputs;
}

nlohmann::json ScenarioSummary::to_json() const {
    nlohmann::json j;
    std::vector<std::string> stamps;
    if (!price.p50.empty()) {
        for (const auto& ts : price.p50.timestamps()) {
            stamps.push_back(core::format_utc_timestamp(ts));
        }
    }
    j["timestamps"] = stamps;
    j["price"] = bands_to_json(price);
    nlohmann::json gen;
    for (size_t a = 0; a < assets.size() && a < generation.size(); ++a) {
        gen[assets[a]] = bands_to_json(generation[a]);
    }
    j["generation_mw"] = gen;
    return j;
}

ScenarioSimulator::ScenarioSimulator(std::vector<AssetProfile> profiles,
                                     PriceModelConfig price_config, SimulationConfig config)
    : profiles_(std::move(profiles)),
      price_model_(std::move(price_config)),
      config_(std::move(config)) {
    Logger::register_component("ScenarioSimulator");
}

Result<Eigen::MatrixXd> ScenarioSimulator::correlation() const {
    const Eigen::Index n = static_cast<Eigen::Index>(profiles_.size());
    Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(n, n);

    if (config_.correlation_matrix.empty()) {
        // One-factor model: every asset loads on a shared weather driver
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = 0; j < n; ++j) {
                if (i != j) {
                    corr(i, j) = profiles_[i].weather_loading * profiles_[j].weather_loading;
                }
            }
        }
        return corr;
    }

    const auto& rows = config_.correlation_matrix;
    if (static_cast<Eigen::Index>(rows.size()) != n) {
        return make_error<Eigen::MatrixXd>(
            ErrorCode::CONFIGURATION_ERROR,
            "Correlation matrix has " + std::to_string(rows.size()) + " rows for " +
                std::to_string(n) + " assets",
            "ScenarioSimulator");
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        if (static_cast<Eigen::Index>(rows[i].size()) != n) {
            return make_error<Eigen::MatrixXd>(ErrorCode::CONFIGURATION_ERROR,
                                               "Correlation matrix row " + std::to_string(i) +
                                                   " has " + std::to_string(rows[i].size()) +
                                                   " entries, expected " + std::to_string(n),
                                               "ScenarioSimulator");
        }
        for (Eigen::Index j = 0; j < n; ++j) {
            if (!std::isfinite(rows[i][j])) {
                return make_error<Eigen::MatrixXd>(ErrorCode::CONFIGURATION_ERROR,
                                                   "Correlation matrix contains a non-finite entry",
                                                   "ScenarioSimulator");
            }
            corr(i, j) = rows[i][j];
        }
    }

    corr = (0.5 * (corr + corr.transpose())).eval();

    for (Eigen::Index i = 0; i < n; ++i) {
        if (std::abs(corr(i, i) - 1.0) > UNIT_DIAGONAL_TOLERANCE) {
            return make_error<Eigen::MatrixXd>(ErrorCode::CONFIGURATION_ERROR,
                                               "Correlation diagonal entry " + std::to_string(i) +
                                                   " is " + std::to_string(corr(i, i)) +
                                                   ", expected 1",
                                               "ScenarioSimulator");
        }
        for (Eigen::Index j = 0; j < n; ++j) {
            if (std::abs(corr(i, j)) > 1.0) {
                return make_error<Eigen::MatrixXd>(
                    ErrorCode::CONFIGURATION_ERROR,
                    "Correlation entry (" + std::to_string(i) + "," + std::to_string(j) +
                        ") = " + std::to_string(corr(i, j)) + " outside [-1, 1]",
                    "ScenarioSimulator");
            }
        }
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(corr);
    const double min_eigenvalue = solver.eigenvalues().minCoeff();
    if (min_eigenvalue < -PSD_TOLERANCE) {
        return make_error<Eigen::MatrixXd>(
            ErrorCode::CONFIGURATION_ERROR,
            "Correlation matrix is not positive semi-definite (smallest eigenvalue " +
                std::to_string(min_eigenvalue) + ")",
            "ScenarioSimulator");
    }

    return corr;
}

Result<Eigen::MatrixXd> ScenarioSimulator::correlation_factor() const {
    auto corr_result = correlation();
    if (corr_result.is_error()) {
        return corr_result;
    }
    const Eigen::MatrixXd& corr = corr_result.value();

    Eigen::LLT<Eigen::MatrixXd> llt(corr);
    if (llt.info() == Eigen::Success) {
        Eigen::MatrixXd factor = llt.matrixL();
        return factor;
    }

    // Semi-definite (e.g. perfectly correlated sites): symmetric square root
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(corr);
    Eigen::VectorXd roots = solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();
    Eigen::MatrixXd factor = solver.eigenvectors() * roots.asDiagonal();
    DEBUG("Correlation matrix is singular, using eigen factor");
    return factor;
}

Result<void> ScenarioSimulator::validate() const {
    if (profiles_.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "At least one asset profile is required", "ScenarioSimulator");
    }
    for (const auto& profile : profiles_) {
        auto valid = profile.validate();
        if (valid.is_error()) {
            return valid;
        }
    }
    if (config_.horizon_hours <= 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Horizon must be positive, got " +
                                    std::to_string(config_.horizon_hours) + " hours",
                                "ScenarioSimulator");
    }
    if (config_.n_realizations == 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Ensemble size must be positive", "ScenarioSimulator");
    }
    auto price_valid = price_model_.validate();
    if (price_valid.is_error()) {
        return price_valid;
    }
    auto start = core::parse_utc_timestamp(config_.start);
    if (start.is_error()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, start.error()->what(),
                                "ScenarioSimulator");
    }
    auto corr = correlation();
    if (corr.is_error()) {
        return forward_error<void>(corr.error());
    }
    return Result<void>();
}

Result<ScenarioSet> ScenarioSimulator::simulate() const {
    Logger::register_component("ScenarioSimulator");
    auto valid = validate();
    if (valid.is_error()) {
        return forward_error<ScenarioSet>(valid.error());
    }

    auto factor_result = correlation_factor();
    if (factor_result.is_error()) {
        return forward_error<ScenarioSet>(factor_result.error());
    }
    const Eigen::MatrixXd& factor = factor_result.value();

    const Timestamp start = core::parse_utc_timestamp(config_.start).value();
    const size_t horizon = static_cast<size_t>(config_.horizon_hours);

    ScenarioSet set;
    set.timestamps = hourly_timestamps(start, horizon);
    for (const auto& profile : profiles_) {
        set.assets.push_back(profile.name);
    }

    std::vector<int> hours(horizon);
    std::vector<int> days(horizon);
    for (size_t t = 0; t < horizon; ++t) {
        hours[t] = core::hour_of_day(set.timestamps[t]);
        days[t] = core::day_of_year(set.timestamps[t]);
    }

    INFO("Simulating " << config_.n_realizations << " realizations of " << horizon
                       << " hours for " << profiles_.size() << " assets (seed "
                       << config_.seed << ")");

    try {
        set.realizations.reserve(config_.n_realizations);
        for (size_t i = 0; i < config_.n_realizations; ++i) {
            set.realizations.push_back(
                simulate_realization(i, factor, set.timestamps, hours, days));
        }
    } catch (const std::exception& e) {
        return make_error<ScenarioSet>(ErrorCode::UNKNOWN_ERROR,
                                       std::string("Scenario generation failed: ") + e.what(),
                                       "ScenarioSimulator");
    }

    INFO("Scenario ensemble complete");
    return set;
}

Realization ScenarioSimulator::simulate_realization(size_t index, const Eigen::MatrixXd& factor,
                                                    const std::vector<Timestamp>& timestamps,
                                                    const std::vector<int>& hours,
                                                    const std::vector<int>& days) const {
    const size_t n_assets = profiles_.size();
    const size_t horizon = timestamps.size();
    // One distribution per engine: normal_distribution caches the second draw of each pair
    std::normal_distribution<double> param_normal(0.0, 1.0);
    std::normal_distribution<double> weather_normal(0.0, 1.0);

    Realization realization;

    // Inter-annual uncertainty: correlated resource factors and a price level
    auto param_rng = make_engine(config_.seed, RandomStream::PARAMETERS, index);
    std::vector<double> eps(n_assets);
    std::vector<double> z(n_assets);
    for (size_t a = 0; a < n_assets; ++a) {
        eps[a] = param_normal(param_rng);
    }
    for (size_t a = 0; a < n_assets; ++a) {
        z[a] = 0.0;
        for (size_t b = 0; b < n_assets; ++b) {
            z[a] += factor(a, b) * eps[b];
        }
        const double sigma = profiles_[a].resource_uncertainty;
        realization.resource_factors.push_back(std::exp(sigma * z[a] - 0.5 * sigma * sigma));
    }
    realization.price_level_factor = price_model_.draw_level_factor(param_rng);

    // Hourly weather through the Gaussian copula
    auto weather_rng = make_engine(config_.seed, RandomStream::WEATHER, index);
    realization.generation_mw.assign(n_assets, std::vector<double>(horizon, 0.0));

    std::vector<WindPowerCurve> curves;
    curves.reserve(n_assets);
    for (const auto& profile : profiles_) {
        curves.emplace_back(profile.wind);
    }

    for (size_t t = 0; t < horizon; ++t) {
        for (size_t a = 0; a < n_assets; ++a) {
            eps[a] = weather_normal(weather_rng);
        }
        for (size_t a = 0; a < n_assets; ++a) {
            z[a] = 0.0;
            for (size_t b = 0; b < n_assets; ++b) {
                z[a] += factor(a, b) * eps[b];
            }
        }

        for (size_t a = 0; a < n_assets; ++a) {
            const auto& profile = profiles_[a];
            const double u = normal_cdf(z[a]);
            double fraction = 0.0;

            if (profile.kind == AssetKind::WIND) {
                const double scale = modulated_weibull_scale(profile.wind, hours[t], days[t]);
                const double speed = weibull_quantile(u, profile.wind.weibull_shape, scale);
                fraction = curves[a].capacity_fraction(speed) * realization.resource_factors[a];
            } else {
                // Drawn every hour, including night, to keep the stream aligned
                const double temperature_noise =
                    profile.solar.ambient_noise_std_c * weather_normal(weather_rng);
                const double clear_sky = clear_sky_fraction(profile.solar, hours[t], days[t]);
                if (clear_sky > 0.0) {
                    const double cloud = kumaraswamy_quantile(u, profile.solar.cloud_alpha,
                                                              profile.solar.cloud_beta);
                    const double irradiance = clear_sky * (1.0 - profile.solar.cloud_derate * cloud);
                    const double cell_temperature =
                        ambient_temperature_c(profile.solar, hours[t], days[t]) +
                        temperature_noise + profile.solar.irradiance_heating_c * irradiance;
                    fraction = irradiance * temperature_derate(profile.solar, cell_temperature) *
                               realization.resource_factors[a];
                }
            }

            fraction = std::min(std::max(fraction, 0.0), 1.0);
            realization.generation_mw[a][t] = fraction * profile.capacity_mw;
        }
    }

    // Prices use a separate stream, independent of the weather draws
    auto price_rng = make_engine(config_.seed, RandomStream::PRICE, index);
    realization.price =
        price_model_.generate(timestamps, realization.price_level_factor, price_rng);

    return realization;
}

Result<ScenarioSummary> ScenarioSimulator::summarize(const ScenarioSet& set) {
    if (set.realizations.empty() || set.timestamps.empty()) {
        return make_error<ScenarioSummary>(ErrorCode::INVALID_ARGUMENT,
                                           "Cannot summarize an empty scenario set",
                                           "ScenarioSimulator");
    }

    const size_t horizon = set.horizon();
    const size_t n = set.size();

    ScenarioSummary summary;
    summary.assets = set.assets;

    // Cross-sectional columns: one vector of N values per timestamp
    std::vector<std::vector<double>> columns(horizon, std::vector<double>(n));

    for (size_t a = 0; a < set.assets.size(); ++a) {
        for (size_t i = 0; i < n; ++i) {
            for (size_t t = 0; t < horizon; ++t) {
                columns[t][i] = set.realizations[i].generation_mw[a][t];
            }
        }
        auto bands = bands_for(set.timestamps, columns);
        if (bands.is_error()) {
            return forward_error<ScenarioSummary>(bands.error());
        }
        summary.generation.push_back(bands.value());
    }

    for (size_t i = 0; i < n; ++i) {
        for (size_t t = 0; t < horizon; ++t) {
            columns[t][i] = set.realizations[i].price[t];
        }
    }
    auto price_bands = bands_for(set.timestamps, columns);
    if (price_bands.is_error()) {
        return forward_error<ScenarioSummary>(price_bands.error());
    }
    summary.price = price_bands.value();

    return summary;
}

}  // namespace renewfolio

// src/risk/risk_model.cpp

#include "renewfolio/risk/risk_model.hpp"
#include <cmath>
#include "renewfolio/core/statistics.hpp"

namespace renewfolio {

RiskModel::RiskModel(RiskModelConfig config)
    : RiskModel(config, std::make_unique<GarchModel>(config.garch)) {}

RiskModel::RiskModel(RiskModelConfig config, std::unique_ptr<VolatilityModel> primary)
    : config_(std::move(config)), primary_(std::move(primary)) {
    Logger::register_component("RiskModel");
}

Result<void> RiskModel::fit(const TimeSeries& prices) {
    active_ = nullptr;
    used_fallback_ = false;

    if (!primary_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "No primary volatility model",
                                "RiskModel");
    }

    auto primary_fit = primary_->fit(prices);
    Logger::register_component("RiskModel");
    if (primary_fit.is_ok()) {
        active_ = primary_.get();
        INFO("Fitted " << primary_->name() << " on " << prices.size() << " prices");
        return Result<void>();
    }

    if (primary_fit.error()->code() != ErrorCode::MODEL_FIT_ERROR ||
        !config_.fallback_to_sample_variance) {
        return primary_fit;
    }

    WARN(primary_->name() << " fit failed (" << primary_fit.error()->what()
                          << "); falling back to sample variance");

    fallback_ = std::make_unique<SampleVarianceModel>(config_.garch.return_type,
                                                      config_.garch.min_observations);
    auto fallback_fit = fallback_->fit(prices);
    if (fallback_fit.is_error()) {
        return fallback_fit;
    }

    active_ = fallback_.get();
    used_fallback_ = true;
    return Result<void>();
}

Result<TimeSeries> RiskModel::forecast(int horizon) const {
    if (!active_) {
        return make_error<TimeSeries>(ErrorCode::NOT_INITIALIZED, "Risk model has not been fitted",
                                      "RiskModel");
    }
    return active_->forecast(horizon);
}

Result<double> RiskModel::variance_ratio(int horizon) const {
    auto path = forecast(horizon);
    if (path.is_error()) {
        return forward_error<double>(path.error());
    }
    auto long_run = active_->unconditional_variance();
    if (long_run.is_error()) {
        return forward_error<double>(long_run.error());
    }
    if (!(long_run.value() > 0.0) || !std::isfinite(long_run.value())) {
        return make_error<double>(ErrorCode::MODEL_FIT_ERROR,
                                  "Long-run variance is " + std::to_string(long_run.value()),
                                  "RiskModel");
    }

    double total = 0.0;
    for (double vol : path.value().values()) {
        total += vol * vol;
    }
    const double ratio = total / static_cast<double>(path.value().size()) / long_run.value();
    if (!std::isfinite(ratio)) {
        return make_error<double>(ErrorCode::MODEL_FIT_ERROR, "Variance ratio is not finite",
                                  "RiskModel");
    }
    return ratio;
}

}  // namespace renewfolio

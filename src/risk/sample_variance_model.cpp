// src/risk/sample_variance_model.cpp

#include "renewfolio/risk/sample_variance_model.hpp"
#include <algorithm>
#include <cmath>
#include "renewfolio/core/statistics.hpp"

namespace renewfolio {

SampleVarianceModel::SampleVarianceModel(ReturnType return_type, size_t min_observations)
    : return_type_(return_type), min_observations_(std::max<size_t>(min_observations, 2)) {}

Result<void> SampleVarianceModel::fit(const TimeSeries& prices) {
    std::lock_guard<std::mutex> lock(mutex_);
    fitted_ = false;

    auto returns = compute_returns(prices, return_type_);
    if (returns.is_error()) {
        return forward_error<void>(returns.error());
    }
    if (returns.value().size() < min_observations_) {
        return make_error<void>(ErrorCode::INSUFFICIENT_DATA,
                                "Sample variance needs at least " +
                                    std::to_string(min_observations_) + " returns, got " +
                                    std::to_string(returns.value().size()),
                                "SampleVarianceModel");
    }

    returns_ = returns.value();
    variance_ = statistics::sample_variance(returns_, statistics::mean(returns_));
    if (!std::isfinite(variance_)) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR, "Sample variance is not finite",
                                "SampleVarianceModel");
    }

    last_price_ = prices[prices.size() - 1];
    last_timestamp_ = prices.end();
    fitted_ = true;
    return Result<void>();
}

Result<TimeSeries> SampleVarianceModel::forecast(int horizon) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!fitted_) {
        return make_error<TimeSeries>(ErrorCode::NOT_INITIALIZED,
                                      "Sample variance model has not been fitted",
                                      "SampleVarianceModel");
    }
    if (horizon <= 0) {
        return make_error<TimeSeries>(ErrorCode::INVALID_ARGUMENT,
                                      "Forecast horizon must be positive, got " +
                                          std::to_string(horizon),
                                      "SampleVarianceModel");
    }

    std::vector<double> flat(static_cast<size_t>(horizon), std::sqrt(variance_));
    return TimeSeries::hourly(last_timestamp_ + SERIES_STEP, std::move(flat));
}

Result<double> SampleVarianceModel::get_current_volatility() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fitted_) {
        return make_error<double>(ErrorCode::NOT_INITIALIZED,
                                  "Sample variance model has not been fitted",
                                  "SampleVarianceModel");
    }
    return std::sqrt(variance_);
}

Result<double> SampleVarianceModel::unconditional_variance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fitted_) {
        return make_error<double>(ErrorCode::NOT_INITIALIZED,
                                  "Sample variance model has not been fitted",
                                  "SampleVarianceModel");
    }
    return variance_;
}

Result<void> SampleVarianceModel::update(double new_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fitted_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Sample variance model has not been fitted",
                                "SampleVarianceModel");
    }

    auto r = compute_return(last_price_, new_price, return_type_);
    if (r.is_error()) {
        return forward_error<void>(r.error());
    }
    returns_.push_back(r.value());
    variance_ = statistics::sample_variance(returns_, statistics::mean(returns_));
    last_price_ = new_price;
    last_timestamp_ += SERIES_STEP;
    return Result<void>();
}

}  // namespace renewfolio

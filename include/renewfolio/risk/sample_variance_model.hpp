// include/renewfolio/risk/sample_variance_model.hpp
#pragma once

#include <mutex>
#include <vector>
#include "renewfolio/risk/volatility_model.hpp"

namespace renewfolio {

/**
 * @brief Constant-variance model, the fallback when GARCH cannot be fitted
 */
class SampleVarianceModel : public VolatilityModel {
public:
    explicit SampleVarianceModel(ReturnType return_type = ReturnType::DIFFERENCE,
                                 size_t min_observations = 2);

    /**
     * @return INSUFFICIENT_DATA below min_observations returns, MODEL_FIT_ERROR for a
     *         non-finite variance
     */
    Result<void> fit(const TimeSeries& prices) override;
    Result<TimeSeries> forecast(int horizon) const override;
    Result<double> get_current_volatility() const override;
    Result<double> unconditional_variance() const override;
    Result<void> update(double new_price) override;
    bool is_fitted() const override { return fitted_; }
    std::string name() const override { return "SampleVariance"; }

private:
    ReturnType return_type_;
    size_t min_observations_;
    std::vector<double> returns_;
    double variance_{0.0};
    double last_price_{0.0};
    Timestamp last_timestamp_{};
    bool fitted_{false};
    mutable std::mutex mutex_;
};

}  // namespace renewfolio

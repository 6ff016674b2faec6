// include/renewfolio/risk/garch_model.hpp
#pragma once

#include <mutex>
#include <vector>
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/risk/volatility_model.hpp"

namespace renewfolio {

/**
 * @brief Configuration for GARCH model
 */
struct GarchConfig : public ConfigBase {
    int p{1};                          // GARCH order (lag order for variance)
    int q{1};                          // ARCH order (lag order for squared residuals)
    size_t min_observations{50};       // Minimum number of returns
    ReturnType return_type{ReturnType::DIFFERENCE};
    double alpha{0.1};                 // ARCH coefficient (initial)
    double beta{0.85};                 // GARCH coefficient (initial)
    int max_iterations{2000};          // Nelder-Mead iterations
    double tolerance{1e-9};            // Simplex spread in log-likelihood at convergence

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["p"] = p;
        j["q"] = q;
        j["min_observations"] = min_observations;
        j["return_type"] = return_type_to_string(return_type);
        j["alpha"] = alpha;
        j["beta"] = beta;
        j["max_iterations"] = max_iterations;
        j["tolerance"] = tolerance;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("p")) p = j.at("p").get<int>();
        if (j.contains("q")) q = j.at("q").get<int>();
        if (j.contains("min_observations")) {
            min_observations = j.at("min_observations").get<size_t>();
        }
        if (j.contains("return_type")) {
            return_type =
                return_type_from_string(j.at("return_type").get<std::string>(), return_type);
        }
        if (j.contains("alpha")) alpha = j.at("alpha").get<double>();
        if (j.contains("beta")) beta = j.at("beta").get<double>();
        if (j.contains("max_iterations")) max_iterations = j.at("max_iterations").get<int>();
        if (j.contains("tolerance")) tolerance = j.at("tolerance").get<double>();
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief GARCH(1,1) conditional variance model
 *
 * h_t = omega + alpha * e_{t-1}^2 + beta * h_{t-1}, fitted by Gaussian maximum
 * likelihood: a coarse grid search followed by Nelder-Mead refinement on
 * standardized residuals, subject to omega > 0, alpha, beta >= 0 and
 * alpha + beta < 1.
 */
class GarchModel : public VolatilityModel {
public:
    explicit GarchModel(GarchConfig config);

    /**
     * @return CONFIGURATION_ERROR for an order other than (1,1), INSUFFICIENT_DATA
     *         below min_observations returns, MODEL_FIT_ERROR on non-convergence,
     *         a non-stationary estimate or a non-finite variance
     */
    Result<void> fit(const TimeSeries& prices) override;
    Result<TimeSeries> forecast(int horizon) const override;
    Result<double> get_current_volatility() const override;
    Result<double> unconditional_variance() const override;
    Result<void> update(double new_price) override;
    bool is_fitted() const override { return fitted_; }
    std::string name() const override { return "GARCH(1,1)"; }

    double get_omega() const { return omega_; }
    double get_alpha() const { return alpha_; }
    double get_beta() const { return beta_; }
    int get_iterations() const { return iterations_; }
    double get_log_likelihood() const { return log_likelihood_; }

    const std::vector<double>& get_conditional_variances() const {
        return conditional_variances_;
    }

private:
    GarchConfig config_;
    double omega_{0.0};      // Constant term
    double alpha_{0.0};      // ARCH coefficient
    double beta_{0.0};       // GARCH coefficient
    double mean_return_{0.0};
    double log_likelihood_{0.0};
    int iterations_{0};
    std::vector<double> residuals_;
    std::vector<double> conditional_variances_;
    double last_price_{0.0};
    Timestamp last_timestamp_{};
    bool fitted_{false};
    mutable std::mutex mutex_;

    // Estimate (omega, alpha, beta) on unit-variance residuals
    Result<void> estimate_parameters(const std::vector<double>& standardized);
    double log_likelihood(const std::vector<double>& residuals, double omega, double alpha,
                          double beta) const;
};

}  // namespace renewfolio

// include/renewfolio/optimization/return_estimate.hpp
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/types.hpp"
#include "renewfolio/simulation/revenue_model.hpp"
#include "renewfolio/simulation/scenario_simulator.hpp"

namespace renewfolio {

/**
 * @brief Annualized expected returns and covariance for a set of assets
 */
struct ReturnEstimate {
    std::vector<std::string> assets;
    Eigen::VectorXd expected_returns;
    Eigen::MatrixXd covariance;
    double periods_per_year{HOURS_PER_YEAR};  // Convention the figures were annualized with
    size_t observations{0};                   // Realizations or periods behind the estimate

    size_t size() const {
        return assets.size();
    }

    /**
     * @return INVALID_DATA for inconsistent shapes or an asymmetric covariance,
     *         MODEL_FIT_ERROR for a non-finite entry
     */
    Result<void> validate() const;

    /**
     * @brief Scale the covariance by a forecast-to-long-run variance ratio
     * @return INVALID_ARGUMENT for a non-positive or non-finite ratio
     */
    Result<void> scale_covariance(double variance_ratio);

    nlohmann::json to_json() const;

    /**
     * @brief Ensemble estimate: one annual return per realization and asset
     *
     * The expected return is the ensemble mean and the covariance is the sample
     * covariance across realizations.
     *
     * @return INSUFFICIENT_DATA below two realizations, SERIES_MISMATCH if the
     *         scenario assets differ from the revenue model's
     */
    static Result<ReturnEstimate> from_scenarios(const ScenarioSet& scenarios,
                                                 const RevenueModel& revenue,
                                                 double periods_per_year);

    /**
     * @brief Historical estimate: per-period mean and covariance, times periods_per_year
     * @return INSUFFICIENT_DATA below two periods, SERIES_MISMATCH for an unaligned panel
     */
    static Result<ReturnEstimate> from_history(const ReturnPanel& panel, double periods_per_year);
};

}  // namespace renewfolio

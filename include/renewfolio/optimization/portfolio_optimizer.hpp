// include/renewfolio/optimization/portfolio_optimizer.hpp
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "renewfolio/core/config_base.hpp"
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/logger.hpp"
#include "renewfolio/core/types.hpp"
#include "renewfolio/optimization/qp_solver.hpp"
#include "renewfolio/optimization/return_estimate.hpp"

namespace renewfolio {

/**
 * @brief Configuration for the mean-variance optimizer
 */
struct OptimizerConfig : public ConfigBase {
    double min_weight{0.2};                 // Default per-asset lower bound
    double max_weight{1.0};                 // Default per-asset upper bound
    std::vector<double> min_weights;        // Per-asset overrides, empty for the defaults
    std::vector<double> max_weights;
    double risk_free_rate{0.02};            // Annual
    int frontier_points{100};
    double periods_per_year{HOURS_PER_YEAR};
    double diagonal_loading{1e-6};          // Fraction of the mean variance added when regularizing
    double max_condition_number{1e10};
    double sharpe_tolerance{1e-6};          // Analytic vs frontier-reported Sharpe
    double max_plausible_sharpe{10.0};
    int max_qp_iterations{200};
    int refinement_iterations{60};          // Golden-section steps around the best grid point

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["min_weight"] = min_weight;
        j["max_weight"] = max_weight;
        j["min_weights"] = min_weights;
        j["max_weights"] = max_weights;
        j["risk_free_rate"] = risk_free_rate;
        j["frontier_points"] = frontier_points;
        j["periods_per_year"] = periods_per_year;
        j["diagonal_loading"] = diagonal_loading;
        j["max_condition_number"] = max_condition_number;
        j["sharpe_tolerance"] = sharpe_tolerance;
        j["max_plausible_sharpe"] = max_plausible_sharpe;
        j["max_qp_iterations"] = max_qp_iterations;
        j["refinement_iterations"] = refinement_iterations;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("min_weight")) min_weight = j.at("min_weight").get<double>();
        if (j.contains("max_weight")) max_weight = j.at("max_weight").get<double>();
        if (j.contains("min_weights")) min_weights = j.at("min_weights").get<std::vector<double>>();
        if (j.contains("max_weights")) max_weights = j.at("max_weights").get<std::vector<double>>();
        if (j.contains("risk_free_rate")) risk_free_rate = j.at("risk_free_rate").get<double>();
        if (j.contains("frontier_points")) frontier_points = j.at("frontier_points").get<int>();
        if (j.contains("periods_per_year")) {
            periods_per_year = j.at("periods_per_year").get<double>();
        }
        if (j.contains("diagonal_loading")) {
            diagonal_loading = j.at("diagonal_loading").get<double>();
        }
        if (j.contains("max_condition_number")) {
            max_condition_number = j.at("max_condition_number").get<double>();
        }
        if (j.contains("sharpe_tolerance")) {
            sharpe_tolerance = j.at("sharpe_tolerance").get<double>();
        }
        if (j.contains("max_plausible_sharpe")) {
            max_plausible_sharpe = j.at("max_plausible_sharpe").get<double>();
        }
        if (j.contains("max_qp_iterations")) {
            max_qp_iterations = j.at("max_qp_iterations").get<int>();
        }
        if (j.contains("refinement_iterations")) {
            refinement_iterations = j.at("refinement_iterations").get<int>();
        }
        if (j.contains("version")) version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Long-only weight vector with its annualized statistics
 */
struct Portfolio {
    std::vector<std::string> assets;
    std::vector<double> weights;
    double expected_return{0.0};
    double volatility{0.0};
    double sharpe{0.0};

    nlohmann::json to_json() const;
};

struct FrontierPoint {
    double target_return{0.0};
    double expected_return{0.0};
    double volatility{0.0};
    double sharpe{0.0};
    std::vector<double> weights;

    nlohmann::json to_json() const;
};

struct OptimizationOutput {
    std::vector<FrontierPoint> frontier;  // Ascending target return
    Portfolio max_sharpe;
    Portfolio min_variance;
    bool covariance_regularized{false};
    double diagonal_loading{0.0};         // Added to every variance, 0 if none
    double condition_number{0.0};         // Of the covariance before loading
    bool implausible_sharpe{false};
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
};

/**
 * @brief Constrained mean-variance optimizer
 *
 * Builds the efficient frontier from the minimum-variance portfolio up to the
 * highest attainable return and selects the maximum-Sharpe portfolio. Every
 * point, including the refinement around the best grid point, comes from the
 * same active-set QP: minimize w'Sw subject to w'r = target, sum(w) = 1 and
 * per-asset bounds.
 */
class PortfolioOptimizer {
public:
    explicit PortfolioOptimizer(OptimizerConfig config);

    /**
     * @return CONFIGURATION_ERROR for an annualization mismatch or bad bounds,
     *         INFEASIBLE_CONSTRAINTS when no weights satisfy the bounds,
     *         INVALID_DATA for a covariance that is not positive semi-definite,
     *         MODEL_FIT_ERROR for NaN inputs, a non-monotonic frontier or a
     *         Sharpe consistency failure
     */
    Result<OptimizationOutput> optimize(const ReturnEstimate& estimate) const;

    /**
     * @brief Statistics of a given weight vector under the estimate
     * @return SERIES_MISMATCH if the weight count differs from the asset count
     */
    Result<Portfolio> evaluate(const ReturnEstimate& estimate,
                               const std::vector<double>& weights) const;

    /**
     * @brief Per-asset lower and upper bounds for n assets
     * @return CONFIGURATION_ERROR for mis-sized overrides or negative bounds,
     *         INFEASIBLE_CONSTRAINTS if the bounds cannot sum to one
     */
    Result<std::pair<Eigen::VectorXd, Eigen::VectorXd>> bounds(size_t n_assets) const;

    const OptimizerConfig& get_config() const {
        return config_;
    }

private:
    struct Problem {
        std::vector<std::string> assets;
        Eigen::VectorXd returns;
        Eigen::MatrixXd covariance;
        Eigen::VectorXd lower;
        Eigen::VectorXd upper;
        Eigen::VectorXd min_return_weights;  // Lowest attainable return
        Eigen::VectorXd max_return_weights;  // Highest attainable return
    };

    Result<void> prepare(const ReturnEstimate& estimate, Problem& problem,
                         OptimizationOutput& output) const;

    // Minimum-variance point, optionally at a fixed target return
    Result<FrontierPoint> solve_point(const Problem& problem,
                                      std::optional<double> target_return) const;

    Result<FrontierPoint> refine_max_sharpe(const Problem& problem, double low,
                                            double high) const;

    Result<void> check_sharpe_consistency(const Problem& problem, const FrontierPoint& point) const;

    Portfolio to_portfolio(const Problem& problem, const FrontierPoint& point) const;
    double sharpe_ratio(double expected_return, double volatility) const;

    OptimizerConfig config_;
    ActiveSetQpSolver solver_;
};

}  // namespace renewfolio

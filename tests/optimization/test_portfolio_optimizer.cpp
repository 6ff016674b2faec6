#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "renewfolio/optimization/portfolio_optimizer.hpp"
#include "../core/test_base.hpp"

namespace renewfolio {

class PortfolioOptimizerTest : public testing::TestBase {
protected:
    // Wind/solar estimate: returns 9.5% and 7.1%, volatilities 13.8% and 16.2%, uncorrelated
    ReturnEstimate two_asset_estimate() {
        ReturnEstimate estimate;
        estimate.assets = {"wind", "solar"};
        estimate.expected_returns = Eigen::Vector2d(0.095, 0.071);
        estimate.covariance = Eigen::Matrix2d::Zero();
        estimate.covariance(0, 0) = 0.138 * 0.138;
        estimate.covariance(1, 1) = 0.162 * 0.162;
        estimate.observations = 1000;
        return estimate;
    }

    OptimizerConfig config;
};

TEST_F(PortfolioOptimizerTest, TwoAssetMaxSharpeMatchesClosedForm) {
    PortfolioOptimizer optimizer(config);
    auto result = optimizer.optimize(two_asset_estimate());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& output = result.value();

    // Weights near 0.5/0.5 with Sharpe 1.8-2.3 are unreachable for these inputs: the
    // tangency Sharpe is sqrt(0.075^2/0.138^2 + 0.051^2/0.162^2) ~ 0.628
    // Interior tangency portfolio: w ~ inv(S) (r - rf), normalized
    const double a = 0.075 / (0.138 * 0.138);
    const double b = 0.051 / (0.162 * 0.162);
    const double w_wind = a / (a + b);

    const auto& best = output.max_sharpe;
    ASSERT_EQ(best.weights.size(), 2u);
    EXPECT_NEAR(best.weights[0], w_wind, 1e-4);
    EXPECT_NEAR(best.weights[1], 1.0 - w_wind, 1e-4);
    EXPECT_NEAR(best.weights[0] + best.weights[1], 1.0, 1e-9);
    EXPECT_NEAR(best.sharpe, 0.628, 0.002);
    EXPECT_FALSE(output.implausible_sharpe);
    EXPECT_FALSE(output.covariance_regularized);

    // Frontier starts at the minimum-variance mix and ends at the upper wind bound
    const double w_mvp = 0.162 * 0.162 / (0.138 * 0.138 + 0.162 * 0.162);
    EXPECT_NEAR(output.min_variance.weights[0], w_mvp, 1e-6);
    ASSERT_EQ(output.frontier.size(), static_cast<size_t>(config.frontier_points));
    EXPECT_NEAR(output.frontier.back().weights[0], 0.8, 1e-8);
    EXPECT_NEAR(output.frontier.back().expected_return, 0.8 * 0.095 + 0.2 * 0.071, 1e-10);
}

TEST_F(PortfolioOptimizerTest, FrontierIsMonotonic) {
    PortfolioOptimizer optimizer(config);
    auto result = optimizer.optimize(two_asset_estimate());
    ASSERT_TRUE(result.is_ok());

    const auto& frontier = result.value().frontier;
    for (size_t k = 1; k < frontier.size(); ++k) {
        EXPECT_GE(frontier[k].expected_return, frontier[k - 1].expected_return - 1e-12);
        EXPECT_GE(frontier[k].volatility, frontier[k - 1].volatility - 1e-12);
        double sum = 0.0;
        for (double w : frontier[k].weights) {
            EXPECT_GE(w, config.min_weight - 1e-9);
            EXPECT_LE(w, config.max_weight + 1e-9);
            sum += w;
        }
        EXPECT_NEAR(sum, 1.0, 1e-9);
    }
}

TEST_F(PortfolioOptimizerTest, ReportedSharpeMatchesEvaluation) {
    PortfolioOptimizer optimizer(config);
    auto estimate = two_asset_estimate();
    auto result = optimizer.optimize(estimate);
    ASSERT_TRUE(result.is_ok());

    const auto& best = result.value().max_sharpe;
    auto evaluated = optimizer.evaluate(estimate, best.weights);
    ASSERT_TRUE(evaluated.is_ok());
    EXPECT_NEAR(evaluated.value().sharpe, best.sharpe, 1e-9);
    EXPECT_NEAR(evaluated.value().volatility, best.volatility, 1e-9);
    EXPECT_NEAR(evaluated.value().expected_return, best.expected_return, 1e-12);

    // No frontier point beats the selected portfolio
    for (const auto& point : result.value().frontier) {
        EXPECT_LE(point.sharpe, best.sharpe + 1e-9);
    }
}

TEST_F(PortfolioOptimizerTest, InfeasibleMinimumBounds) {
    config.min_weight = 0.6;
    PortfolioOptimizer optimizer(config);

    auto result = optimizer.optimize(two_asset_estimate());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INFEASIBLE_CONSTRAINTS);
    EXPECT_NE(std::string(result.error()->what()).find("1.2"), std::string::npos);
}

TEST_F(PortfolioOptimizerTest, InfeasibleMaximumBounds) {
    config.max_weights = {0.3, 0.4};
    config.min_weight = 0.0;
    PortfolioOptimizer optimizer(config);
    EXPECT_EQ(optimizer.optimize(two_asset_estimate()).error()->code(),
              ErrorCode::INFEASIBLE_CONSTRAINTS);
}

TEST_F(PortfolioOptimizerTest, BoundOverridesMustMatchAssets) {
    config.min_weights = {0.1, 0.1, 0.1};
    PortfolioOptimizer optimizer(config);
    EXPECT_EQ(optimizer.bounds(2).error()->code(), ErrorCode::CONFIGURATION_ERROR);

    config.min_weights = {0.1, 0.5};
    config.max_weights = {0.05, 1.0};
    EXPECT_EQ(PortfolioOptimizer(config).bounds(2).error()->code(),
              ErrorCode::INFEASIBLE_CONSTRAINTS);
}

TEST_F(PortfolioOptimizerTest, PerAssetBoundsBind) {
    config.min_weights = {0.0, 0.5};
    config.max_weights = {1.0, 1.0};
    PortfolioOptimizer optimizer(config);

    auto result = optimizer.optimize(two_asset_estimate());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    // The unconstrained tangency holds only 33% solar
    EXPECT_NEAR(result.value().max_sharpe.weights[1], 0.5, 1e-8);
}

TEST_F(PortfolioOptimizerTest, AnnualizationMismatch) {
    auto estimate = two_asset_estimate();
    estimate.periods_per_year = 365.0;
    PortfolioOptimizer optimizer(config);

    auto result = optimizer.optimize(estimate);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(PortfolioOptimizerTest, NonFiniteInputs) {
    auto estimate = two_asset_estimate();
    estimate.covariance(0, 1) = std::numeric_limits<double>::quiet_NaN();
    estimate.covariance(1, 0) = std::numeric_limits<double>::quiet_NaN();
    PortfolioOptimizer optimizer(config);
    EXPECT_EQ(optimizer.optimize(estimate).error()->code(), ErrorCode::MODEL_FIT_ERROR);

    estimate = two_asset_estimate();
    estimate.expected_returns(1) = std::numeric_limits<double>::infinity();
    EXPECT_EQ(optimizer.optimize(estimate).error()->code(), ErrorCode::MODEL_FIT_ERROR);
}

TEST_F(PortfolioOptimizerTest, IndefiniteCovariance) {
    auto estimate = two_asset_estimate();
    estimate.covariance(0, 1) = 0.05;
    estimate.covariance(1, 0) = 0.05;
    PortfolioOptimizer optimizer(config);
    EXPECT_EQ(optimizer.optimize(estimate).error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(PortfolioOptimizerTest, SingularCovarianceIsRegularized) {
    auto estimate = two_asset_estimate();
    estimate.covariance = Eigen::Matrix2d::Constant(0.02);
    PortfolioOptimizer optimizer(config);

    auto result = optimizer.optimize(estimate);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_TRUE(result.value().covariance_regularized);
    EXPECT_GT(result.value().diagonal_loading, 0.0);
    EXPECT_FALSE(result.value().warnings.empty());

    // Identical risk: the higher-return asset takes everything it may
    EXPECT_NEAR(result.value().max_sharpe.weights[0], 0.8, 1e-6);
}

TEST_F(PortfolioOptimizerTest, ImplausibleSharpeIsFlagged) {
    auto estimate = two_asset_estimate();
    // Hourly-scale variances labelled as annual
    estimate.covariance /= 8760.0;
    PortfolioOptimizer optimizer(config);

    auto result = optimizer.optimize(estimate);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_TRUE(result.value().implausible_sharpe);
    EXPECT_FALSE(result.value().warnings.empty());
}

TEST_F(PortfolioOptimizerTest, ThreeAssetsRespectBounds) {
    ReturnEstimate estimate;
    estimate.assets = {"wind_north", "wind_coast", "solar"};
    estimate.expected_returns = Eigen::Vector3d(0.10, 0.08, 0.06);
    estimate.covariance.resize(3, 3);
    estimate.covariance << 0.040, 0.018, -0.004,
                           0.018, 0.030, -0.002,
                          -0.004, -0.002, 0.020;
    config.min_weight = 0.1;
    config.max_weight = 0.5;
    config.frontier_points = 40;
    PortfolioOptimizer optimizer(config);

    auto result = optimizer.optimize(estimate);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    for (const auto& point : result.value().frontier) {
        double sum = 0.0;
        for (double w : point.weights) {
            EXPECT_GE(w, 0.1 - 1e-9);
            EXPECT_LE(w, 0.5 + 1e-9);
            sum += w;
        }
        EXPECT_NEAR(sum, 1.0, 1e-9);
    }
    // The return-maximizing end fills the best asset to its cap
    EXPECT_NEAR(result.value().frontier.back().weights[0], 0.5, 1e-8);
    EXPECT_NEAR(result.value().frontier.back().weights[1], 0.4, 1e-8);
}

TEST_F(PortfolioOptimizerTest, EvaluateChecksShape) {
    PortfolioOptimizer optimizer(config);
    EXPECT_EQ(optimizer.evaluate(two_asset_estimate(), {1.0}).error()->code(),
              ErrorCode::SERIES_MISMATCH);

    auto evaluated = optimizer.evaluate(two_asset_estimate(), {0.5, 0.5});
    ASSERT_TRUE(evaluated.is_ok());
    EXPECT_NEAR(evaluated.value().expected_return, 0.083, 1e-12);
}

TEST_F(PortfolioOptimizerTest, OutputSerializes) {
    PortfolioOptimizer optimizer(config);
    auto result = optimizer.optimize(two_asset_estimate());
    ASSERT_TRUE(result.is_ok());

    auto j = result.value().to_json();
    EXPECT_EQ(j["frontier"].size(), static_cast<size_t>(config.frontier_points));
    EXPECT_EQ(j["max_sharpe"]["assets"][0], "wind");
    EXPECT_TRUE(j.contains("covariance_regularized"));
}

}  // namespace renewfolio

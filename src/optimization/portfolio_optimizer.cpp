// src/optimization/portfolio_optimizer.cpp

#include "renewfolio/optimization/portfolio_optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>

namespace renewfolio {

namespace {

constexpr double WEIGHT_SUM_TOLERANCE = 1e-9;
constexpr double MIN_PSD_EIGENVALUE = -1e-8;

std::vector<double> to_std(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

// Extreme point of {lower <= w <= upper, sum(w) = 1} that maximizes (or minimizes) w'r
Eigen::VectorXd extreme_return_weights(const Eigen::VectorXd& returns, const Eigen::VectorXd& lower,
                                       const Eigen::VectorXd& upper, bool maximize) {
    std::vector<Eigen::Index> order(static_cast<size_t>(returns.size()));
    std::iota(order.begin(), order.end(), Eigen::Index{0});
    std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
        return maximize ? returns(a) > returns(b) : returns(a) < returns(b);
    });

    Eigen::VectorXd w = lower;
    double remaining = 1.0 - lower.sum();
    for (Eigen::Index i : order) {
        const double add = std::min(upper(i) - lower(i), remaining);
        w(i) += add;
        remaining -= add;
        if (remaining <= 0.0) break;
    }
    return w;
}

}  // namespace

nlohmann::json Portfolio::to_json() const {
    nlohmann::json j;
    j["assets"] = assets;
    j["weights"] = weights;
    j["expected_return"] = expected_return;
    j["volatility"] = volatility;
    j["sharpe"] = sharpe;
    return j;
}

nlohmann::json FrontierPoint::to_json() const {
    nlohmann::json j;
    j["target_return"] = target_return;
    j["expected_return"] = expected_return;
    j["volatility"] = volatility;
    j["sharpe"] = sharpe;
    j["weights"] = weights;
    return j;
}

nlohmann::json OptimizationOutput::to_json() const {
    nlohmann::json j;
    nlohmann::json points = nlohmann::json::array();
    for (const auto& point : frontier) {
        points.push_back(point.to_json());
    }
    j["frontier"] = points;
    j["max_sharpe"] = max_sharpe.to_json();
    j["min_variance"] = min_variance.to_json();
    j["covariance_regularized"] = covariance_regularized;
    j["diagonal_loading"] = diagonal_loading;
    j["condition_number"] = condition_number;
    j["implausible_sharpe"] = implausible_sharpe;
    j["warnings"] = warnings;
    return j;
}

PortfolioOptimizer::PortfolioOptimizer(OptimizerConfig config)
    : config_(std::move(config)), solver_(config_.max_qp_iterations) {
    Logger::register_component("PortfolioOptimizer");
}

Result<std::pair<Eigen::VectorXd, Eigen::VectorXd>> PortfolioOptimizer::bounds(
    size_t n_assets) const {
    using Bounds = std::pair<Eigen::VectorXd, Eigen::VectorXd>;

    if (!config_.min_weights.empty() && config_.min_weights.size() != n_assets) {
        return make_error<Bounds>(ErrorCode::CONFIGURATION_ERROR,
                                  "min_weights has " + std::to_string(config_.min_weights.size()) +
                                      " entries for " + std::to_string(n_assets) + " assets",
                                  "PortfolioOptimizer");
    }
    if (!config_.max_weights.empty() && config_.max_weights.size() != n_assets) {
        return make_error<Bounds>(ErrorCode::CONFIGURATION_ERROR,
                                  "max_weights has " + std::to_string(config_.max_weights.size()) +
                                      " entries for " + std::to_string(n_assets) + " assets",
                                  "PortfolioOptimizer");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(n_assets);
    Eigen::VectorXd lower(n);
    Eigen::VectorXd upper(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const size_t k = static_cast<size_t>(i);
        lower(i) = config_.min_weights.empty() ? config_.min_weight : config_.min_weights[k];
        upper(i) = config_.max_weights.empty() ? config_.max_weight : config_.max_weights[k];

        if (!std::isfinite(lower(i)) || !std::isfinite(upper(i)) || lower(i) < 0.0) {
            return make_error<Bounds>(ErrorCode::CONFIGURATION_ERROR,
                                      "Bounds of asset " + std::to_string(k) +
                                          " must be finite and non-negative, got [" +
                                          std::to_string(lower(i)) + ", " +
                                          std::to_string(upper(i)) + "]",
                                      "PortfolioOptimizer");
        }
        if (lower(i) > upper(i)) {
            return make_error<Bounds>(ErrorCode::INFEASIBLE_CONSTRAINTS,
                                      "Lower bound " + std::to_string(lower(i)) +
                                          " exceeds upper bound " + std::to_string(upper(i)) +
                                          " for asset " + std::to_string(k),
                                      "PortfolioOptimizer");
        }
    }

    if (lower.sum() > 1.0 + WEIGHT_SUM_TOLERANCE) {
        return make_error<Bounds>(ErrorCode::INFEASIBLE_CONSTRAINTS,
                                  "Minimum weights sum to " + std::to_string(lower.sum()) +
                                      ", more than 1",
                                  "PortfolioOptimizer");
    }
    if (upper.sum() < 1.0 - WEIGHT_SUM_TOLERANCE) {
        return make_error<Bounds>(ErrorCode::INFEASIBLE_CONSTRAINTS,
                                  "Maximum weights sum to " + std::to_string(upper.sum()) +
                                      ", less than 1",
                                  "PortfolioOptimizer");
    }
    return Bounds(lower, upper);
}

Result<void> PortfolioOptimizer::prepare(const ReturnEstimate& estimate, Problem& problem,
                                         OptimizationOutput& output) const {
    if (config_.frontier_points < 2) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "frontier_points must be at least 2, got " +
                                    std::to_string(config_.frontier_points),
                                "PortfolioOptimizer");
    }
    if (std::abs(estimate.periods_per_year - config_.periods_per_year) > 1e-9) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Estimate annualized with " +
                                    std::to_string(estimate.periods_per_year) +
                                    " periods per year, optimizer expects " +
                                    std::to_string(config_.periods_per_year),
                                "PortfolioOptimizer");
    }

    auto valid = estimate.validate();
    if (valid.is_error()) {
        return valid;
    }

    auto box = bounds(estimate.size());
    if (box.is_error()) {
        return forward_error<void>(box.error());
    }

    problem.assets = estimate.assets;
    problem.returns = estimate.expected_returns;
    problem.covariance = estimate.covariance;
    problem.lower = box.value().first;
    problem.upper = box.value().second;

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen(problem.covariance,
                                                         Eigen::EigenvaluesOnly);
    if (eigen.info() != Eigen::Success) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Covariance eigen-decomposition failed", "PortfolioOptimizer");
    }
    const double min_eig = eigen.eigenvalues().minCoeff();
    const double max_eig = eigen.eigenvalues().maxCoeff();
    if (min_eig < MIN_PSD_EIGENVALUE) {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Covariance is not positive semi-definite: smallest eigenvalue " +
                                    std::to_string(min_eig),
                                "PortfolioOptimizer");
    }

    output.condition_number =
        min_eig > 0.0 ? max_eig / min_eig : std::numeric_limits<double>::infinity();
    if (min_eig <= 0.0 || output.condition_number > config_.max_condition_number) {
        const double mean_variance =
            problem.covariance.trace() / static_cast<double>(problem.covariance.rows());
        const double loading = config_.diagonal_loading * std::max(mean_variance, 1e-12);
        problem.covariance.diagonal().array() += loading;

        output.covariance_regularized = true;
        output.diagonal_loading = loading;

        std::ostringstream msg;
        msg << "Covariance is singular or ill-conditioned (condition number "
            << output.condition_number << "); added diagonal loading " << loading;
        output.warnings.push_back(msg.str());
        WARN(msg.str());
    }

    problem.min_return_weights =
        extreme_return_weights(problem.returns, problem.lower, problem.upper, false);
    problem.max_return_weights =
        extreme_return_weights(problem.returns, problem.lower, problem.upper, true);
    return Result<void>();
}

double PortfolioOptimizer::sharpe_ratio(double expected_return, double volatility) const {
    if (!(volatility > 0.0)) {
        return 0.0;
    }
    return (expected_return - config_.risk_free_rate) / volatility;
}

Result<FrontierPoint> PortfolioOptimizer::solve_point(const Problem& problem,
                                                      std::optional<double> target_return) const {
    const Eigen::Index n = problem.returns.size();
    const double low = problem.min_return_weights.dot(problem.returns);
    const double high = problem.max_return_weights.dot(problem.returns);
    const bool pinned = target_return.has_value() && high - low > 1e-14;

    QpProblem qp;
    qp.hessian = problem.covariance;
    qp.lower = problem.lower;
    qp.upper = problem.upper;
    qp.equality = Eigen::MatrixXd::Ones(pinned ? 2 : 1, n);
    qp.equality_rhs = Eigen::VectorXd::Ones(pinned ? 2 : 1);

    Eigen::VectorXd start = problem.max_return_weights;
    double target = high;
    if (pinned) {
        target = std::min(std::max(*target_return, low), high);
        const double theta = (target - low) / (high - low);
        start = (1.0 - theta) * problem.min_return_weights + theta * problem.max_return_weights;
        qp.equality.row(1) = problem.returns.transpose();
        qp.equality_rhs(1) = target;
    }

    auto solved = solver_.solve(qp, start);
    if (solved.is_error()) {
        return forward_error<FrontierPoint>(solved.error());
    }
    const auto& solution = solved.value();

    FrontierPoint point;
    point.weights = to_std(solution.weights);
    point.expected_return = solution.weights.dot(problem.returns);
    point.target_return = target_return.has_value() ? target : point.expected_return;
    point.volatility = std::sqrt(std::max(2.0 * solution.objective, 0.0));
    point.sharpe = sharpe_ratio(point.expected_return, point.volatility);

    if (!std::isfinite(point.expected_return) || !std::isfinite(point.volatility)) {
        return make_error<FrontierPoint>(ErrorCode::MODEL_FIT_ERROR,
                                         "Frontier point has non-finite return or volatility",
                                         "PortfolioOptimizer");
    }
    return point;
}

Result<FrontierPoint> PortfolioOptimizer::refine_max_sharpe(const Problem& problem, double low,
                                                            double high) const {
    // Sharpe along the efficient frontier is unimodal in the target return
    const double ratio = (std::sqrt(5.0) - 1.0) / 2.0;
    double a = low;
    double b = high;
    double c = b - ratio * (b - a);
    double d = a + ratio * (b - a);

    auto fc = solve_point(problem, c);
    if (fc.is_error()) return fc;
    auto fd = solve_point(problem, d);
    if (fd.is_error()) return fd;
    FrontierPoint left = fc.value();
    FrontierPoint right = fd.value();

    for (int i = 0; i < config_.refinement_iterations && b - a > 1e-12; ++i) {
        if (left.sharpe >= right.sharpe) {
            b = d;
            d = c;
            right = left;
            c = b - ratio * (b - a);
            auto next = solve_point(problem, c);
            if (next.is_error()) return next;
            left = next.value();
        } else {
            a = c;
            c = d;
            left = right;
            d = a + ratio * (b - a);
            auto next = solve_point(problem, d);
            if (next.is_error()) return next;
            right = next.value();
        }
    }
    return left.sharpe >= right.sharpe ? left : right;
}

Result<void> PortfolioOptimizer::check_sharpe_consistency(const Problem& problem,
                                                          const FrontierPoint& point) const {
    const Eigen::Map<const Eigen::VectorXd> w(point.weights.data(),
                                              static_cast<Eigen::Index>(point.weights.size()));

    const double weight_sum = w.sum();
    if (std::abs(weight_sum - 1.0) > WEIGHT_SUM_TOLERANCE) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Weights sum to " + std::to_string(weight_sum),
                                "PortfolioOptimizer");
    }
    for (Eigen::Index i = 0; i < w.size(); ++i) {
        if (w(i) < problem.lower(i) - WEIGHT_SUM_TOLERANCE ||
            w(i) > problem.upper(i) + WEIGHT_SUM_TOLERANCE) {
            return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                    "Weight " + std::to_string(w(i)) + " of '" +
                                        problem.assets[static_cast<size_t>(i)] +
                                        "' is outside its bounds",
                                    "PortfolioOptimizer");
        }
    }

    const double analytic_return = w.dot(problem.returns);
    const double analytic_vol = std::sqrt(std::max(w.dot(problem.covariance * w), 0.0));
    const double analytic = sharpe_ratio(analytic_return, analytic_vol);
    if (!std::isfinite(analytic) ||
        std::abs(analytic - point.sharpe) >
            config_.sharpe_tolerance * std::max(1.0, std::abs(analytic))) {
        return make_error<void>(ErrorCode::MODEL_FIT_ERROR,
                                "Analytic Sharpe " + std::to_string(analytic) +
                                    " disagrees with frontier Sharpe " +
                                    std::to_string(point.sharpe),
                                "PortfolioOptimizer");
    }
    return Result<void>();
}

Portfolio PortfolioOptimizer::to_portfolio(const Problem& problem,
                                           const FrontierPoint& point) const {
    Portfolio portfolio;
    portfolio.assets = problem.assets;
    portfolio.weights = point.weights;
    portfolio.expected_return = point.expected_return;
    portfolio.volatility = point.volatility;
    portfolio.sharpe = point.sharpe;
    return portfolio;
}

Result<OptimizationOutput> PortfolioOptimizer::optimize(const ReturnEstimate& estimate) const {
    Logger::register_component("PortfolioOptimizer");
    OptimizationOutput output;
    Problem problem;

    auto prepared = prepare(estimate, problem, output);
    if (prepared.is_error()) {
        return forward_error<OptimizationOutput>(prepared.error());
    }

    auto mvp = solve_point(problem, std::nullopt);
    if (mvp.is_error()) {
        return forward_error<OptimizationOutput>(mvp.error());
    }
    output.min_variance = to_portfolio(problem, mvp.value());

    const double low = mvp.value().expected_return;
    const double high = std::max(problem.max_return_weights.dot(problem.returns), low);
    const int points = config_.frontier_points;

    output.frontier.reserve(static_cast<size_t>(points));
    output.frontier.push_back(mvp.value());
    for (int k = 1; k < points; ++k) {
        const double target = low + (high - low) * static_cast<double>(k) / (points - 1);
        auto point = solve_point(problem, target);
        if (point.is_error()) {
            return forward_error<OptimizationOutput>(point.error());
        }
        output.frontier.push_back(point.value());
    }

    for (size_t k = 1; k < output.frontier.size(); ++k) {
        const auto& prev = output.frontier[k - 1];
        const auto& cur = output.frontier[k];
        if (cur.volatility < prev.volatility - 1e-10 * std::max(1.0, prev.volatility)) {
            return make_error<OptimizationOutput>(
                ErrorCode::MODEL_FIT_ERROR,
                "Frontier bends backwards at point " + std::to_string(k) + ": volatility " +
                    std::to_string(cur.volatility) + " < " + std::to_string(prev.volatility),
                "PortfolioOptimizer");
        }
    }

    size_t best = 0;
    for (size_t k = 1; k < output.frontier.size(); ++k) {
        const auto& cand = output.frontier[k];
        const auto& incumbent = output.frontier[best];
        if (cand.sharpe > incumbent.sharpe + 1e-12 ||
            (std::abs(cand.sharpe - incumbent.sharpe) <= 1e-12 &&
             cand.volatility < incumbent.volatility)) {
            best = k;
        }
    }

    FrontierPoint chosen = output.frontier[best];
    if (high - low > 1e-12) {
        const double lo = output.frontier[best == 0 ? 0 : best - 1].target_return;
        const double hi = output.frontier[std::min(best + 1, output.frontier.size() - 1)].target_return;
        auto refined = refine_max_sharpe(problem, lo, hi);
        if (refined.is_error()) {
            return forward_error<OptimizationOutput>(refined.error());
        }
        if (refined.value().sharpe > chosen.sharpe) {
            chosen = refined.value();
        }
    }

    auto consistent = check_sharpe_consistency(problem, chosen);
    if (consistent.is_error()) {
        return forward_error<OptimizationOutput>(consistent.error());
    }

    if (std::abs(chosen.sharpe) >= config_.max_plausible_sharpe) {
        std::ostringstream msg;
        msg << "Sharpe ratio " << chosen.sharpe << " is outside the plausible range (|S| < "
            << config_.max_plausible_sharpe << "); check the annualization of the inputs";
        output.implausible_sharpe = true;
        output.warnings.push_back(msg.str());
        WARN(msg.str());
    }

    output.max_sharpe = to_portfolio(problem, chosen);
    INFO("Max-Sharpe portfolio: return=" << chosen.expected_return << " vol="
                                         << chosen.volatility << " sharpe=" << chosen.sharpe);
    return output;
}

Result<Portfolio> PortfolioOptimizer::evaluate(const ReturnEstimate& estimate,
                                               const std::vector<double>& weights) const {
    if (std::abs(estimate.periods_per_year - config_.periods_per_year) > 1e-9) {
        return make_error<Portfolio>(ErrorCode::CONFIGURATION_ERROR,
                                     "Estimate annualized with " +
                                         std::to_string(estimate.periods_per_year) +
                                         " periods per year, optimizer expects " +
                                         std::to_string(config_.periods_per_year),
                                     "PortfolioOptimizer");
    }
    auto valid = estimate.validate();
    if (valid.is_error()) {
        return forward_error<Portfolio>(valid.error());
    }
    if (weights.size() != estimate.size()) {
        return make_error<Portfolio>(ErrorCode::SERIES_MISMATCH,
                                     std::to_string(weights.size()) + " weights for " +
                                         std::to_string(estimate.size()) + " assets",
                                     "PortfolioOptimizer");
    }

    const Eigen::Map<const Eigen::VectorXd> w(weights.data(),
                                              static_cast<Eigen::Index>(weights.size()));
    Portfolio portfolio;
    portfolio.assets = estimate.assets;
    portfolio.weights = weights;
    portfolio.expected_return = w.dot(estimate.expected_returns);
    portfolio.volatility = std::sqrt(std::max(w.dot(estimate.covariance * w), 0.0));
    portfolio.sharpe = sharpe_ratio(portfolio.expected_return, portfolio.volatility);
    return portfolio;
}

}  // namespace renewfolio

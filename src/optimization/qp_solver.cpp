// src/optimization/qp_solver.cpp

#include "renewfolio/optimization/qp_solver.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace renewfolio {

namespace {

constexpr double FEASIBILITY_TOLERANCE = 1e-9;

enum class BoundState { FREE, AT_LOWER, AT_UPPER };

}  // namespace

ActiveSetQpSolver::ActiveSetQpSolver(int max_iterations, double tolerance)
    : max_iterations_(max_iterations), tolerance_(tolerance) {}

Result<void> ActiveSetQpSolver::check_problem(const QpProblem& problem,
                                              const Eigen::VectorXd& start) const {
    const Eigen::Index n = problem.hessian.rows();
    if (problem.hessian.cols() != n || start.size() != n || problem.lower.size() != n ||
        problem.upper.size() != n || problem.equality.cols() != n ||
        problem.equality.rows() != problem.equality_rhs.size() ||
        (problem.linear.size() != 0 && problem.linear.size() != n)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "QP dimensions are inconsistent",
                                "QpSolver");
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        if (start(i) < problem.lower(i) - FEASIBILITY_TOLERANCE ||
            start(i) > problem.upper(i) + FEASIBILITY_TOLERANCE) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Start point violates the bounds of variable " +
                                        std::to_string(i) + ": " + std::to_string(start(i)),
                                    "QpSolver");
        }
    }
    if (problem.equality.rows() > 0) {
        const double residual = (problem.equality * start - problem.equality_rhs).cwiseAbs().maxCoeff();
        if (residual > 1e-8) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Start point violates the equality constraints by " +
                                        std::to_string(residual),
                                    "QpSolver");
        }
    }
    return Result<void>();
}

Result<QpSolution> ActiveSetQpSolver::solve(const QpProblem& problem,
                                            const Eigen::VectorXd& start) const {
    auto checked = check_problem(problem, start);
    if (checked.is_error()) {
        return forward_error<QpSolution>(checked.error());
    }

    const Eigen::Index n = problem.hessian.rows();
    const Eigen::Index m = problem.equality.rows();
    const Eigen::VectorXd linear =
        problem.linear.size() == 0 ? Eigen::VectorXd::Zero(n) : problem.linear;

    Eigen::VectorXd w = start.cwiseMax(problem.lower).cwiseMin(problem.upper);
    std::vector<BoundState> state(static_cast<size_t>(n), BoundState::FREE);

    for (int iteration = 0; iteration < max_iterations_; ++iteration) {
        std::vector<Eigen::Index> free;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (state[static_cast<size_t>(i)] == BoundState::FREE) free.push_back(i);
        }
        const Eigen::Index nf = static_cast<Eigen::Index>(free.size());
        const Eigen::VectorXd gradient = problem.hessian * w + linear;

        Eigen::VectorXd step = Eigen::VectorXd::Zero(n);
        if (nf > 0) {
            // [H_FF A_F'; A_F 0] [p_F; -lambda] = [-g_F; 0]
            Eigen::MatrixXd kkt = Eigen::MatrixXd::Zero(nf + m, nf + m);
            Eigen::VectorXd rhs = Eigen::VectorXd::Zero(nf + m);
            for (Eigen::Index a = 0; a < nf; ++a) {
                for (Eigen::Index b = 0; b < nf; ++b) {
                    kkt(a, b) = problem.hessian(free[a], free[b]);
                }
                for (Eigen::Index k = 0; k < m; ++k) {
                    kkt(a, nf + k) = problem.equality(k, free[a]);
                    kkt(nf + k, a) = problem.equality(k, free[a]);
                }
                rhs(a) = -gradient(free[a]);
            }
            Eigen::VectorXd solution = kkt.completeOrthogonalDecomposition().solve(rhs);
            if (!solution.allFinite()) {
                return make_error<QpSolution>(ErrorCode::MODEL_FIT_ERROR,
                                              "KKT system produced a non-finite step", "QpSolver");
            }
            for (Eigen::Index a = 0; a < nf; ++a) {
                step(free[a]) = solution(a);
            }
        }

        const double step_norm = step.lpNorm<Eigen::Infinity>();
        const double scale = std::max(1.0, w.lpNorm<Eigen::Infinity>());

        if (step_norm <= 1e-10 * scale) {
            // Stationary on the working set: check the sign of the bound multipliers
            Eigen::VectorXd lambda = Eigen::VectorXd::Zero(m);
            if (m > 0) {
                Eigen::MatrixXd a_free(m, nf > 0 ? nf : n);
                Eigen::VectorXd g_free(nf > 0 ? nf : n);
                if (nf > 0) {
                    for (Eigen::Index a = 0; a < nf; ++a) {
                        a_free.col(a) = problem.equality.col(free[a]);
                        g_free(a) = gradient(free[a]);
                    }
                } else {
                    a_free = problem.equality;
                    g_free = gradient;
                }
                lambda = a_free.transpose().completeOrthogonalDecomposition().solve(g_free);
            }
            const Eigen::VectorXd multipliers =
                gradient - (m > 0 ? Eigen::VectorXd(problem.equality.transpose() * lambda)
                                  : Eigen::VectorXd::Zero(n));

            Eigen::Index release = -1;
            double worst = tolerance_ * std::max(1.0, gradient.lpNorm<Eigen::Infinity>());
            for (Eigen::Index i = 0; i < n; ++i) {
                double violation = 0.0;
                if (state[static_cast<size_t>(i)] == BoundState::AT_LOWER) {
                    violation = -multipliers(i);
                } else if (state[static_cast<size_t>(i)] == BoundState::AT_UPPER) {
                    violation = multipliers(i);
                }
                if (violation > worst) {
                    worst = violation;
                    release = i;
                }
            }

            if (release < 0) {
                QpSolution result;
                result.weights = w;
                result.objective = 0.5 * w.dot(problem.hessian * w) + linear.dot(w);
                result.iterations = iteration + 1;
                return result;
            }
            state[static_cast<size_t>(release)] = BoundState::FREE;
            continue;
        }

        // Longest feasible step along the direction
        double alpha = 1.0;
        Eigen::Index blocking = -1;
        BoundState blocking_state = BoundState::FREE;
        for (Eigen::Index i : free) {
            double ratio = std::numeric_limits<double>::infinity();
            BoundState candidate = BoundState::FREE;
            if (step(i) < 0.0) {
                ratio = (problem.lower(i) - w(i)) / step(i);
                candidate = BoundState::AT_LOWER;
            } else if (step(i) > 0.0) {
                ratio = (problem.upper(i) - w(i)) / step(i);
                candidate = BoundState::AT_UPPER;
            }
            if (ratio < alpha) {
                alpha = std::max(ratio, 0.0);
                blocking = i;
                blocking_state = candidate;
            }
        }

        w += alpha * step;
        if (blocking >= 0) {
            state[static_cast<size_t>(blocking)] = blocking_state;
            w(blocking) = blocking_state == BoundState::AT_LOWER ? problem.lower(blocking)
                                                                 : problem.upper(blocking);
        }
    }

    return make_error<QpSolution>(ErrorCode::MODEL_FIT_ERROR,
                                  "Active-set QP did not converge after " +
                                      std::to_string(max_iterations_) + " iterations",
                                  "QpSolver");
}

}  // namespace renewfolio

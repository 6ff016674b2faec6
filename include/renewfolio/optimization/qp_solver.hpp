// include/renewfolio/optimization/qp_solver.hpp
#pragma once

#include <Eigen/Dense>
#include "renewfolio/core/error.hpp"

namespace renewfolio {

/**
 * @brief min 0.5 w'Hw + c'w  s.t.  Aw = b,  lower <= w <= upper
 */
struct QpProblem {
    Eigen::MatrixXd hessian;
    Eigen::VectorXd linear;       // Empty means zero
    Eigen::MatrixXd equality;     // One row per constraint
    Eigen::VectorXd equality_rhs;
    Eigen::VectorXd lower;
    Eigen::VectorXd upper;
};

struct QpSolution {
    Eigen::VectorXd weights;
    double objective{0.0};
    int iterations{0};
};

/**
 * @brief Primal active-set solver for small convex box-constrained QPs
 *
 * Starts from a caller-supplied feasible point and keeps it feasible. Each
 * iteration solves the equality-constrained subproblem on the free variables;
 * a blocked step adds the blocking bound to the working set and a stationary
 * point releases the bound with the most negative multiplier.
 */
class ActiveSetQpSolver {
public:
    explicit ActiveSetQpSolver(int max_iterations = 200, double tolerance = 1e-12);

    /**
     * @return INVALID_ARGUMENT for inconsistent dimensions or an infeasible start,
     *         MODEL_FIT_ERROR if the iteration limit is reached
     */
    Result<QpSolution> solve(const QpProblem& problem, const Eigen::VectorXd& start) const;

private:
    Result<void> check_problem(const QpProblem& problem, const Eigen::VectorXd& start) const;

    int max_iterations_;
    double tolerance_;
};

}  // namespace renewfolio

// include/alloc_ngin/optimization/sqp_solver.hpp

#pragma once

#include <Eigen/Dense>
#include <functional>
#include "alloc_ngin/core/error.hpp"
#include "alloc_ngin/optimization/weight_constraints.hpp"

namespace alloc_ngin {

struct SqpSettings {
    double tolerance{1e-10};   // Stop when the QP step max-norm falls below this
    int max_iterations{1000};  // Outer (SQP) iteration cap
    double max_seconds{10.0};  // Wall-clock cap; <= 0 disables
    int max_qp_iterations{5000};
};

struct SqpSolution {
    Eigen::VectorXd x;
    double objective{0.0};
    int iterations{0};
    bool converged{false};
    bool timed_out{false};
};

/**
 * @brief Sequential quadratic programming over the capped simplex
 *
 * Minimizes a smooth objective subject to min <= x_i <= max and
 * sum(x) = 1. Each iteration solves the quadratic model
 *   min_d g'd + 0.5 d'Bd  s.t.  x + d feasible
 * with an accelerated projected gradient method, then takes an Armijo
 * step along d. B is a damped BFGS approximation of the Hessian, so it
 * stays positive definite without second derivatives.
 */
class SqpSolver {
public:
    /**
     * @brief Objective callback
     * Returns f(x) and writes the gradient into grad
     */
    using Objective = std::function<double(const Eigen::VectorXd& x, Eigen::VectorXd& grad)>;

    SqpSolver(SqpSettings settings, WeightBounds bounds);

    /**
     * @brief Run the solver from x0 (projected onto the feasible set first)
     * @return The final iterate; converged is false when a cap was hit or
     *         the line search stalled
     */
    Result<SqpSolution> minimize(const Objective& objective, const Eigen::VectorXd& x0) const;

private:
    Eigen::VectorXd solve_subproblem(const Eigen::VectorXd& x, const Eigen::VectorXd& gradient,
                                     const Eigen::MatrixXd& hessian) const;

    static void update_hessian(Eigen::MatrixXd& hessian, const Eigen::VectorXd& step,
                               const Eigen::VectorXd& gradient_change);

    SqpSettings settings_;
    WeightBounds bounds_;
};

}  // namespace alloc_ngin

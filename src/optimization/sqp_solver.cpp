// src/optimization/sqp_solver.cpp

#include "alloc_ngin/optimization/sqp_solver.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace alloc_ngin {

namespace {
constexpr double ARMIJO_C1 = 1e-4;
constexpr double MIN_STEP = 1e-12;
constexpr int MAX_STALLS = 2;
}  // namespace

SqpSolver::SqpSolver(SqpSettings settings, WeightBounds bounds)
    : settings_(settings), bounds_(bounds) {}

Result<SqpSolution> SqpSolver::minimize(const Objective& objective,
                                        const Eigen::VectorXd& x0) const {
    if (x0.size() == 0) {
        return make_error<SqpSolution>(ErrorCode::EMPTY_UNIVERSE, "Empty starting point",
                                       "SqpSolver");
    }
    auto feasible = validate_bounds(bounds_, static_cast<size_t>(x0.size()));
    if (feasible.is_error()) {
        return forward_error<SqpSolution>(feasible, "SqpSolver");
    }

    const auto start = std::chrono::steady_clock::now();
    const Eigen::Index n = x0.size();

    SqpSolution solution;
    Eigen::VectorXd x = project_onto_capped_simplex(x0, bounds_);
    Eigen::VectorXd grad(n);
    double f = objective(x, grad);
    if (!std::isfinite(f) || !grad.allFinite()) {
        return make_error<SqpSolution>(ErrorCode::INVALID_DATA,
                                       "Objective is not finite at the starting point",
                                       "SqpSolver");
    }

    Eigen::MatrixXd hessian = Eigen::MatrixXd::Identity(n, n);
    int stalls = 0;

    for (int iter = 0; iter < settings_.max_iterations; ++iter) {
        solution.iterations = iter + 1;

        if (settings_.max_seconds > 0.0) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            if (elapsed.count() > settings_.max_seconds) {
                solution.timed_out = true;
                break;
            }
        }

        Eigen::VectorXd direction = solve_subproblem(x, grad, hessian) - x;
        if (direction.lpNorm<Eigen::Infinity>() < settings_.tolerance) {
            solution.converged = true;
            break;
        }

        const double slope = grad.dot(direction);
        double step = 1.0;
        Eigen::VectorXd x_new(n);
        Eigen::VectorXd grad_new(n);
        double f_new = f;
        bool accepted = false;

        if (slope < 0.0) {
            while (step >= MIN_STEP) {
                x_new = x + step * direction;
                f_new = objective(x_new, grad_new);
                if (std::isfinite(f_new) && f_new <= f + ARMIJO_C1 * step * slope) {
                    accepted = true;
                    break;
                }
                step *= 0.5;
            }
        }

        if (!accepted) {
            // No decrease left to find at the optimum; accept a small step as stationarity
            if (direction.lpNorm<Eigen::Infinity>() < std::sqrt(settings_.tolerance)) {
                solution.converged = true;
                break;
            }
            // Model is poor; restart from the identity before giving up
            if (++stalls > MAX_STALLS)
                break;
            hessian = Eigen::MatrixXd::Identity(n, n);
            continue;
        }
        stalls = 0;

        // Clean tiny budget drift from the step arithmetic
        x_new = enforce_bounds(x_new, bounds_);
        f_new = objective(x_new, grad_new);

        const double decrease = f - f_new;
        const double moved = (x_new - x).lpNorm<Eigen::Infinity>();
        update_hessian(hessian, x_new - x, grad_new - grad);
        x = x_new;
        grad = grad_new;
        f = f_new;

        if (std::abs(decrease) <= settings_.tolerance * (1.0 + std::abs(f)) &&
            moved < std::sqrt(settings_.tolerance)) {
            solution.converged = true;
            break;
        }
    }

    solution.x = x;
    solution.objective = f;
    return solution;
}

Eigen::VectorXd SqpSolver::solve_subproblem(const Eigen::VectorXd& x,
                                            const Eigen::VectorXd& gradient,
                                            const Eigen::MatrixXd& hessian) const {
    // Gershgorin bound on the largest eigenvalue of B
    const double lipschitz = hessian.cwiseAbs().rowwise().sum().maxCoeff();
    const double step = 1.0 / std::max(lipschitz, 1e-12);
    const double tolerance = 1e-3 * settings_.tolerance;

    // FISTA on q(y) = g'(y - x) + 0.5 (y - x)'B(y - x)
    Eigen::VectorXd y = x;
    Eigen::VectorXd z = x;
    double t = 1.0;
    for (int k = 0; k < settings_.max_qp_iterations; ++k) {
        const Eigen::VectorXd model_grad = gradient + hessian * (z - x);
        Eigen::VectorXd y_next = project_onto_capped_simplex(z - step * model_grad, bounds_);

        const double t_next = 0.5 * (1.0 + std::sqrt(1.0 + 4.0 * t * t));
        const double change = (y_next - y).lpNorm<Eigen::Infinity>();
        z = y_next + ((t - 1.0) / t_next) * (y_next - y);
        y = std::move(y_next);
        t = t_next;

        if (change < tolerance)
            break;
    }
    return y;
}

void SqpSolver::update_hessian(Eigen::MatrixXd& hessian, const Eigen::VectorXd& step,
                               const Eigen::VectorXd& gradient_change) {
    const Eigen::VectorXd bs = hessian * step;
    const double sbs = step.dot(bs);
    if (sbs <= 1e-18)
        return;

    // Powell damping keeps B positive definite when s'y is small or negative
    const double sy = step.dot(gradient_change);
    Eigen::VectorXd r = gradient_change;
    if (sy < 0.2 * sbs) {
        const double theta = 0.8 * sbs / (sbs - sy);
        r = theta * gradient_change + (1.0 - theta) * bs;
    }
    const double sr = step.dot(r);
    if (sr <= 1e-18)
        return;

    hessian += -(bs * bs.transpose()) / sbs + (r * r.transpose()) / sr;
    hessian = 0.5 * (hessian + hessian.transpose());
}

}  // namespace alloc_ngin

// src/optimization/mean_variance_optimizer.cpp

#include "alloc_ngin/optimization/mean_variance_optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "alloc_ngin/core/logger.hpp"

namespace alloc_ngin {

MeanVarianceOptimizer::MeanVarianceOptimizer(MeanVarianceConfig config, WeightBounds bounds)
    : config_(std::move(config)), bounds_(bounds) {
    Logger::register_component("MeanVarianceOptimizer");
}

Result<void> MeanVarianceOptimizer::validate_inputs(const AllocationRequest& request) const {
    auto bounds_check = validate_bounds(bounds_, request.assets.size());
    if (bounds_check.is_error()) {
        return bounds_check;
    }

    if (!request.parameters) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Mean-variance allocation requires estimated parameters",
                                "MeanVarianceOptimizer");
    }

    const auto& params = *request.parameters;
    const auto n = static_cast<Eigen::Index>(request.assets.size());
    if (params.expected_returns.size() != n || params.covariance.rows() != n ||
        params.covariance.cols() != n) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Parameter dimensions do not match the universe of " +
                                    std::to_string(n) + " assets",
                                "MeanVarianceOptimizer");
    }

    if (!params.expected_returns.allFinite() || !params.covariance.allFinite() ||
        !std::isfinite(request.risk_free_rate)) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Non-finite estimated parameters",
                                "MeanVarianceOptimizer");
    }

    return Result<void>();
}

double MeanVarianceOptimizer::negative_sharpe(const Eigen::VectorXd& weights,
                                              const Eigen::VectorXd& expected_returns,
                                              const Eigen::MatrixXd& covariance,
                                              double risk_free_rate,
                                              Eigen::VectorXd& gradient) const {
    const Eigen::VectorXd sigma_w = covariance * weights;
    const double variance = weights.dot(sigma_w);
    const double volatility = std::sqrt(std::max(variance, 0.0));

    if (volatility < config_.volatility_floor) {
        gradient = Eigen::VectorXd::Zero(weights.size());
        return config_.zero_volatility_penalty;
    }

    const double excess = expected_returns.dot(weights) - risk_free_rate;
    // d/dw [-(mu'w - rf) / sigma] = -mu / sigma + (mu'w - rf) Sigma w / sigma^3
    gradient = -expected_returns / volatility +
               (excess / (volatility * volatility * volatility)) * sigma_w;
    return -excess / volatility;
}

Result<SqpSolution> MeanVarianceOptimizer::maximize_sharpe(const Eigen::VectorXd& expected_returns,
                                                           const Eigen::MatrixXd& covariance,
                                                           double risk_free_rate) const {
    SqpSettings settings;
    settings.tolerance = config_.tolerance;
    settings.max_iterations = config_.max_iterations;
    settings.max_seconds = config_.max_seconds;
    SqpSolver solver(settings, bounds_);

    auto objective = [&](const Eigen::VectorXd& w, Eigen::VectorXd& grad) {
        return negative_sharpe(w, expected_returns, covariance, risk_free_rate, grad);
    };

    auto solved = solver.minimize(objective, equal_weights(static_cast<size_t>(expected_returns.size())));
    if (solved.is_error()) {
        return solved;
    }

    const SqpSolution& solution = solved.value();
    if (!solution.converged) {
        std::ostringstream oss;
        oss << "SQP stopped after " << solution.iterations << " iterations"
            << (solution.timed_out ? " (time limit reached)" : "") << " without converging";
        return make_error<SqpSolution>(ErrorCode::OPTIMIZATION_DID_NOT_CONVERGE, oss.str(),
                                       "MeanVarianceOptimizer");
    }

    const double variance = solution.x.dot(covariance * solution.x);
    if (std::sqrt(std::max(variance, 0.0)) < config_.volatility_floor) {
        return make_error<SqpSolution>(ErrorCode::DEGENERATE_COVARIANCE,
                                       "Optimal portfolio has zero volatility",
                                       "MeanVarianceOptimizer");
    }

    return solved;
}

Result<Eigen::VectorXd> MeanVarianceOptimizer::tangency_portfolio(
    const Eigen::VectorXd& expected_returns, const Eigen::MatrixXd& covariance,
    double risk_free_rate) const {
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen(covariance, Eigen::EigenvaluesOnly);
    if (eigen.info() != Eigen::Success) {
        return make_error<Eigen::VectorXd>(ErrorCode::SINGULAR_COVARIANCE,
                                           "Eigen decomposition of covariance failed",
                                           "MeanVarianceOptimizer");
    }
    const double max_eigen = eigen.eigenvalues().maxCoeff();
    const double min_eigen = eigen.eigenvalues().minCoeff();
    if (max_eigen <= 0.0 || min_eigen <= 1e-12 * max_eigen) {
        std::ostringstream oss;
        oss << "Covariance is singular (eigenvalues in [" << min_eigen << ", " << max_eigen
            << "])";
        return make_error<Eigen::VectorXd>(ErrorCode::SINGULAR_COVARIANCE, oss.str(),
                                           "MeanVarianceOptimizer");
    }

    Eigen::VectorXd excess =
        expected_returns - Eigen::VectorXd::Constant(expected_returns.size(), risk_free_rate);
    Eigen::VectorXd raw = covariance.ldlt().solve(excess);
    const double denominator = raw.sum();
    if (!std::isfinite(denominator) || denominator <= 1e-12 * raw.cwiseAbs().sum()) {
        std::ostringstream oss;
        oss << "Tangency denominator 1'Sigma^-1(mu - rf) = " << denominator
            << " is not positive";
        return make_error<Eigen::VectorXd>(ErrorCode::NO_TANGENCY_PORTFOLIO, oss.str(),
                                           "MeanVarianceOptimizer");
    }

    Eigen::VectorXd weights = enforce_bounds(raw / denominator, bounds_);
    return weights;
}

Result<AllocationResult> MeanVarianceOptimizer::allocate(const AllocationRequest& request) const {
    auto valid = validate_inputs(request);
    if (valid.is_error()) {
        return forward_error<AllocationResult>(valid);
    }

    const auto& params = *request.parameters;
    const double rf = request.risk_free_rate;

    MeanVarianceResult result;
    result.risk_free_rate = rf;
    Eigen::VectorXd weights;

    auto solved = maximize_sharpe(params.expected_returns, params.covariance, rf);
    if (solved.is_ok()) {
        result.method = MeanVarianceMethod::SQP;
        result.converged = true;
        result.iterations = solved.value().iterations;
        weights = enforce_bounds(solved.value().x, bounds_);
    } else {
        const AllocError* sqp_error = solved.error();
        WARN("Max-Sharpe SQP failed: " << sqp_error->what()
                                       << "; falling back to analytical tangency portfolio");
        result.warnings.push_back({AllocationWarningKind::OPTIMIZER_NOT_CONVERGED,
                                   sqp_error->code(), sqp_error->what()});

        auto tangency = tangency_portfolio(params.expected_returns, params.covariance, rf);
        if (tangency.is_ok()) {
            result.method = MeanVarianceMethod::ANALYTICAL_TANGENCY;
            weights = tangency.value();
            result.warnings.push_back(
                {AllocationWarningKind::ANALYTICAL_FALLBACK, sqp_error->code(),
                 "Bounded analytical tangency portfolio used"});
        } else {
            const AllocError* tangency_error = tangency.error();
            WARN("Tangency portfolio unavailable: " << tangency_error->what()
                                                    << "; falling back to equal weights");
            result.method = MeanVarianceMethod::EQUAL_WEIGHT;
            weights = equal_weights(request.assets.size());
            result.warnings.push_back({AllocationWarningKind::EQUAL_WEIGHT_FALLBACK,
                                       tangency_error->code(), tangency_error->what()});
        }
    }

    const double variance = weights.dot(params.covariance * weights);
    result.expected_return = params.expected_returns.dot(weights);
    result.expected_volatility = std::sqrt(std::max(variance, 0.0));
    result.expected_sharpe = result.expected_volatility > config_.volatility_floor
                                 ? (result.expected_return - rf) / result.expected_volatility
                                 : 0.0;
    result.weights = PortfolioWeights(request.assets, std::move(weights));

    return AllocationResult(std::move(result));
}

}  // namespace alloc_ngin

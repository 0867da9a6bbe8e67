// src/optimization/risk_parity_allocator.cpp

#include "alloc_ngin/optimization/risk_parity_allocator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "alloc_ngin/core/logger.hpp"

namespace alloc_ngin {

namespace {

// Bounds the multiplicative update when a marginal contribution is tiny or negative
constexpr double MIN_CONTRIBUTION = 1e-12;
constexpr double MAX_UPDATE_RATIO = 1e6;

double max_relative_deviation(const Eigen::VectorXd& contributions, double target) {
    return ((contributions.array() - target).abs() / target).maxCoeff();
}

}  // namespace

Eigen::VectorXd risk_contributions(const Eigen::VectorXd& weights,
                                   const Eigen::MatrixXd& covariance) {
    const Eigen::VectorXd sigma_w = covariance * weights;
    const double volatility = std::sqrt(std::max(weights.dot(sigma_w), 0.0));
    if (volatility <= 0.0) {
        return Eigen::VectorXd::Zero(weights.size());
    }
    return weights.cwiseProduct(sigma_w) / volatility;
}

Eigen::VectorXd risk_contribution_shares(const Eigen::VectorXd& weights,
                                         const Eigen::MatrixXd& covariance) {
    Eigen::VectorXd rc = risk_contributions(weights, covariance);
    const double total = rc.sum();
    if (total > 0.0) {
        rc /= total;
    }
    return rc;
}

RiskContributionStats risk_contribution_stats(const Eigen::VectorXd& weights,
                                              const Eigen::MatrixXd& covariance) {
    RiskContributionStats stats;
    const Eigen::VectorXd rc = risk_contributions(weights, covariance);
    const double volatility = rc.sum();
    stats.portfolio_volatility = volatility;
    if (rc.size() == 0 || volatility <= 0.0) {
        return stats;
    }

    const double target = volatility / static_cast<double>(rc.size());
    const Eigen::ArrayXd deviation = (rc.array() - target).abs() / target;
    stats.max_relative_deviation = deviation.maxCoeff();
    stats.mean_relative_deviation = deviation.mean();

    const double mean = rc.mean();
    stats.std_dev = rc.size() > 1
                        ? std::sqrt((rc.array() - mean).square().sum() /
                                    static_cast<double>(rc.size() - 1))
                        : 0.0;

    const double min_rc = rc.minCoeff();
    stats.max_min_ratio =
        min_rc > 0.0 ? rc.maxCoeff() / min_rc : std::numeric_limits<double>::infinity();
    return stats;
}

RiskParityAllocator::RiskParityAllocator(RiskParityConfig config, WeightBounds bounds)
    : config_(std::move(config)), bounds_(bounds) {
    Logger::register_component("RiskParityAllocator");
}

Result<void> RiskParityAllocator::validate_inputs(const AllocationRequest& request) const {
    auto bounds_check = validate_bounds(bounds_, request.assets.size());
    if (bounds_check.is_error()) {
        return bounds_check;
    }

    if (!request.parameters) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Risk parity allocation requires estimated parameters",
                                "RiskParityAllocator");
    }

    const auto& covariance = request.parameters->covariance;
    const auto n = static_cast<Eigen::Index>(request.assets.size());
    if (covariance.rows() != n || covariance.cols() != n) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Covariance dimensions do not match the universe of " +
                                    std::to_string(n) + " assets",
                                "RiskParityAllocator");
    }
    if (!covariance.allFinite()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Non-finite covariance",
                                "RiskParityAllocator");
    }

    if (config_.damping <= 0.0 || config_.damping > 1.0 || config_.max_iterations <= 0 ||
        config_.tolerance <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Risk parity requires 0 < damping <= 1, positive tolerance "
                                "and positive max_iterations",
                                "RiskParityAllocator");
    }

    return Result<void>();
}

Result<AllocationResult> RiskParityAllocator::allocate(const AllocationRequest& request) const {
    auto valid = validate_inputs(request);
    if (valid.is_error()) {
        return forward_error<AllocationResult>(valid);
    }

    const Eigen::MatrixXd& covariance = request.parameters->covariance;
    const size_t n = request.assets.size();
    RiskParityResult result;

    auto initial = inverse_volatility_weights(covariance, config_.volatility_floor);
    if (initial.is_error()) {
        WARN("Risk parity cannot start: " << initial.error()->what()
                                          << "; falling back to equal weights");
        result.method = RiskParityMethod::EQUAL_WEIGHT;
        result.warnings.push_back({AllocationWarningKind::EQUAL_WEIGHT_FALLBACK,
                                   initial.error()->code(), initial.error()->what()});
        Eigen::VectorXd weights = equal_weights(n);
        result.pre_clip = risk_contribution_stats(weights, covariance);
        result.post_clip = result.pre_clip;
        result.weights = PortfolioWeights(request.assets, std::move(weights));
        return AllocationResult(std::move(result));
    }

    const Eigen::VectorXd inverse_vol = initial.value();
    Eigen::VectorXd w = inverse_vol;
    bool degenerate = false;

    for (int iter = 0; iter < config_.max_iterations; ++iter) {
        const Eigen::VectorXd sigma_w = covariance * w;
        const double volatility = std::sqrt(std::max(w.dot(sigma_w), 0.0));
        if (volatility < config_.volatility_floor) {
            degenerate = true;
            break;
        }

        const Eigen::VectorXd rc = w.cwiseProduct(sigma_w) / volatility;
        const double target = volatility / static_cast<double>(n);
        if (max_relative_deviation(rc, target) < config_.tolerance) {
            result.converged = true;
            break;
        }

        result.iterations = iter + 1;
        for (size_t i = 0; i < n; ++i) {
            const auto k = static_cast<Eigen::Index>(i);
            const double ratio =
                std::min(target / std::max(rc(k), MIN_CONTRIBUTION), MAX_UPDATE_RATIO);
            w(k) *= std::pow(ratio, config_.damping);
        }
        w /= w.sum();
    }

    if (degenerate) {
        WARN("Portfolio volatility vanished during risk parity iteration"
             << "; falling back to inverse-volatility weights");
        result.method = RiskParityMethod::INVERSE_VOLATILITY;
        result.converged = false;
        result.warnings.push_back({AllocationWarningKind::INVERSE_VOLATILITY_FALLBACK,
                                   ErrorCode::DEGENERATE_COVARIANCE,
                                   "Portfolio volatility fell below the floor"});
        w = inverse_vol;
    } else {
        result.method = RiskParityMethod::ERC;
        if (!result.converged) {
            // Re-check the final iterate after the last update
            const Eigen::VectorXd rc = risk_contributions(w, covariance);
            const double target = rc.sum() / static_cast<double>(n);
            result.converged = target > 0.0 && max_relative_deviation(rc, target) < config_.tolerance;
        }
        if (!result.converged) {
            WARN("Risk parity did not converge in " << config_.max_iterations << " iterations");
            result.warnings.push_back({AllocationWarningKind::ERC_NOT_CONVERGED,
                                       ErrorCode::OPTIMIZATION_DID_NOT_CONVERGE,
                                       "Iteration cap of " +
                                           std::to_string(config_.max_iterations) +
                                           " reached"});
        }
    }

    result.pre_clip = risk_contribution_stats(w, covariance);

    Eigen::VectorXd bounded = enforce_bounds(w, bounds_);
    result.bounds_binding = (bounded - w).lpNorm<Eigen::Infinity>() > WEIGHT_TOLERANCE;
    result.post_clip = risk_contribution_stats(bounded, covariance);
    if (result.bounds_binding) {
        DEBUG("Weight bounds bind for risk parity; post-clip max RC deviation "
              << result.post_clip.max_relative_deviation);
    }

    result.weights = PortfolioWeights(request.assets, std::move(bounded));
    return AllocationResult(std::move(result));
}

}  // namespace alloc_ngin

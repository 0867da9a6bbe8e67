// src/optimization/weight_constraints.cpp

#include "alloc_ngin/optimization/weight_constraints.hpp"
#include <cmath>
#include <sstream>

namespace alloc_ngin {

Result<void> validate_bounds(const WeightBounds& bounds, size_t num_assets) {
    if (num_assets == 0) {
        return make_error<void>(ErrorCode::EMPTY_UNIVERSE, "Universe has no assets",
                                "WeightConstraints");
    }
    if (!std::isfinite(bounds.min_weight) || !std::isfinite(bounds.max_weight) ||
        bounds.min_weight < 0.0 || bounds.max_weight > 1.0 ||
        bounds.min_weight > bounds.max_weight) {
        std::ostringstream oss;
        oss << "Weight bounds must satisfy 0 <= min <= max <= 1, got [" << bounds.min_weight
            << ", " << bounds.max_weight << "]";
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, oss.str(), "WeightConstraints");
    }

    const double n = static_cast<double>(num_assets);
    if (n * bounds.min_weight > 1.0 + WEIGHT_TOLERANCE ||
        n * bounds.max_weight < 1.0 - WEIGHT_TOLERANCE) {
        std::ostringstream oss;
        oss << "Bounds [" << bounds.min_weight << ", " << bounds.max_weight
            << "] cannot produce a fully invested portfolio of " << num_assets << " assets";
        return make_error<void>(ErrorCode::INFEASIBLE_BOUNDS, oss.str(), "WeightConstraints");
    }

    return Result<void>();
}

bool satisfies_bounds(const Eigen::VectorXd& weights, const WeightBounds& bounds,
                      double tolerance) {
    if (weights.size() == 0)
        return false;
    if (std::abs(weights.sum() - 1.0) > tolerance)
        return false;
    for (Eigen::Index i = 0; i < weights.size(); ++i) {
        if (!std::isfinite(weights(i)) || weights(i) < bounds.min_weight - tolerance ||
            weights(i) > bounds.max_weight + tolerance) {
            return false;
        }
    }
    return true;
}

Eigen::VectorXd enforce_bounds(const Eigen::VectorXd& weights, const WeightBounds& bounds) {
    const double lo = bounds.min_weight;
    const double hi = bounds.max_weight;

    Eigen::VectorXd w = weights.cwiseMax(lo).cwiseMin(hi);
    const double total = w.sum();

    if (total > 1.0) {
        const double excess_room = total - lo * static_cast<double>(w.size());
        if (excess_room > 0.0) {
            const double scale = 1.0 - (total - 1.0) / excess_room;
            w = (w.array() - lo) * scale + lo;
        }
    } else if (total < 1.0) {
        const double headroom = hi * static_cast<double>(w.size()) - total;
        if (headroom > 0.0) {
            const double scale = (1.0 - total) / headroom;
            w = w.array() + (hi - w.array()) * scale;
        }
    }

    return w;
}

Eigen::VectorXd project_onto_capped_simplex(const Eigen::VectorXd& v, const WeightBounds& bounds) {
    const double lo = bounds.min_weight;
    const double hi = bounds.max_weight;

    auto clipped_sum = [&](double shift) {
        return (v.array() - shift).max(lo).min(hi).sum();
    };

    // clipped_sum is non-increasing in the shift
    double left = v.minCoeff() - hi;
    double right = v.maxCoeff() - lo;
    for (int iter = 0; iter < 200 && right - left > 1e-16; ++iter) {
        const double mid = 0.5 * (left + right);
        if (clipped_sum(mid) > 1.0) {
            left = mid;
        } else {
            right = mid;
        }
    }

    Eigen::VectorXd x = (v.array() - 0.5 * (left + right)).max(lo).min(hi);
    return enforce_bounds(x, bounds);
}

Result<Eigen::VectorXd> inverse_volatility_weights(const Eigen::MatrixXd& covariance,
                                                   double volatility_floor) {
    if (covariance.rows() == 0 || covariance.rows() != covariance.cols()) {
        return make_error<Eigen::VectorXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Covariance matrix must be square and non-empty",
                                           "WeightConstraints");
    }

    Eigen::VectorXd inv_vol(covariance.rows());
    for (Eigen::Index i = 0; i < covariance.rows(); ++i) {
        const double variance = covariance(i, i);
        if (!(variance > volatility_floor * volatility_floor)) {
            return make_error<Eigen::VectorXd>(
                ErrorCode::DEGENERATE_COVARIANCE,
                "Asset " + std::to_string(i) + " has zero volatility", "WeightConstraints");
        }
        inv_vol(i) = 1.0 / std::sqrt(variance);
    }

    Eigen::VectorXd weights = inv_vol / inv_vol.sum();
    return weights;
}

Eigen::VectorXd equal_weights(size_t num_assets) {
    const auto n = static_cast<Eigen::Index>(num_assets);
    return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
}

}  // namespace alloc_ngin

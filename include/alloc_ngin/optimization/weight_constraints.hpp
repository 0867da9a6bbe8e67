// include/alloc_ngin/optimization/weight_constraints.hpp

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "alloc_ngin/core/error.hpp"

namespace alloc_ngin {

/**
 * @brief Per-asset box constraint shared by all allocators
 */
struct WeightBounds {
    double min_weight{0.0};
    double max_weight{1.0};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["min_weight"] = min_weight;
        j["max_weight"] = max_weight;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("min_weight"))
            min_weight = j.at("min_weight").get<double>();
        if (j.contains("max_weight"))
            max_weight = j.at("max_weight").get<double>();
    }
};

// Slack used for the budget and box checks
constexpr double WEIGHT_TOLERANCE = 1e-9;

/**
 * @brief Check that bounds are well formed and admit a fully invested portfolio
 * @param bounds Box constraint
 * @param num_assets Universe size
 * @return INVALID_ARGUMENT for malformed bounds, INFEASIBLE_BOUNDS when
 *         n * min > 1 or n * max < 1, EMPTY_UNIVERSE when num_assets is zero
 */
Result<void> validate_bounds(const WeightBounds& bounds, size_t num_assets);

/**
 * @brief Check sum(w) == 1 and min <= w_i <= max within tolerance
 */
bool satisfies_bounds(const Eigen::VectorXd& weights, const WeightBounds& bounds,
                      double tolerance = 1e-8);

/**
 * @brief Clip weights into the box and restore the unit budget
 *
 * After clipping, any excess is removed in proportion to each weight's
 * distance above the lower bound and any shortfall is added in proportion
 * to the headroom below the upper bound. Both steps are exact, so the
 * output satisfies the box and sums to one whenever the bounds are feasible.
 */
Eigen::VectorXd enforce_bounds(const Eigen::VectorXd& weights, const WeightBounds& bounds);

/**
 * @brief Euclidean projection onto {x : min <= x_i <= max, sum(x) = 1}
 *
 * Solved by bisection on the shift t in x_i = clip(v_i - t).
 */
Eigen::VectorXd project_onto_capped_simplex(const Eigen::VectorXd& v, const WeightBounds& bounds);

/**
 * @brief Weights proportional to 1 / sigma_i
 * @return DEGENERATE_COVARIANCE if any asset volatility is not positive
 */
Result<Eigen::VectorXd> inverse_volatility_weights(const Eigen::MatrixXd& covariance,
                                                   double volatility_floor = 1e-12);

/**
 * @brief Equal weights 1/n
 */
Eigen::VectorXd equal_weights(size_t num_assets);

}  // namespace alloc_ngin

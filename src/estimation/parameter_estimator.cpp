// src/estimation/parameter_estimator.cpp

#include "alloc_ngin/estimation/parameter_estimator.hpp"
#include <algorithm>
#include <cmath>
#include "alloc_ngin/core/logger.hpp"

namespace alloc_ngin {

ParameterEstimator::ParameterEstimator(EstimatorConfig config) : config_(config) {
    Logger::register_component("ParameterEstimator");
}

Result<EstimatedParameters> ParameterEstimator::estimate(const ReturnsMatrix& window) const {
    if (window.num_assets() == 0) {
        return make_error<EstimatedParameters>(ErrorCode::EMPTY_UNIVERSE,
                                               "Estimation window has no assets",
                                               "ParameterEstimator");
    }

    const size_t n = window.num_periods();
    const size_t required = std::max<size_t>(config_.min_periods, 2);
    if (n < required) {
        return make_error<EstimatedParameters>(
            ErrorCode::INSUFFICIENT_DATA,
            "Estimation window has " + std::to_string(n) + " periods, need at least " +
                std::to_string(required),
            "ParameterEstimator");
    }

    const Eigen::MatrixXd& returns = window.values();
    const double ppy = static_cast<double>(config_.periods_per_year);

    Eigen::VectorXd mean = returns.colwise().mean().transpose();
    Eigen::MatrixXd centered = returns.rowwise() - mean.transpose();
    Eigen::MatrixXd covariance =
        (centered.transpose() * centered) / static_cast<double>(n - 1);
    // Remove asymmetry left by floating point accumulation
    covariance = 0.5 * (covariance + covariance.transpose());

    EstimatedParameters params;
    params.assets = window.assets();
    params.expected_returns = mean * ppy;
    params.covariance = covariance * ppy;
    params.volatilities = params.covariance.diagonal().cwiseMax(0.0).cwiseSqrt();
    params.num_observations = n;
    params.window_start = window.dates().front();
    params.window_end = window.dates().back();

    for (Eigen::Index i = 0; i < params.volatilities.size(); ++i) {
        if (params.volatilities(i) == 0.0) {
            DEBUG("Asset " << params.assets[static_cast<size_t>(i)]
                           << " has zero variance in the estimation window");
        }
    }

    return params;
}

}  // namespace alloc_ngin

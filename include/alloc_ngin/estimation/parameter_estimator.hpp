// include/alloc_ngin/estimation/parameter_estimator.hpp

#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "alloc_ngin/core/error.hpp"
#include "alloc_ngin/core/types.hpp"
#include "alloc_ngin/data/returns_matrix.hpp"

namespace alloc_ngin {

/**
 * @brief Annualized moments of one estimation window
 */
struct EstimatedParameters {
    std::vector<AssetId> assets;
    Eigen::VectorXd expected_returns;  // Annualized arithmetic mean
    Eigen::MatrixXd covariance;        // Annualized sample covariance (N-1)
    Eigen::VectorXd volatilities;      // sqrt(diag(covariance))
    size_t num_observations{0};
    Timestamp window_start{};
    Timestamp window_end{};

    size_t num_assets() const {
        return assets.size();
    }
};

struct EstimatorConfig {
    int periods_per_year{12};
    size_t min_periods{12};
};

/**
 * @brief Estimates expected returns and covariance from a window of returns
 *
 * The estimator only ever sees the window it is handed; callers are
 * responsible for slicing strictly before the rebalancing date.
 */
class ParameterEstimator {
public:
    explicit ParameterEstimator(EstimatorConfig config = EstimatorConfig{});

    /**
     * @brief Estimate annualized moments
     * @param window Returns strictly preceding the rebalancing date
     * @return EMPTY_UNIVERSE, INSUFFICIENT_DATA, or the estimates
     */
    Result<EstimatedParameters> estimate(const ReturnsMatrix& window) const;

    const EstimatorConfig& config() const {
        return config_;
    }

private:
    EstimatorConfig config_;
};

}  // namespace alloc_ngin

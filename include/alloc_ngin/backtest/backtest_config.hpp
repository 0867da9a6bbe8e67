// include/alloc_ngin/backtest/backtest_config.hpp

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "alloc_ngin/core/config_base.hpp"
#include "alloc_ngin/core/error.hpp"
#include "alloc_ngin/core/types.hpp"
#include "alloc_ngin/optimization/mean_variance_optimizer.hpp"
#include "alloc_ngin/optimization/risk_parity_allocator.hpp"
#include "alloc_ngin/optimization/weight_constraints.hpp"

namespace alloc_ngin {
namespace backtest {

/**
 * @brief Configuration for a walk-forward allocation backtest
 */
struct BacktestConfig : public ConfigBase {
    int periods_per_year{12};
    double risk_free_rate{0.06195};          // Annual, used when no series is given
    std::vector<double> risk_free_series;    // Optional periodic rates, one per matrix row
    std::vector<std::string> rebalancing_dates;  // ISO YYYY-MM-DD, strictly ascending
    WeightBounds weight_bounds;

    size_t estimation_window_months{24};  // Lookback in periods
    size_t min_estimation_periods{12};
    size_t min_test_periods{3};

    MeanVarianceConfig mean_variance;
    RiskParityConfig risk_parity;

    double significance_level{0.05};
    size_t bootstrap_samples{1000};
    uint64_t bootstrap_seed{42};

    double transaction_cost_bps{0.0};
    size_t max_threads{1};

    std::vector<StrategyKind> strategies{StrategyKind::EQUAL_WEIGHT,
                                         StrategyKind::MEAN_VARIANCE,
                                         StrategyKind::RISK_PARITY};

    // Configuration metadata
    std::string version{"1.0.0"};

    /**
     * @brief Check the configuration independently of any data
     * @return INVALID_ARGUMENT describing the first violation
     */
    Result<void> validate() const;

    /**
     * @brief Rebalancing dates parsed as timestamps
     * @return INVALID_ARGUMENT if any date is malformed
     */
    Result<std::vector<Timestamp>> parsed_rebalancing_dates() const;

    /**
     * @brief Periodic risk-free rate for every row of a matrix with num_rows rows
     */
    std::vector<double> periodic_risk_free(size_t num_rows) const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

protected:
    std::string config_name() const override {
        return "BacktestConfig";
    }
};

}  // namespace backtest
}  // namespace alloc_ngin

// include/alloc_ngin/backtest/backtest_results.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "alloc_ngin/backtest/performance_analyzer.hpp"
#include "alloc_ngin/core/types.hpp"
#include "alloc_ngin/optimization/allocator.hpp"
#include "alloc_ngin/statistics/significance_tester.hpp"

namespace alloc_ngin {
namespace backtest {

/**
 * @brief Lifecycle of a rebalancing period
 * ESTIMATING -> ALLOCATING -> APPLYING -> RECORDED, or SKIPPED from any earlier state
 */
enum class PeriodState { ESTIMATING, ALLOCATING, APPLYING, RECORDED, SKIPPED };

std::string period_state_to_string(PeriodState state);

/**
 * @brief Row ranges of one walk-forward step
 *
 * The test window holds rows with start <= date < end. The estimation
 * window holds up to the configured lookback of rows strictly before start.
 */
struct RebalancingPeriod {
    size_t index{0};
    std::string label;
    Timestamp start{};
    Timestamp end{};
    size_t estimation_begin{0};
    size_t estimation_end{0};
    size_t test_begin{0};
    size_t test_end{0};

    size_t estimation_size() const {
        return estimation_end - estimation_begin;
    }

    size_t test_size() const {
        return test_end - test_begin;
    }
};

/**
 * @brief One strategy's allocation and realized returns in one period
 */
struct StrategyPeriodRecord {
    StrategyKind strategy{StrategyKind::EQUAL_WEIGHT};
    AllocationResult allocation;
    std::vector<double> gross_returns;  // R_test * w
    std::vector<double> returns;        // After transaction costs
    double turnover{0.0};
    double transaction_cost{0.0};
    PerformanceMetrics metrics;

    const PortfolioWeights& weights() const {
        return outcome_of(allocation).weights;
    }

    bool degraded() const {
        return outcome_of(allocation).degraded();
    }
};

enum class ComparisonStatus { TESTED, INDETERMINATE, UNAVAILABLE };

std::string comparison_status_to_string(ComparisonStatus status);

/**
 * @brief Pairwise Sharpe comparison; the two tests are reported side by side
 */
struct StrategyComparison {
    StrategyKind strategy_a{StrategyKind::EQUAL_WEIGHT};
    StrategyKind strategy_b{StrategyKind::EQUAL_WEIGHT};
    ComparisonStatus status{ComparisonStatus::UNAVAILABLE};
    std::optional<statistics::SignificanceResult> jobson_korkie;
    std::optional<statistics::BootstrapResult> bootstrap;
    std::string note;

    nlohmann::json to_json() const;
};

struct PeriodRecord {
    RebalancingPeriod period;
    PeriodState state{PeriodState::ESTIMATING};
    std::string skip_reason;
    std::vector<Timestamp> dates;     // Test window dates
    std::vector<double> risk_free;    // Periodic rates over the test window
    std::vector<StrategyPeriodRecord> strategies;
    std::vector<StrategyComparison> comparisons;

    nlohmann::json to_json() const;
};

/**
 * @brief Consolidated view of one strategy over all recorded periods
 */
struct StrategySummary {
    StrategyKind strategy{StrategyKind::EQUAL_WEIGHT};
    std::vector<Timestamp> dates;
    std::vector<double> returns;
    std::vector<double> risk_free;
    PerformanceMetrics metrics;
    size_t recorded_periods{0};
    size_t degraded_periods{0};
    double average_turnover{0.0};
    double total_transaction_cost{0.0};

    nlohmann::json to_json() const;
};

struct SkippedPeriod {
    std::string period;
    std::string reason;
};

struct DegradedAllocation {
    std::string period;
    StrategyKind strategy{StrategyKind::EQUAL_WEIGHT};
    AllocationWarning warning;
};

struct BacktestResults {
    std::vector<AssetId> assets;
    std::vector<PeriodRecord> periods;
    std::vector<StrategySummary> summaries;
    std::vector<StrategyComparison> comparisons;
    std::vector<SkippedPeriod> skipped;
    std::vector<DegradedAllocation> degraded;

    /**
     * @brief Summary for a strategy, or nullptr if it was not run
     */
    const StrategySummary* summary_for(StrategyKind strategy) const;

    nlohmann::json to_json() const;
};

}  // namespace backtest
}  // namespace alloc_ngin

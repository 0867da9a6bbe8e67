// include/alloc_ngin/backtest/backtest_orchestrator.hpp

#pragma once

#include <memory>
#include <vector>
#include "alloc_ngin/backtest/backtest_config.hpp"
#include "alloc_ngin/backtest/backtest_results.hpp"
#include "alloc_ngin/backtest/performance_analyzer.hpp"
#include "alloc_ngin/core/error.hpp"
#include "alloc_ngin/data/returns_matrix.hpp"
#include "alloc_ngin/estimation/parameter_estimator.hpp"
#include "alloc_ngin/optimization/allocator.hpp"
#include "alloc_ngin/statistics/significance_tester.hpp"

namespace alloc_ngin {
namespace backtest {

/**
 * @brief Walk-forward backtest of allocation strategies
 *
 * For each pair of consecutive rebalancing dates the orchestrator
 * estimates parameters on the rows strictly before the first date,
 * allocates with every configured strategy, and holds those weights
 * constant over the rows up to the next date. Periods are independent until turnover and costs are
 * chained in date order, so estimation and allocation may run in
 * parallel.
 */
class BacktestOrchestrator {
public:
    explicit BacktestOrchestrator(BacktestConfig config);

    /**
     * @brief Run the full backtest
     * @param returns Validated returns for the whole sample
     * @return Results, or an error for universe-level problems (invalid
     *         config, infeasible bounds, misaligned risk-free series,
     *         no usable period)
     */
    Result<BacktestResults> run(const ReturnsMatrix& returns) const;

    /**
     * @brief Map rebalancing dates onto row ranges of the matrix
     */
    Result<std::vector<RebalancingPeriod>> plan_periods(const ReturnsMatrix& returns) const;

    const BacktestConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_inputs(const ReturnsMatrix& returns) const;

    std::unique_ptr<Allocator> make_allocator(StrategyKind kind) const;

    /**
     * @brief Estimate, allocate and apply for one period
     * Never fails; problems end in SKIPPED or in degraded allocations.
     */
    PeriodRecord process_period(const RebalancingPeriod& period, const ReturnsMatrix& returns,
                                const std::vector<double>& risk_free,
                                const std::vector<std::unique_ptr<Allocator>>& allocators) const;

    void apply_turnover_and_costs(std::vector<PeriodRecord>& periods) const;

    std::vector<StrategyComparison> compare_strategies(
        const std::vector<StrategyKind>& strategies,
        const std::vector<std::vector<double>>& returns, const std::vector<double>& risk_free,
        bool with_bootstrap) const;

    BacktestConfig config_;
    ParameterEstimator estimator_;
    PerformanceAnalyzer analyzer_;
    statistics::SignificanceTester tester_;
};

}  // namespace backtest
}  // namespace alloc_ngin

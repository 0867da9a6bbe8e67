// src/backtest/backtest_orchestrator.cpp

#include "alloc_ngin/backtest/backtest_orchestrator.hpp"
#include <algorithm>
#include <future>
#include <numeric>
#include <optional>
#include "alloc_ngin/core/logger.hpp"
#include "alloc_ngin/core/time_utils.hpp"
#include "alloc_ngin/optimization/equal_weight_allocator.hpp"
#include "alloc_ngin/optimization/mean_variance_optimizer.hpp"
#include "alloc_ngin/optimization/risk_parity_allocator.hpp"

namespace alloc_ngin {
namespace backtest {

namespace {

double mean_of(const std::vector<double>& values, size_t begin, size_t end) {
    if (end <= begin)
        return 0.0;
    const double sum = std::accumulate(values.begin() + static_cast<std::ptrdiff_t>(begin),
                                       values.begin() + static_cast<std::ptrdiff_t>(end), 0.0);
    return sum / static_cast<double>(end - begin);
}

}  // namespace

BacktestOrchestrator::BacktestOrchestrator(BacktestConfig config)
    : config_(std::move(config)),
      estimator_(EstimatorConfig{config_.periods_per_year, config_.min_estimation_periods}),
      analyzer_(config_.periods_per_year),
      tester_(statistics::SignificanceConfig{config_.significance_level, config_.periods_per_year,
                                             config_.bootstrap_samples, config_.bootstrap_seed}) {
    Logger::register_component("BacktestOrchestrator");
}

std::unique_ptr<Allocator> BacktestOrchestrator::make_allocator(StrategyKind kind) const {
    switch (kind) {
        case StrategyKind::MEAN_VARIANCE:
            return std::make_unique<MeanVarianceOptimizer>(config_.mean_variance,
                                                           config_.weight_bounds);
        case StrategyKind::RISK_PARITY:
            return std::make_unique<RiskParityAllocator>(config_.risk_parity,
                                                         config_.weight_bounds);
        case StrategyKind::EQUAL_WEIGHT:
        default:
            return std::make_unique<EqualWeightAllocator>();
    }
}

Result<void> BacktestOrchestrator::validate_inputs(const ReturnsMatrix& returns) const {
    auto config_check = config_.validate();
    if (config_check.is_error()) {
        return config_check;
    }

    if (returns.num_assets() == 0) {
        return make_error<void>(ErrorCode::EMPTY_UNIVERSE, "Returns matrix has no assets",
                                "BacktestOrchestrator");
    }
    if (returns.empty()) {
        return make_error<void>(ErrorCode::INSUFFICIENT_DATA, "Returns matrix has no periods",
                                "BacktestOrchestrator");
    }

    auto bounds_check = validate_bounds(config_.weight_bounds, returns.num_assets());
    if (bounds_check.is_error()) {
        return bounds_check;
    }

    if (!config_.risk_free_series.empty() &&
        config_.risk_free_series.size() != returns.num_periods()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "risk_free_series has " +
                                    std::to_string(config_.risk_free_series.size()) +
                                    " values but the returns matrix has " +
                                    std::to_string(returns.num_periods()) + " rows",
                                "BacktestOrchestrator");
    }

    return Result<void>();
}

Result<std::vector<RebalancingPeriod>> BacktestOrchestrator::plan_periods(
    const ReturnsMatrix& returns) const {
    auto parsed = config_.parsed_rebalancing_dates();
    if (parsed.is_error()) {
        return forward_error<std::vector<RebalancingPeriod>>(parsed, "BacktestOrchestrator");
    }
    const auto& boundaries = parsed.value();

    std::vector<RebalancingPeriod> periods;
    for (size_t i = 0; i + 1 < boundaries.size(); ++i) {
        RebalancingPeriod period;
        period.index = i;
        period.start = boundaries[i];
        period.end = boundaries[i + 1];
        period.label = "Period " + std::to_string(i + 1) + " (" +
                       core::format_iso_date(period.start) + " to " +
                       core::format_iso_date(period.end) + ")";

        period.test_begin = returns.lower_bound(period.start);
        period.test_end = returns.lower_bound(period.end);
        period.estimation_end = period.test_begin;
        period.estimation_begin =
            period.estimation_end - std::min(config_.estimation_window_months, period.estimation_end);
        periods.push_back(period);
    }
    return periods;
}

PeriodRecord BacktestOrchestrator::process_period(
    const RebalancingPeriod& period, const ReturnsMatrix& returns,
    const std::vector<double>& risk_free,
    const std::vector<std::unique_ptr<Allocator>>& allocators) const {
    PeriodRecord record;
    record.period = period;
    record.state = PeriodState::ESTIMATING;

    auto skip = [&](const std::string& reason) {
        WARN(period.label << " skipped while " << period_state_to_string(record.state) << ": "
                          << reason);
        record.state = PeriodState::SKIPPED;
        record.skip_reason = reason;
    };

    if (period.test_size() < config_.min_test_periods) {
        skip("test window has " + std::to_string(period.test_size()) + " periods, need " +
             std::to_string(config_.min_test_periods));
        return record;
    }
    if (period.estimation_size() < config_.min_estimation_periods) {
        skip("estimation window has " + std::to_string(period.estimation_size()) +
             " periods, need " + std::to_string(config_.min_estimation_periods));
        return record;
    }

    // Only information dated before the rebalancing date feeds the allocation
    double risk_free_rate = config_.risk_free_rate;
    if (!config_.risk_free_series.empty()) {
        risk_free_rate = mean_of(risk_free, period.estimation_begin, period.estimation_end) *
                         static_cast<double>(config_.periods_per_year);
    }

    std::optional<EstimatedParameters> parameters;
    const bool needs_estimation =
        std::any_of(allocators.begin(), allocators.end(),
                    [](const std::unique_ptr<Allocator>& a) { return a->requires_estimation(); });
    if (needs_estimation) {
        auto estimated =
            estimator_.estimate(returns.slice(period.estimation_begin, period.estimation_end));
        if (estimated.is_error()) {
            skip(estimated.error()->to_string());
            return record;
        }
        parameters = estimated.take_value();
    }

    record.state = PeriodState::ALLOCATING;
    DEBUG(period.label << " allocating with " << period.estimation_size()
                       << " estimation periods");

    AllocationRequest request;
    request.assets = returns.assets();
    request.parameters = std::move(parameters);
    request.risk_free_rate = risk_free_rate;

    for (const auto& allocator : allocators) {
        StrategyPeriodRecord strategy_record;
        strategy_record.strategy = allocator->kind();

        auto allocated = allocator->allocate(request);
        if (allocated.is_ok()) {
            strategy_record.allocation = allocated.take_value();
        } else {
            const AllocError* error = allocated.error();
            WARN(period.label << ": " << strategy_to_string(allocator->kind())
                              << " failed (" << error->what() << "); using equal weights");
            EqualWeightResult fallback;
            fallback.weights = PortfolioWeights(request.assets, equal_weights(request.assets.size()));
            fallback.warnings.push_back(
                {AllocationWarningKind::ALLOCATOR_FAILED, error->code(), error->what()});
            strategy_record.allocation = std::move(fallback);
        }
        record.strategies.push_back(std::move(strategy_record));
    }

    record.state = PeriodState::APPLYING;
    const ReturnsMatrix test = returns.slice(period.test_begin, period.test_end);
    for (auto& strategy_record : record.strategies) {
        auto realized = test.portfolio_returns(strategy_record.weights().values());
        if (realized.is_error()) {
            skip(realized.error()->to_string());
            record.strategies.clear();
            return record;
        }
        const Eigen::VectorXd& values = realized.value();
        strategy_record.gross_returns.assign(values.data(), values.data() + values.size());
        strategy_record.returns = strategy_record.gross_returns;
    }

    record.dates = test.dates();
    record.risk_free.assign(risk_free.begin() + static_cast<std::ptrdiff_t>(period.test_begin),
                            risk_free.begin() + static_cast<std::ptrdiff_t>(period.test_end));
    record.state = PeriodState::RECORDED;
    return record;
}

void BacktestOrchestrator::apply_turnover_and_costs(std::vector<PeriodRecord>& periods) const {
    std::vector<std::optional<Eigen::VectorXd>> previous(config_.strategies.size());

    for (auto& record : periods) {
        if (record.state != PeriodState::RECORDED)
            continue;

        std::vector<std::vector<double>> period_returns;
        for (size_t k = 0; k < record.strategies.size(); ++k) {
            auto& strategy_record = record.strategies[k];
            const Eigen::VectorXd& weights = strategy_record.weights().values();

            strategy_record.turnover =
                previous[k] ? 0.5 * (weights - *previous[k]).cwiseAbs().sum() : 1.0;
            strategy_record.transaction_cost =
                strategy_record.turnover * config_.transaction_cost_bps / 10000.0;

            strategy_record.returns = strategy_record.gross_returns;
            if (!strategy_record.returns.empty()) {
                strategy_record.returns.front() -= strategy_record.transaction_cost;
            }

            auto metrics = analyzer_.analyze(strategy_record.returns, record.risk_free);
            if (metrics.is_ok()) {
                strategy_record.metrics = metrics.value();
            } else {
                WARN(record.period.label << ": metrics unavailable for "
                                         << strategy_to_string(strategy_record.strategy) << ": "
                                         << metrics.error()->what());
            }

            previous[k] = weights;
            period_returns.push_back(strategy_record.returns);
        }

        record.comparisons =
            compare_strategies(config_.strategies, period_returns, record.risk_free, false);
    }
}

std::vector<StrategyComparison> BacktestOrchestrator::compare_strategies(
    const std::vector<StrategyKind>& strategies, const std::vector<std::vector<double>>& returns,
    const std::vector<double>& risk_free, bool with_bootstrap) const {
    std::vector<StrategyComparison> comparisons;

    for (size_t i = 0; i < strategies.size(); ++i) {
        for (size_t j = i + 1; j < strategies.size(); ++j) {
            StrategyComparison comparison;
            comparison.strategy_a = strategies[i];
            comparison.strategy_b = strategies[j];
            const std::string name_a = strategy_to_string(strategies[i]);
            const std::string name_b = strategy_to_string(strategies[j]);

            auto jk = tester_.jobson_korkie(name_a, returns[i], name_b, returns[j], risk_free);
            if (jk.is_ok()) {
                comparison.status = ComparisonStatus::TESTED;
                comparison.jobson_korkie = jk.value();
            } else if (jk.error()->code() == ErrorCode::INDETERMINATE_SIGNIFICANCE) {
                comparison.status = ComparisonStatus::INDETERMINATE;
                comparison.note = jk.error()->what();
                WARN("Significance of " << name_a << " vs " << name_b
                                        << " is indeterminate: " << jk.error()->what());
            } else {
                comparison.status = ComparisonStatus::UNAVAILABLE;
                comparison.note = jk.error()->what();
                DEBUG("Significance of " << name_a << " vs " << name_b
                                         << " unavailable: " << jk.error()->what());
            }

            if (with_bootstrap) {
                auto boot = tester_.bootstrap(name_a, returns[i], name_b, returns[j], risk_free);
                if (boot.is_ok()) {
                    comparison.bootstrap = boot.value();
                } else {
                    comparison.note += comparison.note.empty() ? "" : "; ";
                    comparison.note += std::string("bootstrap: ") + boot.error()->what();
                }
            }

            comparisons.push_back(std::move(comparison));
        }
    }
    return comparisons;
}

Result<BacktestResults> BacktestOrchestrator::run(const ReturnsMatrix& returns) const {
    try {
        auto valid = validate_inputs(returns);
        if (valid.is_error()) {
            ERROR("Backtest aborted: " << valid.error()->to_string());
            return forward_error<BacktestResults>(valid);
        }

        auto planned = plan_periods(returns);
        if (planned.is_error()) {
            return forward_error<BacktestResults>(planned);
        }
        const std::vector<RebalancingPeriod>& periods = planned.value();
        const std::vector<double> risk_free = config_.periodic_risk_free(returns.num_periods());

        std::vector<std::unique_ptr<Allocator>> allocators;
        for (const auto& kind : config_.strategies) {
            allocators.push_back(make_allocator(kind));
        }
        // Allocator constructors retag the thread
        LogComponentScope log_scope("BacktestOrchestrator");

        INFO("Running " << periods.size() << " rebalancing periods over "
                        << returns.num_assets() << " assets and " << returns.num_periods()
                        << " return periods");

        std::vector<PeriodRecord> records(periods.size());
        if (config_.max_threads > 1 && periods.size() > 1) {
            for (size_t batch = 0; batch < periods.size(); batch += config_.max_threads) {
                const size_t batch_end = std::min(batch + config_.max_threads, periods.size());
                std::vector<std::future<PeriodRecord>> futures;
                for (size_t i = batch; i < batch_end; ++i) {
                    futures.push_back(std::async(std::launch::async, [&, i]() {
                        LogComponentScope worker_scope("BacktestOrchestrator");
                        return process_period(periods[i], returns, risk_free, allocators);
                    }));
                }
                for (size_t i = batch; i < batch_end; ++i) {
                    records[i] = futures[i - batch].get();
                }
            }
        } else {
            for (size_t i = 0; i < periods.size(); ++i) {
                records[i] = process_period(periods[i], returns, risk_free, allocators);
            }
        }

        apply_turnover_and_costs(records);

        BacktestResults results;
        results.assets = returns.assets();

        for (const auto& record : records) {
            if (record.state == PeriodState::SKIPPED) {
                results.skipped.push_back({record.period.label, record.skip_reason});
                continue;
            }
            for (const auto& strategy_record : record.strategies) {
                for (const auto& warning : outcome_of(strategy_record.allocation).warnings) {
                    results.degraded.push_back(
                        {record.period.label, strategy_record.strategy, warning});
                }
            }
        }

        const size_t recorded = static_cast<size_t>(
            std::count_if(records.begin(), records.end(), [](const PeriodRecord& r) {
                return r.state == PeriodState::RECORDED;
            }));
        if (recorded == 0) {
            return make_error<BacktestResults>(ErrorCode::INSUFFICIENT_DATA,
                                               "Every rebalancing period was skipped",
                                               "BacktestOrchestrator");
        }

        std::vector<double> consolidated_risk_free;
        std::vector<std::vector<double>> consolidated_returns(config_.strategies.size());
        for (size_t k = 0; k < config_.strategies.size(); ++k) {
            StrategySummary summary;
            summary.strategy = config_.strategies[k];
            double turnover_sum = 0.0;

            for (const auto& record : records) {
                if (record.state != PeriodState::RECORDED)
                    continue;
                const auto& strategy_record = record.strategies[k];
                summary.dates.insert(summary.dates.end(), record.dates.begin(), record.dates.end());
                summary.returns.insert(summary.returns.end(), strategy_record.returns.begin(),
                                       strategy_record.returns.end());
                summary.risk_free.insert(summary.risk_free.end(), record.risk_free.begin(),
                                         record.risk_free.end());
                ++summary.recorded_periods;
                if (strategy_record.degraded())
                    ++summary.degraded_periods;
                turnover_sum += strategy_record.turnover;
                summary.total_transaction_cost += strategy_record.transaction_cost;
            }
            summary.average_turnover = turnover_sum / static_cast<double>(summary.recorded_periods);

            auto metrics = analyzer_.analyze(summary.returns, summary.risk_free);
            if (metrics.is_error()) {
                return forward_error<BacktestResults>(metrics, "BacktestOrchestrator");
            }
            summary.metrics = metrics.value();

            consolidated_returns[k] = summary.returns;
            if (k == 0)
                consolidated_risk_free = summary.risk_free;
            results.summaries.push_back(std::move(summary));
        }

        results.comparisons = compare_strategies(config_.strategies, consolidated_returns,
                                                 consolidated_risk_free, true);
        results.periods = std::move(records);

        INFO("Backtest complete: " << recorded << " periods recorded, " << results.skipped.size()
                                   << " skipped, " << results.degraded.size()
                                   << " degraded allocations");
        return results;
    } catch (const std::exception& e) {
        return make_error<BacktestResults>(ErrorCode::UNKNOWN_ERROR,
                                           std::string("Backtest failed: ") + e.what(),
                                           "BacktestOrchestrator");
    }
}

}  // namespace backtest
}  // namespace alloc_ngin

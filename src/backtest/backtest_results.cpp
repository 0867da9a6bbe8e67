// src/backtest/backtest_results.cpp

#include "alloc_ngin/backtest/backtest_results.hpp"
#include "alloc_ngin/core/time_utils.hpp"

namespace alloc_ngin {
namespace backtest {

namespace {

nlohmann::json dates_to_json(const std::vector<Timestamp>& dates) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& date : dates) {
        j.push_back(core::format_iso_date(date));
    }
    return j;
}

}  // namespace

std::string period_state_to_string(PeriodState state) {
    switch (state) {
        case PeriodState::ESTIMATING:
            return "ESTIMATING";
        case PeriodState::ALLOCATING:
            return "ALLOCATING";
        case PeriodState::APPLYING:
            return "APPLYING";
        case PeriodState::RECORDED:
            return "RECORDED";
        case PeriodState::SKIPPED:
            return "SKIPPED";
        default:
            return "UNKNOWN";
    }
}

std::string comparison_status_to_string(ComparisonStatus status) {
    switch (status) {
        case ComparisonStatus::TESTED:
            return "TESTED";
        case ComparisonStatus::INDETERMINATE:
            return "INDETERMINATE";
        case ComparisonStatus::UNAVAILABLE:
            return "UNAVAILABLE";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json StrategyComparison::to_json() const {
    nlohmann::json j;
    j["strategy_a"] = strategy_to_string(strategy_a);
    j["strategy_b"] = strategy_to_string(strategy_b);
    j["status"] = comparison_status_to_string(status);
    j["jobson_korkie"] = jobson_korkie ? jobson_korkie->to_json() : nlohmann::json(nullptr);
    j["bootstrap"] = bootstrap ? bootstrap->to_json() : nlohmann::json(nullptr);
    if (!note.empty())
        j["note"] = note;
    return j;
}

nlohmann::json PeriodRecord::to_json() const {
    nlohmann::json j;
    j["index"] = period.index;
    j["label"] = period.label;
    j["start"] = core::format_iso_date(period.start);
    j["end"] = core::format_iso_date(period.end);
    j["estimation_periods"] = period.estimation_size();
    j["test_periods"] = period.test_size();
    j["state"] = period_state_to_string(state);
    if (state == PeriodState::SKIPPED) {
        j["skip_reason"] = skip_reason;
        return j;
    }

    j["dates"] = dates_to_json(dates);
    j["risk_free"] = risk_free;
    j["strategies"] = nlohmann::json::array();
    for (const auto& record : strategies) {
        nlohmann::json s;
        s["strategy"] = strategy_to_string(record.strategy);
        s["weights"] = record.weights().to_json();
        s["diagnostics"] = diagnostics_of(record.allocation);
        s["gross_returns"] = record.gross_returns;
        s["returns"] = record.returns;
        s["turnover"] = record.turnover;
        s["transaction_cost"] = record.transaction_cost;
        s["metrics"] = record.metrics.to_json();
        j["strategies"].push_back(s);
    }
    j["comparisons"] = nlohmann::json::array();
    for (const auto& comparison : comparisons) {
        j["comparisons"].push_back(comparison.to_json());
    }
    return j;
}

nlohmann::json StrategySummary::to_json() const {
    nlohmann::json j;
    j["strategy"] = strategy_to_string(strategy);
    j["dates"] = dates_to_json(dates);
    j["returns"] = returns;
    j["risk_free"] = risk_free;
    j["metrics"] = metrics.to_json();
    j["recorded_periods"] = recorded_periods;
    j["degraded_periods"] = degraded_periods;
    j["average_turnover"] = average_turnover;
    j["total_transaction_cost"] = total_transaction_cost;
    return j;
}

const StrategySummary* BacktestResults::summary_for(StrategyKind strategy) const {
    for (const auto& summary : summaries) {
        if (summary.strategy == strategy)
            return &summary;
    }
    return nullptr;
}

nlohmann::json BacktestResults::to_json() const {
    nlohmann::json j;
    j["assets"] = assets;

    j["periods"] = nlohmann::json::array();
    for (const auto& period : periods) {
        j["periods"].push_back(period.to_json());
    }

    j["summaries"] = nlohmann::json::array();
    for (const auto& summary : summaries) {
        j["summaries"].push_back(summary.to_json());
    }

    j["comparisons"] = nlohmann::json::array();
    for (const auto& comparison : comparisons) {
        j["comparisons"].push_back(comparison.to_json());
    }

    j["skipped"] = nlohmann::json::array();
    for (const auto& skip : skipped) {
        j["skipped"].push_back({{"period", skip.period}, {"reason", skip.reason}});
    }

    j["degraded"] = nlohmann::json::array();
    for (const auto& entry : degraded) {
        nlohmann::json d = entry.warning.to_json();
        d["period"] = entry.period;
        d["strategy"] = strategy_to_string(entry.strategy);
        j["degraded"].push_back(d);
    }
    return j;
}

}  // namespace backtest
}  // namespace alloc_ngin

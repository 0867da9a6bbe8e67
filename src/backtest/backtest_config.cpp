// src/backtest/backtest_config.cpp

#include "alloc_ngin/backtest/backtest_config.hpp"
#include <cmath>
#include <set>
#include <stdexcept>
#include "alloc_ngin/core/time_utils.hpp"

namespace alloc_ngin {
namespace backtest {

Result<void> BacktestConfig::validate() const {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "BacktestConfig");
    };

    if (periods_per_year <= 0) {
        return invalid("periods_per_year must be positive");
    }
    if (!std::isfinite(risk_free_rate)) {
        return invalid("risk_free_rate must be finite");
    }
    for (double rate : risk_free_series) {
        if (!std::isfinite(rate)) {
            return invalid("risk_free_series contains a non-finite value");
        }
    }
    if (weight_bounds.min_weight < 0.0 || weight_bounds.max_weight > 1.0 ||
        weight_bounds.min_weight > weight_bounds.max_weight) {
        return invalid("weight_bounds must satisfy 0 <= min_weight <= max_weight <= 1");
    }
    if (rebalancing_dates.size() < 2) {
        return invalid("At least two rebalancing dates are required");
    }
    auto dates = parsed_rebalancing_dates();
    if (dates.is_error()) {
        return forward_error<void>(dates);
    }
    const auto& parsed = dates.value();
    for (size_t i = 1; i < parsed.size(); ++i) {
        if (parsed[i] <= parsed[i - 1]) {
            return invalid("Rebalancing dates must be strictly ascending and unique: " +
                           rebalancing_dates[i]);
        }
    }
    if (min_estimation_periods < 2) {
        return invalid("min_estimation_periods must be at least 2");
    }
    if (estimation_window_months < min_estimation_periods) {
        return invalid("estimation_window_months must be at least min_estimation_periods");
    }
    if (min_test_periods < 1) {
        return invalid("min_test_periods must be at least 1");
    }
    if (!(significance_level > 0.0 && significance_level < 1.0)) {
        return invalid("significance_level must lie in (0, 1)");
    }
    if (transaction_cost_bps < 0.0 || !std::isfinite(transaction_cost_bps)) {
        return invalid("transaction_cost_bps must be non-negative");
    }
    if (max_threads == 0) {
        return invalid("max_threads must be at least 1");
    }
    if (strategies.empty()) {
        return invalid("At least one strategy is required");
    }
    std::set<StrategyKind> unique(strategies.begin(), strategies.end());
    if (unique.size() != strategies.size()) {
        return invalid("Strategies must not repeat");
    }
    if (mean_variance.max_iterations <= 0 || mean_variance.tolerance <= 0.0) {
        return invalid("mean_variance requires positive tolerance and max_iterations");
    }
    if (risk_parity.max_iterations <= 0 || risk_parity.tolerance <= 0.0 ||
        risk_parity.damping <= 0.0 || risk_parity.damping > 1.0) {
        return invalid("risk_parity requires positive tolerance, max_iterations and 0 < damping <= 1");
    }

    return Result<void>();
}

Result<std::vector<Timestamp>> BacktestConfig::parsed_rebalancing_dates() const {
    std::vector<Timestamp> parsed;
    parsed.reserve(rebalancing_dates.size());
    for (const auto& text : rebalancing_dates) {
        auto date = core::parse_iso_date(text);
        if (!date) {
            return make_error<std::vector<Timestamp>>(
                ErrorCode::INVALID_ARGUMENT, "Invalid rebalancing date '" + text + "'",
                "BacktestConfig");
        }
        parsed.push_back(*date);
    }
    return parsed;
}

std::vector<double> BacktestConfig::periodic_risk_free(size_t num_rows) const {
    if (!risk_free_series.empty()) {
        return risk_free_series;
    }
    return std::vector<double>(num_rows, risk_free_rate / static_cast<double>(periods_per_year));
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["periods_per_year"] = periods_per_year;
    j["risk_free_rate"] = risk_free_rate;
    j["risk_free_series"] = risk_free_series;
    j["rebalancing_dates"] = rebalancing_dates;
    j["weight_bounds"] = weight_bounds.to_json();
    j["estimation_window_months"] = estimation_window_months;
    j["min_estimation_periods"] = min_estimation_periods;
    j["min_test_periods"] = min_test_periods;
    j["mean_variance"] = mean_variance.to_json();
    j["risk_parity"] = risk_parity.to_json();
    j["significance_level"] = significance_level;
    j["bootstrap_samples"] = bootstrap_samples;
    j["bootstrap_seed"] = bootstrap_seed;
    j["transaction_cost_bps"] = transaction_cost_bps;
    j["max_threads"] = max_threads;

    nlohmann::json strategy_names = nlohmann::json::array();
    for (const auto& kind : strategies) {
        strategy_names.push_back(strategy_to_string(kind));
    }
    j["strategies"] = strategy_names;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("periods_per_year"))
        periods_per_year = j.at("periods_per_year").get<int>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("risk_free_series"))
        risk_free_series = j.at("risk_free_series").get<std::vector<double>>();
    if (j.contains("rebalancing_dates"))
        rebalancing_dates = j.at("rebalancing_dates").get<std::vector<std::string>>();
    if (j.contains("weight_bounds"))
        weight_bounds.from_json(j.at("weight_bounds"));
    if (j.contains("estimation_window_months"))
        estimation_window_months = j.at("estimation_window_months").get<size_t>();
    if (j.contains("min_estimation_periods"))
        min_estimation_periods = j.at("min_estimation_periods").get<size_t>();
    if (j.contains("min_test_periods"))
        min_test_periods = j.at("min_test_periods").get<size_t>();
    if (j.contains("mean_variance"))
        mean_variance.from_json(j.at("mean_variance"));
    if (j.contains("risk_parity"))
        risk_parity.from_json(j.at("risk_parity"));
    if (j.contains("significance_level"))
        significance_level = j.at("significance_level").get<double>();
    if (j.contains("bootstrap_samples"))
        bootstrap_samples = j.at("bootstrap_samples").get<size_t>();
    if (j.contains("bootstrap_seed"))
        bootstrap_seed = j.at("bootstrap_seed").get<uint64_t>();
    if (j.contains("transaction_cost_bps"))
        transaction_cost_bps = j.at("transaction_cost_bps").get<double>();
    if (j.contains("max_threads"))
        max_threads = j.at("max_threads").get<size_t>();
    if (j.contains("strategies")) {
        strategies.clear();
        for (const auto& name : j.at("strategies")) {
            auto kind = strategy_from_string(name.get<std::string>());
            if (!kind) {
                throw std::invalid_argument("Unknown strategy: " + name.get<std::string>());
            }
            strategies.push_back(*kind);
        }
    }
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace backtest
}  // namespace alloc_ngin

// src/backtest/performance_analyzer.cpp

#include "alloc_ngin/backtest/performance_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace alloc_ngin {
namespace backtest {

namespace {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty())
        return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double calculate_sample_std(const std::vector<double>& values) {
    if (values.size() < 2)
        return 0.0;
    const double mean = calculate_mean(values);
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

nlohmann::json optional_to_json(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<double> optional_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
        return std::nullopt;
    return j.at(key).get<double>();
}

}  // namespace

nlohmann::json PerformanceMetrics::to_json() const {
    nlohmann::json j;
    j["num_periods"] = num_periods;
    j["total_return"] = total_return;
    j["annual_return"] = annual_return;
    j["annual_volatility"] = annual_volatility;
    j["annual_risk_free"] = annual_risk_free;
    j["sharpe_ratio"] = optional_to_json(sharpe_ratio);
    j["sortino_ratio"] = optional_to_json(sortino_ratio);
    j["downside_deviation"] = downside_deviation;
    j["max_drawdown"] = max_drawdown;
    j["var_95"] = var_95;
    j["cvar_95"] = cvar_95;
    return j;
}

PerformanceMetrics PerformanceMetrics::from_json(const nlohmann::json& j) {
    PerformanceMetrics metrics;
    if (j.contains("num_periods"))
        metrics.num_periods = j.at("num_periods").get<size_t>();
    if (j.contains("total_return"))
        metrics.total_return = j.at("total_return").get<double>();
    if (j.contains("annual_return"))
        metrics.annual_return = j.at("annual_return").get<double>();
    if (j.contains("annual_volatility"))
        metrics.annual_volatility = j.at("annual_volatility").get<double>();
    if (j.contains("annual_risk_free"))
        metrics.annual_risk_free = j.at("annual_risk_free").get<double>();
    metrics.sharpe_ratio = optional_from_json(j, "sharpe_ratio");
    metrics.sortino_ratio = optional_from_json(j, "sortino_ratio");
    if (j.contains("downside_deviation"))
        metrics.downside_deviation = j.at("downside_deviation").get<double>();
    if (j.contains("max_drawdown"))
        metrics.max_drawdown = j.at("max_drawdown").get<double>();
    if (j.contains("var_95"))
        metrics.var_95 = j.at("var_95").get<double>();
    if (j.contains("cvar_95"))
        metrics.cvar_95 = j.at("cvar_95").get<double>();
    return metrics;
}

PerformanceAnalyzer::PerformanceAnalyzer(int periods_per_year)
    : periods_per_year_(periods_per_year) {}

Result<PerformanceMetrics> PerformanceAnalyzer::analyze(const std::vector<double>& returns,
                                                        const std::vector<double>& risk_free) const {
    if (returns.empty()) {
        return make_error<PerformanceMetrics>(ErrorCode::INSUFFICIENT_DATA,
                                              "Cannot analyze an empty return series",
                                              "PerformanceAnalyzer");
    }
    if (returns.size() != risk_free.size()) {
        return make_error<PerformanceMetrics>(
            ErrorCode::INVALID_ARGUMENT,
            "Return series has " + std::to_string(returns.size()) +
                " periods but risk-free series has " + std::to_string(risk_free.size()),
            "PerformanceAnalyzer");
    }
    if (periods_per_year_ <= 0) {
        return make_error<PerformanceMetrics>(ErrorCode::INVALID_ARGUMENT,
                                              "periods_per_year must be positive",
                                              "PerformanceAnalyzer");
    }

    const double ppy = static_cast<double>(periods_per_year_);
    PerformanceMetrics metrics;
    metrics.num_periods = returns.size();

    double growth = 1.0;
    for (double r : returns) {
        growth *= 1.0 + r;
    }
    metrics.total_return = growth - 1.0;

    metrics.annual_return = calculate_annual_return(returns);
    metrics.annual_volatility = calculate_annual_volatility(returns);
    metrics.annual_risk_free = calculate_mean(risk_free) * ppy;

    if (metrics.annual_volatility > 0.0) {
        metrics.sharpe_ratio =
            (metrics.annual_return - metrics.annual_risk_free) / metrics.annual_volatility;
    }

    std::vector<double> excess(returns.size());
    for (size_t i = 0; i < returns.size(); ++i) {
        excess[i] = returns[i] - risk_free[i];
    }
    metrics.downside_deviation = calculate_downside_deviation(excess);
    if (metrics.downside_deviation > 0.0) {
        metrics.sortino_ratio = calculate_mean(excess) * ppy / metrics.downside_deviation;
    }

    metrics.max_drawdown = calculate_max_drawdown(returns);
    metrics.var_95 = calculate_var_95(returns);
    metrics.cvar_95 = calculate_cvar_95(returns);

    return metrics;
}

double PerformanceAnalyzer::calculate_annual_return(const std::vector<double>& returns) const {
    return calculate_mean(returns) * static_cast<double>(periods_per_year_);
}

double PerformanceAnalyzer::calculate_annual_volatility(const std::vector<double>& returns) const {
    return calculate_sample_std(returns) * std::sqrt(static_cast<double>(periods_per_year_));
}

double PerformanceAnalyzer::calculate_downside_deviation(
    const std::vector<double>& excess_returns) const {
    double sq_sum = 0.0;
    size_t count = 0;
    for (double r : excess_returns) {
        if (r < 0.0) {
            sq_sum += r * r;
            ++count;
        }
    }
    if (count == 0)
        return 0.0;
    return std::sqrt(sq_sum / static_cast<double>(count)) *
           std::sqrt(static_cast<double>(periods_per_year_));
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<double>& returns) const {
    double value = 1.0;
    double peak = 1.0;
    double max_drawdown = 0.0;
    for (double r : returns) {
        value *= 1.0 + r;
        peak = std::max(peak, value);
        max_drawdown = std::min(max_drawdown, value / peak - 1.0);
    }
    return max_drawdown;
}

double PerformanceAnalyzer::calculate_var_95(const std::vector<double>& returns) const {
    if (returns.empty())
        return 0.0;

    std::vector<double> sorted_returns = returns;
    std::sort(sorted_returns.begin(), sorted_returns.end());

    size_t var_index = static_cast<size_t>(static_cast<double>(returns.size()) * 0.05);
    if (var_index >= sorted_returns.size()) {
        var_index = sorted_returns.size() - 1;
    }
    return -sorted_returns[var_index];
}

double PerformanceAnalyzer::calculate_cvar_95(const std::vector<double>& returns) const {
    if (returns.empty())
        return 0.0;

    std::vector<double> sorted_returns = returns;
    std::sort(sorted_returns.begin(), sorted_returns.end());

    size_t tail = static_cast<size_t>(static_cast<double>(returns.size()) * 0.05);
    if (tail == 0) {
        tail = 1;  // Need at least one value
    }
    const double tail_sum = std::accumulate(sorted_returns.begin(),
                                            sorted_returns.begin() + static_cast<std::ptrdiff_t>(tail), 0.0);
    return -tail_sum / static_cast<double>(tail);
}

}  // namespace backtest
}  // namespace alloc_ngin

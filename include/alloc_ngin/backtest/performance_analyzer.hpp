// include/alloc_ngin/backtest/performance_analyzer.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "alloc_ngin/core/error.hpp"

namespace alloc_ngin {
namespace backtest {

/**
 * @brief Ex-post performance of one realized return series
 */
struct PerformanceMetrics {
    size_t num_periods{0};
    double total_return{0.0};           // Compounded over the series
    double annual_return{0.0};          // Arithmetic mean x periods per year
    double annual_volatility{0.0};      // Sample std x sqrt(periods per year)
    double annual_risk_free{0.0};       // Mean periodic rate x periods per year
    std::optional<double> sharpe_ratio;   // Empty when volatility is zero
    std::optional<double> sortino_ratio;  // Empty when there is no downside
    double downside_deviation{0.0};     // Annualized
    double max_drawdown{0.0};           // Non-positive, relative to running peak
    double var_95{0.0};                 // Historical, reported as a positive loss
    double cvar_95{0.0};

    nlohmann::json to_json() const;
    static PerformanceMetrics from_json(const nlohmann::json& j);
};

/**
 * @brief Computes performance metrics from periodic returns
 */
class PerformanceAnalyzer {
public:
    explicit PerformanceAnalyzer(int periods_per_year = 12);

    /**
     * @brief Full metric set for a realized series
     * @param returns Periodic portfolio returns
     * @param risk_free Periodic risk-free rates aligned with returns
     * @return INVALID_ARGUMENT when the series are empty or misaligned
     */
    Result<PerformanceMetrics> analyze(const std::vector<double>& returns,
                                       const std::vector<double>& risk_free) const;

    double calculate_annual_return(const std::vector<double>& returns) const;
    double calculate_annual_volatility(const std::vector<double>& returns) const;

    /**
     * @brief sqrt(sum of squared negative excess returns / count of them), annualized
     * @return 0 when no excess return is negative
     */
    double calculate_downside_deviation(const std::vector<double>& excess_returns) const;

    /**
     * @brief Largest peak-to-trough decline of the compounded value path
     * The path starts at 1.0, so a loss in the first period counts.
     */
    double calculate_max_drawdown(const std::vector<double>& returns) const;

    double calculate_var_95(const std::vector<double>& returns) const;
    double calculate_cvar_95(const std::vector<double>& returns) const;

    int periods_per_year() const {
        return periods_per_year_;
    }

private:
    int periods_per_year_;
};

}  // namespace backtest
}  // namespace alloc_ngin

// include/alloc_ngin/statistics/significance_tester.hpp

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "alloc_ngin/core/error.hpp"

namespace alloc_ngin {
namespace statistics {

struct SignificanceConfig {
    double significance_level{0.05};
    int periods_per_year{12};      // Used only to annualize the reported Sharpe ratios
    size_t bootstrap_samples{1000};
    uint64_t bootstrap_seed{42};
};

/**
 * @brief Jobson-Korkie test of H0: SR_a == SR_b (Memmel correction)
 *
 * statistic and p_value are computed on per-period Sharpe ratios.
 */
struct SignificanceResult {
    std::string strategy_a;
    std::string strategy_b;
    size_t num_observations{0};
    double sharpe_a{0.0};     // Annualized
    double sharpe_b{0.0};     // Annualized
    double difference{0.0};   // sharpe_a - sharpe_b, annualized
    double correlation{0.0};  // Of the two excess return series
    double statistic{0.0};
    double p_value{1.0};
    double significance_level{0.05};
    bool significant{false};
    std::string interpretation;

    nlohmann::json to_json() const;
    static SignificanceResult from_json(const nlohmann::json& j);
};

/**
 * @brief Paired bootstrap of the annualized Sharpe difference
 */
struct BootstrapResult {
    std::string strategy_a;
    std::string strategy_b;
    double observed_difference{0.0};
    double bootstrap_std{0.0};
    double ci_lower{0.0};  // 2.5th percentile
    double ci_upper{0.0};  // 97.5th percentile
    double p_value{1.0};
    bool significant{false};
    size_t samples{0};     // Resamples with a defined Sharpe difference

    nlohmann::json to_json() const;
};

/**
 * @brief Pairwise tests for equality of Sharpe ratios
 */
class SignificanceTester {
public:
    explicit SignificanceTester(SignificanceConfig config = SignificanceConfig{});

    /**
     * @brief Jobson-Korkie test with Memmel's corrected variance
     *
     *   V = (1/T) [2 (1 - rho) + 0.5 (SR_a^2 + SR_b^2 - 2 SR_a SR_b rho^2)]
     *   z = (SR_a - SR_b) / sqrt(V)
     *
     * Swapping a and b negates z and leaves the p-value unchanged.
     *
     * @param returns_a Periodic returns of the first strategy
     * @param returns_b Periodic returns of the second strategy, same dates
     * @param risk_free Periodic risk-free rates, same dates
     * @return INSUFFICIENT_DATA for misaligned or short series,
     *         INDETERMINATE_SIGNIFICANCE when a Sharpe ratio is undefined or
     *         V <= 0 with a non-zero difference
     */
    Result<SignificanceResult> jobson_korkie(const std::string& name_a,
                                             const std::vector<double>& returns_a,
                                             const std::string& name_b,
                                             const std::vector<double>& returns_b,
                                             const std::vector<double>& risk_free) const;

    /**
     * @brief Bootstrap test resampling periods with replacement
     * Deterministic for a fixed seed.
     */
    Result<BootstrapResult> bootstrap(const std::string& name_a,
                                      const std::vector<double>& returns_a,
                                      const std::string& name_b,
                                      const std::vector<double>& returns_b,
                                      const std::vector<double>& risk_free) const;

    const SignificanceConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_inputs(const std::vector<double>& returns_a,
                                 const std::vector<double>& returns_b,
                                 const std::vector<double>& risk_free) const;

    SignificanceConfig config_;
};

}  // namespace statistics
}  // namespace alloc_ngin

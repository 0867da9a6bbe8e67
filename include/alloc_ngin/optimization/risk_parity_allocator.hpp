// include/alloc_ngin/optimization/risk_parity_allocator.hpp

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include "alloc_ngin/core/config_base.hpp"
#include "alloc_ngin/optimization/allocator.hpp"

namespace alloc_ngin {

/**
 * @brief Configuration for equal risk contribution weights
 */
struct RiskParityConfig : public ConfigBase {
    double tolerance{1e-8};         // Max relative deviation of RC_i from sigma_p / n
    int max_iterations{100};
    double damping{0.3};            // Exponent of the multiplicative update
    double volatility_floor{1e-12};

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["tolerance"] = tolerance;
        j["max_iterations"] = max_iterations;
        j["damping"] = damping;
        j["volatility_floor"] = volatility_floor;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("tolerance"))
            tolerance = j.at("tolerance").get<double>();
        if (j.contains("max_iterations"))
            max_iterations = j.at("max_iterations").get<int>();
        if (j.contains("damping"))
            damping = j.at("damping").get<double>();
        if (j.contains("volatility_floor"))
            volatility_floor = j.at("volatility_floor").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

protected:
    std::string config_name() const override {
        return "RiskParityConfig";
    }
};

/**
 * @brief Risk contribution RC_i = w_i (Sigma w)_i / sigma_p for each asset
 * @return Zero vector when the portfolio volatility is zero
 */
Eigen::VectorXd risk_contributions(const Eigen::VectorXd& weights,
                                   const Eigen::MatrixXd& covariance);

/**
 * @brief Share of total risk carried by each asset, RC_i / sigma_p
 */
Eigen::VectorXd risk_contribution_shares(const Eigen::VectorXd& weights,
                                         const Eigen::MatrixXd& covariance);

/**
 * @brief Summary statistics of the risk contributions of a weight vector
 */
RiskContributionStats risk_contribution_stats(const Eigen::VectorXd& weights,
                                              const Eigen::MatrixXd& covariance);

/**
 * @brief Equal risk contribution allocator
 *
 * Starts from inverse-volatility weights and applies the damped update
 *   w_i <- w_i * (target / RC_i)^damping, then renormalizes,
 * with target = sigma_p / n. The deviation is checked on the current
 * iterate before each update, so a converged iterate is returned as is.
 * Box bounds are applied after the iteration; the resulting dispersion
 * of risk contributions is reported in the diagnostics.
 */
class RiskParityAllocator : public Allocator {
public:
    RiskParityAllocator(RiskParityConfig config, WeightBounds bounds);

    StrategyKind kind() const override {
        return StrategyKind::RISK_PARITY;
    }

    bool requires_estimation() const override {
        return true;
    }

    Result<AllocationResult> allocate(const AllocationRequest& request) const override;

    const RiskParityConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_inputs(const AllocationRequest& request) const;

    RiskParityConfig config_;
    WeightBounds bounds_;
};

}  // namespace alloc_ngin

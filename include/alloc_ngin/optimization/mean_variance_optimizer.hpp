// include/alloc_ngin/optimization/mean_variance_optimizer.hpp

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include "alloc_ngin/core/config_base.hpp"
#include "alloc_ngin/optimization/allocator.hpp"
#include "alloc_ngin/optimization/sqp_solver.hpp"

namespace alloc_ngin {

/**
 * @brief Configuration for maximum Sharpe optimization
 */
struct MeanVarianceConfig : public ConfigBase {
    double tolerance{1e-10};               // SQP step tolerance
    int max_iterations{1000};              // SQP iteration cap
    double max_seconds{10.0};              // Wall-clock cap per solve, <= 0 disables
    double volatility_floor{1e-12};        // Below this the Sharpe ratio is undefined
    double zero_volatility_penalty{1e6};   // Objective value used below the floor

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["tolerance"] = tolerance;
        j["max_iterations"] = max_iterations;
        j["max_seconds"] = max_seconds;
        j["volatility_floor"] = volatility_floor;
        j["zero_volatility_penalty"] = zero_volatility_penalty;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("tolerance"))
            tolerance = j.at("tolerance").get<double>();
        if (j.contains("max_iterations"))
            max_iterations = j.at("max_iterations").get<int>();
        if (j.contains("max_seconds"))
            max_seconds = j.at("max_seconds").get<double>();
        if (j.contains("volatility_floor"))
            volatility_floor = j.at("volatility_floor").get<double>();
        if (j.contains("zero_volatility_penalty"))
            zero_volatility_penalty = j.at("zero_volatility_penalty").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }

protected:
    std::string config_name() const override {
        return "MeanVarianceConfig";
    }
};

/**
 * @brief Long-only maximum Sharpe ratio allocator
 *
 * Solves max (mu'w - rf) / sqrt(w' Sigma w) over the capped simplex with
 * SQP, starting from equal weights. When the solver fails the allocator
 * degrades to the bounded analytical tangency portfolio, and from there
 * to equal weights. Every fallback is recorded as a warning.
 */
class MeanVarianceOptimizer : public Allocator {
public:
    MeanVarianceOptimizer(MeanVarianceConfig config, WeightBounds bounds);

    StrategyKind kind() const override {
        return StrategyKind::MEAN_VARIANCE;
    }

    bool requires_estimation() const override {
        return true;
    }

    Result<AllocationResult> allocate(const AllocationRequest& request) const override;

    /**
     * @brief Run the SQP solve alone
     * @return OPTIMIZATION_DID_NOT_CONVERGE if the iteration or time cap was
     *         hit, DEGENERATE_COVARIANCE if the solution has no volatility
     */
    Result<SqpSolution> maximize_sharpe(const Eigen::VectorXd& expected_returns,
                                        const Eigen::MatrixXd& covariance,
                                        double risk_free_rate) const;

    /**
     * @brief Closed-form tangency portfolio Sigma^-1 (mu - rf) / 1'Sigma^-1 (mu - rf), then bounded
     * @return SINGULAR_COVARIANCE or NO_TANGENCY_PORTFOLIO when it does not exist
     */
    Result<Eigen::VectorXd> tangency_portfolio(const Eigen::VectorXd& expected_returns,
                                               const Eigen::MatrixXd& covariance,
                                               double risk_free_rate) const;

    const MeanVarianceConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_inputs(const AllocationRequest& request) const;

    double negative_sharpe(const Eigen::VectorXd& weights, const Eigen::VectorXd& expected_returns,
                           const Eigen::MatrixXd& covariance, double risk_free_rate,
                           Eigen::VectorXd& gradient) const;

    MeanVarianceConfig config_;
    WeightBounds bounds_;
};

}  // namespace alloc_ngin

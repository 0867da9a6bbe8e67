// src/optimization/allocator.cpp

#include "alloc_ngin/optimization/allocator.hpp"

namespace alloc_ngin {

namespace {

nlohmann::json stats_to_json(const RiskContributionStats& stats) {
    nlohmann::json j;
    j["portfolio_volatility"] = stats.portfolio_volatility;
    j["max_relative_deviation"] = stats.max_relative_deviation;
    j["mean_relative_deviation"] = stats.mean_relative_deviation;
    j["std_dev"] = stats.std_dev;
    j["max_min_ratio"] = stats.max_min_ratio;
    return j;
}

}  // namespace

const AllocationOutcome& outcome_of(const AllocationResult& result) {
    return std::visit([](const auto& r) -> const AllocationOutcome& { return r; }, result);
}

StrategyKind strategy_of(const AllocationResult& result) {
    if (std::holds_alternative<MeanVarianceResult>(result))
        return StrategyKind::MEAN_VARIANCE;
    if (std::holds_alternative<RiskParityResult>(result))
        return StrategyKind::RISK_PARITY;
    return StrategyKind::EQUAL_WEIGHT;
}

std::string mean_variance_method_to_string(MeanVarianceMethod method) {
    switch (method) {
        case MeanVarianceMethod::SQP:
            return "SQP";
        case MeanVarianceMethod::ANALYTICAL_TANGENCY:
            return "ANALYTICAL_TANGENCY";
        case MeanVarianceMethod::EQUAL_WEIGHT:
            return "EQUAL_WEIGHT";
        default:
            return "UNKNOWN";
    }
}

std::string risk_parity_method_to_string(RiskParityMethod method) {
    switch (method) {
        case RiskParityMethod::ERC:
            return "ERC";
        case RiskParityMethod::INVERSE_VOLATILITY:
            return "INVERSE_VOLATILITY";
        case RiskParityMethod::EQUAL_WEIGHT:
            return "EQUAL_WEIGHT";
        default:
            return "UNKNOWN";
    }
}

nlohmann::json diagnostics_of(const AllocationResult& result) {
    nlohmann::json j;
    j["strategy"] = strategy_to_string(strategy_of(result));

    if (const auto* mv = std::get_if<MeanVarianceResult>(&result)) {
        j["method"] = mean_variance_method_to_string(mv->method);
        j["converged"] = mv->converged;
        j["iterations"] = mv->iterations;
        j["expected_return"] = mv->expected_return;
        j["expected_volatility"] = mv->expected_volatility;
        j["expected_sharpe"] = mv->expected_sharpe;
        j["risk_free_rate"] = mv->risk_free_rate;
    } else if (const auto* rp = std::get_if<RiskParityResult>(&result)) {
        j["method"] = risk_parity_method_to_string(rp->method);
        j["converged"] = rp->converged;
        j["iterations"] = rp->iterations;
        j["pre_clip"] = stats_to_json(rp->pre_clip);
        j["post_clip"] = stats_to_json(rp->post_clip);
        j["bounds_binding"] = rp->bounds_binding;
    }

    const auto& outcome = outcome_of(result);
    j["degraded"] = outcome.degraded();
    j["warnings"] = nlohmann::json::array();
    for (const auto& warning : outcome.warnings) {
        j["warnings"].push_back(warning.to_json());
    }
    return j;
}

}  // namespace alloc_ngin

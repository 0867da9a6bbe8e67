// include/alloc_ngin/optimization/allocator.hpp

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "alloc_ngin/core/error.hpp"
#include "alloc_ngin/core/types.hpp"
#include "alloc_ngin/estimation/parameter_estimator.hpp"
#include "alloc_ngin/optimization/weight_constraints.hpp"

namespace alloc_ngin {

/**
 * @brief Reasons an allocation was produced by something other than the primary rule
 */
enum class AllocationWarningKind {
    OPTIMIZER_NOT_CONVERGED,      // SQP ran out of iterations or time
    ANALYTICAL_FALLBACK,          // Tangency portfolio used instead of SQP
    EQUAL_WEIGHT_FALLBACK,        // Equal weights used as last resort
    ERC_NOT_CONVERGED,            // Risk parity iteration cap reached
    INVERSE_VOLATILITY_FALLBACK,  // Risk parity degenerated to 1/sigma weights
    ALLOCATOR_FAILED              // Allocator returned an error for the period
};

inline std::string warning_kind_to_string(AllocationWarningKind kind) {
    switch (kind) {
        case AllocationWarningKind::OPTIMIZER_NOT_CONVERGED:
            return "OPTIMIZER_NOT_CONVERGED";
        case AllocationWarningKind::ANALYTICAL_FALLBACK:
            return "ANALYTICAL_FALLBACK";
        case AllocationWarningKind::EQUAL_WEIGHT_FALLBACK:
            return "EQUAL_WEIGHT_FALLBACK";
        case AllocationWarningKind::ERC_NOT_CONVERGED:
            return "ERC_NOT_CONVERGED";
        case AllocationWarningKind::INVERSE_VOLATILITY_FALLBACK:
            return "INVERSE_VOLATILITY_FALLBACK";
        case AllocationWarningKind::ALLOCATOR_FAILED:
            return "ALLOCATOR_FAILED";
        default:
            return "UNKNOWN";
    }
}

struct AllocationWarning {
    AllocationWarningKind kind{AllocationWarningKind::ALLOCATOR_FAILED};
    ErrorCode cause{ErrorCode::NONE};
    std::string message;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["kind"] = warning_kind_to_string(kind);
        j["cause"] = error_code_to_string(cause);
        j["message"] = message;
        return j;
    }
};

/**
 * @brief Fields common to every allocation outcome
 * Any warning marks the allocation as degraded
 */
struct AllocationOutcome {
    PortfolioWeights weights;
    std::vector<AllocationWarning> warnings;

    bool degraded() const {
        return !warnings.empty();
    }
};

struct EqualWeightResult : AllocationOutcome {};

enum class MeanVarianceMethod { SQP, ANALYTICAL_TANGENCY, EQUAL_WEIGHT };

struct MeanVarianceResult : AllocationOutcome {
    MeanVarianceMethod method{MeanVarianceMethod::SQP};
    bool converged{false};
    int iterations{0};
    double expected_return{0.0};      // Ex-ante, annualized
    double expected_volatility{0.0};  // Ex-ante, annualized
    double expected_sharpe{0.0};
    double risk_free_rate{0.0};
};

enum class RiskParityMethod { ERC, INVERSE_VOLATILITY, EQUAL_WEIGHT };

/**
 * @brief Dispersion of risk contributions RC_i = w_i (Sigma w)_i / sigma_p
 */
struct RiskContributionStats {
    double portfolio_volatility{0.0};
    double max_relative_deviation{0.0};  // max_i |RC_i - sigma_p/n| / (sigma_p/n)
    double mean_relative_deviation{0.0};
    double std_dev{0.0};                 // Standard deviation of RC_i
    double max_min_ratio{0.0};
};

struct RiskParityResult : AllocationOutcome {
    RiskParityMethod method{RiskParityMethod::ERC};
    bool converged{false};
    int iterations{0};
    RiskContributionStats pre_clip;   // Final iterate before bounds are applied
    RiskContributionStats post_clip;  // Weights actually returned
    bool bounds_binding{false};
};

/**
 * @brief Outcome of one allocator call, tagged by strategy
 */
using AllocationResult = std::variant<EqualWeightResult, MeanVarianceResult, RiskParityResult>;

const AllocationOutcome& outcome_of(const AllocationResult& result);
StrategyKind strategy_of(const AllocationResult& result);

/**
 * @brief Strategy-specific diagnostics as JSON
 */
nlohmann::json diagnostics_of(const AllocationResult& result);

std::string mean_variance_method_to_string(MeanVarianceMethod method);
std::string risk_parity_method_to_string(RiskParityMethod method);

/**
 * @brief Inputs for one allocation
 * Parameters are absent for rules that need no estimation
 */
struct AllocationRequest {
    std::vector<AssetId> assets;
    std::optional<EstimatedParameters> parameters;
    double risk_free_rate{0.0};  // Annualized
};

/**
 * @brief Interface for weight allocation rules
 */
class Allocator {
public:
    virtual ~Allocator() = default;

    virtual StrategyKind kind() const = 0;

    /**
     * @brief Whether allocate() needs estimated parameters
     */
    virtual bool requires_estimation() const = 0;

    /**
     * @brief Compute weights for one rebalancing period
     *
     * Numerical trouble is absorbed by the rule's own fallback chain and
     * reported as warnings in the result. Errors are returned only for
     * inputs no fallback can handle.
     */
    virtual Result<AllocationResult> allocate(const AllocationRequest& request) const = 0;
};

}  // namespace alloc_ngin

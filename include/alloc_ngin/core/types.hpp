// include/alloc_ngin/core/types.hpp

#pragma once

#include <Eigen/Dense>
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "alloc_ngin/core/error.hpp"

namespace alloc_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Period dates are stored as midnight UTC
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Asset identifier (ticker); the universe is the ordered column set
 */
using AssetId = std::string;

/**
 * @brief Allocation rules supported by the engine
 */
enum class StrategyKind {
    EQUAL_WEIGHT,
    MEAN_VARIANCE,
    RISK_PARITY
};

inline std::string strategy_to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::EQUAL_WEIGHT:
            return "EQUAL_WEIGHT";
        case StrategyKind::MEAN_VARIANCE:
            return "MEAN_VARIANCE";
        case StrategyKind::RISK_PARITY:
            return "RISK_PARITY";
        default:
            return "UNKNOWN";
    }
}

inline std::optional<StrategyKind> strategy_from_string(const std::string& name) {
    if (name == "EQUAL_WEIGHT")
        return StrategyKind::EQUAL_WEIGHT;
    if (name == "MEAN_VARIANCE")
        return StrategyKind::MEAN_VARIANCE;
    if (name == "RISK_PARITY")
        return StrategyKind::RISK_PARITY;
    return std::nullopt;
}

/**
 * @brief Long-only weight vector over an ordered asset universe
 *
 * Produced once per (strategy, rebalancing period) and never mutated
 * afterwards; all accessors are const.
 */
class PortfolioWeights {
public:
    PortfolioWeights() = default;

    PortfolioWeights(std::vector<AssetId> assets, Eigen::VectorXd values)
        : assets_(std::move(assets)), values_(std::move(values)) {}

    const std::vector<AssetId>& assets() const {
        return assets_;
    }

    const Eigen::VectorXd& values() const {
        return values_;
    }

    size_t size() const {
        return assets_.size();
    }

    bool empty() const {
        return assets_.empty();
    }

    double operator[](size_t i) const {
        return values_(static_cast<Eigen::Index>(i));
    }

    /**
     * @brief Weight of a named asset
     * @return The weight, or std::nullopt if the asset is not in the universe
     */
    std::optional<double> weight_of(const AssetId& asset) const;

    double sum() const {
        return values_.sum();
    }

    nlohmann::json to_json() const;

    /**
     * @brief Rebuild weights from their JSON form
     * @return Error if the asset and weight arrays are missing or differ in length
     */
    static Result<PortfolioWeights> from_json(const nlohmann::json& j);

private:
    std::vector<AssetId> assets_;
    Eigen::VectorXd values_;
};

}  // namespace alloc_ngin

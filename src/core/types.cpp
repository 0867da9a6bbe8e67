// src/core/types.cpp

#include "alloc_ngin/core/types.hpp"

namespace alloc_ngin {

std::optional<double> PortfolioWeights::weight_of(const AssetId& asset) const {
    for (size_t i = 0; i < assets_.size(); ++i) {
        if (assets_[i] == asset) {
            return values_(static_cast<Eigen::Index>(i));
        }
    }
    return std::nullopt;
}

nlohmann::json PortfolioWeights::to_json() const {
    nlohmann::json j;
    j["assets"] = assets_;
    std::vector<double> weights(values_.data(), values_.data() + values_.size());
    j["weights"] = weights;
    return j;
}

Result<PortfolioWeights> PortfolioWeights::from_json(const nlohmann::json& j) {
    try {
        if (!j.contains("assets") || !j.contains("weights")) {
            return make_error<PortfolioWeights>(ErrorCode::INVALID_DATA,
                                                "Weights JSON requires 'assets' and 'weights'",
                                                "PortfolioWeights");
        }
        auto assets = j.at("assets").get<std::vector<AssetId>>();
        auto weights = j.at("weights").get<std::vector<double>>();
        if (assets.size() != weights.size()) {
            return make_error<PortfolioWeights>(
                ErrorCode::INVALID_DATA,
                "Asset count " + std::to_string(assets.size()) + " does not match weight count " +
                    std::to_string(weights.size()),
                "PortfolioWeights");
        }
        Eigen::VectorXd values =
            Eigen::Map<const Eigen::VectorXd>(weights.data(), static_cast<Eigen::Index>(weights.size()));
        return PortfolioWeights(std::move(assets), std::move(values));
    } catch (const nlohmann::json::exception& e) {
        return make_error<PortfolioWeights>(ErrorCode::JSON_PARSE_ERROR,
                                            std::string("Invalid weights JSON: ") + e.what(),
                                            "PortfolioWeights");
    }
}

}  // namespace alloc_ngin

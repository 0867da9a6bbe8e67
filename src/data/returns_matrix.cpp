// src/data/returns_matrix.cpp

#include "alloc_ngin/data/returns_matrix.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include "alloc_ngin/core/time_utils.hpp"

namespace alloc_ngin {

Result<ReturnsMatrix> ReturnsMatrix::create(std::vector<Timestamp> dates,
                                            std::vector<AssetId> assets,
                                            Eigen::MatrixXd values) {
    if (assets.empty()) {
        return make_error<ReturnsMatrix>(ErrorCode::EMPTY_UNIVERSE,
                                         "Returns matrix has no assets", "ReturnsMatrix");
    }

    std::unordered_set<AssetId> seen;
    for (const auto& asset : assets) {
        if (asset.empty()) {
            return make_error<ReturnsMatrix>(ErrorCode::INVALID_DATA, "Empty asset name",
                                             "ReturnsMatrix");
        }
        if (!seen.insert(asset).second) {
            return make_error<ReturnsMatrix>(ErrorCode::INVALID_DATA,
                                             "Duplicate asset name: " + asset, "ReturnsMatrix");
        }
    }

    if (static_cast<size_t>(values.rows()) != dates.size() ||
        static_cast<size_t>(values.cols()) != assets.size()) {
        return make_error<ReturnsMatrix>(
            ErrorCode::INVALID_DATA,
            "Matrix shape " + std::to_string(values.rows()) + "x" + std::to_string(values.cols()) +
                " does not match " + std::to_string(dates.size()) + " dates and " +
                std::to_string(assets.size()) + " assets",
            "ReturnsMatrix");
    }

    for (size_t i = 1; i < dates.size(); ++i) {
        if (dates[i] <= dates[i - 1]) {
            return make_error<ReturnsMatrix>(
                ErrorCode::INVALID_DATA,
                "Dates are not strictly ascending at row " + std::to_string(i) + " (" +
                    core::format_iso_date(dates[i]) + ")",
                "ReturnsMatrix");
        }
    }

    for (Eigen::Index r = 0; r < values.rows(); ++r) {
        for (Eigen::Index c = 0; c < values.cols(); ++c) {
            if (!std::isfinite(values(r, c))) {
                return make_error<ReturnsMatrix>(
                    ErrorCode::INVALID_DATA,
                    "Non-finite return for " + assets[static_cast<size_t>(c)] + " on " +
                        core::format_iso_date(dates[static_cast<size_t>(r)]),
                    "ReturnsMatrix");
            }
        }
    }

    return ReturnsMatrix(std::move(dates), std::move(assets), std::move(values));
}

ReturnsMatrix ReturnsMatrix::slice(size_t begin, size_t end) const {
    end = std::min(end, dates_.size());
    begin = std::min(begin, end);
    const auto rows = static_cast<Eigen::Index>(end - begin);

    std::vector<Timestamp> dates(dates_.begin() + static_cast<std::ptrdiff_t>(begin),
                                 dates_.begin() + static_cast<std::ptrdiff_t>(end));
    Eigen::MatrixXd values = values_.middleRows(static_cast<Eigen::Index>(begin), rows);
    return ReturnsMatrix(std::move(dates), assets_, std::move(values));
}

size_t ReturnsMatrix::lower_bound(const Timestamp& date) const {
    auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
    return static_cast<size_t>(it - dates_.begin());
}

Result<Eigen::VectorXd> ReturnsMatrix::portfolio_returns(const Eigen::VectorXd& weights) const {
    if (static_cast<size_t>(weights.size()) != assets_.size()) {
        return make_error<Eigen::VectorXd>(
            ErrorCode::INVALID_ARGUMENT,
            "Weight vector size " + std::to_string(weights.size()) + " does not match " +
                std::to_string(assets_.size()) + " assets",
            "ReturnsMatrix");
    }
    Eigen::VectorXd returns = values_ * weights;
    return returns;
}

}  // namespace alloc_ngin

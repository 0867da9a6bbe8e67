// include/alloc_ngin/data/returns_matrix.hpp

#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "alloc_ngin/core/error.hpp"
#include "alloc_ngin/core/types.hpp"

namespace alloc_ngin {

/**
 * @brief Periodic simple returns for a fixed asset universe
 *
 * Rows are periods in strictly ascending date order, columns are assets.
 * Every value is finite. Instances are immutable once created; slicing
 * returns an independent copy so estimation windows can never alias the
 * data that follows them.
 */
class ReturnsMatrix {
public:
    ReturnsMatrix() = default;

    /**
     * @brief Validate and build a returns matrix
     * @param dates One date per row, strictly ascending
     * @param assets Column names, unique and non-empty
     * @param values Return matrix of shape (dates.size(), assets.size())
     * @return EMPTY_UNIVERSE when there are no assets, INVALID_DATA for any
     *         shape, ordering or finiteness violation
     */
    static Result<ReturnsMatrix> create(std::vector<Timestamp> dates, std::vector<AssetId> assets,
                                        Eigen::MatrixXd values);

    size_t num_periods() const {
        return dates_.size();
    }

    size_t num_assets() const {
        return assets_.size();
    }

    bool empty() const {
        return dates_.empty();
    }

    const std::vector<Timestamp>& dates() const {
        return dates_;
    }

    const std::vector<AssetId>& assets() const {
        return assets_;
    }

    const Eigen::MatrixXd& values() const {
        return values_;
    }

    /**
     * @brief Copy of rows [begin, end)
     * @note Indices are clamped to the matrix; an inverted range gives an empty slice
     */
    ReturnsMatrix slice(size_t begin, size_t end) const;

    /**
     * @brief Index of the first row whose date is >= date
     */
    size_t lower_bound(const Timestamp& date) const;

    /**
     * @brief Per-period portfolio returns R * w
     * @return Error if the weight vector does not match the asset count
     */
    Result<Eigen::VectorXd> portfolio_returns(const Eigen::VectorXd& weights) const;

private:
    ReturnsMatrix(std::vector<Timestamp> dates, std::vector<AssetId> assets,
                  Eigen::MatrixXd values)
        : dates_(std::move(dates)), assets_(std::move(assets)), values_(std::move(values)) {}

    std::vector<Timestamp> dates_;
    std::vector<AssetId> assets_;
    Eigen::MatrixXd values_;
};

}  // namespace alloc_ngin

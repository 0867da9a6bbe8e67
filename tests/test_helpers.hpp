// tests/test_helpers.hpp
#pragma once

#include <Eigen/Dense>
#include <random>
#include <string>
#include <vector>
#include "alloc_ngin/core/time_utils.hpp"
#include "alloc_ngin/core/types.hpp"
#include "alloc_ngin/data/returns_matrix.hpp"

namespace alloc_ngin {
namespace test_support {

/**
 * @brief Month-end style dates: the first of each month starting at year-month
 */
inline std::vector<Timestamp> monthly_dates(int year, unsigned month, size_t count) {
    std::vector<Timestamp> dates;
    dates.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const unsigned m = (month - 1 + static_cast<unsigned>(i)) % 12 + 1;
        const int y = year + static_cast<int>((month - 1 + i) / 12);
        const long days = core::days_from_civil(y, m, 1);
        dates.push_back(Timestamp(std::chrono::hours(24 * days)));
    }
    return dates;
}

inline std::string iso_month(int year, unsigned month) {
    return core::format_iso_date(monthly_dates(year, month, 1).front());
}

inline std::vector<AssetId> asset_names(size_t n) {
    std::vector<AssetId> names;
    for (size_t i = 0; i < n; ++i) {
        names.push_back("ASSET" + std::to_string(i + 1));
    }
    return names;
}

/**
 * @brief Gaussian returns with per-asset mean and volatility
 */
inline Eigen::MatrixXd random_returns(size_t periods, const std::vector<double>& means,
                                      const std::vector<double>& vols, unsigned seed = 42) {
    std::mt19937 gen(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    Eigen::MatrixXd values(static_cast<Eigen::Index>(periods),
                           static_cast<Eigen::Index>(means.size()));
    for (Eigen::Index t = 0; t < values.rows(); ++t) {
        for (Eigen::Index j = 0; j < values.cols(); ++j) {
            const auto k = static_cast<size_t>(j);
            values(t, j) = means[k] + vols[k] * dist(gen);
        }
    }
    return values;
}

inline ReturnsMatrix make_matrix(const Eigen::MatrixXd& values, int year = 2016,
                                 unsigned month = 1) {
    auto result = ReturnsMatrix::create(
        monthly_dates(year, month, static_cast<size_t>(values.rows())),
        asset_names(static_cast<size_t>(values.cols())), values);
    return result.take_value();
}

}  // namespace test_support
}  // namespace alloc_ngin

// include/alloc_ngin/statistics/distributions.hpp

#pragma once

#include <algorithm>
#include <boost/math/distributions/students_t.hpp>
#include <cmath>
#include <vector>

namespace alloc_ngin {
namespace statistics {

/**
 * @brief Two-sided p-value of a Student-t statistic
 * @param degrees_of_freedom Must be positive
 * @throws std::domain_error for non-positive degrees of freedom
 */
inline double two_sided_t_p_value(double t, double degrees_of_freedom) {
    const boost::math::students_t dist(degrees_of_freedom);
    return 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t)));
}

/**
 * @brief Percentile with linear interpolation between order statistics
 * @param sorted Values in ascending order, non-empty
 * @param q Quantile in [0, 1]
 */
inline double percentile(const std::vector<double>& sorted, double q) {
    if (sorted.size() == 1)
        return sorted.front();
    const double position = q * static_cast<double>(sorted.size() - 1);
    const auto lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double fraction = position - static_cast<double>(lower);
    return sorted[lower] + fraction * (sorted[upper] - sorted[lower]);
}

}  // namespace statistics
}  // namespace alloc_ngin

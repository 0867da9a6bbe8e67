#include <gtest/gtest.h>
#include "alloc_ngin/estimation/parameter_estimator.hpp"
#include "test_helpers.hpp"

using namespace alloc_ngin;
using namespace alloc_ngin::test_support;

class ParameterEstimatorTest : public ::testing::Test {
protected:
    ParameterEstimator make_estimator(size_t min_periods) {
        EstimatorConfig config;
        config.periods_per_year = 12;
        config.min_periods = min_periods;
        return ParameterEstimator(config);
    }
};

TEST_F(ParameterEstimatorTest, OrthogonalPatternsGiveDiagonalCovariance) {
    // Zero-mean orthogonal sign patterns shifted by a constant mean
    Eigen::MatrixXd values(4, 2);
    values << 0.01 + 0.02, 0.005 + 0.04,
              0.01 + 0.02, 0.005 - 0.04,
              0.01 - 0.02, 0.005 + 0.04,
              0.01 - 0.02, 0.005 - 0.04;

    auto estimator = make_estimator(4);
    auto result = estimator.estimate(make_matrix(values));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& params = result.value();

    EXPECT_NEAR(params.expected_returns(0), 0.12, 1e-12);
    EXPECT_NEAR(params.expected_returns(1), 0.06, 1e-12);
    EXPECT_NEAR(params.covariance(0, 0), 4 * 0.02 * 0.02 / 3.0 * 12, 1e-12);
    EXPECT_NEAR(params.covariance(1, 1), 4 * 0.04 * 0.04 / 3.0 * 12, 1e-12);
    EXPECT_NEAR(params.covariance(0, 1), 0.0, 1e-15);
    EXPECT_NEAR(params.volatilities(1), std::sqrt(params.covariance(1, 1)), 1e-15);
    EXPECT_EQ(params.num_observations, 4u);
    EXPECT_EQ(params.assets, asset_names(2));
}

TEST_F(ParameterEstimatorTest, CovarianceIsSymmetric) {
    auto matrix = make_matrix(random_returns(60, {0.01, 0.005, 0.008, 0.0},
                                             {0.04, 0.02, 0.06, 0.01}));
    auto result = make_estimator(12).estimate(matrix);
    ASSERT_TRUE(result.is_ok());
    const auto& cov = result.value().covariance;
    EXPECT_TRUE(cov.isApprox(cov.transpose(), 0.0));
    EXPECT_EQ(result.value().window_start, matrix.dates().front());
    EXPECT_EQ(result.value().window_end, matrix.dates().back());
}

TEST_F(ParameterEstimatorTest, ShortWindowIsInsufficient) {
    auto matrix = make_matrix(random_returns(11, {0.01, 0.01}, {0.03, 0.03}));
    auto result = make_estimator(12).estimate(matrix);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(ParameterEstimatorTest, SingleObservationIsAlwaysInsufficient) {
    auto matrix = make_matrix(random_returns(1, {0.01}, {0.03}));
    auto result = make_estimator(0).estimate(matrix);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(ParameterEstimatorTest, EmptyUniverseIsRejected) {
    auto result = make_estimator(2).estimate(ReturnsMatrix());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::EMPTY_UNIVERSE);
}

TEST_F(ParameterEstimatorTest, ConstantAssetHasZeroVolatility) {
    Eigen::MatrixXd values = random_returns(24, {0.01, 0.0}, {0.03, 0.0});
    auto result = make_estimator(12).estimate(make_matrix(values));
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().volatilities(1), 0.0);
    EXPECT_NEAR(result.value().covariance(0, 1), 0.0, 1e-18);
}

#include <gtest/gtest.h>
#include <variant>
#include "alloc_ngin/optimization/mean_variance_optimizer.hpp"

namespace alloc_ngin {

class MeanVarianceOptimizerTest : public ::testing::Test {
protected:
    MeanVarianceConfig default_config;

    AllocationRequest make_request(const Eigen::VectorXd& mu, const Eigen::MatrixXd& cov,
                                   double rf) {
        AllocationRequest request;
        for (Eigen::Index i = 0; i < mu.size(); ++i)
            request.assets.push_back("A" + std::to_string(i));
        EstimatedParameters params;
        params.assets = request.assets;
        params.expected_returns = mu;
        params.covariance = cov;
        params.volatilities = cov.diagonal().cwiseSqrt();
        params.num_observations = 60;
        request.parameters = params;
        request.risk_free_rate = rf;
        return request;
    }

    static Eigen::MatrixXd correlated_covariance(const Eigen::VectorXd& vols, double rho) {
        const Eigen::Index n = vols.size();
        Eigen::MatrixXd corr = Eigen::MatrixXd::Constant(n, n, rho);
        corr.diagonal().setOnes();
        return vols.asDiagonal() * corr * vols.asDiagonal();
    }

    static double sharpe(const Eigen::VectorXd& w, const Eigen::VectorXd& mu,
                         const Eigen::MatrixXd& cov, double rf) {
        return (mu.dot(w) - rf) / std::sqrt(w.dot(cov * w));
    }
};

// Diagonal covariance with equal variances: w proportional to mu - rf = (6, 4, 3) / 100
TEST_F(MeanVarianceOptimizerTest, DiagonalCaseMatchesClosedForm) {
    MeanVarianceOptimizer optimizer(default_config, WeightBounds{0.0, 1.0});
    Eigen::Vector3d mu(0.08, 0.06, 0.05);
    Eigen::MatrixXd cov = Eigen::Vector3d::Constant(0.04).asDiagonal();

    auto result = optimizer.allocate(make_request(mu, cov, 0.02));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    ASSERT_TRUE(std::holds_alternative<MeanVarianceResult>(result.value()));
    const auto& mv = std::get<MeanVarianceResult>(result.value());

    EXPECT_EQ(mv.method, MeanVarianceMethod::SQP);
    EXPECT_TRUE(mv.converged);
    EXPECT_FALSE(mv.degraded());
    EXPECT_NEAR(mv.weights[0], 6.0 / 13.0, 0.01 * 6.0 / 13.0);
    EXPECT_NEAR(mv.weights[1], 4.0 / 13.0, 0.01 * 4.0 / 13.0);
    EXPECT_NEAR(mv.weights[2], 3.0 / 13.0, 0.01 * 3.0 / 13.0);
    EXPECT_NEAR(mv.weights.sum(), 1.0, 1e-9);
    EXPECT_NEAR(mv.expected_sharpe, sharpe(mv.weights.values(), mu, cov, 0.02), 1e-12);
}

TEST_F(MeanVarianceOptimizerTest, SqpAgreesWithTangencyWhenBoundsDoNotBind) {
    MeanVarianceOptimizer optimizer(default_config, WeightBounds{0.0, 1.0});
    Eigen::Vector4d mu(0.09, 0.07, 0.06, 0.08);
    Eigen::MatrixXd cov = correlated_covariance(Eigen::Vector4d(0.20, 0.15, 0.12, 0.18), 0.2);

    auto tangency = optimizer.tangency_portfolio(mu, cov, 0.01);
    ASSERT_TRUE(tangency.is_ok()) << tangency.error()->what();
    ASSERT_GT(tangency.value().minCoeff(), 0.0);

    auto solved = optimizer.maximize_sharpe(mu, cov, 0.01);
    ASSERT_TRUE(solved.is_ok()) << solved.error()->what();
    EXPECT_LT((solved.value().x - tangency.value()).lpNorm<Eigen::Infinity>(), 1e-4);
}

TEST_F(MeanVarianceOptimizerTest, BindingBoundsBeatSimpleAlternatives) {
    WeightBounds bounds{0.05, 0.35};
    MeanVarianceOptimizer optimizer(default_config, bounds);
    Eigen::Vector4d mu(0.15, 0.05, 0.06, 0.04);
    Eigen::MatrixXd cov = correlated_covariance(Eigen::Vector4d(0.15, 0.15, 0.15, 0.15), 0.1);

    auto result = optimizer.allocate(make_request(mu, cov, 0.01));
    ASSERT_TRUE(result.is_ok());
    const auto& weights = outcome_of(result.value()).weights.values();
    EXPECT_TRUE(satisfies_bounds(weights, bounds)) << weights.transpose();
    EXPECT_NEAR(weights(0), 0.35, 1e-6);

    const double optimal = sharpe(weights, mu, cov, 0.01);
    EXPECT_GE(optimal, sharpe(equal_weights(4), mu, cov, 0.01));
    Eigen::Vector4d tilted(0.35, 0.25, 0.25, 0.15);
    EXPECT_GE(optimal + 1e-9, sharpe(tilted, mu, cov, 0.01));
}

TEST_F(MeanVarianceOptimizerTest, IterationCapFallsBackToTangency) {
    MeanVarianceConfig config = default_config;
    config.max_iterations = 1;
    MeanVarianceOptimizer optimizer(config, WeightBounds{0.0, 1.0});
    Eigen::Vector3d mu(0.08, 0.06, 0.05);
    Eigen::MatrixXd cov = Eigen::Vector3d(0.04, 0.02, 0.03).asDiagonal();

    auto result = optimizer.allocate(make_request(mu, cov, 0.02));
    ASSERT_TRUE(result.is_ok());
    const auto& mv = std::get<MeanVarianceResult>(result.value());
    EXPECT_EQ(mv.method, MeanVarianceMethod::ANALYTICAL_TANGENCY);
    EXPECT_FALSE(mv.converged);
    ASSERT_EQ(mv.warnings.size(), 2u);
    EXPECT_EQ(mv.warnings[0].kind, AllocationWarningKind::OPTIMIZER_NOT_CONVERGED);
    EXPECT_EQ(mv.warnings[0].cause, ErrorCode::OPTIMIZATION_DID_NOT_CONVERGE);
    EXPECT_EQ(mv.warnings[1].kind, AllocationWarningKind::ANALYTICAL_FALLBACK);
    EXPECT_TRUE(mv.degraded());
    EXPECT_NEAR(mv.weights.sum(), 1.0, 1e-9);
}

TEST_F(MeanVarianceOptimizerTest, ZeroCovarianceFallsBackToEqualWeight) {
    MeanVarianceOptimizer optimizer(default_config, WeightBounds{0.0, 1.0});
    Eigen::Vector3d mu(0.08, 0.06, 0.05);
    Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(3, 3);

    auto result = optimizer.allocate(make_request(mu, cov, 0.02));
    ASSERT_TRUE(result.is_ok());
    const auto& mv = std::get<MeanVarianceResult>(result.value());
    EXPECT_EQ(mv.method, MeanVarianceMethod::EQUAL_WEIGHT);
    ASSERT_EQ(mv.warnings.size(), 2u);
    EXPECT_EQ(mv.warnings[0].cause, ErrorCode::DEGENERATE_COVARIANCE);
    EXPECT_EQ(mv.warnings[1].kind, AllocationWarningKind::EQUAL_WEIGHT_FALLBACK);
    EXPECT_EQ(mv.warnings[1].cause, ErrorCode::SINGULAR_COVARIANCE);
    EXPECT_DOUBLE_EQ(mv.weights[1], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(mv.expected_sharpe, 0.0);
}

TEST_F(MeanVarianceOptimizerTest, TangencyRequiresPositiveExcessReturn) {
    MeanVarianceOptimizer optimizer(default_config, WeightBounds{0.0, 1.0});
    Eigen::Vector2d mu(0.01, 0.02);
    Eigen::MatrixXd cov = Eigen::Vector2d(0.04, 0.04).asDiagonal();

    auto result = optimizer.tangency_portfolio(mu, cov, 0.05);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NO_TANGENCY_PORTFOLIO);

    Eigen::MatrixXd singular = Eigen::MatrixXd::Constant(2, 2, 0.04);
    auto singular_result = optimizer.tangency_portfolio(mu, singular, 0.0);
    ASSERT_TRUE(singular_result.is_error());
    EXPECT_EQ(singular_result.error()->code(), ErrorCode::SINGULAR_COVARIANCE);
}

TEST_F(MeanVarianceOptimizerTest, InfeasibleBoundsAreAnError) {
    MeanVarianceOptimizer optimizer(default_config, WeightBounds{0.4, 1.0});
    Eigen::Vector3d mu(0.08, 0.06, 0.05);
    Eigen::MatrixXd cov = Eigen::Vector3d::Constant(0.04).asDiagonal();

    auto result = optimizer.allocate(make_request(mu, cov, 0.0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INFEASIBLE_BOUNDS);
}

TEST_F(MeanVarianceOptimizerTest, MissingParametersAreAnError) {
    MeanVarianceOptimizer optimizer(default_config, WeightBounds{0.0, 1.0});
    AllocationRequest request;
    request.assets = {"A", "B"};
    auto result = optimizer.allocate(request);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(MeanVarianceOptimizerTest, ConfigRoundTripsThroughJson) {
    MeanVarianceConfig config;
    config.from_json({{"tolerance", 1e-8}, {"max_iterations", 50}});
    EXPECT_DOUBLE_EQ(config.tolerance, 1e-8);
    EXPECT_EQ(config.max_iterations, 50);
    EXPECT_DOUBLE_EQ(config.max_seconds, 10.0);
    EXPECT_EQ(config.to_json()["max_iterations"].get<int>(), 50);
}

}  // namespace alloc_ngin

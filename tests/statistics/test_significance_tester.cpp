#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <vector>
#include "alloc_ngin/statistics/distributions.hpp"
#include "alloc_ngin/statistics/significance_tester.hpp"

using namespace alloc_ngin;
using namespace alloc_ngin::statistics;

// ============================================================================
// Test Fixtures
// ============================================================================

class SignificanceTesterTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 gen(42);
        std::normal_distribution<> d(0.0, 1.0);

        const size_t n = 120;
        returns_a_.resize(n);
        returns_b_.resize(n);
        risk_free_.assign(n, 0.002);
        for (size_t i = 0; i < n; ++i) {
            const double common = d(gen);
            returns_a_[i] = 0.008 + 0.04 * (0.6 * common + 0.8 * d(gen));
            returns_b_[i] = 0.006 + 0.03 * common;
        }
    }

    std::vector<double> returns_a_;
    std::vector<double> returns_b_;
    std::vector<double> risk_free_;
};

// ============================================================================
// Distribution helpers
// ============================================================================

TEST(DistributionsTest, StudentTPValuesMatchTables) {
    // Two-sided 5% critical values
    EXPECT_NEAR(two_sided_t_p_value(2.2281388519649385, 10.0), 0.05, 1e-9);
    EXPECT_NEAR(two_sided_t_p_value(3.1824463052842638, 3.0), 0.05, 1e-9);
    EXPECT_NEAR(two_sided_t_p_value(0.0, 11.0), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(two_sided_t_p_value(-2.5, 11.0), two_sided_t_p_value(2.5, 11.0));
    // Heavier tails than the normal at the same statistic
    EXPECT_GT(two_sided_t_p_value(1.96, 11.0), 0.05);
}

TEST(DistributionsTest, PercentileInterpolates) {
    std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(percentile(sorted, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(percentile(sorted, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(percentile(sorted, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(percentile({7.0}, 0.3), 7.0);
}

// ============================================================================
// Jobson-Korkie
// ============================================================================

TEST_F(SignificanceTesterTest, IdenticalSeriesAreNotDifferent) {
    SignificanceTester tester;
    auto result = tester.jobson_korkie("A", returns_a_, "A_COPY", returns_a_, risk_free_);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_DOUBLE_EQ(result.value().statistic, 0.0);
    EXPECT_DOUBLE_EQ(result.value().p_value, 1.0);
    EXPECT_FALSE(result.value().significant);
    EXPECT_NEAR(result.value().correlation, 1.0, 1e-12);
}

TEST_F(SignificanceTesterTest, SwappingSeriesNegatesStatistic) {
    SignificanceTester tester;
    auto ab = tester.jobson_korkie("A", returns_a_, "B", returns_b_, risk_free_);
    auto ba = tester.jobson_korkie("B", returns_b_, "A", returns_a_, risk_free_);
    ASSERT_TRUE(ab.is_ok());
    ASSERT_TRUE(ba.is_ok());

    EXPECT_NEAR(ab.value().statistic, -ba.value().statistic, 1e-12);
    EXPECT_NEAR(ab.value().p_value, ba.value().p_value, 1e-12);
    EXPECT_NEAR(ab.value().difference, -ba.value().difference, 1e-12);
    EXPECT_EQ(ab.value().significant, ba.value().significant);
    EXPECT_EQ(ab.value().num_observations, 120u);
}

TEST_F(SignificanceTesterTest, ShiftedSeriesHaveClosedFormStatistic) {
    // With rho = 1 the Memmel variance reduces to (SR_a - SR_b)^2 / (2T), so z = sqrt(2T)
    std::vector<double> shifted(returns_b_.size());
    for (size_t i = 0; i < shifted.size(); ++i)
        shifted[i] = returns_b_[i] + 0.02;

    SignificanceTester tester;
    auto result = tester.jobson_korkie("SHIFTED", shifted, "B", returns_b_, risk_free_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_NEAR(result.value().statistic, std::sqrt(240.0), 1e-6);
    EXPECT_LT(result.value().p_value, 1e-10);
    EXPECT_TRUE(result.value().significant);
    EXPECT_GT(result.value().sharpe_a, result.value().sharpe_b);
}

TEST_F(SignificanceTesterTest, ShortSeriesUseStudentTTail) {
    const std::vector<double> a{0.05, 0.01, 0.04, 0.03};
    const std::vector<double> b{0.01, 0.00, 0.02, -0.01};
    const std::vector<double> rf(4, 0.0);

    SignificanceTester tester;
    auto result = tester.jobson_korkie("A", a, "B", b, rf);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    EXPECT_NEAR(result.value().statistic, 1.8724401503557353, 1e-9);
    // Closed-form Student-t(3) tail; the normal tail would give 0.0611
    EXPECT_NEAR(result.value().p_value, 0.15787156373754563, 1e-9);
    EXPECT_FALSE(result.value().significant);
}

TEST_F(SignificanceTesterTest, SharpeRatiosAreAnnualized) {
    SignificanceConfig config;
    config.periods_per_year = 12;
    SignificanceTester tester(config);
    auto result = tester.jobson_korkie("A", returns_a_, "B", returns_b_, risk_free_);
    ASSERT_TRUE(result.is_ok());

    double mean = 0.0;
    for (size_t i = 0; i < returns_b_.size(); ++i)
        mean += returns_b_[i] - risk_free_[i];
    mean /= static_cast<double>(returns_b_.size());
    double var = 0.0;
    for (size_t i = 0; i < returns_b_.size(); ++i)
        var += std::pow(returns_b_[i] - risk_free_[i] - mean, 2);
    var /= static_cast<double>(returns_b_.size() - 1);

    EXPECT_NEAR(result.value().sharpe_b, mean / std::sqrt(var) * std::sqrt(12.0), 1e-12);
}

TEST_F(SignificanceTesterTest, ZeroVolatilityIsIndeterminate) {
    std::vector<double> flat(returns_a_.size(), 0.002);
    SignificanceTester tester;
    auto result = tester.jobson_korkie("FLAT", flat, "A", returns_a_, risk_free_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INDETERMINATE_SIGNIFICANCE);
}

TEST_F(SignificanceTesterTest, MisalignedOrShortSeriesAreInsufficient) {
    SignificanceTester tester;
    std::vector<double> shorter(returns_b_.begin(), returns_b_.end() - 1);
    auto misaligned = tester.jobson_korkie("A", returns_a_, "B", shorter, risk_free_);
    ASSERT_TRUE(misaligned.is_error());
    EXPECT_EQ(misaligned.error()->code(), ErrorCode::INSUFFICIENT_DATA);

    auto too_short = tester.jobson_korkie("A", {0.01, 0.02}, "B", {0.02, 0.01}, {0.0, 0.0});
    ASSERT_TRUE(too_short.is_error());
    EXPECT_EQ(too_short.error()->code(), ErrorCode::INSUFFICIENT_DATA);
}

TEST_F(SignificanceTesterTest, ResultSurvivesJson) {
    SignificanceTester tester;
    auto result = tester.jobson_korkie("A", returns_a_, "B", returns_b_, risk_free_);
    ASSERT_TRUE(result.is_ok());

    SignificanceResult restored = SignificanceResult::from_json(result.value().to_json());
    EXPECT_EQ(restored.strategy_a, "A");
    EXPECT_EQ(restored.num_observations, 120u);
    EXPECT_DOUBLE_EQ(restored.statistic, result.value().statistic);
    EXPECT_DOUBLE_EQ(restored.p_value, result.value().p_value);
    EXPECT_EQ(restored.interpretation, result.value().interpretation);
}

// ============================================================================
// Bootstrap
// ============================================================================

TEST_F(SignificanceTesterTest, BootstrapIsDeterministicForSeed) {
    SignificanceConfig config;
    config.bootstrap_samples = 500;
    config.bootstrap_seed = 7;
    SignificanceTester first(config);
    SignificanceTester second(config);

    auto a = first.bootstrap("A", returns_a_, "B", returns_b_, risk_free_);
    auto b = second.bootstrap("A", returns_a_, "B", returns_b_, risk_free_);
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_DOUBLE_EQ(a.value().ci_lower, b.value().ci_lower);
    EXPECT_DOUBLE_EQ(a.value().ci_upper, b.value().ci_upper);
    EXPECT_DOUBLE_EQ(a.value().p_value, b.value().p_value);
    EXPECT_EQ(a.value().samples, 500u);
    EXPECT_LE(a.value().ci_lower, a.value().ci_upper);
    EXPECT_GT(a.value().bootstrap_std, 0.0);

    config.bootstrap_seed = 8;
    auto c = SignificanceTester(config).bootstrap("A", returns_a_, "B", returns_b_, risk_free_);
    ASSERT_TRUE(c.is_ok());
    EXPECT_NE(a.value().ci_lower, c.value().ci_lower);
    EXPECT_DOUBLE_EQ(a.value().observed_difference, c.value().observed_difference);
}

TEST_F(SignificanceTesterTest, BootstrapDetectsDominatingSeries) {
    std::vector<double> shifted(returns_b_.size());
    for (size_t i = 0; i < shifted.size(); ++i)
        shifted[i] = returns_b_[i] + 0.02;

    SignificanceTester tester;
    auto result = tester.bootstrap("SHIFTED", shifted, "B", returns_b_, risk_free_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_GT(result.value().ci_lower, 0.0);
    EXPECT_DOUBLE_EQ(result.value().p_value, 0.0);
    EXPECT_TRUE(result.value().significant);
}

TEST_F(SignificanceTesterTest, BootstrapOfIdenticalSeries) {
    SignificanceTester tester;
    auto result = tester.bootstrap("A", returns_a_, "A_COPY", returns_a_, risk_free_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().observed_difference, 0.0);
    EXPECT_DOUBLE_EQ(result.value().p_value, 1.0);
    EXPECT_FALSE(result.value().significant);
}

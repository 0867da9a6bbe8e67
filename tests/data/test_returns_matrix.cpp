#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "alloc_ngin/data/returns_matrix.hpp"
#include "test_helpers.hpp"

using namespace alloc_ngin;
using namespace alloc_ngin::test_support;

class ReturnsMatrixTest : public ::testing::Test {
protected:
    void SetUp() override {
        values = random_returns(36, {0.01, 0.008, 0.012}, {0.05, 0.03, 0.07});
        matrix = make_matrix(values);
    }

    Eigen::MatrixXd values;
    ReturnsMatrix matrix;
};

TEST_F(ReturnsMatrixTest, ExposesShapeAndNames) {
    EXPECT_EQ(matrix.num_periods(), 36u);
    EXPECT_EQ(matrix.num_assets(), 3u);
    EXPECT_EQ(matrix.assets()[1], "ASSET2");
    EXPECT_TRUE(matrix.values().isApprox(values));
}

TEST_F(ReturnsMatrixTest, SliceIsIndependentCopy) {
    ReturnsMatrix window = matrix.slice(12, 24);
    EXPECT_EQ(window.num_periods(), 12u);
    EXPECT_EQ(window.dates().front(), matrix.dates()[12]);
    EXPECT_EQ(window.dates().back(), matrix.dates()[23]);
    EXPECT_DOUBLE_EQ(window.values()(0, 2), values(12, 2));
    EXPECT_NE(window.values().data(), matrix.values().data());
}

TEST_F(ReturnsMatrixTest, SliceClampsOutOfRange) {
    EXPECT_EQ(matrix.slice(30, 100).num_periods(), 6u);
    EXPECT_TRUE(matrix.slice(20, 10).empty());
    EXPECT_EQ(matrix.slice(20, 10).num_assets(), 3u);
}

TEST_F(ReturnsMatrixTest, LowerBoundFindsFirstRowOnOrAfterDate) {
    EXPECT_EQ(matrix.lower_bound(matrix.dates()[5]), 5u);
    EXPECT_EQ(matrix.lower_bound(matrix.dates()[5] + std::chrono::hours(1)), 6u);
    EXPECT_EQ(matrix.lower_bound(matrix.dates().front() - std::chrono::hours(24)), 0u);
    EXPECT_EQ(matrix.lower_bound(matrix.dates().back() + std::chrono::hours(24)), 36u);
}

TEST_F(ReturnsMatrixTest, PortfolioReturnsAreWeightedSums) {
    Eigen::VectorXd w(3);
    w << 0.5, 0.3, 0.2;
    auto result = matrix.portfolio_returns(w);
    ASSERT_TRUE(result.is_ok());
    EXPECT_NEAR(result.value()(7), values.row(7).dot(w), 1e-15);

    auto mismatch = matrix.portfolio_returns(Eigen::VectorXd::Ones(2));
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ReturnsMatrixTest, RejectsEmptyUniverse) {
    auto result = ReturnsMatrix::create(monthly_dates(2016, 1, 2), {}, Eigen::MatrixXd(2, 0));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::EMPTY_UNIVERSE);
}

TEST_F(ReturnsMatrixTest, RejectsNonFiniteValues) {
    Eigen::MatrixXd bad = values;
    bad(4, 1) = std::numeric_limits<double>::quiet_NaN();
    auto result = ReturnsMatrix::create(monthly_dates(2016, 1, 36), asset_names(3), bad);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_THAT(result.error()->what(), ::testing::HasSubstr("ASSET2"));
}

TEST_F(ReturnsMatrixTest, RejectsUnorderedDates) {
    auto dates = monthly_dates(2016, 1, 36);
    std::swap(dates[3], dates[4]);
    auto result = ReturnsMatrix::create(dates, asset_names(3), values);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ReturnsMatrixTest, RejectsDuplicateAssetsAndShapeMismatch) {
    auto duplicate = ReturnsMatrix::create(monthly_dates(2016, 1, 36), {"A", "B", "A"}, values);
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error()->code(), ErrorCode::INVALID_DATA);

    auto shape = ReturnsMatrix::create(monthly_dates(2016, 1, 35), asset_names(3), values);
    ASSERT_TRUE(shape.is_error());
    EXPECT_EQ(shape.error()->code(), ErrorCode::INVALID_DATA);
}

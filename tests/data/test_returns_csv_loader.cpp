#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "alloc_ngin/core/time_utils.hpp"
#include "alloc_ngin/data/returns_csv_loader.hpp"

using namespace alloc_ngin;

class ReturnsCSVLoaderTest : public ::testing::Test {
protected:
    Result<ReturnsMatrix> parse(const std::string& text) {
        std::istringstream input(text);
        return loader.parse(input, "returns.csv");
    }

    void expect_invalid(const std::string& text, const std::string& fragment) {
        auto result = parse(text);
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
        EXPECT_THAT(result.error()->what(), ::testing::HasSubstr(fragment))
            << result.error()->what();
    }

    ReturnsCSVLoader loader;
};

TEST_F(ReturnsCSVLoaderTest, ParsesWellFormedInput) {
    auto result = parse(
        "date,SPY,TLT,GLD\n"
        "2018-01-31,0.0564,-0.0321,0.0310\n"
        "\n"
        "2018-02-28,-0.0364,-0.0305,-0.0205\r\n"
        "2018-03-31, -0.0274 ,0.0289,0.0060\n");
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& matrix = result.value();
    EXPECT_EQ(matrix.num_periods(), 3u);
    ASSERT_EQ(matrix.num_assets(), 3u);
    EXPECT_EQ(matrix.assets()[2], "GLD");
    EXPECT_DOUBLE_EQ(matrix.values()(2, 0), -0.0274);
    EXPECT_EQ(core::format_iso_date(matrix.dates()[1]), "2018-02-28");
}

TEST_F(ReturnsCSVLoaderTest, RejectsBadHeader) {
    expect_invalid("when,SPY\n2018-01-31,0.01\n", "returns.csv:1");
}

TEST_F(ReturnsCSVLoaderTest, RejectsMissingHeader) {
    auto result = parse("\n\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::EMPTY_UNIVERSE);
}

TEST_F(ReturnsCSVLoaderTest, RejectsWrongFieldCount) {
    expect_invalid("date,SPY,TLT\n2018-01-31,0.01\n", "returns.csv:2: expected 3 fields");
    expect_invalid("date,SPY,TLT\n2018-01-31,0.01,0.02,\n", "got 4");
}

TEST_F(ReturnsCSVLoaderTest, RejectsBadDate) {
    expect_invalid("date,SPY\n2018-13-31,0.01\n", "invalid date");
    expect_invalid("date,SPY\n31/01/2018,0.01\n", "invalid date");
}

TEST_F(ReturnsCSVLoaderTest, RejectsOutOfOrderDates) {
    expect_invalid("date,SPY\n2018-02-28,0.01\n2018-01-31,0.02\n", "returns.csv:3");
    expect_invalid("date,SPY\n2018-02-28,0.01\n2018-02-28,0.02\n", "not after");
}

TEST_F(ReturnsCSVLoaderTest, RejectsNonNumericAndNonFiniteValues) {
    expect_invalid("date,SPY,TLT\n2018-01-31,0.01,abc\n", "for TLT");
    expect_invalid("date,SPY\n2018-01-31,nan\n", "invalid return");
    expect_invalid("date,SPY\n2018-01-31,inf\n", "invalid return");
    expect_invalid("date,SPY\n2018-01-31,\n", "invalid return");
    expect_invalid("date,SPY\n2018-01-31,0.01x\n", "invalid return");
}

TEST_F(ReturnsCSVLoaderTest, RejectsDuplicateColumns) {
    auto result = parse("date,SPY,SPY\n2018-01-31,0.01,0.02\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ReturnsCSVLoaderTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "alloc_ngin_loader_test.csv";
    {
        std::ofstream out(path);
        out << "date,A,B\n2019-01-31,0.01,0.02\n2019-02-28,0.03,-0.01\n";
    }

    auto result = loader.load(path.string());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().num_periods(), 2u);
    std::filesystem::remove(path);
}

TEST_F(ReturnsCSVLoaderTest, MissingFileReportsNotFound) {
    auto result = loader.load("/nonexistent/alloc_ngin/returns.csv");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

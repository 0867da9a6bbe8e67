#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "alloc_ngin/core/logger.hpp"

using namespace alloc_ngin;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);

        // Close file handles before removing the directory
        Logger::reset_for_tests();

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig file_config() {
        LoggerConfig config;
        config.min_level = LogLevel::DEBUG;
        config.destination = LogDestination::FILE;
        config.log_directory = test_log_dir;
        config.filename_prefix = "test_alloc";
        return config;
    }

    const std::string test_log_dir = "test_logs_alloc_ngin";
    std::stringstream cout_buffer;
    std::streambuf* original_cout{nullptr};
};

TEST_F(LoggerTest, ConsoleOutputIncludesLevelAndComponent) {
    LoggerConfig config;
    config.min_level = LogLevel::INFO;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    Logger::instance().initialize(config);
    Logger::register_component("RiskParityAllocator");

    WARN("Risk parity did not converge in " << 100 << " iterations");

    const std::string output = cout_buffer.str();
    EXPECT_NE(output.find("[WARNING]"), std::string::npos);
    EXPECT_NE(output.find("[RiskParityAllocator]"), std::string::npos);
    EXPECT_NE(output.find("did not converge in 100 iterations"), std::string::npos);
}

TEST_F(LoggerTest, MessagesBelowMinimumLevelAreDropped) {
    LoggerConfig config;
    config.min_level = LogLevel::WARNING;
    config.destination = LogDestination::CONSOLE;
    Logger::instance().initialize(config);

    DEBUG("estimation window sliced");
    INFO("period recorded");
    EXPECT_TRUE(cout_buffer.str().empty());

    ERROR("backtest aborted");
    EXPECT_NE(cout_buffer.str().find("backtest aborted"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelChangesFiltering) {
    LoggerConfig config;
    config.min_level = LogLevel::ERR;
    config.destination = LogDestination::CONSOLE;
    Logger::instance().initialize(config);

    INFO("hidden");
    EXPECT_TRUE(cout_buffer.str().empty());

    Logger::instance().set_level(LogLevel::INFO);
    EXPECT_EQ(Logger::instance().get_min_level(), LogLevel::INFO);
    INFO("visible");
    EXPECT_NE(cout_buffer.str().find("visible"), std::string::npos);
}

TEST_F(LoggerTest, FileDestinationWritesPrefixedSessionFile) {
    Logger::instance().initialize(file_config());
    INFO("Loaded 36 periods for 3 assets");
    Logger::reset_for_tests();

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    const std::string name = files.front().filename().string();
    EXPECT_EQ(name.rfind("test_alloc_", 0), 0u);
    EXPECT_NE(name.find("_part1.log"), std::string::npos);
    EXPECT_NE(read_file(files.front()).find("Loaded 36 periods for 3 assets"), std::string::npos);
    EXPECT_TRUE(cout_buffer.str().empty());
}

TEST_F(LoggerTest, RotatesWhenFileExceedsMaximumSize) {
    LoggerConfig config = file_config();
    config.max_file_size = 256;
    config.max_files = 10;
    Logger::instance().initialize(config);

    for (int i = 0; i < 20; ++i) {
        INFO("Rebalancing period " << i << " recorded with three strategies and no fallbacks");
    }
    Logger::reset_for_tests();

    auto files = get_log_files(test_log_dir);
    EXPECT_GT(files.size(), 1u);
    bool found_part2 = std::any_of(files.begin(), files.end(), [](const auto& path) {
        return path.filename().string().find("_part2.log") != std::string::npos;
    });
    EXPECT_TRUE(found_part2);
}

TEST_F(LoggerTest, PrunesOldFilesBeyondRetention) {
    LoggerConfig config = file_config();
    config.max_file_size = 128;
    config.max_files = 3;
    Logger::instance().initialize(config);

    for (int i = 0; i < 50; ++i) {
        INFO("Message number " << i << " padded to force frequent rotation of the log");
    }
    Logger::reset_for_tests();

    EXPECT_LE(get_log_files(test_log_dir).size(), 3u);
}

TEST_F(LoggerTest, ConfigRoundTripsThroughJson) {
    LoggerConfig config = file_config();
    config.min_level = LogLevel::ERR;
    config.destination = LogDestination::BOTH;
    config.max_files = 4;

    LoggerConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.min_level, LogLevel::ERR);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "test_alloc");
    EXPECT_EQ(loaded.max_files, 4u);
}

TEST_F(LoggerTest, UninitializedLoggerIsSilentOnStdout) {
    EXPECT_FALSE(Logger::instance().is_initialized());
    INFO("not initialized");
    EXPECT_TRUE(cout_buffer.str().empty());
}

TEST_F(LoggerTest, ComponentScopeRestoresPreviousTag) {
    Logger::register_component("BacktestOrchestrator");
    {
        LogComponentScope scope("SignificanceTester");
        EXPECT_EQ(Logger::current_component(), "SignificanceTester");
    }
    EXPECT_EQ(Logger::current_component(), "BacktestOrchestrator");
}

TEST_F(LoggerTest, LevelNamesParseStrictly) {
    EXPECT_EQ(level_from_string("ERROR"), LogLevel::ERR);
    EXPECT_EQ(level_from_string("TRACE"), LogLevel::TRACE);
    EXPECT_FALSE(level_from_string("error").has_value());

    LoggerConfig config;
    EXPECT_THROW(config.from_json(nlohmann::json{{"destination", "SYSLOG"}}),
                 std::invalid_argument);
}

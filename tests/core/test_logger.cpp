#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "stock_advisor/core/logger.hpp"

using namespace stock_advisor;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();

        // Console output goes to stderr
        original_cerr = std::cerr.rdbuf();
        std::cerr.rdbuf(cerr_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cerr.rdbuf(original_cerr);
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

    std::streambuf* original_cerr;
    std::stringstream cerr_buffer;
    const std::string test_log_dir = "stock_advisor_test_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config;
    config.destination = LogDestination::FILE;
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "Console message");
    EXPECT_EQ(cerr_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToFileWhenConfigured) {
    LoggerConfig config;
    config.destination = LogDestination::FILE;
    config.log_directory = test_log_dir;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "File message");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "File message\n");
    EXPECT_TRUE(cerr_buffer.str().empty());
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.min_level = LogLevel::WARNING;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    DEBUG("Debug");
    INFO("Info");
    WARN("Warning " << 1);
    ERROR("Error " << 2);

    EXPECT_EQ(cerr_buffer.str(), "Warning 1\nError 2\n");
}

TEST_F(LoggerTest, MessageFormattingIncludesLevelAndComponent) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    Logger::instance().initialize(config);
    Logger::register_component("Allocator");

    Logger::instance().log(LogLevel::WARNING, "Skipping BRK.A");
    EXPECT_EQ(cerr_buffer.str(), "[WARNING] [Allocator] Skipping BRK.A\n");
}

TEST_F(LoggerTest, UninitializedLoggerWarnsOnStderr) {
    Logger::instance().log(LogLevel::INFO, "Early message");
    EXPECT_NE(cerr_buffer.str().find("Logger not initialized"), std::string::npos);
}

TEST_F(LoggerTest, FileRotationKeepsMaxFiles) {
    LoggerConfig config;
    config.destination = LogDestination::FILE;
    config.log_directory = test_log_dir;
    config.max_file_size = 10;
    config.max_files = 2;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    for (int i = 0; i < 5; ++i) {
        Logger::instance().log(LogLevel::INFO, "Message number " + std::to_string(i));
    }

    EXPECT_LE(get_log_files(test_log_dir).size(), 2u);
}

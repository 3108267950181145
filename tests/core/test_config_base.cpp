// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "stock_advisor/core/config_base.hpp"
#include "stock_advisor/core/logger.hpp"

using namespace stock_advisor;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "stock_advisor_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->what();
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, MissingFileIsReported) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "missing.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, MalformedJsonIsReported) {
    std::filesystem::path file_path = test_dir / "broken.json";
    std::ofstream(file_path) << "{\"name\": ";

    TestConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(config.name, "default");
}

TEST_F(ConfigBaseTest, WrongTypedValueIsInvalidData) {
    std::filesystem::path file_path = test_dir / "typed.json";
    std::ofstream(file_path) << "{\"value\": \"forty-two\"}";

    TestConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConfigBaseTest, AbsentKeysKeepDefaults) {
    TestConfig config;
    config.from_json(nlohmann::json{{"value", 7}});
    EXPECT_EQ(config.name, "default");
    EXPECT_EQ(config.value, 7);
}

TEST_F(ConfigBaseTest, LoggerConfigRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::WARNING;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "advisor";
    config.max_files = 3;

    LoggerConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.min_level, LogLevel::WARNING);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "advisor");
    EXPECT_EQ(loaded.max_files, 3u);
}

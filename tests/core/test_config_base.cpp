// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "lifecycle_ngin/core/config_base.hpp"
#include "lifecycle_ngin/risk/sizing.hpp"
#include "lifecycle_ngin/trend/trend_config.hpp"

using namespace lifecycle_ngin;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "lifecycle_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TrendEngineConfig config;
    config.ts_threshold = 0.61;
    config.first_dip_max_bars = 12;
    config.first_dip_reset = FirstDipResetPolicy::ON_REENTRY;
    config.rsi_k = 0.7;

    std::filesystem::path file_path = test_dir / "trend.json";

    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TrendEngineConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_DOUBLE_EQ(loaded_config.ts_threshold, 0.61);
    EXPECT_EQ(loaded_config.first_dip_max_bars, 12);
    EXPECT_EQ(loaded_config.first_dip_reset, FirstDipResetPolicy::ON_REENTRY);
    EXPECT_DOUBLE_EQ(loaded_config.rsi_k, 0.7);
}

TEST_F(ConfigBaseTest, LoadNonexistentFile) {
    TrendEngineConfig config;
    auto result = config.load_from_file((test_dir / "nonexistent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, LoadMalformedJson) {
    std::filesystem::path file_path = test_dir / "malformed.json";
    {
        std::ofstream file(file_path);
        file << "{ \"ts_threshold\": 0.5, ";
    }

    TrendEngineConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, LoadRunsValidation) {
    std::filesystem::path file_path = test_dir / "invalid_sizing.json";
    {
        std::ofstream file(file_path);
        file << R"({"trim": {"aggressive": 0.05, "normal": 0.10, "patient": 0.03}})";
    }

    SizingConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, PartialJsonKeepsDefaults) {
    TrendEngineConfig config;
    config.from_json(nlohmann::json{{"adx_floor", 22.0}});

    TrendEngineConfig defaults;
    EXPECT_DOUBLE_EQ(config.adx_floor, 22.0);
    EXPECT_DOUBLE_EQ(config.ts_threshold, defaults.ts_threshold);
    EXPECT_EQ(config.min_bars, defaults.min_bars);
}

TEST_F(ConfigBaseTest, SaveRefusesInvalidConfig) {
    SizingConfig config;
    config.trim.aggressive = 0.05;
    config.trim.normal = 0.10;
    config.trim.patient = 0.03;
    ASSERT_TRUE(config.validate().is_error());

    std::filesystem::path file_path = test_dir / "sizing.json";
    auto result = config.save_to_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(std::filesystem::exists(file_path));
}

TEST_F(ConfigBaseTest, SaveReplacesExistingFile) {
    std::filesystem::path file_path = test_dir / "trend.json";
    {
        std::ofstream file(file_path);
        file << "stale";
    }

    TrendEngineConfig config;
    config.adx_floor = 27.0;
    ASSERT_TRUE(config.save_to_file(file_path.string()).is_ok());
    EXPECT_FALSE(std::filesystem::exists(test_dir / "trend.json.tmp"));

    TrendEngineConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(file_path.string()).is_ok());
    EXPECT_DOUBLE_EQ(loaded.adx_floor, 27.0);
}

TEST_F(ConfigBaseTest, SaveIntoMissingDirectoryFails) {
    TrendEngineConfig config;
    auto result = config.save_to_file((test_dir / "absent" / "trend.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

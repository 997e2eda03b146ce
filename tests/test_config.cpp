/**
 * Campaign Keeper - Configuration Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"

using namespace keeper;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for tests
        testDir = std::filesystem::temp_directory_path() /
            ("campaign-keeper-config-test-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
    }
    
    void TearDown() override {
        // Clean up test directory
        std::filesystem::remove_all(testDir);
    }
    
    std::filesystem::path testDir;
};

TEST_F(ConfigManagerTest, InitializesWithDefaults) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    
    const auto& program = config.programConfig();
    EXPECT_EQ(program.campaignsDirectory, Platform::getDefaultCampaignsPath());
    EXPECT_EQ(program.entityExtension, ".md");
    EXPECT_EQ(program.logVerbosity, "info");
    EXPECT_EQ(program.lockStallWarningSeconds, 30);
    EXPECT_TRUE(program.activeCampaign.empty());
    EXPECT_EQ(config.logDirectory(), testDir / "logs");
}

TEST_F(ConfigManagerTest, SavesAndLoadsConfig) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    
    ProgramConfig program = config.programConfig();
    program.campaignsDirectory = testDir / "campaigns";
    program.activeCampaign = "iron-sea";
    program.logVerbosity = "debug";
    program.lockStallWarningSeconds = 5;
    ASSERT_TRUE(config.setProgramConfig(program));
    
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_FALSE(config.isFirstRun());
    EXPECT_EQ(config.programConfig().campaignsDirectory, testDir / "campaigns");
    EXPECT_EQ(config.programConfig().activeCampaign, "iron-sea");
    EXPECT_EQ(config.programConfig().logVerbosity, "debug");
    EXPECT_EQ(config.programConfig().lockStallWarningSeconds, 5);
}

TEST_F(ConfigManagerTest, DetectsFirstRun) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_TRUE(config.isFirstRun());
    
    ASSERT_TRUE(config.save());
    EXPECT_FALSE(config.isFirstRun());
    EXPECT_TRUE(std::filesystem::exists(testDir / "config.json"));
}

TEST_F(ConfigManagerTest, NormalizesEntityExtension) {
    {
        std::ofstream file(testDir / "config.json");
        file << R"({"entityExtension": "txt"})";
    }
    
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_EQ(config.programConfig().entityExtension, ".txt");
}

TEST_F(ConfigManagerTest, FallsBackToDefaultsOnCorruptFile) {
    {
        std::ofstream file(testDir / "config.json");
        file << "{ not json";
    }
    
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.initialize(testDir));
    EXPECT_EQ(config.programConfig().entityExtension, ".md");
    EXPECT_EQ(config.programConfig().lockStallWarningSeconds, 30);
}

TEST(LogLevelTest, ParsesVerbosityNames) {
    EXPECT_EQ(logLevelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(logLevelFromString("warn"), spdlog::level::warn);
    EXPECT_EQ(logLevelFromString("error"), spdlog::level::err);
    EXPECT_EQ(logLevelFromString("nonsense"), spdlog::level::info);
}

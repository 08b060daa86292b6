/*
 * test_runner_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "config/runner_config.hpp"
#include "logging/log_setup.hpp"

#include <filesystem>
#include <fstream>
#include <random>

using namespace scriptdeck::config;
namespace fs = std::filesystem;

class RunnerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() /
               ("scriptdeck_config_" + std::to_string(rd()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(RunnerConfigTest, Defaults) {
    RunnerConfig config;
    EXPECT_TRUE(config.killProcessGroup);
    EXPECT_EQ(config.readBufferSize, 4096u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_FALSE(config.effectiveStoreDirectory().empty());
}

TEST_F(RunnerConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    auto config = RunnerConfig::fromJson(
        json{{"killProcessGroup", false}, {"logging", {{"level", "debug"}}}});
    EXPECT_FALSE(config.killProcessGroup);
    EXPECT_EQ(config.readBufferSize, 4096u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_TRUE(config.logging.enableConsole);
}

TEST_F(RunnerConfigTest, ZeroBufferFallsBackToDefault) {
    auto config = RunnerConfig::fromJson(json{{"readBufferSize", 0}});
    EXPECT_EQ(config.readBufferSize, 4096u);
}

TEST_F(RunnerConfigTest, StoreDirectoryOverride) {
    RunnerConfig config;
    config.storeDirectory = (dir_ / "mine").string();
    EXPECT_EQ(config.effectiveStoreDirectory().string(),
              (dir_ / "mine").string());
}

// =============================================================================
// Files
// =============================================================================

TEST_F(RunnerConfigTest, MissingFileGivesDefaults) {
    auto loaded = loadRunnerConfig(dir_ / "absent.json");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->storeDirectory.empty());
}

TEST_F(RunnerConfigTest, MalformedFileIsAnError) {
    std::ofstream(dir_ / "bad.json") << "{ nope";
    auto loaded = loadRunnerConfig(dir_ / "bad.json");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("bad.json"), std::string::npos);
}

TEST_F(RunnerConfigTest, SaveThenLoad) {
    RunnerConfig config;
    config.storeDirectory = "/srv/scripts";
    config.workingDirectory = "/srv";
    config.readBufferSize = 1024;
    config.gitBashCandidates = {"E:\\Git\\bin\\bash.exe"};
    config.logging.enableFile = true;
    config.logging.maxFiles = 2;

    auto path = dir_ / "nested" / "scriptdeck.json";
    ASSERT_TRUE(saveRunnerConfig(config, path).has_value());

    auto loaded = loadRunnerConfig(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->storeDirectory, "/srv/scripts");
    EXPECT_EQ(loaded->workingDirectory, "/srv");
    EXPECT_EQ(loaded->readBufferSize, 1024u);
    EXPECT_EQ(loaded->gitBashCandidates, config.gitBashCandidates);
    EXPECT_TRUE(loaded->logging.enableFile);
    EXPECT_EQ(loaded->logging.maxFiles, 2u);
}

// =============================================================================
// Logging
// =============================================================================

TEST_F(RunnerConfigTest, LogLevelNames) {
    EXPECT_EQ(logLevelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(logLevelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(logLevelFromString("err"), spdlog::level::err);
    EXPECT_EQ(logLevelFromString("fatal"), spdlog::level::critical);
    EXPECT_EQ(logLevelFromString("none"), spdlog::level::off);
    EXPECT_EQ(logLevelFromString("verbose"), spdlog::level::info);
}

TEST_F(RunnerConfigTest, SetupLoggingInstallsDefaultLogger) {
    LoggingConfig logging;
    logging.level = "warn";
    logging.enableConsole = false;
    logging.enableFile = true;
    logging.filePath = (dir_ / "logs" / "run.log").string();

    auto logger = scriptdeck::logging::setupLogging(logging);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "scriptdeck");
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    spdlog::warn("written to file");
    logger->flush();
    EXPECT_TRUE(fs::exists(dir_ / "logs" / "run.log"));

    // Leave a console logger behind for later tests
    LoggingConfig console;
    console.enableFile = false;
    scriptdeck::logging::setupLogging(console);
}

TEST_F(RunnerConfigTest, ConsoleLoggingKeepsStdoutClean) {
    // stdout carries run output and --json events
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    auto logger = scriptdeck::logging::setupLogging(LoggingConfig{});
    ASSERT_NE(logger, nullptr);
    spdlog::info("console log line");
    logger->flush();
    auto out = testing::internal::GetCapturedStdout();
    auto err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty()) << out;
    EXPECT_NE(err.find("console log line"), std::string::npos);
}

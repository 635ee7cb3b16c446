/*
 * test_types.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Tests for logging configuration types and initLogging

**************************************************/

#include <gtest/gtest.h>

#include "logging/logging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace sweeplink::logging;

// ============================================================================
// Level conversion
// ============================================================================

TEST(LevelConversionTest, FromStringAcceptsAliases) {
    EXPECT_EQ(levelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(levelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("warn"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("err"), spdlog::level::err);
    EXPECT_EQ(levelFromString("fatal"), spdlog::level::critical);
    EXPECT_EQ(levelFromString("off"), spdlog::level::off);
}

TEST(LevelConversionTest, UnknownNameFallsBackToInfo) {
    EXPECT_EQ(levelFromString("verbose"), spdlog::level::info);
    EXPECT_EQ(levelFromString(""), spdlog::level::info);
}

TEST(LevelConversionTest, ToStringRoundTripsThroughFromString) {
    for (auto level : {spdlog::level::trace, spdlog::level::debug,
                       spdlog::level::info, spdlog::level::warn,
                       spdlog::level::err, spdlog::level::critical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

TEST(SinkKindTest, ParsesNamesAndAliases) {
    EXPECT_EQ(sinkKindFromString("console"), SinkKind::Console);
    EXPECT_EQ(sinkKindFromString("stdout"), SinkKind::Console);
    EXPECT_EQ(sinkKindFromString("basic_file"), SinkKind::File);
    EXPECT_EQ(sinkKindFromString("rotating_file"), SinkKind::RotatingFile);
    EXPECT_FALSE(sinkKindFromString("syslog").has_value());
    EXPECT_EQ(sinkKindName(SinkKind::RotatingFile), "rotating_file");
}

// ============================================================================
// SinkConfig / LoggingConfig
// ============================================================================

TEST(SinkConfigTest, FromJsonUsesDefaults) {
    auto config = SinkConfig::fromJson(nlohmann::json::object());

    EXPECT_EQ(config.type, "console");
    EXPECT_EQ(config.level, spdlog::level::trace);
    EXPECT_EQ(config.maxFiles, 5u);
}

TEST(SinkConfigTest, FileOptionsOnlySerializedForFileSinks) {
    SinkConfig console;
    console.name = "console";
    EXPECT_FALSE(console.toJson().contains("filePath"));

    SinkConfig rotating;
    rotating.type = "rotating_file";
    rotating.filePath = "logs/fleet.log";
    rotating.maxFiles = 3;

    auto j = rotating.toJson();
    EXPECT_EQ(j["filePath"], "logs/fleet.log");
    EXPECT_EQ(j["maxFiles"], 3);
    EXPECT_EQ(SinkConfig::fromJson(j).maxFiles, 3u);
}

TEST(LoggingConfigTest, FromJsonReadsSinks) {
    auto j = nlohmann::json::parse(R"({
        "level": "debug",
        "pattern": "%v",
        "sinks": [
            {"name": "out", "type": "console"},
            {"name": "file", "type": "file", "filePath": "/tmp/x.log"}
        ]
    })");

    auto config = LoggingConfig::fromJson(j);

    EXPECT_EQ(config.level, spdlog::level::debug);
    EXPECT_EQ(config.pattern, "%v");
    ASSERT_EQ(config.sinks.size(), 2u);
    EXPECT_EQ(config.sinks[1].filePath, "/tmp/x.log");
}

TEST(LoggingConfigTest, ComponentLevelsOverrideDefault) {
    auto config = LoggingConfig::fromJson(nlohmann::json::parse(R"({
        "level": "warn",
        "flushLevel": "error",
        "components": {"transport": "trace", "bogus": 3}
    })"));

    EXPECT_EQ(config.flushLevel, spdlog::level::err);
    EXPECT_EQ(config.levelFor("transport"), spdlog::level::trace);
    EXPECT_EQ(config.levelFor("manager"), spdlog::level::warn);
    EXPECT_FALSE(config.components.contains("bogus"));

    auto j = config.toJson();
    EXPECT_EQ(j["components"]["transport"], "trace");
    EXPECT_EQ(LoggingConfig::fromJson(j).components, config.components);
}

TEST(LoggingConfigTest, NonArraySinksIgnored) {
    auto config = LoggingConfig::fromJson({{"sinks", "console"}});
    EXPECT_TRUE(config.sinks.empty());
}

// ============================================================================
// initLogging / getLogger
// ============================================================================

class InitLoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        logPath_ = std::filesystem::temp_directory_path() /
                   ("sweeplink_logging_" +
                    std::to_string(::testing::UnitTest::GetInstance()
                                       ->random_seed()) +
                    ".log");
        std::filesystem::remove(logPath_);
    }

    void TearDown() override {
        initLogging(LoggingConfig{});
        std::filesystem::remove(logPath_);
    }

    std::filesystem::path logPath_;
};

TEST_F(InitLoggingTest, NamedLoggersShareConfiguredSinks) {
    LoggingConfig config;
    config.level = spdlog::level::debug;
    config.pattern = "[%n] %v";
    SinkConfig file;
    file.name = "file";
    file.type = "file";
    file.filePath = logPath_.string();
    config.sinks.push_back(file);

    initLogging(config);
    auto logger = getLogger("init_test");
    logger->debug("hello {}", 42);
    logger->flush();

    std::ifstream in(logPath_);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[init_test] hello 42"), std::string::npos);
    EXPECT_EQ(getLogger("init_test").get(), logger.get());
}

TEST_F(InitLoggingTest, ReinitSwitchesExistingLoggers) {
    auto logger = getLogger("reinit_test");
    auto pinned = getLogger("reinit_pinned");

    LoggingConfig config;
    config.level = spdlog::level::err;
    config.components["reinit_pinned"] = spdlog::level::debug;
    initLogging(config);

    EXPECT_EQ(logger->level(), spdlog::level::err);
    EXPECT_EQ(pinned->level(), spdlog::level::debug);
}

TEST_F(InitLoggingTest, UnknownSinkTypeFallsBackToConsole) {
    LoggingConfig config;
    SinkConfig bogus;
    bogus.type = "syslog-over-carrier-pigeon";
    config.sinks.push_back(bogus);

    initLogging(config);

    EXPECT_EQ(getLogger("fallback_test")->sinks().size(), 1u);
}

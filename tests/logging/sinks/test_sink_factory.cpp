/*
 * test_sink_factory.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Tests for SinkFactory

**************************************************/

#include <gtest/gtest.h>

#include "logging/sinks/sink_factory.hpp"

#include <spdlog/sinks/sink.h>

#include <filesystem>

using namespace sweeplink::logging;

class SinkFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = std::filesystem::temp_directory_path() /
                   "sweeplink_sink_factory_test";
        std::filesystem::remove_all(testDir_);
    }

    void TearDown() override { std::filesystem::remove_all(testDir_); }

    std::filesystem::path testDir_;
};

TEST_F(SinkFactoryTest, CreateConsoleSink) {
    SinkConfig config;
    config.type = "console";
    config.level = spdlog::level::warn;

    auto sink = SinkFactory::createSink(config);

    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::warn);
}

TEST_F(SinkFactoryTest, StdoutIsConsoleAlias) {
    SinkConfig config;
    config.type = "stdout";
    EXPECT_NE(SinkFactory::createSink(config), nullptr);
}

TEST_F(SinkFactoryTest, FileSinkCreatesParentDirectories) {
    SinkConfig config;
    config.type = "file";
    config.filePath = (testDir_ / "nested" / "fleet.log").string();

    auto sink = SinkFactory::createSink(config);

    ASSERT_NE(sink, nullptr);
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "nested"));
}

TEST_F(SinkFactoryTest, RotatingFileSink) {
    SinkConfig config;
    config.type = "rotating_file";
    config.filePath = (testDir_ / "rotating.log").string();
    config.maxFileSize = 1024;
    config.maxFiles = 2;

    EXPECT_NE(SinkFactory::createSink(config), nullptr);
}

TEST_F(SinkFactoryTest, UnknownTypeReturnsNull) {
    SinkConfig config;
    config.type = "unknown";
    EXPECT_EQ(SinkFactory::createSink(config), nullptr);
}

TEST_F(SinkFactoryTest, FileSinkWithoutPathReturnsNull) {
    SinkConfig config;
    config.type = "file";
    EXPECT_EQ(SinkFactory::createSink(config), nullptr);
}

TEST_F(SinkFactoryTest, CreateSinksSkipsBrokenEntries) {
    SinkConfig file;
    file.type = "file";
    file.filePath = (testDir_ / "fleet.log").string();
    SinkConfig broken;
    broken.type = "unknown";

    EXPECT_EQ(SinkFactory::createSinks({broken, file}).size(), 1u);
}

TEST_F(SinkFactoryTest, CreateSinksNeverReturnsEmpty) {
    SinkConfig broken;
    broken.type = "file";

    EXPECT_EQ(SinkFactory::createSinks({broken}).size(), 1u);
    EXPECT_EQ(SinkFactory::createSinks({}).size(), 1u);
}

/*
 * test_fleet_config.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Tests for configuration sections and FleetConfig

**************************************************/

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>

#include "config/fleet_config.hpp"
#include "exception/exception.hpp"

using namespace sweeplink;
using namespace sweeplink::config;

namespace fs = std::filesystem;

class FleetConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("sweeplink_config_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto writeFile(const std::string& name, const std::string& content)
        -> fs::path {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    fs::path dir_;
};

// ============================================================================
// Sections
// ============================================================================

TEST(ConfigSectionTest, DefaultsMatchDocumentedValues) {
    auto manager = ManagerConfig::defaults();
    EXPECT_TRUE(manager.autoConnect);
    EXPECT_EQ(manager.refreshIntervalSeconds, 300u);
    EXPECT_EQ(manager.missingCyclesBeforeRemoval, 2u);
    EXPECT_EQ(manager.requestTimeoutMs, 10000u);

    auto transport = TransportConfig::defaults();
    EXPECT_EQ(transport.port, 8883);
    EXPECT_EQ(transport.commandTopicPrefix, "rr/m/i/");
    EXPECT_EQ(transport.responseTopicPrefix, "rr/m/o/");
    EXPECT_EQ(transport.reconnect.maxDelayMs, 300000u);
    EXPECT_EQ(transport.health.timeoutsBeforeRestart, 3u);

    EXPECT_EQ(LocalConfig::defaults().port, 58867);
    EXPECT_EQ(ManagerConfig::path(), "/sweeplink/manager");
}

TEST(ConfigSectionTest, MissingKeysTakeDefaults) {
    auto manager = ManagerConfig::fromJson({{"autoConnect", false}});

    EXPECT_FALSE(manager.autoConnect);
    EXPECT_EQ(manager.refreshIntervalSeconds, 300u);
}

TEST(ConfigSectionTest, TryFromJsonRejectsWrongType) {
    EXPECT_FALSE(ManagerConfig::tryFromJson({{"autoConnect", "yes"}}).has_value());
    EXPECT_TRUE(ManagerConfig::tryFromJson({{"autoConnect", true}}).has_value());
}

TEST(ConfigSectionTest, MergeAppliesPartialOverrides) {
    auto retry = RetryConfig::defaults();

    retry.merge({{"maxDelayMs", 5000}});

    EXPECT_EQ(retry.maxDelayMs, 5000u);
    EXPECT_EQ(retry.initialDelayMs, 1000u);
}

TEST(ConfigSectionTest, MergeNullRestoresDefault) {
    TransportConfig transport;
    transport.host = "broker.local";
    transport.reconnect.initialDelayMs = 50;

    transport.merge({{"host", nullptr}, {"reconnect", {{"maxDelayMs", 900}}}});

    EXPECT_TRUE(transport.host.empty());
    EXPECT_EQ(transport.reconnect.initialDelayMs, 50u);
    EXPECT_EQ(transport.reconnect.maxDelayMs, 900u);
}

TEST(ConfigSectionTest, MergeRejectsWrongType) {
    auto local = LocalConfig::defaults();

    EXPECT_THROW(local.merge({{"port", "http"}}), json::exception);
}

TEST(ConfigSectionTest, DiffIsPatchBetweenSections) {
    auto a = LocalConfig::defaults();
    auto b = a;
    b.port = 6000;

    auto patch = a.diff(b);

    ASSERT_EQ(patch.size(), 1u);
    EXPECT_EQ(patch[0]["op"], "replace");
    EXPECT_EQ(patch[0]["path"], "/port");
    EXPECT_EQ(patch[0]["value"], 6000);
    EXPECT_EQ(a.toJson().patch(patch), b.toJson());
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(a.diff(a).empty());
}

TEST(ConfigSectionTest, KeyIsLastPathComponent) {
    EXPECT_EQ(ManagerConfig::key(), "manager");
    EXPECT_EQ(TransportConfig::key(), "transport");
}

TEST(ConfigSectionTest, SectionValidatesUnderItsKey) {
    TransportConfig transport;
    transport.health.timeoutsBeforeRestart = 0;
    transport.reconnect.jitter = -0.1;

    auto result = transport.validate();

    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].path, "/transport/reconnect/jitter");
    EXPECT_EQ(result.errors[1].path, "/transport/health/timeoutsBeforeRestart");
}

TEST(ConfigSectionTest, CacheHasNoRangeChecks) {
    EXPECT_TRUE(CacheConfig{}.validate().isValid());
}

TEST(ConfigSectionTest, NestedTransportSections) {
    auto transport = TransportConfig::fromJson(
        {{"host", "mqtt.example.com"},
         {"reconnect", {{"initialDelayMs", 250}}},
         {"health", {{"restartCooldownSeconds", 60}}}});

    EXPECT_EQ(transport.host, "mqtt.example.com");
    EXPECT_EQ(transport.reconnect.initialDelayMs, 250u);
    EXPECT_EQ(transport.reconnect.maxDelayMs, 300000u);
    EXPECT_EQ(transport.health.restartCooldownSeconds, 60u);
}

// ============================================================================
// FleetConfig
// ============================================================================

TEST_F(FleetConfigTest, DefaultsAreValid) {
    FleetConfig cfg;

    EXPECT_TRUE(cfg.validate().isValid());
}

TEST_F(FleetConfigTest, FromJsonFillsMissingSections) {
    auto cfg = FleetConfig::fromJson(
        {{"manager", {{"refreshIntervalSeconds", 60}}},
         {"cache", {{"path", "/var/lib/sweeplink/cache.json"}}}});

    EXPECT_EQ(cfg.manager.refreshIntervalSeconds, 60u);
    EXPECT_EQ(cfg.cache.path, "/var/lib/sweeplink/cache.json");
    EXPECT_EQ(cfg.local.port, 58867);
}

TEST_F(FleetConfigTest, NonObjectRootThrows) {
    EXPECT_THROW((void)FleetConfig::fromJson(json::array()), ConfigError);
}

TEST_F(FleetConfigTest, WrongTypeThrowsConfigError) {
    EXPECT_THROW((void)FleetConfig::fromJson(
                     {{"transport", {{"port", "eighty"}}}}),
                 ConfigError);
}

TEST_F(FleetConfigTest, ValidateReportsEveryProblem) {
    FleetConfig cfg;
    cfg.manager.refreshIntervalSeconds = 0;
    cfg.transport.port = 70000;
    cfg.retry.multiplier = 0.5;
    cfg.retry.jitter = 1.5;
    cfg.local.port = 0;

    auto result = cfg.validate();

    EXPECT_FALSE(result.isValid());
    std::set<std::string> paths;
    for (const auto& error : result.errors) {
        paths.insert(error.path);
    }
    EXPECT_TRUE(paths.contains("/manager/refreshIntervalSeconds"));
    EXPECT_TRUE(paths.contains("/transport/port"));
    EXPECT_TRUE(paths.contains("/retry/multiplier"));
    EXPECT_TRUE(paths.contains("/retry/jitter"));
    EXPECT_TRUE(paths.contains("/local/port"));
}

TEST_F(FleetConfigTest, MaxDelayBelowInitialIsInvalid) {
    FleetConfig cfg;
    cfg.transport.reconnect.initialDelayMs = 5000;
    cfg.transport.reconnect.maxDelayMs = 1000;

    auto result = cfg.validate();

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path, "/transport/reconnect/maxDelayMs");
}

TEST_F(FleetConfigTest, SaveThenLoad) {
    FleetConfig cfg;
    cfg.manager.autoConnect = false;
    cfg.transport.host = "broker.local";
    cfg.logging.level = spdlog::level::debug;

    auto path = dir_ / "fleet.json";
    cfg.saveToFile(path);
    auto loaded = FleetConfig::loadFromFile(path);

    EXPECT_FALSE(loaded.manager.autoConnect);
    EXPECT_EQ(loaded.transport.host, "broker.local");
    EXPECT_EQ(loaded.logging.level, spdlog::level::debug);
    EXPECT_EQ(loaded.toJson(), cfg.toJson());
}

TEST_F(FleetConfigTest, LoadMissingFileThrows) {
    EXPECT_THROW((void)FleetConfig::loadFromFile(dir_ / "absent.json"),
                 ConfigError);
}

TEST_F(FleetConfigTest, LoadMalformedFileThrows) {
    auto path = writeFile("broken.json", "{ \"manager\": ");

    EXPECT_THROW((void)FleetConfig::loadFromFile(path), ConfigError);
}

TEST_F(FleetConfigTest, LoadInvalidValuesThrows) {
    auto path =
        writeFile("invalid.json", R"({"local": {"port": 99999}})");

    try {
        (void)FleetConfig::loadFromFile(path);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("/local/port"),
                  std::string::npos);
        EXPECT_EQ(e.kind(), ErrorKind::Config);
    }
}

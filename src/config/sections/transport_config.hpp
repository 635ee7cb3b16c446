/*
 * transport_config.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Cloud broker and local transport configuration

**************************************************/

#ifndef SWEEPLINK_CONFIG_SECTIONS_TRANSPORT_CONFIG_HPP
#define SWEEPLINK_CONFIG_SECTIONS_TRANSPORT_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace sweeplink::config {

/**
 * @brief Broker reconnection backoff
 */
struct ReconnectConfig {
    size_t initialDelayMs{1000};
    size_t maxDelayMs{300000};
    double multiplier{2.0};
    double jitter{0.1};

    [[nodiscard]] json toJson() const {
        return {{"initialDelayMs", initialDelayMs},
                {"maxDelayMs", maxDelayMs},
                {"multiplier", multiplier},
                {"jitter", jitter}};
    }

    [[nodiscard]] static ReconnectConfig fromJson(const json& j) {
        ReconnectConfig cfg;
        cfg.initialDelayMs = j.value("initialDelayMs", cfg.initialDelayMs);
        cfg.maxDelayMs = j.value("maxDelayMs", cfg.maxDelayMs);
        cfg.multiplier = j.value("multiplier", cfg.multiplier);
        cfg.jitter = j.value("jitter", cfg.jitter);
        return cfg;
    }

    void check(const ConfigChecker& checker) const {
        checker.backoff(initialDelayMs, maxDelayMs, multiplier, jitter);
    }
};

/**
 * @brief Broker health monitoring
 */
struct HealthConfig {
    size_t timeoutsBeforeRestart{3};     ///< Consecutive request timeouts
    size_t restartCooldownSeconds{1800}; ///< Minimum gap between restarts

    [[nodiscard]] json toJson() const {
        return {{"timeoutsBeforeRestart", timeoutsBeforeRestart},
                {"restartCooldownSeconds", restartCooldownSeconds}};
    }

    [[nodiscard]] static HealthConfig fromJson(const json& j) {
        HealthConfig cfg;
        cfg.timeoutsBeforeRestart =
            j.value("timeoutsBeforeRestart", cfg.timeoutsBeforeRestart);
        cfg.restartCooldownSeconds =
            j.value("restartCooldownSeconds", cfg.restartCooldownSeconds);
        return cfg;
    }

    void check(const ConfigChecker& checker) const {
        checker.positive("timeoutsBeforeRestart", timeoutsBeforeRestart);
    }
};

/**
 * @brief Cloud message broker configuration
 */
struct TransportConfig : ConfigSection<TransportConfig> {
    static constexpr std::string_view PATH = "/sweeplink/transport";

    std::string host;
    int port{8883};
    bool tls{true};
    std::string username;
    std::string password;
    std::string clientId;
    size_t keepAliveSeconds{60};
    size_t requestTimeoutMs{10000};
    std::string commandTopicPrefix{"rr/m/i/"};
    std::string responseTopicPrefix{"rr/m/o/"};

    ReconnectConfig reconnect;
    HealthConfig health;

    [[nodiscard]] json serialize() const {
        return {{"host", host},
                {"port", port},
                {"tls", tls},
                {"username", username},
                {"password", password},
                {"clientId", clientId},
                {"keepAliveSeconds", keepAliveSeconds},
                {"requestTimeoutMs", requestTimeoutMs},
                {"commandTopicPrefix", commandTopicPrefix},
                {"responseTopicPrefix", responseTopicPrefix},
                {"reconnect", reconnect.toJson()},
                {"health", health.toJson()}};
    }

    [[nodiscard]] static TransportConfig deserialize(const json& j) {
        TransportConfig cfg;
        cfg.host = j.value("host", cfg.host);
        cfg.port = j.value("port", cfg.port);
        cfg.tls = j.value("tls", cfg.tls);
        cfg.username = j.value("username", cfg.username);
        cfg.password = j.value("password", cfg.password);
        cfg.clientId = j.value("clientId", cfg.clientId);
        cfg.keepAliveSeconds = j.value("keepAliveSeconds", cfg.keepAliveSeconds);
        cfg.requestTimeoutMs = j.value("requestTimeoutMs", cfg.requestTimeoutMs);
        cfg.commandTopicPrefix =
            j.value("commandTopicPrefix", cfg.commandTopicPrefix);
        cfg.responseTopicPrefix =
            j.value("responseTopicPrefix", cfg.responseTopicPrefix);

        if (j.contains("reconnect")) {
            cfg.reconnect = ReconnectConfig::fromJson(j["reconnect"]);
        }
        if (j.contains("health")) {
            cfg.health = HealthConfig::fromJson(j["health"]);
        }
        return cfg;
    }

    void check(const ConfigChecker& checker) const {
        checker.port("port", port);
        checker.positive("keepAliveSeconds", keepAliveSeconds);
        checker.positive("requestTimeoutMs", requestTimeoutMs);
        reconnect.check(checker.at("reconnect"));
        health.check(checker.at("health"));
    }
};

/**
 * @brief Local network transport configuration
 */
struct LocalConfig : ConfigSection<LocalConfig> {
    static constexpr std::string_view PATH = "/sweeplink/local";

    bool enabled{true};
    int port{58867};
    size_t connectTimeoutMs{5000};
    size_t requestTimeoutMs{5000};

    [[nodiscard]] json serialize() const {
        return {{"enabled", enabled},
                {"port", port},
                {"connectTimeoutMs", connectTimeoutMs},
                {"requestTimeoutMs", requestTimeoutMs}};
    }

    [[nodiscard]] static LocalConfig deserialize(const json& j) {
        LocalConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.port = j.value("port", cfg.port);
        cfg.connectTimeoutMs = j.value("connectTimeoutMs", cfg.connectTimeoutMs);
        cfg.requestTimeoutMs = j.value("requestTimeoutMs", cfg.requestTimeoutMs);
        return cfg;
    }

    void check(const ConfigChecker& checker) const {
        checker.port("port", port);
        checker.positive("connectTimeoutMs", connectTimeoutMs);
        checker.positive("requestTimeoutMs", requestTimeoutMs);
    }
};

}  // namespace sweeplink::config

#endif  // SWEEPLINK_CONFIG_SECTIONS_TRANSPORT_CONFIG_HPP

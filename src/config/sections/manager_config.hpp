/*
 * manager_config.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Device manager, device retry and cache configuration

**************************************************/

#ifndef SWEEPLINK_CONFIG_SECTIONS_MANAGER_CONFIG_HPP
#define SWEEPLINK_CONFIG_SECTIONS_MANAGER_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace sweeplink::config {

/**
 * @brief Device manager configuration
 */
struct ManagerConfig : ConfigSection<ManagerConfig> {
    static constexpr std::string_view PATH = "/sweeplink/manager";

    bool autoConnect{true};               ///< Connect every mapped device
    size_t refreshIntervalSeconds{300};   ///< Inventory reconciliation period
    size_t missingCyclesBeforeRemoval{2}; ///< Orphan debounce
    size_t requestTimeoutMs{10000};       ///< Default send() timeout

    [[nodiscard]] json serialize() const {
        return {{"autoConnect", autoConnect},
                {"refreshIntervalSeconds", refreshIntervalSeconds},
                {"missingCyclesBeforeRemoval", missingCyclesBeforeRemoval},
                {"requestTimeoutMs", requestTimeoutMs}};
    }

    [[nodiscard]] static ManagerConfig deserialize(const json& j) {
        ManagerConfig cfg;
        cfg.autoConnect = j.value("autoConnect", cfg.autoConnect);
        cfg.refreshIntervalSeconds =
            j.value("refreshIntervalSeconds", cfg.refreshIntervalSeconds);
        cfg.missingCyclesBeforeRemoval = j.value(
            "missingCyclesBeforeRemoval", cfg.missingCyclesBeforeRemoval);
        cfg.requestTimeoutMs = j.value("requestTimeoutMs", cfg.requestTimeoutMs);
        return cfg;
    }

    void check(const ConfigChecker& checker) const {
        checker.positive("refreshIntervalSeconds", refreshIntervalSeconds);
        checker.positive("missingCyclesBeforeRemoval",
                         missingCyclesBeforeRemoval);
        checker.positive("requestTimeoutMs", requestTimeoutMs);
    }
};

/**
 * @brief Per-device reconnection policy
 */
struct RetryConfig : ConfigSection<RetryConfig> {
    static constexpr std::string_view PATH = "/sweeplink/retry";

    size_t initialDelayMs{1000};
    size_t maxDelayMs{60000};
    double multiplier{2.0};
    double jitter{0.2};  ///< Fraction of the delay, symmetric

    [[nodiscard]] json serialize() const {
        return {{"initialDelayMs", initialDelayMs},
                {"maxDelayMs", maxDelayMs},
                {"multiplier", multiplier},
                {"jitter", jitter}};
    }

    [[nodiscard]] static RetryConfig deserialize(const json& j) {
        RetryConfig cfg;
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
 * @brief Inventory cache location; an empty path keeps the cache in memory
 */
struct CacheConfig : ConfigSection<CacheConfig> {
    static constexpr std::string_view PATH = "/sweeplink/cache";

    std::string path;

    [[nodiscard]] json serialize() const { return {{"path", path}}; }

    [[nodiscard]] static CacheConfig deserialize(const json& j) {
        CacheConfig cfg;
        cfg.path = j.value("path", cfg.path);
        return cfg;
    }
};

}  // namespace sweeplink::config

#endif  // SWEEPLINK_CONFIG_SECTIONS_MANAGER_CONFIG_HPP

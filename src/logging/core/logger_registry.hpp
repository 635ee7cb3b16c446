/*
 * logger_registry.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Registry of the per-component loggers

**************************************************/

#ifndef SWEEPLINK_LOGGING_LOGGER_REGISTRY_HPP
#define SWEEPLINK_LOGGING_LOGGER_REGISTRY_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "../types.hpp"

namespace sweeplink::logging {

/**
 * @brief Owns one spdlog logger per component ("transport", "manager", ...)
 *
 * Every logger shares the registry's sinks. A component runs at the default
 * level unless its level was pinned, either through the "components" map of
 * the configuration or through setLevel(). Loggers are kept out of spdlog's
 * global registry so that configuring one registry never touches another.
 *
 * All methods are thread-safe.
 */
class LoggerRegistry {
public:
    LoggerRegistry() = default;

    LoggerRegistry(const LoggerRegistry&) = delete;
    LoggerRegistry& operator=(const LoggerRegistry&) = delete;

    /**
     * @brief Install sinks and levels; existing loggers are switched over
     */
    void configure(std::vector<spdlog::sink_ptr> sinks,
                   const LoggingConfig& config);

    /**
     * @brief Logger of a component, created on first use
     */
    auto getOrCreate(const std::string& name)
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @return nullptr if the component has no logger yet
     */
    [[nodiscard]] auto get(const std::string& name) const
        -> std::shared_ptr<spdlog::logger>;

    [[nodiscard]] auto exists(const std::string& name) const -> bool;

    auto remove(const std::string& name) -> bool;

    [[nodiscard]] auto list() const -> std::vector<LoggerInfo>;

    /**
     * @brief Pin the level of one component
     * @return false if the component has no logger
     */
    auto setLevel(const std::string& name, Level level) -> bool;

    /**
     * @brief Change the default level; pinned components keep theirs
     */
    void setDefaultLevel(Level level);

    [[nodiscard]] auto defaultLevel() const -> Level;

    /**
     * @return false if the component has no logger
     */
    auto setPattern(const std::string& name, const std::string& pattern)
        -> bool;

    [[nodiscard]] auto getPattern(const std::string& name) const
        -> std::string;

    [[nodiscard]] auto sinks() const -> std::vector<spdlog::sink_ptr>;

    void flushAll();

    /**
     * @brief Forget every logger; sinks and levels stay configured
     */
    void clear();

    [[nodiscard]] auto count() const -> size_t;

private:
    struct Entry {
        std::shared_ptr<spdlog::logger> logger;
        std::string pattern;
        bool pinned{false};
    };

    auto makeEntry(const std::string& name) const -> Entry;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> loggers_;
    std::vector<spdlog::sink_ptr> sinks_;
    Level level_{Level::info};
    Level flushLevel_{Level::warn};
    std::string pattern_{LoggingConfig{}.pattern};
    std::map<std::string, Level> components_;
};

}  // namespace sweeplink::logging

#endif  // SWEEPLINK_LOGGING_LOGGER_REGISTRY_HPP

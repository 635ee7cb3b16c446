/*
 * fleet_config.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Top-level configuration document

**************************************************/

#ifndef SWEEPLINK_CONFIG_FLEET_CONFIG_HPP
#define SWEEPLINK_CONFIG_FLEET_CONFIG_HPP

#include <filesystem>

#include "core/config_section.hpp"
#include "logging/types.hpp"
#include "sections/manager_config.hpp"
#include "sections/transport_config.hpp"

namespace sweeplink::config {

/**
 * @brief Aggregate of every configuration section
 *
 * JSON layout:
 * @code
 * {
 *   "logging":   {...},
 *   "manager":   {...},
 *   "retry":     {...},
 *   "transport": {...},
 *   "local":     {...},
 *   "cache":     {...}
 * }
 * @endcode
 */
struct FleetConfig {
    logging::LoggingConfig logging;
    ManagerConfig manager;
    RetryConfig retry;
    TransportConfig transport;
    LocalConfig local;
    CacheConfig cache;

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Build from a parsed document, missing keys take defaults
     * @throws ConfigError if a value has the wrong type
     */
    [[nodiscard]] static auto fromJson(const json& j) -> FleetConfig;

    /**
     * @brief Read, parse and validate a configuration file
     * @throws ConfigError on I/O, parse or validation failure
     */
    [[nodiscard]] static auto loadFromFile(const std::filesystem::path& path)
        -> FleetConfig;

    /**
     * @brief Write the configuration as pretty-printed JSON
     * @throws ConfigError if the file cannot be written
     */
    void saveToFile(const std::filesystem::path& path) const;

    /**
     * @brief Check value ranges of every section
     */
    [[nodiscard]] auto validate() const -> ConfigValidationResult;
};

}  // namespace sweeplink::config

#endif  // SWEEPLINK_CONFIG_FLEET_CONFIG_HPP

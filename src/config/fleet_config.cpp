/*
 * fleet_config.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "fleet_config.hpp"

#include <fstream>
#include <sstream>

#include "exception/exception.hpp"
#include "logging/logging.hpp"

namespace sweeplink::config {

auto FleetConfig::toJson() const -> json {
    return {{"logging", logging.toJson()},
            {"manager", manager.toJson()},
            {"retry", retry.toJson()},
            {"transport", transport.toJson()},
            {"local", local.toJson()},
            {"cache", cache.toJson()}};
}

auto FleetConfig::fromJson(const json& j) -> FleetConfig {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    FleetConfig cfg;
    try {
        if (j.contains("logging")) {
            cfg.logging = logging::LoggingConfig::fromJson(j["logging"]);
        }
        if (j.contains("manager")) {
            cfg.manager = ManagerConfig::fromJson(j["manager"]);
        }
        if (j.contains("retry")) {
            cfg.retry = RetryConfig::fromJson(j["retry"]);
        }
        if (j.contains("transport")) {
            cfg.transport = TransportConfig::fromJson(j["transport"]);
        }
        if (j.contains("local")) {
            cfg.local = LocalConfig::fromJson(j["local"]);
        }
        if (j.contains("cache")) {
            cfg.cache = CacheConfig::fromJson(j["cache"]);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") +
                          e.what());
    }
    return cfg;
}

auto FleetConfig::loadFromFile(const std::filesystem::path& path)
    -> FleetConfig {
    auto logger = logging::getLogger("config");

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open configuration file: " + path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse configuration file " + path.string() +
                          ": " + e.what());
    }

    auto cfg = fromJson(document);
    auto result = cfg.validate();
    if (!result) {
        std::ostringstream oss;
        oss << "invalid configuration in " << path.string() << ":";
        for (const auto& error : result.errors) {
            logger->error("Config error at '{}': {}", error.path,
                          error.message);
            oss << " " << error.path << ": " << error.message << ";";
        }
        throw ConfigError(oss.str());
    }

    logger->info("Loaded config from file: {}", path.string());
    return cfg;
}

void FleetConfig::saveToFile(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw ConfigError("cannot write configuration file: " + path.string());
    }
    file << toJson().dump(4);
    if (!file) {
        throw ConfigError("failed writing configuration file: " +
                          path.string());
    }
}

auto FleetConfig::validate() const -> ConfigValidationResult {
    ConfigValidationResult result;
    manager.validate(result);
    retry.validate(result);
    transport.validate(result);
    local.validate(result);
    return result;
}

}  // namespace sweeplink::config

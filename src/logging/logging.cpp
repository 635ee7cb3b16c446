/*
 * logging.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "logging.hpp"

namespace sweeplink::logging {

auto registry() -> LoggerRegistry& {
    static LoggerRegistry instance;
    return instance;
}

void initLogging(const LoggingConfig& config) {
    registry().configure(SinkFactory::createSinks(config.sinks), config);
    registry().getOrCreate("config")->debug(
        "Logging at {} with {} sinks, {} component overrides",
        levelToString(config.level), registry().sinks().size(),
        config.components.size());
}

auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    return registry().getOrCreate(name);
}

}  // namespace sweeplink::logging

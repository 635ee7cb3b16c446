/**
 * @file logging.hpp
 * @brief Entry point of the sweeplink logging layer.
 *
 * @par Usage Example:
 * @code
 * #include "logging/logging.hpp"
 *
 * sweeplink::logging::initLogging(config.logging);
 * auto logger = sweeplink::logging::getLogger("manager");
 * logger->info("loaded {} devices", count);
 * @endcode
 *
 * @date 2024-12
 * @copyright Copyright (C) 2024 The sweeplink Authors
 */

#ifndef SWEEPLINK_LOGGING_LOGGING_HPP
#define SWEEPLINK_LOGGING_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "core/logger_registry.hpp"
#include "sinks/sink_factory.hpp"
#include "types.hpp"

namespace sweeplink::logging {

/**
 * @brief Install sinks, levels and pattern from configuration
 *
 * Component loggers that already exist are switched to the new sinks.
 * Sinks that fail to be created are skipped; if none remain a console sink
 * is used.
 */
void initLogging(const LoggingConfig& config);

/**
 * @brief Logger of a component, sharing the configured sinks
 */
[[nodiscard]] auto getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Process-wide registry behind getLogger()
 */
[[nodiscard]] auto registry() -> LoggerRegistry&;

}  // namespace sweeplink::logging

#endif  // SWEEPLINK_LOGGING_LOGGING_HPP

/*
 * sink_factory.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Builds spdlog sinks from the logging configuration

**************************************************/

#ifndef SWEEPLINK_LOGGING_SINKS_SINK_FACTORY_HPP
#define SWEEPLINK_LOGGING_SINKS_SINK_FACTORY_HPP

#include <vector>

#include <spdlog/spdlog.h>

#include "../types.hpp"

namespace sweeplink::logging {

/**
 * @brief Creates console, file and rotating file sinks
 *
 * File sinks create their parent directory. Failures are reported on the
 * default spdlog logger and yield nullptr, so a bad sink entry never stops
 * the fleet from starting.
 */
class SinkFactory {
public:
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

    /**
     * @brief Build every configured sink, skipping the ones that fail
     * @return At least one sink; a colour console sink when nothing else
     * could be built
     */
    [[nodiscard]] static auto createSinks(const std::vector<SinkConfig>& configs)
        -> std::vector<spdlog::sink_ptr>;

    [[nodiscard]] static auto createConsoleSink() -> spdlog::sink_ptr;

private:
    static auto build(SinkKind kind, const SinkConfig& config)
        -> spdlog::sink_ptr;
};

}  // namespace sweeplink::logging

#endif  // SWEEPLINK_LOGGING_SINKS_SINK_FACTORY_HPP

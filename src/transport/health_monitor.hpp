/*
 * health_monitor.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Broker connection health tracking

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_HEALTH_MONITOR_HPP
#define SWEEPLINK_TRANSPORT_HEALTH_MONITOR_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

namespace sweeplink::transport {

/**
 * @brief Decides when repeated request timeouts warrant a reconnect
 *
 * A connection that silently stops delivering responses shows up only as
 * timeouts. After `threshold` consecutive timeouts onTimeout() asks for a
 * restart, at most once per cooldown period.
 */
class HealthMonitor {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    HealthMonitor(size_t threshold, std::chrono::seconds cooldown,
                  NowFn now = [] { return Clock::now(); });

    /**
     * @brief Record a timeout
     * @return true if the connection should be restarted now
     */
    auto onTimeout() -> bool;

    void onSuccess();

    [[nodiscard]] auto consecutiveTimeouts() const -> size_t;

    [[nodiscard]] auto restarts() const -> size_t;

private:
    size_t threshold_;
    std::chrono::seconds cooldown_;
    NowFn now_;

    mutable std::mutex mutex_;
    size_t consecutive_{0};
    size_t restarts_{0};
    std::optional<Clock::time_point> lastRestart_;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_HEALTH_MONITOR_HPP

/*
 * health_monitor.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "health_monitor.hpp"

namespace sweeplink::transport {

HealthMonitor::HealthMonitor(size_t threshold, std::chrono::seconds cooldown,
                             NowFn now)
    : threshold_(threshold), cooldown_(cooldown), now_(std::move(now)) {}

auto HealthMonitor::onTimeout() -> bool {
    std::lock_guard lock(mutex_);
    ++consecutive_;
    if (consecutive_ < threshold_) {
        return false;
    }

    auto now = now_();
    if (lastRestart_ && now - *lastRestart_ < cooldown_) {
        return false;
    }

    lastRestart_ = now;
    consecutive_ = 0;
    ++restarts_;
    return true;
}

void HealthMonitor::onSuccess() {
    std::lock_guard lock(mutex_);
    consecutive_ = 0;
}

auto HealthMonitor::consecutiveTimeouts() const -> size_t {
    std::lock_guard lock(mutex_);
    return consecutive_;
}

auto HealthMonitor::restarts() const -> size_t {
    std::lock_guard lock(mutex_);
    return restarts_;
}

}  // namespace sweeplink::transport

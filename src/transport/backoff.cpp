/*
 * backoff.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "backoff.hpp"

#include <algorithm>
#include <cmath>

namespace sweeplink::transport {

ExponentialBackoff::ExponentialBackoff(BackoffConfig config,
                                       std::optional<uint32_t> seed)
    : config_(config), rng_(seed.value_or(std::random_device{}())) {}

auto ExponentialBackoff::next() -> std::chrono::milliseconds {
    auto maxMs = static_cast<double>(config_.maxDelay.count());
    auto delay = static_cast<double>(config_.initialDelay.count()) *
                 std::pow(config_.multiplier, attempts_);
    delay = std::min(delay, maxMs);

    if (config_.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(-config_.jitter,
                                                    config_.jitter);
        delay += delay * dist(rng_);
    }

    ++attempts_;
    return std::chrono::milliseconds(
        static_cast<long long>(std::clamp(delay, 0.0, maxMs)));
}

}  // namespace sweeplink::transport

/*
 * backoff.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Exponential backoff with symmetric jitter

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_BACKOFF_HPP
#define SWEEPLINK_TRANSPORT_BACKOFF_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace sweeplink::transport {

struct BackoffConfig {
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
    double multiplier{2.0};
    double jitter{0.0};  ///< Fraction of the delay, applied +/-
};

/**
 * @brief Delay generator: min(initial * multiplier^n, max), jittered
 *
 * The returned delay is never negative and never exceeds maxDelay.
 * Not thread-safe; each retry loop owns its own instance.
 */
class ExponentialBackoff {
public:
    explicit ExponentialBackoff(BackoffConfig config,
                                std::optional<uint32_t> seed = std::nullopt);

    [[nodiscard]] auto next() -> std::chrono::milliseconds;

    void reset() noexcept { attempts_ = 0; }

    [[nodiscard]] auto attempts() const noexcept -> uint32_t {
        return attempts_;
    }

    [[nodiscard]] auto config() const noexcept -> const BackoffConfig& {
        return config_;
    }

private:
    BackoffConfig config_;
    uint32_t attempts_{0};
    std::mt19937 rng_;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_BACKOFF_HPP

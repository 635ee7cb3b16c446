/*
 * connection.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Per-device connection with local/cloud fallback and retry

**************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include <spdlog/logger.h>

#include "config/sections/manager_config.hpp"
#include "transport/channel.hpp"
#include "types.hpp"

namespace sweeplink::device {

/**
 * @brief Settings shared by every device connection
 */
struct ConnectionOptions {
    config::RetryConfig retry;
    std::chrono::milliseconds cloudTimeout{10000};
    std::chrono::milliseconds localTimeout{5000};
};

/**
 * @brief Keeps one device reachable
 *
 * A worker thread opens the local channel when there is one and falls back
 * to the cloud channel. Failed attempts are retried with jittered
 * exponential backoff until close(); a lost channel is re-established
 * immediately. The state callback fires once per actual state change.
 */
class DeviceConnection {
public:
    DeviceConnection(std::string duid,
                     std::unique_ptr<transport::Channel> localChannel,
                     std::unique_ptr<transport::Channel> cloudChannel,
                     ConnectionOptions options, StateCallback callback);
    ~DeviceConnection();

    DeviceConnection(const DeviceConnection&) = delete;
    DeviceConnection& operator=(const DeviceConnection&) = delete;

    /**
     * @brief Start connection attempts; returns immediately, idempotent
     */
    void startConnect();

    /**
     * @brief Stop retrying and close both channels; idempotent
     *
     * Called from the state callback, the worker is left to unwind and
     * the destructor waits for it.
     */
    void close();

    /**
     * @brief Send a command over the active channel
     * @param timeout Defaults to the active channel's request timeout
     * @throws ConnectivityFailure when no channel is connected
     * @throws RequestTimeout, RequestCancelled from the channel
     */
    auto send(const std::string& payload,
              std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> std::string;

    [[nodiscard]] auto state() const -> ConnectivityState { return state_; }
    [[nodiscard]] auto activeChannelKind() const
        -> std::optional<transport::ChannelKind>;
    [[nodiscard]] auto duid() const -> const std::string& { return duid_; }
    [[nodiscard]] auto isClosed() const -> bool { return closed_; }

    /**
     * @brief Whether the caller runs on this connection's worker, i.e.
     * inside its state callback
     */
    [[nodiscard]] auto isWorkerThread() const -> bool;

private:
    void run(std::stop_token stopToken);
    auto establish() -> bool;
    void onChannelLost(const transport::Channel* channel,
                       const std::string& reason);
    void setState(ConnectivityState next,
                  const std::optional<std::string>& lastError);

    std::string duid_;
    std::shared_ptr<transport::Channel> local_;
    std::shared_ptr<transport::Channel> cloud_;
    ConnectionOptions options_;
    StateCallback callback_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::shared_ptr<transport::Channel> active_;
    bool channelLost_{false};
    std::jthread worker_;
    std::thread::id workerId_;
    bool workerStarted_{false};
    bool workerDone_{false};

    std::timed_mutex notifyMutex_;
    std::atomic<ConnectivityState> state_{ConnectivityState::Idle};
    std::atomic<bool> closed_{false};
};

}  // namespace sweeplink::device

/*
 * connection.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "connection.hpp"

#include "exception/exception.hpp"
#include "logging/logging.hpp"
#include "transport/backoff.hpp"

namespace sweeplink::device {

namespace {

constexpr auto kNotifyPollInterval = std::chrono::milliseconds(20);

auto toBackoff(const config::RetryConfig& retry) -> transport::BackoffConfig {
    return {std::chrono::milliseconds(retry.initialDelayMs),
            std::chrono::milliseconds(retry.maxDelayMs), retry.multiplier,
            retry.jitter};
}

}  // namespace

DeviceConnection::DeviceConnection(
    std::string duid, std::unique_ptr<transport::Channel> localChannel,
    std::unique_ptr<transport::Channel> cloudChannel, ConnectionOptions options,
    StateCallback callback)
    : duid_(std::move(duid)),
      local_(std::move(localChannel)),
      cloud_(std::move(cloudChannel)),
      options_(std::move(options)),
      callback_(std::move(callback)),
      logger_(logging::getLogger("device")) {
    for (const auto& channel : {local_, cloud_}) {
        if (!channel) {
            continue;
        }
        auto* raw = channel.get();
        channel->setDisconnectCallback(
            [this, raw](const std::string& reason) {
                onChannelLost(raw, reason);
            });
        channel->setMessageCallback([this, raw](const std::string& payload) {
            logger_->trace("{}: {} push of {} bytes", duid_,
                           transport::channelKindName(raw->kind()),
                           payload.size());
        });
    }
}

DeviceConnection::~DeviceConnection() {
    close();
    std::unique_lock lock(mutex_);
    if (workerStarted_ && workerId_ != std::this_thread::get_id()) {
        cv_.wait(lock, [this] { return workerDone_; });
    }
}

void DeviceConnection::startConnect() {
    std::lock_guard lock(mutex_);
    if (closed_ || worker_.joinable()) {
        return;
    }
    worker_ = std::jthread([this](std::stop_token st) {
        run(st);
        std::lock_guard doneLock(mutex_);
        workerDone_ = true;
        workerId_ = std::thread::id();
        cv_.notify_all();
    });
    workerId_ = worker_.get_id();
    workerStarted_ = true;
}

auto DeviceConnection::isWorkerThread() const -> bool {
    std::lock_guard lock(mutex_);
    return workerId_ == std::this_thread::get_id();
}

void DeviceConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }

    std::jthread worker;
    {
        std::lock_guard lock(mutex_);
        worker = std::move(worker_);
        active_.reset();
    }
    if (worker.joinable()) {
        worker.request_stop();
        cv_.notify_all();
        if (worker.get_id() == std::this_thread::get_id()) {
            // close() from the state callback
            worker.detach();
        } else {
            worker.join();
        }
    }

    for (const auto& channel : {local_, cloud_}) {
        if (channel) {
            channel->setDisconnectCallback(nullptr);
            channel->setMessageCallback(nullptr);
            channel->close();
        }
    }
    logger_->debug("{}: connection closed", duid_);
}

auto DeviceConnection::send(const std::string& payload,
                            std::optional<std::chrono::milliseconds> timeout)
    -> std::string {
    std::shared_ptr<transport::Channel> channel;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            throw RequestCancelled("connection to " + duid_ + " is closed");
        }
        channel = active_;
    }
    if (!channel) {
        throw ConnectivityFailure(duid_ + " is not connected");
    }

    auto effective = timeout.value_or(
        channel->kind() == transport::ChannelKind::Local
            ? options_.localTimeout
            : options_.cloudTimeout);
    try {
        return channel->request(payload, effective);
    } catch (const ConnectivityFailure& e) {
        onChannelLost(channel.get(), e.what());
        throw;
    }
}

auto DeviceConnection::activeChannelKind() const
    -> std::optional<transport::ChannelKind> {
    std::lock_guard lock(mutex_);
    if (!active_) {
        return std::nullopt;
    }
    return active_->kind();
}

void DeviceConnection::run(std::stop_token stopToken) {
    transport::ExponentialBackoff backoff(toBackoff(options_.retry));

    while (!stopToken.stop_requested()) {
        if (!establish()) {
            auto delay = backoff.next();
            logger_->debug("{}: retrying in {} ms (attempt {})", duid_,
                           delay.count(), backoff.attempts());
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, stopToken, delay, [] { return false; });
            continue;
        }

        backoff.reset();
        std::unique_lock lock(mutex_);
        cv_.wait(lock, stopToken, [this] { return channelLost_; });
        channelLost_ = false;
    }
}

auto DeviceConnection::establish() -> bool {
    std::optional<std::string> lastError;

    for (const auto& channel : {local_, cloud_}) {
        if (!channel || closed_) {
            continue;
        }
        try {
            channel->open();
        } catch (const FleetException& e) {
            lastError = e.what();
            logger_->warn("{}: {} channel failed: {}", duid_,
                          transport::channelKindName(channel->kind()),
                          e.what());
            continue;
        }

        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return true;
            }
            active_ = channel;
            channelLost_ = false;
        }
        setState(ConnectivityState::Connected, std::nullopt);
        return true;
    }

    if (!lastError) {
        lastError = "no channel available for " + duid_;
    }
    setState(ConnectivityState::Disconnected, lastError);
    return false;
}

void DeviceConnection::onChannelLost(const transport::Channel* channel,
                                     const std::string& reason) {
    {
        std::lock_guard lock(mutex_);
        if (!active_ || active_.get() != channel) {
            return;
        }
        active_.reset();
        channelLost_ = true;
    }
    cv_.notify_all();

    logger_->warn("{}: channel lost: {}", duid_, reason);
    setState(ConnectivityState::Disconnected, reason);
}

void DeviceConnection::setState(ConnectivityState next,
                                const std::optional<std::string>& lastError) {
    // Gives up once closed: close() may be joining this thread
    std::unique_lock lock(notifyMutex_, std::defer_lock);
    while (!lock.try_lock_for(kNotifyPollInterval)) {
        if (closed_) {
            return;
        }
    }
    if (closed_ || state_.exchange(next) == next) {
        return;
    }

    logger_->info("{}: {}", duid_, connectivityStateName(next));
    if (callback_) {
        try {
            callback_(duid_, next, lastError);
        } catch (const std::exception& e) {
            logger_->error("{}: state callback threw: {}", duid_, e.what());
        }
    }
}

}  // namespace sweeplink::device

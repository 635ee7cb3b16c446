/*
 * fake_channel.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Scriptable device channels, connection factory and mocks

**************************************************/

#ifndef SWEEPLINK_TESTS_FAKES_FAKE_CHANNEL_HPP
#define SWEEPLINK_TESTS_FAKES_FAKE_CHANNEL_HPP

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "device/connection_factory.hpp"
#include "exception/exception.hpp"
#include "inventory/account.hpp"
#include "inventory/cache.hpp"
#include "transport/channel.hpp"

namespace sweeplink::test {

/**
 * @brief Shared state of a fake link, kept by the test after the channel
 *        itself has been handed to a DeviceConnection
 */
struct FakeLink {
    using Responder = std::function<std::string(const std::string& payload)>;

    std::atomic<bool> failOpen{false};
    std::atomic<bool> open{false};
    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<int> requests{0};

    std::mutex mutex;
    Responder responder;
    std::optional<std::chrono::milliseconds> lastTimeout;
    transport::Channel::DisconnectCallback disconnectCallback;
    transport::Channel::PushCallback pushCallback;

    void setResponder(Responder next) {
        std::lock_guard lock(mutex);
        responder = std::move(next);
    }

    /// Lose an open link the way a network failure would
    void drop(const std::string& reason = "link dropped") {
        if (!open.exchange(false)) {
            return;
        }
        transport::Channel::DisconnectCallback callback;
        {
            std::lock_guard lock(mutex);
            callback = disconnectCallback;
        }
        if (callback) {
            callback(reason);
        }
    }

    void push(const std::string& payload) {
        transport::Channel::PushCallback callback;
        {
            std::lock_guard lock(mutex);
            callback = pushCallback;
        }
        if (callback) {
            callback(payload);
        }
    }

    [[nodiscard]] auto timeoutSeen() -> std::optional<std::chrono::milliseconds> {
        std::lock_guard lock(mutex);
        return lastTimeout;
    }
};

class FakeChannel : public transport::Channel {
public:
    FakeChannel(transport::ChannelKind kind, std::shared_ptr<FakeLink> link)
        : kind_(kind), link_(std::move(link)) {}

    ~FakeChannel() override { close(); }

    void open() override {
        ++link_->opens;
        if (link_->failOpen) {
            throw ConnectivityFailure(
                std::string(transport::channelKindName(kind_)) +
                " endpoint unreachable");
        }
        link_->open = true;
    }

    void close() override {
        if (link_->open.exchange(false)) {
            ++link_->closes;
        }
    }

    [[nodiscard]] auto isOpen() const -> bool override { return link_->open; }

    auto request(const std::string& payload, std::chrono::milliseconds timeout)
        -> std::string override {
        ++link_->requests;
        FakeLink::Responder responder;
        {
            std::lock_guard lock(link_->mutex);
            link_->lastTimeout = timeout;
            responder = link_->responder;
        }
        if (!link_->open) {
            throw ConnectivityFailure("fake channel is not open");
        }
        if (!responder) {
            return std::string(transport::channelKindName(kind_)) + ":" +
                   payload;
        }
        return responder(payload);
    }

    [[nodiscard]] auto kind() const -> transport::ChannelKind override {
        return kind_;
    }

    void setDisconnectCallback(DisconnectCallback callback) override {
        std::lock_guard lock(link_->mutex);
        link_->disconnectCallback = std::move(callback);
    }

    void setMessageCallback(PushCallback callback) override {
        std::lock_guard lock(link_->mutex);
        link_->pushCallback = std::move(callback);
    }

private:
    transport::ChannelKind kind_;
    std::shared_ptr<FakeLink> link_;
};

/**
 * @brief Retry and timeout settings short enough for unit tests
 */
inline auto fastConnectionOptions() -> device::ConnectionOptions {
    device::ConnectionOptions options;
    options.retry.initialDelayMs = 10;
    options.retry.maxDelayMs = 40;
    options.retry.multiplier = 2.0;
    options.retry.jitter = 0.0;
    options.cloudTimeout = std::chrono::milliseconds(300);
    options.localTimeout = std::chrono::milliseconds(150);
    return options;
}

/**
 * @brief Factory wiring fake links; links are created on first use and
 *        survive connection re-creation so tests can script them up front
 */
class FakeConnectionFactory : public device::DeviceConnectionFactory {
public:
    explicit FakeConnectionFactory(
        device::ConnectionOptions options = fastConnectionOptions())
        : options_(std::move(options)) {}

    auto create(const inventory::DeviceDescriptor& descriptor,
                device::StateCallback callback)
        -> std::shared_ptr<device::DeviceConnection> override {
        std::unique_ptr<transport::Channel> local;
        if (descriptor.localAddress) {
            local = std::make_unique<FakeChannel>(
                transport::ChannelKind::Local,
                link(descriptor.duid, transport::ChannelKind::Local));
        }
        auto cloud = std::make_unique<FakeChannel>(
            transport::ChannelKind::Cloud,
            link(descriptor.duid, transport::ChannelKind::Cloud));

        auto connection = std::make_shared<device::DeviceConnection>(
            descriptor.duid, std::move(local), std::move(cloud), options_,
            std::move(callback));

        std::lock_guard lock(mutex_);
        ++created_[descriptor.duid];
        connections_[descriptor.duid] = connection;
        return connection;
    }

    void close() override { closed_ = true; }

    auto link(const std::string& duid, transport::ChannelKind kind)
        -> std::shared_ptr<FakeLink> {
        std::lock_guard lock(mutex_);
        auto& slot = links_[{duid, kind}];
        if (!slot) {
            slot = std::make_shared<FakeLink>();
        }
        return slot;
    }

    [[nodiscard]] auto createdCount(const std::string& duid) const -> int {
        std::lock_guard lock(mutex_);
        auto it = created_.find(duid);
        return it != created_.end() ? it->second : 0;
    }

    [[nodiscard]] auto connection(const std::string& duid) const
        -> std::shared_ptr<device::DeviceConnection> {
        std::lock_guard lock(mutex_);
        auto it = connections_.find(duid);
        return it != connections_.end() ? it->second.lock() : nullptr;
    }

    [[nodiscard]] auto isClosed() const -> bool { return closed_; }

private:
    device::ConnectionOptions options_;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, transport::ChannelKind>,
             std::shared_ptr<FakeLink>>
        links_;
    std::map<std::string, int> created_;
    std::map<std::string, std::weak_ptr<device::DeviceConnection>>
        connections_;
    std::atomic<bool> closed_{false};
};

// ============================================================================
// GMock collaborators
// ============================================================================

class MockAccountClient : public inventory::AccountClient {
public:
    MOCK_METHOD(inventory::InventorySnapshot, fetchInventory, (), (override));
};

class MockInventoryCache : public inventory::InventoryCache {
public:
    MOCK_METHOD(std::optional<inventory::InventorySnapshot>, loadInventory, (),
                (override));
    MOCK_METHOD(void, storeInventory, (const inventory::InventorySnapshot&),
                (override));
    MOCK_METHOD(std::optional<inventory::CapabilityOverride>, loadOverride,
                (const std::string&), (override));
    MOCK_METHOD(void, storeOverride,
                (const std::string&, const inventory::CapabilityOverride&),
                (override));
};

}  // namespace sweeplink::test

#endif  // SWEEPLINK_TESTS_FAKES_FAKE_CHANNEL_HPP

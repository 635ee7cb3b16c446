/*
 * session.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "session.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "exception/exception.hpp"
#include "guarded_callback.hpp"
#include "health_monitor.hpp"
#include "logging/logging.hpp"
#include "message_codec.hpp"
#include "pending_requests.hpp"

namespace sweeplink::transport {

auto SessionOptions::fromConfig(const config::TransportConfig& cfg)
    -> SessionOptions {
    SessionOptions options;
    options.broker = BrokerParams{
        .host = cfg.host,
        .port = cfg.port,
        .tls = cfg.tls,
        .username = cfg.username,
        .password = cfg.password,
        .clientId = cfg.clientId,
        .keepAlive = std::chrono::seconds(cfg.keepAliveSeconds)};
    options.requestTimeout = std::chrono::milliseconds(cfg.requestTimeoutMs);
    options.reconnect = BackoffConfig{
        .initialDelay = std::chrono::milliseconds(cfg.reconnect.initialDelayMs),
        .maxDelay = std::chrono::milliseconds(cfg.reconnect.maxDelayMs),
        .multiplier = cfg.reconnect.multiplier,
        .jitter = cfg.reconnect.jitter};
    options.timeoutsBeforeRestart = cfg.health.timeoutsBeforeRestart;
    options.restartCooldown =
        std::chrono::seconds(cfg.health.restartCooldownSeconds);
    return options;
}

// ============================================================================
// TransportSession::Impl
// ============================================================================

class TransportSession::Impl {
public:
    Impl(std::shared_ptr<MqttClient> client, SessionOptions options)
        : client_(std::move(client)),
          options_(std::move(options)),
          health_(options_.timeoutsBeforeRestart, options_.restartCooldown),
          logger_(logging::getLogger("transport")) {
        client_->setMessageHandler(
            [this](const std::string& topic, const std::string& payload) {
                onMessage(topic, payload);
            });
        client_->setConnectionLostHandler(
            [this](const std::string& reason) { onConnectionLost(reason); });
    }

    ~Impl() {
        close();
        client_->setMessageHandler(nullptr);
        client_->setConnectionLostHandler(nullptr);
    }

    // ==================== Connection ====================

    void connect() {
        if (closed_) {
            throw RequestCancelled("transport session is closed");
        }
        startSupervisor();
        doConnect();
    }

    void close() {
        if (closed_.exchange(true)) {
            return;
        }

        if (supervisor_.joinable()) {
            supervisor_.request_stop();
            reconnectCv_.notify_all();
            supervisor_.join();
        }

        auto cancelled = pending_.failAll(std::make_exception_ptr(
            RequestCancelled("transport session closed")));
        if (cancelled > 0) {
            logger_->debug("Cancelled {} pending requests on close", cancelled);
        }

        std::vector<std::shared_ptr<MessageSlot>> subscribers;
        std::vector<std::shared_ptr<ListenerSlot>> listeners;
        {
            std::unique_lock lock(subsMutex_);
            for (auto& [topic, slots] : topics_) {
                for (auto& [id, slot] : slots) {
                    subscribers.push_back(std::move(slot));
                }
            }
            topics_.clear();
            subscriptionTopics_.clear();
        }
        {
            std::lock_guard lock(listenersMutex_);
            for (auto& [id, slot] : listeners_) {
                listeners.push_back(std::move(slot));
            }
            listeners_.clear();
        }
        for (const auto& slot : subscribers) {
            slot->retire();
        }
        for (const auto& slot : listeners) {
            slot->retire();
        }

        std::lock_guard lock(connectMutex_);
        if (connected_.exchange(false)) {
            client_->disconnect();
        }
        logger_->info("Transport session closed");
    }

    [[nodiscard]] auto isConnected() const -> bool { return connected_; }
    [[nodiscard]] auto isClosed() const -> bool { return closed_; }

    // ==================== Subscriptions ====================

    auto subscribe(const std::string& topic, MessageCallback callback)
        -> SubscriptionId {
        SubscriptionId id = ++nextSubscriptionId_;
        bool first = false;
        {
            std::unique_lock lock(subsMutex_);
            auto& callbacks = topics_[topic];
            first = callbacks.empty();
            callbacks.emplace(
                id, std::make_shared<MessageSlot>(std::move(callback)));
            subscriptionTopics_[id] = topic;
        }

        if (first && connected_) {
            try {
                client_->subscribe(topic);
            } catch (const FleetException& e) {
                // Restored on the next reconnect
                logger_->warn("Broker subscribe to {} failed: {}", topic,
                              e.what());
            }
        }
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        std::string topic;
        std::shared_ptr<MessageSlot> slot;
        bool last = false;
        {
            std::unique_lock lock(subsMutex_);
            auto it = subscriptionTopics_.find(id);
            if (it == subscriptionTopics_.end()) {
                return;
            }
            topic = it->second;
            subscriptionTopics_.erase(it);

            auto topicIt = topics_.find(topic);
            if (topicIt != topics_.end()) {
                if (auto slotIt = topicIt->second.find(id);
                    slotIt != topicIt->second.end()) {
                    slot = std::move(slotIt->second);
                    topicIt->second.erase(slotIt);
                }
                if (topicIt->second.empty()) {
                    topics_.erase(topicIt);
                    last = true;
                }
            }
        }

        if (slot) {
            slot->retire();
        }

        if (last && connected_) {
            try {
                client_->unsubscribe(topic);
            } catch (const FleetException& e) {
                logger_->warn("Broker unsubscribe from {} failed: {}", topic,
                              e.what());
            }
        }
    }

    [[nodiscard]] auto subscriptionCount(const std::string& topic) const
        -> size_t {
        std::shared_lock lock(subsMutex_);
        auto it = topics_.find(topic);
        return it != topics_.end() ? it->second.size() : 0;
    }

    // ==================== Messaging ====================

    void publish(const std::string& topic, const std::string& payload) {
        if (closed_) {
            throw RequestCancelled("transport session is closed");
        }
        if (!connected_) {
            throw ConnectivityFailure("not connected to broker");
        }
        client_->publish(topic, payload);
    }

    auto request(const std::string& topic, const std::string& payload,
                 std::optional<std::chrono::milliseconds> timeout)
        -> std::string {
        auto effectiveTimeout = timeout.value_or(options_.requestTimeout);

        auto [requestId, future] = allocateRequest();
        auto frame = EnvelopeCodec::encode(
            Frame{requestId, EnvelopeCodec::kRpcRequest, payload});

        try {
            publish(topic, frame);
        } catch (const FleetException&) {
            pending_.pop(requestId);
            throw;
        }
        logger_->trace("Request {} published to {}", requestId, topic);

        auto deadline = std::chrono::steady_clock::now() + effectiveTimeout;
        if (future.wait_until(deadline) == std::future_status::timeout &&
            pending_.pop(requestId)) {
            logger_->warn("Request {} on {} timed out after {}ms", requestId,
                          topic, effectiveTimeout.count());
            if (health_.onTimeout()) {
                restartConnection();
            }
            throw RequestTimeout("request " + std::to_string(requestId) +
                                     " on " + topic + " timed out",
                                 effectiveTimeout);
        }

        // Either a response, or the failure set by failAll()
        auto response = future.get();
        health_.onSuccess();
        return response;
    }

    [[nodiscard]] auto pendingCount() const -> size_t { return pending_.size(); }

    // ==================== Listeners ====================

    auto addConnectionListener(ConnectionListener listener) -> ListenerId {
        std::lock_guard lock(listenersMutex_);
        ListenerId id = ++nextListenerId_;
        listeners_.emplace(
            id, std::make_shared<ListenerSlot>(std::move(listener)));
        return id;
    }

    void removeConnectionListener(ListenerId id) {
        std::shared_ptr<ListenerSlot> slot;
        {
            std::lock_guard lock(listenersMutex_);
            auto it = listeners_.find(id);
            if (it == listeners_.end()) {
                return;
            }
            slot = std::move(it->second);
            listeners_.erase(it);
        }
        slot->retire();
    }

private:
    using MessageSlot = GuardedCallback<MessageCallback>;
    using ListenerSlot = GuardedCallback<ConnectionListener>;

    auto allocateRequest() -> std::pair<uint32_t, std::future<std::string>> {
        while (true) {
            uint32_t id = ++nextRequestId_;
            if (id == 0) {
                continue;
            }
            if (auto future = pending_.tryStart(id)) {
                return {id, std::move(*future)};
            }
        }
    }

    void doConnect() {
        size_t restored = 0;
        {
            std::lock_guard lock(connectMutex_);
            if (closed_) {
                throw RequestCancelled("transport session is closed");
            }
            if (connected_) {
                return;
            }

            logger_->info("Connecting to broker {}:{}", options_.broker.host,
                          options_.broker.port);
            client_->connect(options_.broker);
            connected_ = true;

            std::vector<std::string> topics;
            {
                std::shared_lock subsLock(subsMutex_);
                topics.reserve(topics_.size());
                for (const auto& [topic, callbacks] : topics_) {
                    topics.push_back(topic);
                }
            }
            for (const auto& topic : topics) {
                try {
                    client_->subscribe(topic);
                    ++restored;
                } catch (const FleetException& e) {
                    logger_->warn("Resubscribe to {} failed: {}", topic,
                                  e.what());
                }
            }
        }

        health_.onSuccess();
        logger_->info("Connected to broker, {} topics subscribed", restored);
        notifyListeners(true);
    }

    void onMessage(const std::string& topic, const std::string& payload) {
        if (auto frame = EnvelopeCodec::decode(payload);
            frame && frame->protocol == EnvelopeCodec::kRpcResponse) {
            if (pending_.resolve(frame->requestId, frame->payload)) {
                logger_->trace("Response {} received on {}", frame->requestId,
                               topic);
            } else {
                logger_->debug("Dropping unsolicited response {} on {}",
                               frame->requestId, topic);
            }
        }

        std::vector<std::shared_ptr<MessageSlot>> slots;
        {
            std::shared_lock lock(subsMutex_);
            auto it = topics_.find(topic);
            if (it == topics_.end()) {
                return;
            }
            slots.reserve(it->second.size());
            for (const auto& [id, slot] : it->second) {
                slots.push_back(slot);
            }
        }

        for (const auto& slot : slots) {
            try {
                slot->invoke(topic, payload);
            } catch (const std::exception& e) {
                logger_->error("Subscriber of {} threw: {}", topic, e.what());
            }
        }
    }

    void onConnectionLost(const std::string& reason) {
        if (closed_ || !connected_.exchange(false)) {
            return;
        }
        logger_->warn("Broker connection lost: {}", reason);
        markLost("broker connection lost: " + reason);
    }

    void restartConnection() {
        logger_->warn("Restarting broker connection after repeated timeouts");
        {
            std::lock_guard lock(connectMutex_);
            if (!connected_.exchange(false)) {
                return;
            }
            client_->disconnect();
        }
        markLost("broker connection restarted");
    }

    void markLost(const std::string& reason) {
        auto failed = pending_.failAll(
            std::make_exception_ptr(ConnectivityFailure(reason)));
        if (failed > 0) {
            logger_->warn("Failed {} pending requests: {}", failed, reason);
        }
        notifyListeners(false);
        {
            std::lock_guard lock(reconnectMutex_);
            reconnectRequested_ = true;
        }
        reconnectCv_.notify_all();
    }

    void notifyListeners(bool connected) {
        std::vector<std::shared_ptr<ListenerSlot>> slots;
        {
            std::lock_guard lock(listenersMutex_);
            slots.reserve(listeners_.size());
            for (const auto& [id, slot] : listeners_) {
                slots.push_back(slot);
            }
        }
        for (const auto& slot : slots) {
            try {
                slot->invoke(connected);
            } catch (const std::exception& e) {
                logger_->error("Connection listener threw: {}", e.what());
            }
        }
    }

    void startSupervisor() {
        std::lock_guard lock(reconnectMutex_);
        if (supervisor_.joinable()) {
            return;
        }
        supervisor_ = std::jthread(
            [this](std::stop_token st) { supervise(std::move(st)); });
    }

    void supervise(std::stop_token st) {
        ExponentialBackoff backoff(options_.reconnect);

        while (!st.stop_requested()) {
            {
                std::unique_lock lock(reconnectMutex_);
                if (!reconnectCv_.wait(lock, st,
                                       [this] { return reconnectRequested_; })) {
                    return;
                }
                reconnectRequested_ = false;
            }

            backoff.reset();
            while (!st.stop_requested() && !connected_) {
                auto delay = backoff.next();
                logger_->info("Reconnecting to broker in {}ms (attempt {})",
                              delay.count(), backoff.attempts());
                {
                    std::unique_lock lock(reconnectMutex_);
                    reconnectCv_.wait_for(lock, st, delay, [] { return false; });
                }
                if (st.stop_requested()) {
                    return;
                }

                try {
                    doConnect();
                } catch (const RequestCancelled&) {
                    return;
                } catch (const FleetException& e) {
                    logger_->warn("Reconnect attempt {} failed: {}",
                                  backoff.attempts(), e.what());
                }
            }
        }
    }

    std::shared_ptr<MqttClient> client_;
    SessionOptions options_;
    HealthMonitor health_;
    std::shared_ptr<spdlog::logger> logger_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
    std::mutex connectMutex_;

    PendingRequests<uint32_t, std::string> pending_;
    std::atomic<uint32_t> nextRequestId_{0};

    mutable std::shared_mutex subsMutex_;
    std::unordered_map<std::string,
                       std::map<SubscriptionId, std::shared_ptr<MessageSlot>>>
        topics_;
    std::unordered_map<SubscriptionId, std::string> subscriptionTopics_;
    std::atomic<SubscriptionId> nextSubscriptionId_{0};

    std::mutex listenersMutex_;
    std::map<ListenerId, std::shared_ptr<ListenerSlot>> listeners_;
    ListenerId nextListenerId_{0};

    std::mutex reconnectMutex_;
    std::condition_variable_any reconnectCv_;
    bool reconnectRequested_{false};
    std::jthread supervisor_;
};

// ============================================================================
// TransportSession Public Interface
// ============================================================================

TransportSession::TransportSession(std::shared_ptr<MqttClient> client,
                                   SessionOptions options)
    : impl_(std::make_unique<Impl>(std::move(client), std::move(options))) {}

TransportSession::~TransportSession() = default;

void TransportSession::connect() { impl_->connect(); }

void TransportSession::close() { impl_->close(); }

auto TransportSession::isConnected() const -> bool {
    return impl_->isConnected();
}

auto TransportSession::isClosed() const -> bool { return impl_->isClosed(); }

auto TransportSession::subscribe(const std::string& topic,
                                 MessageCallback callback) -> SubscriptionId {
    return impl_->subscribe(topic, std::move(callback));
}

void TransportSession::unsubscribe(SubscriptionId id) {
    impl_->unsubscribe(id);
}

void TransportSession::publish(const std::string& topic,
                               const std::string& payload) {
    impl_->publish(topic, payload);
}

auto TransportSession::request(const std::string& topic,
                               const std::string& payload,
                               std::optional<std::chrono::milliseconds> timeout)
    -> std::string {
    return impl_->request(topic, payload, timeout);
}

auto TransportSession::addConnectionListener(ConnectionListener listener)
    -> ListenerId {
    return impl_->addConnectionListener(std::move(listener));
}

void TransportSession::removeConnectionListener(ListenerId id) {
    impl_->removeConnectionListener(id);
}

auto TransportSession::pendingCount() const -> size_t {
    return impl_->pendingCount();
}

auto TransportSession::subscriptionCount(const std::string& topic) const
    -> size_t {
    return impl_->subscriptionCount(topic);
}

}  // namespace sweeplink::transport

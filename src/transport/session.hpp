/*
 * session.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Multiplexed broker session with request/response correlation

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_SESSION_HPP
#define SWEEPLINK_TRANSPORT_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "backoff.hpp"
#include "config/sections/transport_config.hpp"
#include "mqtt_client.hpp"

namespace sweeplink::transport {

using SubscriptionId = uint64_t;
using ListenerId = uint64_t;

using MessageCallback =
    std::function<void(const std::string& topic, const std::string& payload)>;
using ConnectionListener = std::function<void(bool connected)>;

/**
 * @brief Session settings
 */
struct SessionOptions {
    BrokerParams broker;
    std::chrono::milliseconds requestTimeout{10000};
    BackoffConfig reconnect{std::chrono::milliseconds(1000),
                            std::chrono::milliseconds(300000), 2.0, 0.1};
    size_t timeoutsBeforeRestart{3};
    std::chrono::seconds restartCooldown{1800};

    [[nodiscard]] static auto fromConfig(const config::TransportConfig& cfg)
        -> SessionOptions;
};

/**
 * @brief One persistent broker connection shared by every cloud device
 *
 * - subscribe()/unsubscribe() maintain a topic -> callbacks registry; the
 *   broker subscription exists while a topic has at least one callback and
 *   is restored after every reconnect.
 * - request() wraps the payload in an RPC request frame and blocks until
 *   the matching response frame, the deadline, a connection loss or close().
 * - Callbacks run on the broker client's thread. unsubscribe(),
 *   removeConnectionListener() and close() wait for a running callback,
 *   so its owner may be destroyed as soon as they return.
 * - An unexpected connection loss fails every pending request with
 *   ConnectivityFailure and hands reconnection to a supervisor thread that
 *   retries with exponential backoff until close().
 */
class TransportSession {
public:
    TransportSession(std::shared_ptr<MqttClient> client,
                     SessionOptions options);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    /**
     * @brief Connect to the broker; no-op when already connected
     * @throws ConnectivityFailure, AuthenticationFailure from the client
     * @throws RequestCancelled after close()
     */
    void connect();

    /**
     * @brief Tear down; idempotent
     */
    void close();

    [[nodiscard]] auto isConnected() const -> bool;
    [[nodiscard]] auto isClosed() const -> bool;

    auto subscribe(const std::string& topic, MessageCallback callback)
        -> SubscriptionId;

    /**
     * @brief Remove a callback; unknown ids are ignored
     *
     * Returns once the callback is no longer running on another thread.
     */
    void unsubscribe(SubscriptionId id);

    /**
     * @brief Fire-and-forget publish
     * @throws ConnectivityFailure when disconnected
     */
    void publish(const std::string& topic, const std::string& payload);

    /**
     * @brief Publish a request and wait for its correlated response
     * @return Response payload
     * @throws RequestTimeout, ConnectivityFailure, RequestCancelled
     */
    auto request(const std::string& topic, const std::string& payload,
                 std::optional<std::chrono::milliseconds> timeout =
                     std::nullopt) -> std::string;

    auto addConnectionListener(ConnectionListener listener) -> ListenerId;

    /**
     * @brief Same guarantee as unsubscribe()
     */
    void removeConnectionListener(ListenerId id);

    [[nodiscard]] auto pendingCount() const -> size_t;
    [[nodiscard]] auto subscriptionCount(const std::string& topic) const
        -> size_t;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_SESSION_HPP

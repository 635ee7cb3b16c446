/*
 * mqtt_client.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Broker client seam used by the transport session

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_MQTT_CLIENT_HPP
#define SWEEPLINK_TRANSPORT_MQTT_CLIENT_HPP

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace sweeplink::transport {

struct BrokerParams {
    std::string host;
    int port{8883};
    bool tls{true};
    std::string username;
    std::string password;
    std::string clientId;
    std::chrono::seconds keepAlive{60};
};

/**
 * @brief Minimal publish/subscribe client
 *
 * Implementations wrap a concrete MQTT library. Handlers are invoked on the
 * client's network thread, one message at a time, in arrival order.
 */
class MqttClient {
public:
    using MessageHandler =
        std::function<void(const std::string& topic, const std::string& payload)>;
    using ConnectionLostHandler = std::function<void(const std::string& reason)>;

    virtual ~MqttClient() = default;

    /**
     * @brief Open the broker connection
     * @throws ConnectivityFailure if the broker is unreachable
     * @throws AuthenticationFailure if the credentials are rejected
     */
    virtual void connect(const BrokerParams& params) = 0;

    /**
     * @brief Close the connection; never reports a connection loss
     */
    virtual void disconnect() = 0;

    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /**
     * @throws ConnectivityFailure when not connected
     */
    virtual void subscribe(const std::string& topic) = 0;
    virtual void unsubscribe(const std::string& topic) = 0;

    /**
     * @throws ConnectivityFailure when not connected
     */
    virtual void publish(const std::string& topic,
                         const std::string& payload) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;

    /**
     * @brief Handler for an unexpected connection loss
     */
    virtual void setConnectionLostHandler(ConnectionLostHandler handler) = 0;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_MQTT_CLIENT_HPP

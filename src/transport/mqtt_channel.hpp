/*
 * mqtt_channel.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Device channel over the shared broker session

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_MQTT_CHANNEL_HPP
#define SWEEPLINK_TRANSPORT_MQTT_CHANNEL_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

#include "channel.hpp"
#include "session.hpp"

namespace sweeplink::transport {

/**
 * @brief Cloud channel of one device
 *
 * Commands go to commandPrefix + topic, responses and pushes arrive on
 * responsePrefix + topic. The session is shared and outlives the channel.
 */
class MqttChannel : public Channel {
public:
    MqttChannel(std::shared_ptr<TransportSession> session, std::string topic,
                std::string commandPrefix = "rr/m/i/",
                std::string responsePrefix = "rr/m/o/");
    ~MqttChannel() override;

    void open() override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    auto request(const std::string& payload, std::chrono::milliseconds timeout)
        -> std::string override;

    [[nodiscard]] auto kind() const -> ChannelKind override {
        return ChannelKind::Cloud;
    }

    void setDisconnectCallback(DisconnectCallback callback) override;
    void setMessageCallback(PushCallback callback) override;

    [[nodiscard]] auto commandTopic() const -> const std::string& {
        return commandTopic_;
    }
    [[nodiscard]] auto responseTopic() const -> const std::string& {
        return responseTopic_;
    }

private:
    void onMessage(const std::string& payload);
    void onConnectionChanged(bool connected);

    std::shared_ptr<TransportSession> session_;
    std::string commandTopic_;
    std::string responseTopic_;

    std::mutex mutex_;
    std::optional<SubscriptionId> subscription_;
    std::optional<ListenerId> listener_;
    std::atomic<bool> open_{false};

    std::mutex callbackMutex_;
    DisconnectCallback disconnectCallback_;
    PushCallback messageCallback_;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_MQTT_CHANNEL_HPP

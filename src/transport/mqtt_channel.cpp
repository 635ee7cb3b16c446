/*
 * mqtt_channel.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "mqtt_channel.hpp"

#include "exception/exception.hpp"
#include "logging/logging.hpp"
#include "message_codec.hpp"

namespace sweeplink::transport {

MqttChannel::MqttChannel(std::shared_ptr<TransportSession> session,
                         std::string topic, std::string commandPrefix,
                         std::string responsePrefix)
    : session_(std::move(session)),
      commandTopic_(commandPrefix + topic),
      responseTopic_(responsePrefix + topic) {}

MqttChannel::~MqttChannel() { close(); }

void MqttChannel::open() {
    std::lock_guard lock(mutex_);

    if (!listener_) {
        listener_ = session_->addConnectionListener(
            [this](bool connected) { onConnectionChanged(connected); });
    }
    if (!subscription_) {
        subscription_ = session_->subscribe(
            responseTopic_,
            [this](const std::string&, const std::string& payload) {
                onMessage(payload);
            });
    }

    session_->connect();
    open_ = true;
    logging::getLogger("transport")
        ->debug("Cloud channel open on {}", responseTopic_);
}

void MqttChannel::close() {
    std::lock_guard lock(mutex_);
    open_ = false;
    if (subscription_) {
        session_->unsubscribe(*subscription_);
        subscription_.reset();
    }
    if (listener_) {
        session_->removeConnectionListener(*listener_);
        listener_.reset();
    }
}

auto MqttChannel::isOpen() const -> bool {
    return open_ && session_->isConnected();
}

auto MqttChannel::request(const std::string& payload,
                          std::chrono::milliseconds timeout) -> std::string {
    if (!open_) {
        throw ConnectivityFailure("cloud channel for " + commandTopic_ +
                                  " is not open");
    }
    return session_->request(commandTopic_, payload, timeout);
}

void MqttChannel::setDisconnectCallback(DisconnectCallback callback) {
    std::lock_guard lock(callbackMutex_);
    disconnectCallback_ = std::move(callback);
}

void MqttChannel::setMessageCallback(PushCallback callback) {
    std::lock_guard lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void MqttChannel::onMessage(const std::string& payload) {
    auto frame = EnvelopeCodec::decode(payload);
    if (frame && frame->protocol == EnvelopeCodec::kRpcResponse) {
        return;  // correlated by the session
    }

    PushCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = messageCallback_;
    }
    if (callback) {
        callback(frame ? frame->payload : payload);
    }
}

void MqttChannel::onConnectionChanged(bool connected) {
    if (connected || !open_.exchange(false)) {
        return;
    }

    DisconnectCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = disconnectCallback_;
    }
    if (callback) {
        callback("cloud connection lost");
    }
}

}  // namespace sweeplink::transport

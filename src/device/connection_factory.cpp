/*
 * connection_factory.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "connection_factory.hpp"

#include "logging/logging.hpp"
#include "transport/local_channel.hpp"
#include "transport/mqtt_channel.hpp"

namespace sweeplink::device {

DefaultConnectionFactory::DefaultConnectionFactory(
    std::shared_ptr<transport::TransportSession> session,
    const config::FleetConfig& config)
    : session_(std::move(session)),
      transport_(config.transport),
      local_(config.local),
      options_{.retry = config.retry,
               .cloudTimeout =
                   std::chrono::milliseconds(config.manager.requestTimeoutMs),
               .localTimeout =
                   std::chrono::milliseconds(config.local.requestTimeoutMs)} {}

auto DefaultConnectionFactory::fromConfig(
    std::shared_ptr<transport::MqttClient> client,
    const config::FleetConfig& config)
    -> std::unique_ptr<DefaultConnectionFactory> {
    auto session = std::make_shared<transport::TransportSession>(
        std::move(client),
        transport::SessionOptions::fromConfig(config.transport));
    return std::make_unique<DefaultConnectionFactory>(std::move(session),
                                                      config);
}

auto DefaultConnectionFactory::create(
    const inventory::DeviceDescriptor& descriptor, StateCallback callback)
    -> std::shared_ptr<DeviceConnection> {
    std::unique_ptr<transport::Channel> localChannel;
    if (local_.enabled && descriptor.localAddress &&
        !descriptor.localAddress->empty()) {
        localChannel = std::make_unique<transport::LocalChannel>(
            transport::LocalChannelOptions{
                .host = *descriptor.localAddress,
                .port = local_.port,
                .connectTimeout =
                    std::chrono::milliseconds(local_.connectTimeoutMs)});
    }

    std::unique_ptr<transport::Channel> cloudChannel;
    if (session_ && !descriptor.topic.empty()) {
        cloudChannel = std::make_unique<transport::MqttChannel>(
            session_, descriptor.topic, transport_.commandTopicPrefix,
            transport_.responseTopicPrefix);
    }

    if (!localChannel && !cloudChannel) {
        logging::getLogger("device")->warn(
            "{} has neither a local address nor a topic", descriptor.duid);
    }

    return std::make_shared<DeviceConnection>(
        descriptor.duid, std::move(localChannel), std::move(cloudChannel),
        options_, std::move(callback));
}

void DefaultConnectionFactory::close() {
    if (session_) {
        session_->close();
    }
}

}  // namespace sweeplink::device

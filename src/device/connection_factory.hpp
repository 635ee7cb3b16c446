/*
 * connection_factory.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Builds device connections from inventory descriptors

**************************************************/

#pragma once

#include <memory>

#include "config/fleet_config.hpp"
#include "connection.hpp"
#include "inventory/types.hpp"
#include "transport/mqtt_client.hpp"
#include "transport/session.hpp"

namespace sweeplink::device {

/**
 * @brief Creates the connection of each managed device
 */
class DeviceConnectionFactory {
public:
    virtual ~DeviceConnectionFactory() = default;

    /**
     * @brief Build an unstarted connection for a device
     */
    virtual auto create(const inventory::DeviceDescriptor& descriptor,
                        StateCallback callback)
        -> std::shared_ptr<DeviceConnection> = 0;

    /**
     * @brief Release resources shared by the created connections
     */
    virtual void close() = 0;
};

/**
 * @brief Local TCP channel when the device has a local address, cloud
 * channel over one shared broker session when it has a topic
 */
class DefaultConnectionFactory : public DeviceConnectionFactory {
public:
    DefaultConnectionFactory(std::shared_ptr<transport::TransportSession> session,
                             const config::FleetConfig& config);

    /**
     * @brief Build the factory and its shared session from configuration
     */
    static auto fromConfig(std::shared_ptr<transport::MqttClient> client,
                           const config::FleetConfig& config)
        -> std::unique_ptr<DefaultConnectionFactory>;

    auto create(const inventory::DeviceDescriptor& descriptor,
                StateCallback callback)
        -> std::shared_ptr<DeviceConnection> override;

    void close() override;

    [[nodiscard]] auto session() const
        -> const std::shared_ptr<transport::TransportSession>& {
        return session_;
    }

private:
    std::shared_ptr<transport::TransportSession> session_;
    config::TransportConfig transport_;
    config::LocalConfig local_;
    ConnectionOptions options_;
};

}  // namespace sweeplink::device

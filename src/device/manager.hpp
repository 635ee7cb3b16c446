/*
 * manager.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Device Manager - fleet inventory, lifecycle and command surface

**************************************************/

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capability/engine.hpp"
#include "config/sections/manager_config.hpp"
#include "connection_factory.hpp"
#include "inventory/account.hpp"
#include "inventory/cache.hpp"
#include "listener_registry.hpp"
#include "types.hpp"

namespace sweeplink::device {

class DeviceManagerImpl;

/**
 * @class DeviceManager
 * @brief Orchestrates the devices of one account.
 *
 * The DeviceManager is responsible for:
 * - Loading the cached inventory and announcing every device without
 *   touching the network
 * - Computing capabilities and driving the per-device lifecycle
 * - Periodic reconciliation against the account inventory
 * - Routing commands to the right device connection
 */
class DeviceManager {
public:
    DeviceManager(config::ManagerConfig config,
                  std::shared_ptr<inventory::AccountClient> account,
                  std::shared_ptr<inventory::InventoryCache> cache,
                  std::unique_ptr<DeviceConnectionFactory> factory,
                  capability::CapabilityEngine engine =
                      capability::CapabilityEngine());

    /**
     * @brief Closes the manager if still open
     */
    ~DeviceManager();

    // Disable copy
    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    // ==================== Inventory ====================

    /**
     * @brief Load the cached inventory and start reconciliation
     *
     * Every cached device is mapped and announced with device_ready before
     * this returns. No network I/O happens on the calling thread; without a
     * cache the inventory is empty and a refresh is scheduled immediately.
     * Calling load() again returns the current devices.
     *
     * @return Devices known after loading
     */
    auto load() -> std::vector<DeviceInfo>;

    /**
     * @brief Run one reconciliation cycle on the calling thread
     * @return false if the account inventory could not be fetched
     */
    auto refresh() -> bool;

    // ==================== Device Access ====================

    [[nodiscard]] auto getDevices() const -> std::vector<DeviceInfo>;

    [[nodiscard]] auto getDevice(const std::string& duid) const
        -> std::optional<DeviceInfo>;

    // ==================== Connection & Commands ====================

    /**
     * @brief Start connecting a device; needed when autoConnect is off
     * @throws DeviceNotFound for an unknown DUID
     */
    void connect(const std::string& duid);

    /**
     * @brief Send an opaque command and wait for the response
     * @param timeout Per-call timeout, defaults to the channel's timeout
     * @throws DeviceNotFound for an unknown DUID
     * @throws ConnectivityFailure, RequestTimeout, RequestCancelled
     */
    auto send(const std::string& duid, const std::string& payload,
              std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> std::string;

    // ==================== Capabilities ====================

    /**
     * @brief Persist detected features and remap the device
     *
     * device_ready is emitted again when the capability set changed.
     */
    void applyOverride(const inventory::CapabilityOverride& overrideRecord);

    // ==================== Listeners ====================

    auto addListener(NotificationCallback callback) -> ListenerHandle;

    /**
     * @brief Unregister a listener; unknown handles are ignored
     */
    void removeListener(ListenerHandle handle);

    // ==================== Diagnostics ====================

    [[nodiscard]] auto getStatistics() const -> json;

    /**
     * @brief Stop reconciliation and close every device connection
     */
    void close();

    [[nodiscard]] auto isClosed() const -> bool;

private:
    std::unique_ptr<DeviceManagerImpl> pimpl_;
};

}  // namespace sweeplink::device

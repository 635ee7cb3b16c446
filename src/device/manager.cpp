/*
 * manager.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Device Manager Public Interface Implementation

**************************************************/

#include "manager.hpp"
#include "manager_impl.hpp"

#include "exception/exception.hpp"

namespace sweeplink::device {

DeviceManager::DeviceManager(config::ManagerConfig config,
                             std::shared_ptr<inventory::AccountClient> account,
                             std::shared_ptr<inventory::InventoryCache> cache,
                             std::unique_ptr<DeviceConnectionFactory> factory,
                             capability::CapabilityEngine engine)
    : pimpl_(std::make_unique<DeviceManagerImpl>(
          std::move(config), std::move(account), std::move(cache),
          std::move(factory), std::move(engine))) {
    pimpl_->logger->debug("DeviceManager: Created");
}

DeviceManager::~DeviceManager() { close(); }

// ==================== Inventory ====================

auto DeviceManager::load() -> std::vector<DeviceInfo> {
    if (pimpl_->closed || pimpl_->loaded.exchange(true)) {
        return getDevices();
    }

    std::optional<inventory::InventorySnapshot> snapshot;
    try {
        snapshot = pimpl_->cache->loadInventory();
    } catch (const FleetException& e) {
        pimpl_->logger->warn("Inventory cache unavailable: {}", e.what());
    }

    if (snapshot) {
        std::lock_guard notifyLock(pimpl_->notifyMutex);
        for (const auto& descriptor : snapshot->devices) {
            bool known = false;
            {
                std::shared_lock lock(pimpl_->mtx);
                known = pimpl_->devices.contains(descriptor.duid);
            }
            if (!descriptor.duid.empty() && !known) {
                pimpl_->addDevice(descriptor);
            }
        }
        pimpl_->logger->info("Loaded {} devices from cache", snapshot->size());
    } else {
        pimpl_->logger->info("No cached inventory, refreshing in background");
    }

    pimpl_->startReconciliation(!snapshot.has_value());
    return getDevices();
}

auto DeviceManager::refresh() -> bool { return pimpl_->refresh(); }

// ==================== Device Access ====================

auto DeviceManager::getDevices() const -> std::vector<DeviceInfo> {
    std::shared_lock lock(pimpl_->mtx);
    std::vector<DeviceInfo> result;
    result.reserve(pimpl_->devices.size());
    for (const auto& [duid, device] : pimpl_->devices) {
        result.push_back(device.info);
    }
    return result;
}

auto DeviceManager::getDevice(const std::string& duid) const
    -> std::optional<DeviceInfo> {
    std::shared_lock lock(pimpl_->mtx);
    auto it = pimpl_->devices.find(duid);
    if (it == pimpl_->devices.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

// ==================== Connection & Commands ====================

void DeviceManager::connect(const std::string& duid) {
    auto connection = pimpl_->findConnection(duid);
    if (connection) {
        connection->startConnect();
    }
}

auto DeviceManager::send(const std::string& duid, const std::string& payload,
                         std::optional<std::chrono::milliseconds> timeout)
    -> std::string {
    auto connection = pimpl_->findConnection(duid);
    if (!connection) {
        throw ConnectivityFailure(duid + " has no connection");
    }

    pimpl_->statistics.commandsSent++;
    try {
        return connection->send(payload, timeout);
    } catch (const RequestTimeout&) {
        pimpl_->statistics.commandsTimedOut++;
        throw;
    } catch (const FleetException&) {
        pimpl_->statistics.commandsFailed++;
        throw;
    }
}

// ==================== Capabilities ====================

void DeviceManager::applyOverride(
    const inventory::CapabilityOverride& overrideRecord) {
    try {
        pimpl_->cache->storeOverride(overrideRecord.deviceId, overrideRecord);
    } catch (const FleetException& e) {
        pimpl_->logger->warn("Could not persist override of {}: {}",
                             overrideRecord.deviceId, e.what());
    }

    std::lock_guard notifyLock(pimpl_->notifyMutex);
    DeviceNotification notification;
    {
        std::unique_lock lock(pimpl_->mtx);
        auto it = pimpl_->devices.find(overrideRecord.deviceId);
        if (it == pimpl_->devices.end()) {
            pimpl_->logger->debug("Override stored for unmanaged device {}",
                                  overrideRecord.deviceId);
            return;
        }

        auto& device = it->second;
        device.overrideRecord = overrideRecord;
        auto capabilities = pimpl_->engine.compute(device.info.descriptor,
                                                   device.overrideRecord);
        pimpl_->statistics.capabilityRecomputations++;
        if (capabilities == device.info.capabilities) {
            return;
        }

        device.info.capabilities = capabilities;
        notification = {.kind = NotificationKind::DeviceReady,
                        .duid = overrideRecord.deviceId,
                        .state = device.info.state,
                        .capabilities = capabilities,
                        .lastError = device.info.lastError};
    }

    pimpl_->logger->info("Override changed capabilities of {}",
                         overrideRecord.deviceId);
    pimpl_->emit(notification);
}

// ==================== Listeners ====================

auto DeviceManager::addListener(NotificationCallback callback)
    -> ListenerHandle {
    return pimpl_->listeners.add(std::move(callback));
}

void DeviceManager::removeListener(ListenerHandle handle) {
    pimpl_->listeners.remove(handle);
}

// ==================== Diagnostics ====================

auto DeviceManager::getStatistics() const -> json {
    auto j = pimpl_->statistics.toJson();

    json states = json::object();
    std::shared_lock lock(pimpl_->mtx);
    for (const auto& [duid, device] : pimpl_->devices) {
        auto name = std::string(lifecycleStateName(device.info.state));
        states[name] = states.value(name, 0) + 1;
    }
    j["devices"] = pimpl_->devices.size();
    j["states"] = states;
    return j;
}

void DeviceManager::close() {
    if (pimpl_->closed.exchange(true)) {
        return;
    }

    pimpl_->stopReconciliation();

    std::vector<std::shared_ptr<DeviceConnection>> connections;
    {
        std::lock_guard notifyLock(pimpl_->notifyMutex);
        std::unique_lock lock(pimpl_->mtx);
        for (auto& [duid, device] : pimpl_->devices) {
            if (device.connection) {
                connections.push_back(device.connection);
            }
        }
        pimpl_->devices.clear();
    }

    pimpl_->closeConnections(connections);
    if (pimpl_->factory) {
        pimpl_->factory->close();
    }
    pimpl_->listeners.clear();
    pimpl_->logger->info("DeviceManager: Closed, {} connections released",
                         connections.size());
}

auto DeviceManager::isClosed() const -> bool { return pimpl_->closed; }

}  // namespace sweeplink::device

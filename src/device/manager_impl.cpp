/*
 * manager_impl.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Device Manager Implementation Details

**************************************************/

#include "manager_impl.hpp"

#include <set>

#include "exception/exception.hpp"
#include "logging/logging.hpp"

namespace sweeplink::device {

namespace {

constexpr auto kNotifyPollInterval = std::chrono::milliseconds(20);

}  // namespace

DeviceManagerImpl::DeviceManagerImpl(
    config::ManagerConfig config,
    std::shared_ptr<inventory::AccountClient> account,
    std::shared_ptr<inventory::InventoryCache> cache,
    std::unique_ptr<DeviceConnectionFactory> factory,
    capability::CapabilityEngine engine)
    : config(std::move(config)),
      account(std::move(account)),
      cache(std::move(cache)),
      factory(std::move(factory)),
      engine(std::move(engine)),
      logger(logging::getLogger("manager")),
      listeners(logger) {}

DeviceManagerImpl::~DeviceManagerImpl() {
    std::unique_lock lock(reconcileMutex);
    if (reconcileThreadId != std::this_thread::get_id()) {
        reconcileCv.wait(lock, [this] { return !reconcileRunning; });
    }
}

auto DeviceManagerImpl::loadOverride(const std::string& duid)
    -> std::optional<inventory::CapabilityOverride> {
    try {
        return cache->loadOverride(duid);
    } catch (const FleetException& e) {
        logger->warn("Override of {} unavailable: {}", duid, e.what());
        return std::nullopt;
    }
}

auto DeviceManagerImpl::modelError(
    const inventory::DeviceDescriptor& descriptor) const
    -> std::optional<std::string> {
    if (engine.isKnownModel(descriptor.model)) {
        return std::nullopt;
    }
    return std::string(errorKindName(ErrorKind::UnknownDeviceModel)) + ": " +
           descriptor.model;
}

void DeviceManagerImpl::addDevice(
    const inventory::DeviceDescriptor& descriptor) {
    ManagedDevice device;
    device.info.descriptor = descriptor;
    device.overrideRecord = loadOverride(descriptor.duid);

    device.info.capabilities =
        engine.compute(descriptor, device.overrideRecord);
    statistics.capabilityRecomputations++;
    device.info.state = LifecycleState::Mapped;
    device.info.lastError = modelError(descriptor);

    if (device.info.lastError) {
        statistics.unknownModels++;
        logger->warn("{} has unknown model '{}', using generic capabilities",
                     descriptor.duid, descriptor.model);
    }
    if (descriptor.protocol() == inventory::ProtocolVersion::Unknown) {
        logger->warn("{} speaks unknown protocol version '{}'",
                     descriptor.duid, descriptor.protocolVersion);
    }

    device.connection = factory->create(
        descriptor,
        [this](const std::string& duid, ConnectivityState state,
               const std::optional<std::string>& lastError) {
            onConnectivity(duid, state, lastError);
        });

    auto connection = device.connection;
    DeviceNotification notification{
        .kind = NotificationKind::DeviceReady,
        .duid = descriptor.duid,
        .state = LifecycleState::Mapped,
        .capabilities = device.info.capabilities,
        .lastError = device.info.lastError};
    {
        std::unique_lock lock(mtx);
        devices.insert_or_assign(descriptor.duid, std::move(device));
    }
    statistics.devicesAdded++;

    logger->info("Mapped {} ({}, {} features)", descriptor.duid,
                 descriptor.model, notification.capabilities->count());
    emit(notification);

    if (config.autoConnect && connection) {
        connection->startConnect();
    }
}

void DeviceManagerImpl::updateDevice(
    const inventory::DeviceDescriptor& descriptor) {
    DeviceNotification notification;
    {
        std::unique_lock lock(mtx);
        auto it = devices.find(descriptor.duid);
        if (it == devices.end()) {
            return;
        }
        auto& device = it->second;
        if (device.info.descriptor == descriptor) {
            return;
        }

        if (device.info.descriptor.firmwareVersion !=
            descriptor.firmwareVersion) {
            logger->info("{} firmware {} -> {}", descriptor.duid,
                         device.info.descriptor.firmwareVersion,
                         descriptor.firmwareVersion);
        }
        device.info.descriptor = descriptor;

        auto capabilities = engine.compute(descriptor, device.overrideRecord);
        statistics.capabilityRecomputations++;
        if (capabilities == device.info.capabilities) {
            logger->debug("{} changed, capabilities unchanged",
                          descriptor.duid);
            return;
        }

        device.info.capabilities = capabilities;
        if (device.info.state != LifecycleState::Disconnected &&
            device.info.state != LifecycleState::Unavailable) {
            device.info.lastError = modelError(descriptor);
        }
        notification = {.kind = NotificationKind::DeviceReady,
                        .duid = descriptor.duid,
                        .state = device.info.state,
                        .capabilities = capabilities,
                        .lastError = device.info.lastError};
    }

    logger->info("Capabilities of {} changed", descriptor.duid);
    emit(notification);
}

void DeviceManagerImpl::reconcile(
    const inventory::InventorySnapshot& snapshot,
    std::vector<std::shared_ptr<DeviceConnection>>& retired) {
    std::set<std::string> seen;

    for (const auto& descriptor : snapshot.devices) {
        if (descriptor.duid.empty() || !seen.insert(descriptor.duid).second) {
            continue;
        }

        bool known = false;
        {
            std::shared_lock lock(mtx);
            known = devices.contains(descriptor.duid);
        }
        if (known) {
            updateDevice(descriptor);
        } else {
            logger->info("New device {} in inventory", descriptor.duid);
            addDevice(descriptor);
        }
    }

    std::vector<DeviceNotification> removed;
    {
        std::unique_lock lock(mtx);
        for (auto it = devices.begin(); it != devices.end();) {
            auto& [duid, device] = *it;
            if (seen.contains(duid)) {
                device.missingCycles = 0;
                ++it;
                continue;
            }

            if (++device.missingCycles < config.missingCyclesBeforeRemoval) {
                logger->info("{} missing from inventory ({}/{})", duid,
                             device.missingCycles,
                             config.missingCyclesBeforeRemoval);
                ++it;
                continue;
            }

            logger->info("{} removed after {} missing refreshes", duid,
                         device.missingCycles);
            if (device.connection) {
                retired.push_back(device.connection);
            }
            removed.push_back({.kind = NotificationKind::DeviceRemoved,
                               .duid = duid,
                               .state = LifecycleState::Removed,
                               .capabilities = std::nullopt,
                               .lastError = std::nullopt});
            statistics.devicesRemoved++;
            it = devices.erase(it);
        }
    }

    for (const auto& notification : removed) {
        emit(notification);
    }
}

auto DeviceManagerImpl::lockNotify()
    -> std::unique_lock<std::recursive_timed_mutex> {
    std::unique_lock lock(notifyMutex, std::defer_lock);
    while (!lock.try_lock_for(kNotifyPollInterval)) {
        if (closed) {
            break;
        }
    }
    return lock;
}

void DeviceManagerImpl::closeConnections(
    const std::vector<std::shared_ptr<DeviceConnection>>& connections) {
    for (const auto& connection : connections) {
        bool ownWorker = connection->isWorkerThread();
        connection->close();
        if (ownWorker) {
            std::lock_guard lock(releasedMutex);
            released.push_back(connection);
        }
    }
}

auto DeviceManagerImpl::refresh() -> bool {
    if (closed) {
        return false;
    }

    std::lock_guard refreshLock(refreshMutex);
    statistics.refreshes++;

    inventory::InventorySnapshot snapshot;
    try {
        snapshot = account->fetchInventory();
    } catch (const FleetException& e) {
        statistics.refreshFailures++;
        logger->warn("Inventory refresh failed ({}): {}",
                     errorKindName(e.kind()), e.what());
        return false;
    } catch (const std::exception& e) {
        statistics.refreshFailures++;
        logger->error("Inventory refresh failed: {}", e.what());
        return false;
    }

    std::vector<std::shared_ptr<DeviceConnection>> retired;
    {
        auto notifyLock = lockNotify();
        if (!notifyLock || closed) {
            return false;
        }
        reconcile(snapshot, retired);
    }

    closeConnections(retired);
    if (closed) {
        return false;
    }

    storeInventory(snapshot.fetchedAt);
    logger->info("Inventory refreshed: {} devices reported",
                 snapshot.size());
    return true;
}

void DeviceManagerImpl::storeInventory(
    std::chrono::system_clock::time_point fetchedAt) {
    inventory::InventorySnapshot managed;
    managed.fetchedAt = fetchedAt;
    {
        std::shared_lock lock(mtx);
        managed.devices.reserve(devices.size());
        for (const auto& [duid, device] : devices) {
            managed.devices.push_back(device.info.descriptor);
        }
    }

    try {
        cache->storeInventory(managed);
    } catch (const FleetException& e) {
        logger->warn("Could not cache inventory: {}", e.what());
    }
}

void DeviceManagerImpl::onConnectivity(
    const std::string& duid, ConnectivityState state,
    const std::optional<std::string>& lastError) {
    auto notifyLock = lockNotify();
    if (!notifyLock) {
        return;
    }

    DeviceNotification notification;
    {
        std::unique_lock lock(mtx);
        auto it = devices.find(duid);
        if (it == devices.end()) {
            return;
        }
        auto& device = it->second;

        LifecycleState next;
        switch (state) {
            case ConnectivityState::Connected:
                next = LifecycleState::Connected;
                device.everConnected = true;
                device.info.lastError = modelError(device.info.descriptor);
                device.info.channelKind =
                    device.connection ? device.connection->activeChannelKind()
                                      : std::nullopt;
                break;
            case ConnectivityState::Disconnected:
                next = device.everConnected ? LifecycleState::Disconnected
                                            : LifecycleState::Unavailable;
                device.info.lastError = lastError;
                device.info.channelKind.reset();
                break;
            default:
                return;
        }

        if (device.info.state == next) {
            return;
        }
        device.info.state = next;
        notification = {.kind = NotificationKind::StateChanged,
                        .duid = duid,
                        .state = next,
                        .capabilities = std::nullopt,
                        .lastError = device.info.lastError};
    }

    logger->info("{} is {}", duid, lifecycleStateName(notification.state));
    emit(notification);
}

void DeviceManagerImpl::emit(const DeviceNotification& notification) {
    std::lock_guard notifyLock(notifyMutex);
    listeners.notify(notification);
}

void DeviceManagerImpl::startReconciliation(bool immediate) {
    std::lock_guard lock(reconcileMutex);
    reconcileRunning = true;
    reconcileThread = std::jthread([this, immediate](std::stop_token st) {
        reconcileLoop(st, immediate);
        std::lock_guard doneLock(reconcileMutex);
        reconcileRunning = false;
        reconcileThreadId = std::thread::id();
        reconcileCv.notify_all();
    });
    reconcileThreadId = reconcileThread.get_id();
}

void DeviceManagerImpl::stopReconciliation() {
    if (!reconcileThread.joinable()) {
        return;
    }
    reconcileThread.request_stop();
    reconcileCv.notify_all();
    if (reconcileThread.get_id() == std::this_thread::get_id()) {
        // close() from a listener running on the reconciliation thread
        reconcileThread.detach();
    } else {
        reconcileThread.join();
    }
}

void DeviceManagerImpl::reconcileLoop(std::stop_token stopToken,
                                      bool immediate) {
    auto interval = std::chrono::seconds(config.refreshIntervalSeconds);
    auto wait = [&] {
        std::unique_lock lock(reconcileMutex);
        reconcileCv.wait_for(lock, stopToken, interval, [] { return false; });
    };

    if (!immediate) {
        wait();
    }
    while (!stopToken.stop_requested()) {
        try {
            refresh();
        } catch (const std::exception& e) {
            logger->error("Reconciliation cycle failed: {}", e.what());
        }
        wait();
    }
    logger->debug("Reconciliation stopped");
}

auto DeviceManagerImpl::findConnection(const std::string& duid) const
    -> std::shared_ptr<DeviceConnection> {
    std::shared_lock lock(mtx);
    auto it = devices.find(duid);
    if (it == devices.end()) {
        throw DeviceNotFound("unknown device " + duid);
    }
    return it->second.connection;
}

}  // namespace sweeplink::device

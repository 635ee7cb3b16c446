/*
 * manager_impl.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Device Manager Implementation Details

**************************************************/

#pragma once

#include "manager.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

namespace sweeplink::device {

/**
 * @brief Bookkeeping for one managed device
 */
struct ManagedDevice {
    DeviceInfo info;
    std::shared_ptr<DeviceConnection> connection;
    std::optional<inventory::CapabilityOverride> overrideRecord;
    size_t missingCycles{0};
    bool everConnected{false};
};

/**
 * @brief Statistics tracking
 */
struct ManagerStatistics {
    std::atomic<uint64_t> refreshes{0};
    std::atomic<uint64_t> refreshFailures{0};
    std::atomic<uint64_t> devicesAdded{0};
    std::atomic<uint64_t> devicesRemoved{0};
    std::atomic<uint64_t> capabilityRecomputations{0};
    std::atomic<uint64_t> unknownModels{0};
    std::atomic<uint64_t> commandsSent{0};
    std::atomic<uint64_t> commandsFailed{0};
    std::atomic<uint64_t> commandsTimedOut{0};
    std::chrono::system_clock::time_point startTime;

    ManagerStatistics() : startTime(std::chrono::system_clock::now()) {}

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["refreshes"] = refreshes.load();
        j["refreshFailures"] = refreshFailures.load();
        j["devicesAdded"] = devicesAdded.load();
        j["devicesRemoved"] = devicesRemoved.load();
        j["capabilityRecomputations"] = capabilityRecomputations.load();
        j["unknownModels"] = unknownModels.load();
        j["commandsSent"] = commandsSent.load();
        j["commandsFailed"] = commandsFailed.load();
        j["commandsTimedOut"] = commandsTimedOut.load();
        auto uptimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now() - startTime)
                            .count();
        j["uptimeMs"] = uptimeMs;
        return j;
    }
};

/**
 * @brief Device Manager Implementation
 *
 * Lock order: refreshMutex -> notifyMutex -> mtx. Notifications are
 * emitted while notifyMutex is held so that each device's transitions
 * reach listeners in order. Background threads take notifyMutex through
 * lockNotify(), which gives up once the manager is closed, so close()
 * may join them even from inside a listener.
 */
class DeviceManagerImpl {
public:
    DeviceManagerImpl(config::ManagerConfig config,
                      std::shared_ptr<inventory::AccountClient> account,
                      std::shared_ptr<inventory::InventoryCache> cache,
                      std::unique_ptr<DeviceConnectionFactory> factory,
                      capability::CapabilityEngine engine);

    /**
     * @brief Waits for a reconciliation thread that close() had to detach
     */
    ~DeviceManagerImpl();

    DeviceManagerImpl(const DeviceManagerImpl&) = delete;
    DeviceManagerImpl& operator=(const DeviceManagerImpl&) = delete;

    // ==================== Collaborators ====================

    config::ManagerConfig config;
    std::shared_ptr<inventory::AccountClient> account;
    std::shared_ptr<inventory::InventoryCache> cache;
    std::unique_ptr<DeviceConnectionFactory> factory;
    const capability::CapabilityEngine engine;
    std::shared_ptr<spdlog::logger> logger;

    // ==================== Device Storage ====================

    std::map<std::string, ManagedDevice> devices;

    // ==================== Event System ====================

    ListenerRegistry<const DeviceNotification&> listeners;

    // ==================== Reconciliation ====================

    std::jthread reconcileThread;
    std::mutex reconcileMutex;
    std::condition_variable_any reconcileCv;
    bool reconcileRunning{false};  // guarded by reconcileMutex
    std::thread::id reconcileThreadId;

    // ==================== Statistics ====================

    ManagerStatistics statistics;

    // ==================== Synchronization ====================

    mutable std::shared_mutex mtx;
    std::recursive_timed_mutex notifyMutex;
    std::mutex refreshMutex;
    std::atomic<bool> loaded{false};
    std::atomic<bool> closed{false};


    // ==================== Helper Methods ====================

    /**
     * @brief Read a device's override; cache failures read as absent
     */
    auto loadOverride(const std::string& duid)
        -> std::optional<inventory::CapabilityOverride>;

    /**
     * @brief lastError carried by devices of unknown models
     */
    auto modelError(const inventory::DeviceDescriptor& descriptor) const
        -> std::optional<std::string>;

    /**
     * @brief Map a new device, announce it and optionally connect it
     * @note Requires notifyMutex
     */
    void addDevice(const inventory::DeviceDescriptor& descriptor);

    /**
     * @brief Apply a changed descriptor, re-announce on capability change
     * @note Requires notifyMutex
     */
    void updateDevice(const inventory::DeviceDescriptor& descriptor);

    /**
     * @brief Reconcile a fetched snapshot against the managed devices
     * @param retired Receives connections of removed devices
     * @note Requires notifyMutex
     */
    void reconcile(const inventory::InventorySnapshot& snapshot,
                   std::vector<std::shared_ptr<DeviceConnection>>& retired);

    /**
     * @brief notifyMutex for background threads
     * @return Unlocked when the manager closed while waiting
     */
    auto lockNotify() -> std::unique_lock<std::recursive_timed_mutex>;

    /**
     * @brief Close connections that left the manager
     * @note Must not be called with mtx held
     */
    void closeConnections(
        const std::vector<std::shared_ptr<DeviceConnection>>& connections);

    auto refresh() -> bool;

    void storeInventory(std::chrono::system_clock::time_point fetchedAt);

    /**
     * @brief Connectivity report from a device connection
     */
    void onConnectivity(const std::string& duid, ConnectivityState state,
                        const std::optional<std::string>& lastError);

    void emit(const DeviceNotification& notification);

    void startReconciliation(bool immediate);
    void stopReconciliation();
    void reconcileLoop(std::stop_token stopToken, bool immediate);

    auto findConnection(const std::string& duid) const
        -> std::shared_ptr<DeviceConnection>;

    // ==================== Released Connections ====================

    // Connections closed from their own worker thread. Declared last so they
    // are destroyed first: each destructor waits for its worker to unwind
    // out of the manager before any other member goes away.
    std::mutex releasedMutex;
    std::vector<std::shared_ptr<DeviceConnection>> released;
};

}  // namespace sweeplink::device

/*
 * cache.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Inventory cache contract and in-process implementations

**************************************************/

#ifndef SWEEPLINK_INVENTORY_CACHE_HPP
#define SWEEPLINK_INVENTORY_CACHE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace sweeplink::inventory {

/**
 * @brief Persistent store for the last inventory and capability overrides
 *
 * load* never throws: a missing or corrupt entry is reported as absent.
 * store* may throw CacheUnavailable.
 */
class InventoryCache {
public:
    virtual ~InventoryCache() = default;

    virtual auto loadInventory() -> std::optional<InventorySnapshot> = 0;
    virtual void storeInventory(const InventorySnapshot& snapshot) = 0;

    virtual auto loadOverride(const std::string& deviceId)
        -> std::optional<CapabilityOverride> = 0;
    virtual void storeOverride(const std::string& deviceId,
                               const CapabilityOverride& record) = 0;
};

/**
 * @brief Thread-safe cache that lives as long as the process
 */
class InMemoryCache : public InventoryCache {
public:
    auto loadInventory() -> std::optional<InventorySnapshot> override;
    void storeInventory(const InventorySnapshot& snapshot) override;

    auto loadOverride(const std::string& deviceId)
        -> std::optional<CapabilityOverride> override;
    void storeOverride(const std::string& deviceId,
                       const CapabilityOverride& record) override;

private:
    std::mutex mutex_;
    std::optional<InventorySnapshot> inventory_;
    std::unordered_map<std::string, CapabilityOverride> overrides_;
};

/**
 * @brief Cache that remembers nothing
 */
class NoCache : public InventoryCache {
public:
    auto loadInventory() -> std::optional<InventorySnapshot> override {
        return std::nullopt;
    }
    void storeInventory(const InventorySnapshot&) override {}

    auto loadOverride(const std::string&)
        -> std::optional<CapabilityOverride> override {
        return std::nullopt;
    }
    void storeOverride(const std::string&,
                       const CapabilityOverride&) override {}
};

}  // namespace sweeplink::inventory

#endif  // SWEEPLINK_INVENTORY_CACHE_HPP

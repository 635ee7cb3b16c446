/*
 * cache.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "cache.hpp"

namespace sweeplink::inventory {

auto InMemoryCache::loadInventory() -> std::optional<InventorySnapshot> {
    std::lock_guard lock(mutex_);
    return inventory_;
}

void InMemoryCache::storeInventory(const InventorySnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    inventory_ = snapshot;
}

auto InMemoryCache::loadOverride(const std::string& deviceId)
    -> std::optional<CapabilityOverride> {
    std::lock_guard lock(mutex_);
    auto it = overrides_.find(deviceId);
    if (it == overrides_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryCache::storeOverride(const std::string& deviceId,
                                  const CapabilityOverride& record) {
    std::lock_guard lock(mutex_);
    overrides_[deviceId] = record;
}

}  // namespace sweeplink::inventory

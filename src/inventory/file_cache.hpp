/*
 * file_cache.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Inventory cache persisted as a single JSON document

**************************************************/

#ifndef SWEEPLINK_INVENTORY_FILE_CACHE_HPP
#define SWEEPLINK_INVENTORY_FILE_CACHE_HPP

#include <filesystem>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "cache.hpp"
#include "config/sections/manager_config.hpp"

namespace sweeplink::inventory {

/**
 * @brief File-backed inventory cache
 *
 * Layout:
 * @code
 * { "inventory": {...}, "overrides": { "<duid>": {...} } }
 * @endcode
 *
 * The file is re-read on every load so that several processes can share it.
 * Writes go to "<path>.tmp" and are renamed over the original.
 */
class FileCache : public InventoryCache {
public:
    explicit FileCache(std::filesystem::path path);

    auto loadInventory() -> std::optional<InventorySnapshot> override;
    void storeInventory(const InventorySnapshot& snapshot) override;

    auto loadOverride(const std::string& deviceId)
        -> std::optional<CapabilityOverride> override;
    void storeOverride(const std::string& deviceId,
                       const CapabilityOverride& record) override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    auto readDocument() -> nlohmann::json;
    void writeDocument(const nlohmann::json& document);

    std::filesystem::path path_;
    std::mutex mutex_;
};

/**
 * @brief Cache selected by configuration
 * @return FileCache when a path is set, InMemoryCache otherwise
 */
[[nodiscard]] auto makeCache(const config::CacheConfig& config)
    -> std::shared_ptr<InventoryCache>;

}  // namespace sweeplink::inventory

#endif  // SWEEPLINK_INVENTORY_FILE_CACHE_HPP

/*
 * types.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Inventory data model: descriptors, snapshots and overrides

**************************************************/

#ifndef SWEEPLINK_INVENTORY_TYPES_HPP
#define SWEEPLINK_INVENTORY_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "capability/feature.hpp"

namespace sweeplink::inventory {

/**
 * @brief Wire protocol family a device speaks
 */
enum class ProtocolVersion : uint8_t { V1, A01, Unknown };

[[nodiscard]] auto parseProtocolVersion(std::string_view text)
    -> ProtocolVersion;

/**
 * @brief Identity and static capability inputs of one device
 */
struct DeviceDescriptor {
    std::string duid;
    std::string name;
    std::string model;
    std::string firmwareVersion;
    std::string protocolVersion{"1.0"};
    uint64_t featureBits{0};
    std::string featureString;
    std::vector<int> featureIds;
    std::set<std::string> productTags;
    std::string topic;
    std::optional<std::string> localAddress;

    [[nodiscard]] auto protocol() const -> ProtocolVersion {
        return parseProtocolVersion(protocolVersion);
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @throws ProtocolViolation on a missing duid or wrongly-typed field
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> DeviceDescriptor;

    auto operator==(const DeviceDescriptor& other) const -> bool = default;
};

/**
 * @brief Point-in-time list of devices
 */
struct InventorySnapshot {
    std::chrono::system_clock::time_point fetchedAt;
    std::vector<DeviceDescriptor> devices;

    [[nodiscard]] auto find(std::string_view duid) const
        -> const DeviceDescriptor*;

    [[nodiscard]] auto size() const -> size_t { return devices.size(); }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @throws ProtocolViolation on malformed input
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> InventorySnapshot;
};

/**
 * @brief Features detected at runtime, valid for one firmware version
 */
struct CapabilityOverride {
    std::string deviceId;
    std::string firmwareVersion;
    std::map<capability::Feature, bool> features;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @throws ProtocolViolation on malformed input
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> CapabilityOverride;

    auto operator==(const CapabilityOverride& other) const -> bool = default;
};

}  // namespace sweeplink::inventory

#endif  // SWEEPLINK_INVENTORY_TYPES_HPP

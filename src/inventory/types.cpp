/*
 * types.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "types.hpp"

#include <algorithm>

#include "exception/exception.hpp"

namespace sweeplink::inventory {

namespace {

using json = nlohmann::json;

auto toMillis(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

auto fromMillis(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

}  // namespace

auto parseProtocolVersion(std::string_view text) -> ProtocolVersion {
    if (text == "1.0") {
        return ProtocolVersion::V1;
    }
    if (text == "A01") {
        return ProtocolVersion::A01;
    }
    return ProtocolVersion::Unknown;
}

// ============================================================================
// DeviceDescriptor
// ============================================================================

auto DeviceDescriptor::toJson() const -> json {
    json j = {{"duid", duid},
              {"name", name},
              {"model", model},
              {"firmwareVersion", firmwareVersion},
              {"protocolVersion", protocolVersion},
              {"featureBits", featureBits},
              {"featureString", featureString},
              {"featureIds", featureIds},
              {"productTags", productTags},
              {"topic", topic}};
    if (localAddress) {
        j["localAddress"] = *localAddress;
    }
    return j;
}

auto DeviceDescriptor::fromJson(const json& j) -> DeviceDescriptor {
    if (!j.is_object()) {
        throw ProtocolViolation("device descriptor must be a JSON object");
    }
    if (!j.contains("duid") || !j["duid"].is_string() ||
        j["duid"].get<std::string>().empty()) {
        throw ProtocolViolation("device descriptor without duid");
    }

    try {
        DeviceDescriptor desc;
        desc.duid = j["duid"].get<std::string>();
        desc.name = j.value("name", "");
        desc.model = j.value("model", "");
        desc.firmwareVersion = j.value("firmwareVersion", "");
        desc.protocolVersion = j.value("protocolVersion", desc.protocolVersion);
        desc.featureBits = j.value("featureBits", uint64_t{0});
        desc.featureString = j.value("featureString", "");
        desc.featureIds = j.value("featureIds", std::vector<int>{});
        desc.productTags = j.value("productTags", std::set<std::string>{});
        desc.topic = j.value("topic", "");
        if (j.contains("localAddress") && !j["localAddress"].is_null()) {
            desc.localAddress = j["localAddress"].get<std::string>();
        }
        return desc;
    } catch (const json::exception& e) {
        throw ProtocolViolation("malformed device descriptor " +
                                j["duid"].get<std::string>() + ": " +
                                e.what());
    }
}

// ============================================================================
// InventorySnapshot
// ============================================================================

auto InventorySnapshot::find(std::string_view duid) const
    -> const DeviceDescriptor* {
    auto it = std::find_if(
        devices.begin(), devices.end(),
        [duid](const DeviceDescriptor& desc) { return desc.duid == duid; });
    return it != devices.end() ? &*it : nullptr;
}

auto InventorySnapshot::toJson() const -> json {
    json list = json::array();
    for (const auto& device : devices) {
        list.push_back(device.toJson());
    }
    return {{"fetchedAt", toMillis(fetchedAt)}, {"devices", list}};
}

auto InventorySnapshot::fromJson(const json& j) -> InventorySnapshot {
    if (!j.is_object() || !j.contains("devices") || !j["devices"].is_array()) {
        throw ProtocolViolation("inventory snapshot without device list");
    }

    InventorySnapshot snapshot;
    try {
        snapshot.fetchedAt = fromMillis(j.value("fetchedAt", int64_t{0}));
    } catch (const json::exception& e) {
        throw ProtocolViolation(std::string("malformed snapshot timestamp: ") +
                                e.what());
    }
    for (const auto& device : j["devices"]) {
        snapshot.devices.push_back(DeviceDescriptor::fromJson(device));
    }
    return snapshot;
}

// ============================================================================
// CapabilityOverride
// ============================================================================

auto CapabilityOverride::toJson() const -> json {
    json flags = json::object();
    for (const auto& [feature, enabled] : features) {
        flags[std::string(capability::featureName(feature))] = enabled;
    }
    return {{"deviceId", deviceId},
            {"firmwareVersion", firmwareVersion},
            {"features", flags}};
}

auto CapabilityOverride::fromJson(const json& j) -> CapabilityOverride {
    if (!j.is_object()) {
        throw ProtocolViolation("capability override must be a JSON object");
    }

    try {
        CapabilityOverride result;
        result.deviceId = j.at("deviceId").get<std::string>();
        result.firmwareVersion = j.at("firmwareVersion").get<std::string>();
        if (j.contains("features")) {
            for (const auto& [name, value] : j["features"].items()) {
                if (auto feature = capability::featureFromName(name)) {
                    result.features[*feature] = value.get<bool>();
                }
            }
        }
        return result;
    } catch (const json::exception& e) {
        throw ProtocolViolation(std::string("malformed capability override: ") +
                                e.what());
    }
}

}  // namespace sweeplink::inventory

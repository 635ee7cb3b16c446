/*
 * types.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "types.hpp"

namespace sweeplink::device {

auto lifecycleStateName(LifecycleState state) -> std::string_view {
    switch (state) {
        case LifecycleState::Discovered:
            return "discovered";
        case LifecycleState::Mapped:
            return "mapped";
        case LifecycleState::Connected:
            return "connected";
        case LifecycleState::Unavailable:
            return "unavailable";
        case LifecycleState::Disconnected:
            return "disconnected";
        case LifecycleState::Removed:
            return "removed";
    }
    return "unknown";
}

auto connectivityStateName(ConnectivityState state) -> std::string_view {
    switch (state) {
        case ConnectivityState::Idle:
            return "idle";
        case ConnectivityState::Connected:
            return "connected";
        case ConnectivityState::Disconnected:
            return "disconnected";
    }
    return "unknown";
}

auto notificationKindName(NotificationKind kind) -> std::string_view {
    switch (kind) {
        case NotificationKind::DeviceReady:
            return "device_ready";
        case NotificationKind::StateChanged:
            return "state_changed";
        case NotificationKind::DeviceRemoved:
            return "device_removed";
    }
    return "unknown";
}

auto DeviceInfo::toJson() const -> json {
    json j;
    j["descriptor"] = descriptor.toJson();
    j["capabilities"] = capabilities.toJson();
    j["state"] = lifecycleStateName(state);
    j["lastError"] = lastError ? json(*lastError) : json(nullptr);
    j["channel"] = channelKind
                       ? json(transport::channelKindName(*channelKind))
                       : json(nullptr);
    return j;
}

auto DeviceNotification::toJson() const -> json {
    json j;
    j["kind"] = notificationKindName(kind);
    j["duid"] = duid;
    j["state"] = lifecycleStateName(state);
    if (capabilities) {
        j["capabilities"] = capabilities->toJson();
    }
    if (lastError) {
        j["lastError"] = *lastError;
    }
    return j;
}

}  // namespace sweeplink::device

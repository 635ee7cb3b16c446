/*
 * types.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Device lifecycle types and notifications

**************************************************/

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "capability/capability_set.hpp"
#include "inventory/types.hpp"
#include "transport/channel.hpp"

namespace sweeplink::device {

using json = nlohmann::json;

/**
 * @brief Lifecycle of a managed device
 *
 * Discovered -> Mapped -> Connected, with Unavailable (never connected yet)
 * and Disconnected (lost after being connected) as degraded siblings of
 * Connected. Removed is terminal.
 */
enum class LifecycleState : uint8_t {
    Discovered,
    Mapped,
    Connected,
    Unavailable,
    Disconnected,
    Removed
};

[[nodiscard]] auto lifecycleStateName(LifecycleState state) -> std::string_view;

/**
 * @brief Connectivity as seen by a device connection
 */
enum class ConnectivityState : uint8_t { Idle, Connected, Disconnected };

[[nodiscard]] auto connectivityStateName(ConnectivityState state)
    -> std::string_view;

/**
 * @brief Snapshot of one managed device
 */
struct DeviceInfo {
    inventory::DeviceDescriptor descriptor;
    capability::CapabilitySet capabilities;
    LifecycleState state{LifecycleState::Discovered};
    std::optional<std::string> lastError;
    std::optional<transport::ChannelKind> channelKind;

    [[nodiscard]] auto toJson() const -> json;
};

enum class NotificationKind : uint8_t { DeviceReady, StateChanged, DeviceRemoved };

[[nodiscard]] auto notificationKindName(NotificationKind kind)
    -> std::string_view;

/**
 * @brief Event delivered to manager listeners
 */
struct DeviceNotification {
    NotificationKind kind{NotificationKind::StateChanged};
    std::string duid;
    LifecycleState state{LifecycleState::Discovered};
    std::optional<capability::CapabilitySet> capabilities{};
    std::optional<std::string> lastError{};

    [[nodiscard]] auto toJson() const -> json;
};

using NotificationCallback = std::function<void(const DeviceNotification&)>;

/**
 * @brief One-way report from a device connection to its owner
 */
using StateCallback =
    std::function<void(const std::string& duid, ConnectivityState state,
                       const std::optional<std::string>& lastError)>;

}  // namespace sweeplink::device

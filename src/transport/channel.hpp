/*
 * channel.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Per-device bidirectional command channel

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_CHANNEL_HPP
#define SWEEPLINK_TRANSPORT_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace sweeplink::transport {

enum class ChannelKind : uint8_t { Cloud, Local };

[[nodiscard]] constexpr auto channelKindName(ChannelKind kind) noexcept
    -> std::string_view {
    return kind == ChannelKind::Cloud ? "cloud" : "local";
}

/**
 * @brief Link from the host to one device
 */
class Channel {
public:
    using DisconnectCallback = std::function<void(const std::string& reason)>;
    using PushCallback = std::function<void(const std::string& payload)>;

    virtual ~Channel() = default;

    /**
     * @brief Establish the link; no-op when already open
     * @throws ConnectivityFailure, AuthenticationFailure
     */
    virtual void open() = 0;

    /**
     * @brief Tear down; idempotent, never reports a disconnect
     */
    virtual void close() = 0;

    [[nodiscard]] virtual auto isOpen() const -> bool = 0;

    /**
     * @brief Send a payload and wait for the device's response
     * @throws ConnectivityFailure, RequestTimeout, RequestCancelled
     */
    virtual auto request(const std::string& payload,
                         std::chrono::milliseconds timeout) -> std::string = 0;

    [[nodiscard]] virtual auto kind() const -> ChannelKind = 0;

    /**
     * @brief Called once per unexpected loss of an open link
     */
    virtual void setDisconnectCallback(DisconnectCallback callback) = 0;

    /**
     * @brief Called for messages the device sends on its own
     */
    virtual void setMessageCallback(PushCallback callback) = 0;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_CHANNEL_HPP

/*
 * local_channel.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Dedicated local-network channel of one device

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_LOCAL_CHANNEL_HPP
#define SWEEPLINK_TRANSPORT_LOCAL_CHANNEL_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/logger.h>

#include "channel.hpp"
#include "pending_requests.hpp"
#include "tcp_connection.hpp"

namespace sweeplink::transport {

struct LocalChannelOptions {
    std::string host;
    int port{58867};
    std::chrono::milliseconds connectTimeout{5000};
    size_t maxFrameSize{1024 * 1024};
};

/**
 * @brief TCP link straight to the device
 *
 * Each envelope frame travels as [u32 big-endian length][frame].
 */
class LocalChannel : public Channel {
public:
    explicit LocalChannel(LocalChannelOptions options);
    ~LocalChannel() override;

    void open() override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    auto request(const std::string& payload, std::chrono::milliseconds timeout)
        -> std::string override;

    [[nodiscard]] auto kind() const -> ChannelKind override {
        return ChannelKind::Local;
    }

    void setDisconnectCallback(DisconnectCallback callback) override;
    void setMessageCallback(PushCallback callback) override;

    [[nodiscard]] auto pendingCount() const -> size_t {
        return pending_.size();
    }

private:
    void onData(std::string_view data);
    void onClosed(std::string_view reason);
    void dispatchFrame(std::string_view data);

    LocalChannelOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex lifecycleMutex_;
    std::unique_ptr<TcpConnection> connection_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    std::string receiveBuffer_;  // receive thread only

    PendingRequests<uint32_t, std::string> pending_;
    std::atomic<uint32_t> nextRequestId_{0};

    std::mutex callbackMutex_;
    DisconnectCallback disconnectCallback_;
    PushCallback messageCallback_;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_LOCAL_CHANNEL_HPP

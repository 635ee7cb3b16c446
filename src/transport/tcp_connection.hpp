/*
 * tcp_connection.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: TCP client socket with a background reader for the local link

*************************************************/

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sweeplink::transport {

struct TcpOptions {
    std::string host{"localhost"};
    int port{0};
    std::chrono::milliseconds connectTimeout{5000};
    size_t readChunkSize{16384};
    bool keepAlive{true};
    bool noDelay{true};
};

struct TcpCounters {
    size_t bytesWritten{0};
    size_t bytesRead{0};
    size_t writes{0};
};

using ReadHandler = std::function<void(std::string_view data)>;
using CloseHandler = std::function<void(std::string_view reason)>;

/**
 * @brief Client socket to one device on the local network
 *
 * Bytes are delivered on a reader thread started by startReading(). The
 * close handler runs on that thread when the peer goes away, never after
 * close() was called.
 */
class TcpConnection {
public:
    explicit TcpConnection(TcpOptions options);
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    /**
     * @brief Resolve and connect within options.connectTimeout
     * @throws ConnectivityFailure if no resolved address accepts
     */
    void connect();

    /**
     * @brief Stop the reader and release the socket; idempotent
     */
    void close();

    [[nodiscard]] auto isConnected() const noexcept -> bool;

    /**
     * @brief Write every byte of data
     * @throws ConnectivityFailure when not connected or the write fails
     */
    void write(std::string_view data);

    /**
     * @brief Start the reader thread; a second call is ignored
     */
    void startReading(ReadHandler onRead, CloseHandler onClose);

    [[nodiscard]] auto counters() const noexcept -> TcpCounters;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sweeplink::transport

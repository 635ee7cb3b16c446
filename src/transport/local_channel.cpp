/*
 * local_channel.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "local_channel.hpp"

#include <utility>

#include "exception/exception.hpp"
#include "logging/logging.hpp"
#include "message_codec.hpp"

namespace sweeplink::transport {

namespace {

constexpr size_t kLengthPrefix = 4;

auto readLength(std::string_view data) -> uint32_t {
    auto byte = [&](size_t i) {
        return static_cast<uint32_t>(static_cast<uint8_t>(data[i]));
    };
    return (byte(0) << 24) | (byte(1) << 16) | (byte(2) << 8) | byte(3);
}

auto withLength(const std::string& frame) -> std::string {
    auto size = static_cast<uint32_t>(frame.size());
    std::string out;
    out.reserve(kLengthPrefix + frame.size());
    out.push_back(static_cast<char>((size >> 24) & 0xFF));
    out.push_back(static_cast<char>((size >> 16) & 0xFF));
    out.push_back(static_cast<char>((size >> 8) & 0xFF));
    out.push_back(static_cast<char>(size & 0xFF));
    out.append(frame);
    return out;
}

}  // namespace

LocalChannel::LocalChannel(LocalChannelOptions options)
    : options_(std::move(options)), logger_(logging::getLogger("local")) {}

LocalChannel::~LocalChannel() { close(); }

void LocalChannel::open() {
    std::lock_guard lock(lifecycleMutex_);
    if (open_) {
        return;
    }

    closing_ = false;
    receiveBuffer_.clear();

    TcpOptions tcp;
    tcp.host = options_.host;
    tcp.port = options_.port;
    tcp.connectTimeout = options_.connectTimeout;
    auto connection = std::make_unique<TcpConnection>(std::move(tcp));
    connection->connect();
    connection->startReading(
        [this](std::string_view data) { onData(data); },
        [this](std::string_view reason) { onClosed(reason); });

    connection_ = std::move(connection);
    open_ = true;
    logger_->info("Local channel open to {}:{}", options_.host, options_.port);
}

void LocalChannel::close() {
    std::unique_ptr<TcpConnection> connection;
    {
        std::lock_guard lock(lifecycleMutex_);
        closing_ = true;
        open_ = false;
        connection = std::move(connection_);
    }

    if (connection) {
        connection->close();
    }
    pending_.failAll(std::make_exception_ptr(
        RequestCancelled("local channel to " + options_.host + " closed")));
}

auto LocalChannel::isOpen() const -> bool { return open_; }

auto LocalChannel::request(const std::string& payload,
                           std::chrono::milliseconds timeout) -> std::string {
    uint32_t requestId = 0;
    std::future<std::string> future;
    while (true) {
        requestId = ++nextRequestId_;
        if (requestId == 0) {
            continue;
        }
        if (auto started = pending_.tryStart(requestId)) {
            future = std::move(*started);
            break;
        }
    }

    auto data = withLength(EnvelopeCodec::encode(
        Frame{requestId, EnvelopeCodec::kRpcRequest, payload}));

    try {
        std::lock_guard lock(lifecycleMutex_);
        if (!open_ || !connection_) {
            throw ConnectivityFailure("local channel to " + options_.host +
                                      " is not open");
        }
        connection_->write(data);
    } catch (const FleetException&) {
        pending_.pop(requestId);
        throw;
    }

    if (future.wait_for(timeout) == std::future_status::timeout &&
        pending_.pop(requestId)) {
        throw RequestTimeout("local request " + std::to_string(requestId) +
                                 " to " + options_.host + " timed out",
                             timeout);
    }
    return future.get();
}

void LocalChannel::setDisconnectCallback(DisconnectCallback callback) {
    std::lock_guard lock(callbackMutex_);
    disconnectCallback_ = std::move(callback);
}

void LocalChannel::setMessageCallback(PushCallback callback) {
    std::lock_guard lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void LocalChannel::onData(std::string_view data) {
    receiveBuffer_.append(data);

    while (receiveBuffer_.size() >= kLengthPrefix) {
        auto length = readLength(receiveBuffer_);
        if (length > options_.maxFrameSize) {
            logger_->error("Frame of {} bytes from {} exceeds limit, dropping "
                           "buffered data",
                           length, options_.host);
            receiveBuffer_.clear();
            return;
        }
        if (receiveBuffer_.size() < kLengthPrefix + length) {
            return;
        }

        dispatchFrame(std::string_view(receiveBuffer_)
                          .substr(kLengthPrefix, length));
        receiveBuffer_.erase(0, kLengthPrefix + length);
    }
}

void LocalChannel::dispatchFrame(std::string_view data) {
    auto frame = EnvelopeCodec::decode(data);
    if (!frame) {
        logger_->warn("Malformed frame from {}", options_.host);
        return;
    }

    if (frame->protocol == EnvelopeCodec::kRpcResponse) {
        if (!pending_.resolve(frame->requestId, frame->payload)) {
            logger_->debug("Dropping unsolicited response {} from {}",
                           frame->requestId, options_.host);
        }
        return;
    }

    PushCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = messageCallback_;
    }
    if (callback) {
        callback(frame->payload);
    }
}

void LocalChannel::onClosed(std::string_view reason) {
    if (closing_ || !open_.exchange(false)) {
        return;
    }

    std::string message = "local connection to " + options_.host +
                          " lost: " + std::string(reason);
    pending_.failAll(std::make_exception_ptr(ConnectivityFailure(message)));

    DisconnectCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = disconnectCallback_;
    }
    if (callback) {
        callback(message);
    }
}

}  // namespace sweeplink::transport

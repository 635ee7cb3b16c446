/*
 * test_local_channel.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Tests for the local channel against a loopback device

**************************************************/

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fakes/fake_mqtt_client.hpp"
#include "exception/exception.hpp"
#include "transport/local_channel.hpp"
#include "transport/message_codec.hpp"

using namespace sweeplink;
using namespace sweeplink::transport;
using sweeplink::test::waitUntil;
using std::chrono::milliseconds;

namespace {

auto lengthPrefixed(const std::string& frame) -> std::string {
    auto size = static_cast<uint32_t>(frame.size());
    std::string out;
    out.push_back(static_cast<char>((size >> 24) & 0xFF));
    out.push_back(static_cast<char>((size >> 16) & 0xFF));
    out.push_back(static_cast<char>((size >> 8) & 0xFF));
    out.push_back(static_cast<char>(size & 0xFF));
    return out + frame;
}

/**
 * @brief Single-client TCP peer speaking the local framing
 */
class LoopbackDevice {
public:
    using Handler = std::function<std::optional<std::string>(const Frame&)>;

    LoopbackDevice() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int reuse = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse,
                     sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listenFd_, 4);

        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::jthread([this](std::stop_token st) { serve(st); });
    }

    ~LoopbackDevice() {
        thread_.request_stop();
        ::shutdown(listenFd_, SHUT_RDWR);
        dropClient();
        thread_.join();
        ::close(listenFd_);
    }

    [[nodiscard]] auto port() const -> int { return port_; }

    void setHandler(Handler handler) {
        std::lock_guard lock(mutex_);
        handler_ = std::move(handler);
    }

    void setSplitWrites(bool split) { split_ = split; }

    void push(const std::string& payload) {
        writeFrame(Frame{0, EnvelopeCodec::kRpcRequest, payload});
    }

    void writeRaw(const std::string& data) {
        std::lock_guard lock(writeMutex_);
        if (clientFd_ >= 0) {
            ::send(clientFd_, data.data(), data.size(), MSG_NOSIGNAL);
        }
    }

    void dropClient() {
        std::lock_guard lock(writeMutex_);
        if (clientFd_ >= 0) {
            ::shutdown(clientFd_, SHUT_RDWR);
        }
    }

    [[nodiscard]] auto hasClient() -> bool {
        std::lock_guard lock(writeMutex_);
        return clientFd_ >= 0;
    }

    [[nodiscard]] auto framesReceived() const -> int { return received_; }

private:
    void serve(std::stop_token st) {
        while (!st.stop_requested()) {
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0) {
                return;
            }
            {
                std::lock_guard lock(writeMutex_);
                clientFd_ = fd;
            }
            readLoop(fd);
            {
                std::lock_guard lock(writeMutex_);
                clientFd_ = -1;
            }
            ::close(fd);
        }
    }

    void readLoop(int fd) {
        std::string buffer;
        char chunk[4096];
        while (true) {
            auto n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return;
            }
            buffer.append(chunk, static_cast<size_t>(n));
            while (buffer.size() >= 4) {
                uint32_t length = (static_cast<uint8_t>(buffer[0]) << 24) |
                                  (static_cast<uint8_t>(buffer[1]) << 16) |
                                  (static_cast<uint8_t>(buffer[2]) << 8) |
                                  static_cast<uint8_t>(buffer[3]);
                if (buffer.size() < 4 + length) {
                    break;
                }
                auto frame = EnvelopeCodec::decode(
                    std::string_view(buffer).substr(4, length));
                buffer.erase(0, 4 + length);
                if (frame) {
                    ++received_;
                    handle(*frame);
                }
            }
        }
    }

    void handle(const Frame& request) {
        Handler handler;
        {
            std::lock_guard lock(mutex_);
            handler = handler_;
        }
        std::optional<std::string> reply =
            handler ? handler(request) : std::optional<std::string>("ok");
        if (reply) {
            writeFrame(
                Frame{request.requestId, EnvelopeCodec::kRpcResponse, *reply});
        }
    }

    void writeFrame(const Frame& frame) {
        auto data = lengthPrefixed(EnvelopeCodec::encode(frame));
        if (!split_) {
            writeRaw(data);
            return;
        }
        auto half = data.size() / 2;
        writeRaw(data.substr(0, half));
        std::this_thread::sleep_for(milliseconds(20));
        writeRaw(data.substr(half));
    }

    int listenFd_{-1};
    int port_{0};
    std::mutex mutex_;
    Handler handler_;
    std::mutex writeMutex_;
    int clientFd_{-1};
    std::atomic<bool> split_{false};
    std::atomic<int> received_{0};
    std::jthread thread_;
};

/// Port that refuses connections
auto closedPort() -> int {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

}  // namespace

class LocalChannelTest : public ::testing::Test {
protected:
    auto makeChannel(int port) -> std::unique_ptr<LocalChannel> {
        return std::make_unique<LocalChannel>(
            LocalChannelOptions{.host = "127.0.0.1",
                                .port = port,
                                .connectTimeout = milliseconds(500),
                                .maxFrameSize = 1024 * 1024});
    }

    LoopbackDevice device_;
};

TEST_F(LocalChannelTest, RequestRoundTrip) {
    device_.setHandler([](const Frame& request) -> std::optional<std::string> {
        return "re:" + request.payload;
    });
    auto channel = makeChannel(device_.port());

    channel->open();

    EXPECT_TRUE(channel->isOpen());
    EXPECT_EQ(channel->kind(), ChannelKind::Local);
    EXPECT_EQ(channel->request("get_status", milliseconds(1000)),
              "re:get_status");
    EXPECT_EQ(channel->pendingCount(), 0u);
}

TEST_F(LocalChannelTest, SequentialRequestsUseDistinctIds) {
    std::vector<uint32_t> ids;
    std::mutex mutex;
    device_.setHandler(
        [&](const Frame& request) -> std::optional<std::string> {
            std::lock_guard lock(mutex);
            ids.push_back(request.requestId);
            return "ok";
        });
    auto channel = makeChannel(device_.port());
    channel->open();

    for (int i = 0; i < 3; ++i) {
        (void)channel->request("x", milliseconds(1000));
    }

    std::lock_guard lock(mutex);
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_NE(ids[0], 0u);
    EXPECT_NE(ids[0], ids[1]);
    EXPECT_NE(ids[1], ids[2]);
}

TEST_F(LocalChannelTest, ResponseSplitAcrossWrites) {
    device_.setSplitWrites(true);
    auto channel = makeChannel(device_.port());
    channel->open();

    EXPECT_EQ(channel->request("x", milliseconds(1000)), "ok");
}

TEST_F(LocalChannelTest, SilentDeviceTimesOut) {
    device_.setHandler(
        [](const Frame&) -> std::optional<std::string> { return std::nullopt; });
    auto channel = makeChannel(device_.port());
    channel->open();

    EXPECT_THROW((void)channel->request("x", milliseconds(50)),
                 RequestTimeout);
    EXPECT_EQ(channel->pendingCount(), 0u);
    EXPECT_TRUE(channel->isOpen());
}

TEST_F(LocalChannelTest, PushFramesForwarded) {
    auto channel = makeChannel(device_.port());
    std::mutex mutex;
    std::vector<std::string> pushed;
    channel->setMessageCallback([&](const std::string& payload) {
        std::lock_guard lock(mutex);
        pushed.push_back(payload);
    });
    channel->open();
    ASSERT_TRUE(waitUntil([&] { return device_.hasClient(); }));

    device_.push("battery:80");

    ASSERT_TRUE(waitUntil([&] {
        std::lock_guard lock(mutex);
        return !pushed.empty();
    }));
    std::lock_guard lock(mutex);
    EXPECT_EQ(pushed.front(), "battery:80");
}

TEST_F(LocalChannelTest, OversizedFrameDiscarded) {
    auto channel = std::make_unique<LocalChannel>(LocalChannelOptions{
        .host = "127.0.0.1", .port = device_.port(), .maxFrameSize = 64});
    channel->open();
    ASSERT_TRUE(waitUntil([&] { return device_.hasClient(); }));

    device_.push(std::string(256, 'x'));
    std::this_thread::sleep_for(milliseconds(50));

    EXPECT_TRUE(channel->isOpen());
    EXPECT_EQ(channel->request("x", milliseconds(1000)), "ok");
}

TEST_F(LocalChannelTest, PeerCloseFailsPendingAndReportsOnce) {
    device_.setHandler(
        [](const Frame&) -> std::optional<std::string> { return std::nullopt; });
    auto channel = makeChannel(device_.port());
    std::atomic<int> losses{0};
    channel->setDisconnectCallback([&](const std::string&) { ++losses; });
    channel->open();

    auto pending = std::async(std::launch::async, [&] {
        return channel->request("x", milliseconds(5000));
    });
    ASSERT_TRUE(waitUntil([&] { return device_.framesReceived() == 1; }));

    device_.dropClient();

    EXPECT_THROW(pending.get(), ConnectivityFailure);
    ASSERT_TRUE(waitUntil([&] { return losses == 1; }));
    EXPECT_FALSE(channel->isOpen());
    EXPECT_THROW((void)channel->request("x", milliseconds(100)),
                 ConnectivityFailure);
}

TEST_F(LocalChannelTest, ReopenAfterPeerClose) {
    auto channel = makeChannel(device_.port());
    channel->open();
    ASSERT_TRUE(waitUntil([&] { return device_.hasClient(); }));
    device_.dropClient();
    ASSERT_TRUE(waitUntil([&] { return !channel->isOpen(); }));
    ASSERT_TRUE(waitUntil([&] { return !device_.hasClient(); }));

    channel->open();

    EXPECT_EQ(channel->request("x", milliseconds(1000)), "ok");
}

TEST_F(LocalChannelTest, CloseCancelsAndStaysSilent) {
    device_.setHandler(
        [](const Frame&) -> std::optional<std::string> { return std::nullopt; });
    auto channel = makeChannel(device_.port());
    std::atomic<int> losses{0};
    channel->setDisconnectCallback([&](const std::string&) { ++losses; });
    channel->open();

    auto pending = std::async(std::launch::async, [&] {
        return channel->request("x", milliseconds(5000));
    });
    ASSERT_TRUE(waitUntil([&] { return device_.framesReceived() == 1; }));

    channel->close();
    channel->close();

    EXPECT_THROW(pending.get(), RequestCancelled);
    EXPECT_EQ(losses.load(), 0);
}

TEST(LocalChannelConnectTest, RefusedConnectionIsConnectivityFailure) {
    LocalChannel channel(LocalChannelOptions{
        .host = "127.0.0.1", .port = closedPort(),
        .connectTimeout = milliseconds(200)});

    EXPECT_THROW(channel.open(), ConnectivityFailure);
    EXPECT_FALSE(channel.isOpen());
}

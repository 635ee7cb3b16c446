/*
 * tcp_connection.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "tcp_connection.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "exception/exception.hpp"
#include "logging/logging.hpp"

namespace sweeplink::transport {

namespace {

// Reader wake-up period for noticing a stop request
constexpr int kReadPollMs = 200;

/**
 * @brief Owning socket descriptor
 */
class Descriptor {
public:
    Descriptor() = default;
    explicit Descriptor(int fd) : fd_(fd) {}
    ~Descriptor() { reset(); }

    Descriptor(Descriptor&& other) noexcept : fd_(other.release()) {}
    Descriptor& operator=(Descriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }

    auto release() noexcept -> int { return std::exchange(fd_, -1); }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};
using AddrInfoList = std::unique_ptr<addrinfo, AddrInfoDeleter>;

auto errnoText() -> std::string { return std::strerror(errno); }

auto enableOption(int fd, int level, int name) -> bool {
    int on = 1;
    return ::setsockopt(fd, level, name, &on, sizeof(on)) == 0;
}

auto resolve(const TcpOptions& options) -> AddrInfoList {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* list = nullptr;
    auto service = std::to_string(options.port);
    if (int rc = ::getaddrinfo(options.host.c_str(), service.c_str(), &hints,
                               &list);
        rc != 0) {
        throw ConnectivityFailure("cannot resolve " + options.host + ": " +
                                  ::gai_strerror(rc));
    }
    return AddrInfoList(list);
}

/**
 * @brief Non-blocking connect to one address, waiting at most timeout
 * @return Connected blocking socket, or an empty descriptor on failure
 */
auto connectTo(const addrinfo& address, std::chrono::milliseconds timeout)
    -> Descriptor {
    Descriptor fd(::socket(address.ai_family,
                           address.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                           address.ai_protocol));
    if (!fd) {
        return {};
    }

    if (::connect(fd.get(), address.ai_addr, address.ai_addrlen) != 0) {
        if (errno != EINPROGRESS) {
            return {};
        }
        pollfd waiter{.fd = fd.get(), .events = POLLOUT, .revents = 0};
        if (::poll(&waiter, 1, static_cast<int>(timeout.count())) != 1) {
            return {};
        }
        int error = 0;
        socklen_t length = sizeof(error);
        if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &error, &length) !=
                0 ||
            error != 0) {
            return {};
        }
    }

    int flags = ::fcntl(fd.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd.get(), F_SETFL, flags & ~O_NONBLOCK) != 0) {
        return {};
    }
    return fd;
}

}  // namespace

// ============================================================================
// TcpConnection::Impl
// ============================================================================

class TcpConnection::Impl {
public:
    explicit Impl(TcpOptions options)
        : options_(std::move(options)), logger_(logging::getLogger("local")) {}

    ~Impl() { close(); }

    void connect() {
        std::lock_guard lock(mutex_);
        if (socket_) {
            return;
        }

        Descriptor fd;
        auto addresses = resolve(options_);
        for (auto* address = addresses.get(); address != nullptr && !fd;
             address = address->ai_next) {
            fd = connectTo(*address, options_.connectTimeout);
        }
        if (!fd) {
            throw ConnectivityFailure("cannot connect to " + options_.host +
                                      ":" + std::to_string(options_.port));
        }

        if (options_.keepAlive &&
            !enableOption(fd.get(), SOL_SOCKET, SO_KEEPALIVE)) {
            logger_->warn("SO_KEEPALIVE on {}: {}", options_.host, errnoText());
        }
        if (options_.noDelay &&
            !enableOption(fd.get(), IPPROTO_TCP, TCP_NODELAY)) {
            logger_->warn("TCP_NODELAY on {}: {}", options_.host, errnoText());
        }

        {
            std::lock_guard writeLock(writeMutex_);
            socket_ = std::move(fd);
        }
        connected_ = true;
        logger_->info("Connected to {}:{}", options_.host, options_.port);
    }

    void close() {
        std::jthread reader;
        {
            std::lock_guard lock(mutex_);
            connected_ = false;
            reader = std::move(reader_);
        }
        if (reader.joinable()) {
            reader.request_stop();
            if (reader.get_id() == std::this_thread::get_id()) {
                // close() from the close handler
                reader.detach();
            } else {
                reader.join();
            }
        }

        std::lock_guard lock(mutex_);
        std::lock_guard writeLock(writeMutex_);
        if (socket_) {
            socket_.reset();
            logger_->debug("Closed connection to {}:{}", options_.host,
                           options_.port);
        }
    }

    [[nodiscard]] auto isConnected() const noexcept -> bool {
        return connected_;
    }

    void write(std::string_view data) {
        std::lock_guard lock(writeMutex_);
        int fd = connected_ ? socket_.get() : -1;
        if (fd < 0) {
            throw ConnectivityFailure("not connected to " + options_.host);
        }

        while (!data.empty()) {
            auto n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                throw ConnectivityFailure("write to " + options_.host +
                                          " failed: " + errnoText());
            }
            data.remove_prefix(static_cast<size_t>(n));
            bytesWritten_ += static_cast<size_t>(n);
        }
        ++writes_;
    }

    void startReading(ReadHandler onRead, CloseHandler onClose) {
        std::lock_guard lock(mutex_);
        if (!socket_ || reader_.joinable()) {
            return;
        }

        reader_ = std::jthread(
            [this, fd = socket_.get(), onRead = std::move(onRead),
             onClose = std::move(onClose)](std::stop_token stop) {
                auto reason = readLoop(fd, stop, onRead);
                if (stop.stop_requested()) {
                    return;
                }
                connected_ = false;
                logger_->warn("Connection to {}:{} lost: {}", options_.host,
                              options_.port, reason);
                if (onClose) {
                    onClose(reason);
                }
            });
    }

    [[nodiscard]] auto counters() const noexcept -> TcpCounters {
        return {.bytesWritten = bytesWritten_,
                .bytesRead = bytesRead_,
                .writes = writes_};
    }

private:
    /**
     * @return Why reading stopped; meaningless after a stop request
     */
    auto readLoop(int fd, const std::stop_token& stop,
                  const ReadHandler& onRead) -> std::string {
        std::vector<char> chunk(options_.readChunkSize);
        while (!stop.stop_requested()) {
            pollfd waiter{.fd = fd, .events = POLLIN, .revents = 0};
            int ready = ::poll(&waiter, 1, kReadPollMs);
            if (ready == 0 || (ready < 0 && errno == EINTR)) {
                continue;
            }
            if (ready < 0) {
                return errnoText();
            }

            auto n = ::recv(fd, chunk.data(), chunk.size(), 0);
            if (n == 0) {
                return "connection closed by peer";
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return errnoText();
            }

            bytesRead_ += static_cast<size_t>(n);
            try {
                onRead(std::string_view(chunk.data(), static_cast<size_t>(n)));
            } catch (const std::exception& e) {
                logger_->error("Read handler for {} failed: {}", options_.host,
                               e.what());
            }
        }
        return "stopped";
    }

    TcpOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex mutex_;  // socket_ lifecycle and reader_
    Descriptor socket_;
    std::atomic<bool> connected_{false};
    std::jthread reader_;

    std::mutex writeMutex_;  // taken after mutex_
    std::atomic<size_t> bytesWritten_{0};
    std::atomic<size_t> bytesRead_{0};
    std::atomic<size_t> writes_{0};
};

// ============================================================================
// TcpConnection
// ============================================================================

TcpConnection::TcpConnection(TcpOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

TcpConnection::~TcpConnection() = default;

void TcpConnection::connect() { impl_->connect(); }

void TcpConnection::close() { impl_->close(); }

auto TcpConnection::isConnected() const noexcept -> bool {
    return impl_->isConnected();
}

void TcpConnection::write(std::string_view data) { impl_->write(data); }

void TcpConnection::startReading(ReadHandler onRead, CloseHandler onClose) {
    impl_->startReading(std::move(onRead), std::move(onClose));
}

auto TcpConnection::counters() const noexcept -> TcpCounters {
    return impl_->counters();
}

}  // namespace sweeplink::transport

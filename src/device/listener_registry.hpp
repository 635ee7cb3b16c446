/*
 * listener_registry.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Handle-based callback registry

**************************************************/

#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <spdlog/logger.h>

namespace sweeplink::device {

using ListenerHandle = uint64_t;

/**
 * @brief Registry that owns listener callbacks
 *
 * Callers keep an opaque handle. notify() invokes a snapshot of the
 * registered callbacks in registration order, outside the lock; a callback
 * that throws is logged and skipped.
 */
template <typename... Args>
class ListenerRegistry {
public:
    using Callback = std::function<void(Args...)>;

    explicit ListenerRegistry(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {}

    auto add(Callback callback) -> ListenerHandle {
        std::lock_guard lock(mutex_);
        auto handle = nextHandle_++;
        callbacks_.emplace(handle, std::move(callback));
        return handle;
    }

    /**
     * @return false if the handle was not registered
     */
    auto remove(ListenerHandle handle) -> bool {
        std::lock_guard lock(mutex_);
        return callbacks_.erase(handle) > 0;
    }

    void notify(const Args&... args) const {
        std::vector<Callback> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot.reserve(callbacks_.size());
            for (const auto& [handle, callback] : callbacks_) {
                snapshot.push_back(callback);
            }
        }

        for (const auto& callback : snapshot) {
            try {
                callback(args...);
            } catch (const std::exception& e) {
                logger_->error("Listener threw: {}", e.what());
            }
        }
    }

    [[nodiscard]] auto size() const -> size_t {
        std::lock_guard lock(mutex_);
        return callbacks_.size();
    }

    void clear() {
        std::lock_guard lock(mutex_);
        callbacks_.clear();
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::map<ListenerHandle, Callback> callbacks_;
    ListenerHandle nextHandle_{1};
};

}  // namespace sweeplink::device

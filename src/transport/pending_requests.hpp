/*
 * pending_requests.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Table correlating outstanding request ids with waiters

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_PENDING_REQUESTS_HPP
#define SWEEPLINK_TRANSPORT_PENDING_REQUESTS_HPP

#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

#include <spdlog/fmt/fmt.h>

#include "exception/exception.hpp"

namespace sweeplink::transport {

/**
 * @brief Thread-safe map of request key to the promise of its response
 *
 * An entry exists only between start() and the first of resolve(), fail(),
 * pop() or failAll(). Once removed, a key can never be resolved again until
 * it is started anew.
 */
template <typename Key, typename Value>
class PendingRequests {
public:
    /**
     * @brief Register a new outstanding request
     * @throws DuplicateRequestId if the key is already outstanding
     */
    auto start(const Key& key) -> std::future<Value> {
        auto future = tryStart(key);
        if (!future) {
            throw DuplicateRequestId(
                fmt::format("request {} is already pending", key));
        }
        return std::move(*future);
    }

    /**
     * @brief Register a request unless the key is outstanding
     */
    auto tryStart(const Key& key) -> std::optional<std::future<Value>> {
        std::lock_guard lock(mutex_);
        if (pending_.contains(key)) {
            return std::nullopt;
        }
        std::promise<Value> promise;
        auto future = promise.get_future();
        pending_.emplace(key, std::move(promise));
        return future;
    }

    /**
     * @brief Deliver the response of an outstanding request
     * @return false if the key is not outstanding (unsolicited or late)
     */
    auto resolve(const Key& key, Value value) -> bool {
        std::promise<Value> promise;
        {
            std::lock_guard lock(mutex_);
            auto it = pending_.find(key);
            if (it == pending_.end()) {
                return false;
            }
            promise = std::move(it->second);
            pending_.erase(it);
        }
        promise.set_value(std::move(value));
        return true;
    }

    /**
     * @brief Fail an outstanding request
     * @return false if the key is not outstanding
     */
    auto fail(const Key& key, std::exception_ptr error) -> bool {
        std::promise<Value> promise;
        {
            std::lock_guard lock(mutex_);
            auto it = pending_.find(key);
            if (it == pending_.end()) {
                return false;
            }
            promise = std::move(it->second);
            pending_.erase(it);
        }
        promise.set_exception(std::move(error));
        return true;
    }

    /**
     * @brief Remove an entry; a remaining waiter sees RequestCancelled
     * @return false if the key was no longer outstanding
     */
    auto pop(const Key& key) -> bool {
        return fail(key, std::make_exception_ptr(RequestCancelled(
                             fmt::format("request {} was withdrawn", key))));
    }

    /**
     * @brief Fail every outstanding request with the same error
     * @return Number of requests failed
     */
    auto failAll(std::exception_ptr error) -> size_t {
        std::unordered_map<Key, std::promise<Value>> drained;
        {
            std::lock_guard lock(mutex_);
            drained.swap(pending_);
        }
        for (auto& [key, promise] : drained) {
            promise.set_exception(error);
        }
        return drained.size();
    }

    [[nodiscard]] auto contains(const Key& key) const -> bool {
        std::lock_guard lock(mutex_);
        return pending_.contains(key);
    }

    [[nodiscard]] auto size() const -> size_t {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, std::promise<Value>> pending_;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_PENDING_REQUESTS_HPP

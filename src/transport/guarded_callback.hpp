/*
 * guarded_callback.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Callback slot that can be retired while another thread is
running it

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_GUARDED_CALLBACK_HPP
#define SWEEPLINK_TRANSPORT_GUARDED_CALLBACK_HPP

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace sweeplink::transport {

/**
 * @brief Shared slot around a subscriber callback
 *
 * Dispatchers copy the shared_ptr out of their registry and call invoke()
 * without holding the registry lock. Once retire() returns, the callback
 * is not running on any other thread and will not be started again, so
 * the objects it captured may be destroyed. A callback that retires its
 * own slot does not wait for itself.
 */
template <typename Fn>
class GuardedCallback {
public:
    explicit GuardedCallback(Fn fn) : fn_(std::move(fn)) {}

    GuardedCallback(const GuardedCallback&) = delete;
    GuardedCallback& operator=(const GuardedCallback&) = delete;

    /**
     * @return false if the slot was already retired
     */
    template <typename... Args>
    auto invoke(Args&&... args) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (retired_) {
                return false;
            }
            callers_.push_back(std::this_thread::get_id());
        }
        Call call(*this);
        fn_(std::forward<Args>(args)...);
        return true;
    }

    /**
     * @brief Stop future invocations and wait for running ones
     */
    void retire() {
        auto self = std::this_thread::get_id();
        std::unique_lock lock(mutex_);
        retired_ = true;
        idle_.wait(lock, [&] {
            return std::all_of(callers_.begin(), callers_.end(),
                               [&](const auto& id) { return id == self; });
        });
    }

    [[nodiscard]] auto retired() const -> bool {
        std::lock_guard lock(mutex_);
        return retired_;
    }

private:
    // Leaves the caller list even when the callback throws
    class Call {
    public:
        explicit Call(GuardedCallback& slot) : slot_(slot) {}
        ~Call() {
            std::lock_guard lock(slot_.mutex_);
            auto& callers = slot_.callers_;
            callers.erase(std::find(callers.begin(), callers.end(),
                                    std::this_thread::get_id()));
            slot_.idle_.notify_all();
        }

        Call(const Call&) = delete;
        Call& operator=(const Call&) = delete;

    private:
        GuardedCallback& slot_;
    };

    Fn fn_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::vector<std::thread::id> callers_;
    bool retired_{false};
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_GUARDED_CALLBACK_HPP

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>


namespace lightsync::core::channel {

// -----------------------------------------------------------------------------
// Wakeup
// -----------------------------------------------------------------------------
//
// Single wait point of the connection loop. Notified by the transport receive
// thread (frame or control event queued) and by command producers. A notify
// that happens while nobody waits is latched, so it is never lost.
//
class Wakeup {
public:
    using clock = std::chrono::steady_clock;

    inline void notify() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_ = true;
        }
        cv_.notify_all();
    }

    // Blocks until notified or until the deadline passes.
    // Returns true when woken by a notification.
    inline bool wait_until(clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (deadline == clock::time_point::max()) {
            cv_.wait(lock, [this] { return pending_; });
        } else {
            cv_.wait_until(lock, deadline, [this] { return pending_; });
        }
        const bool woken = pending_;
        pending_ = false;
        return woken;
    }

    inline bool wait_for(std::chrono::milliseconds timeout) {
        return wait_until(clock::now() + timeout);
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_{false};
};

} // namespace lightsync::core::channel

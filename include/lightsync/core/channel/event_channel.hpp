#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "lcr/log/logger.hpp"


namespace lightsync::core::channel {

/*
===============================================================================
 EventChannel
===============================================================================

Bounded, ordered conduit from the connection loop to the application.

- send() never blocks. When the channel is full the OLDEST pending event is
  dropped and a warning is logged: a blocked producer would stall ping
  handling and cause spurious timeout reconnects.
- recv() blocks until an event is available or the channel is closed and
  drained.
- close() wakes every waiting consumer. Events already queued stay readable.

Multi-producer / multi-consumer safe.
===============================================================================
*/
template<typename T>
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Returns false only when the channel is closed
    inline bool send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
                LS_WARN("[EVENTS] Event channel full (capacity " << capacity_
                        << "), dropped oldest event (total dropped " << dropped_ << ")");
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    [[nodiscard]]
    inline std::optional<T> recv() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return pop_locked_();
    }

    [[nodiscard]]
    inline std::optional<T> recv_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return pop_locked_();
    }

    [[nodiscard]]
    inline std::optional<T> try_recv() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked_();
    }

    inline void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]]
    inline bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]]
    inline std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]]
    inline std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_{false};
    std::uint64_t dropped_{0};

    inline std::optional<T> pop_locked_() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> out(std::move(queue_.front()));
        queue_.pop_front();
        return out;
    }
};

} // namespace lightsync::core::channel

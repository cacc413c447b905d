#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <utility>

#include "lightsync/core/channel/wakeup.hpp"
#include "lightsync/core/transport/websocket/events.hpp"


namespace lightsync::core::transport::websocket {

// -----------------------------------------------------------------------------
// Inbox
// -----------------------------------------------------------------------------
//
// Hand-off between a transport receive thread (producer) and the connection
// loop (consumer). Data frames and control events are queued separately;
// every push notifies the loop's Wakeup.
//
// Unbounded. The loop drains it completely on every iteration.
//
class Inbox {
public:
    explicit Inbox(channel::Wakeup& wakeup) noexcept
        : wakeup_(wakeup)
    {}

    inline void push_message(std::string msg) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(std::move(msg));
        }
        wakeup_.notify();
    }

    inline void push_event(Event ev) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(ev));
        }
        wakeup_.notify();
    }

    [[nodiscard]]
    inline bool pop_message(std::string& out) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (messages_.empty()) {
            return false;
        }
        out = std::move(messages_.front());
        messages_.pop_front();
        return true;
    }

    [[nodiscard]]
    inline bool pop_event(Event& out) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    inline void clear() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
        events_.clear();
    }

private:
    channel::Wakeup& wakeup_;
    std::mutex mutex_;
    std::deque<std::string> messages_;
    std::deque<Event> events_;
};

} // namespace lightsync::core::transport::websocket

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lightsync/core/channel/wakeup.hpp"
#include "lightsync/core/protocol/subscription.hpp"


namespace lightsync::core::channel {

enum class CommandType : std::uint8_t {
    Subscribe,
    Unsubscribe,
    Send,
    Ping
};

[[nodiscard]]
inline constexpr std::string_view to_string(CommandType t) noexcept {
    switch (t) {
    case CommandType::Subscribe:   return "Subscribe";
    case CommandType::Unsubscribe: return "Unsubscribe";
    case CommandType::Send:        return "Send";
    case CommandType::Ping:        return "Ping";
    }
    return "Unknown";
}

// Application -> connection loop request
struct Command {
    CommandType type{CommandType::Ping};
    protocol::Subscription subscription;   // Subscribe / Unsubscribe
    std::string payload;                   // Send

    static Command subscribe(protocol::Subscription sub) {
        Command c;
        c.type = CommandType::Subscribe;
        c.subscription = std::move(sub);
        return c;
    }

    static Command unsubscribe(protocol::Subscription sub) {
        Command c;
        c.type = CommandType::Unsubscribe;
        c.subscription = std::move(sub);
        return c;
    }

    static Command send(std::string payload) {
        Command c;
        c.type = CommandType::Send;
        c.payload = std::move(payload);
        return c;
    }

    static Command ping() {
        Command c;
        c.type = CommandType::Ping;
        return c;
    }
};

enum class PushResult : std::uint8_t {
    Accepted,
    Full,
    Closed
};

[[nodiscard]]
inline constexpr std::string_view to_string(PushResult r) noexcept {
    switch (r) {
    case PushResult::Accepted: return "Accepted";
    case PushResult::Full:     return "Full";
    case PushResult::Closed:   return "Closed";
    }
    return "Unknown";
}

/*
===============================================================================
 CommandChannel
===============================================================================

Bounded queue of Commands consumed by the connection loop.

- push() blocks while the channel is full and returns false once the channel
  is closed (the loop has terminated). Every accepted push notifies the
  loop's Wakeup.
- try_push() never blocks. The command is moved from only when it is
  Accepted, so a Full result leaves it intact for a retry.
- try_pop() is non-blocking and is only called by the loop.
===============================================================================
*/
class CommandChannel {
public:
    CommandChannel(std::size_t capacity, Wakeup& wakeup)
        : capacity_(capacity == 0 ? 1 : capacity)
        , wakeup_(wakeup)
    {}

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    [[nodiscard]]
    inline bool push(Command cmd) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return queue_.size() < capacity_ || closed_; });
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(cmd));
        }
        wakeup_.notify();
        return true;
    }

    [[nodiscard]]
    inline PushResult try_push(Command& cmd) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (queue_.size() >= capacity_) {
                return PushResult::Full;
            }
            queue_.push_back(std::move(cmd));
        }
        wakeup_.notify();
        return PushResult::Accepted;
    }

    [[nodiscard]]
    inline std::optional<Command> try_pop() {
        std::optional<Command> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return std::nullopt;
            }
            out.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        return out;
    }

    // Rejects further pushes and releases blocked producers.
    // Commands still queued are discarded.
    inline void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            queue_.clear();
        }
        not_full_.notify_all();
    }

    // Accept commands again (a new connection loop is starting)
    inline void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        queue_.clear();
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

private:
    const std::size_t capacity_;
    Wakeup& wakeup_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::deque<Command> queue_;
    bool closed_{true};
};

} // namespace lightsync::core::channel

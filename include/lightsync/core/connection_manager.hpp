#pragma once

/*
================================================================================
Connection Manager
================================================================================

Owns one logical market-data session and the single loop that drives it.

  application thread                    connection loop
  ------------------                    ---------------
  subscribe / unsubscribe / send  -->   CommandChannel --> registry + wire
  ping / disconnect                     transport::Connection (FSM)
                                        Router --> Store (books, user, history)
  events().recv()                 <--   EventChannel<WsEvent>
  orderbook() / user_state() ...  <--   Store snapshots (copies)

The loop runs either on a background thread (connect()) or on the caller's
thread (open() + poll()). One poll() pass is:

  1) drain application commands, then apply a pending disconnect()
  2) drain inbound frames through the Router
  3) advance the connection FSM (retry timer, heartbeat)
  4) translate connection signals into application events

Command hand-off:
  - disconnect() never goes through the CommandChannel. It raises a stop
    flag and wakes the loop, so a full channel cannot delay it.
  - With a background loop, a full channel blocks the caller until the loop
    catches up. Without one, the caller is the loop: a full channel is
    drained inline with poll() before the command is queued.

Reconnect semantics:
  - Every (re)connection after the first clears all stores before any frame
    of the new connection is applied.
  - With auto_resubscribe, every registered subscription is re-sent after the
    stores are cleared, then Connected is emitted.

Gap semantics:
  - The Router clears the book and emits ResyncRequired.
  - Under GapPolicy::AutoResync the manager re-subscribes the book itself
    when it is still registered.

Thread-safety:
  - Public methods may be called from any thread. Without a background
    loop, commands and poll() are issued by the thread driving the session.
  - SubscriptionRegistry and the Connection are touched by the loop only.
================================================================================
*/

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "lightsync/core/config.hpp"
#include "lightsync/core/error.hpp"
#include "lightsync/core/event.hpp"
#include "lightsync/core/channel/wakeup.hpp"
#include "lightsync/core/channel/event_channel.hpp"
#include "lightsync/core/channel/command_channel.hpp"
#include "lightsync/core/protocol/registry.hpp"
#include "lightsync/core/protocol/router.hpp"
#include "lightsync/core/protocol/subscription.hpp"
#include "lightsync/core/state/store.hpp"
#include "lightsync/core/transport/concepts.hpp"
#include "lightsync/core/transport/connection.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core {

// Maps a transport open() failure to the application error space
[[nodiscard]]
inline Error to_error(transport::Error err) {
    switch (err) {
    case transport::Error::None:
        return Error::none();
    case transport::Error::InvalidUrl:
        return Error::make(ErrorCode::InvalidUrl, std::string(transport::to_string(err)));
    case transport::Error::InvalidState:
        return Error::make(ErrorCode::AlreadyConnected, "connection already active");
    case transport::Error::Timeout:
        return Error::make(ErrorCode::Timeout, "connection deadline exceeded");
    default:
        return Error::make(ErrorCode::ConnectionFailed, std::string(transport::to_string(err)));
    }
}

// Derives the transport-level configuration from the public one
[[nodiscard]]
inline transport::connection::Config to_connection_config(const Config& cfg) {
    transport::connection::Config out;
    out.reconnect_attempts = cfg.reconnect_attempts;
    out.base_delay = cfg.base_delay;
    out.max_delay = cfg.max_delay;
    out.auto_reconnect = cfg.auto_reconnect;
    out.ping_interval = cfg.ping_interval;
    out.pong_timeout = cfg.pong_timeout;
    out.websocket.connect_timeout = cfg.connect_timeout;
    if (cfg.auth_token) {
        out.websocket.headers.emplace_back("Cookie", "auth_token=" + *cfg.auth_token);
    }
    return out;
}


template<transport::WebSocketConcept WS>
class ConnectionManager {
public:
    using clock = std::chrono::steady_clock;

    explicit ConnectionManager(Config config = {})
        : config_(std::move(config))
        , connection_(wakeup_, to_connection_config(config_), protocol::ping_json())
        , router_(store_)
        , events_(config_.event_channel_capacity)
        , commands_(config_.command_channel_capacity, wakeup_)
    {}

    ~ConnectionManager() {
        shutdown_();
    }

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Establishes the connection and starts the background loop.
    // Returns once the first connection attempt has resolved.
    [[nodiscard]]
    inline Error connect() {
        Error err = open();
        if (err) {
            return err;
        }
        threaded_.store(true, std::memory_order_release);
        loop_ = std::thread([this] { run(); });
        return Error::none();
    }

    // Establishes the connection without starting a thread.
    // The caller drives the session with poll() or run().
    [[nodiscard]]
    inline Error open() {
        if (running_.load(std::memory_order_acquire)) {
            return Error::make(ErrorCode::AlreadyConnected, "connection already active");
        }
        join_loop_();

        Error err = config_.validate();
        if (err) {
            LS_ERROR("[MGR] Invalid configuration: " << err);
            return err;
        }

        LS_INFO("[MGR] Connecting to " << config_.url);
        const transport::Error terr = connection_.open(config_.url);
        if (terr != transport::Error::None) {
            LS_ERROR("[MGR] Connection to " << config_.url << " failed: " << transport::to_string(terr));
            // Drop the Disconnected signal of the failed attempt
            drain_signals_silently_();
            return to_error(terr);
        }

        commands_.reopen();
        stop_requested_.store(false, std::memory_order_release);
        threaded_.store(false, std::memory_order_release);
        running_.store(true, std::memory_order_release);
        // The Connected signal of the first attempt is delivered by the first poll()
        return Error::none();
    }

    // Graceful shutdown: clears subscriptions, closes the transport and
    // waits for the loop to finish. Commands accepted before the call are
    // still processed, later ones are discarded.
    [[nodiscard]]
    inline Error disconnect() {
        if (!running_.load(std::memory_order_acquire)) {
            join_loop_();
            return Error::make(ErrorCode::NotConnected, "not connected");
        }
        request_stop_();
        return Error::none();
    }

    // -------------------------------------------------------------------------
    // Commands (processed in order by the loop)
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error subscribe(protocol::Subscription sub) {
        return push_(channel::Command::subscribe(std::move(sub)));
    }

    [[nodiscard]]
    inline Error unsubscribe(protocol::Subscription sub) {
        return push_(channel::Command::unsubscribe(std::move(sub)));
    }

    // Raw text frame, sent as-is. Not replayed: rejected while the
    // connection is not established.
    [[nodiscard]]
    inline Error send(std::string payload) {
        if (running_.load(std::memory_order_acquire) && !connection_.is_connected()) {
            return Error::make(ErrorCode::NotConnected, "raw frame rejected while not connected");
        }
        return push_(channel::Command::send(std::move(payload)));
    }

    [[nodiscard]]
    inline Error ping() {
        if (running_.load(std::memory_order_acquire) && !connection_.is_connected()) {
            return Error::make(ErrorCode::NotConnected, "ping rejected while not connected");
        }
        return push_(channel::Command::ping());
    }

    // -------------------------------------------------------------------------
    // Loop
    // -------------------------------------------------------------------------

    inline void poll() {
        poll(clock::now());
    }

    inline void poll(clock::time_point now) {
        if (!running_.load(std::memory_order_acquire)) {
            return;
        }

        // 1) Application commands
        // Read before draining so commands accepted ahead of disconnect() still run
        const bool stop = stop_requested_.load(std::memory_order_acquire);
        while (auto cmd = commands_.try_pop()) {
            handle_command_(*cmd);
        }
        if (stop) {
            on_stop_();
        }

        // 2) Inbound frames
        std::string frame;
        while (connection_.poll_message(frame)) {
            route_(frame, now);
        }

        // 3) Connection FSM
        connection_.poll(now);

        // 4) Connection signals
        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_signal_(sig);
        }

        if (connection_.state() == transport::State::Disconnected) {
            finish_();
        }
    }

    // Blocks, polling until the session ends
    inline void run() {
        LS_DEBUG("[MGR] Connection loop started");
        while (running_.load(std::memory_order_acquire)) {
            poll(clock::now());
            if (!running_.load(std::memory_order_acquire)) {
                break;
            }
            wakeup_.wait_until(connection_.next_deadline());
        }
        LS_DEBUG("[MGR] Connection loop finished");
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline channel::EventChannel<WsEvent>& events() noexcept {
        return events_;
    }

    [[nodiscard]]
    inline transport::State state() const noexcept {
        return connection_.state();
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return connection_.is_connected();
    }

    [[nodiscard]]
    inline bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline std::optional<state::OrderBookState> orderbook(std::string_view orderbook_id) const {
        return store_.orderbook(orderbook_id);
    }

    [[nodiscard]]
    inline std::vector<std::string> orderbook_ids() const {
        return store_.orderbook_ids();
    }

    [[nodiscard]]
    inline std::optional<state::UserState> user_state() const {
        return store_.user_state();
    }

    [[nodiscard]]
    inline std::optional<state::PriceHistoryState> price_history(std::string_view orderbook_id, std::string_view resolution) const {
        return store_.price_history(orderbook_id, resolution);
    }

    [[nodiscard]]
    inline std::optional<std::string> subscribed_user() const {
        return store_.read([](const state::Store::Data& d) -> std::optional<std::string> {
            if (!d.user) {
                return std::nullopt;
            }
            return d.user->user();
        });
    }

    [[nodiscard]]
    inline const Config& config() const noexcept {
        return config_;
    }

#ifdef LS_UNIT_TEST
public:
    transport::Connection<WS>& connection() noexcept { return connection_; }
    const protocol::SubscriptionRegistry& registry() const noexcept { return registry_; }
    state::Store& store() noexcept { return store_; }
#endif // LS_UNIT_TEST

private:
    Config config_;

    channel::Wakeup wakeup_;
    state::Store store_;

    transport::Connection<WS> connection_;
    protocol::Router router_;
    protocol::SubscriptionRegistry registry_;

    channel::EventChannel<WsEvent> events_;
    channel::CommandChannel commands_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> threaded_{false};    // loop_ owns the session
    std::thread loop_;

    // Scratch buffer reused across frames
    std::vector<WsEvent> routed_;

private:
    inline Error push_(channel::Command cmd) {
        if (!running_.load(std::memory_order_acquire)) {
            return Error::make(ErrorCode::NotConnected, "not connected");
        }
        if (threaded_.load(std::memory_order_acquire)) {
            if (!commands_.push(std::move(cmd))) {
                return Error::make(ErrorCode::ChannelClosed, "command channel closed");
            }
            return Error::none();
        }

        // No loop thread: nobody else will make room
        for (;;) {
            switch (commands_.try_push(cmd)) {
            case channel::PushResult::Accepted:
                return Error::none();
            case channel::PushResult::Closed:
                return Error::make(ErrorCode::ChannelClosed, "command channel closed");
            case channel::PushResult::Full:
                LS_DEBUG("[MGR] Command channel full -> draining inline");
                poll();
                break;
            }
        }
    }

    inline void emit_(WsEvent ev) {
        if (!events_.send(std::move(ev))) {
            LS_TRACE("[MGR] Event channel closed -> event discarded");
        }
    }

    inline void send_text_(const std::string& text) {
        if (!connection_.is_connected()) {
            // Replayed from the registry on the next connection
            LS_DEBUG("[MGR] Not connected -> deferred: " << text);
            return;
        }
        if (!connection_.send(text)) {
            LS_WARN("[MGR] Failed to send: " << text);
            emit_(WsEvent::error_event(Error::make(ErrorCode::SendFailed, text)));
        }
    }

    // -------------------------------------------------------------------------
    // Commands
    // -------------------------------------------------------------------------

    inline void handle_command_(const channel::Command& cmd) {
        LS_TRACE("[MGR] Command: " << channel::to_string(cmd.type));
        switch (cmd.type) {
        case channel::CommandType::Subscribe:
            on_subscribe_(cmd.subscription);
            break;
        case channel::CommandType::Unsubscribe:
            on_unsubscribe_(cmd.subscription);
            break;
        case channel::CommandType::Send:
        case channel::CommandType::Ping:
            // Connection lost after the command was accepted
            if (!connection_.is_connected()) {
                LS_WARN("[MGR] " << channel::to_string(cmd.type) << " dropped: connection lost before it was sent");
                break;
            }
            send_text_(cmd.type == channel::CommandType::Send ? cmd.payload : protocol::ping_json());
            break;
        }
    }

    inline void on_subscribe_(const protocol::Subscription& sub) {
        using protocol::Channel;

        // One user per connection: a new wallet replaces the previous one
        if (sub.channel == Channel::User && registry_.user() && *registry_.user() != sub.user) {
            const auto previous = protocol::Subscription::user_channel(*registry_.user());
            LS_INFO("[MGR] Replacing user subscription " << previous.user << " -> " << sub.user);
            registry_.remove(previous);
            send_text_(protocol::to_json(previous, protocol::Method::Unsubscribe));
        }

        registry_.add(sub);

        store_.write([&](state::Store::Data& d) {
            switch (sub.channel) {
            case Channel::Books:
                for (const auto& id : sub.orderbook_ids) {
                    d.books.try_emplace(id, id);
                }
                break;
            case Channel::User:
                if (!d.user || d.user->user() != sub.user) {
                    d.user.emplace(sub.user);
                }
                break;
            case Channel::PriceHistory:
                d.price_histories.try_emplace(protocol::price_history_key(sub.orderbook_id, sub.resolution),
                                              sub.orderbook_id, sub.resolution, sub.include_ohlcv);
                break;
            case Channel::Trades:
            case Channel::Ticker:
            case Channel::Market:
                break;
            }
        });

        send_text_(protocol::to_json(sub, protocol::Method::Subscribe));
    }

    inline void on_unsubscribe_(const protocol::Subscription& sub) {
        using protocol::Channel;

        registry_.remove(sub);

        store_.write([&](state::Store::Data& d) {
            switch (sub.channel) {
            case Channel::Books:
                for (const auto& id : sub.orderbook_ids) {
                    d.books.erase(id);
                }
                break;
            case Channel::User:
                if (d.user && d.user->user() == sub.user) {
                    d.user.reset();
                }
                break;
            case Channel::PriceHistory:
                d.price_histories.erase(protocol::price_history_key(sub.orderbook_id, sub.resolution));
                break;
            case Channel::Trades:
            case Channel::Ticker:
            case Channel::Market:
                break;
            }
        });

        send_text_(protocol::to_json(sub, protocol::Method::Unsubscribe));
    }

    // -------------------------------------------------------------------------
    // Inbound frames
    // -------------------------------------------------------------------------

    inline void route_(const std::string& frame, clock::time_point now) {
        routed_.clear();
        (void)router_.route(frame, routed_);

        for (auto& ev : routed_) {
            switch (ev.type) {
            case EventType::Pong:
                connection_.on_pong(now);
                break;
            case EventType::ResyncRequired:
                if (config_.gap_policy == GapPolicy::AutoResync && registry_.is_subscribed_books(ev.orderbook_id)) {
                    LS_INFO("[MGR] Auto-resync of orderbook " << ev.orderbook_id);
                    send_text_(protocol::to_json(protocol::Subscription::books({ev.orderbook_id}), protocol::Method::Subscribe));
                }
                break;
            default:
                break;
            }
            emit_(std::move(ev));
        }
    }

    // -------------------------------------------------------------------------
    // Connection signals
    // -------------------------------------------------------------------------

    inline void handle_signal_(const transport::connection::Signal& sig) {
        using transport::connection::SignalKind;
        LS_DEBUG("[MGR] Signal: " << sig);

        switch (sig.kind) {
        case SignalKind::Connected:
            on_connected_();
            break;
        case SignalKind::Disconnected:
            emit_(WsEvent::disconnected(sig.reason, sig.close_code));
            break;
        case SignalKind::RateLimited:
            emit_(WsEvent::error_event(Error::rate_limited(sig.close_code)));
            break;
        case SignalKind::PingTimeout:
            emit_(WsEvent::error_event(Error::make(ErrorCode::PingTimeout, "no pong received within pong timeout")));
            break;
        case SignalKind::Reconnecting:
            emit_(WsEvent::reconnecting(sig.attempt));
            break;
        case SignalKind::MaxReconnectReached:
            emit_(WsEvent::max_reconnect_reached(sig.attempt));
            break;
        }
    }

    inline void on_connected_() {
        if (connection_.epoch() > 1) {
            // Frames of the new connection must not meet stale state
            store_.clear_all();
            LS_INFO("[MGR] Reconnected (epoch " << connection_.epoch() << ") -> stores cleared");

            if (config_.auto_resubscribe) {
                const auto subs = registry_.subscriptions();
                LS_INFO("[MGR] Replaying " << subs.size() << " subscription(s)");
                for (const auto& sub : subs) {
                    send_text_(protocol::to_json(sub, protocol::Method::Subscribe));
                }
            }
        }
        emit_(WsEvent::connected());
    }

    // -------------------------------------------------------------------------
    // Teardown
    // -------------------------------------------------------------------------

    inline void request_stop_() {
        stop_requested_.store(true, std::memory_order_release);
        wakeup_.notify();
        if (threaded_.load(std::memory_order_acquire)) {
            join_loop_();
        }
        else {
            poll();
        }
    }

    inline void on_stop_() {
        LS_INFO("[MGR] Disconnect requested");
        stop_requested_.store(false, std::memory_order_release);
        registry_.clear();
        connection_.close();
        // Anything queued after the request is discarded
        commands_.close();
    }

    inline void finish_() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        commands_.close();
        LS_INFO("[MGR] Session ended");
    }

    inline void drain_signals_silently_() {
        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            LS_TRACE("[MGR] Discarding signal: " << sig);
        }
    }

    inline void join_loop_() {
        if (loop_.joinable() && loop_.get_id() != std::this_thread::get_id()) {
            loop_.join();
        }
    }

    inline void shutdown_() {
        if (running_.load(std::memory_order_acquire)) {
            request_stop_();
        }
        join_loop_();
        if (loop_.joinable()) {
            loop_.detach();
        }
    }
};

} // namespace lightsync::core

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lightsync/core/channel/wakeup.hpp"
#include "lightsync/core/transport/concepts.hpp"
#include "lightsync/core/transport/parse_url.hpp"
#include "lightsync/core/transport/state.hpp"
#include "lightsync/core/transport/connection/backoff.hpp"
#include "lightsync/core/transport/connection/config.hpp"
#include "lightsync/core/transport/connection/signal.hpp"
#include "lightsync/core/transport/websocket/events.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::transport {

/*
===============================================================================
 lightsync::core::transport::Connection
===============================================================================

Logical WebSocket connection, parameterized by a transport implementation
conforming to transport::WebSocketConcept.

The logical connection keeps its identity across transport failures and
automatic reconnections. It knows nothing about the venue's message schema:
the ping payload is injected and pong detection is reported back through
on_pong() by the protocol layer.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Establish and manage a logical WebSocket connection
- Own the transport lifecycle (connect, close, retry with backoff)
- Check liveness with periodic pings and a pong deadline
- Expose observable consequences as ordered connection::Signal edges

-------------------------------------------------------------------------------
 State Machine
-------------------------------------------------------------------------------

  Disconnected --open()--> Connecting --ok--> Connected
                                |                |
                              fail        close frame / error / ping timeout
                                |                |
                                v                v
                          Disconnected      Reconnecting --timer--> Connecting
                                                 |
                                     attempts exhausted / close()
                                                 v
                                            Disconnected

- The initial open() failure is returned to the caller; it never retries.
- Reconnect delays use full jitter:
      delay = uniform(0, min(base * 2^(attempt-1), max_delay))
- auto_reconnect == false turns every transport loss into a terminal
  Disconnected.

-------------------------------------------------------------------------------
 Liveness
-------------------------------------------------------------------------------
- A ping is sent every ping_interval while Connected
- If an interval fires while a pong is still awaited and more than
  pong_timeout elapsed since the last pong, the transport is dropped and the
  loss is handled exactly like an unexpected close

-------------------------------------------------------------------------------
 Signal ordering
-------------------------------------------------------------------------------
- Close 1008:       RateLimited, Disconnected, Reconnecting
- Ping timeout:     PingTimeout, Disconnected, Reconnecting
- Exhausted:        MaxReconnectReached, Disconnected
- Local close():    Disconnected (never followed by Reconnecting)

-------------------------------------------------------------------------------
 Usage Model
-------------------------------------------------------------------------------
- Call open(url) once to activate the connection
- Drive all progress by calling poll() from a single thread
- Drain frames with poll_message() and signals with poll_signal()
- state() may be read from any thread

No background threads of its own; all logic is poll-driven.
===============================================================================
*/

template <transport::WebSocketConcept WS>
class Connection {
public:
    using clock = std::chrono::steady_clock;

    Connection(channel::Wakeup& wakeup, connection::Config config, std::string ping_payload)
        : wakeup_(wakeup)
        , config_(std::move(config))
        , ping_payload_(std::move(ping_payload))
        , rng_(std::random_device{}())
    {}

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Ensure transport is closed on destruction.
    // Reconnection is not attempted after object lifetime ends.
    ~Connection() {
        close();
    }

    // Connection lifecycle
    [[nodiscard]]
    inline Error open(const std::string& url) noexcept {
        LS_DEBUG("[CONN] Connecting to: " << url);
        now_ = clock::now();

        // 0) PRECONDITION: must be disconnected
        if (get_state_() != State::Disconnected) {
            LS_WARN("[CONN] open() called while not disconnected (state: " << to_string(get_state_()) << "). Ignoring.");
            return Error::InvalidState;
        }
        // 1) PRECONDITION: parse and validate URL
        ParsedUrl tmp;
        if (parse_url(url, tmp) != Error::None) {
            LS_ERROR("[CONN] Invalid URL: " << url);
            return Error::InvalidUrl;
        }
        last_url_ = url;
        parsed_url_ = std::move(tmp);
        // 2) Enter FSM
        transition_(Event::OpenRequested);
        // 3) Fresh transport instance + connect
        create_transport_();
        last_error_ = ws_->connect(*parsed_url_, config_.websocket);
        if (last_error_ != Error::None) {
            LS_ERROR("[CONN] Connection failed (" << to_string(last_error_) << ")");
            transition_(Event::TransportConnectFailed, last_error_);
            return last_error_;
        }
        // 4) Connected
        transition_(Event::TransportConnected);
        LS_INFO("[CONN] Connected to server: " << last_url_);
        return Error::None;
    }

    // Manual disconnect: unconditional shutdown that cancels any pending
    // reconnection. Idempotent.
    inline void close(std::uint16_t code = websocket::CLOSE_NORMAL,
                      std::string_view reason = "client disconnect") noexcept {
        const auto state = get_state_();
        if (state == State::Disconnected || state == State::Disconnecting) {
            return;
        }
        close_code_ = code;
        close_reason_ = std::string(reason);
        transition_(Event::CloseRequested);
    }

    // Sending
    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (get_state_() != State::Connected) {
            LS_WARN("[CONN] send() called while not connected (state: " << to_string(get_state_()) << "). Ignoring.");
            return false;
        }
        if (ws_->send(text)) {
            ++tx_messages_;
            return true;
        }
        LS_WARN("[CONN] send() failed at transport level");
        return false;
    }

    // Event loop
    inline void poll() noexcept {
        poll(clock::now());
    }

    inline void poll(clock::time_point now) noexcept {
        now_ = now;
        // === Drain transport events ===
        if (ws_) {
            std::vector<websocket::Event> events;
            websocket::Event ev;
            while (ws_->poll_event(ev)) {
                events.push_back(std::move(ev));
            }
            for (auto& e : events) {
                switch (e.type) {
                    case websocket::EventType::Close:
                        on_transport_closed_(e.close_code, e.reason);
                        break;
                    case websocket::EventType::Error:
                        on_transport_error_(e.error);
                        break;
                }
            }
        }
        // === Reconnection logic ===
        if (get_state_() == State::Reconnecting && now_ >= next_retry_) {
            reconnect_();
        }
        // === Liveness logic ===
        if (get_state_() == State::Connected && now_ >= next_ping_) {
            on_ping_tick_();
        }
    }

    // Next complete text frame of the current transport
    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        if (!ws_ || get_state_() != State::Connected) {
            return false;
        }
        if (ws_->poll_message(out)) {
            ++rx_messages_;
            return true;
        }
        return false;
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        if (signals_.empty()) {
            return false;
        }
        out = std::move(signals_.front());
        signals_.pop_front();
        return true;
    }

    // Reported by the protocol layer when a pong frame is routed
    inline void on_pong(clock::time_point now) noexcept {
        awaiting_pong_ = false;
        last_pong_ = now;
    }

    inline void on_pong() noexcept {
        on_pong(clock::now());
    }

    // Earliest instant at which poll() has timed work to do
    [[nodiscard]]
    inline clock::time_point next_deadline() const noexcept {
        switch (get_state_()) {
            case State::Connected:    return next_ping_;
            case State::Reconnecting: return next_retry_;
            default:                  return clock::time_point::max();
        }
    }

    // Accessors
    [[nodiscard]]
    inline State state() const noexcept {
        return get_state_();
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return get_state_() == State::Connected;
    }

    // Returns true while the connection is (or will again be) usable
    [[nodiscard]]
    inline bool is_active() const noexcept {
        return get_state_() != State::Disconnected;
    }

    // Incremented once per successful transport connection
    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    [[nodiscard]]
    inline std::uint32_t retry_attempt() const noexcept {
        return retry_attempt_;
    }

    [[nodiscard]]
    inline bool awaiting_pong() const noexcept {
        return awaiting_pong_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return rx_messages_;
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return tx_messages_;
    }

    [[nodiscard]]
    inline Error last_error() const noexcept {
        return last_error_;
    }

    [[nodiscard]]
    inline const connection::Config& config() const noexcept {
        return config_;
    }

#ifdef LS_UNIT_TEST
public:
    inline void force_last_pong(clock::time_point ts) noexcept {
        last_pong_ = ts;
    }

    inline clock::time_point next_retry() const noexcept {
        return next_retry_;
    }

    inline clock::time_point next_ping() const noexcept {
        return next_ping_;
    }

    inline void seed(std::uint64_t s) noexcept {
        rng_.seed(s);
    }

    WS& ws() {
        return *ws_;
    }

    bool has_transport() const noexcept {
        return ws_ != nullptr;
    }
#endif // LS_UNIT_TEST

private:
    channel::Wakeup& wakeup_;
    connection::Config config_;
    std::string ping_payload_;

    std::string last_url_;
    std::optional<ParsedUrl> parsed_url_;      // set -> valid endpoint

    std::unique_ptr<WS> ws_;                   // owned; one instance per transport lifetime

    std::uint64_t epoch_{0};
    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};

    // Liveness tracking
    bool awaiting_pong_{false};
    clock::time_point last_pong_{};
    clock::time_point next_ping_{};

    // Error tracking
    Error last_error_{Error::None};
    DisconnectReason disconnect_reason_{DisconnectReason::None};
    std::uint16_t close_code_{websocket::CLOSE_NORMAL};
    std::string close_reason_;

    // State machine
    std::atomic<State> state_{State::Disconnected};
    clock::time_point now_{};
    clock::time_point next_retry_{};
    std::uint32_t retry_attempt_{0};      // 1-based ordinal of the pending / last attempt
    std::mt19937_64 rng_;

    // Pending signals, in emission order
    std::deque<connection::Signal> signals_;

    inline void emit_(connection::Signal sig) {
        LS_TRACE("[CONN] Emitting signal: " << sig);
        signals_.push_back(std::move(sig));
    }

    inline State get_state_() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    inline void set_state_(State new_state) noexcept {
        LS_TRACE("[CONN] State:  " << to_string(get_state_()) << " -> " << to_string(new_state));
        state_.store(new_state, std::memory_order_release);
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        const State state = get_state_();

        LS_TRACE("[FSM] (" << to_string(state) << ") --" << to_string(event) << "-->");

        switch (state) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::OpenRequested:
                disconnect_reason_ = DisconnectReason::None;
                set_state_(State::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportConnected:
                set_state_(State::Connected);
                ++epoch_;
                retry_attempt_ = 0;
                last_error_ = Error::None;
                disconnect_reason_ = DisconnectReason::None;
                // Liveness restarts with the transport
                awaiting_pong_ = false;
                last_pong_ = now_;
                next_ping_ = now_ + config_.ping_interval;
                emit_(connection::Signal::connected());
                break;

            case Event::TransportConnectFailed:
                // Initial connect: the caller gets the error, no retry cycle
                release_transport_();
                set_state_(State::Disconnected);
                break;

            case Event::TransportReconnectFailed:
                release_transport_();
                last_error_ = error;
                disconnect_reason_ = DisconnectReason::TransportError;
                set_state_(State::Reconnecting);
                schedule_next_retry_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::PingTimeout:
                disconnect_reason_ = DisconnectReason::PingTimeout;
                set_state_(State::Disconnecting);
                if (ws_) {
                    ws_->close(websocket::CLOSE_GOING_AWAY, "ping timeout");
                }
                release_transport_();
                emit_(connection::Signal::disconnected(0, "ping timeout"));
                resolve_loss_();
                break;

            case Event::CloseRequested:
                LS_DEBUG("[CONN] Disconnecting from: " << last_url_);
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Disconnecting);
                if (ws_) {
                    ws_->close(close_code_, close_reason_);
                }
                release_transport_();
                set_state_(State::Disconnected);
                emit_(connection::Signal::disconnected(close_code_, close_reason_));
                LS_INFO("[CONN] Disconnected from server: " << last_url_);
                break;

            case Event::TransportClosed:
                set_state_(State::Disconnecting);
                release_transport_();
                resolve_loss_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Disconnecting:
            // Transient: every path through it resolves within one call
            break;

        // ================================================================
        case State::Reconnecting:
            switch (event) {
            case Event::RetryTimerExpired:
                set_state_(State::Connecting);
                break;

            case Event::CloseRequested:
                disconnect_reason_ = DisconnectReason::LocalClose;
                set_state_(State::Disconnected);
                emit_(connection::Signal::disconnected(0, close_reason_));
                LS_INFO("[CONN] Reconnection cancelled");
                break;

            default:
                break;
            }
            break;
        }
    }

    // Transport lost while Connected: reconnect or stop
    inline void resolve_loss_() {
        if (config_.auto_reconnect) {
            set_state_(State::Reconnecting);
            retry_attempt_ = 0;
            schedule_next_retry_();
        } else {
            LS_INFO("[CONN] Auto-reconnect disabled, staying disconnected");
            set_state_(State::Disconnected);
        }
    }

    inline void create_transport_() {
        release_transport_();
        ws_ = std::make_unique<WS>(wakeup_);
    }

    inline void release_transport_() noexcept {
        if (ws_) {
            ws_->close(websocket::CLOSE_NORMAL, {});
            ws_.reset();
        }
    }

    inline void on_transport_error_(Error error) {
        // Do not override an intentional disconnect decision
        if (disconnect_reason_ == DisconnectReason::PingTimeout || disconnect_reason_ == DisconnectReason::LocalClose) {
            return;
        }
        LS_WARN("[CONN] Transport error: " << to_string(error));
        last_error_ = error;
        disconnect_reason_ = DisconnectReason::TransportError;
    }

    inline void on_transport_closed_(std::uint16_t code, const std::string& reason) {
        if (get_state_() != State::Connected) {
            return; // already resolved
        }
        if (disconnect_reason_ == DisconnectReason::None) {
            disconnect_reason_ = DisconnectReason::RemoteClose;
            last_error_ = Error::RemoteClosed;
        }
        LS_INFO("[CONN] Connection closed from server: " << last_url_ << " (code " << code
                << ", reason: " << (reason.empty() ? to_string(disconnect_reason_) : std::string_view(reason)) << ")");
        if (code == websocket::CLOSE_POLICY) {
            LS_WARN("[CONN] Server closed with rate-limit code " << code);
            emit_(connection::Signal::rate_limited(code));
        }
        emit_(connection::Signal::disconnected(code, reason.empty() ? std::string(to_string(disconnect_reason_)) : reason));
        transition_(Event::TransportClosed, last_error_);
    }

    inline void on_ping_tick_() {
        if (awaiting_pong_ && (now_ - last_pong_) > config_.pong_timeout) {
            LS_WARN("[CONN] Pong timeout: no pong within " << config_.pong_timeout.count() << " ms (Forcing reconnect).");
            emit_(connection::Signal::ping_timeout());
            transition_(Event::PingTimeout, Error::Timeout);
            return;
        }
        LS_TRACE("[CONN] Sending ping");
        if (ws_->send(ping_payload_)) {
            ++tx_messages_;
        } else {
            LS_WARN("[CONN] Failed to send ping");
        }
        awaiting_pong_ = true;
        next_ping_ = now_ + config_.ping_interval;
    }

    inline void reconnect_() {
        LS_DEBUG("[CONN] Reconnecting to: " << last_url_ << " (attempt " << retry_attempt_ << ")");
        // 1) Retry delay elapsed
        transition_(Event::RetryTimerExpired);
        // 2) Fresh transport + connect
        create_transport_();
        const Error err = ws_->connect(*parsed_url_, config_.websocket);
        if (err != Error::None) {
            LS_ERROR("[CONN] Reconnection failed (" << to_string(err) << ")");
            transition_(Event::TransportReconnectFailed, err);
            return;
        }
        // 3) Connected
        transition_(Event::TransportConnected);
        LS_INFO("[CONN] Connection re-established with server '" << last_url_ << "'.");
    }

    // Schedule the next attempt with full-jitter backoff, or give up
    inline void schedule_next_retry_() {
        if (retry_attempt_ >= config_.reconnect_attempts) {
            LS_ERROR("[CONN] Max reconnect attempts reached (" << retry_attempt_ << ")");
            set_state_(State::Disconnected);
            emit_(connection::Signal::max_reconnect_reached(retry_attempt_));
            emit_(connection::Signal::disconnected(0, "max reconnect attempts reached"));
            return;
        }
        ++retry_attempt_;
        const auto delay = connection::full_jitter(retry_attempt_, config_.base_delay, config_.max_delay, rng_);
        next_retry_ = now_ + delay;
        emit_(connection::Signal::reconnecting(retry_attempt_));
        LS_INFO("[CONN] Reconnection attempt " << retry_attempt_ << "/" << config_.reconnect_attempts
                << " in " << delay.count() << " ms");
    }
};

} // namespace lightsync::core::transport

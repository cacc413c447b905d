/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents externally observable, edge-triggered facts
emitted by transport::Connection through poll_signal().

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Delivered in the order the facts happened

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  A WebSocket connection has been established. Increments the epoch.

Disconnected
  The logical connection became unusable. Carries the close code (0 when
  no CLOSE frame was involved) and a human-readable reason.

RateLimited
  The server closed with the rate-limit code (1008). Always emitted BEFORE
  the matching Disconnected.

PingTimeout
  No pong within pong_timeout. Emitted BEFORE the matching Disconnected.

Reconnecting
  A reconnection attempt has been scheduled. Carries its 1-based ordinal.

MaxReconnectReached
  The attempt limit is exhausted. Carries the number of attempts made and
  is followed by a final Disconnected.

===============================================================================
*/
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>


namespace lightsync::core::transport::connection {

enum class SignalKind : std::uint8_t {
    Connected,
    Disconnected,
    RateLimited,
    PingTimeout,
    Reconnecting,
    MaxReconnectReached
};

[[nodiscard]]
inline constexpr std::string_view to_string(SignalKind k) noexcept {
    switch (k) {
        case SignalKind::Connected:           return "Connected";
        case SignalKind::Disconnected:        return "Disconnected";
        case SignalKind::RateLimited:         return "RateLimited";
        case SignalKind::PingTimeout:         return "PingTimeout";
        case SignalKind::Reconnecting:        return "Reconnecting";
        case SignalKind::MaxReconnectReached: return "MaxReconnectReached";
    }
    return "Unknown";
}

struct Signal {
    SignalKind kind{SignalKind::Connected};
    std::uint32_t attempt{0};
    std::uint16_t close_code{0};
    std::string reason;

    static Signal connected() {
        return Signal{};
    }

    static Signal disconnected(std::uint16_t close_code, std::string reason) {
        return Signal{SignalKind::Disconnected, 0, close_code, std::move(reason)};
    }

    static Signal rate_limited(std::uint16_t close_code) {
        return Signal{SignalKind::RateLimited, 0, close_code, {}};
    }

    static Signal ping_timeout() {
        return Signal{SignalKind::PingTimeout, 0, 0, {}};
    }

    static Signal reconnecting(std::uint32_t attempt) {
        return Signal{SignalKind::Reconnecting, attempt, 0, {}};
    }

    static Signal max_reconnect_reached(std::uint32_t attempts) {
        return Signal{SignalKind::MaxReconnectReached, attempts, 0, {}};
    }
};

inline std::ostream& operator<<(std::ostream& os, const Signal& sig) {
    os << to_string(sig.kind);
    if (sig.kind == SignalKind::Reconnecting || sig.kind == SignalKind::MaxReconnectReached) {
        os << " (attempt " << sig.attempt << ")";
    }
    if (sig.close_code != 0) {
        os << " (code " << sig.close_code << ")";
    }
    if (!sig.reason.empty()) {
        os << " (" << sig.reason << ")";
    }
    return os;
}

} // namespace lightsync::core::transport::connection

#pragma once

#include <cstdint>
#include <string_view>


namespace lightsync::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Disconnecting
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:  return "Disconnected";
        case State::Connecting:    return "Connecting";
        case State::Connected:     return "Connected";
        case State::Reconnecting:  return "Reconnecting";
        case State::Disconnecting: return "Disconnecting";
    }
    return "Unknown";
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : std::uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportConnected,          // open / reconnect -> connect succeeded
    TransportConnectFailed,      // open -> connect failed
    TransportReconnectFailed,    // reconnect -> connect failed
    TransportClosed,             // CLOSE frame, read / write error

    // --- Liveness ---
    PingTimeout,

    // --- Retry ---
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:             return "OpenRequested";
        case Event::CloseRequested:            return "CloseRequested";
        case Event::TransportConnected:        return "TransportConnected";
        case Event::TransportConnectFailed:    return "TransportConnectFailed";
        case Event::TransportReconnectFailed:  return "TransportReconnectFailed";
        case Event::TransportClosed:           return "TransportClosed";
        case Event::PingTimeout:               return "PingTimeout";
        case Event::RetryTimerExpired:         return "RetryTimerExpired";
    }
    return "UnknownEvent";
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : std::uint8_t {
    None,
    LocalClose,        // explicit close() by user
    RemoteClose,       // CLOSE frame from the server
    TransportError,    // websocket / IO error
    PingTimeout        // no pong within pong_timeout
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:           return "None";
        case DisconnectReason::LocalClose:     return "LocalClose";
        case DisconnectReason::RemoteClose:    return "RemoteClose";
        case DisconnectReason::TransportError: return "TransportError";
        case DisconnectReason::PingTimeout:    return "PingTimeout";
    }
    return "Unknown";
}

} // namespace lightsync::core::transport

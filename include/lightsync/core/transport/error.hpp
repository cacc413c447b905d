#pragma once

#include <cstdint>
#include <string_view>


namespace lightsync::core::transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification, abstracted away from Boost.Beast /
Asio / OpenSSL error codes.

Higher layers (transport::Connection, ConnectionManager) use it to decide
whether a failure is retried and how it is surfaced.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current connection state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint sent a CLOSE frame

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Connection establishment exceeded its deadline
    ConnectionFailed, // DNS resolution or TCP connect failed
    HandshakeFailed,  // TLS or WebSocket upgrade failed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Read / write failure on an established socket
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    }
    return "Unknown";
}

} // namespace lightsync::core::transport

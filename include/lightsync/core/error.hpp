#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>
#include <utility>


namespace lightsync {

/*
===============================================================================
 lightsync::Error
===============================================================================

Error surface of the synchronization layer.

Errors reach the caller through two paths and never both:

  • Returned synchronously from API calls (usage errors):
        NotConnected, AlreadyConnected, ChannelClosed, InvalidUrl,
        InvalidAuthToken, InvalidConfig, ConnectionFailed, Timeout

  • Emitted as EventType::Error on the event channel (stream errors):
        SequenceGap, ResyncRequired, ConnectionClosed, RateLimited,
        ParseError, ServerError, PingTimeout, SendFailed

Payload fields are only meaningful for the codes documented next to them.
===============================================================================
*/

enum class ErrorCode : std::uint8_t {
    None = 0,

    // --- Reconciliation -----------------------------------------------------
    SequenceGap,        // expected, received, orderbook_id
    ResyncRequired,     // orderbook_id

    // --- Connection lifecycle -----------------------------------------------
    ConnectionFailed,   // message
    ConnectionClosed,   // close_code, message (close reason)
    RateLimited,        // close_code (1008)
    PingTimeout,
    Timeout,            // connection deadline exceeded
    SendFailed,

    // --- Protocol -----------------------------------------------------------
    ParseError,         // message
    ServerError,        // server_code, message, orderbook_id (optional)

    // --- Usage --------------------------------------------------------------
    NotConnected,
    AlreadyConnected,
    ChannelClosed,
    InvalidUrl,
    InvalidAuthToken,
    InvalidConfig,
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::None:             return "None";
    case ErrorCode::SequenceGap:      return "SequenceGap";
    case ErrorCode::ResyncRequired:   return "ResyncRequired";
    case ErrorCode::ConnectionFailed: return "ConnectionFailed";
    case ErrorCode::ConnectionClosed: return "ConnectionClosed";
    case ErrorCode::RateLimited:      return "RateLimited";
    case ErrorCode::PingTimeout:      return "PingTimeout";
    case ErrorCode::Timeout:          return "Timeout";
    case ErrorCode::SendFailed:       return "SendFailed";
    case ErrorCode::ParseError:       return "ParseError";
    case ErrorCode::ServerError:      return "ServerError";
    case ErrorCode::NotConnected:     return "NotConnected";
    case ErrorCode::AlreadyConnected: return "AlreadyConnected";
    case ErrorCode::ChannelClosed:    return "ChannelClosed";
    case ErrorCode::InvalidUrl:       return "InvalidUrl";
    case ErrorCode::InvalidAuthToken: return "InvalidAuthToken";
    case ErrorCode::InvalidConfig:    return "InvalidConfig";
    }
    return "Unknown";
}


// Server-side error codes carried by in-band "error" frames
enum class ServerErrorCode : std::uint8_t {
    EngineUnavailable,
    InvalidJson,
    InvalidMethod,
    RateLimited,
    Unknown
};

[[nodiscard]]
inline constexpr ServerErrorCode server_error_code_from_string(std::string_view s) noexcept {
    if (s == "ENGINE_UNAVAILABLE") return ServerErrorCode::EngineUnavailable;
    if (s == "INVALID_JSON")       return ServerErrorCode::InvalidJson;
    if (s == "INVALID_METHOD")     return ServerErrorCode::InvalidMethod;
    if (s == "RATE_LIMITED")       return ServerErrorCode::RateLimited;
    return ServerErrorCode::Unknown;
}

[[nodiscard]]
inline constexpr std::string_view to_string(ServerErrorCode code) noexcept {
    switch (code) {
    case ServerErrorCode::EngineUnavailable: return "ENGINE_UNAVAILABLE";
    case ServerErrorCode::InvalidJson:       return "INVALID_JSON";
    case ServerErrorCode::InvalidMethod:     return "INVALID_METHOD";
    case ServerErrorCode::RateLimited:       return "RATE_LIMITED";
    case ServerErrorCode::Unknown:           return "UNKNOWN";
    }
    return "UNKNOWN";
}


struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;

    // SequenceGap
    std::uint64_t expected{0};
    std::uint64_t received{0};

    // SequenceGap / ResyncRequired / ServerError
    std::string orderbook_id;

    // ConnectionClosed / RateLimited
    std::uint16_t close_code{0};

    // ServerError (raw code as sent by the server)
    std::string server_code;

    [[nodiscard]]
    inline bool ok() const noexcept { return code == ErrorCode::None; }

    [[nodiscard]]
    explicit operator bool() const noexcept { return code != ErrorCode::None; }

    // --- Factories ----------------------------------------------------------

    static Error none() { return Error{}; }

    static Error make(ErrorCode code, std::string message = {}) {
        Error e;
        e.code = code;
        e.message = std::move(message);
        return e;
    }

    static Error sequence_gap(std::string orderbook_id, std::uint64_t expected, std::uint64_t received) {
        Error e;
        e.code = ErrorCode::SequenceGap;
        e.orderbook_id = std::move(orderbook_id);
        e.expected = expected;
        e.received = received;
        e.message = "sequence gap: expected " + std::to_string(expected) + ", received " + std::to_string(received);
        return e;
    }

    static Error resync_required(std::string orderbook_id) {
        Error e;
        e.code = ErrorCode::ResyncRequired;
        e.message = "resync required for orderbook " + orderbook_id;
        e.orderbook_id = std::move(orderbook_id);
        return e;
    }

    static Error connection_closed(std::uint16_t close_code, std::string reason) {
        Error e;
        e.code = ErrorCode::ConnectionClosed;
        e.close_code = close_code;
        e.message = std::move(reason);
        return e;
    }

    static Error rate_limited(std::uint16_t close_code) {
        Error e;
        e.code = ErrorCode::RateLimited;
        e.close_code = close_code;
        e.message = "rate limited by server";
        return e;
    }

    static Error server_error(std::string server_code, std::string message, std::string orderbook_id = {}) {
        Error e;
        e.code = ErrorCode::ServerError;
        e.server_code = std::move(server_code);
        e.message = std::move(message);
        e.orderbook_id = std::move(orderbook_id);
        return e;
    }

    static Error parse_error(std::string message) {
        return make(ErrorCode::ParseError, std::move(message));
    }
};

inline std::ostream& operator<<(std::ostream& os, const Error& e) {
    os << to_string(e.code);
    if (!e.message.empty()) {
        os << ": " << e.message;
    }
    return os;
}

} // namespace lightsync

/*
================================================================================
lightsync Client Configuration
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "lightsync/core/error.hpp"


namespace lightsync {

// Default production endpoint
inline constexpr std::string_view DEFAULT_WS_URL = "wss://ws.lightcone.xyz/ws";

// WebSocket close code reserved by the server for rate limiting (policy violation)
inline constexpr std::uint16_t RATE_LIMIT_CLOSE_CODE = 1008;

// Upper bound of candles kept per price-history key
inline constexpr std::size_t MAX_CANDLES = 1000;

// What to do after a book delta arrives out of sequence
enum class GapPolicy : std::uint8_t {
    Notify,      // clear the book and emit ResyncRequired; the application decides
    AutoResync   // same, and re-send the book subscription to obtain a fresh snapshot
};

[[nodiscard]]
inline constexpr std::string_view to_string(GapPolicy p) noexcept {
    switch (p) {
    case GapPolicy::Notify:     return "Notify";
    case GapPolicy::AutoResync: return "AutoResync";
    }
    return "Unknown";
}

struct Config {
    std::string url = std::string(DEFAULT_WS_URL);

    // Reconnection
    std::uint32_t reconnect_attempts = 10;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    bool auto_reconnect = true;
    bool auto_resubscribe = true;

    // Liveness
    std::chrono::milliseconds ping_interval{30000};
    std::chrono::milliseconds pong_timeout{60000};

    // Connection establishment deadline (TCP + TLS + upgrade)
    std::chrono::milliseconds connect_timeout{30000};

    // Channels
    std::size_t event_channel_capacity = 1000;
    std::size_t command_channel_capacity = 100;

    // Sent as "Cookie: auth_token=<token>" on the upgrade request
    std::optional<std::string> auth_token;

    GapPolicy gap_policy = GapPolicy::Notify;

    // Validates ranges and the auth token. The URL itself is validated
    // by the transport when connecting.
    [[nodiscard]]
    inline Error validate() const {
        if (auth_token.has_value()) {
            bool blank = true;
            for (char c : *auth_token) {
                if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
                    blank = false;
                    break;
                }
            }
            if (blank) {
                return Error::make(ErrorCode::InvalidAuthToken, "auth token is empty");
            }
        }
        if (event_channel_capacity == 0 || command_channel_capacity == 0) {
            return Error::make(ErrorCode::InvalidConfig, "channel capacity must be non-zero");
        }
        if (max_delay < base_delay) {
            return Error::make(ErrorCode::InvalidConfig, "max_delay must be >= base_delay");
        }
        if (ping_interval.count() <= 0 || pong_timeout.count() <= 0) {
            return Error::make(ErrorCode::InvalidConfig, "ping interval and pong timeout must be positive");
        }
        return Error::none();
    }
};

} // namespace lightsync

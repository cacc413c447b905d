#pragma once

#include <array>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>


namespace lightsync::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Candle resolution validator
// -------------------------------------------------------------
inline constexpr std::array<std::string_view, 6> valid_resolutions = {
    "1m", "5m", "15m", "1h", "4h", "1d"
};

inline auto resolution_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (auto r : valid_resolutions) {
            if (value == r) {
                return {};
            }
        }
        return "Resolution must be one of: 1m, 5m, 15m, 1h, 4h, 1d";
    },
    "Candle resolution validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"});

} // namespace lightsync::examples::cli

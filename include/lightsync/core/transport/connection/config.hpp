#pragma once

#include <chrono>
#include <cstdint>

#include "lightsync/core/transport/websocket/options.hpp"


namespace lightsync::core::transport::connection {

// Transport-level subset of lightsync::Config
struct Config {
    std::uint32_t reconnect_attempts{10};
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    bool auto_reconnect{true};

    std::chrono::milliseconds ping_interval{30000};
    std::chrono::milliseconds pong_timeout{60000};

    websocket::Options websocket;
};

} // namespace lightsync::core::transport::connection

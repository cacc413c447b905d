#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>


namespace lightsync::core::transport::websocket {

// Per-connect parameters handed to the transport
struct Options {
    // One deadline for DNS resolve, TCP connect, TLS handshake and HTTP upgrade
    std::chrono::milliseconds connect_timeout{30000};

    // Extra request headers of the upgrade request (e.g. Cookie)
    std::vector<std::pair<std::string, std::string>> headers;

    std::string user_agent{"lightsync/1.0"};
};

} // namespace lightsync::core::transport::websocket

#pragma once

#include <cstdlib>
#include <cstddef>
#include <string>
#include <string_view>

#include "lightsync/core/transport/error.hpp"


namespace lightsync::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{true};    // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;     // path and query, always starts with '/'
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser supporting ws:// and wss://
    // Accepts the URLs used by the venue and rejects malformed inputs
    // without attempting full RFC 3986 compliance.
    //
    // Example inputs:
    //   wss://ws.lightcone.xyz/ws
    //   ws://localhost:8080/ws?token=abc
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) host[:port], ends at the first '/' or '?'
        const std::size_t end = url.find_first_of("/?", pos);
        const std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        const std::size_t colon = hostport.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = out.secure ? "443" : "80";
        }
        // 4) Path (default "/")
        if (end == std::string_view::npos) {
            out.path = "/";
        } else if (url[end] == '?') {
            out.path = "/" + std::string(url.substr(end));
        } else {
            out.path = std::string(url.substr(end));
        }

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.host) {
            if (c == ' ' || c == '@' || c == '#') {
                return Error::InvalidUrl;
            }
        }
        // Port must be numeric and in range
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace lightsync::core::transport

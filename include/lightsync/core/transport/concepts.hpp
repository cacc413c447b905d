#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <cstdint>

#include "lightsync/core/channel/wakeup.hpp"
#include "lightsync/core/transport/error.hpp"
#include "lightsync/core/transport/parse_url.hpp"
#include "lightsync/core/transport/websocket/events.hpp"
#include "lightsync/core/transport/websocket/options.hpp"


namespace lightsync::core::transport {

// -----------------------------------------------------------------------------
// WebSocketConcept
// -----------------------------------------------------------------------------
//
// Minimal contract required by the Connection layer.
//
// The WebSocket implementation:
//
//   • Is constructed with the Wakeup of the connection loop
//   • Owns its receive thread, if it needs one
//   • Queues complete text frames, drained by poll_message()
//   • Queues control-plane events (Close / Error), drained by poll_event()
//   • Notifies the Wakeup whenever something is queued
//
// One instance represents one transport lifetime; Connection creates a fresh
// instance for every connection attempt.
// -----------------------------------------------------------------------------

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, channel::Wakeup&> &&
    requires(
        WS ws,
        const ParsedUrl& url,
        const websocket::Options& options,
        std::string_view msg,
        std::uint16_t code,
        std::string& out,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(url, options) } noexcept -> std::same_as<Error>;
    { ws.close(code, msg) } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Draining
    // ---------------------------------------------------------------------

    { ws.poll_message(out) } noexcept -> std::same_as<bool>;
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace lightsync::core::transport

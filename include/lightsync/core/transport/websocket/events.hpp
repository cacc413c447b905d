#pragma once

/*
===============================================================================
 lightsync::core::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket transport implementation and
drained by the owning Connection through poll_event().

    • Close  → Transport closed by the peer or by a failure. Carries the
               close code and reason of the CLOSE frame when one was
               received (1006 "abnormal closure" otherwise).
    • Error  → Transport-level failure. Always followed by a Close.

Data frames travel on a separate queue (poll_message()).

-------------------------------------------------------------------------------
 Reliability Contract
-------------------------------------------------------------------------------

• Control-plane events are never dropped.
• Close is delivered exactly once per transport instance.
• A locally requested close() does not produce a Close event.
===============================================================================
*/

#include <cstdint>
#include <string>
#include <utility>

#include "lightsync/core/transport/error.hpp"


namespace lightsync::core::transport::websocket {

// RFC 6455 section 7.4.1
inline constexpr std::uint16_t CLOSE_NORMAL     = 1000;
inline constexpr std::uint16_t CLOSE_GOING_AWAY = 1001;
inline constexpr std::uint16_t CLOSE_ABNORMAL   = 1006;
inline constexpr std::uint16_t CLOSE_POLICY     = 1008;

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1
};

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None};   // valid only if type == Error
    std::uint16_t close_code{CLOSE_ABNORMAL};          // valid only if type == Close
    std::string reason;                                // valid only if type == Close

    static Event make_close(std::uint16_t code, std::string reason) {
        Event ev;
        ev.type = EventType::Close;
        ev.close_code = code;
        ev.reason = std::move(reason);
        return ev;
    }

    static Event make_error(transport::Error e) {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }
};

} // namespace lightsync::core::transport::websocket

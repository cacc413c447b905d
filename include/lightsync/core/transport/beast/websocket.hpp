#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "lightsync/core/channel/wakeup.hpp"
#include "lightsync/core/transport/concepts.hpp"
#include "lightsync/core/transport/error.hpp"
#include "lightsync/core/transport/parse_url.hpp"
#include "lightsync/core/transport/websocket/events.hpp"
#include "lightsync/core/transport/websocket/inbox.hpp"
#include "lightsync/core/transport/websocket/options.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast implementation)
================================================================================

Single-connection transport primitive over Boost.Beast, plain (ws://) or TLS
(wss://, OpenSSL with SNI and peer verification against the system store).

  • No retries, no reconnection logic. Recovery lives in Connection.
  • connect() runs the resolve / TCP / TLS / upgrade chain on the calling
    thread, bounded by Options::connect_timeout, then hands the stream to a
    receive thread that owns its io_context.
  • Complete text frames and control events are queued in an Inbox and the
    connection loop's Wakeup is notified.
  • A CLOSE frame from the peer yields Close(code, reason). A read failure
    yields Error followed by Close(1006). Close is delivered exactly once.
  • close() is idempotent, performs the closing handshake and joins the
    receive thread. It does not queue a Close event.

Boost headers stay out of this header; the stream lives behind a pimpl.
================================================================================
*/

namespace lightsync::core::transport::beast {

class WebSocket {
public:
    explicit WebSocket(channel::Wakeup& wakeup);
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const ParsedUrl& url, const websocket::Options& options) noexcept;

    void close(std::uint16_t code, std::string_view reason) noexcept;

    // Queues a text frame for the writer. Returns false when the transport is
    // not open.
    [[nodiscard]]
    bool send(std::string_view text) noexcept;

    [[nodiscard]]
    inline bool poll_message(std::string& out) noexcept {
        return inbox_.pop_message(out);
    }

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        return inbox_.pop_event(out);
    }

    class Session;

private:
    websocket::Inbox inbox_;
    std::unique_ptr<Session> session_;
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace lightsync::core::transport::beast

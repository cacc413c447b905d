#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "lightsync/core/error.hpp"
#include "lightsync/core/protocol/schema/trade.hpp"
#include "lightsync/core/protocol/schema/ticker.hpp"
#include "lightsync/core/protocol/schema/market.hpp"
#include "lightsync/core/protocol/schema/auth.hpp"


namespace lightsync {

/*
===============================================================================
 lightsync::WsEvent
===============================================================================

High-level event delivered to the application through the EventChannel.

State-bearing events (BookUpdate, UserUpdate, PriceUpdate) are notifications
only: the data lives in the stores and is read back through the client
accessors. Stateless channels (Trade, Ticker, Market, Auth) carry their
payload inline.

Field usage per type:

  Connected            -
  Disconnected         reason, close_code (0 when locally initiated)
  Reconnecting         attempt
  MaxReconnectReached  attempt (number of attempts made)
  BookUpdate           orderbook_id, is_snapshot
  Trade                orderbook_id, trade
  UserUpdate           user, event_type
  PriceUpdate          orderbook_id, resolution
  Ticker               orderbook_id, ticker
  Market               market
  Auth                 auth
  NonceUpdate          user, nonce
  ResyncRequired       orderbook_id
  Pong                 -
  Error                error
===============================================================================
*/

enum class EventType : std::uint8_t {
    Connected,
    Disconnected,
    Reconnecting,
    MaxReconnectReached,
    BookUpdate,
    Trade,
    UserUpdate,
    PriceUpdate,
    Ticker,
    Market,
    Auth,
    NonceUpdate,
    ResyncRequired,
    Pong,
    Error
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
    case EventType::Connected:           return "Connected";
    case EventType::Disconnected:        return "Disconnected";
    case EventType::Reconnecting:        return "Reconnecting";
    case EventType::MaxReconnectReached: return "MaxReconnectReached";
    case EventType::BookUpdate:          return "BookUpdate";
    case EventType::Trade:               return "Trade";
    case EventType::UserUpdate:          return "UserUpdate";
    case EventType::PriceUpdate:         return "PriceUpdate";
    case EventType::Ticker:              return "Ticker";
    case EventType::Market:              return "Market";
    case EventType::Auth:                return "Auth";
    case EventType::NonceUpdate:         return "NonceUpdate";
    case EventType::ResyncRequired:      return "ResyncRequired";
    case EventType::Pong:                return "Pong";
    case EventType::Error:               return "Error";
    }
    return "Unknown";
}

struct WsEvent {
    EventType type{EventType::Connected};

    std::string reason;
    std::uint16_t close_code{0};
    std::uint32_t attempt{0};

    std::string orderbook_id;
    bool is_snapshot{false};

    std::string user;
    std::string event_type;
    std::string resolution;
    std::uint64_t nonce{0};

    std::optional<core::protocol::schema::Trade> trade;
    std::optional<core::protocol::schema::Ticker> ticker;
    std::optional<core::protocol::schema::MarketEvent> market;
    std::optional<core::protocol::schema::Auth> auth;

    Error error;

    // --- Factories ----------------------------------------------------------

    static WsEvent connected() {
        return WsEvent{};
    }

    static WsEvent disconnected(std::string reason, std::uint16_t close_code = 0) {
        WsEvent ev;
        ev.type = EventType::Disconnected;
        ev.reason = std::move(reason);
        ev.close_code = close_code;
        return ev;
    }

    static WsEvent reconnecting(std::uint32_t attempt) {
        WsEvent ev;
        ev.type = EventType::Reconnecting;
        ev.attempt = attempt;
        return ev;
    }

    static WsEvent max_reconnect_reached(std::uint32_t attempts) {
        WsEvent ev;
        ev.type = EventType::MaxReconnectReached;
        ev.attempt = attempts;
        return ev;
    }

    static WsEvent book_update(std::string orderbook_id, bool is_snapshot) {
        WsEvent ev;
        ev.type = EventType::BookUpdate;
        ev.orderbook_id = std::move(orderbook_id);
        ev.is_snapshot = is_snapshot;
        return ev;
    }

    static WsEvent trade_event(core::protocol::schema::Trade trade) {
        WsEvent ev;
        ev.type = EventType::Trade;
        ev.orderbook_id = trade.orderbook_id;
        ev.trade = std::move(trade);
        return ev;
    }

    static WsEvent user_update(std::string user, std::string event_type) {
        WsEvent ev;
        ev.type = EventType::UserUpdate;
        ev.user = std::move(user);
        ev.event_type = std::move(event_type);
        return ev;
    }

    static WsEvent price_update(std::string orderbook_id, std::string resolution) {
        WsEvent ev;
        ev.type = EventType::PriceUpdate;
        ev.orderbook_id = std::move(orderbook_id);
        ev.resolution = std::move(resolution);
        return ev;
    }

    static WsEvent ticker_event(core::protocol::schema::Ticker ticker) {
        WsEvent ev;
        ev.type = EventType::Ticker;
        ev.orderbook_id = ticker.orderbook_id;
        ev.ticker = std::move(ticker);
        return ev;
    }

    static WsEvent market_event(core::protocol::schema::MarketEvent market) {
        WsEvent ev;
        ev.type = EventType::Market;
        ev.market = std::move(market);
        return ev;
    }

    static WsEvent auth_event(core::protocol::schema::Auth auth) {
        WsEvent ev;
        ev.type = EventType::Auth;
        ev.auth = std::move(auth);
        return ev;
    }

    static WsEvent nonce_update(std::string user, std::uint64_t nonce) {
        WsEvent ev;
        ev.type = EventType::NonceUpdate;
        ev.user = std::move(user);
        ev.nonce = nonce;
        return ev;
    }

    static WsEvent resync_required(std::string orderbook_id) {
        WsEvent ev;
        ev.type = EventType::ResyncRequired;
        ev.orderbook_id = std::move(orderbook_id);
        return ev;
    }

    static WsEvent pong() {
        WsEvent ev;
        ev.type = EventType::Pong;
        return ev;
    }

    static WsEvent error_event(Error error) {
        WsEvent ev;
        ev.type = EventType::Error;
        ev.error = std::move(error);
        return ev;
    }
};

inline std::ostream& operator<<(std::ostream& os, const WsEvent& ev) {
    os << to_string(ev.type);
    switch (ev.type) {
    case EventType::Disconnected:
        os << " (" << ev.reason;
        if (ev.close_code != 0) {
            os << ", code " << ev.close_code;
        }
        os << ")";
        break;
    case EventType::Reconnecting:
    case EventType::MaxReconnectReached:
        os << " (attempt " << ev.attempt << ")";
        break;
    case EventType::BookUpdate:
        os << " " << ev.orderbook_id << (ev.is_snapshot ? " snapshot" : " delta");
        break;
    case EventType::Trade:
    case EventType::Ticker:
    case EventType::ResyncRequired:
        os << " " << ev.orderbook_id;
        break;
    case EventType::UserUpdate:
        os << " " << ev.user << " " << ev.event_type;
        break;
    case EventType::PriceUpdate:
        os << " " << ev.orderbook_id << ":" << ev.resolution;
        break;
    case EventType::NonceUpdate:
        os << " " << ev.user << " nonce " << ev.nonce;
        break;
    case EventType::Error:
        os << " " << ev.error;
        break;
    default:
        break;
    }
    return os;
}

} // namespace lightsync

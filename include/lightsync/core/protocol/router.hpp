#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "simdjson.h"

#include "lightsync/core/error.hpp"
#include "lightsync/core/event.hpp"
#include "lightsync/core/protocol/enums.hpp"
#include "lightsync/core/protocol/parser/result.hpp"
#include "lightsync/core/protocol/parser/helpers.hpp"
#include "lightsync/core/protocol/parser/auth.hpp"
#include "lightsync/core/protocol/parser/book.hpp"
#include "lightsync/core/protocol/parser/error.hpp"
#include "lightsync/core/protocol/parser/market.hpp"
#include "lightsync/core/protocol/parser/price_history.hpp"
#include "lightsync/core/protocol/parser/ticker.hpp"
#include "lightsync/core/protocol/parser/trade.hpp"
#include "lightsync/core/protocol/parser/user.hpp"
#include "lightsync/core/protocol/subscription.hpp"
#include "lightsync/core/state/store.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol {

/*
================================================================================
Message Router
================================================================================

Turns one inbound text frame into state mutations and application events.

  frame --simdjson--> envelope {type, data}
        --MessageType--> channel parser (schema::*)
        --Store::write--> OrderBookState / UserState / PriceHistoryState
        --> WsEvent(s)

-------------------------------------------------------------------------------
 Per channel
-------------------------------------------------------------------------------
  book_update    resync:true         -> ResyncRequired (state untouched)
                 applied             -> BookUpdate
                 sequence gap        -> book cleared, Error(SequenceGap),
                                        ResyncRequired
                 (a book is created on its first frame)
  user           applied to the single UserState -> UserUpdate
                 (+ NonceUpdate for nonce events); dropped without a user
  price_history  snapshot creates the history; update needs an existing one;
                 heartbeat refreshes server_time of every history, no event
  trades / ticker / market / auth   forwarded as events, no state
  error          Error(ServerError{code, message}), no state
  pong           Pong
  unknown tag    logged no-op

A malformed frame produces Error(ParseError) and never touches state. Each
frame is applied under a single Store::write(), so readers never see a
half-applied frame.

Whether a ResyncRequired leads to a new subscription is the caller's policy.
================================================================================
*/

class Router {
public:
    explicit Router(state::Store& store)
        : store_(store)
    {}

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Main entry point. Events produced by the frame are appended to `out`.
    [[nodiscard]]
    inline parser::Result route(std::string_view raw, std::vector<WsEvent>& out) noexcept {
        try {
            return route_(raw, out);
        } catch (const std::exception& e) {
            LS_ERROR("[ROUTER] Failed to route message: " << e.what());
            push_(out, WsEvent::error_event(Error::parse_error(e.what())));
            return parser::Result::InvalidValue;
        }
    }

private:
    state::Store& store_;

    // Underlying simdjson parser, reused across frames
    simdjson::dom::parser parser_;

    static inline void push_(std::vector<WsEvent>& out, WsEvent ev) {
        out.push_back(std::move(ev));
    }

    static inline parser::Result parse_failure_(std::vector<WsEvent>& out, MessageType type, parser::Result r) {
        LS_WARN("[ROUTER] Failed to parse '" << to_string(type) << "' message (" << parser::to_string(r) << ")");
        push_(out, WsEvent::error_event(Error::parse_error("invalid " + std::string(to_string(type)) + " message")));
        return r;
    }

    inline parser::Result route_(std::string_view raw, std::vector<WsEvent>& out) {
        simdjson::dom::element root;
        auto error = parser_.parse(raw.data(), raw.size()).get(root);
        if (error) {
            LS_WARN("[ROUTER] JSON parse error: " << error << " in message: " << raw);
            push_(out, WsEvent::error_event(Error::parse_error(simdjson::error_message(error))));
            return parser::Result::InvalidJson;
        }

        std::string tag;
        if (parser::helper::parse_string_required(root, "type", tag) != parser::Result::Parsed) {
            LS_WARN("[ROUTER] Message without 'type' tag: " << raw);
            push_(out, WsEvent::error_event(Error::parse_error("message without type")));
            return parser::Result::InvalidSchema;
        }

        const MessageType type = message_type_from_string(tag);
        if (type == MessageType::Pong) {
            push_(out, WsEvent::pong());
            return parser::Result::Parsed;
        }
        if (type == MessageType::Unknown) {
            LS_WARN("[ROUTER] Unknown message type: " << tag);
            return parser::Result::Ignored;
        }

        simdjson::dom::element data;
        if (!parser::helper::find(root, "data", data)) {
            return parse_failure_(out, type, parser::Result::InvalidSchema);
        }

        switch (type) {
        case MessageType::BookUpdate:   return on_book_update_(data, out);
        case MessageType::Trades:       return on_trade_(data, out);
        case MessageType::User:         return on_user_(data, out);
        case MessageType::PriceHistory: return on_price_history_(data, out);
        case MessageType::Market:       return on_market_(data, out);
        case MessageType::Ticker:       return on_ticker_(data, out);
        case MessageType::Auth:         return on_auth_(data, out);
        case MessageType::Error:        return on_error_(data, out);
        case MessageType::Pong:
        case MessageType::Unknown:
            break;
        }
        return parser::Result::Ignored;
    }

    // =========================================================================
    // State-bearing channels
    // =========================================================================

    inline parser::Result on_book_update_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::BookUpdate update;
        auto r = parser::book_update::parse(data, update);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::BookUpdate, r);
        }

        if (update.resync) {
            LS_INFO("[ROUTER] Resync required for orderbook: " << update.orderbook_id
                    << (update.message ? " (" + *update.message + ")" : std::string{}));
            push_(out, WsEvent::resync_required(update.orderbook_id));
            return r;
        }

        const state::ApplyResult result = store_.write([&](state::Store::Data& d) {
            auto& book = d.books.try_emplace(update.orderbook_id, update.orderbook_id).first->second;
            auto res = book.apply(update);
            if (res.is_gap()) {
                book.clear();
            }
            return res;
        });

        if (result.is_gap()) {
            LS_WARN("[ROUTER] Sequence gap in orderbook " << update.orderbook_id << ": expected "
                    << result.expected << ", received " << result.received << " (book cleared)");
            push_(out, WsEvent::error_event(Error::sequence_gap(update.orderbook_id, result.expected, result.received)));
            push_(out, WsEvent::resync_required(update.orderbook_id));
            return r;
        }
        push_(out, WsEvent::book_update(update.orderbook_id, update.is_snapshot));
        return r;
    }

    inline parser::Result on_user_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::UserEvent ev;
        auto r = parser::user::parse(data, ev);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::User, r);
        }

        // One user per connection: events always belong to the subscribed user
        std::string user;
        const bool applied = store_.write([&](state::Store::Data& d) {
            if (!d.user) {
                return false;
            }
            user = d.user->user();
            return d.user->apply(ev).ok();
        });
        if (user.empty()) {
            LS_WARN("[ROUTER] User event '" << schema::to_string(ev.type) << "' without a subscribed user -> dropped");
            return parser::Result::Ignored;
        }
        if (!applied) {
            return parser::Result::Ignored;
        }

        push_(out, WsEvent::user_update(user, std::string(schema::to_string(ev.type))));
        if (ev.type == schema::UserEventType::Nonce && ev.nonce) {
            push_(out, WsEvent::nonce_update(user, *ev.nonce));
        }
        return r;
    }

    inline parser::Result on_price_history_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::PriceHistoryEvent ev;
        auto r = parser::price_history::parse(data, ev);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::PriceHistory, r);
        }

        // Heartbeats carry no orderbook_id and refresh every history
        if (ev.type == schema::PriceHistoryEventType::Heartbeat) {
            store_.write([&](state::Store::Data& d) {
                for (auto& [key, history] : d.price_histories) {
                    history.apply_heartbeat(ev.server_time);
                }
            });
            return r;
        }

        const std::string& id = *ev.orderbook_id;
        const std::string key = price_history_key(id, ev.resolution);
        const bool applied = store_.write([&](state::Store::Data& d) {
            auto it = d.price_histories.find(key);
            if (it == d.price_histories.end()) {
                if (ev.type != schema::PriceHistoryEventType::Snapshot) {
                    return false;
                }
                it = d.price_histories.try_emplace(key, id, ev.resolution, ev.include_ohlcv.value_or(false)).first;
            }
            return it->second.apply(ev).ok();
        });
        if (!applied) {
            LS_WARN("[ROUTER] Price history " << schema::to_string(ev.type) << " for untracked key " << key << " -> dropped");
            return parser::Result::Ignored;
        }
        push_(out, WsEvent::price_update(id, ev.resolution));
        return r;
    }

    // =========================================================================
    // Stateless channels
    // =========================================================================

    inline parser::Result on_trade_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::Trade trade;
        auto r = parser::trades::parse(data, trade);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::Trades, r);
        }
        push_(out, WsEvent::trade_event(std::move(trade)));
        return r;
    }

    inline parser::Result on_market_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::MarketEvent market;
        auto r = parser::market::parse(data, market);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::Market, r);
        }
        push_(out, WsEvent::market_event(std::move(market)));
        return r;
    }

    inline parser::Result on_ticker_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::Ticker ticker;
        auto r = parser::ticker::parse(data, ticker);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::Ticker, r);
        }
        push_(out, WsEvent::ticker_event(std::move(ticker)));
        return r;
    }

    inline parser::Result on_auth_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::Auth auth;
        auto r = parser::auth::parse(data, auth);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::Auth, r);
        }
        if (!auth.authenticated()) {
            LS_WARN("[ROUTER] Authentication status: " << auth.status << (auth.message ? " (" + *auth.message + ")" : std::string{}));
        }
        push_(out, WsEvent::auth_event(std::move(auth)));
        return r;
    }

    inline parser::Result on_error_(const simdjson::dom::element& data, std::vector<WsEvent>& out) {
        schema::ErrorData err;
        auto r = parser::error::parse(data, err);
        if (r != parser::Result::Parsed) {
            return parse_failure_(out, MessageType::Error, r);
        }
        LS_ERROR("[ROUTER] Server error: " << err.error << " (code: " << err.code << ")");
        push_(out, WsEvent::error_event(Error::server_error(err.code, err.error, err.orderbook_id.value_or(std::string{}))));
        return r;
    }
};

} // namespace lightsync::core::protocol

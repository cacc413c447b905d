#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lightsync/core/protocol/enums.hpp"
#include "lcr/json.hpp"


namespace lightsync::core::protocol {

// ============================================================================
// Subscription channels
// ============================================================================
enum class Channel : std::uint8_t {
    Books,
    Trades,
    User,
    PriceHistory,
    Market,
    Ticker
};

// Wire tag used in "params.type"
[[nodiscard]]
inline constexpr std::string_view to_string(Channel c) noexcept {
    switch (c) {
    case Channel::Books:        return "book_update";
    case Channel::Trades:       return "trades";
    case Channel::User:         return "user";
    case Channel::PriceHistory: return "price_history";
    case Channel::Market:       return "market";
    case Channel::Ticker:       return "ticker";
    }
    return "unknown";
}

enum class Method : std::uint8_t {
    Subscribe,
    Unsubscribe
};

[[nodiscard]]
inline constexpr std::string_view to_string(Method m) noexcept {
    return m == Method::Subscribe ? "subscribe" : "unsubscribe";
}

// Market subscription wildcard
inline constexpr std::string_view ALL_MARKETS = "all";


/*
===============================================================================
 Subscription
===============================================================================

Tagged logical subscription. Only the fields of the active channel are used:

  Books / Trades / Ticker   orderbook_ids
  User                      user
  PriceHistory              orderbook_id, resolution, include_ohlcv
  Market                    market_pubkey

Instances are built through the named factories and serialized with
to_json(). Equality is field-wise on the active fields.
===============================================================================
*/
struct Subscription {
    Channel channel{Channel::Books};

    std::vector<std::string> orderbook_ids;
    std::string user;
    std::string orderbook_id;
    std::string resolution;
    bool include_ohlcv{false};
    std::string market_pubkey;

    static Subscription books(std::vector<std::string> ids) {
        Subscription s;
        s.channel = Channel::Books;
        s.orderbook_ids = std::move(ids);
        return s;
    }

    static Subscription trades(std::vector<std::string> ids) {
        Subscription s;
        s.channel = Channel::Trades;
        s.orderbook_ids = std::move(ids);
        return s;
    }

    static Subscription ticker(std::vector<std::string> ids) {
        Subscription s;
        s.channel = Channel::Ticker;
        s.orderbook_ids = std::move(ids);
        return s;
    }

    static Subscription user_channel(std::string wallet) {
        Subscription s;
        s.channel = Channel::User;
        s.user = std::move(wallet);
        return s;
    }

    static Subscription price_history(std::string orderbook_id, std::string resolution, bool include_ohlcv) {
        Subscription s;
        s.channel = Channel::PriceHistory;
        s.orderbook_id = std::move(orderbook_id);
        s.resolution = std::move(resolution);
        s.include_ohlcv = include_ohlcv;
        return s;
    }

    static Subscription market(std::string market_pubkey) {
        Subscription s;
        s.channel = Channel::Market;
        s.market_pubkey = std::move(market_pubkey);
        return s;
    }

    // True for channels whose ids may be batched into one frame
    [[nodiscard]]
    inline bool is_batched() const noexcept {
        return channel == Channel::Books || channel == Channel::Trades || channel == Channel::Ticker;
    }

    [[nodiscard]]
    inline bool operator==(const Subscription& other) const noexcept {
        if (channel != other.channel) {
            return false;
        }
        switch (channel) {
        case Channel::Books:
        case Channel::Trades:
        case Channel::Ticker:
            return orderbook_ids == other.orderbook_ids;
        case Channel::User:
            return user == other.user;
        case Channel::PriceHistory:
            return orderbook_id == other.orderbook_id
                && resolution == other.resolution
                && include_ohlcv == other.include_ohlcv;
        case Channel::Market:
            return market_pubkey == other.market_pubkey;
        }
        return false;
    }
};

// Key of a price-history stream: "orderbook_id:resolution"
[[nodiscard]]
inline std::string price_history_key(std::string_view orderbook_id, std::string_view resolution) {
    std::string key;
    key.reserve(orderbook_id.size() + 1 + resolution.size());
    key.append(orderbook_id);
    key.push_back(':');
    key.append(resolution);
    return key;
}


// ============================================================================
// Outbound frames
// ============================================================================

//   {"type":"subscribe","params":{"type":"book_update","orderbook_ids":["ob1"]}}
[[nodiscard]]
inline std::string to_json(const Subscription& sub, Method method) {
    std::string out;
    out.reserve(96);
    out += "{\"type\":";
    lcr::json::append_string(out, to_string(method));
    out += ",\"params\":{\"type\":";
    lcr::json::append_string(out, to_string(sub.channel));
    switch (sub.channel) {
    case Channel::Books:
    case Channel::Trades:
    case Channel::Ticker: {
        out += ',';
        lcr::json::append_key(out, "orderbook_ids");
        out += '[';
        bool first = true;
        for (const auto& id : sub.orderbook_ids) {
            if (!first) {
                out += ',';
            }
            lcr::json::append_string(out, id);
            first = false;
        }
        out += ']';
        break;
    }
    case Channel::User:
        out += ',';
        lcr::json::append_key(out, "user");
        lcr::json::append_string(out, sub.user);
        break;
    case Channel::PriceHistory:
        out += ',';
        lcr::json::append_key(out, "orderbook_id");
        lcr::json::append_string(out, sub.orderbook_id);
        out += ',';
        lcr::json::append_key(out, "resolution");
        lcr::json::append_string(out, sub.resolution);
        out += ',';
        lcr::json::append_key(out, "include_ohlcv");
        lcr::json::append_bool(out, sub.include_ohlcv);
        break;
    case Channel::Market:
        out += ',';
        lcr::json::append_key(out, "market_pubkey");
        lcr::json::append_string(out, sub.market_pubkey);
        break;
    }
    out += "}}";
    return out;
}

[[nodiscard]]
inline std::string ping_json() {
    return "{\"type\":\"ping\"}";
}

} // namespace lightsync::core::protocol

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lightsync/core/decimal.hpp"
#include "lightsync/core/protocol/enums.hpp"


namespace lightsync::core::protocol::schema {

// OHLCV candle. Every price may be absent (no trade / no quote in window).
struct Candle {
    std::int64_t t{0};              // window open, unix milliseconds
    std::optional<Decimal> o;
    std::optional<Decimal> h;
    std::optional<Decimal> l;
    std::optional<Decimal> c;
    std::optional<Decimal> v;
    std::optional<Decimal> m;       // midpoint
    std::optional<Decimal> bb;      // best bid
    std::optional<Decimal> ba;      // best ask
};

enum class PriceHistoryEventType : std::uint8_t {
    Snapshot,
    Update,
    Heartbeat
};

[[nodiscard]]
inline constexpr bool price_history_event_type_from_string(std::string_view s, PriceHistoryEventType& out) noexcept {
    if (s == "snapshot")  { out = PriceHistoryEventType::Snapshot;  return true; }
    if (s == "update")    { out = PriceHistoryEventType::Update;    return true; }
    if (s == "heartbeat") { out = PriceHistoryEventType::Heartbeat; return true; }
    return false;
}

[[nodiscard]]
inline constexpr std::string_view to_string(PriceHistoryEventType t) noexcept {
    switch (t) {
    case PriceHistoryEventType::Snapshot:  return "snapshot";
    case PriceHistoryEventType::Update:    return "update";
    case PriceHistoryEventType::Heartbeat: return "heartbeat";
    }
    return "unknown";
}

// ===============================================
// price_history payload
// ===============================================
//
//   Snapshot   prices[] oldest-first, last_timestamp?, server_time?, include_ohlcv?
//   Update     one candle (inline t,o,h,l,c,v,m,bb,ba fields)
//   Heartbeat  server_time only, no orderbook_id
//
struct PriceHistoryEvent {
    PriceHistoryEventType type{PriceHistoryEventType::Snapshot};
    std::optional<std::string> orderbook_id;
    std::string resolution{DEFAULT_RESOLUTION};
    std::optional<bool> include_ohlcv;
    std::vector<Candle> prices;
    std::optional<std::int64_t> last_timestamp;
    std::optional<std::int64_t> server_time;
    std::optional<Candle> candle;
};

} // namespace lightsync::core::protocol::schema

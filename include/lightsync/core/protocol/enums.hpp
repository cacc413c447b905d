#pragma once

#include <cstdint>
#include <string_view>


namespace lightsync::core::protocol {

// ============================================================================
// Inbound channel tag ("type" field of every server frame)
// ============================================================================
enum class MessageType : std::uint8_t {
    BookUpdate,
    Trades,
    User,
    PriceHistory,
    Market,
    Ticker,
    Auth,
    Error,
    Pong,
    Unknown
};

[[nodiscard]]
inline constexpr MessageType message_type_from_string(std::string_view s) noexcept {
    if (s == "book_update")   return MessageType::BookUpdate;
    if (s == "trades")        return MessageType::Trades;
    if (s == "user")          return MessageType::User;
    if (s == "price_history") return MessageType::PriceHistory;
    if (s == "market")        return MessageType::Market;
    if (s == "ticker")        return MessageType::Ticker;
    if (s == "auth")          return MessageType::Auth;
    if (s == "error")         return MessageType::Error;
    if (s == "pong")          return MessageType::Pong;
    return MessageType::Unknown;
}

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType t) noexcept {
    switch (t) {
    case MessageType::BookUpdate:   return "book_update";
    case MessageType::Trades:       return "trades";
    case MessageType::User:         return "user";
    case MessageType::PriceHistory: return "price_history";
    case MessageType::Market:       return "market";
    case MessageType::Ticker:       return "ticker";
    case MessageType::Auth:         return "auth";
    case MessageType::Error:        return "error";
    case MessageType::Pong:         return "pong";
    case MessageType::Unknown:      return "unknown";
    }
    return "unknown";
}


// ============================================================================
// Order side (user channel encodes it as an integer)
// ============================================================================
enum class Side : std::uint8_t {
    Buy  = 0,
    Sell = 1
};

[[nodiscard]]
inline constexpr bool side_from_int(std::int64_t v, Side& out) noexcept {
    switch (v) {
    case 0: out = Side::Buy;  return true;
    case 1: out = Side::Sell; return true;
    default: return false;
    }
}

[[nodiscard]]
inline constexpr std::string_view to_string(Side s) noexcept {
    return s == Side::Buy ? "Buy" : "Sell";
}


// ============================================================================
// Order status as tracked locally
// ============================================================================
enum class OrderStatus : std::uint8_t {
    Open,
    Filled,
    Cancelled
};

[[nodiscard]]
inline constexpr bool order_status_from_string(std::string_view s, OrderStatus& out) noexcept {
    if (s == "open" || s == "Open")           { out = OrderStatus::Open;      return true; }
    if (s == "filled" || s == "Filled")       { out = OrderStatus::Filled;    return true; }
    if (s == "cancelled" || s == "Cancelled") { out = OrderStatus::Cancelled; return true; }
    return false;
}

[[nodiscard]]
inline constexpr std::string_view to_string(OrderStatus s) noexcept {
    switch (s) {
    case OrderStatus::Open:      return "Open";
    case OrderStatus::Filled:    return "Filled";
    case OrderStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}


// ============================================================================
// Candle resolution
// ============================================================================
enum class Resolution : std::uint8_t {
    OneMinute,
    FiveMinutes,
    FifteenMinutes,
    OneHour,
    FourHours,
    OneDay
};

inline constexpr std::string_view DEFAULT_RESOLUTION = "1m";

[[nodiscard]]
inline constexpr bool resolution_from_string(std::string_view s, Resolution& out) noexcept {
    if (s == "1m")  { out = Resolution::OneMinute;      return true; }
    if (s == "5m")  { out = Resolution::FiveMinutes;    return true; }
    if (s == "15m") { out = Resolution::FifteenMinutes; return true; }
    if (s == "1h")  { out = Resolution::OneHour;        return true; }
    if (s == "4h")  { out = Resolution::FourHours;      return true; }
    if (s == "1d")  { out = Resolution::OneDay;         return true; }
    return false;
}

[[nodiscard]]
inline constexpr std::string_view to_string(Resolution r) noexcept {
    switch (r) {
    case Resolution::OneMinute:      return "1m";
    case Resolution::FiveMinutes:    return "5m";
    case Resolution::FifteenMinutes: return "15m";
    case Resolution::OneHour:        return "1h";
    case Resolution::FourHours:      return "4h";
    case Resolution::OneDay:         return "1d";
    }
    return "1m";
}

// Candle width in milliseconds
[[nodiscard]]
inline constexpr std::int64_t duration_ms(Resolution r) noexcept {
    switch (r) {
    case Resolution::OneMinute:      return 60LL * 1000;
    case Resolution::FiveMinutes:    return 5LL * 60 * 1000;
    case Resolution::FifteenMinutes: return 15LL * 60 * 1000;
    case Resolution::OneHour:        return 60LL * 60 * 1000;
    case Resolution::FourHours:      return 4LL * 60 * 60 * 1000;
    case Resolution::OneDay:         return 24LL * 60 * 60 * 1000;
    }
    return 60LL * 1000;
}


// ============================================================================
// Market lifecycle events
// ============================================================================
enum class MarketEventType : std::uint8_t {
    OrderbookCreated,
    Settled,
    Opened,
    Paused,
    Unknown
};

[[nodiscard]]
inline constexpr MarketEventType market_event_type_from_string(std::string_view s) noexcept {
    if (s == "orderbook_created") return MarketEventType::OrderbookCreated;
    if (s == "settled")           return MarketEventType::Settled;
    if (s == "opened")            return MarketEventType::Opened;
    if (s == "paused")            return MarketEventType::Paused;
    return MarketEventType::Unknown;
}

[[nodiscard]]
inline constexpr std::string_view to_string(MarketEventType t) noexcept {
    switch (t) {
    case MarketEventType::OrderbookCreated: return "orderbook_created";
    case MarketEventType::Settled:          return "settled";
    case MarketEventType::Opened:           return "opened";
    case MarketEventType::Paused:           return "paused";
    case MarketEventType::Unknown:          return "unknown";
    }
    return "unknown";
}

} // namespace lightsync::core::protocol

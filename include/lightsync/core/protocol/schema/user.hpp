#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lightsync/core/decimal.hpp"
#include "lightsync/core/protocol/enums.hpp"


namespace lightsync::core::protocol::schema {

struct OutcomeBalance {
    std::int32_t outcome_index{0};
    std::string mint;
    Decimal idle;
    Decimal on_book;
};

// Balances of one market / deposit mint pair.
// Keyed in UserState by "market_pubkey:deposit_mint".
struct BalanceEntry {
    std::string market_pubkey;
    std::string deposit_mint;
    std::vector<OutcomeBalance> outcomes;

    [[nodiscard]]
    inline std::string key() const {
        return market_pubkey + ":" + deposit_mint;
    }
};

struct Order {
    std::string order_hash;
    std::string market_pubkey;
    std::string orderbook_id;
    Side side{Side::Buy};
    Decimal maker_amount;
    Decimal taker_amount;
    Decimal remaining;
    Decimal filled;
    Decimal price;
    OrderStatus status{OrderStatus::Open};
    std::int64_t created_at{0};
    std::int64_t expiration{0};
};

// Placement or update of a single order
struct OrderUpdate {
    std::string order_hash;
    Decimal price;
    Decimal fill_amount;
    Decimal remaining;
    Decimal filled;
    Side side{Side::Buy};
    bool is_maker{false};
    std::int64_t created_at{0};
    std::optional<OrderStatus> status;
    std::optional<std::vector<OutcomeBalance>> balance;
};

enum class UserEventType : std::uint8_t {
    Snapshot,
    Order,
    BalanceUpdate,
    Nonce
};

[[nodiscard]]
inline constexpr bool user_event_type_from_string(std::string_view s, UserEventType& out) noexcept {
    if (s == "snapshot")       { out = UserEventType::Snapshot;      return true; }
    if (s == "order" || s == "order_update") { out = UserEventType::Order; return true; }
    if (s == "balance_update") { out = UserEventType::BalanceUpdate; return true; }
    if (s == "nonce" || s == "nonce_update") { out = UserEventType::Nonce; return true; }
    return false;
}

[[nodiscard]]
inline constexpr std::string_view to_string(UserEventType t) noexcept {
    switch (t) {
    case UserEventType::Snapshot:      return "snapshot";
    case UserEventType::Order:         return "order";
    case UserEventType::BalanceUpdate: return "balance_update";
    case UserEventType::Nonce:         return "nonce";
    }
    return "unknown";
}

// ===============================================
// user payload
// ===============================================
//
// Closed variant over UserEventType. Only the fields of the active
// alternative are populated:
//
//   Snapshot       orders, balances, nonce?
//   Order          order, market_pubkey, orderbook_id, deposit_mint
//   BalanceUpdate  market_pubkey, deposit_mint, balance
//   Nonce          nonce
//
struct UserEvent {
    UserEventType type{UserEventType::Snapshot};
    std::string user;               // "user" or "user_pubkey" when present
    std::string timestamp;

    std::vector<Order> orders;
    std::vector<BalanceEntry> balances;
    std::optional<OrderUpdate> order;
    std::optional<std::vector<OutcomeBalance>> balance;

    std::string market_pubkey;
    std::string orderbook_id;
    std::string deposit_mint;

    std::optional<std::uint64_t> nonce;
};

} // namespace lightsync::core::protocol::schema

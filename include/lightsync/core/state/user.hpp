#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lightsync/core/decimal.hpp"
#include "lightsync/core/protocol/schema/user.hpp"
#include "lightsync/core/state/apply_result.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::state {

/*
===============================================================================
 UserState
===============================================================================

Open orders, balances and nonce of the authenticated user.

apply() dispatches over the closed set of user events:

  Snapshot       replaces every order and balance, sets nonce when present
  Order          remaining == 0 (exact decimal) removes the order by hash;
                 otherwise updates it in place or, for an unknown hash,
                 creates it from the event fields
  BalanceUpdate  replaces the "market_pubkey:deposit_mint" entry
  Nonce          sets nonce (server authoritative, no rollback check)

Not thread-safe. Owned by the Store and mutated by the connection loop only.
===============================================================================
*/
class UserState {
public:
    using Order = protocol::schema::Order;
    using BalanceEntry = protocol::schema::BalanceEntry;
    using OutcomeBalance = protocol::schema::OutcomeBalance;

    UserState() = default;

    explicit UserState(std::string user)
        : user_(std::move(user))
    {}

    [[nodiscard]]
    inline ApplyResult apply(const protocol::schema::UserEvent& ev) {
        using protocol::schema::UserEventType;
        switch (ev.type) {
        case UserEventType::Snapshot:
            apply_snapshot_(ev);
            break;
        case UserEventType::Order:
            if (!ev.order) {
                LS_WARN("[USER] " << user_ << " order event without order payload");
                return ApplyResult::ignored();
            }
            apply_order_(ev);
            break;
        case UserEventType::BalanceUpdate:
            if (!ev.balance || ev.market_pubkey.empty() || ev.deposit_mint.empty()) {
                LS_WARN("[USER] " << user_ << " incomplete balance update");
                return ApplyResult::ignored();
            }
            set_balance_(ev.market_pubkey, ev.deposit_mint, *ev.balance);
            break;
        case UserEventType::Nonce:
            if (!ev.nonce) {
                return ApplyResult::ignored();
            }
            nonce_ = *ev.nonce;
            break;
        }
        if (!ev.timestamp.empty()) {
            last_timestamp_ = ev.timestamp;
        }
        return ApplyResult::applied();
    }

    inline void clear() noexcept {
        orders_.clear();
        balances_.clear();
        nonce_ = 0;
        has_snapshot_ = false;
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline const std::string& user() const noexcept { return user_; }

    [[nodiscard]]
    inline bool has_snapshot() const noexcept { return has_snapshot_; }

    [[nodiscard]]
    inline std::uint64_t nonce() const noexcept { return nonce_; }

    [[nodiscard]]
    inline const std::string& last_timestamp() const noexcept { return last_timestamp_; }

    [[nodiscard]]
    inline std::size_t order_count() const noexcept { return orders_.size(); }

    [[nodiscard]]
    inline std::optional<Order> order(std::string_view order_hash) const {
        auto it = orders_.find(std::string(order_hash));
        if (it == orders_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]]
    inline std::vector<Order> open_orders() const {
        std::vector<Order> out;
        out.reserve(orders_.size());
        for (const auto& [hash, o] : orders_) {
            out.push_back(o);
        }
        return out;
    }

    [[nodiscard]]
    inline std::vector<Order> orders_for_market(std::string_view market_pubkey) const {
        std::vector<Order> out;
        for (const auto& [hash, o] : orders_) {
            if (o.market_pubkey == market_pubkey) out.push_back(o);
        }
        return out;
    }

    [[nodiscard]]
    inline std::vector<Order> orders_for_orderbook(std::string_view orderbook_id) const {
        std::vector<Order> out;
        for (const auto& [hash, o] : orders_) {
            if (o.orderbook_id == orderbook_id) out.push_back(o);
        }
        return out;
    }

    [[nodiscard]]
    inline std::optional<BalanceEntry> balance(std::string_view market_pubkey, std::string_view deposit_mint) const {
        auto it = balances_.find(balance_key_(market_pubkey, deposit_mint));
        if (it == balances_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]]
    inline std::optional<Decimal> idle_balance_for_outcome(std::string_view market_pubkey,
                                                           std::string_view deposit_mint,
                                                           std::int32_t outcome_index) const {
        const OutcomeBalance* ob = outcome_(market_pubkey, deposit_mint, outcome_index);
        if (!ob) return std::nullopt;
        return ob->idle;
    }

    [[nodiscard]]
    inline std::optional<Decimal> on_book_balance_for_outcome(std::string_view market_pubkey,
                                                              std::string_view deposit_mint,
                                                              std::int32_t outcome_index) const {
        const OutcomeBalance* ob = outcome_(market_pubkey, deposit_mint, outcome_index);
        if (!ob) return std::nullopt;
        return ob->on_book;
    }

    [[nodiscard]]
    inline std::size_t balance_count() const noexcept { return balances_.size(); }

private:
    std::string user_;
    std::unordered_map<std::string, Order> orders_;           // order_hash -> order
    std::unordered_map<std::string, BalanceEntry> balances_;  // "market:mint" -> entry
    std::uint64_t nonce_{0};
    bool has_snapshot_{false};
    std::string last_timestamp_;

    [[nodiscard]]
    static inline std::string balance_key_(std::string_view market_pubkey, std::string_view deposit_mint) {
        std::string key;
        key.reserve(market_pubkey.size() + 1 + deposit_mint.size());
        key.append(market_pubkey);
        key.push_back(':');
        key.append(deposit_mint);
        return key;
    }

    inline void apply_snapshot_(const protocol::schema::UserEvent& ev) {
        orders_.clear();
        balances_.clear();
        for (const auto& o : ev.orders) {
            orders_[o.order_hash] = o;
        }
        for (const auto& b : ev.balances) {
            balances_[b.key()] = b;
        }
        if (ev.nonce) {
            nonce_ = *ev.nonce;
        }
        has_snapshot_ = true;
        LS_DEBUG("[USER] " << user_ << " snapshot (" << orders_.size() << " orders, "
                 << balances_.size() << " balances)");
    }

    inline void apply_order_(const protocol::schema::UserEvent& ev) {
        const auto& upd = *ev.order;
        if (decimal::is_zero(upd.remaining)) {
            if (orders_.erase(upd.order_hash) != 0) {
                LS_DEBUG("[USER] " << user_ << " order " << upd.order_hash << " closed");
            }
        } else {
            auto it = orders_.find(upd.order_hash);
            if (it != orders_.end()) {
                it->second.remaining = upd.remaining;
                it->second.filled = upd.filled;
                if (upd.status) {
                    it->second.status = *upd.status;
                }
            } else {
                // First sighting of a placement looks like an update with no prior record
                Order o;
                o.order_hash = upd.order_hash;
                o.market_pubkey = ev.market_pubkey;
                o.orderbook_id = ev.orderbook_id;
                o.side = upd.side;
                o.price = upd.price;
                o.remaining = upd.remaining;
                o.filled = upd.filled;
                o.maker_amount = upd.remaining + upd.filled;
                o.taker_amount = 0;
                o.created_at = upd.created_at;
                o.status = upd.status.value_or(protocol::OrderStatus::Open);
                std::string hash = o.order_hash;
                orders_.emplace(std::move(hash), std::move(o));
            }
        }
        if (upd.balance && !ev.market_pubkey.empty() && !ev.deposit_mint.empty()) {
            set_balance_(ev.market_pubkey, ev.deposit_mint, *upd.balance);
        }
    }

    inline void set_balance_(const std::string& market_pubkey, const std::string& deposit_mint,
                             const std::vector<OutcomeBalance>& outcomes) {
        BalanceEntry entry;
        entry.market_pubkey = market_pubkey;
        entry.deposit_mint = deposit_mint;
        entry.outcomes = outcomes;
        balances_[entry.key()] = std::move(entry);
    }

    [[nodiscard]]
    inline const OutcomeBalance* outcome_(std::string_view market_pubkey,
                                          std::string_view deposit_mint,
                                          std::int32_t outcome_index) const {
        auto it = balances_.find(balance_key_(market_pubkey, deposit_mint));
        if (it == balances_.end()) return nullptr;
        for (const auto& ob : it->second.outcomes) {
            if (ob.outcome_index == outcome_index) return &ob;
        }
        return nullptr;
    }
};

} // namespace lightsync::core::state

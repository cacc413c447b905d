// ============================================================================
// Subscription Registry
// ============================================================================
//
// Stores the logical subscriptions the application currently wants, so they
// can be replayed after a transport reconnect.
//
// ---------------------------------------------------------------------------
// Design goals
// ---------------------------------------------------------------------------
// • Intent only
//     - Stores what was asked for, never callbacks or data
//
// • Id-level precision
//     - Books / Trades / Ticker subscriptions carry several ids; add and
//       remove operate per id, so unsubscribing one id keeps the others
//
// • Batched replay
//     - subscriptions() folds every id of a batched channel into one
//       Subscription (one wire frame per channel)
//
// • One user per connection
//     - At most one wallet is registered. Adding another one replaces it;
//       the caller is responsible for unsubscribing the previous wallet.
//
// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
// • add(sub)          on subscribe
// • remove(sub)       on unsubscribe
// • subscriptions()   enumerated wholesale on reconnect
// • clear()           on manual disconnect
//
// ---------------------------------------------------------------------------
// Threading & usage
// ---------------------------------------------------------------------------
// • Owned and used exclusively by the connection loop
// • Not thread-safe
//
// ============================================================================
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "lightsync/core/protocol/subscription.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::protocol {

class SubscriptionRegistry {
public:
    SubscriptionRegistry() = default;

    // Insert a subscription (idempotent per id)
    inline void add(const Subscription& sub) {
        switch (sub.channel) {
        case Channel::Books:
            books_.insert(sub.orderbook_ids.begin(), sub.orderbook_ids.end());
            break;
        case Channel::Trades:
            trades_.insert(sub.orderbook_ids.begin(), sub.orderbook_ids.end());
            break;
        case Channel::Ticker:
            tickers_.insert(sub.orderbook_ids.begin(), sub.orderbook_ids.end());
            break;
        case Channel::User:
            if (user_ && *user_ != sub.user) {
                LS_DEBUG("[REGISTRY] Replacing user subscription '" << *user_ << "' with '" << sub.user << "'");
            }
            user_ = sub.user;
            break;
        case Channel::PriceHistory:
            price_history_[price_history_key(sub.orderbook_id, sub.resolution)] = sub;
            break;
        case Channel::Market:
            markets_.insert(sub.market_pubkey);
            break;
        }
        LS_TRACE("[REGISTRY] Added " << to_string(sub.channel) << " subscription (total " << count() << ")");
    }

    // Remove a subscription. Unknown ids are ignored.
    inline void remove(const Subscription& sub) {
        switch (sub.channel) {
        case Channel::Books:
            for (const auto& id : sub.orderbook_ids) books_.erase(id);
            break;
        case Channel::Trades:
            for (const auto& id : sub.orderbook_ids) trades_.erase(id);
            break;
        case Channel::Ticker:
            for (const auto& id : sub.orderbook_ids) tickers_.erase(id);
            break;
        case Channel::User:
            if (user_ && *user_ == sub.user) {
                user_.reset();
            }
            break;
        case Channel::PriceHistory:
            price_history_.erase(price_history_key(sub.orderbook_id, sub.resolution));
            break;
        case Channel::Market:
            markets_.erase(sub.market_pubkey);
            break;
        }
        LS_TRACE("[REGISTRY] Removed " << to_string(sub.channel) << " subscription (total " << count() << ")");
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline bool is_subscribed_books(std::string_view orderbook_id) const {
        return books_.count(std::string(orderbook_id)) != 0;
    }

    [[nodiscard]]
    inline bool is_subscribed_trades(std::string_view orderbook_id) const {
        return trades_.count(std::string(orderbook_id)) != 0;
    }

    [[nodiscard]]
    inline bool is_subscribed_ticker(std::string_view orderbook_id) const {
        return tickers_.count(std::string(orderbook_id)) != 0;
    }

    [[nodiscard]]
    inline bool is_subscribed_user(std::string_view wallet) const noexcept {
        return user_ && *user_ == wallet;
    }

    [[nodiscard]]
    inline bool is_subscribed_price_history(std::string_view orderbook_id, std::string_view resolution) const {
        return price_history_.count(price_history_key(orderbook_id, resolution)) != 0;
    }

    // "all" subscribes to every market
    [[nodiscard]]
    inline bool is_subscribed_market(std::string_view market_pubkey) const {
        return markets_.count(std::string(market_pubkey)) != 0
            || markets_.count(std::string(ALL_MARKETS)) != 0;
    }

    [[nodiscard]]
    inline const std::optional<std::string>& user() const noexcept {
        return user_;
    }

    [[nodiscard]]
    inline std::vector<std::string> book_ids() const {
        return std::vector<std::string>(books_.begin(), books_.end());
    }

    [[nodiscard]]
    inline std::vector<std::string> trade_ids() const {
        return std::vector<std::string>(trades_.begin(), trades_.end());
    }

    [[nodiscard]]
    inline std::vector<std::string> ticker_ids() const {
        return std::vector<std::string>(tickers_.begin(), tickers_.end());
    }

    [[nodiscard]]
    inline std::vector<std::string> markets() const {
        return std::vector<std::string>(markets_.begin(), markets_.end());
    }

    // Number of individual subscriptions (each batched id counts once)
    [[nodiscard]]
    inline std::size_t count() const noexcept {
        return books_.size()
             + trades_.size()
             + tickers_.size()
             + (user_ ? 1u : 0u)
             + price_history_.size()
             + markets_.size();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return count() == 0;
    }

    // Replay set. Books, Trades and Ticker ids are folded into one
    // Subscription each; ids are ordered.
    [[nodiscard]]
    inline std::vector<Subscription> subscriptions() const {
        std::vector<Subscription> out;
        if (!books_.empty()) {
            out.push_back(Subscription::books(book_ids()));
        }
        if (!trades_.empty()) {
            out.push_back(Subscription::trades(trade_ids()));
        }
        if (!tickers_.empty()) {
            out.push_back(Subscription::ticker(ticker_ids()));
        }
        if (user_) {
            out.push_back(Subscription::user_channel(*user_));
        }
        for (const auto& [key, sub] : price_history_) {
            out.push_back(sub);
        }
        for (const auto& pubkey : markets_) {
            out.push_back(Subscription::market(pubkey));
        }
        return out;
    }

    inline void clear() noexcept {
        books_.clear();
        trades_.clear();
        tickers_.clear();
        user_.reset();
        price_history_.clear();
        markets_.clear();
        LS_TRACE("[REGISTRY] Cleared all subscriptions");
    }

private:
    std::set<std::string> books_;
    std::set<std::string> trades_;
    std::set<std::string> tickers_;
    std::optional<std::string> user_;
    std::map<std::string, Subscription> price_history_;   // "orderbook_id:resolution"
    std::set<std::string> markets_;
};

} // namespace lightsync::core::protocol

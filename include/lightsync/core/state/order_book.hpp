#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lightsync/core/decimal.hpp"
#include "lightsync/core/protocol/schema/book.hpp"
#include "lightsync/core/state/apply_result.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::state {

/*
===============================================================================
 OrderBookState
===============================================================================

Local mirror of one orderbook, reconciled from snapshot + delta frames.

-------------------------------------------------------------------------------
 Reconciliation
-------------------------------------------------------------------------------
- Snapshot: both sides are replaced, zero-size rows are skipped and
  expected_sequence becomes seq + 1 unconditionally.
- Delta: accepted only when seq == expected_sequence. A zero size removes the
  price, anything else upserts it. expected_sequence then becomes seq + 1.
- A delta with any other seq returns SequenceGap and leaves the book
  untouched. Deciding whether to clear() and resync belongs to the caller.

-------------------------------------------------------------------------------
 Invariants
-------------------------------------------------------------------------------
- A level with size zero is never stored
- expected_sequence grows by exactly one per accepted delta
- Every aggregate (best, spread, mid, depth) is derived on demand and never
  cached, so there is a single source of truth

Not thread-safe. Owned by the Store and mutated by the connection loop only.
===============================================================================
*/
class OrderBookState {
public:
    using Level = protocol::schema::Level;
    using BidMap = std::map<Decimal, Decimal, std::greater<Decimal>>;
    using AskMap = std::map<Decimal, Decimal, std::less<Decimal>>;

    OrderBookState() = default;

    explicit OrderBookState(std::string orderbook_id)
        : orderbook_id_(std::move(orderbook_id))
    {}

    [[nodiscard]]
    inline ApplyResult apply(const protocol::schema::BookUpdate& update) {
        if (update.is_snapshot) {
            bids_.clear();
            asks_.clear();
            for (const auto& lvl : update.bids) {
                if (!decimal::is_zero(lvl.size)) {
                    bids_[lvl.price] = lvl.size;
                }
            }
            for (const auto& lvl : update.asks) {
                if (!decimal::is_zero(lvl.size)) {
                    asks_[lvl.price] = lvl.size;
                }
            }
            expected_sequence_ = update.seq + 1;
            has_snapshot_ = true;
            last_timestamp_ = update.timestamp;
            LS_DEBUG("[BOOK] " << orderbook_id_ << " snapshot seq=" << update.seq
                     << " (" << bids_.size() << " bids, " << asks_.size() << " asks)");
            return ApplyResult::applied();
        }

        if (update.seq != expected_sequence_) {
            LS_WARN("[BOOK] " << orderbook_id_ << " sequence gap: expected " << expected_sequence_
                    << ", received " << update.seq);
            return ApplyResult::gap(expected_sequence_, update.seq);
        }

        apply_levels_(bids_, update.bids);
        apply_levels_(asks_, update.asks);
        expected_sequence_ = update.seq + 1;
        last_timestamp_ = update.timestamp;
        return ApplyResult::applied();
    }

    // Drops all levels; the next accepted message must be a snapshot
    inline void clear() noexcept {
        bids_.clear();
        asks_.clear();
        has_snapshot_ = false;
        expected_sequence_ = 0;
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline const std::string& orderbook_id() const noexcept { return orderbook_id_; }

    [[nodiscard]]
    inline bool has_snapshot() const noexcept { return has_snapshot_; }

    [[nodiscard]]
    inline std::uint64_t expected_sequence() const noexcept { return expected_sequence_; }

    [[nodiscard]]
    inline const std::string& last_timestamp() const noexcept { return last_timestamp_; }

    // Descending by price
    [[nodiscard]]
    inline std::vector<Level> bids() const { return top_(bids_, bids_.size()); }

    // Ascending by price
    [[nodiscard]]
    inline std::vector<Level> asks() const { return top_(asks_, asks_.size()); }

    [[nodiscard]]
    inline std::vector<Level> top_bids(std::size_t n) const { return top_(bids_, n); }

    [[nodiscard]]
    inline std::vector<Level> top_asks(std::size_t n) const { return top_(asks_, n); }

    [[nodiscard]]
    inline std::optional<Decimal> best_bid() const {
        if (bids_.empty()) return std::nullopt;
        return bids_.begin()->first;
    }

    [[nodiscard]]
    inline std::optional<Decimal> best_ask() const {
        if (asks_.empty()) return std::nullopt;
        return asks_.begin()->first;
    }

    // best_ask - best_bid. A crossed or locked book reports zero.
    [[nodiscard]]
    inline std::optional<Decimal> spread() const {
        if (bids_.empty() || asks_.empty()) {
            return std::nullopt;
        }
        const Decimal& bid = bids_.begin()->first;
        const Decimal& ask = asks_.begin()->first;
        if (ask <= bid) {
            return Decimal(0);
        }
        Decimal s = ask - bid;
        return s;
    }

    [[nodiscard]]
    inline std::optional<Decimal> midpoint() const {
        if (bids_.empty() || asks_.empty()) {
            return std::nullopt;
        }
        Decimal mid = (bids_.begin()->first + asks_.begin()->first) / 2;
        return mid;
    }

    [[nodiscard]]
    inline std::optional<Decimal> bid_size_at(const Decimal& price) const {
        auto it = bids_.find(price);
        if (it == bids_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]]
    inline std::optional<Decimal> ask_size_at(const Decimal& price) const {
        auto it = asks_.find(price);
        if (it == asks_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]]
    inline Decimal total_bid_depth() const { return depth_(bids_); }

    [[nodiscard]]
    inline Decimal total_ask_depth() const { return depth_(asks_); }

    [[nodiscard]]
    inline std::size_t bid_count() const noexcept { return bids_.size(); }

    [[nodiscard]]
    inline std::size_t ask_count() const noexcept { return asks_.size(); }

private:
    std::string orderbook_id_;
    BidMap bids_;
    AskMap asks_;
    std::uint64_t expected_sequence_{0};
    bool has_snapshot_{false};
    std::string last_timestamp_;

    template<class Map>
    static inline void apply_levels_(Map& side, const std::vector<Level>& levels) {
        for (const auto& lvl : levels) {
            if (decimal::is_zero(lvl.size)) {
                side.erase(lvl.price);
            } else {
                side[lvl.price] = lvl.size;
            }
        }
    }

    template<class Map>
    [[nodiscard]]
    static inline std::vector<Level> top_(const Map& side, std::size_t n) {
        std::vector<Level> out;
        out.reserve(std::min(n, side.size()));
        for (auto it = side.begin(); it != side.end() && out.size() < n; ++it) {
            out.push_back(Level{it->first, it->second});
        }
        return out;
    }

    template<class Map>
    [[nodiscard]]
    static inline Decimal depth_(const Map& side) {
        Decimal total = 0;
        for (const auto& [price, size] : side) {
            total += size;
        }
        return total;
    }
};

} // namespace lightsync::core::state

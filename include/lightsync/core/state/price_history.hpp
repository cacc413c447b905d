#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lightsync/core/config.hpp"
#include "lightsync/core/decimal.hpp"
#include "lightsync/core/protocol/enums.hpp"
#include "lightsync/core/protocol/schema/price_history.hpp"
#include "lightsync/core/state/apply_result.hpp"
#include "lcr/log/logger.hpp"


namespace lightsync::core::state {

/*
===============================================================================
 PriceHistoryState
===============================================================================

Candle history of one (orderbook_id, resolution) stream.

Candles are kept newest-first so latest() is the front element, with a
timestamp -> position index for O(1) lookup of an existing window.

  Snapshot   input is oldest-first; stored reversed, index rebuilt
  Update     same timestamp overwrites in place (idempotent); a new one is
             inserted at its sorted position and the oldest candles are
             evicted while more than MAX_CANDLES are held
  Heartbeat  updates server_time only

Not thread-safe. Owned by the Store and mutated by the connection loop only.
===============================================================================
*/
class PriceHistoryState {
public:
    using Candle = protocol::schema::Candle;

    PriceHistoryState() = default;

    PriceHistoryState(std::string orderbook_id, std::string resolution, bool include_ohlcv = false)
        : orderbook_id_(std::move(orderbook_id))
        , resolution_(std::move(resolution))
        , include_ohlcv_(include_ohlcv)
    {}

    [[nodiscard]]
    inline ApplyResult apply(const protocol::schema::PriceHistoryEvent& ev) {
        using protocol::schema::PriceHistoryEventType;
        switch (ev.type) {
        case PriceHistoryEventType::Snapshot:
            apply_snapshot_(ev);
            return ApplyResult::applied();
        case PriceHistoryEventType::Update:
            if (!ev.candle) {
                return ApplyResult::ignored();
            }
            upsert_(*ev.candle);
            return ApplyResult::applied();
        case PriceHistoryEventType::Heartbeat:
            apply_heartbeat(ev.server_time);
            return ApplyResult::applied();
        }
        return ApplyResult::ignored();
    }

    inline void apply_heartbeat(std::optional<std::int64_t> server_time) noexcept {
        if (server_time) {
            server_time_ = server_time;
        }
    }

    inline void clear() noexcept {
        candles_.clear();
        index_.clear();
        last_timestamp_.reset();
        server_time_.reset();
        has_snapshot_ = false;
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline const std::string& orderbook_id() const noexcept { return orderbook_id_; }

    [[nodiscard]]
    inline const std::string& resolution_string() const noexcept { return resolution_; }

    // Parsed resolution, nullopt for a tag the client does not know
    [[nodiscard]]
    inline std::optional<protocol::Resolution> resolution() const noexcept {
        protocol::Resolution r;
        if (!protocol::resolution_from_string(resolution_, r)) {
            return std::nullopt;
        }
        return r;
    }

    [[nodiscard]]
    inline bool include_ohlcv() const noexcept { return include_ohlcv_; }

    [[nodiscard]]
    inline bool has_snapshot() const noexcept { return has_snapshot_; }

    [[nodiscard]]
    inline std::optional<std::int64_t> last_timestamp() const noexcept { return last_timestamp_; }

    [[nodiscard]]
    inline std::optional<std::int64_t> server_time() const noexcept { return server_time_; }

    // Newest first
    [[nodiscard]]
    inline const std::vector<Candle>& candles() const noexcept { return candles_; }

    [[nodiscard]]
    inline std::vector<Candle> recent_candles(std::size_t n) const {
        const std::size_t end = n < candles_.size() ? n : candles_.size();
        return std::vector<Candle>(candles_.begin(), candles_.begin() + static_cast<std::ptrdiff_t>(end));
    }

    [[nodiscard]]
    inline std::optional<Candle> candle(std::int64_t t) const {
        auto it = index_.find(t);
        if (it == index_.end()) return std::nullopt;
        return candles_[it->second];
    }

    [[nodiscard]]
    inline std::optional<Candle> latest() const {
        if (candles_.empty()) return std::nullopt;
        return candles_.front();
    }

    [[nodiscard]]
    inline std::optional<Candle> oldest() const {
        if (candles_.empty()) return std::nullopt;
        return candles_.back();
    }

    [[nodiscard]]
    inline std::optional<Decimal> current_midpoint() const {
        if (candles_.empty()) return std::nullopt;
        return candles_.front().m;
    }

    [[nodiscard]]
    inline std::optional<Decimal> current_best_bid() const {
        if (candles_.empty()) return std::nullopt;
        return candles_.front().bb;
    }

    [[nodiscard]]
    inline std::optional<Decimal> current_best_ask() const {
        if (candles_.empty()) return std::nullopt;
        return candles_.front().ba;
    }

    [[nodiscard]]
    inline std::size_t candle_count() const noexcept { return candles_.size(); }

private:
    std::string orderbook_id_;
    std::string resolution_{protocol::DEFAULT_RESOLUTION};
    bool include_ohlcv_{false};
    std::vector<Candle> candles_;                          // newest first
    std::unordered_map<std::int64_t, std::size_t> index_;  // t -> position in candles_
    std::optional<std::int64_t> last_timestamp_;
    std::optional<std::int64_t> server_time_;
    bool has_snapshot_{false};

    inline void apply_snapshot_(const protocol::schema::PriceHistoryEvent& ev) {
        candles_.clear();
        index_.clear();
        candles_.reserve(ev.prices.size());
        for (auto it = ev.prices.rbegin(); it != ev.prices.rend(); ++it) {
            if (index_.count(it->t) != 0) {
                continue; // duplicate window in the snapshot, newest copy wins
            }
            index_[it->t] = candles_.size();
            candles_.push_back(*it);
        }
        evict_();
        last_timestamp_ = ev.last_timestamp;
        if (!last_timestamp_ && !candles_.empty()) {
            last_timestamp_ = candles_.front().t;
        }
        if (ev.server_time) {
            server_time_ = ev.server_time;
        }
        if (ev.include_ohlcv) {
            include_ohlcv_ = *ev.include_ohlcv;
        }
        has_snapshot_ = true;
        LS_DEBUG("[PRICE] " << orderbook_id_ << ":" << resolution_ << " snapshot (" << candles_.size() << " candles)");
    }

    inline void upsert_(const Candle& c) {
        auto found = index_.find(c.t);
        if (found != index_.end()) {
            candles_[found->second] = c;
        } else {
            // First position holding an older window
            std::size_t pos = 0;
            while (pos < candles_.size() && candles_[pos].t > c.t) {
                ++pos;
            }
            for (auto& [t, idx] : index_) {
                if (idx >= pos) {
                    ++idx;
                }
            }
            candles_.insert(candles_.begin() + static_cast<std::ptrdiff_t>(pos), c);
            index_[c.t] = pos;
            evict_();
        }
        if (!candles_.empty()) {
            last_timestamp_ = candles_.front().t;
        }
    }

    inline void evict_() {
        while (candles_.size() > MAX_CANDLES) {
            index_.erase(candles_.back().t);
            candles_.pop_back();
        }
    }
};

} // namespace lightsync::core::state

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lightsync/core/protocol/subscription.hpp"
#include "lightsync/core/state/order_book.hpp"
#include "lightsync/core/state/user.hpp"
#include "lightsync/core/state/price_history.hpp"


namespace lightsync::core::state {

/*
===============================================================================
 Store
===============================================================================

Single lockable resource of the client: every entity store behind one
reader-writer mutex.

- The connection loop is the only writer. Each inbound message is applied
  inside one write() call, so a reader never observes a half-applied message.
- Application threads read through read() or the copy accessors below. No
  reference into the guarded data ever escapes the lock.
- At most one UserState exists (one authenticated user per connection).
===============================================================================
*/
class Store {
public:
    struct Data {
        std::map<std::string, OrderBookState> books;               // orderbook_id
        std::optional<UserState> user;
        std::map<std::string, PriceHistoryState> price_histories;  // "orderbook_id:resolution"

        // Drops the content of every store. Entries are kept so the set of
        // tracked ids survives a reconnect; they refill from fresh snapshots.
        inline void clear_all() noexcept {
            for (auto& [id, book] : books) {
                book.clear();
            }
            if (user) {
                user->clear();
            }
            for (auto& [key, history] : price_histories) {
                history.clear();
            }
        }
    };

    Store() = default;
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    template<class F>
    inline decltype(auto) write(F&& f) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return std::forward<F>(f)(data_);
    }

    template<class F>
    inline decltype(auto) read(F&& f) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return std::forward<F>(f)(static_cast<const Data&>(data_));
    }

    // ---------------------------------------------------------------------
    // Point-in-time copies
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline std::optional<OrderBookState> orderbook(std::string_view orderbook_id) const {
        return read([&](const Data& d) -> std::optional<OrderBookState> {
            auto it = d.books.find(std::string(orderbook_id));
            if (it == d.books.end()) return std::nullopt;
            return it->second;
        });
    }

    [[nodiscard]]
    inline std::vector<std::string> orderbook_ids() const {
        return read([](const Data& d) {
            std::vector<std::string> ids;
            ids.reserve(d.books.size());
            for (const auto& [id, book] : d.books) {
                ids.push_back(id);
            }
            return ids;
        });
    }

    [[nodiscard]]
    inline std::optional<UserState> user_state() const {
        return read([](const Data& d) { return d.user; });
    }

    [[nodiscard]]
    inline std::optional<PriceHistoryState> price_history(std::string_view orderbook_id, std::string_view resolution) const {
        const std::string key = protocol::price_history_key(orderbook_id, resolution);
        return read([&](const Data& d) -> std::optional<PriceHistoryState> {
            auto it = d.price_histories.find(key);
            if (it == d.price_histories.end()) return std::nullopt;
            return it->second;
        });
    }

    inline void clear_all() {
        write([](Data& d) { d.clear_all(); });
    }

private:
    mutable std::shared_mutex mutex_;
    Data data_;
};

} // namespace lightsync::core::state

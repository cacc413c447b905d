#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lightsync/core/config.hpp"
#include "lightsync/core/error.hpp"
#include "lightsync/core/event.hpp"
#include "lightsync/core/protocol/subscription.hpp"
#include "lightsync/core/state/order_book.hpp"
#include "lightsync/core/state/user.hpp"
#include "lightsync/core/state/price_history.hpp"
#include "lightsync/core/transport/state.hpp"


namespace lightsync {

// -----------------------------
// Client (Facade)
// -----------------------------
//
// Production client over the Boost.Beast transport. Owns the background
// connection loop; the application consumes events with next_event() and
// reads entity state through point-in-time copies.
//
// Usage errors (NotConnected, AlreadyConnected, ChannelClosed, InvalidUrl,
// InvalidAuthToken) are returned synchronously. Everything else arrives as
// an event.
class Client {
public:
    using Subscription = core::protocol::Subscription;

    explicit Client(std::string url);
    explicit Client(Config cfg = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // lifecycle
    [[nodiscard]] Error connect();
    [[nodiscard]] Error disconnect();

    // subscriptions
    [[nodiscard]] Error subscribe(Subscription sub);
    [[nodiscard]] Error unsubscribe(Subscription sub);

    [[nodiscard]] Error subscribe_book_updates(std::vector<std::string> orderbook_ids);
    [[nodiscard]] Error unsubscribe_book_updates(std::vector<std::string> orderbook_ids);
    [[nodiscard]] Error subscribe_trades(std::vector<std::string> orderbook_ids);
    [[nodiscard]] Error unsubscribe_trades(std::vector<std::string> orderbook_ids);
    [[nodiscard]] Error subscribe_ticker(std::vector<std::string> orderbook_ids);
    [[nodiscard]] Error unsubscribe_ticker(std::vector<std::string> orderbook_ids);
    [[nodiscard]] Error subscribe_user(std::string wallet);
    [[nodiscard]] Error unsubscribe_user(std::string wallet);
    [[nodiscard]] Error subscribe_price_history(std::string orderbook_id, std::string resolution, bool include_ohlcv = false);
    [[nodiscard]] Error unsubscribe_price_history(std::string orderbook_id, std::string resolution);
    [[nodiscard]] Error subscribe_market(std::string market_pubkey = std::string(core::protocol::ALL_MARKETS));
    [[nodiscard]] Error unsubscribe_market(std::string market_pubkey = std::string(core::protocol::ALL_MARKETS));

    // raw traffic; NotConnected unless the connection is established
    [[nodiscard]] Error send(std::string payload);
    [[nodiscard]] Error ping();

    // events
    std::optional<WsEvent> next_event();
    std::optional<WsEvent> next_event(std::chrono::milliseconds timeout);
    std::optional<WsEvent> try_next_event();
    std::uint64_t dropped_events() const;

    // state (copies)
    std::optional<core::state::OrderBookState> orderbook(std::string_view orderbook_id) const;
    std::vector<std::string> orderbook_ids() const;
    std::optional<core::state::UserState> user_state() const;
    std::optional<core::state::PriceHistoryState> price_history(std::string_view orderbook_id, std::string_view resolution) const;
    std::optional<std::string> subscribed_user() const;

    // connection
    core::transport::State state() const;
    bool is_connected() const;
    const Config& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lightsync

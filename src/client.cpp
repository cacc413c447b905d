#include "lightsync/client.hpp"

// ---- Core includes (PRIVATE) ----
#include "lightsync/core/connection_manager.hpp"
#include "lightsync/core/transport/beast/websocket.hpp"


namespace lightsync {

using core::protocol::Subscription;

using WS = core::transport::beast::WebSocket;

// -----------------------------
// Impl
// -----------------------------

struct Client::Impl {
    core::ConnectionManager<WS> manager;

    explicit Impl(Config cfg)
        : manager(std::move(cfg))
    {}
};

// -----------------------------
// Client methods
// -----------------------------

Client::Client(Config cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg))) {}

Client::Client(std::string url)
    : Client([&] {
        Config cfg;
        cfg.url = std::move(url);
        return cfg;
    }()) {}

// The manager disconnects and joins its loop on destruction
Client::~Client() = default;

Error Client::connect() {
    return impl_->manager.connect();
}

Error Client::disconnect() {
    return impl_->manager.disconnect();
}

Error Client::subscribe(Subscription sub) {
    return impl_->manager.subscribe(std::move(sub));
}

Error Client::unsubscribe(Subscription sub) {
    return impl_->manager.unsubscribe(std::move(sub));
}

Error Client::subscribe_book_updates(std::vector<std::string> orderbook_ids) {
    return subscribe(Subscription::books(std::move(orderbook_ids)));
}

Error Client::unsubscribe_book_updates(std::vector<std::string> orderbook_ids) {
    return unsubscribe(Subscription::books(std::move(orderbook_ids)));
}

Error Client::subscribe_trades(std::vector<std::string> orderbook_ids) {
    return subscribe(Subscription::trades(std::move(orderbook_ids)));
}

Error Client::unsubscribe_trades(std::vector<std::string> orderbook_ids) {
    return unsubscribe(Subscription::trades(std::move(orderbook_ids)));
}

Error Client::subscribe_ticker(std::vector<std::string> orderbook_ids) {
    return subscribe(Subscription::ticker(std::move(orderbook_ids)));
}

Error Client::unsubscribe_ticker(std::vector<std::string> orderbook_ids) {
    return unsubscribe(Subscription::ticker(std::move(orderbook_ids)));
}

Error Client::subscribe_user(std::string wallet) {
    return subscribe(Subscription::user_channel(std::move(wallet)));
}

Error Client::unsubscribe_user(std::string wallet) {
    return unsubscribe(Subscription::user_channel(std::move(wallet)));
}

Error Client::subscribe_price_history(std::string orderbook_id, std::string resolution, bool include_ohlcv) {
    return subscribe(Subscription::price_history(std::move(orderbook_id), std::move(resolution), include_ohlcv));
}

Error Client::unsubscribe_price_history(std::string orderbook_id, std::string resolution) {
    return unsubscribe(Subscription::price_history(std::move(orderbook_id), std::move(resolution), false));
}

Error Client::subscribe_market(std::string market_pubkey) {
    return subscribe(Subscription::market(std::move(market_pubkey)));
}

Error Client::unsubscribe_market(std::string market_pubkey) {
    return unsubscribe(Subscription::market(std::move(market_pubkey)));
}

Error Client::send(std::string payload) {
    return impl_->manager.send(std::move(payload));
}

Error Client::ping() {
    return impl_->manager.ping();
}

std::optional<WsEvent> Client::next_event() {
    return impl_->manager.events().recv();
}

std::optional<WsEvent> Client::next_event(std::chrono::milliseconds timeout) {
    return impl_->manager.events().recv_for(timeout);
}

std::optional<WsEvent> Client::try_next_event() {
    return impl_->manager.events().try_recv();
}

std::uint64_t Client::dropped_events() const {
    return impl_->manager.events().dropped();
}

std::optional<core::state::OrderBookState> Client::orderbook(std::string_view orderbook_id) const {
    return impl_->manager.orderbook(orderbook_id);
}

std::vector<std::string> Client::orderbook_ids() const {
    return impl_->manager.orderbook_ids();
}

std::optional<core::state::UserState> Client::user_state() const {
    return impl_->manager.user_state();
}

std::optional<core::state::PriceHistoryState> Client::price_history(std::string_view orderbook_id, std::string_view resolution) const {
    return impl_->manager.price_history(orderbook_id, resolution);
}

std::optional<std::string> Client::subscribed_user() const {
    return impl_->manager.subscribed_user();
}

core::transport::State Client::state() const {
    return impl_->manager.state();
}

bool Client::is_connected() const {
    return impl_->manager.is_connected();
}

const Config& Client::config() const {
    return impl_->manager.config();
}

} // namespace lightsync

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

#include "lightsync.hpp"
#include "lcr/log/logger.hpp"

#include "common/cli/stream_params.hpp"

namespace cli = lightsync::examples::cli;
using namespace lightsync;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Printing helpers
// -----------------------------------------------------------------------------
static void print_book(const Client& client, const std::string& orderbook_id, std::uint32_t depth) {
    auto book = client.orderbook(orderbook_id);
    if (!book || !book->has_snapshot()) {
        return;
    }
    std::cout << "  [" << orderbook_id << "] seq=" << book->expected_sequence()
              << " bids=" << book->bid_count() << " asks=" << book->ask_count();
    if (auto spread = book->spread()) {
        std::cout << " spread=" << decimal::to_string(*spread);
    }
    if (auto mid = book->midpoint()) {
        std::cout << " mid=" << decimal::to_string(*mid);
    }
    std::cout << "\n";
    for (const auto& lvl : book->top_asks(depth)) {
        std::cout << "      ask " << decimal::to_string(lvl.price) << " x " << decimal::to_string(lvl.size) << "\n";
    }
    for (const auto& lvl : book->top_bids(depth)) {
        std::cout << "      bid " << decimal::to_string(lvl.price) << " x " << decimal::to_string(lvl.size) << "\n";
    }
}

static void print_user(const Client& client) {
    auto user = client.user_state();
    if (!user) {
        return;
    }
    std::cout << "  [user " << user->user() << "] orders=" << user->order_count()
              << " balances=" << user->balance_count() << " nonce=" << user->nonce() << "\n";
}

static void print_candle(const Client& client, const std::string& orderbook_id, const std::string& resolution) {
    auto history = client.price_history(orderbook_id, resolution);
    if (!history) {
        return;
    }
    auto latest = history->latest();
    std::cout << "  [candles " << orderbook_id << ":" << resolution << "] count=" << history->candle_count();
    if (latest) {
        std::cout << " t=" << latest->t;
        if (latest->c) {
            std::cout << " close=" << decimal::to_string(*latest->c);
        }
        if (latest->m) {
            std::cout << " mid=" << decimal::to_string(*latest->m);
        }
    }
    std::cout << "\n";
}

// -----------------------------------------------------------------------------
// Event handling
// -----------------------------------------------------------------------------
static void handle_event(const Client& client, const cli::stream::Params& params, const WsEvent& ev) {
    std::cout << " -> " << ev << std::endl;
    switch (ev.type) {
    case EventType::BookUpdate:
        print_book(client, ev.orderbook_id, params.depth);
        break;
    case EventType::UserUpdate:
        print_user(client);
        break;
    case EventType::PriceUpdate:
        print_candle(client, ev.orderbook_id, ev.resolution);
        break;
    case EventType::MaxReconnectReached:
        running.store(false);
        break;
    default:
        break;
    }
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // Signal handling
    // -------------------------------------------------------------
    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::stream::configure(argc, argv, "LightSync - Market Data Stream Example\n"
        "Mirrors order books, user state and candles over one WebSocket session.\n"
    );
    params.dump("=== Stream Example Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    Client client{params.to_config()};

    if (auto err = client.connect()) {
        LS_ERROR("Connect failed: " << err);
        return -1;
    }

    // -------------------------------------------------------------
    // Subscriptions
    // -------------------------------------------------------------
    auto check = [](Error err, const char* what) {
        if (err) {
            LS_ERROR("Subscribe " << what << " failed: " << err);
        }
    };
    if (!params.books.empty()) {
        check(client.subscribe_book_updates(params.books), "books");
    }
    if (!params.trades.empty()) {
        check(client.subscribe_trades(params.trades), "trades");
    }
    if (!params.wallet.empty()) {
        check(client.subscribe_user(params.wallet), "user");
    }
    if (!params.price_history.empty()) {
        check(client.subscribe_price_history(params.price_history, params.resolution, true), "price history");
    }

    // -------------------------------------------------------------------------
    // Event loop (runs until Ctrl+C or the session ends)
    // -------------------------------------------------------------------------
    while (running.load()) {
        auto ev = client.next_event(std::chrono::milliseconds(200));
        if (!ev) {
            if (client.state() == core::transport::State::Disconnected) {
                // The final events may land between the timeout and the state check
                while (auto tail = client.try_next_event()) {
                    handle_event(client, params, *tail);
                }
                LS_WARN("Session ended");
                break;
            }
            continue;
        }
        handle_event(client, params, *ev);
    }

    // -------------------------------------------------------------------------
    // Graceful shutdown
    // -------------------------------------------------------------------------
    if (auto err = client.disconnect(); err && err.code != ErrorCode::NotConnected) {
        LS_WARN("Disconnect: " << err);
    }
    if (client.dropped_events() > 0) {
        LS_WARN("Dropped events: " << client.dropped_events());
    }

    std::cout << "=== Done ===\n";
    return 0;
}

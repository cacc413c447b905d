/*
===============================================================================
 state::UserState - Group C Unit Tests
===============================================================================

Scope:
------
Orders, balances and nonce of the single subscribed user.

Covered Requirements:
---------------------
C1. Snapshot replaces orders, balances and nonce

C2. Order events
    - remaining == "0" (exact decimal, any spelling) removes the order,
      regardless of filled
    - non-zero remaining for an unknown hash creates exactly one order
    - a second event for the same hash updates in place (no duplicate)

C3. Balance and nonce events
    - balance_update replaces the entry of its market / mint
    - nonce is overwritten by the server value

Non-Goals:
----------
- Wire parsing
- Multi-user state

===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "lightsync/core/state/user.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace lightsync;
using namespace lightsync::core;
using protocol::schema::UserEvent;
using protocol::schema::UserEventType;
using fixture::dec;


static UserEvent order_event(const std::string& hash, const std::string& remaining, const std::string& filled) {
    UserEvent ev;
    ev.type = UserEventType::Order;
    ev.market_pubkey = "m1";
    ev.orderbook_id = "ob1";
    protocol::schema::OrderUpdate upd;
    upd.order_hash = hash;
    upd.price = dec("0.5");
    upd.remaining = dec(remaining);
    upd.filled = dec(filled);
    upd.side = protocol::Side::Sell;
    ev.order = upd;
    return ev;
}

// -----------------------------------------------------------------------------
// Group C1: snapshot
// -----------------------------------------------------------------------------
void test_snapshot() {
    std::cout << "[TEST] Group C1: snapshot\n";

    state::UserState user{"wallet1"};
    TEST_CHECK(!user.has_snapshot());

    // Prior order that the snapshot must discard
    TEST_CHECK(user.apply(order_event("stale", "1", "0")).ok());
    TEST_CHECK(user.order_count() == 1);

    UserEvent snap;
    snap.type = UserEventType::Snapshot;
    protocol::schema::Order o;
    o.order_hash = "h1";
    o.market_pubkey = "m1";
    o.orderbook_id = "ob1";
    o.remaining = dec("10");
    o.price = dec("0.5");
    snap.orders.push_back(o);
    protocol::schema::BalanceEntry b;
    b.market_pubkey = "m1";
    b.deposit_mint = "mint1";
    b.outcomes.push_back({0, "o0", dec("5"), dec("1")});
    b.outcomes.push_back({1, "o1", dec("2"), dec("0")});
    snap.balances.push_back(b);
    snap.nonce = 7;

    TEST_CHECK(user.apply(snap).ok());
    TEST_CHECK(user.has_snapshot());
    TEST_CHECK(user.order_count() == 1);
    TEST_CHECK(!user.order("stale").has_value());
    TEST_CHECK(user.order("h1")->remaining == dec("10"));
    TEST_CHECK(user.orders_for_orderbook("ob1").size() == 1);
    TEST_CHECK(user.orders_for_market("m2").empty());
    TEST_CHECK(user.nonce() == 7);
    TEST_CHECK(user.balance_count() == 1);
    TEST_CHECK(*user.idle_balance_for_outcome("m1", "mint1", 0) == dec("5"));
    TEST_CHECK(*user.on_book_balance_for_outcome("m1", "mint1", 0) == dec("1"));
    TEST_CHECK(*user.idle_balance_for_outcome("m1", "mint1", 1) == dec("2"));
    TEST_CHECK(!user.idle_balance_for_outcome("m1", "mint1", 2).has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C2: order events
// -----------------------------------------------------------------------------
void test_order_events() {
    std::cout << "[TEST] Group C2: order events\n";

    state::UserState user{"wallet1"};

    // Unknown hash with remaining -> exactly one new order
    TEST_CHECK(user.apply(order_event("h1", "10", "0")).ok());
    TEST_CHECK(user.order_count() == 1);
    auto o = user.order("h1");
    TEST_CHECK(o.has_value());
    TEST_CHECK(o->status == protocol::OrderStatus::Open);
    TEST_CHECK(o->side == protocol::Side::Sell);
    TEST_CHECK(o->market_pubkey == "m1");

    // Same hash -> in-place update
    TEST_CHECK(user.apply(order_event("h1", "4", "6")).ok());
    TEST_CHECK(user.order_count() == 1);
    TEST_CHECK(user.order("h1")->remaining == dec("4"));
    TEST_CHECK(user.order("h1")->filled == dec("6"));

    // Exact zero with trailing digits removes the order
    TEST_CHECK(user.apply(order_event("h1", "0.000000", "10")).ok());
    TEST_CHECK(user.order_count() == 0);

    // Removal of an unknown order is harmless
    TEST_CHECK(user.apply(order_event("h2", "0", "0")).ok());
    TEST_CHECK(user.order_count() == 0);

    // A tiny non-zero remaining is not zero
    TEST_CHECK(user.apply(order_event("h3", "0.000000000000000001", "0")).ok());
    TEST_CHECK(user.order_count() == 1);

    // Order event without payload is ignored
    UserEvent empty;
    empty.type = UserEventType::Order;
    TEST_CHECK(!user.apply(empty).ok());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group C3: balance and nonce events
// -----------------------------------------------------------------------------
void test_balance_and_nonce() {
    std::cout << "[TEST] Group C3: balance and nonce\n";

    state::UserState user{"wallet1"};

    UserEvent bal;
    bal.type = UserEventType::BalanceUpdate;
    bal.market_pubkey = "m1";
    bal.deposit_mint = "mint1";
    bal.balance = std::vector<protocol::schema::OutcomeBalance>{{0, "o0", dec("3"), dec("0")}};
    TEST_CHECK(user.apply(bal).ok());
    TEST_CHECK(*user.idle_balance_for_outcome("m1", "mint1", 0) == dec("3"));

    bal.balance = std::vector<protocol::schema::OutcomeBalance>{{0, "o0", dec("1.25"), dec("0.75")}};
    TEST_CHECK(user.apply(bal).ok());
    TEST_CHECK(user.balance_count() == 1);
    TEST_CHECK(*user.idle_balance_for_outcome("m1", "mint1", 0) == dec("1.25"));
    TEST_CHECK(*user.on_book_balance_for_outcome("m1", "mint1", 0) == dec("0.75"));

    UserEvent nonce;
    nonce.type = UserEventType::Nonce;
    nonce.nonce = 12;
    TEST_CHECK(user.apply(nonce).ok());
    TEST_CHECK(user.nonce() == 12);

    // Server is authoritative: a lower value is accepted
    nonce.nonce = 3;
    TEST_CHECK(user.apply(nonce).ok());
    TEST_CHECK(user.nonce() == 3);

    user.clear();
    TEST_CHECK(user.order_count() == 0);
    TEST_CHECK(user.balance_count() == 0);
    TEST_CHECK(user.nonce() == 0);
    TEST_CHECK(user.user() == "wallet1");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_snapshot();
    test_order_events();
    test_balance_and_nonce();

    std::cout << "\n[GROUP C - USER STATE TESTS PASSED]\n";
    return 0;
}

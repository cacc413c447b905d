/*
===============================================================================
 state::OrderBookState - Group B Unit Tests
===============================================================================

Scope:
------
Reconciliation of one order book from snapshots and sequenced deltas.

Covered Requirements:
---------------------
B1. Snapshot followed by a delta (ob1 scenario)
    - best bid / best ask / spread / midpoint are derived from the levels
    - a size "0" delta removes the level
    - expected_sequence == seq + 1 after each accepted message

B2. Sequence gap
    - delta seq=5 while expected_sequence=1 -> SequenceGap{1, 5}
    - the book is left untouched
    - clear() resets has_snapshot and both sides

B3. Replay against an independent oracle
    - snapshot(seq=N) + in-order deltas N+1..N+k
    - expected_sequence == N+k+1
    - resulting levels equal a plain map replay of the same levels

B4. Zero-size rows
    - never inserted by a snapshot
    - removed by a delta (also when spelled "0.000")

Non-Goals:
----------
- Wire parsing (covered by the router tests)
- Gap policy (covered by the connection manager tests)

===============================================================================
*/

#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "lightsync/core/state/order_book.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace lightsync;
using namespace lightsync::core;
using protocol::schema::BookUpdate;
using protocol::schema::Level;
using fixture::dec;
using fixture::level;


static BookUpdate make_update(std::uint64_t seq, bool snapshot,
                              std::vector<Level> bids, std::vector<Level> asks) {
    BookUpdate u;
    u.orderbook_id = "ob1";
    u.timestamp = "2024-01-01T00:00:00.000Z";
    u.seq = seq;
    u.is_snapshot = snapshot;
    u.bids = std::move(bids);
    u.asks = std::move(asks);
    return u;
}

// -----------------------------------------------------------------------------
// Group B1: ob1 scenario
// -----------------------------------------------------------------------------
void test_snapshot_then_delta() {
    std::cout << "[TEST] Group B1: snapshot then delta\n";

    state::OrderBookState book{"ob1"};
    TEST_CHECK(!book.has_snapshot());
    TEST_CHECK(!book.best_bid().has_value());

    auto r = book.apply(make_update(0, true,
        {level("0.50", "0.0010"), level("0.49", "0.0020")},
        {level("0.51", "0.0005")}));
    TEST_CHECK(r.ok());
    TEST_CHECK(book.has_snapshot());
    TEST_CHECK(book.expected_sequence() == 1);
    TEST_CHECK(*book.best_bid() == dec("0.50"));
    TEST_CHECK(*book.best_ask() == dec("0.51"));
    TEST_CHECK(*book.spread() == dec("0.01"));
    TEST_CHECK(*book.midpoint() == dec("0.505"));
    TEST_CHECK(book.total_bid_depth() == dec("0.0030"));

    r = book.apply(make_update(1, false,
        {level("0.50", "0.0015")},
        {level("0.51", "0")}));
    TEST_CHECK(r.ok());
    TEST_CHECK(book.expected_sequence() == 2);
    TEST_CHECK(*book.bid_size_at(dec("0.50")) == dec("0.0015"));
    TEST_CHECK(!book.ask_size_at(dec("0.51")).has_value());
    TEST_CHECK(!book.best_ask().has_value());
    TEST_CHECK(!book.spread().has_value());
    TEST_CHECK(!book.midpoint().has_value());
    TEST_CHECK(book.bid_count() == 2);
    TEST_CHECK(book.ask_count() == 0);

    // Bids are ordered best (highest) first
    auto bids = book.top_bids(5);
    TEST_CHECK(bids.size() == 2);
    TEST_CHECK(bids[0].price == dec("0.50"));
    TEST_CHECK(bids[1].price == dec("0.49"));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B2: sequence gap
// -----------------------------------------------------------------------------
void test_sequence_gap() {
    std::cout << "[TEST] Group B2: sequence gap\n";

    state::OrderBookState book{"ob1"};
    TEST_CHECK(book.apply(make_update(0, true, {level("0.50", "1")}, {level("0.60", "2")})).ok());
    TEST_CHECK(book.expected_sequence() == 1);

    auto r = book.apply(make_update(5, false, {level("0.50", "9")}, {}));
    TEST_CHECK(r.is_gap());
    TEST_CHECK(r.expected == 1);
    TEST_CHECK(r.received == 5);

    // Untouched
    TEST_CHECK(book.expected_sequence() == 1);
    TEST_CHECK(*book.bid_size_at(dec("0.50")) == dec("1"));
    TEST_CHECK(book.has_snapshot());

    // A stale delta is a gap too
    TEST_CHECK(book.apply(make_update(0, false, {}, {})).is_gap());

    book.clear();
    TEST_CHECK(!book.has_snapshot());
    TEST_CHECK(book.bid_count() == 0);
    TEST_CHECK(book.ask_count() == 0);

    // A fresh snapshot re-baselines unconditionally
    TEST_CHECK(book.apply(make_update(42, true, {level("0.40", "1")}, {})).ok());
    TEST_CHECK(book.expected_sequence() == 43);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B3: replay oracle
// -----------------------------------------------------------------------------
void test_replay_matches_oracle() {
    std::cout << "[TEST] Group B3: in-order replay matches oracle\n";

    using Oracle = std::map<Decimal, Decimal>;
    auto oracle_apply = [](Oracle& side, const std::vector<Level>& levels) {
        for (const auto& lvl : levels) {
            if (lvl.size.is_zero()) {
                side.erase(lvl.price);
            } else {
                side[lvl.price] = lvl.size;
            }
        }
    };

    const std::uint64_t N = 100;
    const std::uint64_t K = 50;

    state::OrderBookState book{"ob1"};
    Oracle bids_oracle;
    Oracle asks_oracle;

    std::vector<Level> snap_bids;
    std::vector<Level> snap_asks;
    for (int i = 0; i < 10; ++i) {
        snap_bids.push_back(level("0.4" + std::to_string(i), std::to_string(i + 1)));
        snap_asks.push_back(level("0.6" + std::to_string(i), std::to_string(i + 1)));
    }
    TEST_CHECK(book.apply(make_update(N, true, snap_bids, snap_asks)).ok());
    oracle_apply(bids_oracle, snap_bids);
    oracle_apply(asks_oracle, snap_asks);

    for (std::uint64_t k = 1; k <= K; ++k) {
        const auto digit = std::to_string(k % 10);
        // Alternate between upserts and removals
        const std::string size = (k % 3 == 0) ? "0" : std::to_string(k) + ".5";
        std::vector<Level> bids{level("0.4" + digit, size)};
        std::vector<Level> asks{level("0.6" + digit, (k % 4 == 0) ? "0" : "7")};
        TEST_CHECK(book.apply(make_update(N + k, false, bids, asks)).ok());
        oracle_apply(bids_oracle, bids);
        oracle_apply(asks_oracle, asks);
    }

    TEST_CHECK(book.expected_sequence() == N + K + 1);

    auto bids = book.bids();
    TEST_CHECK(bids.size() == bids_oracle.size());
    auto oit = bids_oracle.rbegin();
    for (const auto& lvl : bids) {
        TEST_CHECK(lvl.price == oit->first);
        TEST_CHECK(lvl.size == oit->second);
        ++oit;
    }

    auto asks = book.asks();
    TEST_CHECK(asks.size() == asks_oracle.size());
    auto ait = asks_oracle.begin();
    for (const auto& lvl : asks) {
        TEST_CHECK(lvl.price == ait->first);
        TEST_CHECK(lvl.size == ait->second);
        ++ait;
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B4: zero-size rows
// -----------------------------------------------------------------------------
void test_zero_size_rows() {
    std::cout << "[TEST] Group B4: zero-size rows\n";

    state::OrderBookState book{"ob1"};
    TEST_CHECK(book.apply(make_update(7, true,
        {level("0.50", "0"), level("0.49", "3")},
        {level("0.51", "0.000"), level("0.52", "4")})).ok());
    TEST_CHECK(book.bid_count() == 1);
    TEST_CHECK(book.ask_count() == 1);
    TEST_CHECK(!book.bid_size_at(dec("0.50")).has_value());
    TEST_CHECK(!book.ask_size_at(dec("0.51")).has_value());

    TEST_CHECK(book.apply(make_update(8, false, {level("0.49", "0.000")}, {})).ok());
    TEST_CHECK(!book.bid_size_at(dec("0.49")).has_value());
    TEST_CHECK(book.bid_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_snapshot_then_delta();
    test_sequence_gap();
    test_replay_matches_oracle();
    test_zero_size_rows();

    std::cout << "\n[GROUP B - ORDER BOOK TESTS PASSED]\n";
    return 0;
}

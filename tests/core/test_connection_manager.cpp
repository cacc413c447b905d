/*
===============================================================================
 core::ConnectionManager - Group K Unit Tests
===============================================================================

Scope:
------
Session orchestration over MockWebSocket: commands, routing into the store,
connection signals, reconnect replay and shutdown. The loop is driven with
open() + poll(now) except where the background thread itself is under test.

Covered Requirements:
---------------------
K1. Lifecycle preconditions
    - commands before open() fail with NotConnected
    - invalid auth token rejected before any network activity
    - auth token is sent as a Cookie header
    - initial connect failure is returned, session never starts

K2. Subscriptions
    - subscribe sends the request frame and seeds the store
    - unsubscribe sends the request frame and drops the store entry
    - a second wallet replaces the first (unsubscribe + new state)

K3. Inbound routing
    - book / user / price_history frames reach the store
    - pong frames clear the pending heartbeat

K4. Reconnect
    - every store is empty right after the reconnect
    - the replayed subscribe set equals the registry contents
    - commands issued while reconnecting are replayed

K5. Gap policy
    - AutoResync re-subscribes the book
    - Notify leaves the decision to the application

K6. Shutdown
    - disconnect() clears the registry and ends the session
    - threaded connect() delivers events and stops on disconnect()

K7. Raw frames while not connected
    - send() and ping() fail with NotConnected while reconnecting
    - nothing is queued, so no later Error event surfaces

K8. Caller-driven loop with a full command channel
    - a command that finds the channel full drains it inline
    - disconnect() returns at once and ends the session

Non-Goals:
----------
- Transport retry timing (connection tests)
- Wire parsing details (router tests)

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "lightsync/core/connection_manager.hpp"
#include "common/json_helpers.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

using namespace lightsync;
using namespace std::chrono_literals;
using core::protocol::Subscription;
using core::protocol::Method;
using core::protocol::to_json;
using core::transport::test::MockWebSocket;

using Manager = core::ConnectionManager<MockWebSocket>;
using clock_type = Manager::clock;

static constexpr const char* URL = "wss://ws.lightcone.test/ws";


static Config make_config() {
    Config cfg;
    cfg.url = URL;
    cfg.reconnect_attempts = 3;
    cfg.base_delay = 100ms;
    cfg.max_delay = 1000ms;
    return cfg;
}

static std::vector<WsEvent> drain(Manager& mgr) {
    std::vector<WsEvent> out;
    while (auto ev = mgr.events().try_recv()) {
        out.push_back(std::move(*ev));
    }
    return out;
}

static bool has_event(const std::vector<WsEvent>& events, EventType type) {
    return std::any_of(events.begin(), events.end(), [&](const WsEvent& ev) { return ev.type == type; });
}

static bool was_sent(const std::string& frame) {
    const auto& sent = MockWebSocket::sent();
    return std::find(sent.begin(), sent.end(), frame) != sent.end();
}


// -----------------------------------------------------------------------------
// Group K1: lifecycle preconditions
// -----------------------------------------------------------------------------
void test_preconditions() {
    std::cout << "[TEST] Group K1: lifecycle preconditions\n";
    MockWebSocket::reset();

    {
        Manager mgr{make_config()};
        TEST_CHECK(mgr.subscribe(Subscription::books({"ob1"})).code == ErrorCode::NotConnected);
        TEST_CHECK(mgr.ping().code == ErrorCode::NotConnected);
        TEST_CHECK(mgr.disconnect().code == ErrorCode::NotConnected);
        TEST_CHECK(mgr.state() == core::transport::State::Disconnected);
    }

    {
        auto cfg = make_config();
        cfg.auth_token = "   ";
        Manager mgr{cfg};
        TEST_CHECK(mgr.open().code == ErrorCode::InvalidAuthToken);
        TEST_CHECK(MockWebSocket::connect_calls() == 0);
        TEST_CHECK(!mgr.is_running());
    }

    {
        auto cfg = make_config();
        cfg.auth_token = "tok123";
        Manager mgr{cfg};
        TEST_CHECK(mgr.open().ok());
        const auto& headers = MockWebSocket::last_options().headers;
        TEST_CHECK(std::find(headers.begin(), headers.end(),
                             std::make_pair(std::string("Cookie"), std::string("auth_token=tok123"))) != headers.end());
        TEST_CHECK(mgr.open().code == ErrorCode::AlreadyConnected);
    }

    {
        MockWebSocket::reset();
        MockWebSocket::script_connect({core::transport::Error::ConnectionFailed});
        Manager mgr{make_config()};
        TEST_CHECK(mgr.open().code == ErrorCode::ConnectionFailed);
        TEST_CHECK(!mgr.is_running());
        TEST_CHECK(drain(mgr).empty());
    }

    {
        auto cfg = make_config();
        cfg.url = "http://nope";
        Manager mgr{cfg};
        TEST_CHECK(mgr.open().code == ErrorCode::InvalidUrl);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K2: subscriptions
// -----------------------------------------------------------------------------
void test_subscriptions() {
    std::cout << "[TEST] Group K2: subscribe / unsubscribe\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.open().ok());
    mgr.poll(clock_type::now());
    auto events = drain(mgr);
    TEST_CHECK(events.size() == 1);
    TEST_CHECK(events[0].type == EventType::Connected);

    const auto books = Subscription::books({"ob1", "ob2"});
    TEST_CHECK(mgr.subscribe(books).ok());
    TEST_CHECK(mgr.subscribe(Subscription::price_history("ob1", "1m", true)).ok());
    TEST_CHECK(mgr.send(R"({"type":"custom"})").ok());
    mgr.poll(clock_type::now());

    TEST_CHECK(MockWebSocket::sent().size() == 3);
    TEST_CHECK(MockWebSocket::sent()[0] == to_json(books, Method::Subscribe));
    TEST_CHECK(MockWebSocket::sent()[1] == to_json(Subscription::price_history("ob1", "1m", true), Method::Subscribe));
    TEST_CHECK(MockWebSocket::sent()[2] == R"({"type":"custom"})");
    TEST_CHECK(mgr.registry().is_subscribed_books("ob2"));
    TEST_CHECK(mgr.orderbook_ids() == std::vector<std::string>({"ob1", "ob2"}));
    TEST_CHECK(mgr.price_history("ob1", "1m").has_value());

    MockWebSocket::clear_sent();
    TEST_CHECK(mgr.unsubscribe(Subscription::books({"ob2"})).ok());
    mgr.poll(clock_type::now());
    TEST_CHECK(MockWebSocket::sent().size() == 1);
    TEST_CHECK(MockWebSocket::sent()[0] == to_json(Subscription::books({"ob2"}), Method::Unsubscribe));
    TEST_CHECK(!mgr.orderbook("ob2").has_value());
    TEST_CHECK(mgr.orderbook("ob1").has_value());
    TEST_CHECK(!mgr.registry().is_subscribed_books("ob2"));

    std::cout << "[TEST] OK\n";
}

void test_user_replacement() {
    std::cout << "[TEST] Group K2: user replacement\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.open().ok());
    TEST_CHECK(mgr.subscribe(Subscription::user_channel("wallet1")).ok());
    mgr.poll(clock_type::now());
    TEST_CHECK(*mgr.subscribed_user() == "wallet1");

    MockWebSocket::clear_sent();
    TEST_CHECK(mgr.subscribe(Subscription::user_channel("wallet2")).ok());
    mgr.poll(clock_type::now());

    TEST_CHECK(MockWebSocket::sent().size() == 2);
    TEST_CHECK(MockWebSocket::sent()[0] == to_json(Subscription::user_channel("wallet1"), Method::Unsubscribe));
    TEST_CHECK(MockWebSocket::sent()[1] == to_json(Subscription::user_channel("wallet2"), Method::Subscribe));
    TEST_CHECK(*mgr.subscribed_user() == "wallet2");
    TEST_CHECK(mgr.user_state()->user() == "wallet2");
    TEST_CHECK(*mgr.registry().user() == "wallet2");

    TEST_CHECK(mgr.unsubscribe(Subscription::user_channel("wallet2")).ok());
    mgr.poll(clock_type::now());
    TEST_CHECK(!mgr.subscribed_user().has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K3: inbound routing
// -----------------------------------------------------------------------------
void test_routing_and_pong() {
    std::cout << "[TEST] Group K3: routing and pong\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.open().ok());
    const auto t0 = clock_type::now();
    TEST_CHECK(mgr.subscribe(Subscription::books({"ob1"})).ok());
    mgr.poll(t0);
    (void)drain(mgr);

    MockWebSocket::current()->emit_message(json::frame::book("ob1", 10, true, {{"0.50", "1"}}, {{"0.52", "3"}}));
    MockWebSocket::current()->emit_message(json::frame::book("ob1", 11, false, {{"0.51", "2"}}, {}));
    mgr.poll(t0);

    auto events = drain(mgr);
    TEST_CHECK(events.size() == 2);
    TEST_CHECK(events[0].type == EventType::BookUpdate && events[0].is_snapshot);
    TEST_CHECK(events[1].type == EventType::BookUpdate && !events[1].is_snapshot);
    auto book = mgr.orderbook("ob1");
    TEST_CHECK(*book->best_bid() == fixture::dec("0.51"));
    TEST_CHECK(*book->best_ask() == fixture::dec("0.52"));
    TEST_CHECK(*book->spread() == fixture::dec("0.01"));
    TEST_CHECK(book->expected_sequence() == 12);

    // Heartbeat: ping at ping_interval, pong clears it
    MockWebSocket::clear_sent();
    mgr.poll(t0 + mgr.config().ping_interval);
    TEST_CHECK(was_sent(core::protocol::ping_json()));
    TEST_CHECK(mgr.connection().awaiting_pong());

    MockWebSocket::current()->emit_message(json::frame::pong());
    mgr.poll(t0 + mgr.config().ping_interval + 1s);
    TEST_CHECK(!mgr.connection().awaiting_pong());
    TEST_CHECK(has_event(drain(mgr), EventType::Pong));

    // Explicit ping
    MockWebSocket::clear_sent();
    TEST_CHECK(mgr.ping().ok());
    mgr.poll(t0 + mgr.config().ping_interval + 1s);
    TEST_CHECK(MockWebSocket::sent().size() == 1);
    TEST_CHECK(MockWebSocket::sent()[0] == core::protocol::ping_json());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K4: reconnect
// -----------------------------------------------------------------------------
void test_reconnect_replay() {
    std::cout << "[TEST] Group K4: reconnect clears stores and replays subscriptions\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.open().ok());
    const auto t0 = clock_type::now();
    TEST_CHECK(mgr.subscribe(Subscription::books({"ob1"})).ok());
    TEST_CHECK(mgr.subscribe(Subscription::user_channel("wallet1")).ok());
    TEST_CHECK(mgr.subscribe(Subscription::price_history("ob1", "1m", true)).ok());
    mgr.poll(t0);

    MockWebSocket::current()->emit_message(json::frame::book("ob1", 1, true, {{"0.5", "1"}}, {}));
    MockWebSocket::current()->emit_message(json::frame::user_snapshot("wallet1", 4));
    MockWebSocket::current()->emit_message(json::frame::price_snapshot("ob1", "1m", {60000, 120000}));
    mgr.poll(t0);
    TEST_CHECK(mgr.orderbook("ob1")->has_snapshot());
    TEST_CHECK(mgr.user_state()->order_count() == 1);
    TEST_CHECK(mgr.price_history("ob1", "1m")->candle_count() == 2);
    (void)drain(mgr);

    // Remote close
    MockWebSocket::current()->emit_close(core::transport::websocket::CLOSE_GOING_AWAY, "restart");
    mgr.poll(t0);
    auto events = drain(mgr);
    TEST_CHECK(events.size() == 2);
    TEST_CHECK(events[0].type == EventType::Disconnected);
    TEST_CHECK(events[0].reason == "restart");
    TEST_CHECK(events[1].type == EventType::Reconnecting);
    TEST_CHECK(events[1].attempt == 1);
    TEST_CHECK(mgr.state() == core::transport::State::Reconnecting);

    // Issued while reconnecting: registered now, sent on replay
    MockWebSocket::clear_sent();
    TEST_CHECK(mgr.subscribe(Subscription::trades({"ob2"})).ok());
    mgr.poll(t0);
    TEST_CHECK(MockWebSocket::sent().empty());

    mgr.poll(t0 + 2s);
    TEST_CHECK(mgr.is_connected());
    TEST_CHECK(mgr.connection().epoch() == 2);
    events = drain(mgr);
    TEST_CHECK(events.size() == 1);
    TEST_CHECK(events[0].type == EventType::Connected);

    // Stores empty before any frame of the new connection
    TEST_CHECK(!mgr.orderbook("ob1")->has_snapshot());
    TEST_CHECK(mgr.orderbook("ob1")->bid_count() == 0);
    TEST_CHECK(mgr.user_state()->order_count() == 0);
    TEST_CHECK(mgr.user_state()->nonce() == 0);
    TEST_CHECK(mgr.price_history("ob1", "1m")->candle_count() == 0);

    // Replayed set == registry contents
    std::vector<std::string> expected;
    for (const auto& sub : mgr.registry().subscriptions()) {
        expected.push_back(to_json(sub, Method::Subscribe));
    }
    std::vector<std::string> sent = MockWebSocket::sent();
    std::sort(expected.begin(), expected.end());
    std::sort(sent.begin(), sent.end());
    TEST_CHECK(expected.size() == 4);
    TEST_CHECK(sent == expected);
    TEST_CHECK(was_sent(to_json(Subscription::trades({"ob2"}), Method::Subscribe)));

    std::cout << "[TEST] OK\n";
}

void test_rate_limited_close() {
    std::cout << "[TEST] Group K4: rate-limited close\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.open().ok());
    mgr.poll(clock_type::now());
    (void)drain(mgr);

    MockWebSocket::current()->emit_close(RATE_LIMIT_CLOSE_CODE, "slow down");
    mgr.poll(clock_type::now());
    auto events = drain(mgr);
    TEST_CHECK(events.size() == 3);
    TEST_CHECK(events[0].type == EventType::Error);
    TEST_CHECK(events[0].error.code == ErrorCode::RateLimited);
    TEST_CHECK(events[1].type == EventType::Disconnected);
    TEST_CHECK(events[1].close_code == RATE_LIMIT_CLOSE_CODE);
    TEST_CHECK(events[2].type == EventType::Reconnecting);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K5: gap policy
// -----------------------------------------------------------------------------
static std::size_t gap_resubscribes(GapPolicy policy) {
    MockWebSocket::reset();
    auto cfg = make_config();
    cfg.gap_policy = policy;
    Manager mgr{cfg};

    TEST_CHECK(mgr.open().ok());
    const auto t0 = clock_type::now();
    TEST_CHECK(mgr.subscribe(Subscription::books({"ob1"})).ok());
    mgr.poll(t0);
    MockWebSocket::current()->emit_message(json::frame::book("ob1", 10, true, {{"0.5", "1"}}, {}));
    mgr.poll(t0);
    (void)drain(mgr);

    MockWebSocket::clear_sent();
    MockWebSocket::current()->emit_message(json::frame::book("ob1", 15, false, {{"0.4", "1"}}, {}));
    mgr.poll(t0);

    auto events = drain(mgr);
    TEST_CHECK(has_event(events, EventType::ResyncRequired));
    TEST_CHECK(!mgr.orderbook("ob1")->has_snapshot());

    const auto frame = to_json(Subscription::books({"ob1"}), Method::Subscribe);
    return static_cast<std::size_t>(std::count(MockWebSocket::sent().begin(), MockWebSocket::sent().end(), frame));
}

void test_gap_policy() {
    std::cout << "[TEST] Group K5: gap policy\n";

    TEST_CHECK(gap_resubscribes(GapPolicy::AutoResync) == 1);
    TEST_CHECK(gap_resubscribes(GapPolicy::Notify) == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group K6: shutdown
// -----------------------------------------------------------------------------
void test_disconnect() {
    std::cout << "[TEST] Group K6: disconnect\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.open().ok());
    TEST_CHECK(mgr.subscribe(Subscription::books({"ob1"})).ok());
    TEST_CHECK(mgr.subscribe(Subscription::market("all")).ok());
    mgr.poll(clock_type::now());
    (void)drain(mgr);

    TEST_CHECK(mgr.disconnect().ok());
    TEST_CHECK(!mgr.is_running());
    TEST_CHECK(mgr.state() == core::transport::State::Disconnected);
    TEST_CHECK(mgr.registry().empty());
    TEST_CHECK(MockWebSocket::close_count() == 1);

    auto events = drain(mgr);
    TEST_CHECK(events.size() == 1);
    TEST_CHECK(events[0].type == EventType::Disconnected);
    TEST_CHECK(events[0].close_code == 1000);

    TEST_CHECK(mgr.subscribe(Subscription::books({"ob1"})).code == ErrorCode::NotConnected);
    TEST_CHECK(mgr.disconnect().code == ErrorCode::NotConnected);

    // A new session starts clean: nothing to replay
    MockWebSocket::clear_sent();
    TEST_CHECK(mgr.open().ok());
    mgr.poll(clock_type::now());
    TEST_CHECK(MockWebSocket::sent().empty());
    TEST_CHECK(has_event(drain(mgr), EventType::Connected));

    std::cout << "[TEST] OK\n";
}

void test_threaded_session() {
    std::cout << "[TEST] Group K6: threaded session\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.connect().ok());
    auto ev = mgr.events().recv_for(2s);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->type == EventType::Connected);

    TEST_CHECK(mgr.subscribe(Subscription::ticker({"ob1"})).ok());
    TEST_CHECK(mgr.disconnect().ok());
    TEST_CHECK(!mgr.is_running());

    // Loop joined: static mock state is stable now
    TEST_CHECK(was_sent(to_json(Subscription::ticker({"ob1"}), Method::Subscribe)));
    ev = mgr.events().recv_for(2s);
    TEST_CHECK(ev.has_value());
    TEST_CHECK(ev->type == EventType::Disconnected);

    std::cout << "[TEST] OK\n";
}

void test_raw_frames_while_reconnecting() {
    std::cout << "[TEST] Group K7: raw frames while reconnecting\n";
    MockWebSocket::reset();
    Manager mgr{make_config()};

    TEST_CHECK(mgr.open().ok());
    const auto t0 = clock_type::now();
    mgr.poll(t0);
    (void)drain(mgr);

    MockWebSocket::current()->emit_close(core::transport::websocket::CLOSE_GOING_AWAY, "restart");
    mgr.poll(t0);
    TEST_CHECK(mgr.state() == core::transport::State::Reconnecting);
    (void)drain(mgr);

    MockWebSocket::clear_sent();
    TEST_CHECK(mgr.send(R"({"type":"custom"})").code == ErrorCode::NotConnected);
    TEST_CHECK(mgr.ping().code == ErrorCode::NotConnected);

    mgr.poll(t0);
    const auto events = drain(mgr);
    TEST_CHECK(!has_event(events, EventType::Error));
    TEST_CHECK(MockWebSocket::sent().empty());

    // Nothing resurfaces after the reconnect either
    mgr.poll(t0 + 2s);
    TEST_CHECK(mgr.is_connected());
    TEST_CHECK(!was_sent(R"({"type":"custom"})"));
    TEST_CHECK(!has_event(drain(mgr), EventType::Error));

    std::cout << "[TEST] OK\n";
}

void test_full_channel_caller_driven() {
    std::cout << "[TEST] Group K8: full command channel without a loop thread\n";
    MockWebSocket::reset();
    Config cfg = make_config();
    cfg.command_channel_capacity = 1;
    Manager mgr{cfg};

    TEST_CHECK(mgr.open().ok());
    mgr.poll(clock_type::now());
    (void)drain(mgr);
    MockWebSocket::clear_sent();

    TEST_CHECK(mgr.subscribe(Subscription::books({"ob1"})).ok());
    // The channel is full: the first command goes out before the second is queued
    TEST_CHECK(mgr.subscribe(Subscription::books({"ob2"})).ok());
    TEST_CHECK(MockWebSocket::sent().size() == 1);
    TEST_CHECK(MockWebSocket::sent()[0] == to_json(Subscription::books({"ob1"}), Method::Subscribe));

    // Channel still full with the second subscribe
    TEST_CHECK(mgr.disconnect().ok());
    TEST_CHECK(!mgr.is_running());
    TEST_CHECK(mgr.state() == core::transport::State::Disconnected);
    TEST_CHECK(mgr.registry().empty());
    TEST_CHECK(was_sent(to_json(Subscription::books({"ob2"}), Method::Subscribe)));
    TEST_CHECK(has_event(drain(mgr), EventType::Disconnected));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_preconditions();
    test_subscriptions();
    test_user_replacement();
    test_routing_and_pong();
    test_reconnect_replay();
    test_rate_limited_close();
    test_gap_policy();
    test_disconnect();
    test_threaded_session();
    test_raw_frames_while_reconnecting();
    test_full_channel_caller_driven();

    std::cout << "\n[GROUP K - CONNECTION MANAGER TESTS PASSED]\n";
    return 0;
}

/*
===============================================================================
 transport::Connection - Group J Unit Tests
===============================================================================

Scope:
------
Logical connection state machine driven by MockWebSocket and an explicit
clock passed to poll(now).

Covered Requirements:
---------------------
J1. open()
    - invalid URL and wrong state are rejected
    - an initial connect failure returns the error, emits nothing, never retries

J2. Local close
    - emits Disconnected(code, reason) once, idempotent
    - frames are only delivered while Connected

J3. Remote close / transport error
    - close 1008: RateLimited, Disconnected, Reconnecting (in that order)
    - error: Disconnected(1006), Reconnecting; no RateLimited
    - the retry timer reconnects and bumps the epoch

J4. Liveness
    - ping payload sent every ping_interval
    - a pong clears the pending ping
    - no pong within pong_timeout: PingTimeout, Disconnected, Reconnecting

J5. Termination
    - exhausted attempts: MaxReconnectReached, Disconnected
    - auto_reconnect == false: terminal Disconnected
    - close() during Reconnecting cancels the retry

Non-Goals:
----------
- Real network I/O
- Protocol routing (connection manager tests)

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "lightsync/core/channel/wakeup.hpp"
#include "lightsync/core/transport/connection.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

using namespace lightsync::core;
using namespace lightsync::core::transport;
using namespace std::chrono_literals;
using test::MockWebSocket;
using connection::Signal;
using connection::SignalKind;

using TestConnection = Connection<MockWebSocket>;
using clock_type = TestConnection::clock;

static constexpr const char* URL = "wss://ws.lightcone.test/ws";
static constexpr const char* PING = R"({"type":"ping"})";


static connection::Config make_config() {
    connection::Config cfg;
    cfg.reconnect_attempts = 3;
    cfg.base_delay = 100ms;
    cfg.max_delay = 1000ms;
    cfg.ping_interval = 1000ms;
    cfg.pong_timeout = 1500ms;
    return cfg;
}

static std::vector<Signal> drain(TestConnection& conn) {
    std::vector<Signal> out;
    Signal sig;
    while (conn.poll_signal(sig)) {
        out.push_back(sig);
    }
    return out;
}


// -----------------------------------------------------------------------------
// Group J1: open()
// -----------------------------------------------------------------------------
void test_open() {
    std::cout << "[TEST] Group J1: open()\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    TestConnection conn{wakeup, make_config(), PING};

    TEST_CHECK(conn.open("http://nope") == Error::InvalidUrl);
    TEST_CHECK(conn.state() == State::Disconnected);
    TEST_CHECK(MockWebSocket::connect_calls() == 0);

    // Initial failure: surfaced, no retry cycle, no signals
    MockWebSocket::script_connect({Error::ConnectionFailed});
    TEST_CHECK(conn.open(URL) == Error::ConnectionFailed);
    TEST_CHECK(conn.state() == State::Disconnected);
    TEST_CHECK(drain(conn).empty());
    conn.poll(clock_type::now() + 1h);
    TEST_CHECK(MockWebSocket::connect_calls() == 1);
    TEST_CHECK(conn.epoch() == 0);

    TEST_CHECK(conn.open(URL) == Error::None);
    TEST_CHECK(conn.is_connected());
    TEST_CHECK(conn.epoch() == 1);
    TEST_CHECK(MockWebSocket::last_url().host == "ws.lightcone.test");
    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 1);
    TEST_CHECK(sigs[0].kind == SignalKind::Connected);

    TEST_CHECK(conn.open(URL) == Error::InvalidState);
    TEST_CHECK(MockWebSocket::connect_calls() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group J2: local close
// -----------------------------------------------------------------------------
void test_local_close() {
    std::cout << "[TEST] Group J2: local close\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    TestConnection conn{wakeup, make_config(), PING};

    TEST_CHECK(conn.open(URL) == Error::None);
    (void)drain(conn);

    TEST_CHECK(conn.send("hello"));
    TEST_CHECK(MockWebSocket::sent().size() == 1);
    TEST_CHECK(MockWebSocket::sent()[0] == "hello");

    MockWebSocket::current()->emit_message("frame-1");
    std::string msg;
    TEST_CHECK(conn.poll_message(msg));
    TEST_CHECK(msg == "frame-1");
    TEST_CHECK(!conn.poll_message(msg));

    conn.close();
    TEST_CHECK(conn.state() == State::Disconnected);
    TEST_CHECK(MockWebSocket::close_count() == 1);
    TEST_CHECK(MockWebSocket::last_close_code() == websocket::CLOSE_NORMAL);
    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 1);
    TEST_CHECK(sigs[0].kind == SignalKind::Disconnected);
    TEST_CHECK(sigs[0].close_code == websocket::CLOSE_NORMAL);
    TEST_CHECK(sigs[0].reason == "client disconnect");

    // Idempotent
    conn.close();
    TEST_CHECK(drain(conn).empty());
    TEST_CHECK(!conn.send("late"));
    TEST_CHECK(!conn.poll_message(msg));
    TEST_CHECK(conn.next_deadline() == clock_type::time_point::max());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group J3: remote close and transport errors
// -----------------------------------------------------------------------------
void test_remote_close_rate_limited() {
    std::cout << "[TEST] Group J3: remote close 1008 and reconnect\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    TestConnection conn{wakeup, make_config(), PING};
    conn.seed(7);

    TEST_CHECK(conn.open(URL) == Error::None);
    (void)drain(conn);
    const auto t0 = clock_type::now();

    MockWebSocket::current()->emit_close(websocket::CLOSE_POLICY, "too many requests");
    conn.poll(t0);

    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 3);
    TEST_CHECK(sigs[0].kind == SignalKind::RateLimited);
    TEST_CHECK(sigs[0].close_code == websocket::CLOSE_POLICY);
    TEST_CHECK(sigs[1].kind == SignalKind::Disconnected);
    TEST_CHECK(sigs[1].close_code == websocket::CLOSE_POLICY);
    TEST_CHECK(sigs[1].reason == "too many requests");
    TEST_CHECK(sigs[2].kind == SignalKind::Reconnecting);
    TEST_CHECK(sigs[2].attempt == 1);
    TEST_CHECK(conn.state() == State::Reconnecting);

    // First delay is bounded by base_delay
    TEST_CHECK(conn.next_retry() <= t0 + 100ms);
    TEST_CHECK(conn.next_deadline() == conn.next_retry());

    conn.poll(t0 + 1000ms);
    TEST_CHECK(conn.is_connected());
    TEST_CHECK(conn.epoch() == 2);
    TEST_CHECK(conn.retry_attempt() == 0);
    TEST_CHECK(MockWebSocket::connect_calls() == 2);
    sigs = drain(conn);
    TEST_CHECK(sigs.size() == 1);
    TEST_CHECK(sigs[0].kind == SignalKind::Connected);

    std::cout << "[TEST] OK\n";
}

void test_transport_error() {
    std::cout << "[TEST] Group J3: transport error\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    TestConnection conn{wakeup, make_config(), PING};

    TEST_CHECK(conn.open(URL) == Error::None);
    (void)drain(conn);

    MockWebSocket::current()->emit_error(Error::TransportFailure);
    conn.poll(clock_type::now());

    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 2);
    TEST_CHECK(sigs[0].kind == SignalKind::Disconnected);
    TEST_CHECK(sigs[0].close_code == websocket::CLOSE_ABNORMAL);
    TEST_CHECK(!sigs[0].reason.empty());
    TEST_CHECK(sigs[1].kind == SignalKind::Reconnecting);
    TEST_CHECK(conn.last_error() == Error::TransportFailure);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group J4: liveness
// -----------------------------------------------------------------------------
void test_ping_pong() {
    std::cout << "[TEST] Group J4: ping / pong / timeout\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    TestConnection conn{wakeup, make_config(), PING};

    TEST_CHECK(conn.open(URL) == Error::None);
    (void)drain(conn);
    const auto t0 = clock_type::now();
    TEST_CHECK(conn.next_deadline() <= t0 + 1000ms);

    // First tick: ping sent
    conn.poll(t0 + 1000ms);
    TEST_CHECK(MockWebSocket::sent().size() == 1);
    TEST_CHECK(MockWebSocket::sent()[0] == PING);
    TEST_CHECK(conn.awaiting_pong());

    conn.on_pong(t0 + 1100ms);
    TEST_CHECK(!conn.awaiting_pong());

    // Second tick: pong was recent, ping again
    conn.poll(t0 + 2000ms);
    TEST_CHECK(MockWebSocket::sent().size() == 2);
    TEST_CHECK(conn.is_connected());
    TEST_CHECK(drain(conn).empty());

    // Third tick: 1900ms since last pong > pong_timeout
    conn.poll(t0 + 3000ms);
    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 3);
    TEST_CHECK(sigs[0].kind == SignalKind::PingTimeout);
    TEST_CHECK(sigs[1].kind == SignalKind::Disconnected);
    TEST_CHECK(sigs[1].close_code == 0);
    TEST_CHECK(sigs[1].reason == "ping timeout");
    TEST_CHECK(sigs[2].kind == SignalKind::Reconnecting);
    TEST_CHECK(conn.state() == State::Reconnecting);
    TEST_CHECK(MockWebSocket::last_close_code() == websocket::CLOSE_GOING_AWAY);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group J5: termination
// -----------------------------------------------------------------------------
void test_max_reconnect() {
    std::cout << "[TEST] Group J5: reconnect attempts exhausted\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    auto cfg = make_config();
    cfg.reconnect_attempts = 2;
    TestConnection conn{wakeup, cfg, PING};

    MockWebSocket::script_connect({Error::None, Error::ConnectionFailed, Error::HandshakeFailed});
    TEST_CHECK(conn.open(URL) == Error::None);
    (void)drain(conn);
    const auto t0 = clock_type::now();

    MockWebSocket::current()->emit_close(websocket::CLOSE_GOING_AWAY, "restart");
    conn.poll(t0);
    conn.poll(t0 + 10s);
    conn.poll(t0 + 20s);

    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 5);
    TEST_CHECK(sigs[0].kind == SignalKind::Disconnected);
    TEST_CHECK(sigs[1].kind == SignalKind::Reconnecting && sigs[1].attempt == 1);
    TEST_CHECK(sigs[2].kind == SignalKind::Reconnecting && sigs[2].attempt == 2);
    TEST_CHECK(sigs[3].kind == SignalKind::MaxReconnectReached && sigs[3].attempt == 2);
    TEST_CHECK(sigs[4].kind == SignalKind::Disconnected);
    TEST_CHECK(sigs[4].reason == "max reconnect attempts reached");
    TEST_CHECK(conn.state() == State::Disconnected);
    TEST_CHECK(MockWebSocket::connect_calls() == 3);

    // Terminal: no further attempts
    conn.poll(t0 + 1h);
    TEST_CHECK(MockWebSocket::connect_calls() == 3);

    std::cout << "[TEST] OK\n";
}

void test_auto_reconnect_disabled() {
    std::cout << "[TEST] Group J5: auto_reconnect disabled\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    auto cfg = make_config();
    cfg.auto_reconnect = false;
    TestConnection conn{wakeup, cfg, PING};

    TEST_CHECK(conn.open(URL) == Error::None);
    (void)drain(conn);

    MockWebSocket::current()->emit_close(websocket::CLOSE_NORMAL, "bye");
    conn.poll(clock_type::now());

    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 1);
    TEST_CHECK(sigs[0].kind == SignalKind::Disconnected);
    TEST_CHECK(sigs[0].reason == "bye");
    TEST_CHECK(conn.state() == State::Disconnected);

    // A new session may be opened afterwards
    TEST_CHECK(conn.open(URL) == Error::None);
    TEST_CHECK(conn.epoch() == 2);

    std::cout << "[TEST] OK\n";
}

void test_close_while_reconnecting() {
    std::cout << "[TEST] Group J5: close() while reconnecting\n";
    MockWebSocket::reset();
    channel::Wakeup wakeup;
    TestConnection conn{wakeup, make_config(), PING};

    TEST_CHECK(conn.open(URL) == Error::None);
    (void)drain(conn);
    const auto t0 = clock_type::now();

    MockWebSocket::current()->emit_close(websocket::CLOSE_GOING_AWAY, {});
    conn.poll(t0);
    TEST_CHECK(conn.state() == State::Reconnecting);
    (void)drain(conn);

    conn.close();
    TEST_CHECK(conn.state() == State::Disconnected);
    auto sigs = drain(conn);
    TEST_CHECK(sigs.size() == 1);
    TEST_CHECK(sigs[0].kind == SignalKind::Disconnected);

    conn.poll(t0 + 1h);
    TEST_CHECK(MockWebSocket::connect_calls() == 1);
    TEST_CHECK(drain(conn).empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_open();
    test_local_close();
    test_remote_close_rate_limited();
    test_transport_error();
    test_ping_pong();
    test_max_reconnect();
    test_auto_reconnect_disabled();
    test_close_while_reconnecting();

    std::cout << "\n[GROUP J - CONNECTION TESTS PASSED]\n";
    return 0;
}

#include "lightsync/core/transport/beast/websocket.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include "lcr/log/logger.hpp"


namespace lightsync::core::transport::beast {

namespace {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace ws  = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

// Bound on the closing handshake once the stream is open
constexpr std::chrono::seconds CLOSE_TIMEOUT{5};

inline Error map_connect_error_(const boost::beast::error_code& ec, Error fallback) noexcept {
    if (ec == boost::beast::error::timeout) {
        return Error::Timeout;
    }
    return fallback;
}

inline Error map_receive_error_(const boost::beast::error_code& ec) noexcept {
    if (ec == boost::beast::error::timeout) {
        LS_WARN("[WS] Receive timeout");
        return Error::Timeout;
    }
    if (ec == net::error::eof || ec == net::error::connection_reset ||
        ec == net::error::connection_aborted || ec == ssl::error::stream_truncated) {
        LS_INFO("[WS] Connection closed by peer");
        return Error::RemoteClosed;
    }
    LS_ERROR("[WS] Receive failed: " << ec.message());
    return Error::TransportFailure;
}

} // namespace


// -----------------------------------------------------------------------------
// Session: one stream, one io_context, one receive thread
// -----------------------------------------------------------------------------
class WebSocket::Session {
public:
    virtual ~Session() = default;

    [[nodiscard]]
    virtual Error connect(const ParsedUrl& url, const websocket::Options& options) noexcept = 0;

    [[nodiscard]]
    virtual bool send(std::string_view text) noexcept = 0;

    virtual void close(std::uint16_t code, std::string_view reason) noexcept = 0;
};

namespace {

template<bool Secure>
class SessionImpl final : public WebSocket::Session {
    using next_layer_type = std::conditional_t<Secure,
                                               boost::beast::ssl_stream<boost::beast::tcp_stream>,
                                               boost::beast::tcp_stream>;
    using stream_type = ws::stream<next_layer_type>;

public:
    explicit SessionImpl(websocket::Inbox& inbox)
        : inbox_(inbox)
    {}

    ~SessionImpl() override {
        close(websocket::CLOSE_NORMAL, {});
    }

    Error connect(const ParsedUrl& url, const websocket::Options& options) noexcept override {
        try {
            return connect_(url, options);
        } catch (const std::exception& e) {
            LS_ERROR("[WS] connect() failed: " << e.what());
            return Error::TransportFailure;
        }
    }

    bool send(std::string_view text) noexcept override {
        if (!running_.load(std::memory_order_acquire) || closed_.load(std::memory_order_acquire)) {
            LS_ERROR("[WS] send() called on a transport that is not open");
            return false;
        }
        try {
            LS_TRACE("[WS] Sending message ... (size " << text.size() << ")");
            net::post(ioc_, [this, msg = std::string(text)]() mutable {
                write_queue_.push_back(std::move(msg));
                if (write_queue_.size() == 1) {
                    do_write_();
                }
            });
        } catch (const std::exception& e) {
            LS_ERROR("[WS] send() failed: " << e.what());
            return false;
        }
        return true;
    }

    void close(std::uint16_t code, std::string_view reason) noexcept override {
        if (!thread_.joinable()) {
            return;
        }
        // A local close never produces a Close event
        local_close_.store(true, std::memory_order_release);
        closed_.store(true, std::memory_order_release);
        try {
            LS_TRACE("[WS] Closing WebSocket ...");
            net::post(ioc_, [this, code, reason = std::string(reason)]() {
                if (write_queue_.empty()) {
                    do_close_(code, reason);
                } else {
                    pending_close_.emplace(code, reason);
                }
            });
        } catch (const std::exception& e) {
            LS_ERROR("[WS] close() could not schedule the closing handshake: " << e.what());
            ioc_.stop();
        }
        thread_.join();
        running_.store(false, std::memory_order_release);
        LS_TRACE("[WS] WebSocket closed.");
    }

private:
    websocket::Inbox& inbox_;
    net::io_context ioc_;
    ssl::context ssl_ctx_{ssl::context::tlsv12_client};
    std::unique_ptr<stream_type> ws_;
    boost::beast::flat_buffer buffer_;

    std::deque<std::string> write_queue_;                          // receive thread only
    std::optional<std::pair<std::uint16_t, std::string>> pending_close_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};       // Close delivered or locally requested
    std::atomic<bool> local_close_{false};

    inline std::unique_ptr<stream_type> make_stream_() {
        if constexpr (Secure) {
            return std::make_unique<stream_type>(ioc_, ssl_ctx_);
        } else {
            return std::make_unique<stream_type>(ioc_);
        }
    }

    // Runs the io_context on the calling thread until the pending operation completes
    inline void run_once_() {
        ioc_.run();
        ioc_.restart();
    }

    inline Error connect_(const ParsedUrl& url, const websocket::Options& options) {
        // One budget for resolve, TCP, TLS and the HTTP upgrade
        const auto deadline = std::chrono::steady_clock::now() + options.connect_timeout;
        boost::beast::error_code ec;

        if constexpr (Secure) {
            ssl_ctx_.set_default_verify_paths(ec);
            if (ec) {
                LS_WARN("[WS] Could not load the default certificate store: " << ec.message());
            }
            ssl_ctx_.set_verify_mode(ssl::verify_peer);
        }
        ws_ = make_stream_();

        // 1) Resolve
        tcp::resolver resolver(ioc_);
        tcp::resolver::results_type endpoints;
        net::steady_timer resolve_timer(ioc_);
        bool resolve_timed_out = false;
        resolve_timer.expires_at(deadline);
        resolve_timer.async_wait([&](const boost::beast::error_code& e) {
            if (!e) {
                resolve_timed_out = true;
                resolver.cancel();
            }
        });
        resolver.async_resolve(url.host, url.port,
            [&](const boost::beast::error_code& e, tcp::resolver::results_type r) {
                ec = e;
                endpoints = std::move(r);
                resolve_timer.cancel();
            });
        run_once_();
        if (resolve_timed_out) {
            LS_ERROR("[WS] Resolve timed out for " << url.host);
            return Error::Timeout;
        }
        if (ec) {
            LS_ERROR("[WS] Resolve failed for " << url.host << ": " << ec.message());
            return Error::ConnectionFailed;
        }

        // 2) TCP connect
        auto& lowest = boost::beast::get_lowest_layer(*ws_);
        lowest.expires_at(deadline);
        lowest.async_connect(endpoints, [&](const boost::beast::error_code& e, const tcp::endpoint&) { ec = e; });
        run_once_();
        if (ec) {
            LS_ERROR("[WS] TCP connect failed: " << ec.message());
            return map_connect_error_(ec, Error::ConnectionFailed);
        }

        // 3) TLS handshake (SNI + host name verification)
        if constexpr (Secure) {
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url.host.c_str())) {
                LS_ERROR("[WS] Failed to set SNI host name");
                return Error::HandshakeFailed;
            }
            ws_->next_layer().set_verify_callback(ssl::host_name_verification(url.host));
            ws_->next_layer().async_handshake(ssl::stream_base::client,
                [&](const boost::beast::error_code& e) { ec = e; });
            run_once_();
            if (ec) {
                LS_ERROR("[WS] TLS handshake failed: " << ec.message());
                return map_connect_error_(ec, Error::HandshakeFailed);
            }
        }

        // 4) HTTP upgrade; the websocket layer owns timeouts from here on
        const auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            LS_ERROR("[WS] Connect timeout expired before the WebSocket upgrade");
            return Error::Timeout;
        }
        lowest.expires_never();
        ws_->set_option(ws::stream_base::timeout{remaining, ws::stream_base::none(), false});
        ws_->set_option(ws::stream_base::decorator(
            [user_agent = options.user_agent, headers = options.headers](ws::request_type& req) {
                req.set(boost::beast::http::field::user_agent, user_agent);
                for (const auto& [name, value] : headers) {
                    req.set(name, value);
                }
            }));
        ws_->text(true);

        const bool default_port = (url.secure && url.port == "443") || (!url.secure && url.port == "80");
        const std::string host = default_port ? url.host : url.host + ":" + url.port;
        ws_->async_handshake(host, url.path, [&](const boost::beast::error_code& e) { ec = e; });
        run_once_();
        if (ec) {
            LS_ERROR("[WS] WebSocket upgrade failed: " << ec.message());
            return map_connect_error_(ec, Error::HandshakeFailed);
        }
        ws_->set_option(ws::stream_base::timeout{CLOSE_TIMEOUT, ws::stream_base::none(), false});

        // 5) Hand the stream to the receive thread
        running_.store(true, std::memory_order_release);
        do_read_();
        thread_ = std::thread([this] { run_(); });
        LS_DEBUG("[WS] Connected to " << host << url.path);
        return Error::None;
    }

    inline void run_() noexcept {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            LS_ERROR("[WS] Receive loop terminated: " << e.what());
            fail_(Error::TransportFailure, e.what());
        }
    }

    inline void do_read_() {
        ws_->async_read(buffer_, [this](const boost::beast::error_code& ec, std::size_t bytes) {
            on_read_(ec, bytes);
        });
    }

    inline void on_read_(const boost::beast::error_code& ec, std::size_t bytes) {
        if (ec == ws::error::closed) {
            if (local_close_.load(std::memory_order_acquire)) {
                return;
            }
            const auto& cr = ws_->reason();
            const auto code = static_cast<std::uint16_t>(cr.code);
            LS_INFO("[WS] Received WebSocket close frame (code " << code << ")");
            signal_close_(code, std::string(cr.reason.data(), cr.reason.size()));
            return;
        }
        if (ec) {
            if (local_close_.load(std::memory_order_acquire) || ec == net::error::operation_aborted) {
                return;
            }
            fail_(map_receive_error_(ec), ec.message());
            return;
        }
        LS_TRACE("[WS] Received message (size " << bytes << ")");
        inbox_.push_message(boost::beast::buffers_to_string(buffer_.data()));
        buffer_.consume(buffer_.size());
        do_read_();
    }

    inline void do_write_() {
        ws_->async_write(net::buffer(write_queue_.front()),
            [this](const boost::beast::error_code& ec, std::size_t) {
                if (ec) {
                    if (!local_close_.load(std::memory_order_acquire) && ec != net::error::operation_aborted) {
                        LS_ERROR("[WS] Write failed: " << ec.message());
                        fail_(Error::TransportFailure, ec.message());
                    }
                    return;
                }
                write_queue_.pop_front();
                if (!write_queue_.empty()) {
                    do_write_();
                } else if (pending_close_) {
                    auto [code, reason] = std::move(*pending_close_);
                    pending_close_.reset();
                    do_close_(code, reason);
                }
            });
    }

    inline void do_close_(std::uint16_t code, const std::string& reason) {
        ws::close_reason close_reason(code);
        close_reason.reason = reason;
        ws_->async_close(close_reason, [this](const boost::beast::error_code& ec) {
            if (ec && ec != net::error::operation_aborted) {
                LS_DEBUG("[WS] Closing handshake failed: " << ec.message());
            }
            boost::beast::error_code ignored;
            boost::beast::get_lowest_layer(*ws_).socket().close(ignored);
        });
    }

    // Error first, then exactly one Close
    inline void fail_(Error error, const std::string& reason) {
        if (closed_.load(std::memory_order_acquire)) {
            return;
        }
        inbox_.push_event(websocket::Event::make_error(error));
        signal_close_(websocket::CLOSE_ABNORMAL, reason);
    }

    inline void signal_close_(std::uint16_t code, std::string reason) {
        if (closed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        inbox_.push_event(websocket::Event::make_close(code, std::move(reason)));
    }
};

} // namespace


WebSocket::WebSocket(channel::Wakeup& wakeup)
    : inbox_(wakeup)
{}

WebSocket::~WebSocket() {
    close(websocket::CLOSE_NORMAL, {});
}

Error WebSocket::connect(const ParsedUrl& url, const websocket::Options& options) noexcept {
    if (session_) {
        LS_ERROR("[WS] connect() called twice on the same transport");
        return Error::InvalidState;
    }
    try {
        if (url.secure) {
            session_ = std::make_unique<SessionImpl<true>>(inbox_);
        } else {
            session_ = std::make_unique<SessionImpl<false>>(inbox_);
        }
    } catch (const std::exception& e) {
        LS_ERROR("[WS] Failed to create session: " << e.what());
        return Error::TransportFailure;
    }
    return session_->connect(url, options);
}

void WebSocket::close(std::uint16_t code, std::string_view reason) noexcept {
    if (session_) {
        session_->close(code, reason);
    }
}

bool WebSocket::send(std::string_view text) noexcept {
    if (!session_) {
        LS_ERROR("[WS] send() called on unconnected WebSocket");
        return false;
    }
    return session_->send(text);
}

} // namespace lightsync::core::transport::beast

#include "gwpp/transport/websocket_transport.hpp"
#include "gwpp/log/logger.hpp"
#include "gwpp/security/gateway_url.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <deque>
#include <format>
#include <optional>
#include <thread>
#include <type_traits>

namespace gwpp {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

TransportError make_error(TransportError::Category category, std::string_view step, beast::error_code ec) {
    if (ec == beast::error::timeout) {
        category = TransportError::Category::Timeout;
    }
    return TransportError{category, std::format("{}: {}", step, ec.message())};
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection
// ─────────────────────────────────────────────────────────────────────────────
// Lives on the transport's I/O thread. Every member function below runs
// there, so none of the state needs locking except the shared ready state.

class ConnectionBase {
public:
    virtual ~ConnectionBase() = default;
    virtual void start() = 0;
    virtual void enqueue(std::string text) = 0;
    virtual void shutdown(std::uint16_t code, std::string reason) = 0;
    virtual void detach() = 0;
};

template <typename Stream>
class Connection final
    : public ConnectionBase
    , public std::enable_shared_from_this<Connection<Stream>> {
public:
    static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

    template <typename... StreamArgs>
    Connection(
        net::io_context& ioc,
        security::GatewayEndpoint endpoint,
        const WebSocketTransportConfig& config,
        TransportHandlers handlers,
        std::atomic<ReadyState>& state,
        StreamArgs&&... stream_args
    )
        : resolver_(ioc)
        , ws_(std::forward<StreamArgs>(stream_args)...)
        , endpoint_(std::move(endpoint))
        , config_(config)
        , handlers_(std::move(handlers))
        , state_(state)
    {}

    void start() override {
        GWPP_LOG_DEBUG(std::format("Resolving {}:{}", endpoint_.host, endpoint_.port));
        resolver_.async_resolve(
            endpoint_.host,
            endpoint_.port,
            beast::bind_front_handler(&Connection::on_resolve, this->shared_from_this())
        );
    }

    void enqueue(std::string text) override {
        if (!open_ || closing_ || closed_) {
            GWPP_LOG_DEBUG("Dropping outbound message: socket not open");
            return;
        }
        queue_.push_back(std::move(text));
        if (!writing_) {
            do_write();
        }
    }

    void shutdown(std::uint16_t code, std::string reason) override {
        if (closing_ || closed_) {
            return;
        }
        closing_ = true;
        state_.store(ReadyState::Closing);

        if (!open_) {
            // Still connecting: abort and report the close right away
            beast::error_code ignored;
            resolver_.cancel();
            beast::get_lowest_layer(ws_).socket().close(ignored);
            report_close(close_code::Abnormal, {}, false);
            return;
        }

        close_reason_ = websocket::close_reason(static_cast<websocket::close_code>(code), reason);
        if (!writing_) {
            do_close();
        }
    }

    void detach() override {
        handlers_ = {};
    }

private:
    // ── Connect sequence ────────────────────────────────────────────────────

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail(make_error(TransportError::Category::Network, "resolve", ec));
        }
        beast::get_lowest_layer(ws_).expires_after(config_.connect_timeout);
        beast::get_lowest_layer(ws_).async_connect(
            results,
            beast::bind_front_handler(&Connection::on_connect, this->shared_from_this())
        );
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            return fail(make_error(TransportError::Category::Network, "connect", ec));
        }

        if constexpr (kTls) {
            // SNI, required by most TLS front ends
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str())) {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                return fail(make_error(TransportError::Category::Tls, "sni", sni_ec));
            }
            if (config_.tls.verify_peer) {
                ws_.next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
            }
            beast::get_lowest_layer(ws_).expires_after(config_.connect_timeout);
            ws_.next_layer().async_handshake(
                ssl::stream_base::client,
                beast::bind_front_handler(&Connection::on_tls_handshake, this->shared_from_this())
            );
        } else {
            do_upgrade();
        }
    }

    void on_tls_handshake(beast::error_code ec) {
        if (ec) {
            return fail(make_error(TransportError::Category::Tls, "tls handshake", ec));
        }
        do_upgrade();
    }

    void do_upgrade() {
        // The websocket stream applies its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();

        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = config_.handshake_timeout;
        ws_.set_option(timeouts);

        ws_.set_option(websocket::stream_base::decorator(
            [agent = config_.user_agent, headers = config_.headers](websocket::request_type& req) {
                if (!agent.empty()) {
                    req.set(http::field::user_agent, agent);
                }
                for (const auto& [name, value] : headers) {
                    req.set(name, value);
                }
            }
        ));

        if (config_.max_message_size > 0) {
            ws_.read_message_max(config_.max_message_size);
        }
        ws_.text(true);

        ws_.async_handshake(
            endpoint_.host_header,
            endpoint_.target,
            beast::bind_front_handler(&Connection::on_upgrade, this->shared_from_this())
        );
    }

    void on_upgrade(beast::error_code ec) {
        if (ec) {
            return fail(make_error(TransportError::Category::Protocol, "websocket handshake", ec));
        }
        if (closing_ || closed_) {
            return;
        }

        open_ = true;
        state_.store(ReadyState::Open);
        GWPP_LOG_DEBUG("WebSocket open: " + endpoint_.url);
        if (handlers_.on_open) {
            handlers_.on_open();
        }
        do_read();
    }

    // ── Read loop ───────────────────────────────────────────────────────────

    void do_read() {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(&Connection::on_read, this->shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == websocket::error::closed) {
            return report_remote_close();
        }
        if (ec) {
            if (closing_ && ec == net::error::operation_aborted) {
                return;  // on_closed reports this one
            }
            return fail(make_error(TransportError::Category::Network, "read", ec));
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (handlers_.on_message && !closed_) {
            handlers_.on_message(std::move(text));
        }
        if (!closed_) {
            do_read();
        }
    }

    // ── Write queue ─────────────────────────────────────────────────────────

    void do_write() {
        writing_ = true;
        ws_.async_write(
            net::buffer(queue_.front()),
            beast::bind_front_handler(&Connection::on_write, this->shared_from_this())
        );
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) {
            return fail(make_error(TransportError::Category::Network, "write", ec));
        }
        queue_.pop_front();

        if (close_reason_ && !close_started_) {
            do_close();
        } else if (!queue_.empty() && !closing_) {
            do_write();
        }
    }

    // ── Close ───────────────────────────────────────────────────────────────

    void do_close() {
        close_started_ = true;
        ws_.async_close(
            *close_reason_,
            beast::bind_front_handler(&Connection::on_closed, this->shared_from_this())
        );
    }

    void on_closed(beast::error_code ec) {
        if (ec) {
            GWPP_LOG_DEBUG("Closing handshake failed: " + ec.message());
            return report_close(close_code::Abnormal, {}, false);
        }
        report_remote_close();
    }

    void report_remote_close() {
        const auto& reason = ws_.reason();
        if (reason.code == websocket::close_code::none) {
            return report_close(close_code::NoStatus, {}, true);
        }
        report_close(
            static_cast<std::uint16_t>(reason.code),
            std::string(reason.reason.data(), reason.reason.size()),
            true
        );
    }

    void fail(TransportError error) {
        if (closed_) {
            return;
        }
        GWPP_LOG_DEBUG("WebSocket failure: " + error.message);
        if (handlers_.on_error) {
            handlers_.on_error(error);
        }
        report_close(close_code::Abnormal, {}, false);
    }

    void report_close(std::uint16_t code, std::string reason, bool was_clean) {
        if (closed_) {
            return;
        }
        closed_ = true;
        state_.store(ReadyState::Closed);

        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);

        if (handlers_.on_close) {
            handlers_.on_close(CloseEvent{code, std::move(reason), was_clean});
        }
    }

    tcp::resolver resolver_;
    websocket::stream<Stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> queue_;

    security::GatewayEndpoint endpoint_;
    const WebSocketTransportConfig& config_;
    TransportHandlers handlers_;
    std::atomic<ReadyState>& state_;

    std::optional<websocket::close_reason> close_reason_;
    bool open_{false};
    bool writing_{false};
    bool closing_{false};
    bool close_started_{false};
    bool closed_{false};
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// WebSocketTransport
// ═══════════════════════════════════════════════════════════════════════════

struct WebSocketTransport::Impl {
    // Declared first so it outlives the connection destroyed with the io_context
    std::atomic<ReadyState> state{ReadyState::Closed};

    std::string url;
    WebSocketTransportConfig config;
    bool opened{false};

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::optional<ssl::context> ssl_ctx;
    std::shared_ptr<ConnectionBase> connection;
    std::thread thread;

    Impl(std::string u, WebSocketTransportConfig c)
        : url(std::move(u))
        , config(std::move(c))
    {}

    // Reports a failure that happened before any socket existed, in the same
    // order a connection would: error, then close.
    void fail_early(TransportHandlers handlers, TransportError error) {
        state.store(ReadyState::Closed);
        net::post(ioc, [handlers = std::move(handlers), error = std::move(error)]() {
            if (handlers.on_error) {
                handlers.on_error(error);
            }
            if (handlers.on_close) {
                handlers.on_close(CloseEvent{close_code::Abnormal, {}, false});
            }
        });
    }

    std::optional<TransportError> prepare_tls() {
        try {
            ssl_ctx.emplace(ssl::context::tls_client);
            if (config.tls.verify_peer) {
                ssl_ctx->set_verify_mode(ssl::verify_peer);
                if (config.tls.ca_cert_path.empty()) {
                    ssl_ctx->set_default_verify_paths();
                } else {
                    ssl_ctx->load_verify_file(config.tls.ca_cert_path);
                }
            } else {
                GWPP_LOG_WARN("TLS peer verification disabled for " + url);
                ssl_ctx->set_verify_mode(ssl::verify_none);
            }
        } catch (const boost::system::system_error& e) {
            return TransportError{TransportError::Category::Tls, std::string("tls setup: ") + e.what()};
        }
        return std::nullopt;
    }
};

WebSocketTransport::WebSocketTransport(std::string url, WebSocketTransportConfig config)
    : impl_(std::make_unique<Impl>(std::move(url), std::move(config)))
{}

WebSocketTransport::~WebSocketTransport() {
    if (!impl_->thread.joinable()) {
        return;
    }
    if (impl_->connection) {
        net::post(impl_->ioc, [conn = impl_->connection]() {
            conn->detach();
            conn->shutdown(close_code::GoingAway, {});
        });
    }
    impl_->work.reset();
    impl_->thread.join();
}

void WebSocketTransport::open(TransportHandlers handlers) {
    if (impl_->opened) {
        GWPP_LOG_WARN("WebSocketTransport::open called twice; ignoring");
        return;
    }
    impl_->opened = true;
    impl_->state.store(ReadyState::Connecting);

    impl_->work.emplace(net::make_work_guard(impl_->ioc));
    impl_->thread = std::thread([impl = impl_.get()]() {
        impl->ioc.run();
    });

    auto validation = security::validate_gateway_url(impl_->url);
    if (!validation.is_valid || !validation.endpoint) {
        impl_->fail_early(std::move(handlers), TransportError{
            TransportError::Category::Protocol,
            "invalid gateway URL: " + validation.error.value_or("unknown error")
        });
        return;
    }
    if (validation.warning) {
        GWPP_LOG_WARN(*validation.warning + " (" + impl_->url + ")");
    }

    auto endpoint = std::move(*validation.endpoint);
    if (endpoint.tls) {
        if (auto error = impl_->prepare_tls()) {
            impl_->fail_early(std::move(handlers), std::move(*error));
            return;
        }
        impl_->connection = std::make_shared<Connection<TlsStream>>(
            impl_->ioc, std::move(endpoint), impl_->config, std::move(handlers), impl_->state,
            impl_->ioc, *impl_->ssl_ctx
        );
    } else {
        impl_->connection = std::make_shared<Connection<PlainStream>>(
            impl_->ioc, std::move(endpoint), impl_->config, std::move(handlers), impl_->state,
            impl_->ioc
        );
    }

    net::post(impl_->ioc, [conn = impl_->connection]() { conn->start(); });
}

TransportResult<void> WebSocketTransport::send(std::string text) {
    if (impl_->state.load() != ReadyState::Open || !impl_->connection) {
        return tl::unexpected(TransportError{
            TransportError::Category::Closed,
            std::format("WebSocket is {}", to_string(impl_->state.load()))
        });
    }
    net::post(impl_->ioc, [conn = impl_->connection, text = std::move(text)]() mutable {
        conn->enqueue(std::move(text));
    });
    return {};
}

void WebSocketTransport::close(std::uint16_t code, std::string reason) {
    const auto state = impl_->state.load();
    if (state == ReadyState::Closing || state == ReadyState::Closed || !impl_->connection) {
        return;
    }
    net::post(impl_->ioc, [conn = impl_->connection, code, reason = std::move(reason)]() mutable {
        conn->shutdown(code, std::move(reason));
    });
}

ReadyState WebSocketTransport::ready_state() const noexcept {
    return impl_->state.load();
}

const std::string& WebSocketTransport::url() const noexcept {
    return impl_->url;
}

TransportFactory make_websocket_transport_factory(WebSocketTransportConfig config) {
    return [config = std::move(config)](const std::string& url) -> std::unique_ptr<ITransport> {
        return std::make_unique<WebSocketTransport>(url, config);
    };
}

}  // namespace gwpp

#include "gwpp/client/gateway_session.hpp"
#include "gwpp/client/handshake.hpp"
#include "gwpp/log/logger.hpp"
#include "gwpp/protocol/frame.hpp"
#include "gwpp/security/gateway_url.hpp"
#include "gwpp/transport/websocket_transport.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <format>

namespace gwpp {

namespace {

// Helper to safely invoke caller callbacks with exception protection
template <typename Handler, typename... Args>
void safe_invoke(const char* slot, const Handler& handler, Args&&... args) {
    if (!handler) {
        return;
    }
    try {
        handler(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        GWPP_LOG_ERROR(std::format("Exception in {} callback: {}", slot, e.what()));
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connection Attempt
// ═══════════════════════════════════════════════════════════════════════════
// Everything scoped to one transport instance. Discarded on close; a new
// connect() builds a fresh one, so the handshake guard and the pending table
// never carry over.

struct GatewaySession::Attempt {
    std::uint64_t generation;
    std::unique_ptr<ITransport> transport;
    HandshakeNegotiator handshake;
    asio::steady_timer settle_timer;
    RequestCorrelator requests;

    Attempt(
        std::uint64_t gen,
        std::unique_ptr<ITransport> t,
        HandshakeConfig handshake_config,
        const asio::strand<asio::any_io_executor>& strand
    )
        : generation(gen)
        , transport(std::move(t))
        , handshake(std::move(handshake_config))
        , settle_timer(strand)
    {}
};

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

GatewaySession::GatewaySession(
    asio::any_io_executor executor,
    GatewaySessionConfig config,
    GatewayCallbacks callbacks,
    TransportFactory transport_factory
)
    : config_(std::move(config))
    , transport_factory_(std::move(transport_factory))
    , strand_(asio::make_strand(std::move(executor)))
    , callbacks_(std::move(callbacks))
{
    if (!transport_factory_) {
        transport_factory_ = make_websocket_transport_factory(config_.transport);
    }
}

GatewaySession::~GatewaySession() {
    // Queued strand work sees an expired lifetime and bails out
    lifetime_.reset();

    std::vector<AttemptPtr> attempts = std::exchange(retired_, {});
    if (current_) {
        attempts.push_back(std::exchange(current_, nullptr));
    }

    // No close event will reach these attempts any more
    const auto reason = GatewayError::connection_closed(close_code::GoingAway, "session destroyed");
    for (const auto& attempt : attempts) {
        attempt->settle_timer.cancel();
        const auto failed = attempt->requests.reject_all(reason);
        if (failed > 0) {
            GWPP_LOG_DEBUG(std::format("Failed {} pending request(s): session destroyed", failed));
        }
    }
}

template <typename F>
void GatewaySession::post_to_strand(F&& f) {
    asio::post(strand_, [alive = std::weak_ptr<int>(lifetime_), f = std::forward<F>(f)]() mutable {
        if (alive.expired()) {
            return;
        }
        f();
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

void GatewaySession::connect() {
    post_to_strand([this]() { do_connect(); });
}

void GatewaySession::disconnect() {
    post_to_strand([this]() { do_disconnect(); });
}

void GatewaySession::do_connect() {
    if (!config_.enabled) {
        GWPP_LOG_DEBUG("connect() ignored: session disabled");
        return;
    }
    if (config_.url.empty()) {
        GWPP_LOG_DEBUG("connect() ignored: no gateway URL");
        return;
    }
    if (current_) {
        const auto ready = current_->transport->ready_state();
        if (ready == ReadyState::Connecting || ready == ReadyState::Open) {
            GWPP_LOG_DEBUG("connect() ignored: transport already " + std::string(to_string(ready)));
            return;
        }
        // Closing or already closed with its close event still queued: that
        // event fails the old requests and reports the close.
        retire(std::exchange(current_, nullptr));
    }

    const auto validation = security::validate_gateway_url(config_.url);
    if (!validation.is_valid) {
        GWPP_LOG_ERROR("Invalid gateway URL '" + config_.url + "': " + validation.error.value_or(""));
        notify_error(GatewayError::transport_error(
            "invalid gateway URL: " + validation.error.value_or("unknown error")));
        return;
    }

    auto transport = transport_factory_(config_.url);
    if (!transport) {
        notify_error(GatewayError::transport_error("transport factory returned no transport"));
        return;
    }

    auto attempt = std::make_shared<Attempt>(
        ++next_generation_, std::move(transport), config_.handshake, strand_);
    current_ = attempt;
    set_state(SessionState::Connecting);
    refresh_pending_count();

    GWPP_LOG_INFO(std::format("Connecting to gateway {} (attempt #{})", config_.url, attempt->generation));
    attempt->transport->open(make_transport_handlers(attempt));
}

void GatewaySession::do_disconnect() {
    if (!current_) {
        return;
    }
    auto attempt = std::exchange(current_, nullptr);
    set_state(SessionState::Closed);

    // Pending requests fail when the close event arrives, with its code
    attempt->transport->close(close_code::Normal, {});
    retire(std::move(attempt));
    refresh_pending_count();

    GWPP_LOG_INFO("Gateway session disconnecting");
}

void GatewaySession::retire(AttemptPtr attempt) {
    attempt->settle_timer.cancel();
    retired_.push_back(std::move(attempt));
}

SessionState GatewaySession::state() const noexcept {
    return state_.load();
}

bool GatewaySession::is_connected() const noexcept {
    return state_.load() == SessionState::Connected;
}

std::size_t GatewaySession::pending_requests() const noexcept {
    return pending_count_.load();
}

asio::any_io_executor GatewaySession::get_executor() const {
    return strand_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

void GatewaySession::send(std::string method, Json params, ResponseHandler on_complete) {
    post_to_strand([this, method = std::move(method), params = std::move(params),
                    on_complete = std::move(on_complete)]() mutable {
        issue_request(current_, std::move(method), std::move(params), std::move(on_complete));
    });
}

std::future<GatewayResult<Json>> GatewaySession::send(std::string method, Json params) {
    auto promise = std::make_shared<std::promise<GatewayResult<Json>>>();
    auto future = promise->get_future();
    send(std::move(method), std::move(params), [promise](GatewayResult<Json> result) {
        promise->set_value(std::move(result));
    });
    return future;
}

asio::awaitable<GatewayResult<Json>> GatewaySession::async_send(std::string method, Json params) {
    using ResponseChannel = asio::experimental::channel<
        void(asio::error_code, GatewayResult<Json>)
    >;
    // shared_ptr: the completion may outlive this frame if the caller
    // abandons the coroutine
    auto channel = std::make_shared<ResponseChannel>(strand_, 1);

    send(std::move(method), std::move(params), [channel](GatewayResult<Json> result) {
        channel->try_send(asio::error_code{}, std::move(result));
    });

    try {
        co_return co_await channel->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(GatewayError::transport_error(e.what()));
    }
}

void GatewaySession::issue_request(
    const AttemptPtr& attempt,
    std::string method,
    Json params,
    ResponseHandler on_complete
) {
    if (!attempt || attempt->transport->ready_state() != ReadyState::Open) {
        safe_invoke("completion", on_complete, tl::unexpected(GatewayError::not_connected()));
        return;
    }

    RequestFrame frame;
    frame.id = attempt->requests.next_id();
    frame.method = method;
    if (!params.is_null()) {
        frame.params = std::move(params);
    }

    const auto id = frame.id;
    attempt->requests.track(id, std::move(method), std::move(on_complete));
    refresh_pending_count();

    auto sent = attempt->transport->send(encode_frame(frame));
    if (!sent) {
        GWPP_LOG_WARN("Send failed: " + sent.error().message);
        attempt->requests.reject(id, GatewayError::transport_error(sent.error().message));
        refresh_pending_count();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Transport Events
// ═══════════════════════════════════════════════════════════════════════════

TransportHandlers GatewaySession::make_transport_handlers(const AttemptPtr& attempt) {
    // Handlers may fire on the transport's own thread: hop onto the strand,
    // then drop anything addressed to an attempt that no longer exists.
    std::weak_ptr<Attempt> weak = attempt;

    TransportHandlers handlers;
    handlers.on_open = [this, weak]() {
        post_to_strand([this, weak]() {
            if (auto a = weak.lock()) handle_open(a);
        });
    };
    handlers.on_message = [this, weak](std::string text) {
        post_to_strand([this, weak, text = std::move(text)]() {
            if (auto a = weak.lock()) handle_message(a, text);
        });
    };
    handlers.on_error = [this, weak](const TransportError& error) {
        post_to_strand([this, weak, error]() {
            if (auto a = weak.lock()) handle_error(a, error);
        });
    };
    handlers.on_close = [this, weak](const CloseEvent& event) {
        post_to_strand([this, weak, event]() {
            if (auto a = weak.lock()) handle_close(a, event);
        });
    };
    return handlers;
}

void GatewaySession::handle_open(const AttemptPtr& attempt) {
    if (attempt != current_) {
        return;
    }
    set_state(SessionState::Handshaking);
    GWPP_LOG_INFO("Gateway socket open: " + config_.url);

    std::weak_ptr<Attempt> weak = attempt;
    attempt->settle_timer.expires_after(config_.settle_delay);
    attempt->settle_timer.async_wait([this, weak](asio::error_code ec) {
        if (ec) {
            return;  // Cancelled: challenge arrived first, or the attempt ended
        }
        if (auto a = weak.lock()) {
            send_handshake(a);
        }
    });
}

void GatewaySession::handle_message(const AttemptPtr& attempt, const std::string& text) {
    auto frame = decode_frame(text);
    if (!frame) {
        GWPP_LOG_DEBUG("Dropping malformed frame: " + frame.error().message);
        return;
    }

    // A disconnecting transport still settles its own requests
    if (attempt != current_ && !std::holds_alternative<ResponseFrame>(*frame)) {
        return;
    }

    if (const auto* event = std::get_if<EventFrame>(&*frame)) {
        if (event->event == CHALLENGE_EVENT) {
            send_handshake(attempt);
            return;
        }
        GatewayCallbacks callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks = callbacks_;
        }
        safe_invoke("event", callbacks.on_event,
                    GatewayEvent{event->event, event->payload.value_or(Json{}), event->seq});
        return;
    }

    if (const auto* response = std::get_if<ResponseFrame>(&*frame)) {
        if (!attempt->requests.settle(*response)) {
            GWPP_LOG_DEBUG("Response for unknown request id " + response->id);
        }
        refresh_pending_count();
        return;
    }

    const auto& request = std::get<RequestFrame>(*frame);
    GWPP_LOG_DEBUG("Ignoring server request '" + request.method + "'");
}

void GatewaySession::handle_error(const AttemptPtr& attempt, const TransportError& error) {
    if (attempt != current_) {
        return;
    }
    GWPP_LOG_ERROR("Gateway transport error: " + error.message);
    notify_error(GatewayError::transport_error(error.message));
}

void GatewaySession::handle_close(const AttemptPtr& attempt, const CloseEvent& event) {
    attempt->settle_timer.cancel();

    if (attempt == current_) {
        current_.reset();
        set_state(SessionState::Closed);
    } else {
        // Disconnected or replaced earlier; a newer attempt keeps its state
        std::erase(retired_, attempt);
    }

    const std::string reason = event.reason.empty() ? std::string("closed") : event.reason;
    GWPP_LOG_INFO(std::format("Gateway closed ({}): {} (attempt #{})", event.code, reason, attempt->generation));

    const auto failed = attempt->requests.reject_all(
        GatewayError::connection_closed(event.code, event.reason));
    if (failed > 0) {
        GWPP_LOG_DEBUG(std::format("Failed {} pending request(s) on close", failed));
    }
    refresh_pending_count();

    notify_close(reason);
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

void GatewaySession::send_handshake(const AttemptPtr& attempt) {
    if (attempt != current_) {
        return;
    }
    auto params = attempt->handshake.begin();
    if (!params) {
        return;  // Already sent on this transport
    }
    attempt->settle_timer.cancel();

    GWPP_LOG_INFO(std::format("Sending connect handshake (protocol {})", params->max_protocol));

    std::weak_ptr<Attempt> weak = attempt;
    issue_request(attempt, CONNECT_METHOD, params->to_json(),
        [this, weak](GatewayResult<Json> result) {
            if (auto a = weak.lock()) {
                handle_handshake_result(a, std::move(result));
            }
        });
}

void GatewaySession::handle_handshake_result(const AttemptPtr& attempt, GatewayResult<Json> result) {
    if (attempt != current_) {
        return;  // Failed by close or disconnect; already reported there
    }

    if (result) {
        set_state(SessionState::Connected);
        GWPP_LOG_INFO("Gateway handshake accepted");
        GatewayCallbacks callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks = callbacks_;
        }
        safe_invoke("hello", callbacks.on_hello, *result);
        return;
    }

    const auto rejected = result.error().code == GatewayErrorCode::RequestFailed
        ? GatewayError::handshake_rejected(result.error().message)
        : result.error();

    GWPP_LOG_WARN("Gateway handshake failed: " + rejected.message);
    set_state(SessionState::Closed);
    notify_close(rejected.message);

    // The close event that follows is reported normally
    attempt->transport->close(close_code::HandshakeFailed, "connect failed");
}

// ═══════════════════════════════════════════════════════════════════════════
// Callbacks
// ═══════════════════════════════════════════════════════════════════════════

void GatewaySession::set_callbacks(GatewayCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_ = std::move(callbacks);
}

void GatewaySession::on_event(std::function<void(const GatewayEvent&)> handler) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.on_event = std::move(handler);
}

void GatewaySession::on_hello(std::function<void(const Json&)> handler) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.on_hello = std::move(handler);
}

void GatewaySession::on_close(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.on_close = std::move(handler);
}

void GatewaySession::on_error(std::function<void(const GatewayError&)> handler) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.on_error = std::move(handler);
}

void GatewaySession::notify_error(const GatewayError& error) {
    std::function<void(const GatewayError&)> handler;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        handler = callbacks_.on_error;
    }
    safe_invoke("error", handler, error);
}

void GatewaySession::notify_close(const std::string& reason) {
    std::function<void(const std::string&)> handler;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        handler = callbacks_.on_close;
    }
    safe_invoke("close", handler, reason);
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

void GatewaySession::set_url(std::string url) {
    post_to_strand([this, url = std::move(url)]() mutable {
        config_.url = std::move(url);
    });
}

void GatewaySession::set_enabled(bool enabled) {
    post_to_strand([this, enabled]() {
        config_.enabled = enabled;
    });
}

void GatewaySession::set_credentials(std::optional<std::string> token, std::optional<std::string> password) {
    post_to_strand([this, token = std::move(token), password = std::move(password)]() mutable {
        config_.handshake.token = std::move(token);
        config_.handshake.password = std::move(password);
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

void GatewaySession::set_state(SessionState state) {
    const auto previous = state_.exchange(state);
    if (previous != state) {
        GWPP_LOG_DEBUG(std::format("Session state {} -> {}", to_string(previous), to_string(state)));
    }
}

void GatewaySession::refresh_pending_count() {
    pending_count_.store(current_ ? current_->requests.pending_count() : 0);
}

}  // namespace gwpp

#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Gateway Session
// ═══════════════════════════════════════════════════════════════════════════
// One persistent socket to a gateway, exposed as a request/response channel
// plus a stream of pushed events.
//
// Usage:
//   asio::io_context io;
//   GatewaySession session(io.get_executor(), GatewaySessionConfig::from_env());
//   session.on_hello([](const Json& hello) { ... });
//   session.on_event([](const GatewayEvent& ev) { ... });
//   session.connect();
//
//   session.send("chat.send", {{"sessionKey", "main"}, {"message", "hi"}},
//       [](GatewayResult<Json> result) { ... });
//
//   io.run();
//
// Lifecycle of one connection attempt:
//   connect()  -> transport opens -> settle delay (or connect.challenge)
//              -> "connect" request -> hello -> Connected
//   close      -> every pending request fails with ConnectionClosed
//
// All state lives on a strand of the given executor. Public member functions
// may be called from any thread; they never block and never complete
// inline. Completions and callbacks run on the strand, except for requests
// failed by the destructor, which complete on the destroying thread.

#include "gwpp/client/client_error.hpp"
#include "gwpp/client/request_correlator.hpp"
#include "gwpp/client/session_config.hpp"
#include "gwpp/transport.hpp"

#include <nlohmann/json.hpp>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gwpp {

using Json = nlohmann::json;

enum class SessionState : std::uint8_t {
    Idle,         ///< Never connected
    Connecting,   ///< Transport opening
    Handshaking,  ///< Socket open, "connect" not yet accepted
    Connected,    ///< Hello received
    Closed        ///< Transport closed, handshake rejected, or disconnected
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle:        return "idle";
        case SessionState::Connecting:  return "connecting";
        case SessionState::Handshaking: return "handshaking";
        case SessionState::Connected:   return "connected";
        case SessionState::Closed:      return "closed";
    }
    return "unknown";
}

/// A pushed event. payload is null when the frame carried none.
struct GatewayEvent {
    std::string event;
    Json payload;
    std::optional<std::int64_t> seq;
};

/// One subscriber per slot; setting a slot replaces the previous subscriber.
struct GatewayCallbacks {
    std::function<void(const GatewayEvent&)> on_event;
    std::function<void(const Json& hello)> on_hello;
    std::function<void(const std::string& reason)> on_close;
    std::function<void(const GatewayError&)> on_error;
};

class GatewaySession {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────────

    /// An empty factory means WebSocketTransport built from config.transport.
    GatewaySession(
        asio::any_io_executor executor,
        GatewaySessionConfig config,
        GatewayCallbacks callbacks = {},
        TransportFactory transport_factory = {}
    );

    /// Fails every request still pending with ConnectionClosed (1001,
    /// "session destroyed"). Destroy the session on its strand, or while no
    /// thread is running the io_context.
    ~GatewaySession();

    // Non-copyable, non-movable
    GatewaySession(const GatewaySession&) = delete;
    GatewaySession& operator=(const GatewaySession&) = delete;
    GatewaySession(GatewaySession&&) = delete;
    GatewaySession& operator=(GatewaySession&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Open a new transport. Does nothing while disabled, with an empty URL,
    /// or while a transport is already connecting or open.
    void connect();

    /// Start closing the transport. Idempotent. Pending requests fail and the
    /// close callback runs once the close event arrives, as for any close.
    void disconnect();

    [[nodiscard]] SessionState state() const noexcept;
    [[nodiscard]] bool is_connected() const noexcept;

    /// Requests awaiting a response on the current transport
    [[nodiscard]] std::size_t pending_requests() const noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────
    // A request fails with NotConnected unless the socket is open. It is not
    // held back until the handshake completes.

    void send(std::string method, Json params, ResponseHandler on_complete);

    [[nodiscard]] std::future<GatewayResult<Json>> send(
        std::string method,
        Json params = Json::object()
    );

    [[nodiscard]] asio::awaitable<GatewayResult<Json>> async_send(
        std::string method,
        Json params = Json::object()
    );

    /// Same as send()
    [[nodiscard]] std::future<GatewayResult<Json>> request(
        std::string method,
        Json params = Json::object()
    ) {
        return send(std::move(method), std::move(params));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Callbacks
    // ─────────────────────────────────────────────────────────────────────────
    // The latest subscriber is always the one invoked, including for a
    // connection that was already in flight when it was set.

    void set_callbacks(GatewayCallbacks callbacks);
    void on_event(std::function<void(const GatewayEvent&)> handler);
    void on_hello(std::function<void(const Json&)> handler);
    void on_close(std::function<void(const std::string&)> handler);
    void on_error(std::function<void(const GatewayError&)> handler);

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (applies from the next connect())
    // ─────────────────────────────────────────────────────────────────────────

    void set_url(std::string url);
    void set_enabled(bool enabled);
    void set_credentials(std::optional<std::string> token, std::optional<std::string> password);

    [[nodiscard]] asio::any_io_executor get_executor() const;

private:
    struct Attempt;
    using AttemptPtr = std::shared_ptr<Attempt>;

    // Strand-side operations
    void do_connect();
    void do_disconnect();
    void issue_request(const AttemptPtr& attempt, std::string method, Json params, ResponseHandler on_complete);

    // Transport events, already on the strand
    void handle_open(const AttemptPtr& attempt);
    void handle_message(const AttemptPtr& attempt, const std::string& text);
    void handle_error(const AttemptPtr& attempt, const TransportError& error);
    void handle_close(const AttemptPtr& attempt, const CloseEvent& event);

    // Handshake
    void send_handshake(const AttemptPtr& attempt);
    void handle_handshake_result(const AttemptPtr& attempt, GatewayResult<Json> result);

    // Helpers
    TransportHandlers make_transport_handlers(const AttemptPtr& attempt);
    void retire(AttemptPtr attempt);
    void set_state(SessionState state);
    void refresh_pending_count();
    void notify_error(const GatewayError& error);
    void notify_close(const std::string& reason);
    template <typename F>
    void post_to_strand(F&& f);

    GatewaySessionConfig config_;
    TransportFactory transport_factory_;

    // Strand for thread-safe access to shared state
    asio::strand<asio::any_io_executor> strand_;

    // Expires with the session; posted work checks it before touching members
    std::shared_ptr<int> lifetime_{std::make_shared<int>(0)};

    // State mirrored for lock-free queries
    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<std::size_t> pending_count_{0};
    std::uint64_t next_generation_{0};

    // Current attempt, plus disconnected ones finishing their close handshake
    AttemptPtr current_;
    std::vector<AttemptPtr> retired_;

    // Callbacks (protected by callbacks_mutex_)
    mutable std::mutex callbacks_mutex_;
    GatewayCallbacks callbacks_;
};

}  // namespace gwpp

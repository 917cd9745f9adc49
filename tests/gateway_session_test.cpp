// ─────────────────────────────────────────────────────────────────────────────
// GatewaySession Tests
// ─────────────────────────────────────────────────────────────────────────────
// The session runs on an io_context that each test drives by hand: drain()
// runs everything that is ready, advance() also lets timers fire. The
// transport is a MockTransport, so every socket event is injected explicitly.

#include <catch2/catch_test_macros.hpp>

#include "gwpp/client/gateway_session.hpp"
#include "mocks/mock_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gwpp;
using namespace gwpp::testing;
using namespace std::chrono_literals;

namespace {

GatewaySessionConfig test_config() {
    GatewaySessionConfig config;
    config.with_url("ws://gateway.test/ws")
          .with_token("secret")
          .with_locale("en-US")
          .with_settle_delay(10s);  // Only a challenge triggers the handshake
    return config;
}

std::string id_of(const Json& frame) {
    return frame.at("id").get<std::string>();
}

/// Records the outcome of one request. Requests still pending when the
/// harness is torn down complete after the Outcome is gone; those are ignored.
struct Outcome {
    std::optional<GatewayResult<Json>> result;
    int calls{0};

    Outcome() = default;
    Outcome(const Outcome&) = delete;
    Outcome& operator=(const Outcome&) = delete;
    ~Outcome() { *alive_ = false; }

    ResponseHandler handler() {
        return [this, alive = alive_](GatewayResult<Json> r) {
            if (!*alive) {
                return;
            }
            result = std::move(r);
            ++calls;
        };
    }

    [[nodiscard]] const GatewayError& error() const { return result->error(); }

private:
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

// ─────────────────────────────────────────────────────────────────────────────
// Harness - session + mock transports + recorded callbacks
// ─────────────────────────────────────────────────────────────────────────────

class SessionHarness {
public:
    explicit SessionHarness(GatewaySessionConfig config = test_config()) {
        GatewayCallbacks callbacks;
        callbacks.on_event = [this](const GatewayEvent& e) { events.push_back(e); };
        callbacks.on_hello = [this](const Json& hello) { hellos.push_back(hello); };
        callbacks.on_close = [this](const std::string& reason) { closes.push_back(reason); };
        callbacks.on_error = [this](const GatewayError& error) { errors.push_back(error); };

        session = std::make_unique<GatewaySession>(
            io.get_executor(), std::move(config), std::move(callbacks), transports.factory());
    }

    SessionHarness(const SessionHarness&) = delete;
    SessionHarness& operator=(const SessionHarness&) = delete;

    /// Run every handler that is ready now
    void drain() {
        io.restart();
        io.poll();
    }

    /// Run handlers, including timers due within `duration`
    void advance(std::chrono::milliseconds duration) {
        io.restart();
        io.run_for(duration);
    }

    /// connect() and open the socket; no handshake yet
    std::shared_ptr<MockTransportState> open_transport() {
        session->connect();
        drain();
        auto transport = transports.latest();
        transport->simulate_open();
        drain();
        return transport;
    }

    /// Open, answer the challenge, accept the handshake
    std::shared_ptr<MockTransportState> connect_session(const Json& hello = {{"session", "abc"}}) {
        auto transport = open_transport();
        transport->push_event("connect.challenge", {{"nonce", "n-1"}});
        drain();
        transport->respond(id_of(transport->requests("connect").at(0)), hello);
        drain();
        return transport;
    }

    asio::io_context io;
    MockTransportFactory transports;
    std::unique_ptr<GatewaySession> session;

    std::vector<GatewayEvent> events;
    std::vector<Json> hellos;
    std::vector<std::string> closes;
    std::vector<GatewayError> errors;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("connect opens exactly one transport", "[session]") {
    SessionHarness h;

    REQUIRE(h.session->state() == SessionState::Idle);

    h.session->connect();
    h.session->connect();
    h.drain();

    REQUIRE(h.transports.created_count() == 1);
    REQUIRE(h.transports.latest()->opened());
    REQUIRE(h.transports.latest()->url() == "ws://gateway.test/ws");
    REQUIRE(h.session->state() == SessionState::Connecting);

    SECTION("connect while open is a no-op") {
        h.transports.latest()->simulate_open();
        h.drain();
        REQUIRE(h.session->state() == SessionState::Handshaking);

        h.session->connect();
        h.drain();
        REQUIRE(h.transports.created_count() == 1);
    }
}

TEST_CASE("connect does nothing when disabled or without a URL", "[session]") {
    SECTION("disabled") {
        SessionHarness h(test_config().with_enabled(false));
        h.session->connect();
        h.drain();
        REQUIRE(h.transports.created_count() == 0);
        REQUIRE(h.session->state() == SessionState::Idle);
    }

    SECTION("empty URL") {
        SessionHarness h(test_config().with_url(""));
        h.session->connect();
        h.drain();
        REQUIRE(h.transports.created_count() == 0);
        REQUIRE(h.errors.empty());
    }

    SECTION("disabled at runtime") {
        SessionHarness h;
        h.session->set_enabled(false);
        h.session->connect();
        h.drain();
        REQUIRE(h.transports.created_count() == 0);
    }
}

TEST_CASE("invalid URL is reported without opening a transport", "[session]") {
    SessionHarness h(test_config().with_url("http://gateway.test/ws"));

    h.session->connect();
    h.drain();

    REQUIRE(h.transports.created_count() == 0);
    REQUIRE(h.errors.size() == 1);
    REQUIRE(h.errors[0].code == GatewayErrorCode::TransportError);
    REQUIRE(h.errors[0].message == "invalid gateway URL: Only ws:// and wss:// URLs are allowed");
    REQUIRE(h.closes.empty());
}

TEST_CASE("set_url applies to the next connect", "[session]") {
    SessionHarness h;

    h.session->set_url("wss://other.test/gateway");
    h.session->connect();
    h.drain();

    REQUIRE(h.transports.latest()->url() == "wss://other.test/gateway");
}

// ═══════════════════════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("handshake waits for the settle delay when no challenge arrives", "[session][handshake]") {
    SessionHarness h(test_config().with_settle_delay(20ms));

    auto t = h.open_transport();
    REQUIRE(t->requests("connect").empty());

    h.advance(500ms);

    auto connects = t->requests("connect");
    REQUIRE(connects.size() == 1);

    const auto& params = connects[0]["params"];
    REQUIRE(params["minProtocol"] == 3);
    REQUIRE(params["maxProtocol"] == 3);
    REQUIRE(params["client"]["id"] == "webchat-ui");
    REQUIRE(params["client"]["displayName"] == "Travel Agent");
    REQUIRE(params["role"] == "operator");
    REQUIRE(params["scopes"] == Json::array({"operator.read", "operator.write"}));
    REQUIRE(params["auth"] == Json{{"token", "secret"}});
    REQUIRE(params["locale"] == "en-US");
}

TEST_CASE("challenge triggers the handshake exactly once", "[session][handshake]") {
    SessionHarness h(test_config().with_settle_delay(50ms));

    auto t = h.open_transport();
    t->push_event("connect.challenge", {{"nonce", "n-1"}});
    h.drain();

    REQUIRE(t->requests("connect").size() == 1);

    // A second challenge and the settle timer both lose the race
    t->push_event("connect.challenge", {{"nonce", "n-2"}});
    h.advance(200ms);

    REQUIRE(t->requests("connect").size() == 1);
    REQUIRE(h.events.empty());
}

TEST_CASE("challenge after hello does not resend the handshake", "[session][handshake]") {
    SessionHarness h;
    auto t = h.connect_session();
    REQUIRE(h.session->state() == SessionState::Connected);

    t->push_event("connect.challenge", {{"nonce", "n-2"}});
    h.drain();

    REQUIRE(t->requests("connect").size() == 1);
    REQUIRE(h.session->state() == SessionState::Connected);
    REQUIRE(h.session->is_connected());
    REQUIRE(h.hellos.size() == 1);
    REQUIRE(h.events.empty());
}

TEST_CASE("credentials set at runtime go into the next handshake", "[session][handshake]") {
    SessionHarness h;

    h.session->set_credentials(std::nullopt, std::string("pw"));
    auto t = h.open_transport();
    t->push_event("connect.challenge");
    h.drain();

    REQUIRE(t->requests("connect").at(0)["params"]["auth"] == Json{{"password", "pw"}});
}

TEST_CASE("blank credentials omit the auth block", "[session][handshake]") {
    SessionHarness h;

    h.session->set_credentials(std::string("  "), std::nullopt);
    auto t = h.open_transport();
    t->push_event("connect.challenge");
    h.drain();

    REQUIRE_FALSE(t->requests("connect").at(0)["params"].contains("auth"));
}

TEST_CASE("accepted handshake delivers hello once", "[session][handshake]") {
    SessionHarness h;

    auto t = h.connect_session({{"session", "abc"}});

    REQUIRE(h.hellos.size() == 1);
    REQUIRE(h.hellos[0] == Json{{"session", "abc"}});
    REQUIRE(h.session->state() == SessionState::Connected);
    REQUIRE(h.session->is_connected());
    REQUIRE(h.session->pending_requests() == 0);
    REQUIRE(h.closes.empty());
}

TEST_CASE("rejected handshake reports the failure and closes the transport", "[session][handshake]") {
    SessionHarness h;

    auto t = h.open_transport();
    t->push_event("connect.challenge");
    h.drain();
    t->respond_error(id_of(t->requests("connect").at(0)), "bad token");
    h.drain();

    REQUIRE(h.hellos.empty());
    REQUIRE(h.closes == std::vector<std::string>{"bad token"});
    REQUIRE_FALSE(h.session->is_connected());
    REQUIRE(h.session->state() == SessionState::Closed);

    REQUIRE(t->close_calls().size() == 1);
    REQUIRE(t->close_calls()[0].code == 4008);
    REQUIRE(t->close_calls()[0].reason == "connect failed");

    // The transport close that follows is reported as well
    t->simulate_close(4008, "connect failed");
    h.drain();
    REQUIRE(h.closes == std::vector<std::string>{"bad token", "connect failed"});
}

TEST_CASE("rejected handshake without a message", "[session][handshake]") {
    SessionHarness h;

    auto t = h.open_transport();
    t->push_event("connect.challenge");
    h.drain();
    t->simulate_frame({{"type", "res"}, {"id", id_of(t->requests("connect").at(0))}, {"ok", false}});
    h.drain();

    REQUIRE(h.closes == std::vector<std::string>{"request failed"});
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("send without an open socket fails with NotConnected", "[session][request]") {
    SessionHarness h;

    SECTION("never connected") {
        Outcome o;
        h.session->send("chat.send", Json::object(), o.handler());
        h.drain();

        REQUIRE(o.calls == 1);
        REQUIRE(o.error().code == GatewayErrorCode::NotConnected);
        REQUIRE(o.error().message == "gateway not connected");
        REQUIRE(h.transports.created_count() == 0);
    }

    SECTION("still connecting") {
        h.session->connect();
        h.drain();

        Outcome o;
        h.session->send("chat.send", Json::object(), o.handler());
        h.drain();

        REQUIRE(o.error().code == GatewayErrorCode::NotConnected);
        REQUIRE(h.transports.latest()->sent().empty());
    }
}

TEST_CASE("completion never runs inline", "[session][request]") {
    SessionHarness h;

    Outcome o;
    h.session->send("chat.send", Json::object(), o.handler());
    REQUIRE(o.calls == 0);

    h.drain();
    REQUIRE(o.calls == 1);
}

TEST_CASE("requests are written as req frames and matched by id", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome a, b, c;
    h.session->send("chat.send", {{"message", "hi"}}, a.handler());
    h.session->send("chat.history", {{"limit", 10}}, b.handler());
    h.session->send("status", Json::object(), c.handler());
    h.drain();

    REQUIRE(h.session->pending_requests() == 3);

    auto send_req = t->requests("chat.send").at(0);
    auto history_req = t->requests("chat.history").at(0);
    auto status_req = t->requests("status").at(0);
    REQUIRE(send_req["params"] == Json{{"message", "hi"}});
    REQUIRE(status_req["params"] == Json::object());
    REQUIRE(id_of(send_req) != id_of(history_req));

    // Out of order
    t->respond(id_of(status_req), {{"state", "ok"}});
    t->respond(id_of(send_req), {{"runId", "r-1"}});
    h.drain();

    REQUIRE((**a.result)["runId"] == "r-1");
    REQUIRE((**c.result)["state"] == "ok");
    REQUIRE(b.calls == 0);
    REQUIRE(h.session->pending_requests() == 1);

    t->respond(id_of(history_req), Json::array());
    h.drain();
    REQUIRE((*b.result)->is_array());
    REQUIRE(h.session->pending_requests() == 0);
}

TEST_CASE("null params are left out of the frame", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("ping", Json(nullptr), o.handler());
    h.drain();

    REQUIRE_FALSE(t->requests("ping").at(0).contains("params"));
}

TEST_CASE("requests are not held back for the handshake", "[session][request]") {
    SessionHarness h;
    auto t = h.open_transport();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();

    REQUIRE(t->requests("status").size() == 1);
    REQUIRE(t->requests("connect").empty());
    REQUIRE(o.calls == 0);
}

TEST_CASE("failed response carries the gateway's message", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome denied, bare;
    h.session->send("chat.send", Json::object(), denied.handler());
    h.drain();
    t->respond_error(t->last_request_id(), "denied");

    h.session->send("chat.send", Json::object(), bare.handler());
    h.drain();
    t->simulate_frame({{"type", "res"}, {"id", t->last_request_id()}, {"ok", false}});
    h.drain();

    REQUIRE(denied.error().code == GatewayErrorCode::RequestFailed);
    REQUIRE(denied.error().message == "denied");
    REQUIRE(bare.error().message == "request failed");
}

TEST_CASE("response without payload resolves with null", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("ack", Json::object(), o.handler());
    h.drain();
    t->simulate_frame({{"type", "res"}, {"id", t->last_request_id()}, {"ok", true}});
    h.drain();

    REQUIRE(o.result->has_value());
    REQUIRE((*o.result)->is_null());
}

TEST_CASE("response for an unknown id has no effect", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();

    t->respond("00000000-0000-4000-8000-000000000000", {{"state", "ok"}});
    h.drain();

    REQUIRE(o.calls == 0);
    REQUIRE(h.session->pending_requests() == 1);
    REQUIRE(h.errors.empty());
    REQUIRE(h.closes.empty());
}

TEST_CASE("send failure rejects the request", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();
    t->set_fail_sends(true);

    Outcome o;
    h.session->send("chat.send", Json::object(), o.handler());
    h.drain();

    REQUIRE(o.error().code == GatewayErrorCode::TransportError);
    REQUIRE(o.error().message == "injected send failure");
    REQUIRE(h.session->pending_requests() == 0);
}

TEST_CASE("future send resolves with the response", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();

    auto future = h.session->send("status", Json::object());
    auto alias = h.session->request("status");
    h.drain();

    REQUIRE(future.wait_for(0s) == std::future_status::timeout);

    auto status_requests = t->requests("status");
    REQUIRE(status_requests.size() == 2);
    t->respond(id_of(status_requests[0]), {{"state", "ok"}});
    t->respond_error(id_of(status_requests[1]), "busy");
    h.drain();

    REQUIRE(future.wait_for(0s) == std::future_status::ready);
    auto result = future.get();
    REQUIRE(result.has_value());
    REQUIRE((*result)["state"] == "ok");

    auto failed = alias.get();
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().message == "busy");
}

TEST_CASE("async_send resumes the coroutine with the response", "[session][request]") {
    SessionHarness h;
    auto t = h.connect_session();

    std::optional<GatewayResult<Json>> outcome;
    asio::co_spawn(h.io, [&]() -> asio::awaitable<void> {
        outcome = co_await h.session->async_send("chat.send", {{"message", "hi"}});
    }, asio::detached);
    h.drain();

    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(t->requests("chat.send").size() == 1);

    t->respond(t->last_request_id(), {{"runId", "r-9"}});
    h.drain();

    REQUIRE(outcome.has_value());
    REQUIRE(outcome->has_value());
    REQUIRE((**outcome)["runId"] == "r-9");
}

TEST_CASE("async_send without a connection", "[session][request]") {
    SessionHarness h;

    std::optional<GatewayResult<Json>> outcome;
    asio::co_spawn(h.io, [&]() -> asio::awaitable<void> {
        outcome = co_await h.session->async_send("status");
    }, asio::detached);
    h.drain();

    REQUIRE(outcome.has_value());
    REQUIRE(outcome->error().code == GatewayErrorCode::NotConnected);
}

// ═══════════════════════════════════════════════════════════════════════════
// Close Handling
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("close fails every pending request", "[session][close]") {
    SessionHarness h;
    auto t = h.connect_session();

    std::vector<Outcome> outcomes(3);
    for (auto& o : outcomes) {
        h.session->send("chat.history", Json::object(), o.handler());
    }
    h.drain();
    REQUIRE(h.session->pending_requests() == 3);

    t->simulate_close(1001, "going away");
    h.drain();

    for (const auto& o : outcomes) {
        REQUIRE(o.calls == 1);
        REQUIRE(o.error().code == GatewayErrorCode::ConnectionClosed);
        REQUIRE(o.error().message == "gateway closed (1001): going away");
        REQUIRE(o.error().close_code == 1001);
    }
    REQUIRE(h.session->pending_requests() == 0);
    REQUIRE(h.closes == std::vector<std::string>{"going away"});
    REQUIRE(h.session->state() == SessionState::Closed);
    REQUIRE_FALSE(h.session->is_connected());
}

TEST_CASE("close without a reason is reported as closed", "[session][close]") {
    SessionHarness h;
    auto t = h.connect_session();

    t->simulate_close(1006, "");
    h.drain();

    REQUIRE(h.closes == std::vector<std::string>{"closed"});
}

TEST_CASE("close before the handshake completes fails the handshake silently", "[session][close]") {
    SessionHarness h;
    auto t = h.open_transport();
    t->push_event("connect.challenge");
    h.drain();
    REQUIRE(h.session->pending_requests() == 1);

    t->simulate_close(1006, "");
    h.drain();

    REQUIRE(h.hellos.empty());
    REQUIRE(h.closes == std::vector<std::string>{"closed"});
    REQUIRE(t->close_calls().empty());
}

TEST_CASE("transport errors are reported without failing requests", "[session][close]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();

    t->simulate_error("connection reset");
    h.drain();

    REQUIRE(h.errors.size() == 1);
    REQUIRE(h.errors[0].code == GatewayErrorCode::TransportError);
    REQUIRE(h.errors[0].message == "connection reset");
    REQUIRE(o.calls == 0);
    REQUIRE(h.session->pending_requests() == 1);
}

TEST_CASE("disconnect fails pending requests with the close event", "[session][close]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome a, b;
    h.session->send("status", Json::object(), a.handler());
    h.session->send("chat.send", Json::object(), b.handler());
    h.drain();

    h.session->disconnect();
    h.drain();

    REQUIRE(h.session->state() == SessionState::Closed);
    REQUIRE_FALSE(h.session->is_connected());
    REQUIRE(h.session->pending_requests() == 0);
    REQUIRE(t->close_calls().size() == 1);
    REQUIRE(t->close_calls()[0].code == 1000);

    // Nothing settles until the closing handshake finishes
    REQUIRE(a.calls == 0);
    REQUIRE(b.calls == 0);
    REQUIRE(h.closes.empty());

    t->simulate_close(1000, "");
    h.drain();

    REQUIRE(a.calls == 1);
    REQUIRE(a.error().code == GatewayErrorCode::ConnectionClosed);
    REQUIRE(a.error().message == "gateway closed (1000): no reason");
    REQUIRE(a.error().close_code == 1000);
    REQUIRE(b.calls == 1);
    REQUIRE(h.closes == std::vector<std::string>{"closed"});

    // Idempotent
    h.session->disconnect();
    h.drain();
    REQUIRE(t->close_calls().size() == 1);
    REQUIRE(h.closes.size() == 1);
}

TEST_CASE("a disconnecting transport still settles its responses", "[session][close]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();
    const auto id = t->last_request_id();

    h.session->disconnect();
    h.drain();

    t->push_event("chat", {{"text", "late"}});
    t->respond(id, {{"state", "ok"}});
    h.drain();

    REQUIRE(o.calls == 1);
    REQUIRE(o.result->has_value());
    REQUIRE(h.events.empty());

    t->simulate_close(1000, "");
    h.drain();
    REQUIRE(o.calls == 1);
}

TEST_CASE("destroying the session fails pending requests", "[session][close]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    auto future = h.session->send("chat.history", Json::object());
    h.drain();
    REQUIRE(h.session->pending_requests() == 2);

    h.session.reset();

    REQUIRE(o.calls == 1);
    REQUIRE(o.error().code == GatewayErrorCode::ConnectionClosed);
    REQUIRE(o.error().message == "gateway closed (1001): session destroyed");

    REQUIRE(future.wait_for(0s) == std::future_status::ready);
    auto result = future.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == GatewayErrorCode::ConnectionClosed);
    REQUIRE(result.error().close_code == 1001);

    REQUIRE(t->destroyed());
    t->simulate_close(1006, "");
    h.drain();
    REQUIRE(o.calls == 1);
    REQUIRE(h.closes.empty());
}

TEST_CASE("destroying the session fails requests of a disconnecting transport", "[session][close]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();
    h.session->disconnect();
    h.drain();
    REQUIRE(o.calls == 0);

    h.session.reset();

    REQUIRE(o.calls == 1);
    REQUIRE(o.error().message == "gateway closed (1001): session destroyed");
}

TEST_CASE("connect racing a queued close reports that close", "[session][close]") {
    SessionHarness h;
    auto first = h.connect_session();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();

    // connect() is queued ahead of the close event of the dropped socket
    h.session->connect();
    first->simulate_close(1006, "");
    h.drain();

    REQUIRE(h.transports.created_count() == 2);
    REQUIRE(h.session->state() == SessionState::Connecting);

    REQUIRE(o.calls == 1);
    REQUIRE(o.error().message == "gateway closed (1006): no reason");
    REQUIRE(o.error().close_code == 1006);
    REQUIRE(h.closes == std::vector<std::string>{"closed"});
}

TEST_CASE("connect after a rejected handshake reports the old close", "[session][close]") {
    SessionHarness h;
    auto first = h.open_transport();
    first->push_event("connect.challenge");
    h.drain();
    first->respond_error(id_of(first->requests("connect").at(0)), "bad token");
    h.drain();
    REQUIRE(first->ready_state() == ReadyState::Closing);

    auto second = h.open_transport();
    REQUIRE(h.transports.created_count() == 2);

    first->simulate_close(4008, "connect failed");
    h.drain();

    REQUIRE(h.closes == std::vector<std::string>{"bad token", "connect failed"});
    REQUIRE(h.session->state() == SessionState::Handshaking);
    REQUIRE(second->ready_state() == ReadyState::Open);
}

TEST_CASE("disconnect without a transport is a no-op", "[session][close]") {
    SessionHarness h;

    h.session->disconnect();
    h.drain();

    REQUIRE(h.session->state() == SessionState::Idle);
    REQUIRE(h.closes.empty());
}

TEST_CASE("reconnect starts a fresh handshake on a new transport", "[session][close]") {
    SessionHarness h;
    auto first = h.connect_session();

    first->simulate_close(1006, "");
    h.drain();

    auto second = h.open_transport();
    REQUIRE(h.transports.created_count() == 2);
    REQUIRE(h.session->state() == SessionState::Handshaking);

    second->push_event("connect.challenge");
    h.drain();
    REQUIRE(second->requests("connect").size() == 1);
    REQUIRE(first->requests("connect").size() == 1);

    second->respond(id_of(second->requests("connect").at(0)), {{"session", "def"}});
    h.drain();
    REQUIRE(h.hellos.size() == 2);
    REQUIRE(h.hellos[1]["session"] == "def");
}

TEST_CASE("a previous transport cannot affect the current session", "[session][close]") {
    SessionHarness h;
    auto old_transport = h.connect_session();

    h.session->disconnect();
    h.drain();
    auto current = h.open_transport();

    old_transport->push_event("chat", {{"text", "late"}});
    old_transport->push_event("connect.challenge");
    old_transport->simulate_error("late error");
    old_transport->simulate_close(1006, "");
    h.drain();

    REQUIRE(h.events.empty());
    REQUIRE(h.errors.empty());
    REQUIRE(old_transport->requests("connect").size() == 1);
    REQUIRE(current->requests("connect").empty());

    // Its close is still reported, without touching the new attempt
    REQUIRE(h.closes == std::vector<std::string>{"closed"});
    REQUIRE(h.session->state() == SessionState::Handshaking);
    REQUIRE(current->ready_state() == ReadyState::Open);
}

// ═══════════════════════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("events are forwarded with payload and seq", "[session][event]") {
    SessionHarness h;
    auto t = h.connect_session();

    t->simulate_frame({{"type", "event"}, {"event", "chat"}, {"payload", {{"text", "hi"}}}, {"seq", 7}});
    t->push_event("presence");
    h.drain();

    REQUIRE(h.events.size() == 2);
    REQUIRE(h.events[0].event == "chat");
    REQUIRE(h.events[0].payload["text"] == "hi");
    REQUIRE(h.events[0].seq == 7);
    REQUIRE(h.events[1].event == "presence");
    REQUIRE(h.events[1].payload.is_null());
    REQUIRE_FALSE(h.events[1].seq.has_value());
}

TEST_CASE("events arrive before the handshake completes", "[session][event]") {
    SessionHarness h;
    auto t = h.open_transport();

    t->push_event("tick", {{"ts", 1}});
    h.drain();

    REQUIRE(h.events.size() == 1);
}

TEST_CASE("malformed frames are dropped silently", "[session][event]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();

    t->simulate_message("not json");
    t->simulate_message("[1,2,3]");
    t->simulate_message(R"({"type":"bogus"})");
    t->simulate_message(R"({"type":"res","ok":true})");
    t->simulate_message(R"({"type":"event"})");
    t->simulate_message(R"({"type":"req","id":"s-1","method":"tools.call"})");
    h.drain();

    REQUIRE(h.events.empty());
    REQUIRE(h.errors.empty());
    REQUIRE(h.closes.empty());
    REQUIRE(o.calls == 0);
    REQUIRE(h.session->is_connected());
}

// ═══════════════════════════════════════════════════════════════════════════
// Callbacks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("the latest subscriber is invoked", "[session][callback]") {
    SessionHarness h;
    auto t = h.open_transport();
    t->push_event("connect.challenge");
    h.drain();

    // Replace the hello subscriber while the handshake is in flight
    std::vector<Json> replaced;
    h.session->on_hello([&](const Json& hello) { replaced.push_back(hello); });

    t->respond(id_of(t->requests("connect").at(0)), {{"session", "abc"}});
    h.drain();

    REQUIRE(replaced.size() == 1);
    REQUIRE(h.hellos.empty());
}

TEST_CASE("set_callbacks replaces every slot", "[session][callback]") {
    SessionHarness h;
    auto t = h.connect_session();

    int events = 0;
    GatewayCallbacks callbacks;
    callbacks.on_event = [&](const GatewayEvent&) { ++events; };
    h.session->set_callbacks(std::move(callbacks));

    t->push_event("chat");
    t->simulate_close(1000, "bye");
    h.drain();

    REQUIRE(events == 1);
    REQUIRE(h.events.empty());
    REQUIRE(h.closes.empty());
}

TEST_CASE("throwing callbacks do not disturb the session", "[session][callback]") {
    SessionHarness h;
    auto t = h.connect_session();

    h.session->on_event([](const GatewayEvent&) { throw std::runtime_error("handler bug"); });

    Outcome o;
    h.session->send("status", Json::object(), o.handler());
    h.drain();

    t->push_event("chat");
    t->respond(t->last_request_id(), {{"state", "ok"}});
    REQUIRE_NOTHROW(h.drain());

    REQUIRE(o.calls == 1);
    REQUIRE(o.result->has_value());
    REQUIRE(h.session->is_connected());
}

// ═══════════════════════════════════════════════════════════════════════════
// End-to-End Scenarios
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("challenge, handshake, hello", "[session][scenario]") {
    SessionHarness h(test_config().with_settle_delay(50ms));

    h.session->connect();
    h.drain();
    auto t = h.transports.latest();

    t->simulate_open();
    t->push_event("connect.challenge", {{"nonce", "n"}});
    h.drain();

    auto connects = t->requests("connect");
    REQUIRE(connects.size() == 1);

    t->respond(id_of(connects[0]), {{"session", "abc"}});
    h.advance(200ms);  // Settle timer would have fired by now

    REQUIRE(t->requests("connect").size() == 1);
    REQUIRE(h.hellos == std::vector<Json>{Json{{"session", "abc"}}});
    REQUIRE(h.events.empty());
}

TEST_CASE("pending request fails when the connection drops", "[session][scenario]") {
    SessionHarness h;
    auto t = h.connect_session();

    Outcome o;
    h.session->send("listThings", Json::object(), o.handler());
    h.drain();

    t->simulate_close(1006, "");
    h.drain();

    REQUIRE(o.calls == 1);
    REQUIRE(o.error().code == GatewayErrorCode::ConnectionClosed);
    REQUIRE(o.error().message.find("1006") != std::string::npos);
    REQUIRE(h.closes == std::vector<std::string>{"closed"});
}

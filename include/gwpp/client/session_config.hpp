#pragma once

#include "gwpp/client/handshake.hpp"
#include "gwpp/transport/websocket_transport_config.hpp"

#include <chrono>
#include <string>

namespace gwpp {

// ═══════════════════════════════════════════════════════════════════════════
// Gateway Session Configuration
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* DEFAULT_GATEWAY_URL = "ws://localhost:18789/ws";

struct GatewaySessionConfig {
    /// Gateway endpoint (ws:// or wss://). Empty = connect() does nothing.
    std::string url;

    /// connect() does nothing while disabled
    bool enabled = true;

    /// Wait between socket open and the handshake, giving the server a
    /// chance to send connect.challenge first
    std::chrono::milliseconds settle_delay{750};

    /// Identity, credentials and scopes sent in the "connect" request
    HandshakeConfig handshake = HandshakeConfig::defaults();

    /// Used only by the default WebSocket transport factory
    WebSocketTransportConfig transport;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    GatewaySessionConfig& with_url(std::string value);
    GatewaySessionConfig& with_enabled(bool value);
    GatewaySessionConfig& with_token(std::string value);
    GatewaySessionConfig& with_password(std::string value);
    GatewaySessionConfig& with_settle_delay(std::chrono::milliseconds delay);
    GatewaySessionConfig& with_locale(std::string value);
    GatewaySessionConfig& with_client(ClientIdentity client);

    /// GATEWAY_URL (default DEFAULT_GATEWAY_URL), GATEWAY_TOKEN and
    /// GATEWAY_PASSWORD from the environment
    [[nodiscard]] static GatewaySessionConfig from_env();
};

}  // namespace gwpp

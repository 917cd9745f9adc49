#ifndef GWPP_TRANSPORT_WEBSOCKET_TRANSPORT_CONFIG_HPP
#define GWPP_TRANSPORT_WEBSOCKET_TRANSPORT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace gwpp {

// ─────────────────────────────────────────────────────────────────────────────
// TLS Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Used only for wss:// URLs.

struct WebSocketTlsConfig {
    // Path to CA certificate bundle for server verification.
    // If empty, uses system default CA store.
    std::string ca_cert_path;

    // WARNING: Setting to false is a security risk!
    bool verify_peer{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// WebSocket Transport Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct WebSocketTransportConfig {
    using HeaderMap = std::unordered_map<std::string, std::string>;

    // Resolve + TCP connect (+ TLS handshake for wss).
    std::chrono::milliseconds connect_timeout{10'000};

    // HTTP upgrade handshake and the closing handshake.
    std::chrono::milliseconds handshake_timeout{10'000};

    // Extra headers sent on the upgrade request.
    HeaderMap headers;

    // User-Agent on the upgrade request. Empty = Beast's default.
    std::string user_agent;

    WebSocketTlsConfig tls;

    // Largest inbound message accepted before the connection fails.
    // 0 = Beast's default limit.
    std::size_t max_message_size{16 * 1024 * 1024};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    WebSocketTransportConfig& with_header(const std::string& name, const std::string& value);
    WebSocketTransportConfig& with_user_agent(std::string agent);
    WebSocketTransportConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    WebSocketTransportConfig& with_handshake_timeout(std::chrono::milliseconds timeout);
    WebSocketTransportConfig& with_ca_cert(std::string path);
    WebSocketTransportConfig& with_verify_peer(bool verify);
    WebSocketTransportConfig& with_max_message_size(std::size_t bytes);
};

}  // namespace gwpp

#endif  // GWPP_TRANSPORT_WEBSOCKET_TRANSPORT_CONFIG_HPP

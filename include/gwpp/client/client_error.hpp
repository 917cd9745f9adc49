#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Gateway Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Every request completion carries either the response payload or one of
// these errors. Connection-level failures (transport errors, rejected
// handshakes) are also reported to the session callbacks in this form.

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gwpp {

enum class GatewayErrorCode {
    NotConnected,       ///< No open transport when the request was issued
    HandshakeRejected,  ///< Gateway answered "connect" with ok:false
    ConnectionClosed,   ///< Transport closed while the request was pending
    RequestFailed,      ///< Gateway answered the request with ok:false
    TransportError,     ///< Socket-level failure
    MalformedFrame      ///< Undecodable inbound data (never surfaced to callers)
};

[[nodiscard]] constexpr std::string_view to_string(GatewayErrorCode code) noexcept {
    switch (code) {
        case GatewayErrorCode::NotConnected:      return "NotConnected";
        case GatewayErrorCode::HandshakeRejected: return "HandshakeRejected";
        case GatewayErrorCode::ConnectionClosed:  return "ConnectionClosed";
        case GatewayErrorCode::RequestFailed:     return "RequestFailed";
        case GatewayErrorCode::TransportError:    return "TransportError";
        case GatewayErrorCode::MalformedFrame:    return "MalformedFrame";
    }
    return "Unknown";
}

struct GatewayError {
    GatewayErrorCode code;
    std::string message;
    std::optional<int> close_code{};           ///< Set for ConnectionClosed
    std::optional<std::string> close_reason{}; ///< Set for ConnectionClosed

    [[nodiscard]] static GatewayError not_connected() {
        return {GatewayErrorCode::NotConnected, "gateway not connected"};
    }

    [[nodiscard]] static GatewayError handshake_rejected(std::string msg) {
        return {GatewayErrorCode::HandshakeRejected, std::move(msg)};
    }

    /// Message reads "gateway closed (<code>): <reason>", with "no reason"
    /// substituted for an empty reason.
    [[nodiscard]] static GatewayError connection_closed(int code, std::string reason);

    [[nodiscard]] static GatewayError request_failed(std::string msg) {
        return {GatewayErrorCode::RequestFailed, std::move(msg)};
    }

    [[nodiscard]] static GatewayError transport_error(std::string msg) {
        return {GatewayErrorCode::TransportError, std::move(msg)};
    }

    [[nodiscard]] static GatewayError malformed_frame(std::string msg) {
        return {GatewayErrorCode::MalformedFrame, std::move(msg)};
    }

    /// "<code>: <message>", for logs and CLI output
    [[nodiscard]] std::string describe() const;
};

template <typename T>
using GatewayResult = tl::expected<T, GatewayError>;

}  // namespace gwpp

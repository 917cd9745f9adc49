#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Transport
// ═══════════════════════════════════════════════════════════════════════════
// ITransport over Boost.Beast, for ws:// and wss:// gateway URLs.
//
// Each instance runs its own I/O thread. open() resolves, connects, performs
// the TLS handshake (wss) and the HTTP upgrade, then reads text messages
// until the socket closes. Handlers run on that I/O thread.
//
// Destroying an open transport finishes the closing handshake (bounded by
// handshake_timeout) without invoking any handler.

#include "gwpp/transport.hpp"
#include "gwpp/transport/websocket_transport_config.hpp"

#include <memory>
#include <string>

namespace gwpp {

class WebSocketTransport : public ITransport {
public:
    explicit WebSocketTransport(std::string url, WebSocketTransportConfig config = {});
    ~WebSocketTransport() override;

    // Non-copyable, non-movable
    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;
    WebSocketTransport(WebSocketTransport&&) = delete;
    WebSocketTransport& operator=(WebSocketTransport&&) = delete;

    void open(TransportHandlers handlers) override;
    [[nodiscard]] TransportResult<void> send(std::string text) override;
    void close(std::uint16_t code = close_code::Normal, std::string reason = {}) override;
    [[nodiscard]] ReadyState ready_state() const noexcept override;

    [[nodiscard]] const std::string& url() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Factory producing a WebSocketTransport per connection attempt
[[nodiscard]] TransportFactory make_websocket_transport_factory(WebSocketTransportConfig config = {});

}  // namespace gwpp

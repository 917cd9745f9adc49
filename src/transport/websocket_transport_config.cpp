#include "gwpp/transport/websocket_transport_config.hpp"

namespace gwpp {

WebSocketTransportConfig& WebSocketTransportConfig::with_header(
    const std::string& name,
    const std::string& value
) {
    headers[name] = value;
    return *this;
}

WebSocketTransportConfig& WebSocketTransportConfig::with_user_agent(std::string agent) {
    user_agent = std::move(agent);
    return *this;
}

WebSocketTransportConfig& WebSocketTransportConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

WebSocketTransportConfig& WebSocketTransportConfig::with_handshake_timeout(std::chrono::milliseconds timeout) {
    handshake_timeout = timeout;
    return *this;
}

WebSocketTransportConfig& WebSocketTransportConfig::with_ca_cert(std::string path) {
    tls.ca_cert_path = std::move(path);
    return *this;
}

WebSocketTransportConfig& WebSocketTransportConfig::with_verify_peer(bool verify) {
    tls.verify_peer = verify;
    return *this;
}

WebSocketTransportConfig& WebSocketTransportConfig::with_max_message_size(std::size_t bytes) {
    max_message_size = bytes;
    return *this;
}

}  // namespace gwpp

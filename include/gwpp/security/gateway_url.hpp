#ifndef GWPP_SECURITY_GATEWAY_URL_HPP
#define GWPP_SECURITY_GATEWAY_URL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gwpp::security {

// ═══════════════════════════════════════════════════════════════════════════
// Gateway URL Validation
// ═══════════════════════════════════════════════════════════════════════════
// Parses a gateway endpoint (ws:// or wss://) with ada and splits it into
// what the WebSocket transport needs to dial it. A URL that fails here never
// reaches the network.

struct GatewayUrlConfig {
    bool allow_plaintext = true;             // ws:// accepted (with a warning off-host)
    std::vector<std::string> allowed_hosts;  // Whitelist (empty = allow all)
    std::vector<std::string> blocked_hosts;  // Blacklist
    std::size_t max_url_length = 2048;
};

struct GatewayEndpoint {
    std::string url;          // Normalized href
    std::string host;         // Name or address to resolve (no IPv6 brackets)
    std::string host_header;  // Value for the Host header ("host" or "host:port")
    std::string port;         // Always set; 80 / 443 when the URL has none
    std::string target;       // Path plus query, at least "/"
    bool tls{false};          // wss://
};

struct GatewayUrlValidation {
    bool is_valid{false};
    std::optional<GatewayEndpoint> endpoint;
    std::optional<std::string> warning;  // Non-blocking concern
    std::optional<std::string> error;    // Blocking issue
};

[[nodiscard]] GatewayUrlValidation validate_gateway_url(
    const std::string& url,
    const GatewayUrlConfig& config = {}
);

namespace detail {

// Check if host is localhost or loopback
[[nodiscard]] bool is_localhost(std::string_view host);

// Strip the brackets ada keeps around IPv6 literals
[[nodiscard]] std::string_view unbracket(std::string_view host);

}  // namespace detail

}  // namespace gwpp::security

#endif  // GWPP_SECURITY_GATEWAY_URL_HPP

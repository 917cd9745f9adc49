#include "gwpp/security/gateway_url.hpp"

#include <ada.h>

#include <algorithm>

namespace gwpp::security {

namespace detail {

std::string_view unbracket(std::string_view host) {
    if (host.size() >= 2 && host.starts_with('[') && host.ends_with(']')) {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

bool is_localhost(std::string_view host) {
    host = unbracket(host);

    if (host == "localhost" || host == "localhost.localdomain") {
        return true;
    }
    if (host == "::1" || host == "0:0:0:0:0:0:0:1") {
        return true;
    }
    // 127.0.0.0/8; ada has already canonicalized IPv4 to dotted decimal
    return host.starts_with("127.");
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Main Validation Function
// ═══════════════════════════════════════════════════════════════════════════

GatewayUrlValidation validate_gateway_url(const std::string& url, const GatewayUrlConfig& config) {
    GatewayUrlValidation result;

    if (url.empty()) {
        result.error = "URL is empty";
        return result;
    }

    auto parsed = ada::parse<ada::url>(url);
    if (!parsed.has_value()) {
        result.error = "Invalid URL format";
        return result;
    }

    const auto& ada_url = parsed.value();

    std::string scheme = std::string(ada_url.get_protocol());
    if (!scheme.empty() && scheme.back() == ':') {
        scheme.pop_back();
    }

    const bool is_wss = (scheme == "wss");
    const bool is_ws = (scheme == "ws");
    if (!is_wss && !is_ws) {
        result.error = "Only ws:// and wss:// URLs are allowed";
        return result;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        result.error = "URL has no host";
        return result;
    }

    if (!ada_url.get_username().empty() || !ada_url.get_password().empty()) {
        result.error = "URLs with embedded credentials are not allowed";
        return result;
    }

    if (is_ws && !config.allow_plaintext) {
        result.error = "Only wss:// URLs are allowed";
        return result;
    }

    if (!config.allowed_hosts.empty()) {
        bool found = std::find(config.allowed_hosts.begin(), config.allowed_hosts.end(), host)
                     != config.allowed_hosts.end();
        if (!found) {
            result.error = "Host '" + host + "' is not in the allowed hosts list";
            return result;
        }
    }

    if (!config.blocked_hosts.empty()) {
        bool found = std::find(config.blocked_hosts.begin(), config.blocked_hosts.end(), host)
                     != config.blocked_hosts.end();
        if (found) {
            result.error = "Host '" + host + "' is blocked";
            return result;
        }
    }

    if (is_ws && !detail::is_localhost(host)) {
        result.warning = "ws:// to a remote host is not encrypted";
    }

    if (url.size() > config.max_url_length && !result.warning) {
        result.warning = "URL is unusually long";
    }

    GatewayEndpoint endpoint;
    endpoint.url = std::string(ada_url.get_href());
    endpoint.host = std::string(detail::unbracket(host));
    endpoint.host_header = std::string(ada_url.get_host());
    endpoint.tls = is_wss;

    // ada drops the port when it is the scheme default
    endpoint.port = std::string(ada_url.get_port());
    if (endpoint.port.empty()) {
        endpoint.port = is_wss ? "443" : "80";
    }

    endpoint.target = std::string(ada_url.get_pathname());
    if (endpoint.target.empty()) {
        endpoint.target = "/";
    }
    endpoint.target += std::string(ada_url.get_search());

    result.is_valid = true;
    result.endpoint = std::move(endpoint);
    return result;
}

}  // namespace gwpp::security

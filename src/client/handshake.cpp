#include "gwpp/client/handshake.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>

namespace gwpp {

// ─────────────────────────────────────────────────────────────────────────────
// Environment defaults
// ─────────────────────────────────────────────────────────────────────────────

std::string default_platform() {
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

std::string locale_from_posix(const std::string& posix_locale) {
    // Strip ".codeset" and "@modifier"
    std::string tag = posix_locale.substr(0, posix_locale.find_first_of(".@"));
    if (tag.empty() || tag == "C" || tag == "POSIX") {
        return "en-US";
    }
    std::replace(tag.begin(), tag.end(), '_', '-');
    return tag;
}

std::string default_locale() {
    for (const char* var : {"LC_ALL", "LANG"}) {
        if (const char* value = std::getenv(var); value != nullptr && *value != '\0') {
            return locale_from_posix(value);
        }
    }
    return "en-US";
}

std::string default_user_agent(const ClientIdentity& client) {
    return std::format("gwpp/{} ({}; {})", client.version, client.platform, client.id);
}

HandshakeConfig HandshakeConfig::defaults() {
    HandshakeConfig config;
    config.client.platform = default_platform();
    config.locale = default_locale();
    config.user_agent = default_user_agent(config.client);
    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// Connect params
// ─────────────────────────────────────────────────────────────────────────────

ConnectParams build_connect_params(const HandshakeConfig& config) {
    ConnectParams params;
    params.min_protocol = config.protocol_version;
    params.max_protocol = config.protocol_version;
    params.client = config.client;
    if (params.client.platform.empty()) {
        params.client.platform = default_platform();
    }
    params.role = config.role;
    params.scopes = config.scopes;
    params.caps = config.caps;
    params.auth = ConnectAuth::from_credentials(config.token, config.password);
    params.locale = config.locale.empty() ? std::string("en-US") : config.locale;
    params.user_agent = config.user_agent.empty()
        ? default_user_agent(params.client)
        : config.user_agent;
    return params;
}

HandshakeNegotiator::HandshakeNegotiator(HandshakeConfig config)
    : config_(std::move(config)) {}

std::optional<ConnectParams> HandshakeNegotiator::begin() {
    if (sent_) {
        return std::nullopt;
    }
    sent_ = true;
    return build_connect_params(config_);
}

}  // namespace gwpp

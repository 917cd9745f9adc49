#include "gwpp/client/session_config.hpp"

#include <cstdlib>
#include <optional>

namespace gwpp {

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

GatewaySessionConfig& GatewaySessionConfig::with_url(std::string value) {
    url = std::move(value);
    return *this;
}

GatewaySessionConfig& GatewaySessionConfig::with_enabled(bool value) {
    enabled = value;
    return *this;
}

GatewaySessionConfig& GatewaySessionConfig::with_token(std::string value) {
    handshake.token = std::move(value);
    return *this;
}

GatewaySessionConfig& GatewaySessionConfig::with_password(std::string value) {
    handshake.password = std::move(value);
    return *this;
}

GatewaySessionConfig& GatewaySessionConfig::with_settle_delay(std::chrono::milliseconds delay) {
    settle_delay = delay;
    return *this;
}

GatewaySessionConfig& GatewaySessionConfig::with_locale(std::string value) {
    handshake.locale = std::move(value);
    return *this;
}

GatewaySessionConfig& GatewaySessionConfig::with_client(ClientIdentity client) {
    handshake.client = std::move(client);
    if (handshake.client.platform.empty()) {
        handshake.client.platform = default_platform();
    }
    return *this;
}

GatewaySessionConfig GatewaySessionConfig::from_env() {
    GatewaySessionConfig config;
    config.url = env_value("GATEWAY_URL").value_or(DEFAULT_GATEWAY_URL);
    config.handshake.token = env_value("GATEWAY_TOKEN");
    config.handshake.password = env_value("GATEWAY_PASSWORD");
    return config;
}

}  // namespace gwpp

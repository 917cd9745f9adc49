#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Handshake Negotiator
// ═══════════════════════════════════════════════════════════════════════════
// Builds the one "connect" request that turns an open socket into an
// authenticated, versioned gateway session, and guards against sending it
// twice on the same transport. The settle timer and a server
// "connect.challenge" both race to trigger the handshake; whichever arrives
// first wins and every later trigger is a no-op.
//
// One negotiator exists per transport instance, so the guard resets
// naturally on reconnect.

#include "gwpp/protocol/gateway_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gwpp {

struct HandshakeConfig {
    int protocol_version{GATEWAY_PROTOCOL_VERSION};
    ClientIdentity client{};
    std::string role{"operator"};
    std::vector<std::string> scopes{"operator.read", "operator.write"};
    std::vector<std::string> caps{};
    std::optional<std::string> token;
    std::optional<std::string> password;
    std::string locale;
    std::string user_agent;

    /// Identity and environment defaults for this process (platform, locale
    /// from $LANG, user agent).
    [[nodiscard]] static HandshakeConfig defaults();
};

/// "linux", "darwin", "win32", ... chosen at compile time
[[nodiscard]] std::string default_platform();

/// BCP 47 tag derived from a POSIX locale string ("de_DE.UTF-8" -> "de-DE").
/// Empty, "C" and "POSIX" map to "en-US".
[[nodiscard]] std::string locale_from_posix(const std::string& posix_locale);

[[nodiscard]] std::string default_locale();

[[nodiscard]] std::string default_user_agent(const ClientIdentity& client);

[[nodiscard]] ConnectParams build_connect_params(const HandshakeConfig& config);

class HandshakeNegotiator {
public:
    explicit HandshakeNegotiator(HandshakeConfig config);

    /// Connect params on the first call, nullopt on every later call.
    [[nodiscard]] std::optional<ConnectParams> begin();

    [[nodiscard]] bool sent() const noexcept { return sent_; }

    [[nodiscard]] const HandshakeConfig& config() const noexcept { return config_; }

private:
    HandshakeConfig config_;
    bool sent_{false};
};

}  // namespace gwpp

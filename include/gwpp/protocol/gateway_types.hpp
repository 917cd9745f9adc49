#ifndef GWPP_PROTOCOL_GATEWAY_TYPES_HPP
#define GWPP_PROTOCOL_GATEWAY_TYPES_HPP

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace gwpp {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Constants
// ═══════════════════════════════════════════════════════════════════════════

/// The client asserts exactly this version (min == max); no range negotiation
inline constexpr int GATEWAY_PROTOCOL_VERSION = 3;

inline constexpr const char* CONNECT_METHOD = "connect";
inline constexpr const char* CHALLENGE_EVENT = "connect.challenge";

// ═══════════════════════════════════════════════════════════════════════════
// Client Identity
// ═══════════════════════════════════════════════════════════════════════════

struct ClientIdentity {
    std::string id{"webchat-ui"};
    std::string display_name{"Travel Agent"};
    std::string version{"0.1.0"};
    std::string platform;
    std::string mode{"webchat"};

    [[nodiscard]] Json to_json() const {
        return {
            {"id", id},
            {"displayName", display_name},
            {"version", version},
            {"platform", platform},
            {"mode", mode}
        };
    }

    static ClientIdentity from_json(const Json& j) {
        ClientIdentity identity;
        identity.id = j.value("id", "");
        identity.display_name = j.value("displayName", "");
        identity.version = j.value("version", "");
        identity.platform = j.value("platform", "");
        identity.mode = j.value("mode", "");
        return identity;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Auth Block
// ═══════════════════════════════════════════════════════════════════════════

struct ConnectAuth {
    std::optional<std::string> token;
    std::optional<std::string> password;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (token) j["token"] = *token;
        if (password) j["password"] = *password;
        return j;
    }

    /// Trims both credentials; returns nullopt when neither survives
    [[nodiscard]] static std::optional<ConnectAuth> from_credentials(
        const std::optional<std::string>& token,
        const std::optional<std::string>& password
    ) {
        ConnectAuth auth{non_blank(token), non_blank(password)};
        if (!auth.token && !auth.password) {
            return std::nullopt;
        }
        return auth;
    }

private:
    static std::optional<std::string> non_blank(const std::optional<std::string>& value) {
        if (!value) {
            return std::nullopt;
        }
        const auto not_space = [](unsigned char c) { return !std::isspace(c); };
        const auto first = std::find_if(value->begin(), value->end(), not_space);
        const auto last = std::find_if(value->rbegin(), value->rend(), not_space).base();
        if (first >= last) {
            return std::nullopt;
        }
        return std::string(first, last);
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Connect Request Params
// ═══════════════════════════════════════════════════════════════════════════

struct ConnectParams {
    int min_protocol{GATEWAY_PROTOCOL_VERSION};
    int max_protocol{GATEWAY_PROTOCOL_VERSION};
    ClientIdentity client;
    std::string role;
    std::vector<std::string> scopes;
    std::vector<std::string> caps;
    std::optional<ConnectAuth> auth;  ///< Key omitted entirely when absent
    std::string locale;
    std::string user_agent;

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"minProtocol", min_protocol},
            {"maxProtocol", max_protocol},
            {"client", client.to_json()},
            {"role", role},
            {"scopes", scopes},
            {"caps", caps},
            {"locale", locale},
            {"userAgent", user_agent}
        };
        if (auth) {
            j["auth"] = auth->to_json();
        }
        return j;
    }

    static ConnectParams from_json(const Json& j) {
        ConnectParams params;
        params.min_protocol = j.value("minProtocol", 0);
        params.max_protocol = j.value("maxProtocol", 0);
        if (j.contains("client") && j["client"].is_object()) {
            params.client = ClientIdentity::from_json(j["client"]);
        }
        params.role = j.value("role", "");
        params.scopes = j.value("scopes", std::vector<std::string>{});
        params.caps = j.value("caps", std::vector<std::string>{});
        if (j.contains("auth") && j["auth"].is_object()) {
            const auto& a = j["auth"];
            ConnectAuth auth;
            if (a.contains("token") && a["token"].is_string()) {
                auth.token = a["token"].get<std::string>();
            }
            if (a.contains("password") && a["password"].is_string()) {
                auth.password = a["password"].get<std::string>();
            }
            params.auth = std::move(auth);
        }
        params.locale = j.value("locale", "");
        params.user_agent = j.value("userAgent", "");
        return params;
    }
};

}  // namespace gwpp

#endif  // GWPP_PROTOCOL_GATEWAY_TYPES_HPP

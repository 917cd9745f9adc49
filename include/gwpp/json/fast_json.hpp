#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON parsing for inbound frames
// ─────────────────────────────────────────────────────────────────────────────
// Inbound gateway traffic is parsed with simdjson (On-Demand API) and
// materialized as nlohmann::json, which the rest of the library uses for
// inspection and for building outbound frames.
//
//   auto doc = gwpp::fast_parse(text);
//   if (doc && doc->is_object()) { ... }

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace gwpp {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using JsonParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    /// Documents nested deeper than this are rejected
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Parse a complete document. Trailing non-whitespace content is an error.
    [[nodiscard]] JsonParseResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] JsonParseResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_object(simdjson::ondemand::object object, std::size_t depth);
    [[nodiscard]] JsonParseResult convert_array(simdjson::ondemand::array array, std::size_t depth);

    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;
};

/// Parse with a thread-local parser
[[nodiscard]] JsonParseResult fast_parse(std::string_view text);

/// Name of the active simdjson kernel ("haswell", "arm64", "fallback", ...)
[[nodiscard]] std::string fast_json_implementation();

}  // namespace gwpp

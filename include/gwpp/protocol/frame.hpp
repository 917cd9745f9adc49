#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Gateway Frames
// ═══════════════════════════════════════════════════════════════════════════
// Every WebSocket text message is one JSON object discriminated by "type":
//
//   {"type":"event","event":"chat","payload":{...},"seq":12}
//   {"type":"req","id":"<uuid>","method":"chat.send","params":{...}}
//   {"type":"res","id":"<uuid>","ok":true,"payload":{...}}
//   {"type":"res","id":"<uuid>","ok":false,"error":{"message":"denied"}}
//
// Decoding is structural only: a frame is valid when it is a JSON object with
// a known "type" and the fields that kind needs. Event names and methods are
// never checked here.

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gwpp {

using Json = nlohmann::json;

struct FrameError {
    enum class Code {
        InvalidJson,   // not parseable
        NotAnObject,   // top-level value is not an object
        MissingType,   // no string "type" discriminant
        UnknownType,   // "type" is not event / req / res
        MissingField,  // a field required by the frame kind is absent
        InvalidField   // a field has the wrong JSON type
    };

    Code code{Code::InvalidJson};
    std::string message;
};

template <typename T>
using FrameResult = tl::expected<T, FrameError>;

struct EventFrame {
    std::string event;
    std::optional<Json> payload{};
    std::optional<std::int64_t> seq{};

    [[nodiscard]] Json to_json() const;
    static FrameResult<EventFrame> from_json(const Json& j);
};

struct RequestFrame {
    std::string id;
    std::string method;
    std::optional<Json> params{};

    [[nodiscard]] Json to_json() const;
    static FrameResult<RequestFrame> from_json(const Json& j);
};

struct ResponseFrame {
    std::string id;
    bool ok{false};
    std::optional<Json> payload{};
    std::optional<std::string> error_message{};  ///< error.message, when present

    [[nodiscard]] Json to_json() const;
    static FrameResult<ResponseFrame> from_json(const Json& j);
};

using Frame = std::variant<EventFrame, RequestFrame, ResponseFrame>;

namespace frame_type {
inline constexpr std::string_view Event    = "event";
inline constexpr std::string_view Request  = "req";
inline constexpr std::string_view Response = "res";
}  // namespace frame_type

/// Decode one wire message (parsed with simdjson)
[[nodiscard]] FrameResult<Frame> decode_frame(std::string_view text);

/// Decode an already-parsed JSON value
[[nodiscard]] FrameResult<Frame> frame_from_json(const Json& j);

[[nodiscard]] Json frame_to_json(const Frame& frame);

/// Compact wire form of a frame
[[nodiscard]] std::string encode_frame(const Frame& frame);

}  // namespace gwpp

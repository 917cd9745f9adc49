#include "gwpp/protocol/frame.hpp"
#include "gwpp/json/fast_json.hpp"

#include <cstdint>
#include <limits>

namespace gwpp {

namespace {

tl::unexpected<FrameError> frame_error(FrameError::Code code, std::string message) {
    return tl::unexpected(FrameError{code, std::move(message)});
}

FrameResult<std::string> required_string(const Json& j, const char* field) {
    const auto it = j.find(field);
    if (it == j.end()) {
        return frame_error(FrameError::Code::MissingField,
                           std::string("missing '") + field + "'");
    }
    if (!it->is_string()) {
        return frame_error(FrameError::Code::InvalidField,
                           std::string("'") + field + "' must be a string");
    }
    return it->get<std::string>();
}

/// Absent and explicit null are both treated as "no value"
std::optional<Json> optional_value(const Json& j, const char* field) {
    const auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// EventFrame
// ─────────────────────────────────────────────────────────────────────────────

Json EventFrame::to_json() const {
    Json j = {{"type", frame_type::Event}, {"event", event}};
    if (payload) {
        j["payload"] = *payload;
    }
    if (seq) {
        j["seq"] = *seq;
    }
    return j;
}

FrameResult<EventFrame> EventFrame::from_json(const Json& j) {
    auto name = required_string(j, "event");
    if (!name) {
        return tl::unexpected(name.error());
    }

    EventFrame frame;
    frame.event = std::move(*name);
    frame.payload = optional_value(j, "payload");

    if (const auto seq = optional_value(j, "seq")) {
        if (!seq->is_number_integer()) {
            return frame_error(FrameError::Code::InvalidField, "'seq' must be an integer");
        }
        // Unsigned values count as integers too; anything past int64 would wrap
        if (seq->is_number_unsigned()
            && seq->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return frame_error(FrameError::Code::InvalidField, "'seq' out of range");
        }
        frame.seq = seq->get<std::int64_t>();
    }
    return frame;
}

// ─────────────────────────────────────────────────────────────────────────────
// RequestFrame
// ─────────────────────────────────────────────────────────────────────────────

Json RequestFrame::to_json() const {
    Json j = {{"type", frame_type::Request}, {"id", id}, {"method", method}};
    if (params) {
        j["params"] = *params;
    }
    return j;
}

FrameResult<RequestFrame> RequestFrame::from_json(const Json& j) {
    auto id = required_string(j, "id");
    if (!id) {
        return tl::unexpected(id.error());
    }
    auto method = required_string(j, "method");
    if (!method) {
        return tl::unexpected(method.error());
    }
    return RequestFrame{std::move(*id), std::move(*method), optional_value(j, "params")};
}

// ─────────────────────────────────────────────────────────────────────────────
// ResponseFrame
// ─────────────────────────────────────────────────────────────────────────────

Json ResponseFrame::to_json() const {
    Json j = {{"type", frame_type::Response}, {"id", id}, {"ok", ok}};
    if (payload) {
        j["payload"] = *payload;
    }
    if (error_message) {
        j["error"] = {{"message", *error_message}};
    }
    return j;
}

FrameResult<ResponseFrame> ResponseFrame::from_json(const Json& j) {
    auto id = required_string(j, "id");
    if (!id) {
        return tl::unexpected(id.error());
    }

    const auto ok = j.find("ok");
    if (ok == j.end()) {
        return frame_error(FrameError::Code::MissingField, "missing 'ok'");
    }
    if (!ok->is_boolean()) {
        return frame_error(FrameError::Code::InvalidField, "'ok' must be a boolean");
    }

    ResponseFrame frame;
    frame.id = std::move(*id);
    frame.ok = ok->get<bool>();
    frame.payload = optional_value(j, "payload");

    // Lenient: a non-object error, or one without a string message, just
    // leaves error_message empty.
    if (const auto error = optional_value(j, "error"); error && error->is_object()) {
        const auto message = error->find("message");
        if (message != error->end() && message->is_string()) {
            frame.error_message = message->get<std::string>();
        }
    }
    return frame;
}

// ─────────────────────────────────────────────────────────────────────────────
// Codec
// ─────────────────────────────────────────────────────────────────────────────

FrameResult<Frame> frame_from_json(const Json& j) {
    if (!j.is_object()) {
        return frame_error(FrameError::Code::NotAnObject, "frame must be a JSON object");
    }

    const auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        return frame_error(FrameError::Code::MissingType, "frame has no string 'type'");
    }

    const auto& kind = type->get_ref<const std::string&>();
    if (kind == frame_type::Event) {
        return EventFrame::from_json(j).map([](EventFrame f) { return Frame{std::move(f)}; });
    }
    if (kind == frame_type::Response) {
        return ResponseFrame::from_json(j).map([](ResponseFrame f) { return Frame{std::move(f)}; });
    }
    if (kind == frame_type::Request) {
        return RequestFrame::from_json(j).map([](RequestFrame f) { return Frame{std::move(f)}; });
    }
    return frame_error(FrameError::Code::UnknownType, "unknown frame type '" + kind + "'");
}

FrameResult<Frame> decode_frame(std::string_view text) {
    auto parsed = fast_parse(text);
    if (!parsed) {
        return frame_error(FrameError::Code::InvalidJson, parsed.error().message);
    }
    return frame_from_json(*parsed);
}

Json frame_to_json(const Frame& frame) {
    return std::visit([](const auto& f) { return f.to_json(); }, frame);
}

std::string encode_frame(const Frame& frame) {
    // Invalid UTF-8 in caller-supplied params is replaced, never thrown
    return frame_to_json(frame).dump(-1, ' ', false, Json::error_handler_t::replace);
}

}  // namespace gwpp

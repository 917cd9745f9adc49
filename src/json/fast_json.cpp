#include "gwpp/json/fast_json.hpp"

namespace gwpp {

namespace {

tl::unexpected<JsonParseError> failure(simdjson::error_code code) {
    return tl::unexpected(JsonParseError(simdjson::error_message(code)));
}

}  // namespace

JsonParseResult FastJsonParser::parse(std::string_view text) {
    simdjson::padded_string padded(text);

    auto iterated = parser_.iterate(padded);
    if (iterated.error() != simdjson::SUCCESS) {
        return failure(iterated.error());
    }

    try {
        simdjson::ondemand::document document = std::move(iterated).value();
        auto root = document.get_value();
        if (root.error() != simdjson::SUCCESS) {
            return failure(root.error());
        }
        auto converted = convert(root.value(), 0);
        if (!converted) {
            return converted;
        }
        if (!document.at_end()) {
            return tl::unexpected(JsonParseError("Trailing content after JSON document"));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

JsonParseResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    auto type = value.type();
    if (type.error() != simdjson::SUCCESS) {
        return failure(type.error());
    }

    switch (type.value()) {
        case simdjson::ondemand::json_type::object: {
            auto object = value.get_object();
            if (object.error() != simdjson::SUCCESS) {
                return failure(object.error());
            }
            return convert_object(object.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto array = value.get_array();
            if (array.error() != simdjson::SUCCESS) {
                return failure(array.error());
            }
            return convert_array(array.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return failure(str.error());
            }
            return nlohmann::json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number: {
            // Sequence numbers and ids are integral; prefer exact integer forms
            auto as_int = value.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = value.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            auto as_double = value.get_double();
            if (as_double.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_double.value());
            }
            return failure(as_double.error());
        }

        case simdjson::ondemand::json_type::boolean: {
            auto flag = value.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return failure(flag.error());
            }
            return nlohmann::json(flag.value());
        }

        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonParseError("Unknown JSON type"));
}

JsonParseResult FastJsonParser::convert_object(simdjson::ondemand::object object, std::size_t depth) {
    nlohmann::json result = nlohmann::json::object();

    for (auto field : object) {
        auto key = field.unescaped_key();
        if (key.error() != simdjson::SUCCESS) {
            return failure(key.error());
        }
        std::string name(key.value());

        auto member = field.value();
        if (member.error() != simdjson::SUCCESS) {
            return failure(member.error());
        }

        auto converted = convert(member.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(name)] = std::move(*converted);
    }

    return result;
}

JsonParseResult FastJsonParser::convert_array(simdjson::ondemand::array array, std::size_t depth) {
    nlohmann::json result = nlohmann::json::array();

    for (auto element : array) {
        if (element.error() != simdjson::SUCCESS) {
            return failure(element.error());
        }
        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

JsonParseResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace gwpp

#include "mmlive/protocol/frame_parser.hpp"

#include <utility>

namespace mmlive {

namespace {

[[nodiscard]] tl::unexpected<FrameParseError> failure(simdjson::error_code code, std::size_t depth) {
    return tl::unexpected(FrameParseError{std::string(simdjson::error_message(code)), depth});
}

}  // namespace

FrameResult FrameParser::parse(std::string_view text) {
    const simdjson::padded_string padded(text);

    simdjson::ondemand::document document;
    if (auto code = parser_.iterate(padded).get(document); code != simdjson::SUCCESS) {
        return failure(code, 0);
    }

    try {
        simdjson::ondemand::value root;
        if (auto code = document.get_value().get(root); code != simdjson::SUCCESS) {
            return failure(code, 0);
        }

        auto built = build(root, 0);
        if (!built) {
            return built;
        }
        if (document.at_end() == false) {
            return tl::unexpected(FrameParseError{"trailing content after JSON value", 0});
        }
        return built;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(FrameParseError{e.what(), 0});
    }
}

FrameResult FrameParser::build(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > max_depth_) {
        return tl::unexpected(FrameParseError{
            "frame nested deeper than " + std::to_string(max_depth_) + " levels", depth});
    }

    simdjson::ondemand::json_type type;
    if (auto code = value.type().get(type); code != simdjson::SUCCESS) {
        return failure(code, depth);
    }

    switch (type) {
        case simdjson::ondemand::json_type::object: {
            simdjson::ondemand::object object;
            if (auto code = value.get_object().get(object); code != simdjson::SUCCESS) {
                return failure(code, depth);
            }
            Json out = Json::object();
            for (auto field : object) {
                std::string_view key;
                if (auto code = field.unescaped_key().get(key); code != simdjson::SUCCESS) {
                    return failure(code, depth);
                }
                simdjson::ondemand::value member;
                if (auto code = field.value().get(member); code != simdjson::SUCCESS) {
                    return failure(code, depth);
                }
                auto built = build(member, depth + 1);
                if (!built) {
                    return built;
                }
                out[std::string(key)] = std::move(*built);
            }
            return out;
        }

        case simdjson::ondemand::json_type::array: {
            simdjson::ondemand::array array;
            if (auto code = value.get_array().get(array); code != simdjson::SUCCESS) {
                return failure(code, depth);
            }
            Json out = Json::array();
            for (auto element : array) {
                simdjson::ondemand::value item;
                if (auto code = element.get(item); code != simdjson::SUCCESS) {
                    return failure(code, depth);
                }
                auto built = build(item, depth + 1);
                if (!built) {
                    return built;
                }
                out.push_back(std::move(*built));
            }
            return out;
        }

        case simdjson::ondemand::json_type::string: {
            std::string_view text;
            if (auto code = value.get_string().get(text); code != simdjson::SUCCESS) {
                return failure(code, depth);
            }
            return Json(std::string(text));
        }

        case simdjson::ondemand::json_type::number: {
            // Integers keep their integral type.
            simdjson::ondemand::number number;
            if (auto code = value.get_number().get(number); code != simdjson::SUCCESS) {
                return failure(code, depth);
            }
            if (number.is_int64()) {
                return Json(number.get_int64());
            }
            if (number.is_uint64()) {
                return Json(number.get_uint64());
            }
            return Json(number.get_double());
        }

        case simdjson::ondemand::json_type::boolean: {
            bool flag = false;
            if (auto code = value.get_bool().get(flag); code != simdjson::SUCCESS) {
                return failure(code, depth);
            }
            return Json(flag);
        }

        case simdjson::ondemand::json_type::null:
            return Json(nullptr);

        default:
            break;
    }
    return tl::unexpected(FrameParseError{"unsupported JSON value", depth});
}

FrameResult parse_frame(std::string_view text) {
    thread_local FrameParser parser;
    return parser.parse(text);
}

std::string frame_parser_backend() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace mmlive

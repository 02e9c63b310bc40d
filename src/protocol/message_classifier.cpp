#include "mmlive/protocol/message_classifier.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <exception>

namespace mmlive {

namespace {

[[nodiscard]] bool has_marker(const Json& raw, const char* key) {
    const auto it = raw.find(key);
    return it != raw.end() && !it->is_null();
}

template <typename T>
[[nodiscard]] InboundMessage decode_as(const Json& raw, const char* key) {
    try {
        return T::from_json(raw.at(key));
    } catch (const std::exception& e) {
        return Unrecognized{raw, std::string("malformed ") + key + ": " + e.what()};
    }
}

[[nodiscard]] std::optional<std::chrono::milliseconds> to_millis(double ms) noexcept {
    const bool is_valid = std::isfinite(ms) && ms >= 0.0;
    if (is_valid == false) {
        return std::nullopt;
    }
    if (ms >= static_cast<double>(kMaxTimeLeft.count())) {
        return kMaxTimeLeft;
    }
    return std::chrono::milliseconds{static_cast<std::int64_t>(ms)};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// classify
// ─────────────────────────────────────────────────────────────────────────────

InboundMessage classify(const Json& raw) noexcept {
    if (!raw.is_object()) {
        return Unrecognized{raw, "message is not a JSON object"};
    }

    if (has_marker(raw, "setupComplete")) {
        return SetupComplete{};
    }
    if (has_marker(raw, "goAway")) {
        return decode_as<GoAway>(raw, "goAway");
    }
    if (has_marker(raw, "sessionResumptionUpdate")) {
        return decode_as<SessionResumptionUpdate>(raw, "sessionResumptionUpdate");
    }
    if (has_marker(raw, "toolCall")) {
        return decode_as<ToolCall>(raw, "toolCall");
    }
    if (has_marker(raw, "toolCallCancellation")) {
        return decode_as<ToolCallCancellation>(raw, "toolCallCancellation");
    }
    if (has_marker(raw, "serverContent")) {
        return decode_as<ServerContent>(raw, "serverContent");
    }

    return Unrecognized{raw, "no known message field"};
}

// ─────────────────────────────────────────────────────────────────────────────
// partition_model_turn
// ─────────────────────────────────────────────────────────────────────────────

TurnPartition partition_model_turn(const Content& turn) {
    TurnPartition partition;
    for (const auto& part : turn.parts) {
        if (part.is_pcm_audio()) {
            partition.audio.push_back(part);
        } else {
            partition.other.push_back(part);
        }
    }
    return partition;
}

// ─────────────────────────────────────────────────────────────────────────────
// parse_time_left
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::chrono::milliseconds> parse_time_left(const Json& value) noexcept {
    if (value.is_number()) {
        return to_millis(value.get<double>());
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const auto& text = value.get_ref<const std::string&>();
    const char* first = text.data();
    const char* last = text.data() + text.size();
    while (first != last && (*first == ' ' || *first == '\t')) {
        ++first;
    }

    double number = 0.0;
    const auto [ptr, ec] = std::from_chars(first, last, number);
    const bool parsed = (ec == std::errc{}) && (ptr != first);
    if (parsed == false) {
        return std::nullopt;
    }

    const std::string_view suffix(ptr, static_cast<std::size_t>(last - ptr));
    if (suffix.starts_with("ms")) {
        return to_millis(number);
    }
    if (suffix.starts_with("s")) {
        return to_millis(number * 1000.0);
    }
    return to_millis(number);
}

}  // namespace mmlive

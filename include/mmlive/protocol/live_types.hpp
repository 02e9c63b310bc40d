#ifndef MMLIVE_PROTOCOL_LIVE_TYPES_HPP
#define MMLIVE_PROTOCOL_LIVE_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mmlive {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Live API Wire Types
// ═══════════════════════════════════════════════════════════════════════════
// Value types for the message shapes exchanged with the live service.
// Field names follow the service's camelCase JSON. Anything the client does
// not route on is carried through as raw JSON.

inline constexpr std::string_view PCM_AUDIO_MIME_PREFIX = "audio/pcm";

// ═══════════════════════════════════════════════════════════════════════════
// Content Parts
// ═══════════════════════════════════════════════════════════════════════════

struct InlineData {
    std::string mime_type;
    std::string data;  // Base64 encoded

    static InlineData from_json(const Json& j) {
        return {
            j.value("mimeType", ""),
            j.value("data", "")
        };
    }

    [[nodiscard]] Json to_json() const {
        return {{"mimeType", mime_type}, {"data", data}};
    }

    bool operator==(const InlineData&) const = default;
};

/// One fragment of a turn. Text and inline data get typed fields; every other
/// key (functionCall, executableCode, thought, ...) is kept in `extra`.
struct Part {
    std::optional<std::string> text;
    std::optional<InlineData> inline_data;
    Json extra = Json::object();

    [[nodiscard]] static Part from_text(std::string value) {
        Part part;
        part.text = std::move(value);
        return part;
    }

    [[nodiscard]] static Part from_inline_data(std::string mime_type, std::string data) {
        Part part;
        part.inline_data = InlineData{std::move(mime_type), std::move(data)};
        return part;
    }

    /// True for inline audio the client plays back directly ("audio/pcm...").
    [[nodiscard]] bool is_pcm_audio() const {
        return inline_data.has_value()
            && std::string_view(inline_data->mime_type).starts_with(PCM_AUDIO_MIME_PREFIX);
    }

    static Part from_json(const Json& j) {
        Part part;
        for (const auto& [key, value] : j.items()) {
            if (key == "text" && value.is_string()) {
                part.text = value.get<std::string>();
            } else if (key == "inlineData" && value.is_object()) {
                part.inline_data = InlineData::from_json(value);
            } else {
                part.extra[key] = value;
            }
        }
        return part;
    }

    [[nodiscard]] Json to_json() const {
        Json j = extra.is_object() ? extra : Json::object();
        if (text) {
            j["text"] = *text;
        }
        if (inline_data) {
            j["inlineData"] = inline_data->to_json();
        }
        return j;
    }

    bool operator==(const Part&) const = default;
};

/// A turn: ordered parts plus an optional author role ("model", "user").
struct Content {
    std::optional<std::string> role;
    std::vector<Part> parts;

    static Content from_json(const Json& j) {
        Content content;
        if (j.contains("role") && j["role"].is_string()) {
            content.role = j["role"].get<std::string>();
        }
        if (j.contains("parts") && j["parts"].is_array()) {
            for (const auto& p : j["parts"]) {
                content.parts.push_back(Part::from_json(p));
            }
        }
        return content;
    }

    [[nodiscard]] Json to_json() const {
        Json parts_json = Json::array();
        for (const auto& p : parts) {
            parts_json.push_back(p.to_json());
        }
        Json j = {{"parts", std::move(parts_json)}};
        if (role) {
            j["role"] = *role;
        }
        return j;
    }

    bool operator==(const Content&) const = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Client → Server
// ═══════════════════════════════════════════════════════════════════════════

/// One realtime media chunk ("audio/pcm;rate=16000", "image/jpeg", ...).
struct MediaChunk {
    std::string mime_type;
    std::string data;  // Base64 encoded

    [[nodiscard]] bool is_audio() const {
        return mime_type.find("audio") != std::string::npos;
    }

    [[nodiscard]] bool is_video() const {
        return mime_type.find("image") != std::string::npos;
    }

    [[nodiscard]] Json to_json() const {
        return {{"mimeType", mime_type}, {"data", data}};
    }
};

struct FunctionResponse {
    std::optional<std::string> id;
    std::string name;
    Json response = Json::object();

    static FunctionResponse from_json(const Json& j) {
        FunctionResponse fr;
        if (j.contains("id") && j["id"].is_string()) {
            fr.id = j["id"].get<std::string>();
        }
        fr.name = j.value("name", "");
        if (j.contains("response")) {
            fr.response = j["response"];
        }
        return fr;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"response", response}};
        if (id) {
            j["id"] = *id;
        }
        return j;
    }
};

struct ToolResponse {
    std::vector<FunctionResponse> function_responses;

    [[nodiscard]] bool empty() const noexcept {
        return function_responses.empty();
    }

    static ToolResponse from_json(const Json& j) {
        ToolResponse tr;
        if (j.contains("functionResponses") && j["functionResponses"].is_array()) {
            for (const auto& fr : j["functionResponses"]) {
                tr.function_responses.push_back(FunctionResponse::from_json(fr));
            }
        }
        return tr;
    }

    [[nodiscard]] Json to_json() const {
        Json responses = Json::array();
        for (const auto& fr : function_responses) {
            responses.push_back(fr.to_json());
        }
        return {{"functionResponses", std::move(responses)}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Server → Client
// ═══════════════════════════════════════════════════════════════════════════

struct FunctionCall {
    std::optional<std::string> id;
    std::string name;
    Json args = Json::object();

    static FunctionCall from_json(const Json& j) {
        FunctionCall call;
        if (j.contains("id") && j["id"].is_string()) {
            call.id = j["id"].get<std::string>();
        }
        call.name = j.value("name", "");
        if (j.contains("args")) {
            call.args = j["args"];
        }
        return call;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"args", args}};
        if (id) {
            j["id"] = *id;
        }
        return j;
    }
};

struct ToolCall {
    std::vector<FunctionCall> function_calls;

    static ToolCall from_json(const Json& j) {
        ToolCall tc;
        if (j.contains("functionCalls") && j["functionCalls"].is_array()) {
            for (const auto& c : j["functionCalls"]) {
                tc.function_calls.push_back(FunctionCall::from_json(c));
            }
        }
        return tc;
    }

    [[nodiscard]] Json to_json() const {
        Json calls = Json::array();
        for (const auto& c : function_calls) {
            calls.push_back(c.to_json());
        }
        return {{"functionCalls", std::move(calls)}};
    }
};

struct ToolCallCancellation {
    std::vector<std::string> ids;

    static ToolCallCancellation from_json(const Json& j) {
        ToolCallCancellation tcc;
        if (j.contains("ids") && j["ids"].is_array()) {
            for (const auto& id : j["ids"]) {
                tcc.ids.push_back(id.get<std::string>());
            }
        }
        return tcc;
    }

    [[nodiscard]] Json to_json() const {
        return {{"ids", ids}};
    }
};

/// Termination warning. `time_left` is kept raw; see parse_time_left().
struct GoAway {
    std::optional<Json> time_left;

    static GoAway from_json(const Json& j) {
        GoAway go_away;
        if (j.is_object() && j.contains("timeLeft") && !j["timeLeft"].is_null()) {
            go_away.time_left = j["timeLeft"];
        }
        return go_away;
    }
};

struct SessionResumptionUpdate {
    std::optional<std::string> new_handle;
    bool resumable{false};

    static SessionResumptionUpdate from_json(const Json& j) {
        SessionResumptionUpdate update;
        if (j.contains("newHandle") && j["newHandle"].is_string()) {
            update.new_handle = j["newHandle"].get<std::string>();
        }
        if (j.contains("resumable") && j["resumable"].is_boolean()) {
            update.resumable = j["resumable"].get<bool>();
        }
        return update;
    }
};

/// Generated content. `interrupted` and `turn_complete` are set when the
/// field is present, non-null and not explicitly false.
struct ServerContent {
    bool interrupted{false};
    bool turn_complete{false};
    std::optional<Content> model_turn;

    static ServerContent from_json(const Json& j) {
        ServerContent sc;
        auto flag = [&j](const char* key) {
            if (!j.contains(key)) {
                return false;
            }
            const auto& v = j[key];
            const bool explicit_false = v.is_boolean() && v.get<bool>() == false;
            return !(v.is_null() || explicit_false);
        };
        sc.interrupted = flag("interrupted");
        sc.turn_complete = flag("turnComplete");
        if (j.contains("modelTurn") && j["modelTurn"].is_object()) {
            sc.model_turn = Content::from_json(j["modelTurn"]);
        }
        return sc;
    }
};

}  // namespace mmlive

#endif  // MMLIVE_PROTOCOL_LIVE_TYPES_HPP

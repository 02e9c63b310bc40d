#include <catch2/catch_test_macros.hpp>

#include "mmlive/protocol/live_types.hpp"

using namespace mmlive;

// ─────────────────────────────────────────────────────────────────────────────
// Part
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Part parses text and inline data", "[types][part]") {
    SECTION("Text part") {
        const auto part = Part::from_json({{"text", "hello"}});
        REQUIRE(part.text == "hello");
        REQUIRE_FALSE(part.inline_data.has_value());
        REQUIRE(part.extra.empty());
    }

    SECTION("Inline data part") {
        const auto part = Part::from_json(
            {{"inlineData", {{"mimeType", "audio/pcm;rate=24000"}, {"data", "AAEC"}}}});
        REQUIRE(part.inline_data.has_value());
        REQUIRE(part.inline_data->mime_type == "audio/pcm;rate=24000");
        REQUIRE(part.inline_data->data == "AAEC");
    }

    SECTION("Unknown keys are carried in extra") {
        const Json raw = {{"executableCode", {{"code", "print(1)"}}}, {"thought", true}};
        const auto part = Part::from_json(raw);
        REQUIRE(part.extra["executableCode"]["code"] == "print(1)");
        REQUIRE(part.to_json() == raw);
    }
}

TEST_CASE("Part::is_pcm_audio matches the audio/pcm prefix only", "[types][part]") {
    REQUIRE(Part::from_inline_data("audio/pcm", "").is_pcm_audio());
    REQUIRE(Part::from_inline_data("audio/pcm;rate=24000", "").is_pcm_audio());
    REQUIRE_FALSE(Part::from_inline_data("audio/wav", "").is_pcm_audio());
    REQUIRE_FALSE(Part::from_inline_data("image/jpeg", "").is_pcm_audio());
    REQUIRE_FALSE(Part::from_text("audio/pcm").is_pcm_audio());
}

TEST_CASE("Content keeps part order and role", "[types][content]") {
    const Json raw = {
        {"role", "model"},
        {"parts", Json::array({{{"text", "a"}}, {{"text", "b"}}, {{"text", "c"}}})}
    };
    const auto content = Content::from_json(raw);

    REQUIRE(content.role == "model");
    REQUIRE(content.parts.size() == 3);
    REQUIRE(content.parts[0].text == "a");
    REQUIRE(content.parts[2].text == "c");
    REQUIRE(content.to_json() == raw);
}

// ─────────────────────────────────────────────────────────────────────────────
// Client → Server
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("MediaChunk classifies by mime substring", "[types][media]") {
    const MediaChunk audio{"audio/pcm;rate=16000", "AA=="};
    const MediaChunk video{"image/jpeg", "AA=="};
    const MediaChunk other{"application/octet-stream", "AA=="};

    REQUIRE(audio.is_audio());
    REQUIRE_FALSE(audio.is_video());
    REQUIRE(video.is_video());
    REQUIRE_FALSE(other.is_audio());
    REQUIRE_FALSE(other.is_video());
    REQUIRE(audio.to_json() == Json{{"mimeType", "audio/pcm;rate=16000"}, {"data", "AA=="}});
}

TEST_CASE("ToolResponse serializes functionResponses", "[types][tool]") {
    ToolResponse response;
    REQUIRE(response.empty());

    response.function_responses.push_back({"call-1", "lookup", {{"result", 42}}});
    REQUIRE_FALSE(response.empty());

    const auto j = response.to_json();
    REQUIRE(j["functionResponses"].size() == 1);
    REQUIRE(j["functionResponses"][0]["id"] == "call-1");
    REQUIRE(j["functionResponses"][0]["name"] == "lookup");
    REQUIRE(j["functionResponses"][0]["response"]["result"] == 42);

    const auto parsed = ToolResponse::from_json(j);
    REQUIRE(parsed.function_responses.size() == 1);
    REQUIRE(parsed.function_responses[0].id == "call-1");
}

// ─────────────────────────────────────────────────────────────────────────────
// Server → Client
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ToolCall parses function calls", "[types][tool]") {
    const auto call = ToolCall::from_json({{"functionCalls", Json::array({
        {{"id", "c1"}, {"name", "get_weather"}, {"args", {{"city", "Oslo"}}}},
        {{"name", "no_id"}}
    })}});

    REQUIRE(call.function_calls.size() == 2);
    REQUIRE(call.function_calls[0].id == "c1");
    REQUIRE(call.function_calls[0].args["city"] == "Oslo");
    REQUIRE_FALSE(call.function_calls[1].id.has_value());
    REQUIRE(call.function_calls[1].args.empty());
}

TEST_CASE("SessionResumptionUpdate defaults to not resumable", "[types][resumption]") {
    const auto update = SessionResumptionUpdate::from_json({{"newHandle", "h1"}});
    REQUIRE(update.new_handle == "h1");
    REQUIRE_FALSE(update.resumable);
}

TEST_CASE("ServerContent flags follow field presence", "[types][content]") {
    SECTION("Present and true") {
        const auto sc = ServerContent::from_json({{"turnComplete", true}});
        REQUIRE(sc.turn_complete);
        REQUIRE_FALSE(sc.interrupted);
    }

    SECTION("Explicit false is not set") {
        const auto sc = ServerContent::from_json({{"interrupted", false}, {"turnComplete", false}});
        REQUIRE_FALSE(sc.interrupted);
        REQUIRE_FALSE(sc.turn_complete);
    }

    SECTION("Model turn is optional") {
        REQUIRE_FALSE(ServerContent::from_json(Json::object()).model_turn.has_value());
        const auto sc = ServerContent::from_json({{"modelTurn", {{"parts", Json::array()}}}});
        REQUIRE(sc.model_turn.has_value());
        REQUIRE(sc.model_turn->parts.empty());
    }
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mmlive/protocol/frame_parser.hpp"
#include "mmlive/protocol/message_classifier.hpp"

#include <cstdint>
#include <string>

using namespace mmlive;
using Catch::Matchers::ContainsSubstring;

// ─────────────────────────────────────────────────────────────────────────────
// Server Frames
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("parse_frame decodes a model turn frame", "[frame]") {
    auto frame = parse_frame(R"({
        "serverContent": {
            "modelTurn": {
                "parts": [
                    {"inlineData": {"mimeType": "audio/pcm;rate=24000", "data": "AQID"}},
                    {"text": "café \"quoted\""}
                ]
            },
            "turnComplete": true
        }
    })");

    REQUIRE(frame.has_value());
    const auto& parts = (*frame)["serverContent"]["modelTurn"]["parts"];
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0]["inlineData"]["data"] == "AQID");
    REQUIRE(parts[1]["text"] == "caf\xC3\xA9 \"quoted\"");
    REQUIRE(kind_of(classify(*frame)) == MessageKind::ServerContent);
}

TEST_CASE("parse_frame keeps number kinds", "[frame]") {
    auto frame = parse_frame(
        R"({"usageMetadata": {"totalTokenCount": 9007199254740993, "big": 18446744073709551615,)"
        R"( "neg": -17, "ratio": 2.5e-3}, "goAway": {"timeLeft": 5000}})");

    REQUIRE(frame.has_value());
    const auto& usage = (*frame)["usageMetadata"];
    REQUIRE(usage["totalTokenCount"].is_number_integer());
    REQUIRE(usage["totalTokenCount"].get<std::int64_t>() == 9007199254740993LL);
    REQUIRE(usage["big"].is_number_unsigned());
    REQUIRE(usage["neg"] == -17);
    REQUIRE_THAT(usage["ratio"].get<double>(), Catch::Matchers::WithinRel(0.0025, 1e-9));
    REQUIRE((*frame)["goAway"]["timeLeft"] == 5000);
}

TEST_CASE("parse_frame handles empty containers and literals", "[frame]") {
    auto frame = parse_frame(R"({"setupComplete": {}, "ids": [], "flag": false, "none": null})");

    REQUIRE(frame.has_value());
    REQUIRE((*frame)["setupComplete"] == Json::object());
    REQUIRE((*frame)["ids"] == Json::array());
    REQUIRE((*frame)["flag"] == false);
    REQUIRE((*frame)["none"].is_null());
}

TEST_CASE("parse_frame rejects malformed frames", "[frame]") {
    SECTION("Invalid syntax") {
        REQUIRE_FALSE(parse_frame(R"({"setupComplete": })").has_value());
    }

    SECTION("Truncated") {
        REQUIRE_FALSE(parse_frame(R"({"serverContent": {"turnComplete": tr)").has_value());
    }

    SECTION("Empty or whitespace") {
        REQUIRE_FALSE(parse_frame("").has_value());
        REQUIRE_FALSE(parse_frame("   \n").has_value());
    }

    SECTION("Trailing content") {
        auto frame = parse_frame(R"({"setupComplete": {}} {"goAway": {}})");
        REQUIRE_FALSE(frame.has_value());
        REQUIRE_THAT(frame.error().message, ContainsSubstring("trailing"));
    }
}

TEST_CASE("FrameParser enforces the nesting limit", "[frame]") {
    FrameParser parser(4);
    REQUIRE(parser.max_depth() == 4);

    REQUIRE(parser.parse(R"({"a": {"b": {"c": 1}}})").has_value());

    auto deep = parser.parse(R"({"a": {"b": {"c": {"d": {"e": {"f": 1}}}}}})");
    REQUIRE_FALSE(deep.has_value());
    REQUIRE_THAT(deep.error().message, ContainsSubstring("deeper than 4"));
    REQUIRE(deep.error().depth == 5);
}

TEST_CASE("FrameParser can be reused across frames", "[frame]") {
    FrameParser parser;

    for (int i = 0; i < 50; ++i) {
        auto frame = parser.parse(R"({"toolCallCancellation": {"ids": ["c)" + std::to_string(i) + R"("]}})");
        REQUIRE(frame.has_value());
        REQUIRE((*frame)["toolCallCancellation"]["ids"][0] == "c" + std::to_string(i));
    }

    REQUIRE_FALSE(parser.parse("{").has_value());
    REQUIRE(parser.parse(R"({"setupComplete": {}})").has_value());
}

TEST_CASE("frame_parser_backend names a kernel", "[frame]") {
    REQUIRE_FALSE(frame_parser_backend().empty());
}

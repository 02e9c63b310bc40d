#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Server Frame Parser
// ─────────────────────────────────────────────────────────────────────────────
// Turns the text of one inbound frame into a Json document. simdjson does the
// parsing; the result is built as nlohmann::json because the wire types and
// the classifier work on that.
//
// Transport bindings call this on every text frame before handing the
// message to LiveSessionCallbacks::on_message. The replay transport uses it
// for recorded streams.
//
// Usage:
//   FrameParser parser;
//   auto message = parser.parse(frame_text);
//   if (!message) {
//       callbacks.on_error("bad frame: " + message.error().message);
//   }

#include "mmlive/transport.hpp"

#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mmlive {

struct FrameParseError {
    std::string message;
    std::size_t depth{0};  // Nesting level at which parsing stopped
};

using FrameResult = tl::expected<Json, FrameParseError>;

class FrameParser {
public:
    /// Frames nested deeper than this are rejected.
    static constexpr std::size_t kDefaultMaxDepth = 64;

    FrameParser() = default;
    explicit FrameParser(std::size_t max_depth) : max_depth_(max_depth) {}

    /// Not thread-safe; use one parser per reading thread.
    [[nodiscard]] FrameResult parse(std::string_view text);

    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    [[nodiscard]] FrameResult build(simdjson::ondemand::value value, std::size_t depth);

    simdjson::ondemand::parser parser_;
    std::size_t max_depth_{kDefaultMaxDepth};
};

/// Parse with a thread-local FrameParser.
[[nodiscard]] FrameResult parse_frame(std::string_view text);

/// Active simdjson kernel ("haswell", "arm64", "fallback", ...).
[[nodiscard]] std::string frame_parser_backend();

}  // namespace mmlive

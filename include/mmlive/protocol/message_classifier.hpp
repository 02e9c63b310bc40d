#ifndef MMLIVE_PROTOCOL_MESSAGE_CLASSIFIER_HPP
#define MMLIVE_PROTOCOL_MESSAGE_CLASSIFIER_HPP

#include "mmlive/protocol/live_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mmlive {

// ═══════════════════════════════════════════════════════════════════════════
// Inbound Message Classification
// ═══════════════════════════════════════════════════════════════════════════
// Maps one raw server message to exactly one category. First match wins:
//
//   setupComplete            → SetupComplete
//   goAway                   → GoAway
//   sessionResumptionUpdate  → SessionResumptionUpdate
//   toolCall                 → ToolCall
//   toolCallCancellation     → ToolCallCancellation
//   serverContent            → ServerContent
//   anything else            → Unrecognized
//
// classify() never throws. A recognized marker whose payload fails to decode
// comes back as Unrecognized with the decode error in `reason`.

struct SetupComplete {};

struct Unrecognized {
    Json raw;
    std::string reason;
};

using InboundMessage = std::variant<
    SetupComplete,
    GoAway,
    SessionResumptionUpdate,
    ToolCall,
    ToolCallCancellation,
    ServerContent,
    Unrecognized
>;

enum class MessageKind {
    SetupComplete,
    GoAway,
    SessionResumptionUpdate,
    ToolCall,
    ToolCallCancellation,
    ServerContent,
    Unrecognized
};

[[nodiscard]] constexpr std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::SetupComplete:           return "SetupComplete";
        case MessageKind::GoAway:                  return "GoAway";
        case MessageKind::SessionResumptionUpdate: return "SessionResumptionUpdate";
        case MessageKind::ToolCall:                return "ToolCall";
        case MessageKind::ToolCallCancellation:    return "ToolCallCancellation";
        case MessageKind::ServerContent:           return "ServerContent";
        case MessageKind::Unrecognized:            return "Unrecognized";
    }
    return "Unknown";
}

/// Variant index and MessageKind line up one to one.
[[nodiscard]] inline MessageKind kind_of(const InboundMessage& message) noexcept {
    return static_cast<MessageKind>(message.index());
}

[[nodiscard]] InboundMessage classify(const Json& raw) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Model Turn Partitioning
// ─────────────────────────────────────────────────────────────────────────────

struct TurnPartition {
    std::vector<Part> audio;  // PCM inline audio, original order
    std::vector<Part> other;  // Everything else, original order
};

[[nodiscard]] TurnPartition partition_model_turn(const Content& turn);

// ─────────────────────────────────────────────────────────────────────────────
// GoAway timeLeft
// ─────────────────────────────────────────────────────────────────────────────
// Accepts a non-negative number (milliseconds) or a string starting with a
// non-negative number. String suffix "s" means seconds ("9.5s", the protobuf
// Duration form); "ms" or no suffix means milliseconds. Values beyond
// kMaxTimeLeft are clamped to it so the result always fits a timer deadline.

inline constexpr std::chrono::milliseconds kMaxTimeLeft =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max()) / 4;

[[nodiscard]] std::optional<std::chrono::milliseconds> parse_time_left(const Json& value) noexcept;

}  // namespace mmlive

#endif  // MMLIVE_PROTOCOL_MESSAGE_CLASSIFIER_HPP

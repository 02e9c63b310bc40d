#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Live Session Transport Contract
// ═══════════════════════════════════════════════════════════════════════════
// The bidirectional channel to the live service is supplied by a binding
// (SDK wrapper, WebSocket client, replay harness). The client only consumes
// this contract.
//
// Callback rules for implementations:
// - on_open / on_message / on_error / on_close may arrive on any thread,
//   including from inside open() before it returns.
// - on_close is delivered at most once per session.
// - Callbacks must not be invoked after the session object is destroyed.

#include "mmlive/protocol/live_types.hpp"
#include "mmlive/transport.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mmlive {

/// WebSocket normal-closure code. Any other code counts as abnormal.
inline constexpr int kNormalClosureCode = 1000;

// ═══════════════════════════════════════════════════════════════════════════
// Session Callbacks
// ═══════════════════════════════════════════════════════════════════════════

struct LiveSessionCallbacks {
    std::function<void()> on_open;
    std::function<void(const Json& message)> on_message;
    std::function<void(const std::string& message)> on_error;
    std::function<void(int code, const std::string& reason)> on_close;
};

// ═══════════════════════════════════════════════════════════════════════════
// Connect Request
// ═══════════════════════════════════════════════════════════════════════════

struct ConnectRequest {
    std::string model;
    Json config;  // Caller config plus sessionResumption / contextWindowCompression

    /// Handle carried in config.sessionResumption.handle, if any.
    [[nodiscard]] std::optional<std::string> resumption_handle() const {
        if (!config.is_object()) {
            return std::nullopt;
        }
        const auto it = config.find("sessionResumption");
        if (it == config.end() || !it->is_object()) {
            return std::nullopt;
        }
        const auto handle = it->find("handle");
        if (handle == it->end() || !handle->is_string()) {
            return std::nullopt;
        }
        return handle->get<std::string>();
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Live Session Interface
// ═══════════════════════════════════════════════════════════════════════════

class ILiveSession {
public:
    virtual ~ILiveSession() = default;

    /// Stream one media chunk (audio / video frame)
    virtual TransportResult<void> send_realtime_input(const MediaChunk& chunk) = 0;

    /// Answer one or more function calls
    virtual TransportResult<void> send_tool_response(const ToolResponse& response) = 0;

    /// Send conversational turns
    virtual TransportResult<void> send_client_content(
        const std::vector<Part>& turns,
        bool turn_complete
    ) = 0;

    /// Close the channel. Idempotent.
    virtual void close() = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Live Transport Interface
// ═══════════════════════════════════════════════════════════════════════════

class ILiveTransport {
public:
    virtual ~ILiveTransport() = default;

    /// Open a session. Blocks until the service accepts or rejects it.
    [[nodiscard]] virtual TransportResult<std::shared_ptr<ILiveSession>> open(
        const ConnectRequest& request,
        LiveSessionCallbacks callbacks
    ) = 0;
};

}  // namespace mmlive

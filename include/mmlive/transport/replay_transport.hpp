#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Replay Transport
// ═══════════════════════════════════════════════════════════════════════════
// An ILiveTransport whose server side is driven by the caller. Used by the
// replay tool, the examples and the tests.
//
// - open() records the ConnectRequest, then either fails (fail_next_opens)
//   or returns a session and fires on_open before returning.
// - Outbound sends on the current session are recorded in order.
// - feed(), feed_text(), feed_error() and simulate_close() drive the
//   current session's callbacks on the calling thread.
// - Closing a session from the client side delivers on_close(1000) once,
//   like a WebSocket close handshake.
//
// Usage:
//   auto transport = std::make_shared<ReplayTransport>();
//   LiveClient client(io.get_executor(), transport);
//   client.connect("models/live", Json::object());
//   transport->feed({{"setupComplete", Json::object()}});
//   transport->simulate_close(1011, "internal error");

#include "mmlive/transport/live_transport.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace mmlive {

/// One outbound call recorded by a replay session.
struct SentMessage {
    enum class Kind {
        RealtimeInput,
        ToolResponse,
        ClientContent
    };

    Kind kind{};
    Json payload;  // Wire form of the call's argument(s)
};

[[nodiscard]] constexpr std::string_view to_string(SentMessage::Kind kind) noexcept {
    switch (kind) {
        case SentMessage::Kind::RealtimeInput: return "realtimeInput";
        case SentMessage::Kind::ToolResponse:  return "toolResponse";
        case SentMessage::Kind::ClientContent: return "clientContent";
    }
    return "unknown";
}

class ReplayTransport final : public ILiveTransport {
public:
    ReplayTransport();
    ~ReplayTransport() override;

    ReplayTransport(const ReplayTransport&) = delete;
    ReplayTransport& operator=(const ReplayTransport&) = delete;

    // ILiveTransport
    [[nodiscard]] TransportResult<std::shared_ptr<ILiveSession>> open(
        const ConnectRequest& request,
        LiveSessionCallbacks callbacks
    ) override;

    // ─────────────────────────────────────────────────────────────────────────
    // Scripting
    // ─────────────────────────────────────────────────────────────────────────

    /// The next `count` open() calls are refused with a network error.
    void fail_next_opens(std::size_t count);

    /// Deliver a server message to the current session. False if none is open.
    bool feed(const Json& message);

    /// Deliver one raw text frame the way a socket binding would: parsed
    /// frames go to on_message, malformed ones to on_error.
    bool feed_text(std::string_view frame);

    /// Deliver a transport error to the current session. False if none is open.
    bool feed_error(const std::string& message);

    /// Close the current session from the server side. False if none is open.
    bool simulate_close(int code, const std::string& reason);

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<ConnectRequest> connect_requests() const;
    [[nodiscard]] std::size_t open_attempts() const;
    [[nodiscard]] std::vector<SentMessage> sent() const;
    void clear_sent();
    [[nodiscard]] bool has_open_session() const;

    /// Read a recorded server stream: one JSON message per line, blank lines
    /// and lines starting with '#' skipped.
    [[nodiscard]] static tl::expected<std::vector<Json>, std::string> load_jsonl(
        const std::filesystem::path& path
    );

private:
    class Session;
    struct State;

    [[nodiscard]] std::shared_ptr<Session> current() const;

    std::shared_ptr<State> state_;
};

}  // namespace mmlive

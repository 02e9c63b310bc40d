#pragma once

#include "mmlive/client/event_emitter.hpp"
#include "mmlive/client/live_client_config.hpp"
#include "mmlive/client/reconnection_policy.hpp"
#include "mmlive/log/logger.hpp"
#include "mmlive/protocol/live_types.hpp"
#include "mmlive/protocol/message_classifier.hpp"
#include "mmlive/transport/live_transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mmlive {

// ─────────────────────────────────────────────────────────────────────────────
// Connection Status
// ─────────────────────────────────────────────────────────────────────────────
//
//   ┌──────────────┐  connect()   ┌────────────┐  open ok   ┌───────────┐
//   │ Disconnected │─────────────▶│ Connecting │───────────▶│ Connected │
//   └──────────────┘              └────────────┘            └─────┬─────┘
//          ▲   ▲                        │ open failed             │
//          │   └────────────────────────┘                         │
//          │        close / disconnect() / GoAway handover        │
//          └──────────────────────────────────────────────────────┘
//
// Abnormal closures and failed opens schedule a backoff timer that calls
// connect() again with the stored model and configuration.

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
    }
    return "unknown";
}

/// Snapshot returned by LiveClient::reconnection_status().
struct ReconnectionStatus {
    bool enabled{true};
    std::size_t attempts{0};
    std::size_t max_attempts{0};
    bool has_resumption_handle{false};

    bool operator==(const ReconnectionStatus&) const = default;
};

/// Caller configuration plus the session options every connect carries:
/// `sessionResumption` ({"handle": h} or {}) and
/// `contextWindowCompression` ({"slidingWindow": {}}).
[[nodiscard]] Json build_connect_config(
    const Json& requested,
    const std::optional<std::string>& resumption_handle
);

// ═══════════════════════════════════════════════════════════════════════════
// LiveClient
// ═══════════════════════════════════════════════════════════════════════════
// Long-lived streaming session client. Owns at most one live session,
// classifies every inbound message into typed notifications, and survives
// transient drops through session resumption and exponential backoff.
//
// Thread safety: every public method may be called from any thread. One
// mutex guards all mutable state; it is never held while calling into the
// transport or into listeners, so listeners may call back into the client.
//
// Timers (backoff and GoAway handover) run on a strand of the executor
// passed in. The executor must be running for automatic reconnection.
//
// Destruction waits for session and timer handlers running on other threads
// to return; afterwards no listener is invoked. Listeners must not destroy
// the client they are registered on.
//
// Usage:
//   asio::io_context io;
//   LiveClient client(io.get_executor(), transport, LiveClientConfig{});
//   client.events().on_content([](const Content& turn) { ... });
//   client.connect("models/live-model", {{"responseModalities", {"AUDIO"}}});
//   client.send(Part::from_text("hello"));
//   io.run();

class LiveClient {
public:
    LiveClient(
        asio::any_io_executor executor,
        std::shared_ptr<ILiveTransport> transport,
        LiveClientConfig config = {}
    );

    ~LiveClient();

    LiveClient(const LiveClient&) = delete;
    LiveClient& operator=(const LiveClient&) = delete;
    LiveClient(LiveClient&&) = delete;
    LiveClient& operator=(LiveClient&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Open a session. Returns false without touching state when a session
    /// is already connecting or connected, and false when the open fails
    /// (a reconnection is scheduled if auto-reconnect is on).
    bool connect(const std::string& model, const Json& config);

    /// Close the current session. No automatic reconnection follows.
    /// Returns false when there was no session to close.
    bool disconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Outbound Commands
    // ─────────────────────────────────────────────────────────────────────────
    // All three are dropped silently while no session is open.

    void send_realtime_input(const std::vector<MediaChunk>& chunks);

    /// Nothing is sent for a response without function responses.
    void send_tool_response(const ToolResponse& response);

    void send(const Part& part, bool turn_complete = true);
    void send(const std::vector<Part>& parts, bool turn_complete = true);

    // ─────────────────────────────────────────────────────────────────────────
    // Reconnection Control
    // ─────────────────────────────────────────────────────────────────────────

    void set_auto_reconnect(bool enabled);

    [[nodiscard]] ReconnectionStatus reconnection_status() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ConnectionStatus status() const;

    /// Model of the last connect() call.
    [[nodiscard]] std::optional<std::string> model() const;

    /// Configuration of the last connect() call, without the session options
    /// the client adds. Null before the first connect().
    [[nodiscard]] Json config() const;

    [[nodiscard]] std::optional<std::string> resumption_handle() const;

    [[nodiscard]] LiveClientEvents& events() noexcept { return events_; }

private:
    using Generation = std::uint64_t;
    using Epoch = std::uint64_t;

    class HandlerGate;

    // Connect path shared by connect(), backoff timer and GoAway handover.
    // expected_epoch: abort if the reconnect epoch moved on.
    bool connect_impl(
        const std::string& model,
        const Json& config,
        std::optional<Epoch> expected_epoch
    );

    LiveSessionCallbacks make_callbacks(Generation generation);
    [[nodiscard]] std::shared_ptr<ILiveSession> current_session() const;

    // Session callbacks
    void handle_open(Generation generation);
    void handle_message(Generation generation, const Json& raw);
    void handle_error(Generation generation, const std::string& message);
    void handle_close(Generation generation, int code, const std::string& reason);

    // Inbound message reactions
    void on_go_away(Generation generation, const GoAway& go_away);
    void on_resumption_update(const SessionResumptionUpdate& update);
    void on_server_content(const ServerContent& content, const Json& raw);

    // Reconnection
    void schedule_reconnect();
    void on_reconnect_timer(Epoch epoch);
    void on_go_away_timer(Epoch epoch, Generation generation);
    void cancel_reconnect_timer();
    void cancel_all_timers();

    /// Publish a `log` notification and mirror it to the operational logger.
    void log_event(std::string_view type, Json message, LogLevel level = LogLevel::Debug);

    // Immutable after construction
    std::shared_ptr<ILiveTransport> transport_;
    LiveClientConfig config_;
    std::shared_ptr<ILogger> logger_;
    LiveClientEvents events_;

    // Timers live on the strand; only strand handlers touch them.
    asio::strand<asio::any_io_executor> strand_;
    asio::steady_timer reconnect_timer_;
    asio::steady_timer go_away_timer_;

    // Every timer and transport handler enters this before touching the
    // client; the destructor closes it and drains running handlers.
    std::shared_ptr<HandlerGate> gate_;

    mutable std::mutex mutex_;
    ConnectionStatus status_{ConnectionStatus::Disconnected};
    std::shared_ptr<ILiveSession> session_;
    Generation generation_{0};      // Bumped whenever the current session is retired
    Epoch reconnect_epoch_{0};      // Bumped to invalidate every pending timer
    bool manual_disconnect_{false};
    std::optional<std::string> model_;
    Json requested_config_;
    std::optional<std::string> resumption_handle_;
    ReconnectionPolicy reconnection_;
};

}  // namespace mmlive

#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Live Client Notifications
// ═══════════════════════════════════════════════════════════════════════════
// Typed publish/subscribe surface for application collaborators.
//
// Usage:
//   auto id = client.events().on_audio([](const ByteBuffer& pcm) { ... });
//   client.events().on_content([](const Content& turn) { ... });
//   ...
//   client.events().off(id);
//
// Listeners run synchronously on the thread that produced the notification
// (usually the transport's read thread). Keep them short; hand slow work to
// an executor. A listener that throws is logged and skipped.

#include "mmlive/log/logger.hpp"
#include "mmlive/protocol/live_types.hpp"
#include "mmlive/util/base64.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mmlive {

// ─────────────────────────────────────────────────────────────────────────────
// Event Kinds
// ─────────────────────────────────────────────────────────────────────────────

enum class LiveEvent {
    Open,
    Close,
    Error,
    SetupComplete,
    Audio,
    Content,
    Interrupted,
    TurnComplete,
    ToolCall,
    ToolCallCancellation,
    Log
};

[[nodiscard]] constexpr std::string_view to_string(LiveEvent event) noexcept {
    switch (event) {
        case LiveEvent::Open:                 return "open";
        case LiveEvent::Close:                return "close";
        case LiveEvent::Error:                return "error";
        case LiveEvent::SetupComplete:        return "setupcomplete";
        case LiveEvent::Audio:                return "audio";
        case LiveEvent::Content:              return "content";
        case LiveEvent::Interrupted:          return "interrupted";
        case LiveEvent::TurnComplete:         return "turncomplete";
        case LiveEvent::ToolCall:             return "toolcall";
        case LiveEvent::ToolCallCancellation: return "toolcallcancellation";
        case LiveEvent::Log:                  return "log";
    }
    return "unknown";
}

/// Payload of the `log` notification.
struct StreamingLog {
    std::chrono::system_clock::time_point timestamp;
    std::string type;  // "client.send", "server.goaway", ...
    Json message;

    [[nodiscard]] Json to_json() const {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()
        ).count();
        return {{"date", ms}, {"type", type}, {"message", message}};
    }
};

using ListenerId = std::uint64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Signal - ordered listener list for one notification kind
// ─────────────────────────────────────────────────────────────────────────────

template <typename... Args>
class Signal {
public:
    using Listener = std::function<void(Args...)>;

    void connect(ListenerId id, Listener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.emplace_back(id, std::move(listener));
    }

    bool disconnect(ListenerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(listeners_.begin(), listeners_.end(),
            [id](const auto& entry) { return entry.first == id; });
        if (it == listeners_.end()) {
            return false;
        }
        listeners_.erase(it);
        return true;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    // Listeners are copied out first so they may (un)subscribe while running.
    void emit(ILogger& logger, std::string_view name, const Args&... args) const {
        std::vector<std::pair<ListenerId, Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = listeners_;
        }
        for (const auto& [id, listener] : snapshot) {
            try {
                listener(args...);
            } catch (const std::exception& e) {
                logger.error_fmt("Listener {} for '{}' threw: {}", id, name, e.what());
            }
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
};

// ─────────────────────────────────────────────────────────────────────────────
// LiveClientEvents
// ─────────────────────────────────────────────────────────────────────────────

class LiveClientEvents {
public:
    explicit LiveClientEvents(std::shared_ptr<ILogger> logger)
        : logger_(std::move(logger))
    {}

    LiveClientEvents(const LiveClientEvents&) = delete;
    LiveClientEvents& operator=(const LiveClientEvents&) = delete;

    // Subscription

    ListenerId on_open(std::function<void()> fn) {
        return subscribe(open_, std::move(fn));
    }
    ListenerId on_close(std::function<void(int code, const std::string& reason)> fn) {
        return subscribe(close_, std::move(fn));
    }
    ListenerId on_error(std::function<void(const std::string& message)> fn) {
        return subscribe(error_, std::move(fn));
    }
    ListenerId on_setup_complete(std::function<void()> fn) {
        return subscribe(setup_complete_, std::move(fn));
    }
    ListenerId on_audio(std::function<void(const ByteBuffer& data)> fn) {
        return subscribe(audio_, std::move(fn));
    }
    ListenerId on_content(std::function<void(const Content& model_turn)> fn) {
        return subscribe(content_, std::move(fn));
    }
    ListenerId on_interrupted(std::function<void()> fn) {
        return subscribe(interrupted_, std::move(fn));
    }
    ListenerId on_turn_complete(std::function<void()> fn) {
        return subscribe(turn_complete_, std::move(fn));
    }
    ListenerId on_tool_call(std::function<void(const ToolCall& call)> fn) {
        return subscribe(tool_call_, std::move(fn));
    }
    ListenerId on_tool_call_cancellation(std::function<void(const ToolCallCancellation& cancellation)> fn) {
        return subscribe(tool_call_cancellation_, std::move(fn));
    }
    ListenerId on_log(std::function<void(const StreamingLog& log)> fn) {
        return subscribe(log_, std::move(fn));
    }

    /// Remove a listener registered through any on_* method.
    bool off(ListenerId id) {
        return open_.disconnect(id)
            || close_.disconnect(id)
            || error_.disconnect(id)
            || setup_complete_.disconnect(id)
            || audio_.disconnect(id)
            || content_.disconnect(id)
            || interrupted_.disconnect(id)
            || turn_complete_.disconnect(id)
            || tool_call_.disconnect(id)
            || tool_call_cancellation_.disconnect(id)
            || log_.disconnect(id);
    }

    [[nodiscard]] std::size_t listener_count(LiveEvent event) const {
        switch (event) {
            case LiveEvent::Open:                 return open_.size();
            case LiveEvent::Close:                return close_.size();
            case LiveEvent::Error:                return error_.size();
            case LiveEvent::SetupComplete:        return setup_complete_.size();
            case LiveEvent::Audio:                return audio_.size();
            case LiveEvent::Content:              return content_.size();
            case LiveEvent::Interrupted:          return interrupted_.size();
            case LiveEvent::TurnComplete:         return turn_complete_.size();
            case LiveEvent::ToolCall:             return tool_call_.size();
            case LiveEvent::ToolCallCancellation: return tool_call_cancellation_.size();
            case LiveEvent::Log:                  return log_.size();
        }
        return 0;
    }

    // Publication (used by LiveClient)

    void emit_open() const { open_.emit(*logger_, to_string(LiveEvent::Open)); }
    void emit_close(int code, const std::string& reason) const {
        close_.emit(*logger_, to_string(LiveEvent::Close), code, reason);
    }
    void emit_error(const std::string& message) const {
        error_.emit(*logger_, to_string(LiveEvent::Error), message);
    }
    void emit_setup_complete() const {
        setup_complete_.emit(*logger_, to_string(LiveEvent::SetupComplete));
    }
    void emit_audio(const ByteBuffer& data) const {
        audio_.emit(*logger_, to_string(LiveEvent::Audio), data);
    }
    void emit_content(const Content& model_turn) const {
        content_.emit(*logger_, to_string(LiveEvent::Content), model_turn);
    }
    void emit_interrupted() const {
        interrupted_.emit(*logger_, to_string(LiveEvent::Interrupted));
    }
    void emit_turn_complete() const {
        turn_complete_.emit(*logger_, to_string(LiveEvent::TurnComplete));
    }
    void emit_tool_call(const ToolCall& call) const {
        tool_call_.emit(*logger_, to_string(LiveEvent::ToolCall), call);
    }
    void emit_tool_call_cancellation(const ToolCallCancellation& cancellation) const {
        tool_call_cancellation_.emit(*logger_, to_string(LiveEvent::ToolCallCancellation), cancellation);
    }
    void emit_log(const StreamingLog& log) const {
        log_.emit(*logger_, to_string(LiveEvent::Log), log);
    }

private:
    template <typename SignalT, typename Fn>
    ListenerId subscribe(SignalT& signal, Fn&& fn) {
        const ListenerId id = next_id_.fetch_add(1, std::memory_order_relaxed);
        signal.connect(id, std::forward<Fn>(fn));
        return id;
    }

    std::shared_ptr<ILogger> logger_;
    std::atomic<ListenerId> next_id_{1};

    Signal<> open_;
    Signal<int, std::string> close_;
    Signal<std::string> error_;
    Signal<> setup_complete_;
    Signal<ByteBuffer> audio_;
    Signal<Content> content_;
    Signal<> interrupted_;
    Signal<> turn_complete_;
    Signal<ToolCall> tool_call_;
    Signal<ToolCallCancellation> tool_call_cancellation_;
    Signal<StreamingLog> log_;
};

}  // namespace mmlive

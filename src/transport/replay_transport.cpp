#include "mmlive/transport/replay_transport.hpp"
#include "mmlive/log/logger.hpp"
#include "mmlive/protocol/frame_parser.hpp"

#include <fstream>
#include <utility>

namespace mmlive {

// ═══════════════════════════════════════════════════════════════════════════
// Shared State
// ═══════════════════════════════════════════════════════════════════════════

struct ReplayTransport::State {
    mutable std::mutex mutex;
    std::vector<ConnectRequest> requests;
    std::size_t failures_remaining{0};
    std::vector<SentMessage> sent;
    std::shared_ptr<Session> current;

    void record(SentMessage::Kind kind, Json payload) {
        std::lock_guard<std::mutex> lock(mutex);
        sent.push_back({kind, std::move(payload)});
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════

class ReplayTransport::Session final : public ILiveSession {
public:
    Session(std::shared_ptr<State> state, LiveSessionCallbacks callbacks)
        : state_(std::move(state))
        , callbacks_(std::move(callbacks))
    {}

    TransportResult<void> send_realtime_input(const MediaChunk& chunk) override {
        if (is_closed()) {
            return tl::unexpected(TransportError::closed());
        }
        state_->record(SentMessage::Kind::RealtimeInput, chunk.to_json());
        return {};
    }

    TransportResult<void> send_tool_response(const ToolResponse& response) override {
        if (is_closed()) {
            return tl::unexpected(TransportError::closed());
        }
        state_->record(SentMessage::Kind::ToolResponse, response.to_json());
        return {};
    }

    TransportResult<void> send_client_content(
        const std::vector<Part>& turns,
        bool turn_complete
    ) override {
        if (is_closed()) {
            return tl::unexpected(TransportError::closed());
        }
        Json parts = Json::array();
        for (const auto& part : turns) {
            parts.push_back(part.to_json());
        }
        state_->record(SentMessage::Kind::ClientContent,
            {{"turns", std::move(parts)}, {"turnComplete", turn_complete}});
        return {};
    }

    void close() override {
        deliver_close(kNormalClosureCode, "closed by client");
    }

    void deliver_open() {
        std::function<void()> callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            callback = callbacks_.on_open;
        }
        if (callback) {
            callback();
        }
    }

    bool deliver_message(const Json& message) {
        std::function<void(const Json&)> callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            callback = callbacks_.on_message;
        }
        if (callback) {
            callback(message);
        }
        return true;
    }

    bool deliver_error(const std::string& message) {
        std::function<void(const std::string&)> callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            callback = callbacks_.on_error;
        }
        if (callback) {
            callback(message);
        }
        return true;
    }

    // on_close is delivered at most once.
    bool deliver_close(int code, const std::string& reason) {
        std::function<void(int, const std::string&)> callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            closed_ = true;
            callback = callbacks_.on_close;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->current.get() == this) {
                state_->current.reset();
            }
        }
        if (callback) {
            callback(code, reason);
        }
        return true;
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::shared_ptr<State> state_;
    LiveSessionCallbacks callbacks_;
    mutable std::mutex mutex_;
    bool closed_{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// ReplayTransport
// ═══════════════════════════════════════════════════════════════════════════

ReplayTransport::ReplayTransport()
    : state_(std::make_shared<State>())
{}

ReplayTransport::~ReplayTransport() {
    // Break the State <-> Session cycle.
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->current.reset();
}

TransportResult<std::shared_ptr<ILiveSession>> ReplayTransport::open(
    const ConnectRequest& request,
    LiveSessionCallbacks callbacks
) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->requests.push_back(request);

        if (state_->failures_remaining > 0) {
            --state_->failures_remaining;
            get_logger().debug("replay: refusing open for " + request.model);
            return tl::unexpected(TransportError::network("replay: open refused"));
        }

        session = std::make_shared<Session>(state_, std::move(callbacks));
        state_->current = session;
    }

    session->deliver_open();
    return std::static_pointer_cast<ILiveSession>(session);
}

void ReplayTransport::fail_next_opens(std::size_t count) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->failures_remaining = count;
}

std::shared_ptr<ReplayTransport::Session> ReplayTransport::current() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->current;
}

bool ReplayTransport::feed(const Json& message) {
    auto session = current();
    return session && session->deliver_message(message);
}

bool ReplayTransport::feed_text(std::string_view frame) {
    auto session = current();
    if (!session) {
        return false;
    }
    auto message = parse_frame(frame);
    if (!message) {
        return session->deliver_error("malformed frame: " + message.error().message);
    }
    return session->deliver_message(*message);
}

bool ReplayTransport::feed_error(const std::string& message) {
    auto session = current();
    return session && session->deliver_error(message);
}

bool ReplayTransport::simulate_close(int code, const std::string& reason) {
    auto session = current();
    return session && session->deliver_close(code, reason);
}

std::vector<ConnectRequest> ReplayTransport::connect_requests() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->requests;
}

std::size_t ReplayTransport::open_attempts() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->requests.size();
}

std::vector<SentMessage> ReplayTransport::sent() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->sent;
}

void ReplayTransport::clear_sent() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->sent.clear();
}

bool ReplayTransport::has_open_session() const {
    return current() != nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSONL loading
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<std::vector<Json>, std::string> ReplayTransport::load_jsonl(
    const std::filesystem::path& path
) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected("cannot open " + path.string());
    }

    std::vector<Json> messages;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        auto message = parse_frame(line);
        if (!message) {
            return tl::unexpected(
                path.string() + ":" + std::to_string(line_number) + ": " + message.error().message);
        }
        messages.push_back(std::move(*message));
    }
    return messages;
}

}  // namespace mmlive

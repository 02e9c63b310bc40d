#include "mmlive/client/live_client.hpp"
#include "mmlive/util/base64.hpp"

#include <asio/bind_executor.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <condition_variable>
#include <stdexcept>
#include <thread>
#include <utility>

namespace mmlive {

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

Json build_connect_config(
    const Json& requested,
    const std::optional<std::string>& resumption_handle
) {
    Json enhanced = requested.is_object() ? requested : Json::object();
    enhanced["sessionResumption"] = resumption_handle
        ? Json{{"handle", *resumption_handle}}
        : Json::object();
    enhanced["contextWindowCompression"] = {{"slidingWindow", Json::object()}};
    return enhanced;
}

namespace {

[[nodiscard]] std::shared_ptr<ILogger> resolve_logger(const LiveClientConfig& config) {
    return config.logger ? config.logger : global_logger_handle();
}

[[nodiscard]] std::string_view media_label(bool has_audio, bool has_video) noexcept {
    if (has_audio && has_video) {
        return "audio + video";
    }
    if (has_audio) {
        return "audio";
    }
    if (has_video) {
        return "video";
    }
    return "unknown";
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Handler Gate
// ═══════════════════════════════════════════════════════════════════════════
// Records the threads currently inside a handler. Once closed, no handler
// enters, and close_and_wait() blocks until every handler running on another
// thread has left. Handlers on the closing thread itself are not waited for.

class LiveClient::HandlerGate {
public:
    class Scope {
    public:
        explicit Scope(HandlerGate& gate)
            : gate_(gate)
            , entered_(gate.enter())
        {}

        ~Scope() {
            if (entered_) {
                gate_.leave();
            }
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        explicit operator bool() const noexcept { return entered_; }

    private:
        HandlerGate& gate_;
        bool entered_;
    };

    void close_and_wait() {
        const auto self = std::this_thread::get_id();
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        idle_.wait(lock, [this, self]() {
            return std::all_of(active_.begin(), active_.end(),
                [self](std::thread::id id) { return id == self; });
        });
    }

private:
    bool enter() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        active_.push_back(std::this_thread::get_id());
        return true;
    }

    void leave() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = std::find(active_.begin(), active_.end(), std::this_thread::get_id());
            if (it != active_.end()) {
                active_.erase(it);
            }
        }
        idle_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable idle_;
    std::vector<std::thread::id> active_;
    bool closed_{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

LiveClient::LiveClient(
    asio::any_io_executor executor,
    std::shared_ptr<ILiveTransport> transport,
    LiveClientConfig config
)
    : transport_(std::move(transport))
    , config_(std::move(config))
    , logger_(resolve_logger(config_))
    , events_(logger_)
    , strand_(asio::make_strand(executor))
    , reconnect_timer_(strand_)
    , go_away_timer_(strand_)
    , gate_(std::make_shared<HandlerGate>())
    , reconnection_(config_.max_reconnect_attempts, config_.reconnect_base_delay)
{
    if (!transport_) {
        throw std::invalid_argument("LiveClient requires a transport");
    }
    const auto valid = config_.validate();
    if (!valid) {
        throw std::invalid_argument("Invalid LiveClientConfig: " + valid.error());
    }
    if (config_.auto_reconnect == false) {
        reconnection_.set_enabled(false);
    }
}

LiveClient::~LiveClient() {
    // From here on this thread is the only one touching the timers.
    gate_->close_and_wait();

    reconnect_timer_.cancel();
    go_away_timer_.cancel();

    std::shared_ptr<ILiveSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(session_);
        ++generation_;
        ++reconnect_epoch_;
    }
    if (session) {
        session->close();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

bool LiveClient::connect(const std::string& model, const Json& config) {
    return connect_impl(model, config, std::nullopt);
}

bool LiveClient::connect_impl(
    const std::string& model,
    const Json& config,
    std::optional<Epoch> expected_epoch
) {
    const bool config_ok = config.is_object() || config.is_null();
    if (config_ok == false) {
        log_event("client.error", "connect rejected: configuration must be a JSON object", LogLevel::Error);
        return false;
    }

    ConnectRequest request;
    Generation generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != ConnectionStatus::Disconnected) {
            logger_->debug_fmt("connect ignored while {}", to_string(status_));
            return false;
        }
        if (expected_epoch && *expected_epoch != reconnect_epoch_) {
            return false;
        }

        status_ = ConnectionStatus::Connecting;
        model_ = model;
        requested_config_ = config;
        manual_disconnect_ = false;
        generation = ++generation_;

        request.model = model;
        request.config = build_connect_config(config, resumption_handle_);
    }

    logger_->info_fmt("Connecting to {} (resuming: {})",
        model, request.resumption_handle().has_value());

    auto opened = transport_->open(request, make_callbacks(generation));

    if (!opened) {
        bool current = false;
        bool retry = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = (generation == generation_);
            if (current) {
                status_ = ConnectionStatus::Disconnected;
                retry = reconnection_.enabled() && !manual_disconnect_;
            }
        }
        if (current == false) {
            return false;
        }

        log_event("client.error",
            "Error connecting: " + opened.error().message, LogLevel::Error);
        if (retry) {
            schedule_reconnect();
        }
        return false;
    }

    auto session = std::move(*opened);
    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale = (generation != generation_);
        if (stale == false) {
            session_ = session;
            status_ = ConnectionStatus::Connected;
            reconnection_.reset();
            ++reconnect_epoch_;
        }
    }

    // Disconnected or closed while the open was in flight.
    if (stale) {
        logger_->debug("Session retired before open completed; closing it");
        session->close();
        return false;
    }

    cancel_reconnect_timer();
    logger_->info_fmt("Connected to {}", model);
    return true;
}

bool LiveClient::disconnect() {
    std::shared_ptr<ILiveSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A manual disconnect also voids any reconnection still in flight.
        manual_disconnect_ = true;
        ++reconnect_epoch_;
        ++generation_;
        session = std::move(session_);
        status_ = ConnectionStatus::Disconnected;
    }
    cancel_all_timers();

    if (!session) {
        return false;
    }

    session->close();
    log_event("client.close", "Disconnected", LogLevel::Info);
    events_.emit_close(config_.normal_closure_code, "client disconnect");
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound Commands
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<ILiveSession> LiveClient::current_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void LiveClient::send_realtime_input(const std::vector<MediaChunk>& chunks) {
    auto session = current_session();
    if (!session) {
        return;
    }

    bool has_audio = false;
    bool has_video = false;
    for (const auto& chunk : chunks) {
        auto sent = session->send_realtime_input(chunk);
        if (!sent) {
            logger_->warn_fmt("realtime input ({}) not sent: {}", chunk.mime_type, sent.error().message);
        }
        has_audio = has_audio || chunk.is_audio();
        has_video = has_video || chunk.is_video();
    }
    log_event("client.realtimeInput", std::string(media_label(has_audio, has_video)), LogLevel::Trace);
}

void LiveClient::send_tool_response(const ToolResponse& response) {
    if (response.empty()) {
        return;
    }
    auto session = current_session();
    if (!session) {
        return;
    }

    auto sent = session->send_tool_response(response);
    if (!sent) {
        logger_->warn_fmt("tool response not sent: {}", sent.error().message);
    }
    log_event("client.toolResponse", response.to_json());
}

void LiveClient::send(const Part& part, bool turn_complete) {
    send(std::vector<Part>{part}, turn_complete);
}

void LiveClient::send(const std::vector<Part>& parts, bool turn_complete) {
    auto session = current_session();
    if (!session) {
        return;
    }

    auto sent = session->send_client_content(parts, turn_complete);
    if (!sent) {
        logger_->warn_fmt("client content not sent: {}", sent.error().message);
    }

    Json turns = Json::array();
    for (const auto& part : parts) {
        turns.push_back(part.to_json());
    }
    log_event("client.send", {{"turns", std::move(turns)}, {"turnComplete", turn_complete}});
}

// ═══════════════════════════════════════════════════════════════════════════
// Reconnection Control
// ═══════════════════════════════════════════════════════════════════════════

void LiveClient::set_auto_reconnect(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnection_.set_enabled(enabled);
        if (enabled == false) {
            ++reconnect_epoch_;
        }
    }
    if (enabled == false) {
        cancel_all_timers();
    }
    logger_->info_fmt("Auto-reconnection {}", enabled ? "enabled" : "disabled");
}

ReconnectionStatus LiveClient::reconnection_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        reconnection_.enabled(),
        reconnection_.attempts(),
        reconnection_.max_attempts(),
        resumption_handle_.has_value()
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

ConnectionStatus LiveClient::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<std::string> LiveClient::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

Json LiveClient::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_config_;
}

std::optional<std::string> LiveClient::resumption_handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resumption_handle_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Session Callbacks
// ═══════════════════════════════════════════════════════════════════════════

LiveSessionCallbacks LiveClient::make_callbacks(Generation generation) {
    auto gate = gate_;
    LiveSessionCallbacks callbacks;
    callbacks.on_open = [this, gate, generation]() {
        HandlerGate::Scope scope(*gate);
        if (scope) {
            handle_open(generation);
        }
    };
    callbacks.on_message = [this, gate, generation](const Json& raw) {
        HandlerGate::Scope scope(*gate);
        if (scope) {
            handle_message(generation, raw);
        }
    };
    callbacks.on_error = [this, gate, generation](const std::string& message) {
        HandlerGate::Scope scope(*gate);
        if (scope) {
            handle_error(generation, message);
        }
    };
    callbacks.on_close = [this, gate, generation](int code, const std::string& reason) {
        HandlerGate::Scope scope(*gate);
        if (scope) {
            handle_close(generation, code, reason);
        }
    };
    return callbacks;
}

void LiveClient::handle_open(Generation generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
    }
    log_event("client.open", "Connected", LogLevel::Info);
    events_.emit_open();
}

void LiveClient::handle_error(Generation generation, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
    }
    log_event("server.error", message, LogLevel::Warn);
    events_.emit_error(message);
}

void LiveClient::handle_close(Generation generation, int code, const std::string& reason) {
    bool reconnect = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            logger_->debug_fmt("Ignoring close ({}) from a retired session", code);
            return;
        }
        status_ = ConnectionStatus::Disconnected;
        session_.reset();
        ++generation_;

        const bool abnormal = (code != config_.normal_closure_code);
        reconnect = abnormal && reconnection_.enabled() && !manual_disconnect_;
    }

    log_event("server.close",
        reason.empty() ? std::string("disconnected") : "disconnected with reason: " + reason,
        LogLevel::Info);

    if (reconnect) {
        logger_->warn_fmt("Connection lost ({}: {}). Attempting auto-reconnection",
            code, reason.empty() ? "unknown reason" : reason);
        schedule_reconnect();
    }

    events_.emit_close(code, reason);
}

void LiveClient::handle_message(Generation generation, const Json& raw) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
    }

    const auto message = classify(raw);
    switch (kind_of(message)) {
        case MessageKind::SetupComplete:
            log_event("server.send", "setupComplete");
            events_.emit_setup_complete();
            break;

        case MessageKind::GoAway:
            on_go_away(generation, std::get<GoAway>(message));
            break;

        case MessageKind::SessionResumptionUpdate:
            on_resumption_update(std::get<SessionResumptionUpdate>(message));
            break;

        case MessageKind::ToolCall:
            log_event("server.toolCall", raw);
            events_.emit_tool_call(std::get<ToolCall>(message));
            break;

        case MessageKind::ToolCallCancellation:
            log_event("server.toolCallCancellation", raw);
            events_.emit_tool_call_cancellation(std::get<ToolCallCancellation>(message));
            break;

        case MessageKind::ServerContent:
            on_server_content(std::get<ServerContent>(message), raw);
            break;

        case MessageKind::Unrecognized: {
            const auto& unrecognized = std::get<Unrecognized>(message);
            log_event("server.unrecognized",
                {{"reason", unrecognized.reason}, {"message", unrecognized.raw}});
            break;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound Message Reactions
// ═══════════════════════════════════════════════════════════════════════════

void LiveClient::on_go_away(Generation generation, const GoAway& go_away) {
    const std::string time_left_text = go_away.time_left
        ? (go_away.time_left->is_string() ? go_away.time_left->get<std::string>() : go_away.time_left->dump())
        : std::string("unknown time");
    log_event("server.goaway", "Connection terminating in " + time_left_text, LogLevel::Warn);

    if (!go_away.time_left) {
        return;
    }
    const auto time_left = parse_time_left(*go_away.time_left);
    if (!time_left) {
        logger_->warn_fmt("GoAway timeLeft '{}' is not a duration; no handover scheduled", time_left_text);
        return;
    }

    Epoch epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reconnection_.enabled() == false) {
            return;
        }
        epoch = reconnect_epoch_;
    }

    const auto delay = std::max(std::chrono::milliseconds{0}, *time_left - config_.goaway_lead_time);
    logger_->info_fmt("Scheduling session handover in {}ms", delay.count());

    auto gate = gate_;
    asio::post(strand_, [this, gate, epoch, generation, delay]() {
        HandlerGate::Scope scope(*gate);
        if (!scope) {
            return;
        }
        go_away_timer_.expires_after(delay);
        go_away_timer_.async_wait(asio::bind_executor(strand_,
            [this, gate, epoch, generation](asio::error_code ec) {
                if (ec) {
                    return;  // Cancelled or replaced
                }
                HandlerGate::Scope scope(*gate);
                if (!scope) {
                    return;
                }
                on_go_away_timer(epoch, generation);
            }
        ));
    });
}

void LiveClient::on_resumption_update(const SessionResumptionUpdate& update) {
    const bool has_handle = update.new_handle.has_value() && !update.new_handle->empty();
    if (update.resumable == false || has_handle == false) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resumption_handle_ = update.new_handle;
    }
    log_event("server.resumption", "New resumption handle: " + *update.new_handle);
}

void LiveClient::on_server_content(const ServerContent& content, const Json& raw) {
    if (content.interrupted) {
        log_event("server.content", "interrupted");
        events_.emit_interrupted();
        return;
    }

    // Not exclusive with modelTurn: both may arrive in one message.
    if (content.turn_complete) {
        log_event("server.content", "turnComplete");
        events_.emit_turn_complete();
    }

    if (!content.model_turn) {
        return;
    }

    auto partition = partition_model_turn(*content.model_turn);
    for (const auto& part : partition.audio) {
        if (part.inline_data->data.empty()) {
            continue;
        }
        auto decoded = base64_decode(part.inline_data->data);
        if (!decoded) {
            logger_->warn_fmt("Dropping audio part ({}): {}", part.inline_data->mime_type, decoded.error());
            continue;
        }
        const auto size = decoded->size();
        events_.emit_audio(*decoded);
        log_event("server.audio", "buffer (" + std::to_string(size) + ")", LogLevel::Trace);
    }

    if (partition.other.empty()) {
        return;
    }

    Content turn;
    turn.role = content.model_turn->role;
    turn.parts = std::move(partition.other);
    events_.emit_content(turn);
    log_event("server.content", raw);
}

// ═══════════════════════════════════════════════════════════════════════════
// Reconnection
// ═══════════════════════════════════════════════════════════════════════════

void LiveClient::schedule_reconnect() {
    std::optional<std::chrono::milliseconds> delay;
    Epoch epoch = 0;
    std::size_t attempt = 0;
    bool dropped_handle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = reconnection_.schedule();
        epoch = reconnect_epoch_;
        attempt = reconnection_.attempts();
        if (!delay && resumption_handle_) {
            // Exhausted retries may mean a rejected handle; the next connect starts fresh.
            resumption_handle_.reset();
            dropped_handle = true;
        }
    }

    if (!delay) {
        log_event("client.reconnect",
            "Max reconnection attempts (" + std::to_string(config_.max_reconnect_attempts)
                + ") reached. Auto-reconnection disabled.",
            LogLevel::Fatal);
        if (dropped_handle) {
            logger_->warn("Resumption handle discarded; next connect opens a fresh session");
        }
        return;
    }

    logger_->info_fmt("Scheduling reconnection attempt {}/{} in {}ms",
        attempt, config_.max_reconnect_attempts, delay->count());

    auto gate = gate_;
    const auto wait = *delay;
    asio::post(strand_, [this, gate, epoch, wait]() {
        HandlerGate::Scope scope(*gate);
        if (!scope) {
            return;
        }
        reconnect_timer_.expires_after(wait);
        reconnect_timer_.async_wait(asio::bind_executor(strand_,
            [this, gate, epoch](asio::error_code ec) {
                if (ec) {
                    return;
                }
                HandlerGate::Scope scope(*gate);
                if (!scope) {
                    return;
                }
                on_reconnect_timer(epoch);
            }
        ));
    });
}

void LiveClient::on_reconnect_timer(Epoch epoch) {
    std::string model;
    Json config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool stale = (epoch != reconnect_epoch_) || manual_disconnect_;
        if (stale) {
            return;
        }
        if (!model_) {
            logger_->error("Cannot reconnect: missing model or configuration");
            return;
        }
        if (status_ != ConnectionStatus::Disconnected) {
            return;
        }
        model = *model_;
        config = requested_config_;
    }

    log_event("client.reconnect", "Attempting reconnection with session resumption", LogLevel::Info);
    if (connect_impl(model, config, epoch)) {
        logger_->info("Reconnected; session resumed");
        events_.emit_setup_complete();
    }
}

void LiveClient::on_go_away_timer(Epoch epoch, Generation generation) {
    std::shared_ptr<ILiveSession> retired;
    std::string model;
    Json config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool still_current = (epoch == reconnect_epoch_)
            && (generation == generation_)
            && (status_ == ConnectionStatus::Connected)
            && (manual_disconnect_ == false);
        if (still_current == false || !model_) {
            return;
        }
        // Retire the warned session first so at most one stays live.
        retired = std::move(session_);
        status_ = ConnectionStatus::Disconnected;
        ++generation_;
        model = *model_;
        config = requested_config_;
    }

    log_event("client.reconnect", "Replacing session before server termination", LogLevel::Info);
    if (retired) {
        retired->close();
    }
    if (connect_impl(model, config, epoch)) {
        events_.emit_setup_complete();
    }
}

void LiveClient::cancel_reconnect_timer() {
    auto gate = gate_;
    asio::post(strand_, [this, gate]() {
        HandlerGate::Scope scope(*gate);
        if (scope) {
            reconnect_timer_.cancel();
        }
    });
}

void LiveClient::cancel_all_timers() {
    auto gate = gate_;
    asio::post(strand_, [this, gate]() {
        HandlerGate::Scope scope(*gate);
        if (scope) {
            reconnect_timer_.cancel();
            go_away_timer_.cancel();
        }
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

void LiveClient::log_event(std::string_view type, Json message, LogLevel level) {
    if (logger_->should_log(level)) {
        const std::string text = message.is_string() ? message.get<std::string>() : message.dump();
        logger_->event(level, type, text);
    }
    events_.emit_log(StreamingLog{
        std::chrono::system_clock::now(),
        std::string(type),
        std::move(message)
    });
}

}  // namespace mmlive

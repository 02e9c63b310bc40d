// ─────────────────────────────────────────────────────────────────────────────
// mmlive-replay - Recorded Session Player
// ─────────────────────────────────────────────────────────────────────────────
// Pushes a recorded server stream (JSON lines) through a LiveClient backed by
// the replay transport and prints every notification the client raises.
//
// Usage:
//   mmlive-replay --file session.jsonl
//   mmlive-replay --file session.jsonl --json > events.jsonl
//   mmlive-replay --file drop.jsonl --close-code 1011 --log-level debug
//
// Each non-blank line of the input is one server message, for example:
//   {"setupComplete": {}}
//   {"serverContent": {"modelTurn": {"parts": [{"text": "hi"}]}, "turnComplete": true}}
//   # comments are skipped
//
// After the last message the session is closed with --close-code. An
// abnormal code shows the reconnection the client would schedule; the
// backoff timer itself is not run.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <asio/io_context.hpp>

#include "mmlive/client/live_client.hpp"
#include "mmlive/log/spdlog_logger.hpp"
#include "mmlive/transport/replay_transport.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace mmlive;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

class EventPrinter {
public:
    explicit EventPrinter(bool json_output) : json_output_(json_output) {}

    void print(LiveEvent event, const Json& payload = nullptr) const {
        if (json_output_) {
            Json line = {{"event", to_string(event)}};
            if (!payload.is_null()) {
                line["payload"] = payload;
            }
            std::cout << line.dump() << "\n";
            return;
        }

        std::cout << color::c(event_color(event)) << to_string(event) << color::c(color::reset);
        if (!payload.is_null()) {
            std::cout << " " << color::c(color::dim)
                      << (payload.is_string() ? payload.get<std::string>() : payload.dump())
                      << color::c(color::reset);
        }
        std::cout << "\n";
    }

private:
    static const char* event_color(LiveEvent event) {
        switch (event) {
            case LiveEvent::Error:
            case LiveEvent::Close:
                return color::red;
            case LiveEvent::Open:
            case LiveEvent::SetupComplete:
                return color::green;
            case LiveEvent::ToolCall:
            case LiveEvent::ToolCallCancellation:
            case LiveEvent::Interrupted:
                return color::yellow;
            default:
                return color::cyan;
        }
    }

    bool json_output_;
};

void subscribe_all(LiveClientEvents& events, const EventPrinter& out, bool show_logs) {
    events.on_open([&out] { out.print(LiveEvent::Open); });
    events.on_close([&out](int code, const std::string& reason) {
        out.print(LiveEvent::Close, {{"code", code}, {"reason", reason}});
    });
    events.on_error([&out](const std::string& message) { out.print(LiveEvent::Error, message); });
    events.on_setup_complete([&out] { out.print(LiveEvent::SetupComplete); });
    events.on_audio([&out](const ByteBuffer& data) {
        out.print(LiveEvent::Audio, {{"bytes", data.size()}});
    });
    events.on_content([&out](const Content& turn) { out.print(LiveEvent::Content, turn.to_json()); });
    events.on_interrupted([&out] { out.print(LiveEvent::Interrupted); });
    events.on_turn_complete([&out] { out.print(LiveEvent::TurnComplete); });
    events.on_tool_call([&out](const ToolCall& call) { out.print(LiveEvent::ToolCall, call.to_json()); });
    events.on_tool_call_cancellation([&out](const ToolCallCancellation& cancellation) {
        out.print(LiveEvent::ToolCallCancellation, cancellation.to_json());
    });
    if (show_logs) {
        events.on_log([&out](const StreamingLog& log) { out.print(LiveEvent::Log, log.to_json()); });
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mmlive-replay", "Replay a recorded live session stream");

    options.add_options()
        ("f,file", "JSONL file with one server message per line", cxxopts::value<std::string>())
        ("m,model", "Model name passed to connect()", cxxopts::value<std::string>()->default_value("models/replay"))
        ("c,close-code", "Close code delivered after the last message", cxxopts::value<int>()->default_value("1000"))
        ("l,log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("warn"))
        ("show-logs", "Also print `log` notifications")
        ("j,json", "Print notifications as JSON lines")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (result.count("file") == 0) {
            print_error("--file is required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        const bool json_output = result.count("json") > 0;
        color::enabled = !result.count("no-color") && !json_output;
        set_logger(make_spdlog_console_logger(parse_log_level(result["log-level"].as<std::string>())));

        auto messages = ReplayTransport::load_jsonl(result["file"].as<std::string>());
        if (!messages) {
            print_error(messages.error());
            return 1;
        }

        const EventPrinter out(json_output);

        asio::io_context io;
        auto transport = std::make_shared<ReplayTransport>();
        LiveClient client(io.get_executor(), transport);

        subscribe_all(client.events(), out, result.count("show-logs") > 0);

        if (client.connect(result["model"].as<std::string>(), Json::object()) == false) {
            print_error("connect failed");
            return 1;
        }

        for (const auto& message : *messages) {
            transport->feed(message);
        }
        transport->simulate_close(result["close-code"].as<int>(), "replay finished");

        const auto status = client.reconnection_status();
        if (json_output == false) {
            std::cout << "\n" << color::c(color::bold) << "Replayed " << messages->size()
                      << " message(s)" << color::c(color::reset) << "\n"
                      << "  resumption handle: " << client.resumption_handle().value_or("(none)") << "\n"
                      << "  auto-reconnect:    " << (status.enabled ? "enabled" : "disabled")
                      << " (" << status.attempts << "/" << status.max_attempts << " attempts scheduled)\n";
        }
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}

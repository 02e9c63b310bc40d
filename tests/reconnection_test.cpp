// ─────────────────────────────────────────────────────────────────────────────
// Reconnection Tests - backoff timer, session resumption, GoAway handover
// ─────────────────────────────────────────────────────────────────────────────
// These run the io_context so the strand timers fire. Base delays are a few
// milliseconds; io.run() returns once no timer is pending.

#include <catch2/catch_test_macros.hpp>

#include "mmlive/client/live_client.hpp"
#include "mmlive/transport/replay_transport.hpp"
#include "mocks/event_recorder.hpp"
#include "mocks/manual_transport.hpp"
#include "mocks/recording_logger.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

using namespace mmlive;
using namespace std::chrono_literals;
using mmlive::testing::EventRecorder;
using mmlive::testing::ManualTransport;
using mmlive::testing::RecordingLogger;

namespace {

const std::string kModel = "models/live-test";

Json resumption_update(const std::string& handle) {
    return {{"sessionResumptionUpdate", {{"newHandle", handle}, {"resumable", true}}}};
}

LiveClientConfig fast_config(std::shared_ptr<ILogger> logger) {
    return LiveClientConfig{}
        .with_reconnect_base_delay(1ms)
        .with_goaway_lead_time(0ms)
        .with_logger(std::move(logger));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Backoff Reconnection
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Abnormal closure reconnects with the resumption handle", "[reconnect][resume]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    auto logger = std::make_shared<RecordingLogger>();
    LiveClient client(io.get_executor(), transport, fast_config(logger));
    EventRecorder recorder(client.events());

    const Json requested = {{"responseModalities", {"AUDIO"}}};
    REQUIRE(client.connect(kModel, requested));
    transport->feed(resumption_update("h1"));
    recorder.clear();

    REQUIRE(transport->simulate_close(1011, "internal error"));
    REQUIRE(client.reconnection_status().attempts == 1);

    io.run();

    REQUIRE(client.status() == ConnectionStatus::Connected);
    REQUIRE(client.reconnection_status() == ReconnectionStatus{true, 0, 5, true});

    const auto requests = transport->connect_requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[1].model == kModel);
    REQUIRE(requests[1].resumption_handle() == "h1");
    REQUIRE(requests[1].config["responseModalities"] == Json{"AUDIO"});

    REQUIRE(recorder.kinds() == std::vector<LiveEvent>{
        LiveEvent::Close, LiveEvent::Open, LiveEvent::SetupComplete
    });
    REQUIRE(recorder.logs_of("client.reconnect").size() == 1);
}

TEST_CASE("Normal closure never reconnects", "[reconnect]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));

    REQUIRE(client.connect(kModel, Json::object()));
    REQUIRE(transport->simulate_close(1000, ""));

    io.run();

    REQUIRE(transport->open_attempts() == 1);
    REQUIRE(client.status() == ConnectionStatus::Disconnected);
    REQUIRE(client.reconnection_status().enabled);
}

TEST_CASE("Failed reconnections back off exponentially then give up", "[reconnect][backoff]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    auto logger = std::make_shared<RecordingLogger>();
    LiveClient client(io.get_executor(), transport, fast_config(logger));
    EventRecorder recorder(client.events());

    REQUIRE(client.connect(kModel, Json::object()));
    transport->fail_next_opens(100);
    REQUIRE(transport->simulate_close(1006, "abnormal"));

    io.run();

    // 1 initial open + 5 retries.
    REQUIRE(transport->open_attempts() == 6);
    REQUIRE(client.status() == ConnectionStatus::Disconnected);
    REQUIRE_FALSE(client.reconnection_status().enabled);

    REQUIRE(logger->contains("attempt 1/5 in 1ms"));
    REQUIRE(logger->contains("attempt 2/5 in 2ms"));
    REQUIRE(logger->contains("attempt 3/5 in 4ms"));
    REQUIRE(logger->contains("attempt 4/5 in 8ms"));
    REQUIRE(logger->contains("attempt 5/5 in 16ms"));
    REQUIRE(logger->count(LogLevel::Fatal) == 1);
    REQUIRE(logger->contains("Max reconnection attempts (5) reached"));

    REQUIRE(recorder.logs_of("client.error").size() == 5);
    REQUIRE(recorder.count(LiveEvent::SetupComplete) == 0);

    SECTION("A later abnormal closure does not reconnect") {
        transport->fail_next_opens(0);
        REQUIRE(client.connect(kModel, Json::object()));
        REQUIRE(transport->simulate_close(1011, ""));
        io.restart();
        io.run();
        REQUIRE(transport->open_attempts() == 7);
        REQUIRE(client.status() == ConnectionStatus::Disconnected);
    }

    SECTION("Re-enabling restores the full budget") {
        client.set_auto_reconnect(true);
        REQUIRE(client.reconnection_status() == ReconnectionStatus{true, 0, 5, false});
    }
}

TEST_CASE("Exhausted reconnection falls back to a fresh session", "[reconnect][resume]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));

    REQUIRE(client.connect(kModel, Json::object()));
    transport->feed(resumption_update("stale-handle"));
    transport->fail_next_opens(5);
    REQUIRE(transport->simulate_close(1011, ""));

    io.run();

    REQUIRE(transport->open_attempts() == 6);
    REQUIRE(transport->connect_requests()[5].resumption_handle() == "stale-handle");
    REQUIRE_FALSE(client.resumption_handle().has_value());

    REQUIRE(client.connect(kModel, Json::object()));
    REQUIRE_FALSE(transport->connect_requests().back().resumption_handle().has_value());
}

TEST_CASE("Success after failures resets the attempt counter", "[reconnect][backoff]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    auto logger = std::make_shared<RecordingLogger>();
    LiveClient client(io.get_executor(), transport, fast_config(logger));
    EventRecorder recorder(client.events());

    REQUIRE(client.connect(kModel, Json::object()));
    transport->fail_next_opens(2);
    REQUIRE(transport->simulate_close(1011, ""));

    io.run();

    REQUIRE(transport->open_attempts() == 4);
    REQUIRE(client.status() == ConnectionStatus::Connected);
    REQUIRE(client.reconnection_status().attempts == 0);
    REQUIRE(logger->contains("attempt 3/5 in 4ms"));
    REQUIRE(recorder.count(LiveEvent::SetupComplete) == 1);

    SECTION("The next drop starts from the base delay again") {
        logger->clear();
        REQUIRE(transport->simulate_close(1011, ""));
        REQUIRE(logger->contains("attempt 1/5 in 1ms"));
        io.restart();
        io.run();
        REQUIRE(client.status() == ConnectionStatus::Connected);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("disconnect voids a pending reconnection", "[reconnect][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport,
        fast_config(std::make_shared<NullLogger>()).with_reconnect_base_delay(20ms));
    EventRecorder recorder(client.events());

    REQUIRE(client.connect(kModel, Json::object()));
    REQUIRE(transport->simulate_close(1011, ""));
    REQUIRE(client.reconnection_status().attempts == 1);

    REQUIRE_FALSE(client.disconnect());
    io.run();

    REQUIRE(transport->open_attempts() == 1);
    REQUIRE(client.status() == ConnectionStatus::Disconnected);
    REQUIRE(recorder.count(LiveEvent::Close) == 1);
}

TEST_CASE("Disabling auto-reconnect voids a pending reconnection", "[reconnect][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));

    REQUIRE(client.connect(kModel, Json::object()));
    REQUIRE(transport->simulate_close(1011, ""));
    client.set_auto_reconnect(false);

    io.run();

    REQUIRE(transport->open_attempts() == 1);
    REQUIRE(client.reconnection_status() == ReconnectionStatus{false, 0, 5, false});
}

TEST_CASE("Manual connect before the timer fires wins", "[reconnect][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport,
        fast_config(std::make_shared<NullLogger>()).with_reconnect_base_delay(20ms));
    EventRecorder recorder(client.events());

    REQUIRE(client.connect(kModel, Json::object()));
    REQUIRE(transport->simulate_close(1011, ""));
    REQUIRE(client.connect(kModel, Json::object()));

    io.run();

    REQUIRE(transport->open_attempts() == 2);
    REQUIRE(client.status() == ConnectionStatus::Connected);
    REQUIRE(recorder.count(LiveEvent::SetupComplete) == 0);
}

TEST_CASE("Client destruction with a pending timer is safe", "[reconnect][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    {
        LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));
        REQUIRE(client.connect(kModel, Json::object()));
        REQUIRE(transport->simulate_close(1011, ""));
    }

    io.run();
    REQUIRE(transport->open_attempts() == 1);
}

TEST_CASE("Client destruction while the executor runs on another thread", "[reconnect][cancel]") {
    for (int round = 0; round < 50; ++round) {
        asio::io_context io;
        auto work = asio::make_work_guard(io);
        std::thread runner([&io] { io.run(); });

        auto transport = std::make_shared<ReplayTransport>();
        std::atomic<int> events_after_destruction{0};
        std::atomic<bool> destroyed{false};
        {
            LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));
            client.events().on_open([&] {
                if (destroyed.load()) {
                    ++events_after_destruction;
                }
            });
            client.events().on_setup_complete([&] {
                if (destroyed.load()) {
                    ++events_after_destruction;
                }
            });

            REQUIRE(client.connect(kModel, Json::object()));
            transport->feed({{"goAway", {{"timeLeft", 0}}}});
            (void)transport->simulate_close(1011, "drop");
            std::this_thread::sleep_for(std::chrono::microseconds(round * 20));
        }
        destroyed.store(true);

        work.reset();
        runner.join();

        REQUIRE(events_after_destruction.load() == 0);
        REQUIRE(transport->open_attempts() >= 1);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Stale Sessions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Callbacks from a replaced session are ignored", "[reconnect][stale]") {
    asio::io_context io;
    auto transport = std::make_shared<ManualTransport>();
    LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));
    EventRecorder recorder(client.events());

    REQUIRE(client.connect(kModel, Json::object()));
    transport->callbacks(0).on_close(1011, "drop");
    io.run();

    REQUIRE(transport->opens() == 2);
    REQUIRE(client.status() == ConnectionStatus::Connected);
    recorder.clear();

    const auto old = transport->callbacks(0);
    old.on_close(1011, "late duplicate");
    old.on_message({{"setupComplete", Json::object()}});
    old.on_error("late error");

    REQUIRE(client.status() == ConnectionStatus::Connected);
    REQUIRE(client.reconnection_status().attempts == 0);
    REQUIRE(recorder.events().empty());

    SECTION("The current session still works") {
        client.send(Part::from_text("hi"));
        REQUIRE(transport->session(1)->sends() == 1);
        REQUIRE(transport->session(0)->sends() == 0);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// GoAway Handover
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("GoAway replaces the session before the deadline", "[reconnect][goaway]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    auto logger = std::make_shared<RecordingLogger>();
    LiveClient client(io.get_executor(), transport, fast_config(logger));
    EventRecorder recorder(client.events());

    REQUIRE(client.connect(kModel, {{"k", "v"}}));
    transport->feed(resumption_update("h-go"));
    recorder.clear();

    transport->feed({{"goAway", {{"timeLeft", "5ms"}}}});
    io.run();

    REQUIRE(client.status() == ConnectionStatus::Connected);
    const auto requests = transport->connect_requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[1].resumption_handle() == "h-go");
    REQUIRE(requests[1].config["k"] == "v");

    // The retired session's close is not reported.
    REQUIRE(recorder.kinds() == std::vector<LiveEvent>{LiveEvent::Open, LiveEvent::SetupComplete});
    REQUIRE(client.reconnection_status().attempts == 0);
    REQUIRE(logger->contains("Scheduling session handover in 5ms"));
}

TEST_CASE("GoAway honours the lead time", "[reconnect][goaway]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    auto logger = std::make_shared<RecordingLogger>();
    LiveClient client(io.get_executor(), transport, fast_config(logger).with_goaway_lead_time(5ms));

    REQUIRE(client.connect(kModel, Json::object()));
    transport->feed({{"goAway", {{"timeLeft", 25}}}});

    REQUIRE(logger->contains("Scheduling session handover in 20ms"));
    io.run();
    REQUIRE(transport->open_attempts() == 2);
}

TEST_CASE("GoAway with a huge timeLeft waits instead of firing at once", "[reconnect][goaway]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    auto logger = std::make_shared<RecordingLogger>();
    LiveClient client(io.get_executor(), transport, fast_config(logger).with_goaway_lead_time(1000ms));

    REQUIRE(client.connect(kModel, Json::object()));
    transport->feed({{"goAway", {{"timeLeft", 1e30}}}});

    REQUIRE(logger->contains(
        "Scheduling session handover in " + std::to_string((kMaxTimeLeft - 1000ms).count()) + "ms"));

    io.run_for(20ms);
    REQUIRE(transport->open_attempts() == 1);
    REQUIRE(client.status() == ConnectionStatus::Connected);

    REQUIRE(client.disconnect());
    io.run();
    REQUIRE(transport->open_attempts() == 1);
}

TEST_CASE("GoAway without a usable timeLeft schedules nothing", "[reconnect][goaway]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));
    EventRecorder recorder(client.events());

    REQUIRE(client.connect(kModel, Json::object()));

    SECTION("Non-numeric") {
        transport->feed({{"goAway", {{"timeLeft", "soon"}}}});
    }
    SECTION("Negative") {
        transport->feed({{"goAway", {{"timeLeft", -5}}}});
    }
    SECTION("Missing") {
        transport->feed({{"goAway", Json::object()}});
    }

    io.run();

    REQUIRE(transport->open_attempts() == 1);
    REQUIRE(client.status() == ConnectionStatus::Connected);
    REQUIRE(recorder.logs_of("server.goaway").size() == 1);
}

TEST_CASE("disconnect voids a pending GoAway handover", "[reconnect][goaway][cancel]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport, fast_config(std::make_shared<NullLogger>()));

    REQUIRE(client.connect(kModel, Json::object()));
    transport->feed({{"goAway", {{"timeLeft", "30ms"}}}});
    REQUIRE(client.disconnect());

    io.run();

    REQUIRE(transport->open_attempts() == 1);
    REQUIRE(client.status() == ConnectionStatus::Disconnected);
}

TEST_CASE("GoAway handover is skipped when the session already dropped", "[reconnect][goaway]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport,
        fast_config(std::make_shared<NullLogger>()).with_reconnect_base_delay(5ms));

    REQUIRE(client.connect(kModel, Json::object()));
    transport->feed({{"goAway", {{"timeLeft", "1ms"}}}});
    REQUIRE(transport->simulate_close(1011, ""));

    io.run();

    // Only the backoff reconnection opens a session.
    REQUIRE(transport->open_attempts() == 2);
    REQUIRE(client.status() == ConnectionStatus::Connected);
}

TEST_CASE("GoAway with auto-reconnect disabled schedules nothing", "[reconnect][goaway]") {
    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();
    LiveClient client(io.get_executor(), transport,
        fast_config(std::make_shared<NullLogger>()).with_auto_reconnect(false));

    REQUIRE(client.connect(kModel, Json::object()));
    transport->feed({{"goAway", {{"timeLeft", "1ms"}}}});

    io.run();

    REQUIRE(transport->open_attempts() == 1);
}

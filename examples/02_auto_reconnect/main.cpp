// Example 02: Automatic Reconnection
//
// Demonstrates session resumption and exponential backoff: the server hands
// out a resumption handle, the connection drops abnormally, and the client
// reconnects on its own carrying the handle.

#include <mmlive/client/live_client.hpp>
#include <mmlive/log/spdlog_logger.hpp>
#include <mmlive/transport/replay_transport.hpp>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace mmlive;
using namespace std::chrono_literals;
using Json = nlohmann::json;

int main() {
    std::cout << "=== Automatic Reconnection Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Info));

    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();

    // Short delays so the example finishes quickly: 50, 100, 200ms...
    auto config = LiveClientConfig{}
        .with_reconnect_base_delay(50ms)
        .with_max_reconnect_attempts(3);
    LiveClient client(io.get_executor(), transport, config);

    client.events().on_setup_complete([&client] {
        const auto status = client.reconnection_status();
        std::cout << "[setupcomplete] attempts=" << status.attempts
                  << " handle=" << client.resumption_handle().value_or("(none)") << "\n";
    });
    client.events().on_close([](int code, const std::string& reason) {
        std::cout << "[close] " << code << " " << reason << "\n";
    });

    if (!client.connect("models/live-preview", Json::object())) {
        std::cerr << "ERROR: connect failed\n";
        return 1;
    }

    // Server issues a resumption handle
    transport->feed({{"sessionResumptionUpdate", {{"newHandle", "handle-42"}, {"resumable", true}}}});

    // The first reconnection attempt is refused, the second succeeds
    transport->fail_next_opens(1);
    transport->simulate_close(1011, "internal error");

    std::cout << "Reconnection status after drop: attempts="
              << client.reconnection_status().attempts << "\n";

    // Run the backoff timers until nothing is pending
    io.run();

    const auto requests = transport->connect_requests();
    std::cout << "\nConnect requests issued: " << requests.size() << "\n";
    for (const auto& request : requests) {
        std::cout << "  handle=" << request.resumption_handle().value_or("(none)") << "\n";
    }
    std::cout << "Final status: " << to_string(client.status()) << "\n";

    client.disconnect();
    return 0;
}

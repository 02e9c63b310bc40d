// Example 01: Basic Live Session
//
// Connects a LiveClient over the replay transport, streams a turn, and shows
// how one server message fans out into audio and content notifications.

#include <mmlive/client/live_client.hpp>
#include <mmlive/transport/replay_transport.hpp>
#include <mmlive/util/base64.hpp>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace mmlive;
using Json = nlohmann::json;

int main() {
    std::cout << "=== Basic Live Session Example ===\n\n";

    asio::io_context io;
    auto transport = std::make_shared<ReplayTransport>();

    // 1. Create client (defaults: 5 attempts, 1000ms base delay)
    LiveClient client(io.get_executor(), transport);

    // 2. Register listeners BEFORE connecting
    client.events().on_open([] { std::cout << "[open]\n"; });
    client.events().on_setup_complete([] { std::cout << "[setupcomplete]\n"; });
    client.events().on_audio([](const ByteBuffer& pcm) {
        std::cout << "[audio] " << pcm.size() << " bytes\n";
    });
    client.events().on_content([](const Content& turn) {
        for (const auto& part : turn.parts) {
            std::cout << "[content] " << part.text.value_or("<non-text part>") << "\n";
        }
    });
    client.events().on_turn_complete([] { std::cout << "[turncomplete]\n"; });
    client.events().on_close([](int code, const std::string& reason) {
        std::cout << "[close] " << code << " " << reason << "\n";
    });

    // 3. Connect
    const Json config = {{"responseModalities", {"AUDIO"}}};
    if (!client.connect("models/live-preview", config)) {
        std::cerr << "ERROR: connect failed\n";
        return 1;
    }
    std::cout << "Status: " << to_string(client.status()) << "\n";
    std::cout << "Sent config: " << transport->connect_requests().back().config.dump() << "\n\n";

    // 4. Server handshake and a mixed model turn
    transport->feed({{"setupComplete", Json::object()}});

    const std::vector<std::uint8_t> pcm = {0x01, 0x02, 0x03, 0x04};
    transport->feed({
        {"serverContent", {
            {"modelTurn", {{"parts", Json::array({
                {{"inlineData", {{"mimeType", "audio/pcm;rate=24000"}, {"data", base64_encode(pcm)}}}},
                {{"text", "Hello from the model"}}
            })}}},
            {"turnComplete", true}
        }}
    });

    // 5. Send a user turn and a realtime audio chunk
    client.send(Part::from_text("Hi there"));
    client.send_realtime_input({MediaChunk{"audio/pcm;rate=16000", base64_encode(pcm)}});
    std::cout << "\nOutbound messages recorded: " << transport->sent().size() << "\n";

    // 6. Disconnect (no reconnection follows)
    client.disconnect();
    std::cout << "Status: " << to_string(client.status()) << "\n";
    return 0;
}

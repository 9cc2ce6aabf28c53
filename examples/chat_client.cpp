#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "onyxnet/config.hpp"
#include "onyxnet/errors.hpp"
#include "onyxnet/identity.hpp"
#include "onyxnet/session.hpp"
#include "onyxnet/ws_client.hpp"

// Prints session events to the terminal. Runs on the client thread only.
class ConsoleHost : public OnyxNet::SessionHost {
public:
    void on_system_notice(const std::string& text, OnyxNet::NoticeLevel level) override {
        switch (level) {
            case OnyxNet::NoticeLevel::INFO:
                std::cout << "[SYSTEM] " << text << std::endl;
                break;
            case OnyxNet::NoticeLevel::MUTED:
                std::cout << "[.] " << text << std::endl;
                break;
            case OnyxNet::NoticeLevel::WARNING:
                std::cout << "[WARN] " << text << std::endl;
                break;
            case OnyxNet::NoticeLevel::ERROR:
                std::cout << "[ERROR] " << text << std::endl;
                break;
        }
    }

    void on_peer_message(const std::string& sender_id, const std::string& plaintext) override {
        std::cout << "<" << OnyxNet::short_id(sender_id) << "> " << plaintext << std::endl;
    }

    void on_connection_state_change(OnyxNet::ConnectionState state) override {
        std::cout << "[STATUS] " << OnyxNet::to_string(state) << std::endl;
    }

    void on_own_message(const std::string& plaintext) {
        std::cout << "<Me> " << plaintext << std::endl;
    }
};

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "onyx_chat_client";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    OnyxNet::EndpointConfig config;
    try {
        config = OnyxNet::parse_endpoint_args(args);
    } catch (const OnyxNet::InvalidArgument& e) {
        std::cerr << e.what() << "\n" << OnyxNet::endpoint_usage(program);
        return 2;
    }
    if (config.show_help) {
        std::cout << OnyxNet::endpoint_usage(program);
        return 0;
    }

    // No identity, no session: never connect without one.
    std::unique_ptr<OnyxNet::Identity> identity;
    try {
        std::cout << "[SYSTEM] Generating keys..." << std::endl;
        identity = std::make_unique<OnyxNet::Identity>(OnyxNet::Identity::generate());
    } catch (const OnyxNet::KeyGenerationError& e) {
        std::cerr << "Key generation failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[SYSTEM] ID: " << identity->id() << std::endl;

    ConsoleHost host;
    OnyxNet::net::WsClientWrapper client;
    OnyxNet::SessionController session(*identity, client, host);
    std::atomic<bool> running{true};

    client.set_on_open_callback([&session]() { session.on_open(); });
    client.set_on_text_callback([&session](const std::string& text) { session.on_frame(text); });
    // The main thread may be blocked reading stdin when the relay goes away.
    client.set_on_disconnect_callback([&session, &running]() {
        session.on_close();
        if (running.exchange(false)) {
            std::cout << "[SYSTEM] Connection to relay lost. Press Enter to exit." << std::endl;
        }
    });
    client.set_on_fail_callback([&session, &running]() {
        session.on_fail();
        if (running.exchange(false)) {
            std::cout << "[SYSTEM] Could not reach the relay. Press Enter to exit." << std::endl;
        }
    });

    session.on_connecting();
    try {
        client.connect(config.uri());
    } catch (const OnyxNet::RuntimeError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::string line;
    while (running && std::getline(std::cin, line)) {
        if (!running) {
            break;
        }
        if (line == "/quit" || line == "/exit") {
            running = false;
            break;
        }
        if (line.empty()) {
            continue;
        }
        // Hand the line to the client thread so it is ordered with inbound frames.
        client.post([&session, &host, line]() {
            if (session.submit(line)) {
                host.on_own_message(line);
            }
        });
    }

    client.disconnect();
    std::cout << "[SYSTEM] Disconnected." << std::endl;
    return 0;
}

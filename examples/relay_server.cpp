#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "onyxnet/config.hpp"
#include "onyxnet/errors.hpp"
#include "onyxnet/ws_relay.hpp"

namespace {
    std::atomic<bool> g_stop_requested{false};

    void request_stop(int) {
        g_stop_requested = true;
    }
}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "onyx_relay";
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

    std::signal(SIGINT, request_stop);
    std::signal(SIGTERM, request_stop);

    OnyxNet::net::WsRelayServer relay;
    try {
        relay.run(config.host, config.port);
    } catch (const OnyxNet::Exception& e) {
        std::cerr << "Relay failed to start: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "OnyxNet TCP relay serving on " << config.host << ":" << config.port << std::endl;
    std::cout << "OnyxNet WebSocket relay serving on " << config.uri() << std::endl;

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n[!] Relay stopped by user." << std::endl;
    relay.stop();
    return 0;
}

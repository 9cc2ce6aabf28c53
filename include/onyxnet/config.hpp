#ifndef ONYXNET_CONFIG_HPP
#define ONYXNET_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace OnyxNet {

    constexpr char DEFAULT_RELAY_HOST[] = "127.0.0.1";
    constexpr uint16_t DEFAULT_RELAY_PORT = 8888;

    /**
     * @brief Where the relay listens, or where a client connects.
     *
     * A relay serves two listeners: newline-delimited JSON over plain TCP on @c port,
     * and WebSocket on @c port + 1. Clients of this library use the WebSocket one.
     */
    struct EndpointConfig {
        std::string host = DEFAULT_RELAY_HOST;
        uint16_t port = DEFAULT_RELAY_PORT;
        bool show_help = false;

        uint16_t ws_port() const { return static_cast<uint16_t>(port + 1); }

        // "ws://host:<port + 1>"
        std::string uri() const;
    };

    /**
     * @brief Reads {"relay": {"host": ..., "port": ...}} from a JSON file over @p base.
     *        Absent keys keep their value from @p base.
     * @throws InvalidArgument if the file cannot be read or has the wrong shape.
     */
    EndpointConfig load_endpoint_config(const std::string& path, EndpointConfig base = {});

    /**
     * @brief Parses --host, --port, --config <file> and --help.
     *
     * The config file is applied first; --host and --port override it regardless of
     * their position on the command line.
     *
     * @param args Arguments without the program name.
     * @throws InvalidArgument on unknown flags, missing values or an invalid port.
     */
    EndpointConfig parse_endpoint_args(const std::vector<std::string>& args);

    std::string endpoint_usage(const std::string& program);

} // namespace OnyxNet

#endif // ONYXNET_CONFIG_HPP

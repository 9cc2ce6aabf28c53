#include "onyxnet/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>

#include "onyxnet/errors.hpp"

using json = nlohmann::json;

namespace OnyxNet {

namespace {

uint16_t parse_port(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 5) {
        throw InvalidArgument("Invalid port: '" + text + "'");
    }
    unsigned long value = std::stoul(text);
    // The WebSocket listener takes the next port up.
    if (value == 0 || value > 65534) {
        throw InvalidArgument("Port out of range: " + text);
    }
    return static_cast<uint16_t>(value);
}

} // namespace

std::string EndpointConfig::uri() const {
    return "ws://" + host + ":" + std::to_string(ws_port());
}

EndpointConfig load_endpoint_config(const std::string& path, EndpointConfig base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InvalidArgument("Cannot open config file: " + path);
    }

    json config = json::parse(file, nullptr, false);
    if (config.is_discarded() || !config.is_object()) {
        throw InvalidArgument("Config file is not a JSON object: " + path);
    }

    auto relay = config.find("relay");
    if (relay == config.end()) {
        return base;
    }
    if (!relay->is_object()) {
        throw InvalidArgument("Config key 'relay' must be an object");
    }

    auto host = relay->find("host");
    if (host != relay->end()) {
        if (!host->is_string() || host->get<std::string>().empty()) {
            throw InvalidArgument("Config key 'relay.host' must be a non-empty string");
        }
        base.host = host->get<std::string>();
    }

    auto port = relay->find("port");
    if (port != relay->end()) {
        if (!port->is_number_unsigned()) {
            throw InvalidArgument("Config key 'relay.port' must be a positive integer");
        }
        base.port = parse_port(std::to_string(port->get<uint64_t>()));
    }

    return base;
}

EndpointConfig parse_endpoint_args(const std::vector<std::string>& args) {
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> config_path;
    bool show_help = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            show_help = true;
            continue;
        }
        if (arg != "--host" && arg != "--port" && arg != "--config") {
            throw InvalidArgument("Unknown argument: " + arg);
        }
        if (i + 1 >= args.size()) {
            throw InvalidArgument("Missing value for " + arg);
        }

        const std::string& value = args[++i];
        if (arg == "--host") {
            if (value.empty()) {
                throw InvalidArgument("Host must not be empty");
            }
            host = value;
        } else if (arg == "--port") {
            port = parse_port(value);
        } else {
            config_path = value;
        }
    }

    EndpointConfig config;
    if (config_path) {
        config = load_endpoint_config(*config_path, config);
    }
    if (host) {
        config.host = *host;
    }
    if (port) {
        config.port = *port;
    }
    config.show_help = show_help;
    return config;
}

std::string endpoint_usage(const std::string& program) {
    return "Usage: " + program + " [--host HOST] [--port PORT] [--config FILE]\n"
           "  --host HOST    relay host (default " + std::string(DEFAULT_RELAY_HOST) + ")\n"
           "  --port PORT    relay line port, WebSocket on PORT+1 (default " +
           std::to_string(DEFAULT_RELAY_PORT) + ")\n"
           "  --config FILE  JSON file: {\"relay\": {\"host\": ..., \"port\": ...}}\n";
}

} // namespace OnyxNet

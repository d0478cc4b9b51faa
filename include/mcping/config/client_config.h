#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcping/network/ping_options.h"

namespace mcping {

/// Default port of a Java edition server.
constexpr uint16_t kDefaultServerPort = 25565;

struct ServerTarget {
    std::string host;
    uint16_t port = kDefaultServerPort;
};

enum class OutputFormat { Text, Json };

/**
 * Settings of the command-line tool, read from a JSON file:
 *
 *   {
 *     "log_level": "info",
 *     "output": "text",
 *     "protocol_version": -1,
 *     "max_packet_length": 4194304,
 *     "servers": [{"host": "mc.example.net", "port": 25565}]
 *   }
 *
 * Every key is optional.
 */
struct ClientConfig {
    std::string log_level = "info";
    OutputFormat output = OutputFormat::Text;
    PingOptions ping;
    std::vector<ServerTarget> servers;
};

struct ConfigError : public std::runtime_error {
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/// Build a config from parsed JSON; throws ConfigError on bad values.
ClientConfig parse_client_config(const nlohmann::json& j);

/// Read and parse a config file; throws ConfigError.
ClientConfig load_client_config(const std::string& path);

/// Parse `host`, `host:port` or `[v6-address]:port`; throws ConfigError.
ServerTarget parse_server_target(const std::string& address);

} // namespace mcping

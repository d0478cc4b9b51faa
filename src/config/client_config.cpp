/**
 * ClientConfig — JSON configuration of the command-line tool.
 */

#include "mcping/config/client_config.h"

#include <charconv>
#include <fstream>
#include <limits>

#include <spdlog/spdlog.h>

namespace mcping {

using json = nlohmann::json;

namespace {

uint16_t parse_port(const std::string& text) {
    unsigned value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, err] = std::from_chars(first, last, value);
    if (err != std::errc{} || ptr != last || value == 0 || value > 65535) {
        throw ConfigError("invalid port: '" + text + "'");
    }
    return static_cast<uint16_t>(value);
}

ServerTarget parse_server_entry(const json& entry) {
    if (entry.is_string()) {
        return parse_server_target(entry.get<std::string>());
    }
    if (!entry.is_object() || !entry.contains("host") || !entry["host"].is_string()) {
        throw ConfigError("each server needs a \"host\" string");
    }
    ServerTarget target;
    target.host = entry["host"].get<std::string>();
    if (entry.contains("port")) {
        const auto& port = entry["port"];
        if (!port.is_number_unsigned() || port.get<uint64_t>() == 0 || port.get<uint64_t>() > 65535) {
            throw ConfigError("invalid port for " + target.host);
        }
        target.port = port.get<uint16_t>();
    }
    return target;
}

int32_t parse_protocol_version(const json& value) {
    const bool in_range = value.is_number_unsigned()
        ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
        : value.is_number_integer() && value.get<int64_t>() >= std::numeric_limits<int32_t>::min() &&
              value.get<int64_t>() <= std::numeric_limits<int32_t>::max();
    if (!in_range) {
        throw ConfigError("protocol_version must be a 32-bit integer");
    }
    return value.get<int32_t>();
}

size_t parse_max_packet_length(const json& value) {
    if (!value.is_number_unsigned() || value.get<uint64_t>() == 0 ||
        value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError("max_packet_length must be between 1 and 4294967295");
    }
    return static_cast<size_t>(value.get<uint64_t>());
}

} // namespace

ServerTarget parse_server_target(const std::string& address) {
    if (address.empty()) {
        throw ConfigError("empty server address");
    }

    ServerTarget target;
    if (address.front() == '[') {
        const auto close = address.find(']');
        if (close == std::string::npos) {
            throw ConfigError("unterminated IPv6 address: '" + address + "'");
        }
        target.host = address.substr(1, close - 1);
        if (close + 1 < address.size()) {
            if (address[close + 1] != ':') {
                throw ConfigError("unexpected text after IPv6 address: '" + address + "'");
            }
            target.port = parse_port(address.substr(close + 2));
        }
        return target;
    }

    const auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        target.host = address;
    } else {
        target.host = address.substr(0, colon);
        target.port = parse_port(address.substr(colon + 1));
    }
    if (target.host.empty()) {
        throw ConfigError("missing host in '" + address + "'");
    }
    return target;
}

ClientConfig parse_client_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    ClientConfig config;
    try {
        config.log_level = j.value("log_level", config.log_level);
        if (j.contains("protocol_version")) {
            config.ping.protocol_version = parse_protocol_version(j["protocol_version"]);
        }
        if (j.contains("max_packet_length")) {
            config.ping.max_packet_length = parse_max_packet_length(j["max_packet_length"]);
        }

        const auto output = j.value("output", std::string("text"));
        if (output == "text") {
            config.output = OutputFormat::Text;
        } else if (output == "json") {
            config.output = OutputFormat::Json;
        } else {
            throw ConfigError("output must be \"text\" or \"json\", got \"" + output + "\"");
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("config value has the wrong type: ") + e.what());
    }

    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        throw ConfigError("unknown log_level \"" + config.log_level + "\"");
    }

    if (j.contains("servers")) {
        const auto& servers = j["servers"];
        if (!servers.is_array()) {
            throw ConfigError("\"servers\" must be an array");
        }
        for (const auto& entry : servers) {
            config.servers.push_back(parse_server_entry(entry));
        }
    }
    return config;
}

ClientConfig load_client_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    const json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("config file is not valid JSON: " + path);
    }
    return parse_client_config(j);
}

} // namespace mcping

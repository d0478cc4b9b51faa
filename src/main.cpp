/**
 * mcping — Command-line status ping
 *
 * Loads the tool config, pings every configured server (or the servers given
 * on the command line) and prints what each one reports.
 *
 *   mcping [--config <file>] [--json] [host[:port] ...]
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "mcping/config/client_config.h"
#include "mcping/network/status_client.h"

using json = nlohmann::json;

static void print_text(const mcping::ServerTarget& target, const mcping::Pong& pong) {
    std::cout << target.host << ":" << target.port << "\n"
              << "  version:     " << pong.version_name << " (protocol " << pong.protocol << ")\n"
              << "  players:     " << pong.online_players << "/" << pong.max_players << "\n"
              << "  description: " << pong.description << "\n"
              << "  latency:     " << pong.latency.count() / 1000.0 << " ms\n";
    if (pong.sample && !pong.sample->empty()) {
        std::cout << "  sample:\n";
        for (const auto& player : *pong.sample) {
            std::cout << "    " << player.name << " (" << player.id << ")\n";
        }
    }
    if (pong.favicon) {
        std::cout << "  favicon:     " << pong.favicon->size() << " bytes\n";
    }
    if (pong.mod_info) {
        std::cout << "  mods (FML):  " << pong.mod_info->mod_list.size() << "\n";
    }
    if (pong.forge_data) {
        std::cout << "  mods (FML2): " << pong.forge_data->mods.size() << "\n";
    }
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    std::string config_path;
    bool force_json = false;
    std::vector<std::string> addresses;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--json") {
            force_json = true;
        } else {
            addresses.push_back(arg);
        }
    }

    mcping::ClientConfig config;
    try {
        if (!config_path.empty()) {
            config = mcping::load_client_config(config_path);
            spdlog::info("Loaded config from {}", config_path);
        }
        if (!addresses.empty()) {
            config.servers.clear();
            for (const auto& address : addresses) {
                config.servers.push_back(mcping::parse_server_target(address));
            }
        }
    } catch (const mcping::ConfigError& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    if (force_json) {
        config.output = mcping::OutputFormat::Json;
    }
    if (config.servers.empty()) {
        spdlog::error("No servers given. Usage: {} [--config <file>] [--json] [host[:port] ...]", argv[0]);
        return EXIT_FAILURE;
    }

    asio::io_context io;
    mcping::StatusClient client(io, config.ping);

    std::size_t failures = 0;
    json results = json::array();
    for (const auto& target : config.servers) {
        auto pong = client.query(target.host, target.port);
        if (!pong) {
            ++failures;
            continue;
        }
        if (config.output == mcping::OutputFormat::Json) {
            json entry = *pong;
            entry["server"] = {{"host", target.host}, {"port", target.port}};
            results.push_back(std::move(entry));
        } else {
            print_text(target, *pong);
        }
    }

    if (config.output == mcping::OutputFormat::Json) {
        std::cout << results.dump(2) << std::endl;
    }
    spdlog::info("{} of {} server(s) answered", config.servers.size() - failures, config.servers.size());
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

#pragma once

#include <asio.hpp>
#include <cstdint>
#include <optional>
#include <string>

#include "mcping/network/ping_options.h"
#include "mcping/status/pong.h"

namespace mcping {

/**
 * TCP client that resolves a server, connects, and runs one status ping
 * per call. Every query uses a fresh connection.
 */
class StatusClient {
public:
    explicit StatusClient(asio::io_context& io, PingOptions options = {});

    /// Ping `host:port`; failures are logged and yield nullopt.
    std::optional<Pong> query(const std::string& host, uint16_t port);

    /// Ping `host:port`; throws std::system_error or PingError.
    Pong query_or_throw(const std::string& host, uint16_t port);

private:
    asio::ip::tcp::socket connect(const std::string& host, uint16_t port);

    asio::io_context& io_;
    asio::ip::tcp::resolver resolver_;
    PingOptions options_;
};

} // namespace mcping

/**
 * StatusClient — Resolves and connects to a server, then pings it.
 *
 * Name resolution and the TCP connection belong to the caller of the ping
 * functions; this class is that caller for the command-line tool.
 */

#include "mcping/network/status_client.h"

#include <spdlog/spdlog.h>

#include "mcping/network/ping.h"

namespace mcping {

StatusClient::StatusClient(asio::io_context& io, PingOptions options)
    : io_(io), resolver_(io), options_(options) {}

asio::ip::tcp::socket StatusClient::connect(const std::string& host, uint16_t port) {
    auto endpoints = resolver_.resolve(host, std::to_string(port));
    asio::ip::tcp::socket socket(io_);
    const auto endpoint = asio::connect(socket, endpoints);
    spdlog::debug("connected to {}:{} ({})", host, port, endpoint.address().to_string());
    socket.set_option(asio::ip::tcp::no_delay(true));
    return socket;
}

Pong StatusClient::query_or_throw(const std::string& host, uint16_t port) {
    auto socket = connect(host, port);
    Pong pong = ping(socket, host, port, options_);

    asio::error_code ignored;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    return pong;
}

std::optional<Pong> StatusClient::query(const std::string& host, uint16_t port) {
    try {
        return query_or_throw(host, port);
    } catch (const PingError& e) {
        spdlog::warn("{}:{}: {}", host, port, e.what());
    } catch (const std::system_error& e) {
        spdlog::warn("{}:{}: cannot connect: {}", host, port, e.code().message());
    }
    return std::nullopt;
}

} // namespace mcping

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <asio.hpp>

#include "mcping/network/detail/async_ping_op.h"
#include "mcping/network/ping_options.h"
#include "mcping/network/status_exchange.h"
#include "mcping/protocol/error.h"
#include "mcping/status/pong.h"

/**
 * Status ping over a caller-owned stream.
 *
 * The stream is anything asio can read from and write to: a connected
 * tcp::socket, an ssl::stream, a local socket or a test double. The stream
 * is used exclusively for the duration of the call and left open.
 *
 *   blocking:      ping(stream, host, port)            SyncReadStream + SyncWriteStream
 *   completion:    async_ping(stream, host, port, options, token)
 *   coroutine:     co_await co_ping(stream, host, port)
 *
 * No timeouts are applied; wrap the call with a deadline if the peer may stall.
 */

namespace mcping {

namespace detail {

template <typename SyncStream>
Pong run_ping(SyncStream& stream, StatusExchange& exchange, std::error_code& ec) {
    asio::error_code io_ec;

    exchange.begin();
    asio::write(stream, asio::buffer(exchange.request()), io_ec);
    if (io_ec) {
        ec = exchange.fail(io_ec);
        return {};
    }
    exchange.request_sent();

    while (!exchange.done()) {
        auto region = exchange.prepare();
        asio::read(stream, asio::buffer(region.data(), region.size()), io_ec);
        if (io_ec) {
            ec = exchange.fail(io_ec);
            return {};
        }
        if ((ec = exchange.commit())) {
            return {};
        }
    }
    return exchange.finish(ec);
}

} // namespace detail

/// Blocking ping; failures are reported through `ec`.
template <typename SyncStream>
Pong ping(SyncStream& stream,
          std::string_view hostname,
          std::uint16_t port,
          const PingOptions& options,
          std::error_code& ec) {
    StatusExchange exchange(hostname, port, options);
    return detail::run_ping(stream, exchange, ec);
}

/// Blocking ping; throws PingError naming the failed phase.
template <typename SyncStream>
Pong ping(SyncStream& stream,
          std::string_view hostname,
          std::uint16_t port,
          const PingOptions& options = {}) {
    StatusExchange exchange(hostname, port, options);
    std::error_code ec;
    Pong pong = detail::run_ping(stream, exchange, ec);
    if (ec) {
        throw PingError(ec, exchange.phase());
    }
    return pong;
}

/**
 * Asynchronous ping as an asio composed operation.
 *
 * Completion signature: void(std::error_code, Pong). Works with any asio
 * completion token (callbacks, use_future, deferred, use_awaitable).
 */
template <typename AsyncStream, typename CompletionToken>
auto async_ping(AsyncStream& stream,
                std::string_view hostname,
                std::uint16_t port,
                const PingOptions& options,
                CompletionToken&& token) {
    return asio::async_compose<CompletionToken, void(std::error_code, Pong)>(
        detail::AsyncPingOp<AsyncStream>(
            stream, std::make_unique<StatusExchange>(hostname, port, options)),
        std::forward<CompletionToken>(token), stream);
}

/// Coroutine ping; throws PingError naming the failed phase.
template <typename AsyncStream>
asio::awaitable<Pong> co_ping(AsyncStream& stream,
                              std::string hostname,
                              std::uint16_t port,
                              PingOptions options = {}) {
    StatusExchange exchange(hostname, port, options);
    asio::error_code io_ec;

    exchange.begin();
    co_await asio::async_write(stream, asio::buffer(exchange.request()),
                               asio::redirect_error(asio::use_awaitable, io_ec));
    if (io_ec) {
        throw PingError(exchange.fail(io_ec), exchange.phase());
    }
    exchange.request_sent();

    while (!exchange.done()) {
        auto region = exchange.prepare();
        co_await asio::async_read(stream, asio::buffer(region.data(), region.size()),
                                  asio::redirect_error(asio::use_awaitable, io_ec));
        if (io_ec) {
            throw PingError(exchange.fail(io_ec), exchange.phase());
        }
        if (auto ec = exchange.commit()) {
            throw PingError(ec, exchange.phase());
        }
    }

    std::error_code ec;
    Pong pong = exchange.finish(ec);
    if (ec) {
        throw PingError(ec, exchange.phase());
    }
    co_return pong;
}

} // namespace mcping

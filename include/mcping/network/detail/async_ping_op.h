#pragma once

#include <cstddef>
#include <memory>
#include <system_error>
#include <utility>

#include <asio.hpp>

#include "mcping/network/status_exchange.h"
#include "mcping/status/pong.h"

#include <asio/yield.hpp>

namespace mcping::detail {

/// Composed operation behind async_ping(), written as a stackless coroutine.
template <typename AsyncStream>
class AsyncPingOp {
public:
    AsyncPingOp(AsyncStream& stream, std::unique_ptr<StatusExchange> exchange)
        : stream_(stream), exchange_(std::move(exchange)) {}

    template <typename Self>
    void operator()(Self& self, asio::error_code io_ec = {}, std::size_t = 0) {
        reenter (coro_) {
            exchange_->begin();
            yield asio::async_write(stream_, asio::buffer(exchange_->request()), std::move(self));
            if (io_ec) {
                return fail(self, exchange_->fail(io_ec));
            }
            exchange_->request_sent();

            while (!exchange_->done()) {
                yield {
                    auto region = exchange_->prepare();
                    asio::async_read(stream_, asio::buffer(region.data(), region.size()), std::move(self));
                }
                if (io_ec) {
                    return fail(self, exchange_->fail(io_ec));
                }
                if (auto ec = exchange_->commit()) {
                    return fail(self, ec);
                }
            }
            finish(self);
        }
    }

private:
    template <typename Self>
    void fail(Self& self, std::error_code ec) {
        self.complete(ec, Pong{});
    }

    template <typename Self>
    void finish(Self& self) {
        std::error_code ec;
        Pong pong = exchange_->finish(ec);
        self.complete(ec, std::move(pong));
    }

    AsyncStream& stream_;
    // Heap-allocated so the buffers handed to asio survive moves of the op.
    std::unique_ptr<StatusExchange> exchange_;
    asio::coroutine coro_;
};

} // namespace mcping::detail

#include <asio/unyield.hpp>

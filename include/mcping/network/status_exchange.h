#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include "mcping/network/ping_options.h"
#include "mcping/protocol/error.h"
#include "mcping/protocol/packet.h"
#include "mcping/status/pong.h"

namespace mcping {

/**
 * One status ping, without any I/O.
 *
 * A driver writes request(), then keeps filling prepare() from its
 * transport and calling commit() until done(), then calls finish(). The
 * blocking and the asynchronous ping functions all drive this class, so
 * the protocol rules exist once.
 */
class StatusExchange {
public:
    StatusExchange(std::string_view hostname, std::uint16_t port, const PingOptions& options);

    /// Start the latency clock; drivers call this right before writing.
    void begin();

    /// Handshake frame followed by the status request frame.
    [[nodiscard]] const std::vector<std::uint8_t>& request() const noexcept { return request_; }

    /// Called by the driver once request() has been fully written.
    void request_sent();

    std::span<std::uint8_t> prepare() { return reader_.prepare(); }

    std::error_code commit();

    [[nodiscard]] bool done() const noexcept { return reader_.done(); }

    /// Map a transport error for the current phase and log it.
    std::error_code fail(const std::error_code& transport_error);

    /// Check the packet id, decode the body and stamp the latency.
    Pong finish(std::error_code& ec);

    [[nodiscard]] PingPhase phase() const noexcept { return phase_; }

private:
    std::error_code log_failure(std::error_code ec) const;

    std::vector<std::uint8_t> request_;
    FrameReader reader_;
    PingPhase phase_ = PingPhase::Handshake;
    std::chrono::steady_clock::time_point started_;
};

} // namespace mcping

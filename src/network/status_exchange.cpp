/**
 * StatusExchange — the ping state machine shared by every driver.
 *
 *   Handshake      -> write handshake + status request
 *   AwaitResponse  -> read exactly one packet and check its id
 *   Decode         -> parse the status document
 */

#include "mcping/network/status_exchange.h"

#include <asio/error.hpp>
#include <spdlog/spdlog.h>

#include "mcping/protocol/request_builder.h"
#include "mcping/status/status_parser.h"

namespace mcping {

StatusExchange::StatusExchange(std::string_view hostname,
                               std::uint16_t port,
                               const PingOptions& options)
    : reader_(options.max_packet_length),
      started_(std::chrono::steady_clock::now()) {
    frame_payload(build_handshake(options.protocol_version, hostname, port), request_);
    frame_payload(build_status_request(), request_);
    spdlog::debug("pinging {}:{} with protocol version {}", hostname, port, options.protocol_version);
}

void StatusExchange::begin() {
    started_ = std::chrono::steady_clock::now();
}

void StatusExchange::request_sent() {
    spdlog::trace("sent {} request bytes", request_.size());
    phase_ = PingPhase::AwaitResponse;
}

std::error_code StatusExchange::commit() {
    auto ec = reader_.commit();
    return ec ? log_failure(ec) : ec;
}

std::error_code StatusExchange::fail(const std::error_code& transport_error) {
    spdlog::debug("transport error during {}: {}", to_string(phase_), transport_error.message());
    const Errc kind = transport_error == asio::error::eof ? Errc::TruncatedStream : Errc::Io;
    return log_failure(make_error_code(kind));
}

Pong StatusExchange::finish(std::error_code& ec) {
    Packet packet = reader_.take();
    if (packet.id != kStatusResponsePacketId) {
        spdlog::debug("expected status response 0x{:02x}, got packet 0x{:02x}",
                      kStatusResponsePacketId, packet.id);
        ec = log_failure(make_error_code(Errc::ProtocolError));
        return {};
    }

    phase_ = PingPhase::Decode;
    Pong pong = parse_status(packet.body, ec);
    if (ec) {
        ec = log_failure(ec);
        return {};
    }
    pong.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started_);
    spdlog::debug("status received in {} us", pong.latency.count());
    return pong;
}

std::error_code StatusExchange::log_failure(std::error_code ec) const {
    spdlog::debug("ping failed during {}: {}", to_string(phase_), ec.message());
    return ec;
}

} // namespace mcping

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace mcping {

/// Packet id shared by the handshake, the status request and the status response.
constexpr std::uint32_t kHandshakePacketId = 0x00;
constexpr std::uint32_t kStatusRequestPacketId = 0x00;
constexpr std::uint32_t kStatusResponsePacketId = 0x00;

/// "Next state" value of a handshake that asks for the status exchange.
constexpr std::uint32_t kNextStateStatus = 1;

/// Protocol version that lets the server answer with whatever it speaks.
constexpr std::int32_t kLatestProtocolVersion = -1;

/**
 * Payload of the handshake packet: packet id, VarInt protocol version,
 * length-prefixed hostname, big-endian port, VarInt next state.
 *
 * The hostname is written as given; length limits are the caller's business.
 */
std::vector<std::uint8_t> build_handshake(std::int32_t protocol_version,
                                          std::string_view hostname,
                                          std::uint16_t port);

/// Payload of the (empty) status request packet: just its id.
std::vector<std::uint8_t> build_status_request();

} // namespace mcping

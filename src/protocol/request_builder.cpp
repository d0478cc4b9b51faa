/**
 * Outbound packet payloads. Each payload starts with its packet id; the
 * frame_packet() length prefix is added by the caller.
 */

#include "mcping/protocol/request_builder.h"

#include "mcping/protocol/varint.h"

namespace mcping {

std::vector<std::uint8_t> build_handshake(std::int32_t protocol_version,
                                          std::string_view hostname,
                                          std::uint16_t port) {
    std::vector<std::uint8_t> out;
    out.reserve(1 + kMaxVarIntBytes * 3 + hostname.size() + 2);

    encode_varint(kHandshakePacketId, out);
    // Negative versions go out as their two's complement bit pattern.
    encode_varint(static_cast<std::uint32_t>(protocol_version), out);
    encode_varint(static_cast<std::uint32_t>(hostname.size()), out);
    out.insert(out.end(), hostname.begin(), hostname.end());
    out.push_back(static_cast<std::uint8_t>(port >> 8));
    out.push_back(static_cast<std::uint8_t>(port & 0xFF));
    encode_varint(kNextStateStatus, out);
    return out;
}

std::vector<std::uint8_t> build_status_request() {
    return encode_varint(kStatusRequestPacketId);
}

} // namespace mcping

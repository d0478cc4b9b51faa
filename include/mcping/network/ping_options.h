#pragma once

#include <cstddef>
#include <cstdint>

#include "mcping/protocol/packet.h"
#include "mcping/protocol/request_builder.h"

namespace mcping {

/// Per-call knobs of a status ping.
struct PingOptions {
    /// Sent in the handshake; -1 asks the server for its own version.
    std::int32_t protocol_version = kLatestProtocolVersion;
    /// Largest inbound packet length accepted before any allocation.
    std::size_t max_packet_length = kDefaultMaxPacketLength;
};

} // namespace mcping

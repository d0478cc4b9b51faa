#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

#include "mcping/protocol/varint.h"

namespace mcping {

/// Default upper bound on a declared inbound packet length (4 MiB).
constexpr std::size_t kDefaultMaxPacketLength = 4 * 1024 * 1024;

/// One decoded packet: id plus everything after it.
struct Packet {
    std::uint32_t id = 0;
    std::vector<std::uint8_t> body;
};

/**
 * Checked conversion of a payload size to its length prefix.
 *
 * Frames are limited to payloads below 2^32 bytes; larger sizes throw
 * std::length_error instead of writing a wrapped length.
 */
std::uint32_t frame_length(std::size_t payload_size);

/// Append `VarInt(len(id) + len(body)) | VarInt(id) | body` to `out`.
void frame_packet(std::uint32_t packet_id,
                  std::span<const std::uint8_t> body,
                  std::vector<std::uint8_t>& out);

std::vector<std::uint8_t> frame_packet(std::uint32_t packet_id,
                                       std::span<const std::uint8_t> body);

/// Length-prefix a payload that already starts with its packet id.
void frame_payload(std::span<const std::uint8_t> payload, std::vector<std::uint8_t>& out);

/**
 * Incremental reader for one length-prefixed packet.
 *
 * The reader performs no I/O. A driver asks for the region to fill with
 * prepare(), fills it completely from its transport and calls commit().
 * The length prefix is requested one byte at a time; the payload is
 * requested in one piece once its length has been checked against the
 * configured bound, so nothing is allocated for a hostile length.
 */
class FrameReader {
public:
    explicit FrameReader(std::size_t max_length = kDefaultMaxPacketLength);

    /// Region the driver has to fill before calling commit(). Empty once done().
    std::span<std::uint8_t> prepare();

    /// Consume the region returned by the last prepare().
    std::error_code commit();

    [[nodiscard]] bool done() const noexcept { return state_ == State::Done; }

    /// The declared length, valid once the prefix has been read.
    [[nodiscard]] std::size_t declared_length() const noexcept { return payload_.size(); }

    /// Move the decoded packet out. Only valid once done().
    Packet take();

private:
    enum class State { Length, Payload, Done };

    std::error_code finish_payload();

    State state_ = State::Length;
    std::size_t max_length_;
    VarIntDecoder length_;
    std::uint8_t length_byte_ = 0;
    std::vector<std::uint8_t> payload_;
    Packet packet_;
};

/**
 * Read one packet from the front of an in-memory buffer.
 *
 * Fails with Errc::TruncatedStream when `data` is shorter than the frame
 * declares, Errc::ProtocolError for a zero or oversized length and
 * Errc::MalformedVarInt for a broken prefix. Trailing bytes are ignored.
 */
Packet read_packet(std::span<const std::uint8_t> data,
                   std::size_t max_length,
                   std::error_code& ec);

} // namespace mcping

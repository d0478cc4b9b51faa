/**
 * Packet framing: `VarInt length | VarInt packet id | body`, where the length
 * covers the id and the body.
 */

#include "mcping/protocol/packet.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "mcping/protocol/error.h"

namespace mcping {

std::uint32_t frame_length(std::size_t payload_size) {
    if (payload_size > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("packet payload of " + std::to_string(payload_size) +
                                " bytes does not fit a length prefix");
    }
    return static_cast<std::uint32_t>(payload_size);
}

void frame_packet(std::uint32_t packet_id,
                  std::span<const std::uint8_t> body,
                  std::vector<std::uint8_t>& out) {
    const std::uint32_t length = frame_length(varint_size(packet_id) + body.size());
    out.reserve(out.size() + varint_size(length) + length);
    encode_varint(length, out);
    encode_varint(packet_id, out);
    out.insert(out.end(), body.begin(), body.end());
}

std::vector<std::uint8_t> frame_packet(std::uint32_t packet_id,
                                       std::span<const std::uint8_t> body) {
    std::vector<std::uint8_t> out;
    frame_packet(packet_id, body, out);
    return out;
}

void frame_payload(std::span<const std::uint8_t> payload, std::vector<std::uint8_t>& out) {
    encode_varint(frame_length(payload.size()), out);
    out.insert(out.end(), payload.begin(), payload.end());
}

FrameReader::FrameReader(std::size_t max_length) : max_length_(max_length) {}

std::span<std::uint8_t> FrameReader::prepare() {
    switch (state_) {
    case State::Length:
        return {&length_byte_, 1};
    case State::Payload:
        return payload_;
    case State::Done:
        break;
    }
    return {};
}

std::error_code FrameReader::commit() {
    if (state_ == State::Payload) {
        return finish_payload();
    }
    if (state_ == State::Done) {
        return {};
    }

    switch (length_.feed(length_byte_)) {
    case VarIntDecoder::Status::NeedMore:
        return {};
    case VarIntDecoder::Status::Malformed:
        spdlog::debug("packet length prefix is not a valid VarInt");
        return Errc::MalformedVarInt;
    case VarIntDecoder::Status::Done:
        break;
    }

    const std::size_t length = length_.value();
    if (length == 0 || length > max_length_) {
        spdlog::debug("rejecting packet with declared length {} (bound {})", length, max_length_);
        return Errc::ProtocolError;
    }
    payload_.resize(length);
    state_ = State::Payload;
    return {};
}

std::error_code FrameReader::finish_payload() {
    std::error_code ec;
    std::size_t offset = 0;
    packet_.id = decode_varint(payload_, offset, ec);
    if (ec) {
        return ec;
    }
    packet_.body.assign(payload_.begin() + static_cast<std::ptrdiff_t>(offset), payload_.end());
    state_ = State::Done;
    spdlog::trace("read packet 0x{:02x} with {} body bytes", packet_.id, packet_.body.size());
    return {};
}

Packet FrameReader::take() {
    return std::move(packet_);
}

Packet read_packet(std::span<const std::uint8_t> data,
                   std::size_t max_length,
                   std::error_code& ec) {
    FrameReader reader(max_length);
    std::size_t pos = 0;
    while (!reader.done()) {
        auto region = reader.prepare();
        if (data.size() - pos < region.size()) {
            ec = Errc::TruncatedStream;
            return {};
        }
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(pos), region.size(), region.begin());
        pos += region.size();
        if ((ec = reader.commit())) {
            return {};
        }
    }
    ec.clear();
    return reader.take();
}

} // namespace mcping

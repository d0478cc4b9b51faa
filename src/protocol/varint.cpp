/**
 * VarInt codec: 7 value bits per byte, least significant group first, high
 * bit set on every byte except the last.
 */

#include "mcping/protocol/varint.h"

#include "mcping/protocol/error.h"

namespace mcping {

namespace {

constexpr std::uint8_t kSegmentBits = 0x7F;
constexpr std::uint8_t kContinueBit = 0x80;

// Only the low four bits of the fifth byte still fit into 32 bits.
constexpr std::uint8_t kLastByteMask = 0x0F;

} // namespace

void encode_varint(std::uint32_t value, std::vector<std::uint8_t>& out) {
    while (value > kSegmentBits) {
        out.push_back(static_cast<std::uint8_t>((value & kSegmentBits) | kContinueBit));
        value >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(value));
}

std::vector<std::uint8_t> encode_varint(std::uint32_t value) {
    std::vector<std::uint8_t> out;
    out.reserve(kMaxVarIntBytes);
    encode_varint(value, out);
    return out;
}

std::size_t varint_size(std::uint32_t value) noexcept {
    std::size_t size = 1;
    while (value > kSegmentBits) {
        value >>= 7;
        ++size;
    }
    return size;
}

VarIntDecoder::Status VarIntDecoder::feed(std::uint8_t byte) noexcept {
    if (count_ == kMaxVarIntBytes - 1) {
        // Fifth byte: must terminate and must not carry bits beyond 32.
        if ((byte & kContinueBit) != 0 || (byte & ~kLastByteMask) != 0) {
            ++count_;
            return Status::Malformed;
        }
    } else if (count_ >= kMaxVarIntBytes) {
        return Status::Malformed;
    }

    value_ |= static_cast<std::uint32_t>(byte & kSegmentBits) << (7 * count_);
    ++count_;
    return (byte & kContinueBit) != 0 ? Status::NeedMore : Status::Done;
}

void VarIntDecoder::reset() noexcept {
    value_ = 0;
    count_ = 0;
}

std::uint32_t decode_varint(std::span<const std::uint8_t> data,
                            std::size_t& offset,
                            std::error_code& ec) noexcept {
    VarIntDecoder decoder;
    std::size_t pos = offset;
    while (pos < data.size()) {
        switch (decoder.feed(data[pos++])) {
        case VarIntDecoder::Status::NeedMore:
            continue;
        case VarIntDecoder::Status::Done:
            offset = pos;
            ec.clear();
            return decoder.value();
        case VarIntDecoder::Status::Malformed:
            ec = Errc::MalformedVarInt;
            return 0;
        }
    }
    ec = Errc::TruncatedStream;
    return 0;
}

} // namespace mcping

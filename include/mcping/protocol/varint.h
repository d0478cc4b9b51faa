#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace mcping {

/// A 32-bit VarInt never takes more than five bytes on the wire.
constexpr std::size_t kMaxVarIntBytes = 5;

/// Append the minimal VarInt encoding of `value` to `out`.
void encode_varint(std::uint32_t value, std::vector<std::uint8_t>& out);

std::vector<std::uint8_t> encode_varint(std::uint32_t value);

/// Number of bytes encode_varint() produces for `value` (1..5).
std::size_t varint_size(std::uint32_t value) noexcept;

/**
 * Incremental VarInt decoder, fed one byte at a time.
 *
 * Used both for buffered decoding and by the frame reader while the packet
 * length is still arriving from the transport.
 */
class VarIntDecoder {
public:
    enum class Status { NeedMore, Done, Malformed };

    Status feed(std::uint8_t byte) noexcept;

    [[nodiscard]] std::uint32_t value() const noexcept { return value_; }
    [[nodiscard]] std::size_t bytes_consumed() const noexcept { return count_; }

    void reset() noexcept;

private:
    std::uint32_t value_ = 0;
    std::size_t count_ = 0;
};

/**
 * Decode a VarInt starting at `data[offset]` and advance `offset` past it.
 *
 * Sets `ec` to Errc::TruncatedStream when `data` ends before the VarInt
 * terminates, or Errc::MalformedVarInt when it overflows 32 bits.
 */
std::uint32_t decode_varint(std::span<const std::uint8_t> data,
                            std::size_t& offset,
                            std::error_code& ec) noexcept;

} // namespace mcping

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "mcping/protocol/error.h"
#include "mcping/protocol/packet.h"

#include "scripted_stream.h"

using mcping::Errc;

TEST(Packet, FrameLayout) {
    const auto frame = mcping::frame_packet(0x00, bytes({0xaa, 0xbb}));
    EXPECT_EQ(frame, bytes({0x03, 0x00, 0xaa, 0xbb}));

    const auto large_id = mcping::frame_packet(300, {});
    EXPECT_EQ(large_id, bytes({0x02, 0xac, 0x02}));
}

TEST(Packet, FramePayloadPrefixesLength) {
    std::vector<uint8_t> out;
    mcping::frame_payload(bytes({0x00}), out);
    mcping::frame_payload(bytes({0x00, 0x01}), out);
    EXPECT_EQ(out, bytes({0x01, 0x00, 0x02, 0x00, 0x01}));
}

TEST(Packet, FrameLengthIsChecked) {
    EXPECT_EQ(mcping::frame_length(5), 5u);
    EXPECT_EQ(mcping::frame_length(0xffffffffu), 0xffffffffu);
    EXPECT_THROW(mcping::frame_length(std::size_t{1} << 32), std::length_error);
}

TEST(Packet, Roundtrip) {
    const std::vector<uint32_t> ids = {0x00, 0x01, 0x7f, 0x80, 0x3fff};
    const std::vector<std::size_t> sizes = {0, 1, 127, 128, 300, 70000};
    for (auto id : ids) {
        for (auto size : sizes) {
            std::vector<uint8_t> body(size);
            for (std::size_t i = 0; i < size; ++i) {
                body[i] = static_cast<uint8_t>(i * 7);
            }
            std::error_code ec;
            const auto packet = mcping::read_packet(mcping::frame_packet(id, body),
                                                    mcping::kDefaultMaxPacketLength, ec);
            ASSERT_FALSE(ec) << ec.message();
            EXPECT_EQ(packet.id, id);
            EXPECT_EQ(packet.body, body);
        }
    }
}

TEST(Packet, ZeroLength) {
    std::error_code ec;
    mcping::read_packet(bytes({0x00, 0x00}), mcping::kDefaultMaxPacketLength, ec);
    EXPECT_EQ(ec, Errc::ProtocolError);
}

TEST(Packet, OversizedLengthRejectedBeforeReading) {
    // Declares 0x0fffffff bytes and then carries almost nothing.
    mcping::FrameReader reader(mcping::kDefaultMaxPacketLength);
    const auto prefix = bytes({0xff, 0xff, 0xff, 0x7f});
    std::error_code ec;
    for (auto b : prefix) {
        auto region = reader.prepare();
        ASSERT_EQ(region.size(), 1u);
        region[0] = b;
        ec = reader.commit();
        if (ec) {
            break;
        }
    }
    EXPECT_EQ(ec, Errc::ProtocolError);
    EXPECT_EQ(reader.declared_length(), 0u);
}

TEST(Packet, ConfigurableBound) {
    const auto frame = mcping::frame_packet(0x00, std::vector<uint8_t>(99));
    std::error_code ec;
    mcping::read_packet(frame, 100, ec);
    EXPECT_FALSE(ec);
    mcping::read_packet(frame, 99, ec);
    EXPECT_EQ(ec, Errc::ProtocolError);
}

TEST(Packet, TruncatedBody) {
    auto frame = mcping::frame_packet(0x00, bytes({1, 2, 3, 4, 5}));
    frame.pop_back();
    std::error_code ec;
    mcping::read_packet(frame, mcping::kDefaultMaxPacketLength, ec);
    EXPECT_EQ(ec, Errc::TruncatedStream);
}

TEST(Packet, TruncatedLength) {
    std::error_code ec;
    mcping::read_packet(bytes({0x80}), mcping::kDefaultMaxPacketLength, ec);
    EXPECT_EQ(ec, Errc::TruncatedStream);

    mcping::read_packet(std::vector<uint8_t>{}, mcping::kDefaultMaxPacketLength, ec);
    EXPECT_EQ(ec, Errc::TruncatedStream);
}

TEST(Packet, MalformedLength) {
    std::error_code ec;
    mcping::read_packet(bytes({0x80, 0x80, 0x80, 0x80, 0x80, 0x00}), mcping::kDefaultMaxPacketLength, ec);
    EXPECT_EQ(ec, Errc::MalformedVarInt);
}

TEST(Packet, IdRunsPastFrame) {
    // Length 1, but the id VarInt wants a second byte.
    std::error_code ec;
    mcping::read_packet(bytes({0x01, 0x80, 0x01}), mcping::kDefaultMaxPacketLength, ec);
    EXPECT_EQ(ec, Errc::TruncatedStream);
}

TEST(Packet, ReaderRequestsExactRegions) {
    const auto frame = mcping::frame_packet(0x00, std::vector<uint8_t>(200, 0x42));
    mcping::FrameReader reader;
    std::size_t pos = 0;
    std::vector<std::size_t> requested;
    while (!reader.done()) {
        auto region = reader.prepare();
        requested.push_back(region.size());
        std::copy_n(frame.begin() + static_cast<std::ptrdiff_t>(pos), region.size(), region.begin());
        pos += region.size();
        ASSERT_FALSE(reader.commit());
    }
    // Two length bytes one at a time, then id + body in one piece.
    EXPECT_EQ(requested, (std::vector<std::size_t>{1, 1, 201}));
    EXPECT_EQ(pos, frame.size());
    EXPECT_TRUE(reader.prepare().empty());

    const auto packet = reader.take();
    EXPECT_EQ(packet.id, 0u);
    EXPECT_EQ(packet.body.size(), 200u);
}

TEST(Packet, TrailingBytesIgnored) {
    auto data = mcping::frame_packet(0x05, bytes({0x01}));
    data.push_back(0xee);
    std::error_code ec;
    const auto packet = mcping::read_packet(data, mcping::kDefaultMaxPacketLength, ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(packet.id, 5u);
    EXPECT_EQ(packet.body, bytes({0x01}));
}

#include <gtest/gtest.h>

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

#include "mcping/network/ping.h"
#include "mcping/protocol/request_builder.h"

#include "scripted_stream.h"

using mcping::Errc;
using mcping::PingPhase;

namespace {

const std::string kStatusJson =
    R"({"version":{"name":"1.20","protocol":763},"players":{"max":20,"online":3},"description":"A Server"})";

std::vector<uint8_t> expected_request(std::string_view host, uint16_t port, int32_t version = -1) {
    std::vector<uint8_t> out;
    mcping::frame_payload(mcping::build_handshake(version, host, port), out);
    mcping::frame_payload(mcping::build_status_request(), out);
    return out;
}

void expect_status(const mcping::Pong& pong) {
    EXPECT_EQ(pong.version_name, "1.20");
    EXPECT_EQ(pong.protocol, 763);
    EXPECT_EQ(pong.max_players, 20u);
    EXPECT_EQ(pong.online_players, 3u);
    EXPECT_EQ(pong.description, "A Server");
    EXPECT_FALSE(pong.favicon);
    EXPECT_GE(pong.latency.count(), 0);
}

// Expects `f` to throw PingError with the given kind and phase.
template <typename F>
void expect_ping_error(F&& f, Errc kind, PingPhase phase) {
    try {
        f();
        ADD_FAILURE() << "expected PingError";
    } catch (const mcping::PingError& e) {
        EXPECT_EQ(e.code(), kind) << e.what();
        EXPECT_EQ(e.phase(), phase) << e.what();
    }
}

} // namespace

TEST(Ping, EndToEnd) {
    ScriptedStream stream(status_response(kStatusJson));
    const auto pong = mcping::ping(stream, "localhost", 25565);
    expect_status(pong);

    const auto request = bytes({
        0x13, 0x00, 0xff, 0xff, 0xff, 0xff, 0x0f,
        0x09, 'l', 'o', 'c', 'a', 'l', 'h', 'o', 's', 't',
        0x63, 0xdd, 0x01,
        0x01, 0x00,
    });
    EXPECT_EQ(stream.written(), request);
}

TEST(Ping, ResponseInSingleByteChunks) {
    ScriptedStream stream(status_response(kStatusJson), 1);
    expect_status(mcping::ping(stream, "localhost", 25565));
}

TEST(Ping, ProtocolVersionOption) {
    ScriptedStream stream(status_response(kStatusJson));
    mcping::PingOptions options;
    options.protocol_version = 763;
    mcping::ping(stream, "mc.example.net", 25566, options);
    EXPECT_EQ(stream.written(), expected_request("mc.example.net", 25566, 763));
}

TEST(Ping, UnexpectedPacketId) {
    ScriptedStream stream(status_response(kStatusJson, 0x01));
    expect_ping_error([&] { mcping::ping(stream, "localhost", 25565); },
                      Errc::ProtocolError, PingPhase::AwaitResponse);
}

TEST(Ping, OversizedDeclaredLength) {
    ScriptedStream stream(bytes({0xff, 0xff, 0xff, 0x7f, 0x00, 0x01, 0x02}));
    expect_ping_error([&] { mcping::ping(stream, "localhost", 25565); },
                      Errc::ProtocolError, PingPhase::AwaitResponse);
    EXPECT_EQ(stream.bytes_read(), 4u);
}

TEST(Ping, EmptyResponse) {
    ScriptedStream stream(std::vector<uint8_t>{});
    expect_ping_error([&] { mcping::ping(stream, "localhost", 25565); },
                      Errc::TruncatedStream, PingPhase::AwaitResponse);
}

TEST(Ping, TruncatedResponse) {
    auto response = status_response(kStatusJson);
    response.resize(response.size() / 2);
    ScriptedStream stream(response);
    expect_ping_error([&] { mcping::ping(stream, "localhost", 25565); },
                      Errc::TruncatedStream, PingPhase::AwaitResponse);
}

TEST(Ping, WriteFailure) {
    ScriptedStream stream(status_response(kStatusJson));
    stream.fail_writes(asio::error::broken_pipe);
    expect_ping_error([&] { mcping::ping(stream, "localhost", 25565); },
                      Errc::Io, PingPhase::Handshake);
}

TEST(Ping, ReadFailure) {
    ScriptedStream stream(status_response(kStatusJson));
    stream.fail_reads(asio::error::connection_reset);
    expect_ping_error([&] { mcping::ping(stream, "localhost", 25565); },
                      Errc::Io, PingPhase::AwaitResponse);
}

TEST(Ping, BrokenDocument) {
    ScriptedStream stream(status_response("<html>"));
    expect_ping_error([&] { mcping::ping(stream, "localhost", 25565); },
                      Errc::InvalidJson, PingPhase::Decode);
}

TEST(Ping, ErrorCodeOverload) {
    ScriptedStream stream(status_response(R"({"favicon":"nope"})"));
    std::error_code ec;
    const auto pong = mcping::ping(stream, "localhost", 25565, mcping::PingOptions{}, ec);
    EXPECT_EQ(ec, Errc::InvalidFavicon);
    EXPECT_EQ(pong.description, "");

    ScriptedStream good(status_response(kStatusJson));
    expect_status(mcping::ping(good, "localhost", 25565, mcping::PingOptions{}, ec));
    EXPECT_FALSE(ec);
}

class AsyncPing : public ::testing::Test {
protected:
    AsyncPing() : client_(io_), server_(io_) {
        asio::local::connect_pair(client_, server_);
    }

    void serve(const std::vector<uint8_t>& response, bool close_after = false) {
        asio::write(server_, asio::buffer(response));
        if (close_after) {
            server_.shutdown(asio::socket_base::shutdown_send);
        }
    }

    std::vector<uint8_t> received_request(std::size_t size) {
        std::vector<uint8_t> request(size);
        asio::read(server_, asio::buffer(request));
        return request;
    }

    asio::io_context io_;
    asio::local::stream_protocol::socket client_;
    asio::local::stream_protocol::socket server_;
};

TEST_F(AsyncPing, CompletionHandler) {
    serve(status_response(kStatusJson));

    bool called = false;
    mcping::async_ping(client_, "localhost", 25565, mcping::PingOptions{},
                       [&](std::error_code ec, mcping::Pong pong) {
                           called = true;
                           EXPECT_FALSE(ec) << ec.message();
                           expect_status(pong);
                       });
    io_.run();

    EXPECT_TRUE(called);
    const auto expected = expected_request("localhost", 25565);
    EXPECT_EQ(received_request(expected.size()), expected);
}

TEST_F(AsyncPing, CompletionHandlerTruncated) {
    auto response = status_response(kStatusJson);
    response.resize(10);
    serve(response, true);

    std::error_code result;
    mcping::async_ping(client_, "localhost", 25565, mcping::PingOptions{},
                       [&](std::error_code ec, mcping::Pong) { result = ec; });
    io_.run();

    EXPECT_EQ(result, Errc::TruncatedStream);
}

TEST_F(AsyncPing, OversizedLength) {
    serve(bytes({0xff, 0xff, 0xff, 0x7f}));

    std::error_code result;
    mcping::PingOptions options;
    options.max_packet_length = 1024;
    mcping::async_ping(client_, "localhost", 25565, options,
                       [&](std::error_code ec, mcping::Pong) { result = ec; });
    io_.run();

    EXPECT_EQ(result, Errc::ProtocolError);
}

TEST_F(AsyncPing, Coroutine) {
    serve(status_response(kStatusJson));

    std::optional<mcping::Pong> result;
    asio::co_spawn(io_, mcping::co_ping(client_, "localhost", 25565),
                   [&](std::exception_ptr e, mcping::Pong pong) {
                       EXPECT_FALSE(e);
                       result = std::move(pong);
                   });
    io_.run();

    ASSERT_TRUE(result);
    expect_status(*result);
}

TEST_F(AsyncPing, CoroutineThrowsPingError) {
    serve(status_response(R"({"favicon":"data:image/png;base64,!!!!"})"));

    std::exception_ptr error;
    asio::co_spawn(io_, mcping::co_ping(client_, "localhost", 25565),
                   [&](std::exception_ptr e, mcping::Pong) { error = e; });
    io_.run();

    ASSERT_TRUE(error);
    expect_ping_error([&] { std::rethrow_exception(error); },
                      Errc::InvalidEncoding, PingPhase::Decode);
}

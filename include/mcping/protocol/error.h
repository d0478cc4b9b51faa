#pragma once

#include <string>
#include <system_error>

namespace mcping {

/**
 * Failure kinds of a status ping, usable as std::error_code values.
 */
enum class Errc {
    Io = 1,           // transport failure
    TruncatedStream,  // fewer bytes available than the framing declared
    MalformedVarInt,  // non-terminating or overlong VarInt
    ProtocolError,    // unexpected packet id, zero or oversized length
    InvalidEncoding,  // bad UTF-8 or base64
    InvalidJson,      // status string is not a JSON object
    InvalidFavicon,   // favicon without the data URI prefix
};

/// The phase of a ping in which a failure occurred.
enum class PingPhase {
    Handshake,
    AwaitResponse,
    Decode,
};

const std::error_category& error_category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

const char* to_string(PingPhase phase) noexcept;

/**
 * Thrown by the throwing ping overloads. Carries the failure kind and the
 * phase it happened in.
 */
class PingError : public std::system_error {
public:
    PingError(std::error_code ec, PingPhase phase);

    [[nodiscard]] PingPhase phase() const noexcept { return phase_; }

private:
    PingPhase phase_;
};

} // namespace mcping

namespace std {
template <>
struct is_error_code_enum<mcping::Errc> : true_type {};
} // namespace std

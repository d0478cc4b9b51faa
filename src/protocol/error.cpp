/**
 * Error category for ping failures.
 */

#include "mcping/protocol/error.h"

namespace mcping {

namespace {

class PingErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "mcping"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::Io:              return "transport failure";
        case Errc::TruncatedStream: return "stream ended before the declared length";
        case Errc::MalformedVarInt: return "malformed VarInt";
        case Errc::ProtocolError:   return "protocol violation";
        case Errc::InvalidEncoding: return "invalid UTF-8 or base64 encoding";
        case Errc::InvalidJson:     return "status document is not a JSON object";
        case Errc::InvalidFavicon:  return "favicon is not a PNG data URI";
        }
        return "unknown mcping error";
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static const PingErrorCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

const char* to_string(PingPhase phase) noexcept {
    switch (phase) {
    case PingPhase::Handshake:     return "handshake";
    case PingPhase::AwaitResponse: return "await response";
    case PingPhase::Decode:        return "decode";
    }
    return "unknown";
}

PingError::PingError(std::error_code ec, PingPhase phase)
    : std::system_error(ec, std::string("ping failed during ") + to_string(phase)),
      phase_(phase) {}

} // namespace mcping

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "mcping/status/pong.h"

namespace mcping {

/// Every favicon must start with this data URI prefix.
constexpr std::string_view kFaviconPrefix = "data:image/png;base64,";

/**
 * Decode the body of a status response packet.
 *
 * The body is one length-prefixed UTF-8 string holding a JSON object.
 * Missing or mistyped optional fields fall back to their defaults; only a
 * broken frame, bad encoding, a non-object document or a bad favicon fail.
 * The latency field is left at zero.
 */
Pong parse_status(std::span<const std::uint8_t> body, std::error_code& ec);

/// Throwing overload; raises std::system_error.
Pong parse_status(std::span<const std::uint8_t> body);

/// Deepest component nesting accepted in a description.
constexpr std::size_t kMaxChatDepth = 512;

/**
 * Interpret a description value (string, component object or array).
 *
 * Sets `ec` to Errc::InvalidJson when components nest deeper than
 * kMaxChatDepth.
 */
ChatComponent parse_chat(const nlohmann::json& value, std::error_code& ec);

bool is_valid_utf8(std::string_view text) noexcept;

} // namespace mcping

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcping {

/**
 * Standard (padded) base64, backed by libsodium.
 *
 * Line breaks inside the encoded text are skipped; any other character
 * outside the alphabet makes decoding fail.
 */
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view encoded);

std::string base64_encode(std::span<const std::uint8_t> data);

} // namespace mcping

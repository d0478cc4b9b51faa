/**
 * Base64 helpers on top of libsodium's sodium_base642bin / sodium_bin2base64.
 */

#include "mcping/crypto/base64.h"

#include <sodium.h>

namespace mcping {

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view encoded) {
    std::vector<std::uint8_t> out(encoded.size() / 4 * 3 + 3);
    std::size_t decoded_len = 0;

    // A null b64_end makes libsodium reject the input on the first bad character.
    if (sodium_base642bin(out.data(), out.size(),
                          encoded.data(), encoded.size(),
                          "\r\n", &decoded_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    out.resize(decoded_len);
    return out;
}

std::string base64_encode(std::span<const std::uint8_t> data) {
    const std::size_t encoded_len =
        sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    out.resize(encoded_len - 1); // drop the terminating NUL
    return out;
}

} // namespace mcping

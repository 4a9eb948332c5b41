#pragma once

#include <initializer_list>
#include <span>
#include <string_view>
#include "crypto.hpp"

namespace qline::crypto {

// HMAC-SHA256 over one message
HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message);

// HMAC-SHA256 over the concatenation of parts, without building it
HmacDigest hmac_sha256_parts(std::span<const uint8_t> key,
                             std::initializer_list<std::span<const uint8_t>> parts);

// RFC 5869 extract. An empty salt means HashLen zero bytes.
HmacDigest hkdf_extract(std::span<const uint8_t> salt, std::span<const uint8_t> ikm);

// RFC 5869 expand into output. Throws std::invalid_argument above 255 blocks.
void hkdf_expand(std::span<const uint8_t> prk,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> output);

void hkdf(std::span<const uint8_t> salt,
          std::span<const uint8_t> ikm,
          std::span<const uint8_t> info,
          std::span<uint8_t> output);

// One 256-bit key from ikm under text labels for salt and info
SymmetricKey derive_symmetric_key(std::string_view salt_label,
                                  std::span<const uint8_t> ikm,
                                  std::string_view info_label);

// View a string literal label as bytes
inline std::span<const uint8_t> as_bytes(std::string_view label) {
    return {reinterpret_cast<const uint8_t*>(label.data()), label.size()};
}

}  // namespace qline::crypto

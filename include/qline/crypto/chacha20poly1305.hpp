#pragma once

#include <optional>
#include <span>
#include <vector>
#include "crypto.hpp"

namespace qline::crypto {

// ChaCha20-Poly1305 (IETF) AEAD encryption
// Ciphertext has the plaintext's length, tag is separate
std::vector<uint8_t> encrypt_detached(const SymmetricKey& key,
                                       const Nonce& nonce,
                                       std::span<const uint8_t> plaintext,
                                       AuthTag& tag_out,
                                       std::span<const uint8_t> additional_data = {});

// ChaCha20-Poly1305 (IETF) AEAD decryption
// The tag is verified before anything is written to the result; on failure
// nullopt is returned and no plaintext bytes leave this function
std::optional<std::vector<uint8_t>> decrypt_detached(const SymmetricKey& key,
                                                      const Nonce& nonce,
                                                      std::span<const uint8_t> ciphertext,
                                                      const AuthTag& tag,
                                                      std::span<const uint8_t> additional_data = {});

}  // namespace qline::crypto

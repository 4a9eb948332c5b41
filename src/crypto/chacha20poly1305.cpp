#include "qline/crypto/chacha20poly1305.hpp"

#include <sodium.h>

namespace qline::crypto {

std::vector<uint8_t> encrypt_detached(const SymmetricKey& key,
                                       const Nonce& nonce,
                                       std::span<const uint8_t> plaintext,
                                       AuthTag& tag_out,
                                       std::span<const uint8_t> additional_data) {
    std::vector<uint8_t> ciphertext(plaintext.size());
    unsigned long long tag_len;

    crypto_aead_chacha20poly1305_ietf_encrypt_detached(
        ciphertext.data(),
        tag_out.data(), &tag_len,
        plaintext.data(), plaintext.size(),
        additional_data.data(), additional_data.size(),
        nullptr,  // nsec
        nonce.data(),
        key.data()
    );

    return ciphertext;
}

std::optional<std::vector<uint8_t>> decrypt_detached(const SymmetricKey& key,
                                                      const Nonce& nonce,
                                                      std::span<const uint8_t> ciphertext,
                                                      const AuthTag& tag,
                                                      std::span<const uint8_t> additional_data) {
    std::vector<uint8_t> plaintext(ciphertext.size());

    // libsodium checks the tag before decrypting into the output buffer
    if (crypto_aead_chacha20poly1305_ietf_decrypt_detached(
            plaintext.data(),
            nullptr,  // nsec
            ciphertext.data(), ciphertext.size(),
            tag.data(),
            additional_data.data(), additional_data.size(),
            nonce.data(),
            key.data()
        ) != 0) {
        sodium_memzero(plaintext.data(), plaintext.size());
        return std::nullopt;
    }

    return plaintext;
}

}  // namespace qline::crypto

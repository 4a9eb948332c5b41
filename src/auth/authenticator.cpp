#include "qline/auth/authenticator.hpp"

#include <sodium.h>

#include <stdexcept>

namespace qline::auth {

static_assert(ED25519_PUBLIC_KEY_SIZE == crypto_sign_PUBLICKEYBYTES);
static_assert(ED25519_SECRET_KEY_SIZE == crypto_sign_SECRETKEYBYTES);
static_assert(ED25519_SEED_SIZE == crypto_sign_SEEDBYTES);
static_assert(ED25519_SIGNATURE_SIZE == crypto_sign_BYTES);

Ed25519Authenticator::Ed25519Authenticator() {
    if (crypto_sign_keypair(public_key_.data(), secret_key_.data()) != 0) {
        sodium_memzero(secret_key_.data(), secret_key_.size());
        throw std::runtime_error("Failed to generate Ed25519 keypair");
    }
}

Ed25519Authenticator::Ed25519Authenticator(const IdentitySeed& seed) {
    if (crypto_sign_seed_keypair(public_key_.data(), secret_key_.data(), seed.data()) != 0) {
        sodium_memzero(secret_key_.data(), secret_key_.size());
        throw std::runtime_error("Failed to derive Ed25519 keypair from seed");
    }
}

Ed25519Authenticator::~Ed25519Authenticator() {
    sodium_memzero(secret_key_.data(), secret_key_.size());
}

std::vector<uint8_t> Ed25519Authenticator::public_identity() const {
    return {public_key_.begin(), public_key_.end()};
}

std::vector<uint8_t> Ed25519Authenticator::sign(std::span<const uint8_t> message) const {
    std::vector<uint8_t> signature(ED25519_SIGNATURE_SIZE);
    unsigned long long sig_len = 0;
    crypto_sign_detached(signature.data(), &sig_len, message.data(), message.size(),
                         secret_key_.data());
    signature.resize(static_cast<size_t>(sig_len));
    return signature;
}

bool Ed25519Authenticator::verify(std::span<const uint8_t> identity,
                                  std::span<const uint8_t> message,
                                  std::span<const uint8_t> signature) const {
    if (identity.size() != ED25519_PUBLIC_KEY_SIZE || signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       identity.data()) == 0;
}

}  // namespace qline::auth

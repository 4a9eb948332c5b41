#include "qline/crypto/x25519.hpp"

#include <sodium.h>

namespace qline::crypto {

void X25519KeyPair::wipe() {
    sodium_memzero(secret_key.data(), secret_key.size());
}

X25519KeyPair generate_keypair() {
    X25519KeyPair kp;
    crypto_box_keypair(kp.public_key.data(), kp.secret_key.data());
    return kp;
}

std::optional<SharedSecret> key_exchange(const SecretKey& our_secret,
                                          const PublicKey& their_public) {
    SharedSecret shared;

    // crypto_scalarmult returns 0 on success, -1 on failure (weak key)
    if (crypto_scalarmult(shared.data(), our_secret.data(), their_public.data()) != 0) {
        return std::nullopt;
    }

    // All-zero output indicates a low-order peer point
    if (sodium_is_zero(shared.data(), shared.size())) {
        return std::nullopt;
    }

    return shared;
}

}  // namespace qline::crypto

#include "qline/crypto/crypto.hpp"

#include <sodium.h>

namespace qline::crypto {

bool init() {
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

bool is_zero(std::span<const uint8_t> data) {
    return sodium_is_zero(data.data(), data.size()) == 1;
}

void random_bytes(std::span<uint8_t> output) {
    randombytes_buf(output.data(), output.size());
}

uint32_t random_uniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

double random_unit() {
    // 53 random bits give every representable double in [0, 1) with step 2^-53
    uint64_t bits = 0;
    randombytes_buf(&bits, sizeof(bits));
    return static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);
}

bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

Sha256Digest sha256(std::span<const uint8_t> data) {
    Sha256Digest digest;
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

struct Sha256::State {
    crypto_hash_sha256_state ctx;
};

Sha256::Sha256() : state_(std::make_unique<State>()) {
    crypto_hash_sha256_init(&state_->ctx);
}

Sha256::~Sha256() {
    sodium_memzero(&state_->ctx, sizeof(state_->ctx));
}

void Sha256::update(std::span<const uint8_t> data) {
    crypto_hash_sha256_update(&state_->ctx, data.data(), data.size());
}

Sha256Digest Sha256::peek() const {
    crypto_hash_sha256_state copy = state_->ctx;
    Sha256Digest digest;
    crypto_hash_sha256_final(&copy, digest.data());
    sodium_memzero(&copy, sizeof(copy));
    return digest;
}

void Sha256::reset() {
    crypto_hash_sha256_init(&state_->ctx);
}

}  // namespace qline::crypto

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace qline::crypto {

// Key sizes
constexpr size_t X25519_KEY_SIZE = 32;
constexpr size_t X25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t X25519_SECRET_KEY_SIZE = 32;
constexpr size_t CHACHA20_KEY_SIZE = 32;
constexpr size_t CHACHA20_NONCE_SIZE = 12;
constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t HMAC_SHA256_SIZE = 32;
constexpr size_t SHA256_SIZE = 32;
constexpr size_t HKDF_SALT_SIZE = 32;

using SecretKey = std::array<uint8_t, X25519_SECRET_KEY_SIZE>;
using PublicKey = std::array<uint8_t, X25519_PUBLIC_KEY_SIZE>;
using SharedSecret = std::array<uint8_t, X25519_KEY_SIZE>;
using SymmetricKey = std::array<uint8_t, CHACHA20_KEY_SIZE>;
using Nonce = std::array<uint8_t, CHACHA20_NONCE_SIZE>;
using AuthTag = std::array<uint8_t, POLY1305_TAG_SIZE>;
using HmacDigest = std::array<uint8_t, HMAC_SHA256_SIZE>;
using Sha256Digest = std::array<uint8_t, SHA256_SIZE>;

// Initialize the crypto subsystem
bool init();

// Securely zero memory
void secure_zero(void* ptr, size_t len);

// True if every byte is zero (constant time)
bool is_zero(std::span<const uint8_t> data);

// Generate random bytes
void random_bytes(std::span<uint8_t> output);

// Uniform random integer in [0, upper_bound)
uint32_t random_uniform(uint32_t upper_bound);

// Uniform random double in [0, 1)
double random_unit();

// Constant-time comparison
bool constant_time_compare(std::span<const uint8_t> a, std::span<const uint8_t> b);

// SHA-256
Sha256Digest sha256(std::span<const uint8_t> data);

// Incremental SHA-256 used for handshake transcripts
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(std::span<const uint8_t> data);

    // Digest of everything absorbed so far; the running state is left intact
    [[nodiscard]] Sha256Digest peek() const;

    void reset();

private:
    struct State;
    std::unique_ptr<State> state_;
};

}  // namespace qline::crypto

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace qline::auth {

constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;
constexpr size_t ED25519_SEED_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

using IdentitySeed = std::array<uint8_t, ED25519_SEED_SIZE>;

// Long-term identity used to authenticate the classical handshake.
// Implementations must be safe to call from one thread at a time.
class Authenticator {
public:
    virtual ~Authenticator() = default;

    // Encoded public identity sent to the peer
    [[nodiscard]] virtual std::vector<uint8_t> public_identity() const = 0;

    virtual std::vector<uint8_t> sign(std::span<const uint8_t> message) const = 0;

    // Verify signature by the holder of identity over message
    [[nodiscard]] virtual bool verify(std::span<const uint8_t> identity,
                                      std::span<const uint8_t> message,
                                      std::span<const uint8_t> signature) const = 0;
};

class Ed25519Authenticator : public Authenticator {
public:
    // Fresh random identity
    Ed25519Authenticator();

    // Deterministic identity from a 32-byte seed
    explicit Ed25519Authenticator(const IdentitySeed& seed);

    ~Ed25519Authenticator() override;

    Ed25519Authenticator(const Ed25519Authenticator&) = delete;
    Ed25519Authenticator& operator=(const Ed25519Authenticator&) = delete;

    [[nodiscard]] std::vector<uint8_t> public_identity() const override;
    std::vector<uint8_t> sign(std::span<const uint8_t> message) const override;
    [[nodiscard]] bool verify(std::span<const uint8_t> identity,
                              std::span<const uint8_t> message,
                              std::span<const uint8_t> signature) const override;

private:
    std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE> public_key_{};
    std::array<uint8_t, ED25519_SECRET_KEY_SIZE> secret_key_{};
};

}  // namespace qline::auth

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

#include "qline/common/error.hpp"
#include "qline/crypto/crypto.hpp"

namespace qline::session {

class SessionKeyManager;

// 256-bit session key tagged with its generation and creation time.
// Move-only. The key bytes live in a heap block that never moves, so
// erasure can be verified after the fact. Destroying a key that was never
// erased is a defect: it is logged and the storage is wiped anyway.
class HybridSessionKey {
public:
    static constexpr size_t SIZE = crypto::CHACHA20_KEY_SIZE;

    HybridSessionKey(const crypto::SymmetricKey& material, uint64_t created_at_ms);
    ~HybridSessionKey();

    HybridSessionKey(HybridSessionKey&& other) noexcept;
    HybridSessionKey& operator=(HybridSessionKey&& other) noexcept;
    HybridSessionKey(const HybridSessionKey&) = delete;
    HybridSessionKey& operator=(const HybridSessionKey&) = delete;

    // 0 until activated by a SessionKeyManager
    [[nodiscard]] uint32_t generation() const { return generation_; }
    [[nodiscard]] uint64_t created_at_ms() const { return created_at_ms_; }

    // Key bytes for scoped use; must not be copied out
    [[nodiscard]] const crypto::SymmetricKey& material() const { return *material_; }

    // Overwrite with zeros and mark unusable
    void erase();
    [[nodiscard]] bool is_erased() const { return erased_; }

    // True if the backing storage is all zero
    [[nodiscard]] bool storage_is_zeroed() const;

    // Constant-time equality of key bytes
    [[nodiscard]] bool same_material(const HybridSessionKey& other) const;

private:
    friend class SessionKeyManager;

    std::unique_ptr<crypto::SymmetricKey> material_;
    uint32_t generation_{0};
    uint64_t created_at_ms_{0};
    bool erased_{false};
};

struct HybridKeyDeriverConfig {
    size_t key_length_bits = 256;            // Only 256 is supported by the AEAD
    size_t min_classical_entropy_bytes = 16;  // 128 bits
};

// Combines quantum, classical and authenticated material into a session key.
// IKM = len || quantum bits (packed MSB-first) || len || classical entropy
//       || len || authenticated secret   (lengths are 32-bit big-endian)
// key = HKDF-SHA256(salt "qline-hybrid-v1", IKM, info "qline session key")
class HybridKeyDeriver {
public:
    explicit HybridKeyDeriver(const HybridKeyDeriverConfig& config = {});

    // INSUFFICIENT_ENTROPY if quantum_key_bits is empty or classical_entropy
    // is shorter than the configured minimum. Pure: equal inputs give equal keys.
    std::optional<HybridSessionKey> derive(std::span<const uint8_t> quantum_key_bits,
                                           std::span<const uint8_t> classical_entropy,
                                           std::span<const uint8_t> authenticated_secret);

    [[nodiscard]] ErrorCode last_error() const { return last_error_; }

private:
    HybridKeyDeriverConfig config_;
    ErrorCode last_error_{ErrorCode::NONE};
};

}  // namespace qline::session

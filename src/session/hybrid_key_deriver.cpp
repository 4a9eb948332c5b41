#include "qline/session/hybrid_key_deriver.hpp"

#include <spdlog/spdlog.h>

#include "qline/crypto/hkdf.hpp"
#include "qline/crypto/secure_buffer.hpp"
#include "qline/utils/time.hpp"

namespace qline::session {

namespace {

constexpr std::string_view DERIVE_SALT = "qline-hybrid-v1";
constexpr std::string_view DERIVE_INFO = "qline session key";

void append_u32(crypto::SecureBuffer& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void append_bytes(crypto::SecureBuffer& out, std::span<const uint8_t> data) {
    append_u32(out, static_cast<uint32_t>(data.size()));
    for (auto b : data) {
        out.push_back(b);
    }
}

}  // namespace

HybridSessionKey::HybridSessionKey(const crypto::SymmetricKey& material, uint64_t created_at_ms)
    : material_(std::make_unique<crypto::SymmetricKey>(material)),
      created_at_ms_(created_at_ms) {}

HybridSessionKey::~HybridSessionKey() {
    if (material_ && !erased_) {
        spdlog::error("Session key generation {} released without erase", generation_);
        erase();
    }
}

HybridSessionKey::HybridSessionKey(HybridSessionKey&& other) noexcept
    : material_(std::move(other.material_)),
      generation_(other.generation_),
      created_at_ms_(other.created_at_ms_),
      erased_(other.erased_) {
    other.erased_ = true;
}

HybridSessionKey& HybridSessionKey::operator=(HybridSessionKey&& other) noexcept {
    if (this != &other) {
        if (material_ && !erased_) {
            spdlog::error("Session key generation {} overwritten without erase", generation_);
            erase();
        }
        material_ = std::move(other.material_);
        generation_ = other.generation_;
        created_at_ms_ = other.created_at_ms_;
        erased_ = other.erased_;
        other.erased_ = true;
    }
    return *this;
}

void HybridSessionKey::erase() {
    if (material_) {
        crypto::secure_zero(material_->data(), material_->size());
    }
    erased_ = true;
}

bool HybridSessionKey::storage_is_zeroed() const {
    return material_ && crypto::is_zero(*material_);
}

bool HybridSessionKey::same_material(const HybridSessionKey& other) const {
    if (!material_ || !other.material_) {
        return false;
    }
    return crypto::constant_time_compare(*material_, *other.material_);
}

HybridKeyDeriver::HybridKeyDeriver(const HybridKeyDeriverConfig& config) : config_(config) {}

std::optional<HybridSessionKey> HybridKeyDeriver::derive(std::span<const uint8_t> quantum_key_bits,
                                                         std::span<const uint8_t> classical_entropy,
                                                         std::span<const uint8_t> authenticated_secret) {
    if (config_.key_length_bits != HybridSessionKey::SIZE * 8) {
        last_error_ = ErrorCode::INVALID_PARAMETER;
        return std::nullopt;
    }
    if (quantum_key_bits.empty() || classical_entropy.size() < config_.min_classical_entropy_bytes) {
        last_error_ = ErrorCode::INSUFFICIENT_ENTROPY;
        return std::nullopt;
    }

    // Pack quantum bits MSB-first; a trailing partial byte is zero-padded
    crypto::SecureBuffer packed((quantum_key_bits.size() + 7) / 8);
    for (size_t i = 0; i < quantum_key_bits.size(); ++i) {
        if (quantum_key_bits[i] & 1) {
            packed[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
    }

    crypto::SecureBuffer ikm;
    ikm.reserve(12 + packed.size() + classical_entropy.size() + authenticated_secret.size());
    // Bit count rather than byte count keeps 8 and 7 bit keys distinct
    append_u32(ikm, static_cast<uint32_t>(quantum_key_bits.size()));
    for (size_t i = 0; i < packed.size(); ++i) {
        ikm.push_back(packed[i]);
    }
    append_bytes(ikm, classical_entropy);
    append_bytes(ikm, authenticated_secret);

    auto material = crypto::derive_symmetric_key(DERIVE_SALT, ikm.span(), DERIVE_INFO);

    HybridSessionKey key(material, utils::time_ms());
    crypto::secure_zero(material.data(), material.size());

    last_error_ = ErrorCode::NONE;
    return key;
}

}  // namespace qline::session

#include "qline/qkd/sifter.hpp"

namespace qline::qkd {

Sifter::Sifter(const SifterConfig& config) : config_(config) {}

std::optional<SiftedKey> Sifter::sift(std::span<const Basis> local_bases,
                                      std::span<const Basis> peer_bases,
                                      std::span<const uint8_t> local_bits) {
    if (local_bases.size() != peer_bases.size() || local_bases.size() != local_bits.size()) {
        last_error_ = ErrorCode::LENGTH_MISMATCH;
        return std::nullopt;
    }

    SiftedKey key;
    key.bits.reserve(local_bits.size());
    key.source_indices.reserve(local_bits.size());

    for (size_t i = 0; i < local_bases.size(); ++i) {
        if (local_bases[i] == peer_bases[i]) {
            key.bits.push_back(local_bits[i] & 1);
            key.source_indices.push_back(static_cast<uint32_t>(i));
        }
    }

    if (key.size() < config_.min_sifted_bits) {
        last_error_ = ErrorCode::INSUFFICIENT_KEY_MATERIAL;
        return std::nullopt;
    }

    last_error_ = ErrorCode::NONE;
    return key;
}

}  // namespace qline::qkd

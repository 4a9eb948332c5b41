#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "qline/common/error.hpp"
#include "qline/crypto/secure_buffer.hpp"
#include "qline/qkd/quantum_channel.hpp"

namespace qline::qkd {

// Bits kept where both parties measured in the same basis
struct SiftedKey {
    crypto::SecureBuffer bits;            // One bit per byte
    std::vector<uint32_t> source_indices;  // Raw-stream position of each bit

    [[nodiscard]] size_t size() const { return bits.size(); }
    [[nodiscard]] bool empty() const { return bits.empty(); }
};

struct SifterConfig {
    size_t min_sifted_bits = 256;  // Shorter keys need a fresh stream
};

class Sifter {
public:
    explicit Sifter(const SifterConfig& config = {});

    // Keep local_bits[i] wherever local_bases[i] == peer_bases[i].
    // LENGTH_MISMATCH if the sequences differ in length,
    // INSUFFICIENT_KEY_MATERIAL if fewer than min_sifted_bits survive.
    std::optional<SiftedKey> sift(std::span<const Basis> local_bases,
                                  std::span<const Basis> peer_bases,
                                  std::span<const uint8_t> local_bits);

    [[nodiscard]] ErrorCode last_error() const { return last_error_; }
    [[nodiscard]] const SifterConfig& config() const { return config_; }

private:
    SifterConfig config_;
    ErrorCode last_error_{ErrorCode::NONE};
};

}  // namespace qline::qkd

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "qline/common/error.hpp"
#include "qline/crypto/secure_buffer.hpp"

namespace qline::qkd {

using PermutationSeed = std::array<uint8_t, 32>;

// Half-open range [begin, end) over permuted key positions
struct ParityRange {
    uint32_t begin;
    uint32_t end;

    [[nodiscard]] uint32_t length() const { return end - begin; }
    [[nodiscard]] uint32_t mid() const { return begin + length() / 2; }

    bool operator==(const ParityRange& other) const = default;
};

struct ReconcilerConfig {
    size_t passes = 4;
    size_t min_block_size = 8;
    size_t max_block_size = 256;
};

// Parity-based error correction (BINARY search over shuffled blocks).
// The reference side only answers parity queries; the correcting side
// locates single-bit errors in mismatching blocks and flips them.
class Reconciler {
public:
    explicit Reconciler(const ReconcilerConfig& config = {});

    // Block size for the first pass, about 0.73 / qber
    [[nodiscard]] size_t initial_block_size(double qber) const;

    // Block size used by pass p (doubles each pass)
    [[nodiscard]] size_t block_size_for_pass(size_t initial, size_t pass) const;

    // Deterministic permutation of [0, n) shared by both sides through the seed
    static std::vector<uint32_t> permutation(const PermutationSeed& seed, size_t n);

    // Parity of bits at perm[begin..end)
    static uint8_t parity(std::span<const uint8_t> bits,
                          std::span<const uint32_t> perm,
                          const ParityRange& range);

    // Parities of consecutive blocks of the permuted key
    static std::vector<ParityRange> blocks(size_t n, size_t block_size);
    static std::vector<uint8_t> parities(std::span<const uint8_t> bits,
                                         std::span<const uint32_t> perm,
                                         std::span<const ParityRange> ranges);

    // Blocks whose local parity disagrees with the reference. Single-bit
    // blocks are corrected in place and not returned.
    std::optional<std::vector<ParityRange>> mismatched(crypto::SecureBuffer& bits,
                                                       std::span<const uint32_t> perm,
                                                       std::span<const ParityRange> ranges,
                                                       std::span<const uint8_t> reference_parities);

    // Ranges to query next: the first half of every active range
    static std::vector<ParityRange> first_halves(std::span<const ParityRange> active);

    // Narrow each active range using the reference parities of its first
    // half. Ranges reduced to one position are corrected in place.
    std::optional<std::vector<ParityRange>> narrow(crypto::SecureBuffer& bits,
                                                   std::span<const uint32_t> perm,
                                                   std::span<const ParityRange> active,
                                                   std::span<const uint8_t> first_half_parities);

    [[nodiscard]] size_t corrected_bits() const { return corrected_bits_; }
    [[nodiscard]] size_t disclosed_parities() const { return disclosed_parities_; }
    void reset_counters();

    [[nodiscard]] ErrorCode last_error() const { return last_error_; }
    [[nodiscard]] const ReconcilerConfig& config() const { return config_; }

private:
    ReconcilerConfig config_;
    size_t corrected_bits_{0};
    size_t disclosed_parities_{0};
    ErrorCode last_error_{ErrorCode::NONE};

    void flip(crypto::SecureBuffer& bits, std::span<const uint32_t> perm, uint32_t position);
};

}  // namespace qline::qkd

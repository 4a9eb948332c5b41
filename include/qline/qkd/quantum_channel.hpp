#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "qline/common/error.hpp"

namespace qline::qkd {

// BB84 measurement bases
enum class Basis : uint8_t {
    RECTILINEAR = 0,
    DIAGONAL = 1
};

// One party's (bit, basis) record for a handshake attempt.
// Immutable once constructed.
class BitBasisStream {
public:
    BitBasisStream() = default;
    BitBasisStream(std::vector<uint8_t> bits, std::vector<Basis> bases);
    ~BitBasisStream();

    BitBasisStream(BitBasisStream&&) noexcept = default;
    BitBasisStream& operator=(BitBasisStream&&) noexcept = default;
    BitBasisStream(const BitBasisStream&) = delete;
    BitBasisStream& operator=(const BitBasisStream&) = delete;

    [[nodiscard]] size_t size() const { return bits_.size(); }
    [[nodiscard]] bool empty() const { return bits_.empty(); }
    [[nodiscard]] uint8_t bit(size_t i) const { return bits_[i]; }
    [[nodiscard]] Basis basis(size_t i) const { return bases_[i]; }
    [[nodiscard]] std::span<const uint8_t> bits() const { return bits_; }
    [[nodiscard]] std::span<const Basis> bases() const { return bases_; }

private:
    std::vector<uint8_t> bits_;
    std::vector<Basis> bases_;
};

// Simulated quantum channel: prepares and measures BB84 states.
// Stateless apart from the last error; every call draws fresh randomness.
class QuantumChannelSimulator {
public:
    // n uniformly random (bit, basis) pairs for the sending party.
    // error_rate must lie in [0, 1]. Flipping an unrecorded uniform bit
    // leaves it uniform, so source noise has no observable effect before
    // measurement; channel noise is applied by transmit().
    std::optional<BitBasisStream> generate(size_t n, double error_rate);

    // Measurement by the receiving party. The receiver picks a uniform basis
    // per position. Matching basis: the bit passes through, flipped with
    // probability channel_error_rate. Differing basis: the outcome is random.
    std::optional<BitBasisStream> transmit(const BitBasisStream& stream,
                                           double channel_error_rate);

    [[nodiscard]] ErrorCode last_error() const { return last_error_; }

private:
    ErrorCode last_error_{ErrorCode::NONE};
};

}  // namespace qline::qkd

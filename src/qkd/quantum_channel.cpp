#include "qline/qkd/quantum_channel.hpp"

#include "qline/crypto/crypto.hpp"

namespace qline::qkd {

namespace {

bool valid_rate(double rate) {
    return rate >= 0.0 && rate <= 1.0;
}

// Draw n random bits, one per byte
std::vector<uint8_t> random_bits(size_t n) {
    std::vector<uint8_t> bits(n);
    crypto::random_bytes(bits);
    for (auto& b : bits) {
        b &= 1;
    }
    return bits;
}

std::vector<Basis> random_bases(size_t n) {
    auto raw = random_bits(n);
    std::vector<Basis> bases(n);
    for (size_t i = 0; i < n; ++i) {
        bases[i] = static_cast<Basis>(raw[i]);
    }
    return bases;
}

}  // namespace

BitBasisStream::BitBasisStream(std::vector<uint8_t> bits, std::vector<Basis> bases)
    : bits_(std::move(bits)), bases_(std::move(bases)) {}

BitBasisStream::~BitBasisStream() {
    if (!bits_.empty()) {
        crypto::secure_zero(bits_.data(), bits_.size());
    }
}

std::optional<BitBasisStream> QuantumChannelSimulator::generate(size_t n, double error_rate) {
    if (n == 0 || !valid_rate(error_rate)) {
        last_error_ = ErrorCode::INVALID_PARAMETER;
        return std::nullopt;
    }

    last_error_ = ErrorCode::NONE;
    return BitBasisStream(random_bits(n), random_bases(n));
}

std::optional<BitBasisStream> QuantumChannelSimulator::transmit(const BitBasisStream& stream,
                                                                double channel_error_rate) {
    if (stream.empty() || !valid_rate(channel_error_rate)) {
        last_error_ = ErrorCode::INVALID_PARAMETER;
        return std::nullopt;
    }

    const size_t n = stream.size();
    auto receiver_bases = random_bases(n);
    auto coin = random_bits(n);
    std::vector<uint8_t> measured(n);

    for (size_t i = 0; i < n; ++i) {
        if (receiver_bases[i] != stream.basis(i)) {
            // Wrong basis collapses the state to a random outcome
            measured[i] = coin[i];
            continue;
        }
        uint8_t bit = stream.bit(i);
        if (channel_error_rate > 0.0 && crypto::random_unit() < channel_error_rate) {
            bit ^= 1;
        }
        measured[i] = bit;
    }

    crypto::secure_zero(coin.data(), coin.size());
    last_error_ = ErrorCode::NONE;
    return BitBasisStream(std::move(measured), std::move(receiver_bases));
}

}  // namespace qline::qkd

#include "qline/qkd/reconciler.hpp"

#include <sodium.h>

#include <algorithm>
#include <cmath>

namespace qline::qkd {

Reconciler::Reconciler(const ReconcilerConfig& config) : config_(config) {}

size_t Reconciler::initial_block_size(double qber) const {
    if (qber <= 0.0) {
        return config_.max_block_size;
    }
    auto size = static_cast<size_t>(std::ceil(0.73 / qber));
    return std::clamp(size, config_.min_block_size, config_.max_block_size);
}

size_t Reconciler::block_size_for_pass(size_t initial, size_t pass) const {
    size_t size = initial;
    for (size_t p = 0; p < pass && size < config_.max_block_size; ++p) {
        size *= 2;
    }
    return std::min(size, config_.max_block_size);
}

std::vector<uint32_t> Reconciler::permutation(const PermutationSeed& seed, size_t n) {
    std::vector<uint32_t> perm(n);
    for (size_t i = 0; i < n; ++i) {
        perm[i] = static_cast<uint32_t>(i);
    }
    if (n < 2) {
        return perm;
    }

    static_assert(sizeof(PermutationSeed) == randombytes_SEEDBYTES);
    std::vector<uint32_t> stream(n);
    randombytes_buf_deterministic(stream.data(), stream.size() * sizeof(uint32_t), seed.data());

    for (size_t i = n - 1; i > 0; --i) {
        size_t j = stream[i] % (i + 1);
        std::swap(perm[i], perm[j]);
    }
    return perm;
}

uint8_t Reconciler::parity(std::span<const uint8_t> bits,
                           std::span<const uint32_t> perm,
                           const ParityRange& range) {
    uint8_t p = 0;
    for (uint32_t i = range.begin; i < range.end; ++i) {
        p ^= bits[perm[i]] & 1;
    }
    return p;
}

std::vector<ParityRange> Reconciler::blocks(size_t n, size_t block_size) {
    std::vector<ParityRange> out;
    if (block_size == 0) {
        return out;
    }
    for (size_t begin = 0; begin < n; begin += block_size) {
        size_t end = std::min(n, begin + block_size);
        out.push_back({static_cast<uint32_t>(begin), static_cast<uint32_t>(end)});
    }
    return out;
}

std::vector<uint8_t> Reconciler::parities(std::span<const uint8_t> bits,
                                          std::span<const uint32_t> perm,
                                          std::span<const ParityRange> ranges) {
    std::vector<uint8_t> out;
    out.reserve(ranges.size());
    for (const auto& r : ranges) {
        out.push_back(parity(bits, perm, r));
    }
    return out;
}

std::optional<std::vector<ParityRange>> Reconciler::mismatched(
    crypto::SecureBuffer& bits,
    std::span<const uint32_t> perm,
    std::span<const ParityRange> ranges,
    std::span<const uint8_t> reference_parities) {
    if (ranges.size() != reference_parities.size() || perm.size() != bits.size()) {
        last_error_ = ErrorCode::LENGTH_MISMATCH;
        return std::nullopt;
    }

    disclosed_parities_ += ranges.size();
    std::vector<ParityRange> active;
    for (size_t i = 0; i < ranges.size(); ++i) {
        if (ranges[i].end > bits.size() || ranges[i].length() == 0) {
            last_error_ = ErrorCode::INVALID_PARAMETER;
            return std::nullopt;
        }
        if (parity(bits.span(), perm, ranges[i]) == (reference_parities[i] & 1)) {
            continue;
        }
        if (ranges[i].length() == 1) {
            flip(bits, perm, ranges[i].begin);
        } else {
            active.push_back(ranges[i]);
        }
    }

    last_error_ = ErrorCode::NONE;
    return active;
}

std::vector<ParityRange> Reconciler::first_halves(std::span<const ParityRange> active) {
    std::vector<ParityRange> halves;
    halves.reserve(active.size());
    for (const auto& r : active) {
        halves.push_back({r.begin, r.mid()});
    }
    return halves;
}

std::optional<std::vector<ParityRange>> Reconciler::narrow(
    crypto::SecureBuffer& bits,
    std::span<const uint32_t> perm,
    std::span<const ParityRange> active,
    std::span<const uint8_t> first_half_parities) {
    if (active.size() != first_half_parities.size()) {
        last_error_ = ErrorCode::LENGTH_MISMATCH;
        return std::nullopt;
    }

    disclosed_parities_ += active.size();
    std::vector<ParityRange> next;
    for (size_t i = 0; i < active.size(); ++i) {
        ParityRange first{active[i].begin, active[i].mid()};
        ParityRange narrowed = active[i];
        if (parity(bits.span(), perm, first) != (first_half_parities[i] & 1)) {
            narrowed = first;
        } else {
            narrowed = {active[i].mid(), active[i].end};
        }

        if (narrowed.length() == 1) {
            flip(bits, perm, narrowed.begin);
        } else {
            next.push_back(narrowed);
        }
    }

    last_error_ = ErrorCode::NONE;
    return next;
}

void Reconciler::reset_counters() {
    corrected_bits_ = 0;
    disclosed_parities_ = 0;
}

void Reconciler::flip(crypto::SecureBuffer& bits, std::span<const uint32_t> perm, uint32_t position) {
    bits[perm[position]] ^= 1;
    ++corrected_bits_;
}

}  // namespace qline::qkd

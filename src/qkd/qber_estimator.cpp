#include "qline/qkd/qber_estimator.hpp"

#include <algorithm>
#include <cmath>

#include "qline/crypto/crypto.hpp"

namespace qline::qkd {

QberReport::QberReport(size_t sample_size, size_t mismatches, double threshold)
    : sample_size_(sample_size),
      mismatches_(mismatches),
      error_rate_(static_cast<double>(mismatches) / static_cast<double>(sample_size)),
      decision_(error_rate_ <= threshold ? QberDecision::ACCEPT : QberDecision::ABORT) {}

QberEstimator::QberEstimator(const QberEstimatorConfig& config) : config_(config) {}

std::optional<std::vector<uint32_t>> QberEstimator::choose_sample_indices(size_t sifted_length) {
    if (sifted_length < 2 || config_.sample_fraction <= 0.0 || config_.sample_fraction >= 1.0) {
        last_error_ = ErrorCode::INVALID_PARAMETER;
        return std::nullopt;
    }

    auto count = static_cast<size_t>(std::llround(config_.sample_fraction *
                                                  static_cast<double>(sifted_length)));
    count = std::clamp<size_t>(count, 1, sifted_length - 1);

    // Partial Fisher-Yates over the position list
    std::vector<uint32_t> positions(sifted_length);
    for (size_t i = 0; i < sifted_length; ++i) {
        positions[i] = static_cast<uint32_t>(i);
    }
    for (size_t i = 0; i < count; ++i) {
        auto remaining = static_cast<uint32_t>(sifted_length - i);
        size_t j = i + crypto::random_uniform(remaining);
        std::swap(positions[i], positions[j]);
    }

    positions.resize(count);
    std::sort(positions.begin(), positions.end());
    last_error_ = ErrorCode::NONE;
    return positions;
}

std::optional<QberReport> QberEstimator::estimate(const SiftedKey& sifted_local,
                                                  std::span<const uint8_t> peer_sample_bits,
                                                  std::span<const uint32_t> sample_indices) {
    if (sample_indices.empty()) {
        last_error_ = ErrorCode::INVALID_PARAMETER;
        return std::nullopt;
    }
    if (peer_sample_bits.size() != sample_indices.size()) {
        last_error_ = ErrorCode::LENGTH_MISMATCH;
        return std::nullopt;
    }

    std::vector<bool> seen(sifted_local.size(), false);
    size_t mismatches = 0;

    for (size_t k = 0; k < sample_indices.size(); ++k) {
        uint32_t idx = sample_indices[k];
        if (idx >= sifted_local.size() || seen[idx]) {
            last_error_ = ErrorCode::INVALID_PARAMETER;
            return std::nullopt;
        }
        seen[idx] = true;
        if ((sifted_local.bits[idx] & 1) != (peer_sample_bits[k] & 1)) {
            ++mismatches;
        }
    }

    last_error_ = ErrorCode::NONE;
    return QberReport(sample_indices.size(), mismatches, config_.threshold);
}

SiftedKey QberEstimator::discard_sample(const SiftedKey& sifted,
                                        std::span<const uint32_t> sample_indices) {
    std::vector<bool> disclosed(sifted.size(), false);
    for (auto idx : sample_indices) {
        if (idx < sifted.size()) {
            disclosed[idx] = true;
        }
    }

    SiftedKey remaining;
    remaining.bits.reserve(sifted.size());
    remaining.source_indices.reserve(sifted.size());
    for (size_t i = 0; i < sifted.size(); ++i) {
        if (!disclosed[i]) {
            remaining.bits.push_back(sifted.bits[i]);
            remaining.source_indices.push_back(sifted.source_indices[i]);
        }
    }
    return remaining;
}

std::vector<uint8_t> QberEstimator::sample_bits(const SiftedKey& sifted,
                                                std::span<const uint32_t> sample_indices) {
    std::vector<uint8_t> bits;
    bits.reserve(sample_indices.size());
    for (auto idx : sample_indices) {
        bits.push_back(idx < sifted.size() ? (sifted.bits[idx] & 1) : 0);
    }
    return bits;
}

}  // namespace qline::qkd

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "qline/common/error.hpp"
#include "qline/qkd/sifter.hpp"

namespace qline::qkd {

enum class QberDecision : uint8_t {
    ACCEPT,
    ABORT
};

// Outcome of comparing the disclosed sample; fixed once produced.
// Only QberEstimator creates reports, and only from a non-empty sample.
class QberReport {
public:
    [[nodiscard]] size_t sample_size() const { return sample_size_; }
    [[nodiscard]] size_t mismatches() const { return mismatches_; }
    [[nodiscard]] double error_rate() const { return error_rate_; }
    [[nodiscard]] QberDecision decision() const { return decision_; }
    [[nodiscard]] bool accepted() const { return decision_ == QberDecision::ACCEPT; }

private:
    friend class QberEstimator;
    QberReport(size_t sample_size, size_t mismatches, double threshold);

    size_t sample_size_;
    size_t mismatches_;
    double error_rate_;
    QberDecision decision_;
};

struct QberEstimatorConfig {
    double threshold = 0.11;       // BB84 security bound
    double sample_fraction = 0.2;  // Share of the sifted key disclosed
};

class QberEstimator {
public:
    explicit QberEstimator(const QberEstimatorConfig& config = {});

    // Random sorted subset of [0, sifted_length) to disclose.
    // Size is max(1, round(sample_fraction * sifted_length)), capped so at
    // least one bit stays private.
    std::optional<std::vector<uint32_t>> choose_sample_indices(size_t sifted_length);

    // Compare local bits at sample_indices with the peer's disclosed bits.
    // error_rate = mismatches / sample_size; ACCEPT iff error_rate <= threshold.
    std::optional<QberReport> estimate(const SiftedKey& sifted_local,
                                       std::span<const uint8_t> peer_sample_bits,
                                       std::span<const uint32_t> sample_indices);

    // Sifted key with the disclosed positions removed
    static SiftedKey discard_sample(const SiftedKey& sifted,
                                    std::span<const uint32_t> sample_indices);

    // Local bits at the sample positions (for disclosure to the peer)
    static std::vector<uint8_t> sample_bits(const SiftedKey& sifted,
                                            std::span<const uint32_t> sample_indices);

    [[nodiscard]] ErrorCode last_error() const { return last_error_; }
    [[nodiscard]] const QberEstimatorConfig& config() const { return config_; }

private:
    QberEstimatorConfig config_;
    ErrorCode last_error_{ErrorCode::NONE};
};

}  // namespace qline::qkd

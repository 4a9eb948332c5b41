#pragma once

#include <cstdint>
#include <chrono>

namespace qline::utils {

// Get current time in milliseconds (monotonic)
inline uint64_t time_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

// Deadline helper for reads that span several partial receives
class Deadline {
public:
    explicit Deadline(std::chrono::milliseconds timeout)
        : end_(std::chrono::steady_clock::now() + timeout) {}

    [[nodiscard]] std::chrono::milliseconds remaining() const {
        auto now = std::chrono::steady_clock::now();
        if (now >= end_) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - now);
    }

    [[nodiscard]] bool expired() const {
        return std::chrono::steady_clock::now() >= end_;
    }

private:
    std::chrono::steady_clock::time_point end_;
};

}  // namespace qline::utils

#pragma once

#include <cstddef>
#include <cstdint>

namespace qline::channel {

// Sliding window for replay protection on one (generation, direction).
// Sequence numbers start at 0. A number seen before, or older than the
// window, is a replay; a jump ahead is a gap (lost frames), not an error.
class ReplayWindow {
public:
    // Window size: tracks 64 packets before the highest seen
    static constexpr size_t WINDOW_SIZE = 64;

    ReplayWindow() = default;

    // Check if a sequence number is valid (not replayed)
    // Returns true if the frame should be accepted
    [[nodiscard]] bool check(uint64_t seq) const;

    // Update the window with a new sequence number
    // Should only be called after check() returns true
    // Returns how many sequence numbers were skipped to reach seq
    uint64_t update(uint64_t seq);

    // Get the highest seen sequence number
    [[nodiscard]] uint64_t highest() const { return highest_seq_; }

    // Total sequence numbers skipped so far
    [[nodiscard]] uint64_t gaps() const { return gaps_; }

    // Reset the window
    void reset();

private:
    uint64_t highest_seq_{0};
    uint64_t bitmap_{0};  // Bitmap for window: bit i = seq (highest_seq_ - i - 1)
    uint64_t gaps_{0};
    bool initialized_{false};
};

}  // namespace qline::channel

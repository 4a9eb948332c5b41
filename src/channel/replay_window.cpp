#include "qline/channel/replay_window.hpp"

namespace qline::channel {

bool ReplayWindow::check(uint64_t seq) const {
    // First frame initializes the window
    if (!initialized_) {
        return true;
    }

    // Sequence number is too old (before the window)
    if (seq + WINDOW_SIZE <= highest_seq_) {
        return false;
    }

    // Sequence number is strictly ahead of the highest - new frame
    if (seq > highest_seq_) {
        return true;
    }

    // Sequence number equals highest - duplicate
    if (seq == highest_seq_) {
        return false;
    }

    // Sequence number is within the window
    // Check if already seen in bitmap
    uint64_t diff = highest_seq_ - seq - 1;
    if (diff < WINDOW_SIZE) {
        return (bitmap_ & (1ULL << diff)) == 0;
    }

    return false;
}

uint64_t ReplayWindow::update(uint64_t seq) {
    uint64_t skipped = 0;

    if (!initialized_) {
        // Numbering starts at 0, anything earlier was lost
        skipped = seq;
        highest_seq_ = seq;
        bitmap_ = 0;
        initialized_ = true;
        gaps_ += skipped;
        return skipped;
    }

    if (seq > highest_seq_) {
        uint64_t shift = seq - highest_seq_;
        skipped = shift - 1;
        if (shift >= WINDOW_SIZE) {
            // Completely new window
            bitmap_ = 0;
        } else {
            // Shift and set the bit for the old highest
            bitmap_ = (bitmap_ << shift) | (1ULL << (shift - 1));
        }
        highest_seq_ = seq;
    } else if (seq < highest_seq_) {
        // Late arrival fills a hole counted earlier
        uint64_t diff = highest_seq_ - seq - 1;
        if (diff < WINDOW_SIZE) {
            bitmap_ |= (1ULL << diff);
        }
        if (gaps_ > 0) {
            --gaps_;
        }
    }

    gaps_ += skipped;
    return skipped;
}

void ReplayWindow::reset() {
    highest_seq_ = 0;
    bitmap_ = 0;
    gaps_ = 0;
    initialized_ = false;
}

}  // namespace qline::channel

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

namespace qline::transport {

// Outcome of a bounded read
enum class ReadStatus {
    OK,
    TIMEOUT,
    CLOSED,  // Peer closed the stream
    ERROR
};

struct ReadResult {
    ReadStatus status{ReadStatus::ERROR};
    size_t bytes{0};  // At least 1 when status is OK
};

// Ordered, reliable byte stream supplied by the environment.
// The protocol layers above never retransmit.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Write every byte or fail
    virtual bool write_all(std::span<const uint8_t> data) = 0;

    // Read whatever is available, up to out.size(), waiting at most timeout
    // for the first byte. Nothing is consumed on TIMEOUT.
    virtual ReadResult read_some(std::span<uint8_t> out, std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

}  // namespace qline::transport

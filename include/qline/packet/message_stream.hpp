#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

#include "qline/packet/wire.hpp"
#include "qline/transport/byte_stream.hpp"

namespace qline::packet {

enum class ReceiveStatus {
    OK,
    TIMEOUT,
    CLOSED,     // Peer closed the underlying stream
    MALFORMED,  // Bad header or payload; the stream is no longer in sync
    ERROR
};

struct ReceiveResult {
    ReceiveStatus status{ReceiveStatus::ERROR};
    std::optional<Envelope> envelope;
};

// Frames Envelopes over a ByteStream. send() may be called from any thread;
// receive() is meant for a single reader. Partially received messages stay
// buffered across timeouts.
class MessageStream {
public:
    explicit MessageStream(transport::ByteStream& stream);

    // Returns the encoded bytes on success so callers can hash what went out
    std::optional<std::vector<uint8_t>> send(const Envelope& envelope);

    // raw_out receives header + payload bytes of the returned message
    ReceiveResult receive(std::chrono::milliseconds timeout, std::vector<uint8_t>* raw_out = nullptr);

    void close();

    [[nodiscard]] uint64_t messages_sent() const { return messages_sent_; }
    [[nodiscard]] uint64_t messages_received() const { return messages_received_; }

private:
    static constexpr size_t READ_CHUNK = 64 * 1024;

    transport::ByteStream& stream_;
    std::mutex send_mutex_;
    std::vector<uint8_t> rx_buffer_;
    uint64_t messages_sent_{0};
    uint64_t messages_received_{0};
};

}  // namespace qline::packet

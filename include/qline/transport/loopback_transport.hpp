#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include "byte_stream.hpp"

namespace qline::transport {

// In-memory stream endpoint. Two endpoints created by make_pair() are
// connected back to back; closing either side ends the stream for both.
class LoopbackStream : public ByteStream {
public:
    struct Pipe;

    LoopbackStream(std::shared_ptr<Pipe> inbound, std::shared_ptr<Pipe> outbound);
    ~LoopbackStream() override;

    LoopbackStream(const LoopbackStream&) = delete;
    LoopbackStream& operator=(const LoopbackStream&) = delete;

    static std::pair<std::unique_ptr<LoopbackStream>, std::unique_ptr<LoopbackStream>> make_pair();

    bool write_all(std::span<const uint8_t> data) override;
    ReadResult read_some(std::span<uint8_t> out, std::chrono::milliseconds timeout) override;
    void close() override;
    [[nodiscard]] bool is_open() const override;

    // Bytes written by this endpoint so far (for tests)
    [[nodiscard]] uint64_t bytes_written() const { return bytes_written_; }

private:
    std::shared_ptr<Pipe> inbound_;
    std::shared_ptr<Pipe> outbound_;
    uint64_t bytes_written_{0};
};

struct LoopbackStream::Pipe {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<uint8_t> buffer;
    bool closed{false};
};

}  // namespace qline::transport

#include "qline/transport/loopback_transport.hpp"

#include <algorithm>

namespace qline::transport {

LoopbackStream::LoopbackStream(std::shared_ptr<Pipe> inbound, std::shared_ptr<Pipe> outbound)
    : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

LoopbackStream::~LoopbackStream() {
    close();
}

std::pair<std::unique_ptr<LoopbackStream>, std::unique_ptr<LoopbackStream>> LoopbackStream::make_pair() {
    auto a_to_b = std::make_shared<Pipe>();
    auto b_to_a = std::make_shared<Pipe>();
    return {std::make_unique<LoopbackStream>(b_to_a, a_to_b),
            std::make_unique<LoopbackStream>(a_to_b, b_to_a)};
}

bool LoopbackStream::write_all(std::span<const uint8_t> data) {
    {
        std::lock_guard lock(outbound_->mutex);
        if (outbound_->closed) {
            return false;
        }
        outbound_->buffer.insert(outbound_->buffer.end(), data.begin(), data.end());
    }
    outbound_->cv.notify_all();
    bytes_written_ += data.size();
    return true;
}

ReadResult LoopbackStream::read_some(std::span<uint8_t> out, std::chrono::milliseconds timeout) {
    std::unique_lock lock(inbound_->mutex);
    bool ready = inbound_->cv.wait_for(lock, timeout, [this] {
        return !inbound_->buffer.empty() || inbound_->closed;
    });
    if (!ready) {
        return {ReadStatus::TIMEOUT, 0};
    }
    if (inbound_->buffer.empty()) {
        return {ReadStatus::CLOSED, 0};
    }

    size_t n = std::min(out.size(), inbound_->buffer.size());
    std::copy_n(inbound_->buffer.begin(), n, out.begin());
    inbound_->buffer.erase(inbound_->buffer.begin(), inbound_->buffer.begin() + static_cast<std::ptrdiff_t>(n));
    return {ReadStatus::OK, n};
}

void LoopbackStream::close() {
    for (auto* pipe : {inbound_.get(), outbound_.get()}) {
        {
            std::lock_guard lock(pipe->mutex);
            pipe->closed = true;
        }
        pipe->cv.notify_all();
    }
}

bool LoopbackStream::is_open() const {
    std::lock_guard lock(outbound_->mutex);
    return !outbound_->closed;
}

}  // namespace qline::transport

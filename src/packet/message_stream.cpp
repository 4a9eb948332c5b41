#include "qline/packet/message_stream.hpp"

#include "qline/utils/time.hpp"

#include <spdlog/spdlog.h>

namespace qline::packet {

namespace {

ReceiveStatus from_read_status(transport::ReadStatus status) {
    switch (status) {
        case transport::ReadStatus::OK:
            return ReceiveStatus::OK;
        case transport::ReadStatus::TIMEOUT:
            return ReceiveStatus::TIMEOUT;
        case transport::ReadStatus::CLOSED:
            return ReceiveStatus::CLOSED;
        case transport::ReadStatus::ERROR:
            break;
    }
    return ReceiveStatus::ERROR;
}

}  // namespace

MessageStream::MessageStream(transport::ByteStream& stream) : stream_(stream) {}

std::optional<std::vector<uint8_t>> MessageStream::send(const Envelope& envelope) {
    auto data = serialize(envelope);
    if (data.size() - WireHeader::SIZE > MAX_PAYLOAD_SIZE) {
        spdlog::error("Refusing to send oversized message ({} bytes)", data.size());
        return std::nullopt;
    }

    std::lock_guard lock(send_mutex_);
    if (!stream_.write_all(data)) {
        return std::nullopt;
    }
    ++messages_sent_;
    return data;
}

ReceiveResult MessageStream::receive(std::chrono::milliseconds timeout, std::vector<uint8_t>* raw_out) {
    utils::Deadline deadline(timeout);
    std::vector<uint8_t> chunk(READ_CHUNK);

    for (;;) {
        if (rx_buffer_.size() >= WireHeader::SIZE) {
            auto header = parse_header(std::span<const uint8_t>(rx_buffer_).first(WireHeader::SIZE));
            if (!header) {
                spdlog::warn("Received malformed message header (type 0x{:02x})", rx_buffer_[0]);
                rx_buffer_.clear();
                return {ReceiveStatus::MALFORMED, std::nullopt};
            }

            size_t total = WireHeader::SIZE + header->length;
            if (rx_buffer_.size() >= total) {
                auto payload = std::span<const uint8_t>(rx_buffer_).subspan(WireHeader::SIZE, header->length);
                auto message = parse_payload(header->type, payload);
                if (!message) {
                    spdlog::warn("Received malformed payload for message type 0x{:02x}",
                                 static_cast<uint8_t>(header->type));
                    rx_buffer_.clear();
                    return {ReceiveStatus::MALFORMED, std::nullopt};
                }

                if (raw_out != nullptr) {
                    raw_out->assign(rx_buffer_.begin(), rx_buffer_.begin() + static_cast<std::ptrdiff_t>(total));
                }
                rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + static_cast<std::ptrdiff_t>(total));
                ++messages_received_;
                return {ReceiveStatus::OK, Envelope{header->attempt, std::move(*message)}};
            }
        }

        auto result = stream_.read_some(chunk, deadline.remaining());
        if (result.status != transport::ReadStatus::OK) {
            return {from_read_status(result.status), std::nullopt};
        }
        rx_buffer_.insert(rx_buffer_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(result.bytes));
    }
}

void MessageStream::close() {
    stream_.close();
}

}  // namespace qline::packet

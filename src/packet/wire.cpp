#include "qline/packet/wire.hpp"

#include <algorithm>
#include <type_traits>

namespace qline::packet {

namespace {

// Serialize uint64_t to bytes (big-endian)
void write_u64(std::vector<uint8_t>& buffer, uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

// Serialize uint32_t to bytes (big-endian)
void write_u32(std::vector<uint8_t>& buffer, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        buffer.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

// Serialize uint16_t to bytes (big-endian)
void write_u16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value >> 8));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

void write_bytes(std::vector<uint8_t>& buffer, std::span<const uint8_t> data) {
    buffer.insert(buffer.end(), data.begin(), data.end());
}

// Pack 2-bit symbols, four per byte, first symbol in the high bits
void write_symbols(std::vector<uint8_t>& buffer, const std::vector<uint8_t>& symbols) {
    write_u32(buffer, static_cast<uint32_t>(symbols.size()));
    for (size_t i = 0; i < symbols.size(); i += 4) {
        uint8_t packed = 0;
        for (size_t j = 0; j < 4 && i + j < symbols.size(); ++j) {
            packed |= static_cast<uint8_t>((symbols[i + j] & 0x03) << (6 - 2 * j));
        }
        buffer.push_back(packed);
    }
}

// Pack single bits, MSB-first
void write_bits(std::vector<uint8_t>& buffer, const std::vector<uint8_t>& bits) {
    write_u32(buffer, static_cast<uint32_t>(bits.size()));
    for (size_t i = 0; i < bits.size(); i += 8) {
        uint8_t packed = 0;
        for (size_t j = 0; j < 8 && i + j < bits.size(); ++j) {
            packed |= static_cast<uint8_t>((bits[i + j] & 1) << (7 - j));
        }
        buffer.push_back(packed);
    }
}

// Bounds-checked cursor over a payload
class Reader {
public:
    explicit Reader(std::span<const uint8_t> data) : data_(data) {}

    bool u8(uint8_t& out) {
        if (!need(1)) return false;
        out = data_[pos_++];
        return true;
    }

    bool u16(uint16_t& out) {
        if (!need(2)) return false;
        out = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return true;
    }

    bool u32(uint32_t& out) {
        if (!need(4)) return false;
        out = 0;
        for (int i = 0; i < 4; ++i) {
            out = (out << 8) | data_[pos_++];
        }
        return true;
    }

    bool u64(uint64_t& out) {
        if (!need(8)) return false;
        out = 0;
        for (int i = 0; i < 8; ++i) {
            out = (out << 8) | data_[pos_++];
        }
        return true;
    }

    bool bytes(std::span<uint8_t> out) {
        if (!need(out.size())) return false;
        std::copy(data_.begin() + pos_, data_.begin() + pos_ + out.size(), out.begin());
        pos_ += out.size();
        return true;
    }

    bool bytes(std::vector<uint8_t>& out, size_t n) {
        if (!need(n)) return false;
        out.assign(data_.begin() + pos_, data_.begin() + pos_ + n);
        pos_ += n;
        return true;
    }

    bool symbols(std::vector<uint8_t>& out) {
        uint32_t count = 0;
        if (!u32(count)) return false;
        size_t packed_len = (static_cast<size_t>(count) + 3) / 4;
        if (!need(packed_len)) return false;
        out.resize(count);
        for (size_t i = 0; i < count; ++i) {
            uint8_t packed = data_[pos_ + i / 4];
            out[i] = static_cast<uint8_t>((packed >> (6 - 2 * (i % 4))) & 0x03);
        }
        pos_ += packed_len;
        return true;
    }

    bool bits(std::vector<uint8_t>& out) {
        uint32_t count = 0;
        if (!u32(count)) return false;
        size_t packed_len = (static_cast<size_t>(count) + 7) / 8;
        if (!need(packed_len)) return false;
        out.resize(count);
        for (size_t i = 0; i < count; ++i) {
            uint8_t packed = data_[pos_ + i / 8];
            out[i] = static_cast<uint8_t>((packed >> (7 - (i % 8))) & 1);
        }
        pos_ += packed_len;
        return true;
    }

    [[nodiscard]] bool done() const { return pos_ == data_.size(); }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

private:
    bool need(size_t n) const { return data_.size() - pos_ >= n; }

    std::span<const uint8_t> data_;
    size_t pos_{0};
};

bool known_type(uint8_t type) {
    switch (static_cast<MessageType>(type)) {
        case MessageType::QUANTUM_STATES:
        case MessageType::BASIS_DISCLOSURE:
        case MessageType::SAMPLE_DISCLOSURE:
        case MessageType::PARITY_EXCHANGE:
        case MessageType::AUTH_HANDSHAKE:
        case MessageType::KEY_CONFIRM:
        case MessageType::HANDSHAKE_RETRY:
        case MessageType::AEAD_FRAME:
        case MessageType::ROTATE_REQUEST:
        case MessageType::CLOSE:
            return true;
    }
    return false;
}

bool valid_error_code(uint8_t code) {
    return code <= static_cast<uint8_t>(ErrorCode::INTERNAL_ERROR);
}

std::vector<uint8_t> serialize_payload(const Message& message) {
    std::vector<uint8_t> payload;

    std::visit([&payload](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, QuantumStates>) {
            std::vector<uint8_t> symbols(m.bits.size());
            for (size_t i = 0; i < m.bits.size() && i < m.bases.size(); ++i) {
                symbols[i] = static_cast<uint8_t>(((m.bits[i] & 1) << 1) |
                                                  static_cast<uint8_t>(m.bases[i]));
            }
            write_symbols(payload, symbols);
        } else if constexpr (std::is_same_v<T, BasisDisclosure>) {
            std::vector<uint8_t> symbols(m.bases.size());
            for (size_t i = 0; i < m.bases.size(); ++i) {
                symbols[i] = static_cast<uint8_t>(m.bases[i]);
            }
            write_symbols(payload, symbols);
        } else if constexpr (std::is_same_v<T, SampleDisclosure>) {
            write_u32(payload, static_cast<uint32_t>(m.indices.size()));
            for (auto idx : m.indices) {
                write_u32(payload, idx);
            }
            write_bits(payload, m.bits);
        } else if constexpr (std::is_same_v<T, ParityExchange>) {
            payload.push_back(static_cast<uint8_t>(m.kind));
            write_u32(payload, m.pass);
            write_bytes(payload, m.seed);
            write_u32(payload, m.block_size);
            write_u32(payload, static_cast<uint32_t>(m.ranges.size()));
            for (const auto& r : m.ranges) {
                write_u32(payload, r.begin);
                write_u32(payload, r.end);
            }
            write_bits(payload, m.parities);
        } else if constexpr (std::is_same_v<T, AuthHandshake>) {
            write_u16(payload, static_cast<uint16_t>(m.public_identity.size()));
            write_bytes(payload, m.public_identity);
            write_bytes(payload, m.ephemeral_public);
            write_u16(payload, static_cast<uint16_t>(m.signature.size()));
            write_bytes(payload, m.signature);
        } else if constexpr (std::is_same_v<T, KeyConfirm>) {
            write_u32(payload, m.generation);
            write_bytes(payload, m.mac);
        } else if constexpr (std::is_same_v<T, HandshakeRetry>) {
            payload.push_back(static_cast<uint8_t>(m.reason));
        } else if constexpr (std::is_same_v<T, AeadFrame>) {
            write_u32(payload, m.generation);
            write_u64(payload, m.sequence);
            write_bytes(payload, m.nonce);
            write_u32(payload, static_cast<uint32_t>(m.ciphertext.size()));
            write_bytes(payload, m.ciphertext);
            write_bytes(payload, m.tag);
        } else if constexpr (std::is_same_v<T, RotateRequest>) {
            write_u32(payload, m.generation);
        } else if constexpr (std::is_same_v<T, Close>) {
            payload.push_back(static_cast<uint8_t>(m.reason));
        }
    }, message);

    return payload;
}

}  // namespace

MessageType get_message_type(const Message& message) {
    return std::visit([](const auto& m) -> MessageType {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, QuantumStates>) {
            return MessageType::QUANTUM_STATES;
        } else if constexpr (std::is_same_v<T, BasisDisclosure>) {
            return MessageType::BASIS_DISCLOSURE;
        } else if constexpr (std::is_same_v<T, SampleDisclosure>) {
            return MessageType::SAMPLE_DISCLOSURE;
        } else if constexpr (std::is_same_v<T, ParityExchange>) {
            return MessageType::PARITY_EXCHANGE;
        } else if constexpr (std::is_same_v<T, AuthHandshake>) {
            return MessageType::AUTH_HANDSHAKE;
        } else if constexpr (std::is_same_v<T, KeyConfirm>) {
            return MessageType::KEY_CONFIRM;
        } else if constexpr (std::is_same_v<T, HandshakeRetry>) {
            return MessageType::HANDSHAKE_RETRY;
        } else if constexpr (std::is_same_v<T, AeadFrame>) {
            return MessageType::AEAD_FRAME;
        } else if constexpr (std::is_same_v<T, RotateRequest>) {
            return MessageType::ROTATE_REQUEST;
        } else if constexpr (std::is_same_v<T, Close>) {
            return MessageType::CLOSE;
        }
    }, message);
}

std::array<uint8_t, WireHeader::SIZE> serialize_header(const WireHeader& header) {
    std::array<uint8_t, WireHeader::SIZE> data;
    data[0] = static_cast<uint8_t>(header.type);
    for (int i = 0; i < 4; ++i) {
        data[1 + i] = static_cast<uint8_t>(header.attempt >> (24 - 8 * i));
        data[5 + i] = static_cast<uint8_t>(header.length >> (24 - 8 * i));
    }
    return data;
}

std::optional<WireHeader> parse_header(std::span<const uint8_t> data) {
    if (data.size() < WireHeader::SIZE || !known_type(data[0])) {
        return std::nullopt;
    }

    WireHeader header;
    header.type = static_cast<MessageType>(data[0]);
    header.attempt = 0;
    header.length = 0;
    for (int i = 0; i < 4; ++i) {
        header.attempt = (header.attempt << 8) | data[1 + i];
        header.length = (header.length << 8) | data[5 + i];
    }

    if (header.length > MAX_PAYLOAD_SIZE) {
        return std::nullopt;
    }
    return header;
}

std::vector<uint8_t> serialize(const Envelope& envelope) {
    auto payload = serialize_payload(envelope.message);

    WireHeader header;
    header.type = get_message_type(envelope.message);
    header.attempt = envelope.attempt;
    header.length = static_cast<uint32_t>(payload.size());

    std::vector<uint8_t> out;
    out.reserve(WireHeader::SIZE + payload.size());
    auto header_bytes = serialize_header(header);
    out.insert(out.end(), header_bytes.begin(), header_bytes.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<Message> parse_payload(MessageType type, std::span<const uint8_t> payload) {
    Reader r(payload);

    switch (type) {
        case MessageType::QUANTUM_STATES: {
            std::vector<uint8_t> symbols;
            if (!r.symbols(symbols) || !r.done()) return std::nullopt;
            QuantumStates msg;
            msg.bits.resize(symbols.size());
            msg.bases.resize(symbols.size());
            for (size_t i = 0; i < symbols.size(); ++i) {
                msg.bits[i] = static_cast<uint8_t>((symbols[i] >> 1) & 1);
                msg.bases[i] = static_cast<qkd::Basis>(symbols[i] & 1);
            }
            return Message{std::move(msg)};
        }

        case MessageType::BASIS_DISCLOSURE: {
            std::vector<uint8_t> symbols;
            if (!r.symbols(symbols) || !r.done()) return std::nullopt;
            BasisDisclosure msg;
            msg.bases.resize(symbols.size());
            for (size_t i = 0; i < symbols.size(); ++i) {
                if (symbols[i] > 1) return std::nullopt;
                msg.bases[i] = static_cast<qkd::Basis>(symbols[i]);
            }
            return Message{std::move(msg)};
        }

        case MessageType::SAMPLE_DISCLOSURE: {
            uint32_t count = 0;
            if (!r.u32(count) || r.remaining() / 4 < count) return std::nullopt;
            SampleDisclosure msg;
            msg.indices.resize(count);
            for (auto& idx : msg.indices) {
                if (!r.u32(idx)) return std::nullopt;
            }
            if (!r.bits(msg.bits) || !r.done()) return std::nullopt;
            return Message{std::move(msg)};
        }

        case MessageType::PARITY_EXCHANGE: {
            ParityExchange msg;
            uint8_t kind = 0;
            uint32_t range_count = 0;
            if (!r.u8(kind) || kind < 0x01 || kind > 0x03) return std::nullopt;
            msg.kind = static_cast<ParityExchange::Kind>(kind);
            if (!r.u32(msg.pass) || !r.bytes(msg.seed) || !r.u32(msg.block_size) ||
                !r.u32(range_count) || r.remaining() / 8 < range_count) {
                return std::nullopt;
            }
            msg.ranges.resize(range_count);
            for (auto& range : msg.ranges) {
                if (!r.u32(range.begin) || !r.u32(range.end) || range.end <= range.begin) {
                    return std::nullopt;
                }
            }
            if (!r.bits(msg.parities) || !r.done()) return std::nullopt;
            return Message{std::move(msg)};
        }

        case MessageType::AUTH_HANDSHAKE: {
            AuthHandshake msg;
            uint16_t id_len = 0;
            uint16_t sig_len = 0;
            if (!r.u16(id_len) || !r.bytes(msg.public_identity, id_len) ||
                !r.bytes(msg.ephemeral_public) ||
                !r.u16(sig_len) || !r.bytes(msg.signature, sig_len) || !r.done()) {
                return std::nullopt;
            }
            return Message{std::move(msg)};
        }

        case MessageType::KEY_CONFIRM: {
            KeyConfirm msg;
            if (!r.u32(msg.generation) || !r.bytes(msg.mac) || !r.done()) return std::nullopt;
            return Message{msg};
        }

        case MessageType::HANDSHAKE_RETRY: {
            uint8_t reason = 0;
            if (!r.u8(reason) || !valid_error_code(reason) || !r.done()) return std::nullopt;
            return Message{HandshakeRetry{static_cast<ErrorCode>(reason)}};
        }

        case MessageType::AEAD_FRAME: {
            AeadFrame msg;
            uint32_t ct_len = 0;
            if (!r.u32(msg.generation) || !r.u64(msg.sequence) || !r.bytes(msg.nonce) ||
                !r.u32(ct_len) || !r.bytes(msg.ciphertext, ct_len) || !r.bytes(msg.tag) ||
                !r.done()) {
                return std::nullopt;
            }
            return Message{std::move(msg)};
        }

        case MessageType::ROTATE_REQUEST: {
            RotateRequest msg;
            if (!r.u32(msg.generation) || !r.done()) return std::nullopt;
            return Message{msg};
        }

        case MessageType::CLOSE: {
            uint8_t reason = 0;
            if (!r.u8(reason) || !valid_error_code(reason) || !r.done()) return std::nullopt;
            return Message{Close{static_cast<ErrorCode>(reason)}};
        }
    }

    return std::nullopt;
}

}  // namespace qline::packet

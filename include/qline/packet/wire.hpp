#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "qline/common/error.hpp"
#include "qline/crypto/crypto.hpp"
#include "qline/qkd/quantum_channel.hpp"
#include "qline/qkd/reconciler.hpp"

namespace qline::packet {

// Message types
enum class MessageType : uint8_t {
    QUANTUM_STATES = 0x01,     // Simulated quantum channel: prepared states
    BASIS_DISCLOSURE = 0x02,   // Measurement bases
    SAMPLE_DISCLOSURE = 0x03,  // QBER sample positions and bits
    PARITY_EXCHANGE = 0x04,    // Reconciliation parities and queries
    AUTH_HANDSHAKE = 0x05,     // Identity, ephemeral key, signature
    KEY_CONFIRM = 0x06,        // MAC proving both sides hold the same key
    HANDSHAKE_RETRY = 0x07,    // Abandon the current attempt
    AEAD_FRAME = 0x10,         // Application data
    ROTATE_REQUEST = 0x11,     // Responder asks the initiator to rotate
    CLOSE = 0x12               // Orderly teardown
};

// Prepared (bit, basis) pairs as sent over the simulated quantum channel
struct QuantumStates {
    std::vector<uint8_t> bits;
    std::vector<qkd::Basis> bases;
};

struct BasisDisclosure {
    std::vector<qkd::Basis> bases;
};

struct SampleDisclosure {
    std::vector<uint32_t> indices;
    std::vector<uint8_t> bits;
};

struct ParityExchange {
    enum class Kind : uint8_t {
        BLOCKS = 0x01,  // Reference: seed, block size, block parities
        QUERY = 0x02,   // Corrector: ranges to reveal (empty ends the pass)
        REPLY = 0x03    // Reference: parities of the queried ranges
    };
    Kind kind{Kind::BLOCKS};
    uint32_t pass{0};
    qkd::PermutationSeed seed{};
    uint32_t block_size{0};
    std::vector<qkd::ParityRange> ranges;
    std::vector<uint8_t> parities;
};

struct AuthHandshake {
    std::vector<uint8_t> public_identity;
    crypto::PublicKey ephemeral_public{};
    std::vector<uint8_t> signature;
};

struct KeyConfirm {
    uint32_t generation{0};
    crypto::HmacDigest mac{};
};

struct HandshakeRetry {
    ErrorCode reason{ErrorCode::NONE};
};

struct AeadFrame {
    uint32_t generation{0};
    uint64_t sequence{0};
    crypto::Nonce nonce{};
    std::vector<uint8_t> ciphertext;
    crypto::AuthTag tag{};
};

struct RotateRequest {
    uint32_t generation{0};
};

struct Close {
    ErrorCode reason{ErrorCode::NONE};
};

using Message = std::variant<
    QuantumStates,
    BasisDisclosure,
    SampleDisclosure,
    ParityExchange,
    AuthHandshake,
    KeyConfirm,
    HandshakeRetry,
    AeadFrame,
    RotateRequest,
    Close
>;

// A message together with the handshake attempt it belongs to
// (0 outside handshakes)
struct Envelope {
    uint32_t attempt{0};
    Message message;
};

// Wire header: type(1) + attempt(4) + length(4), big-endian
struct WireHeader {
    static constexpr size_t SIZE = 9;
    MessageType type;
    uint32_t attempt;
    uint32_t length;  // Payload length (not including header)
};

constexpr uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

// Largest raw state count whose handshake messages all fit one frame. The
// sample disclosure is the biggest: a u32 index and one bit per sampled
// position, and the sample can approach the raw count.
constexpr size_t MAX_RAW_BITS = (MAX_PAYLOAD_SIZE - 8) / 33 * 8;

// Get message type from variant
MessageType get_message_type(const Message& message);

// Serialize header
std::array<uint8_t, WireHeader::SIZE> serialize_header(const WireHeader& header);

// Parse header; nullopt if short, of unknown type, or oversized
std::optional<WireHeader> parse_header(std::span<const uint8_t> data);

// Serialize a complete message (header + payload)
std::vector<uint8_t> serialize(const Envelope& envelope);

// Parse a payload of the given type; nullopt if malformed
std::optional<Message> parse_payload(MessageType type, std::span<const uint8_t> payload);

}  // namespace qline::packet

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <thread>

#include "qline/crypto/crypto.hpp"
#include "qline/packet/message_stream.hpp"
#include "qline/packet/wire.hpp"
#include "qline/transport/loopback_transport.hpp"

namespace qline::packet {
namespace {

using namespace std::chrono_literals;

class PacketTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
    }

    // Serialize then parse back through the header path
    static std::optional<Envelope> reparse(const Envelope& envelope) {
        auto bytes = serialize(envelope);
        auto header = parse_header(bytes);
        if (!header || bytes.size() != WireHeader::SIZE + header->length) {
            return std::nullopt;
        }
        auto message = parse_payload(header->type, std::span<const uint8_t>(bytes).subspan(WireHeader::SIZE));
        if (!message) {
            return std::nullopt;
        }
        return Envelope{header->attempt, std::move(*message)};
    }
};

TEST_F(PacketTest, HeaderSerialization) {
    WireHeader header{MessageType::PARITY_EXCHANGE, 0x01020304, 1234};

    auto bytes = serialize_header(header);
    EXPECT_EQ(bytes[0], 0x04);
    EXPECT_EQ(bytes[1], 0x01);
    EXPECT_EQ(bytes[4], 0x04);

    auto parsed = parse_header(bytes);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->type, header.type);
    EXPECT_EQ(parsed->attempt, header.attempt);
    EXPECT_EQ(parsed->length, header.length);
}

TEST_F(PacketTest, HeaderRejectsShortUnknownAndOversized) {
    std::array<uint8_t, 2> short_data = {0x01, 0x00};
    EXPECT_FALSE(parse_header(short_data).has_value());

    auto unknown = serialize_header({MessageType::CLOSE, 0, 1});
    unknown[0] = 0x08;
    EXPECT_FALSE(parse_header(unknown).has_value());

    auto oversized = serialize_header({MessageType::AEAD_FRAME, 0, MAX_PAYLOAD_SIZE + 1});
    EXPECT_FALSE(parse_header(oversized).has_value());

    auto at_limit = serialize_header({MessageType::AEAD_FRAME, 0, MAX_PAYLOAD_SIZE});
    EXPECT_TRUE(parse_header(at_limit).has_value());
}

TEST_F(PacketTest, MessageTypeOfVariant) {
    EXPECT_EQ(get_message_type(Message{QuantumStates{}}), MessageType::QUANTUM_STATES);
    EXPECT_EQ(get_message_type(Message{BasisDisclosure{}}), MessageType::BASIS_DISCLOSURE);
    EXPECT_EQ(get_message_type(Message{SampleDisclosure{}}), MessageType::SAMPLE_DISCLOSURE);
    EXPECT_EQ(get_message_type(Message{ParityExchange{}}), MessageType::PARITY_EXCHANGE);
    EXPECT_EQ(get_message_type(Message{AuthHandshake{}}), MessageType::AUTH_HANDSHAKE);
    EXPECT_EQ(get_message_type(Message{KeyConfirm{}}), MessageType::KEY_CONFIRM);
    EXPECT_EQ(get_message_type(Message{HandshakeRetry{}}), MessageType::HANDSHAKE_RETRY);
    EXPECT_EQ(get_message_type(Message{AeadFrame{}}), MessageType::AEAD_FRAME);
    EXPECT_EQ(get_message_type(Message{RotateRequest{}}), MessageType::ROTATE_REQUEST);
    EXPECT_EQ(get_message_type(Message{Close{}}), MessageType::CLOSE);
}

TEST_F(PacketTest, QuantumStatesPackFourPerByte) {
    QuantumStates states;
    states.bits = {1, 0, 1, 1, 0};
    states.bases = {qkd::Basis::DIAGONAL, qkd::Basis::RECTILINEAR, qkd::Basis::RECTILINEAR,
                    qkd::Basis::DIAGONAL, qkd::Basis::DIAGONAL};

    auto bytes = serialize(Envelope{3, states});
    // count(4) + ceil(5 / 4) packed bytes
    EXPECT_EQ(bytes.size(), WireHeader::SIZE + 4 + 2);

    auto parsed = reparse(Envelope{3, states});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->attempt, 3u);
    const auto& got = std::get<QuantumStates>(parsed->message);
    EXPECT_EQ(got.bits, states.bits);
    EXPECT_EQ(got.bases, states.bases);
}

TEST_F(PacketTest, SampleDisclosureRoundTrip) {
    SampleDisclosure sample;
    sample.indices = {0, 17, 4095};
    sample.bits = {1, 0, 1};

    auto parsed = reparse(Envelope{1, sample});
    ASSERT_TRUE(parsed.has_value());
    const auto& got = std::get<SampleDisclosure>(parsed->message);
    EXPECT_EQ(got.indices, sample.indices);
    EXPECT_EQ(got.bits, sample.bits);
}

TEST_F(PacketTest, ParityExchangeRoundTrip) {
    ParityExchange query;
    query.kind = ParityExchange::Kind::QUERY;
    query.pass = 2;
    query.seed.fill(0x3C);
    query.block_size = 64;
    query.ranges = {{0, 32}, {64, 80}};
    query.parities = {1, 0};

    auto parsed = reparse(Envelope{2, query});
    ASSERT_TRUE(parsed.has_value());
    const auto& got = std::get<ParityExchange>(parsed->message);
    EXPECT_EQ(got.kind, ParityExchange::Kind::QUERY);
    EXPECT_EQ(got.pass, 2u);
    EXPECT_EQ(got.seed, query.seed);
    EXPECT_EQ(got.block_size, 64u);
    EXPECT_EQ(got.ranges, query.ranges);
    EXPECT_EQ(got.parities, query.parities);
}

TEST_F(PacketTest, AuthHandshakeAndFrameRoundTrip) {
    AuthHandshake auth;
    auth.public_identity.assign(32, 0x11);
    auth.ephemeral_public.fill(0x22);
    auth.signature.assign(64, 0x33);

    auto parsed = reparse(Envelope{1, auth});
    ASSERT_TRUE(parsed.has_value());
    const auto& got_auth = std::get<AuthHandshake>(parsed->message);
    EXPECT_EQ(got_auth.public_identity, auth.public_identity);
    EXPECT_EQ(got_auth.ephemeral_public, auth.ephemeral_public);
    EXPECT_EQ(got_auth.signature, auth.signature);

    AeadFrame frame;
    frame.generation = 7;
    frame.sequence = 0x0102030405060708ULL;
    frame.nonce.fill(0x44);
    frame.ciphertext = {9, 8, 7};
    frame.tag.fill(0x55);

    parsed = reparse(Envelope{0, frame});
    ASSERT_TRUE(parsed.has_value());
    const auto& got_frame = std::get<AeadFrame>(parsed->message);
    EXPECT_EQ(got_frame.generation, 7u);
    EXPECT_EQ(got_frame.sequence, frame.sequence);
    EXPECT_EQ(got_frame.nonce, frame.nonce);
    EXPECT_EQ(got_frame.ciphertext, frame.ciphertext);
    EXPECT_EQ(got_frame.tag, frame.tag);
}

TEST_F(PacketTest, ControlMessagesCarryReason) {
    auto parsed = reparse(Envelope{4, HandshakeRetry{ErrorCode::KEY_CONFIRMATION_FAILED}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::get<HandshakeRetry>(parsed->message).reason, ErrorCode::KEY_CONFIRMATION_FAILED);

    parsed = reparse(Envelope{0, Close{ErrorCode::EAVESDROPPING_SUSPECTED}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::get<Close>(parsed->message).reason, ErrorCode::EAVESDROPPING_SUSPECTED);

    parsed = reparse(Envelope{0, RotateRequest{12}});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::get<RotateRequest>(parsed->message).generation, 12u);
}

TEST_F(PacketTest, MalformedPayloadsRejected) {
    // Trailing byte
    std::vector<uint8_t> close_payload = {0x00, 0x00};
    EXPECT_FALSE(parse_payload(MessageType::CLOSE, close_payload).has_value());

    // Unknown error code
    std::vector<uint8_t> bad_reason = {0xFF};
    EXPECT_FALSE(parse_payload(MessageType::HANDSHAKE_RETRY, bad_reason).has_value());

    // Count larger than the data
    std::vector<uint8_t> short_states = {0x00, 0x00, 0x01, 0x00, 0xAA};
    EXPECT_FALSE(parse_payload(MessageType::QUANTUM_STATES, short_states).has_value());

    // Basis symbol out of range
    std::vector<uint8_t> bad_basis = {0x00, 0x00, 0x00, 0x01, 0xC0};
    EXPECT_FALSE(parse_payload(MessageType::BASIS_DISCLOSURE, bad_basis).has_value());

    // Truncated frame
    AeadFrame frame;
    frame.ciphertext = {1, 2, 3, 4};
    auto bytes = serialize(Envelope{0, frame});
    auto payload = std::span<const uint8_t>(bytes).subspan(WireHeader::SIZE);
    EXPECT_FALSE(parse_payload(MessageType::AEAD_FRAME, payload.first(payload.size() - 1)).has_value());

    // Empty parity range
    ParityExchange parity;
    parity.ranges = {{5, 5}};
    bytes = serialize(Envelope{0, parity});
    payload = std::span<const uint8_t>(bytes).subspan(WireHeader::SIZE);
    EXPECT_FALSE(parse_payload(MessageType::PARITY_EXCHANGE, payload).has_value());
}

TEST_F(PacketTest, MessageStreamDeliversInOrder) {
    auto [a, b] = transport::LoopbackStream::make_pair();
    MessageStream sender(*a);
    MessageStream receiver(*b);

    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(sender.send(Envelope{i, RotateRequest{i * 10}}).has_value());
    }
    for (uint32_t i = 0; i < 5; ++i) {
        std::vector<uint8_t> raw;
        auto result = receiver.receive(1000ms, &raw);
        ASSERT_EQ(result.status, ReceiveStatus::OK) << "message " << i;
        EXPECT_EQ(result.envelope->attempt, i);
        EXPECT_EQ(std::get<RotateRequest>(result.envelope->message).generation, i * 10);
        EXPECT_EQ(raw, serialize(Envelope{i, RotateRequest{i * 10}}));
    }
    EXPECT_EQ(sender.messages_sent(), 5u);
    EXPECT_EQ(receiver.messages_received(), 5u);
}

TEST_F(PacketTest, MessageStreamKeepsPartialMessageAcrossTimeout) {
    auto [a, b] = transport::LoopbackStream::make_pair();
    MessageStream receiver(*b);

    AeadFrame frame;
    frame.generation = 1;
    frame.ciphertext.assign(100, 0xAB);
    auto bytes = serialize(Envelope{0, frame});

    ASSERT_TRUE(a->write_all(std::span<const uint8_t>(bytes).first(20)));
    EXPECT_EQ(receiver.receive(20ms).status, ReceiveStatus::TIMEOUT);

    ASSERT_TRUE(a->write_all(std::span<const uint8_t>(bytes).subspan(20)));
    auto result = receiver.receive(1000ms);
    ASSERT_EQ(result.status, ReceiveStatus::OK);
    EXPECT_EQ(std::get<AeadFrame>(result.envelope->message).ciphertext, frame.ciphertext);
}

TEST_F(PacketTest, MessageStreamReportsMalformedAndClosed) {
    auto [a, b] = transport::LoopbackStream::make_pair();
    MessageStream receiver(*b);

    std::vector<uint8_t> garbage = {0x7F, 0, 0, 0, 0, 0, 0, 0, 0};
    ASSERT_TRUE(a->write_all(garbage));
    EXPECT_EQ(receiver.receive(1000ms).status, ReceiveStatus::MALFORMED);

    a->close();
    EXPECT_EQ(receiver.receive(1000ms).status, ReceiveStatus::CLOSED);
}

TEST_F(PacketTest, MessageStreamSendFailsAfterClose) {
    auto [a, b] = transport::LoopbackStream::make_pair();
    MessageStream sender(*a);
    b->close();
    EXPECT_FALSE(sender.send(Envelope{0, Close{}}).has_value());
}

}  // namespace
}  // namespace qline::packet

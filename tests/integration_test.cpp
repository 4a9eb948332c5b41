#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "qline/auth/authenticator.hpp"
#include "qline/crypto/crypto.hpp"
#include "qline/session/session_orchestrator.hpp"
#include "qline/transport/loopback_transport.hpp"
#include "qline/transport/tcp_transport.hpp"

namespace qline {
namespace {

using namespace std::chrono_literals;
using session::SessionConfig;
using session::SessionOrchestrator;
using session::SessionPhase;

// Echo every message until the session leaves ACTIVE
void echo_until_closed(SessionOrchestrator& responder) {
    while (responder.is_active()) {
        auto message = responder.receive(200ms);
        if (message && !responder.send(*message)) {
            return;
        }
    }
}

// Send one message and wait for its echo
std::optional<std::vector<uint8_t>> round_trip(SessionOrchestrator& initiator,
                                               const std::vector<uint8_t>& message) {
    if (!initiator.send(message)) {
        return std::nullopt;
    }
    for (int i = 0; i < 100 && initiator.is_active(); ++i) {
        auto echo = initiator.receive(100ms);
        if (echo) {
            return echo;
        }
    }
    return std::nullopt;
}

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        auto [a, b] = transport::LoopbackStream::make_pair();
        initiator_stream_ = std::move(a);
        responder_stream_ = std::move(b);

        config_.raw_bits = 2048;
        config_.handshake_timeout = 5000ms;
        config_.psk.assign(32, 0x5C);
    }

    // Establish, rotate once and deliver one frame under generation 2.
    // Neither side is reading afterwards.
    void establish_and_rotate(SessionOrchestrator& initiator, SessionOrchestrator& responder) {
        bool responder_ok = false;
        std::optional<std::vector<uint8_t>> delivered;
        std::thread peer([&] {
            responder_ok = responder.establish();
            if (responder_ok) {
                delivered = responder.receive(5000ms);
            }
        });

        bool rotated = initiator.establish() && initiator.rotate();
        std::vector<uint8_t> marker = {0x42};
        bool sent = rotated && initiator.send(marker);
        peer.join();

        ASSERT_TRUE(responder_ok);
        ASSERT_TRUE(rotated);
        ASSERT_TRUE(sent);
        ASSERT_TRUE(delivered.has_value());
        ASSERT_EQ(initiator.keys().current_generation(), 2u);
        ASSERT_EQ(responder.keys().current_generation(), 2u);
        ASSERT_TRUE(initiator.keys().storage_is_zeroed(1));
    }

    SessionConfig config_;
    std::unique_ptr<transport::LoopbackStream> initiator_stream_;
    std::unique_ptr<transport::LoopbackStream> responder_stream_;
    auth::Ed25519Authenticator alice_;
    auth::Ed25519Authenticator bob_;
};

TEST_F(IntegrationTest, EchoOverNoiselessChannel) {
    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);

    bool responder_ok = false;
    std::thread peer([&] {
        responder_ok = responder.establish();
        if (responder_ok) {
            echo_until_closed(responder);
        }
    });

    ASSERT_TRUE(initiator.establish());

    std::string text = "Grüße, κόσμε";
    std::vector<std::vector<uint8_t>> messages = {
        {},
        {0x7F},
        std::vector<uint8_t>(1024, 0xA1),
        std::vector<uint8_t>(65536),
        std::vector<uint8_t>(text.begin(), text.end()),
    };
    crypto::random_bytes(messages[3]);

    for (size_t i = 0; i < messages.size(); ++i) {
        auto echo = round_trip(initiator, messages[i]);
        ASSERT_TRUE(echo.has_value()) << "message " << i;
        EXPECT_EQ(*echo, messages[i]) << "message " << i;
    }

    initiator.close();
    peer.join();

    EXPECT_TRUE(responder_ok);
    EXPECT_EQ(initiator.phase(), SessionPhase::CLOSED);
    EXPECT_EQ(responder.phase(), SessionPhase::CLOSED);
    EXPECT_EQ(responder.state().last_error, ErrorCode::NONE);
    EXPECT_EQ(initiator.stats().frames_sent, messages.size());
    EXPECT_EQ(responder.stats().frames_received, messages.size());
    EXPECT_EQ(responder.stats().frames_missing, 0u);

    // Closing erases every key on both sides
    EXPECT_FALSE(initiator.keys().has_active_key());
    EXPECT_FALSE(responder.keys().has_active_key());
    EXPECT_TRUE(initiator.keys().storage_is_zeroed(1));
    EXPECT_TRUE(responder.keys().storage_is_zeroed(1));

    std::vector<uint8_t> late = {1};
    EXPECT_FALSE(initiator.send(late));
}

TEST_F(IntegrationTest, NoisyChannelReconciles) {
    config_.channel_error_rate = 0.02;
    config_.max_handshake_attempts = 6;

    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);

    bool responder_ok = false;
    std::thread peer([&] {
        responder_ok = responder.establish();
        if (responder_ok) {
            echo_until_closed(responder);
        }
    });

    bool initiator_ok = initiator.establish();
    std::optional<std::vector<uint8_t>> echo;
    std::vector<uint8_t> message = {'n', 'o', 'i', 's', 'e'};
    if (initiator_ok) {
        echo = round_trip(initiator, message);
    }
    initiator.close();
    peer.join();

    ASSERT_TRUE(initiator_ok);
    EXPECT_TRUE(responder_ok);
    ASSERT_TRUE(echo.has_value());
    EXPECT_EQ(*echo, message);
    EXPECT_GT(responder.stats().bits_corrected, 0u);
    EXPECT_GT(responder.stats().parities_disclosed, 0u);
    EXPECT_LE(initiator.stats().last_qber, config_.qber_threshold);
}

TEST_F(IntegrationTest, EavesdroppingAbortsBothSides) {
    config_.channel_error_rate = 0.3;

    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);

    bool responder_ok = true;
    std::thread peer([&] { responder_ok = responder.establish(); });
    bool initiator_ok = initiator.establish();
    peer.join();

    EXPECT_FALSE(initiator_ok);
    EXPECT_FALSE(responder_ok);
    EXPECT_EQ(initiator.phase(), SessionPhase::ABORTED);
    EXPECT_EQ(responder.phase(), SessionPhase::ABORTED);
    EXPECT_EQ(initiator.state().last_error, ErrorCode::EAVESDROPPING_SUSPECTED);
    EXPECT_EQ(responder.state().last_error, ErrorCode::EAVESDROPPING_SUSPECTED);

    // Both sides measured the same sample
    ASSERT_TRUE(initiator.last_qber_report().has_value());
    ASSERT_TRUE(responder.last_qber_report().has_value());
    EXPECT_GT(initiator.last_qber_report()->error_rate(), 0.11);
    EXPECT_EQ(initiator.last_qber_report()->mismatches(), responder.last_qber_report()->mismatches());

    // No attempt is retried after an eavesdropping verdict
    EXPECT_EQ(initiator.stats().handshake_attempts, 1u);
    EXPECT_FALSE(initiator.keys().has_active_key());
}

TEST_F(IntegrationTest, RotationByByteLimit) {
    config_.rotation.interval = 0ms;
    config_.rotation.byte_limit = 100;

    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);

    bool responder_ok = false;
    std::thread peer([&] {
        responder_ok = responder.establish();
        if (responder_ok) {
            echo_until_closed(responder);
        }
    });

    // 64 bytes per message: every second echo pushes the initiator over the limit
    ASSERT_TRUE(initiator.establish());
    for (int i = 0; i < 5; ++i) {
        std::vector<uint8_t> message(64, static_cast<uint8_t>(i));
        auto echo = round_trip(initiator, message);
        ASSERT_TRUE(echo.has_value()) << "message " << i;
        EXPECT_EQ(*echo, message);
    }

    auto initiator_generation = initiator.state().current_generation;
    auto responder_generation = responder.keys().current_generation();

    // Retired generations are erased once the peer confirmed the new key
    EXPECT_FALSE(initiator.keys().is_live(1));
    EXPECT_TRUE(initiator.keys().storage_is_zeroed(1));
    EXPECT_FALSE(initiator.keys().is_live(2));

    initiator.close();
    peer.join();

    EXPECT_TRUE(responder_ok);
    EXPECT_EQ(initiator.stats().rotations, 2u);
    EXPECT_EQ(responder.stats().rotations, 2u);
    EXPECT_EQ(initiator_generation, 3u);
    EXPECT_EQ(responder_generation, 3u);
    EXPECT_EQ(responder.stats().frames_received, 5u);
    EXPECT_TRUE(responder.keys().storage_is_zeroed(1));
}

TEST_F(IntegrationTest, ResponderRequestsRotation) {
    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);

    bool responder_ok = false;
    bool requested = false;
    std::thread peer([&] {
        responder_ok = responder.establish();
        if (responder_ok) {
            requested = responder.rotate();
            echo_until_closed(responder);
        }
    });

    ASSERT_TRUE(initiator.establish());
    for (int i = 0; i < 50 && initiator.stats().rotations == 0 && initiator.is_active(); ++i) {
        EXPECT_FALSE(initiator.receive(100ms).has_value());
    }

    std::vector<uint8_t> message = {'a', 'f', 't', 'e', 'r'};
    auto echo = round_trip(initiator, message);
    initiator.close();
    peer.join();

    EXPECT_TRUE(requested);
    EXPECT_EQ(initiator.stats().rotations, 1u);
    EXPECT_EQ(responder.stats().rotations, 1u);
    ASSERT_TRUE(echo.has_value());
    EXPECT_EQ(*echo, message);
}

TEST_F(IntegrationTest, TamperedStreamAbortsReceiver) {
    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);

    bool responder_ok = false;
    std::thread peer([&] { responder_ok = responder.establish(); });
    ASSERT_TRUE(initiator.establish());
    peer.join();
    ASSERT_TRUE(responder_ok);

    // A frame for a generation the responder never had
    packet::MessageStream injector(*initiator_stream_);
    packet::AeadFrame forged;
    forged.generation = 9;
    forged.ciphertext = {1, 2, 3};
    ASSERT_TRUE(injector.send(packet::Envelope{0, forged}).has_value());

    EXPECT_FALSE(responder.receive(1000ms).has_value());
    EXPECT_EQ(responder.phase(), SessionPhase::ABORTED);
    EXPECT_EQ(responder.state().last_error, ErrorCode::KEY_UNAVAILABLE);

    // The initiator learns why
    EXPECT_FALSE(initiator.receive(1000ms).has_value());
    EXPECT_EQ(initiator.phase(), SessionPhase::ABORTED);
    EXPECT_EQ(initiator.state().last_error, ErrorCode::KEY_UNAVAILABLE);

    // Both sides wiped the live key
    EXPECT_FALSE(responder.keys().has_active_key());
    EXPECT_FALSE(initiator.keys().has_active_key());
    EXPECT_TRUE(responder.keys().storage_is_zeroed(1));
    EXPECT_TRUE(initiator.keys().storage_is_zeroed(1));
}

TEST_F(IntegrationTest, AbortDuringRotationErasesBothGenerations) {
    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);
    ASSERT_NO_FATAL_FAILURE(establish_and_rotate(initiator, responder));

    // Take the next quantum states in the responder's place, then drop the link
    bool rotated = true;
    std::thread rotation([&] { rotated = initiator.rotate(); });
    packet::MessageStream peer_side(*responder_stream_);
    auto states = peer_side.receive(5000ms);
    responder_stream_->close();
    rotation.join();

    ASSERT_EQ(states.status, packet::ReceiveStatus::OK);
    EXPECT_EQ(packet::get_message_type(states.envelope->message), packet::MessageType::QUANTUM_STATES);

    EXPECT_FALSE(rotated);
    EXPECT_EQ(initiator.phase(), SessionPhase::ABORTED);
    EXPECT_EQ(initiator.state().last_error, ErrorCode::TRANSPORT_ERROR);
    EXPECT_FALSE(initiator.keys().has_active_key());
    EXPECT_FALSE(initiator.keys().is_live(2));
    EXPECT_FALSE(initiator.keys().is_live(3));
    EXPECT_TRUE(initiator.keys().storage_is_zeroed(1));
    EXPECT_TRUE(initiator.keys().storage_is_zeroed(2));
}

TEST_F(IntegrationTest, ResponderAbortDuringRotationErasesBothGenerations) {
    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);
    ASSERT_NO_FATAL_FAILURE(establish_and_rotate(initiator, responder));

    // Quantum states for a third attempt, then the link drops before the
    // responder can disclose its bases
    packet::QuantumStates states;
    states.bits.assign(64, 1);
    states.bases.assign(64, qkd::Basis::RECTILINEAR);
    packet::MessageStream injector(*initiator_stream_);
    ASSERT_TRUE(injector.send(packet::Envelope{3, std::move(states)}).has_value());
    initiator_stream_->close();

    EXPECT_FALSE(responder.receive(2000ms).has_value());
    EXPECT_EQ(responder.phase(), SessionPhase::ABORTED);
    EXPECT_EQ(responder.state().last_error, ErrorCode::TRANSPORT_ERROR);
    EXPECT_FALSE(responder.keys().has_active_key());
    EXPECT_FALSE(responder.keys().is_live(2));
    EXPECT_TRUE(responder.keys().storage_is_zeroed(1));
    EXPECT_TRUE(responder.keys().storage_is_zeroed(2));
}

TEST_F(IntegrationTest, StaleRotationRequestIgnored) {
    SessionOrchestrator initiator(Role::INITIATOR, config_, *initiator_stream_, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *responder_stream_, bob_);
    ASSERT_NO_FATAL_FAILURE(establish_and_rotate(initiator, responder));

    // Names generation 1, which the rotation to 2 already replaced
    packet::MessageStream injector(*responder_stream_);
    ASSERT_TRUE(injector.send(packet::Envelope{0, packet::RotateRequest{1}}).has_value());

    EXPECT_FALSE(initiator.receive(200ms).has_value());
    EXPECT_EQ(initiator.phase(), SessionPhase::ACTIVE);
    EXPECT_EQ(initiator.stats().rotations, 1u);
    EXPECT_EQ(initiator.keys().current_generation(), 2u);
}

TEST_F(IntegrationTest, EchoOverTcp) {
    transport::TcpListener listener;
    ASSERT_TRUE(listener.open({"127.0.0.1", 0}));

    std::unique_ptr<transport::TcpStream> server;
    std::thread acceptor([&] { server = listener.accept(2000ms); });
    auto client = transport::tcp_connect({"127.0.0.1", listener.local_address().port}, 2000ms);
    acceptor.join();
    ASSERT_NE(client, nullptr);
    ASSERT_NE(server, nullptr);

    auto pinned = config_;
    pinned.peer_identity = bob_.public_identity();
    SessionOrchestrator initiator(Role::INITIATOR, pinned, *client, alice_);
    SessionOrchestrator responder(Role::RESPONDER, config_, *server, bob_);

    bool responder_ok = false;
    std::thread peer([&] {
        responder_ok = responder.establish();
        if (responder_ok) {
            echo_until_closed(responder);
        }
    });

    bool initiator_ok = initiator.establish();
    std::optional<std::vector<uint8_t>> echo;
    std::vector<uint8_t> message(4096, 0x3E);
    if (initiator_ok) {
        echo = round_trip(initiator, message);
    }
    initiator.close();
    peer.join();

    ASSERT_TRUE(initiator_ok);
    EXPECT_TRUE(responder_ok);
    ASSERT_TRUE(echo.has_value());
    EXPECT_EQ(*echo, message);
    EXPECT_EQ(responder.phase(), SessionPhase::CLOSED);
}

}  // namespace
}  // namespace qline

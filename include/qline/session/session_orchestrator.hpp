#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "qline/auth/authenticator.hpp"
#include "qline/channel/authenticated_channel.hpp"
#include "qline/common/error.hpp"
#include "qline/common/role.hpp"
#include "qline/crypto/crypto.hpp"
#include "qline/packet/message_stream.hpp"
#include "qline/qkd/qber_estimator.hpp"
#include "qline/qkd/quantum_channel.hpp"
#include "qline/qkd/reconciler.hpp"
#include "qline/qkd/sifter.hpp"
#include "qline/session/hybrid_key_deriver.hpp"
#include "qline/session/session_key_manager.hpp"
#include "qline/transport/byte_stream.hpp"

namespace qline::session {

struct SessionConfig {
    // Quantum exchange
    size_t raw_bits = 2048;
    double channel_error_rate = 0.0;  // Simulated noise applied by the responder
    double qber_threshold = 0.11;
    double sample_fraction = 0.2;
    size_t min_sifted_bits = 256;
    size_t reconciliation_passes = 4;

    // Keys
    size_t key_length_bits = 256;
    RotationPolicy rotation;

    // Handshake
    std::chrono::milliseconds handshake_timeout{10000};
    uint32_t max_handshake_attempts = 3;

    // Pre-shared key mixed into the authenticated secret (may be empty)
    std::vector<uint8_t> psk;

    // Expected peer identity; empty accepts any identity that signs correctly
    std::vector<uint8_t> peer_identity;
};

enum class SessionPhase : uint8_t {
    INIT,
    QKD_EXCHANGE,
    SIFTING,
    QBER_CHECK,
    RECONCILING,
    AUTHENTICATING,
    KEY_DERIVATION,
    ACTIVE,
    ROTATING,
    ABORTED,  // Terminal
    CLOSED    // Terminal
};

const char* phase_to_string(SessionPhase phase);

struct SessionState {
    Role role{Role::INITIATOR};
    SessionPhase phase{SessionPhase::INIT};
    uint32_t current_generation{0};
    bool peer_authenticated{false};
    ErrorCode last_error{ErrorCode::NONE};
};

struct SessionStats {
    uint64_t handshake_attempts{0};
    uint64_t rotations{0};
    uint64_t frames_sent{0};
    uint64_t frames_received{0};
    uint64_t frames_missing{0};
    uint64_t bits_corrected{0};
    uint64_t parities_disclosed{0};
    double last_qber{0.0};
};

// Drives one endpoint of a session: QKD exchange, sifting, QBER check,
// reconciliation, authentication, key derivation and confirmation, then
// application traffic with key rotation.
//
// Single-threaded: establish, send, receive, rotate and close must be called
// from one thread. The byte stream is borrowed and must outlive the session.
class SessionOrchestrator {
public:
    using StateCallback = std::function<void(SessionPhase)>;

    SessionOrchestrator(Role role,
                        const SessionConfig& config,
                        transport::ByteStream& stream,
                        const auth::Authenticator& authenticator);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    void set_state_callback(StateCallback callback);

    // Run the handshake until ACTIVE (true) or a terminal phase (false)
    bool establish();

    // Seal and send application data. May rotate first (initiator) or ask
    // the peer to rotate (responder).
    bool send(std::span<const uint8_t> plaintext);

    // Next plaintext from the peer. nullopt on timeout (phase stays ACTIVE),
    // on orderly close (CLOSED) or on failure (ABORTED); see state().
    std::optional<std::vector<uint8_t>> receive(std::chrono::milliseconds timeout);

    // Initiator: rotate now. Responder: ask the initiator to rotate.
    bool rotate();

    // Send Close and erase every key
    void close();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] SessionPhase phase() const { return phase_; }
    [[nodiscard]] Role role() const { return role_; }
    [[nodiscard]] bool is_active() const { return phase_ == SessionPhase::ACTIVE; }
    [[nodiscard]] const SessionStats& stats() const { return stats_; }
    [[nodiscard]] const SessionKeyManager& keys() const { return keys_; }
    [[nodiscard]] const std::vector<uint8_t>& peer_identity() const { return peer_identity_; }
    [[nodiscard]] const std::optional<qkd::QberReport>& last_qber_report() const { return last_qber_; }

private:
    // Outcome of one handshake step
    enum class Step {
        OK,
        RETRY,  // Recoverable failure, start a new attempt
        FAILED  // Session aborted
    };

    struct Incoming {
        Step step{Step::FAILED};
        std::optional<packet::Envelope> envelope;
        std::vector<uint8_t> raw;
    };

    struct Attempt;

    Role role_;
    SessionConfig config_;
    packet::MessageStream stream_;
    const auth::Authenticator& authenticator_;

    qkd::QuantumChannelSimulator simulator_;
    qkd::Sifter sifter_;
    qkd::QberEstimator estimator_;
    qkd::Reconciler reconciler_;
    HybridKeyDeriver deriver_;
    SessionKeyManager keys_;
    channel::AuthenticatedChannel channel_;

    SessionPhase phase_{SessionPhase::INIT};
    ErrorCode last_error_{ErrorCode::NONE};
    bool peer_authenticated_{false};
    uint32_t attempt_{0};
    bool rotating_{false};
    bool rotate_requested_{false};
    std::vector<uint8_t> peer_identity_;
    std::optional<qkd::QberReport> last_qber_;
    std::deque<std::vector<uint8_t>> inbox_;
    SessionStats stats_;
    StateCallback state_callback_;

    void set_phase(SessionPhase phase);
    // Handshake stage change; a rotation stays in ROTATING throughout
    void advance(SessionPhase phase);
    bool is_terminal() const;

    // Handshake driver; first is a QuantumStates already read by receive()
    bool run_handshake(std::optional<packet::Envelope> first);
    Step run_attempt(std::optional<packet::Envelope>& first);

    Step exchange_states(Attempt& attempt, std::optional<packet::Envelope>& first);
    Step sift(Attempt& attempt);
    Step check_qber(Attempt& attempt);
    Step reconcile(Attempt& attempt);
    Step reconcile_reference(Attempt& attempt, size_t pass, size_t block_size);
    Step reconcile_correct(Attempt& attempt, size_t pass);
    Step authenticate(Attempt& attempt);
    Step derive_and_confirm(Attempt& attempt);

    // Handshake I/O; classical messages are added to the transcript
    Step send_handshake(Attempt& attempt, packet::Message message, bool in_transcript = true);
    Incoming read_handshake(packet::MessageType expected);
    template <typename T>
    std::optional<T> expect(Attempt& attempt, packet::MessageType type, Step& step,
                            bool in_transcript = true);

    // Local recoverable failure: tell the peer, then retry
    Step retry(ErrorCode reason);

    // Frames and control messages that can arrive outside a handshake.
    // Returns false if the session ended.
    bool handle_frame(const packet::AeadFrame& frame, std::optional<std::vector<uint8_t>>* out);
    void handle_close(const packet::Close& message);

    bool maybe_rotate();
    bool send_control(packet::Message message);

    void fail(ErrorCode code);
    void wipe_keys();
};

}  // namespace qline::session

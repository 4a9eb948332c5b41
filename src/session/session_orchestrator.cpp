#include "qline/session/session_orchestrator.hpp"

#include <variant>

#include <spdlog/spdlog.h>

#include "qline/crypto/hkdf.hpp"
#include "qline/crypto/x25519.hpp"
#include "qline/utils/time.hpp"

namespace qline::session {

namespace {

constexpr std::string_view AUTH_LABEL = "qline-auth-v1";
constexpr std::string_view CONFIRM_LABEL = "qline-confirm";

// Room for the AEAD frame fields around the ciphertext
constexpr size_t MAX_PLAINTEXT_SIZE = packet::MAX_PAYLOAD_SIZE - 64;

// Upper bound on query rounds in one reconciliation pass
constexpr size_t MAX_PARITY_ROUNDS = 40;

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

// "qline-auth-v1" || role || transcript hash || ephemeral public key
std::vector<uint8_t> auth_message(Role signer,
                                  const crypto::Sha256Digest& transcript_hash,
                                  const crypto::PublicKey& ephemeral_public) {
    auto label = crypto::as_bytes(AUTH_LABEL);
    std::vector<uint8_t> msg(label.begin(), label.end());
    msg.push_back(static_cast<uint8_t>(signer));
    msg.insert(msg.end(), transcript_hash.begin(), transcript_hash.end());
    msg.insert(msg.end(), ephemeral_public.begin(), ephemeral_public.end());
    return msg;
}

// HMAC(key, "qline-confirm" || role || generation)
crypto::HmacDigest confirm_mac(const crypto::SymmetricKey& key, Role sender, uint32_t generation) {
    std::vector<uint8_t> context{static_cast<uint8_t>(sender)};
    append_u32(context, generation);
    return crypto::hmac_sha256_parts(key, {crypto::as_bytes(CONFIRM_LABEL), context});
}

bool is_handshake_type(packet::MessageType type) {
    switch (type) {
        case packet::MessageType::QUANTUM_STATES:
        case packet::MessageType::BASIS_DISCLOSURE:
        case packet::MessageType::SAMPLE_DISCLOSURE:
        case packet::MessageType::PARITY_EXCHANGE:
        case packet::MessageType::AUTH_HANDSHAKE:
        case packet::MessageType::KEY_CONFIRM:
        case packet::MessageType::HANDSHAKE_RETRY:
            return true;
        default:
            return false;
    }
}

}  // namespace

const char* phase_to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::INIT:
            return "INIT";
        case SessionPhase::QKD_EXCHANGE:
            return "QKD_EXCHANGE";
        case SessionPhase::SIFTING:
            return "SIFTING";
        case SessionPhase::QBER_CHECK:
            return "QBER_CHECK";
        case SessionPhase::RECONCILING:
            return "RECONCILING";
        case SessionPhase::AUTHENTICATING:
            return "AUTHENTICATING";
        case SessionPhase::KEY_DERIVATION:
            return "KEY_DERIVATION";
        case SessionPhase::ACTIVE:
            return "ACTIVE";
        case SessionPhase::ROTATING:
            return "ROTATING";
        case SessionPhase::ABORTED:
            return "ABORTED";
        case SessionPhase::CLOSED:
            return "CLOSED";
    }
    return "UNKNOWN";
}

// Everything one handshake attempt produces. Secrets are wiped when the
// attempt ends, whatever the outcome.
struct SessionOrchestrator::Attempt {
    crypto::Sha256 transcript;
    qkd::BitBasisStream local;  // Prepared (initiator) or measured (responder)
    std::vector<qkd::Basis> peer_bases;
    std::optional<qkd::SiftedKey> sifted;
    std::optional<qkd::QberReport> report;
    crypto::Sha256Digest transcript_hash{};
    std::vector<uint8_t> signature_initiator;
    std::vector<uint8_t> signature_responder;
    crypto::SharedSecret classical{};
    std::optional<HybridSessionKey> candidate;

    ~Attempt() {
        crypto::secure_zero(classical.data(), classical.size());
        if (candidate) {
            candidate->erase();
        }
    }
};

SessionOrchestrator::SessionOrchestrator(Role role,
                                         const SessionConfig& config,
                                         transport::ByteStream& stream,
                                         const auth::Authenticator& authenticator)
    : role_(role),
      config_(config),
      stream_(stream),
      authenticator_(authenticator),
      sifter_(qkd::SifterConfig{config.min_sifted_bits}),
      estimator_(qkd::QberEstimatorConfig{config.qber_threshold, config.sample_fraction}),
      reconciler_(qkd::ReconcilerConfig{config.reconciliation_passes}),
      deriver_(HybridKeyDeriverConfig{config.key_length_bits}),
      keys_(config.rotation),
      channel_(role, keys_) {}

SessionOrchestrator::~SessionOrchestrator() {
    wipe_keys();
}

void SessionOrchestrator::set_state_callback(StateCallback callback) {
    state_callback_ = std::move(callback);
}

void SessionOrchestrator::set_phase(SessionPhase phase) {
    if (phase_ == phase) {
        return;
    }
    spdlog::info("[{}] {} -> {}", role_to_string(role_), phase_to_string(phase_), phase_to_string(phase));
    phase_ = phase;
    if (state_callback_) {
        state_callback_(phase);
    }
}

void SessionOrchestrator::advance(SessionPhase phase) {
    if (rotating_) {
        spdlog::debug("[{}] rotation: {}", role_to_string(role_), phase_to_string(phase));
        return;
    }
    set_phase(phase);
}

bool SessionOrchestrator::is_terminal() const {
    return phase_ == SessionPhase::ABORTED || phase_ == SessionPhase::CLOSED;
}

SessionState SessionOrchestrator::state() const {
    SessionState s;
    s.role = role_;
    s.phase = phase_;
    s.current_generation = keys_.current_generation();
    s.peer_authenticated = peer_authenticated_;
    s.last_error = last_error_;
    return s;
}

bool SessionOrchestrator::establish() {
    if (phase_ != SessionPhase::INIT) {
        spdlog::warn("establish() called in phase {}", phase_to_string(phase_));
        return false;
    }
    return run_handshake(std::nullopt);
}

bool SessionOrchestrator::run_handshake(std::optional<packet::Envelope> first) {
    for (uint32_t tries = 1;; ++tries) {
        ++stats_.handshake_attempts;
        if (first) {
            attempt_ = first->attempt;
        } else {
            ++attempt_;
        }

        Step step = run_attempt(first);
        first.reset();

        if (step == Step::OK) {
            return true;
        }
        if (step == Step::FAILED) {
            return false;
        }
        if (tries >= config_.max_handshake_attempts) {
            spdlog::error("[{}] Handshake failed after {} attempts", role_to_string(role_), tries);
            fail(last_error_);
            return false;
        }
        spdlog::info("[{}] Retrying handshake (attempt {})", role_to_string(role_), attempt_ + 1);
    }
}

SessionOrchestrator::Step SessionOrchestrator::run_attempt(std::optional<packet::Envelope>& first) {
    Attempt attempt;
    reconciler_.reset_counters();

    Step step = exchange_states(attempt, first);
    if (step == Step::OK) step = sift(attempt);
    if (step == Step::OK) step = check_qber(attempt);
    if (step == Step::OK) step = reconcile(attempt);
    if (step == Step::OK) step = authenticate(attempt);
    if (step == Step::OK) step = derive_and_confirm(attempt);
    return step;
}

// ---------------------------------------------------------------------------
// Handshake I/O
// ---------------------------------------------------------------------------

SessionOrchestrator::Step SessionOrchestrator::send_handshake(Attempt& attempt,
                                                              packet::Message message,
                                                              bool in_transcript) {
    auto bytes = stream_.send(packet::Envelope{attempt_, std::move(message)});
    if (!bytes) {
        fail(ErrorCode::TRANSPORT_ERROR);
        return Step::FAILED;
    }
    if (in_transcript) {
        attempt.transcript.update(*bytes);
    }
    return Step::OK;
}

SessionOrchestrator::Incoming SessionOrchestrator::read_handshake(packet::MessageType expected) {
    Incoming in;

    for (;;) {
        std::vector<uint8_t> raw;
        auto result = stream_.receive(config_.handshake_timeout, &raw);
        switch (result.status) {
            case packet::ReceiveStatus::OK:
                break;
            case packet::ReceiveStatus::TIMEOUT:
                spdlog::warn("[{}] Timed out waiting for message type 0x{:02x}",
                             role_to_string(role_), static_cast<uint8_t>(expected));
                fail(ErrorCode::TIMEOUT);
                return in;
            case packet::ReceiveStatus::MALFORMED:
                fail(ErrorCode::PROTOCOL_ERROR);
                return in;
            case packet::ReceiveStatus::CLOSED:
            case packet::ReceiveStatus::ERROR:
                fail(ErrorCode::TRANSPORT_ERROR);
                return in;
        }

        auto& envelope = *result.envelope;
        auto type = packet::get_message_type(envelope.message);

        // Traffic of the live generation keeps flowing during a rotation
        if (type == packet::MessageType::AEAD_FRAME) {
            if (!handle_frame(std::get<packet::AeadFrame>(envelope.message), nullptr)) {
                return in;
            }
            continue;
        }
        if (type == packet::MessageType::CLOSE) {
            handle_close(std::get<packet::Close>(envelope.message));
            return in;
        }
        if (type == packet::MessageType::ROTATE_REQUEST) {
            continue;
        }

        if (envelope.attempt < attempt_) {
            spdlog::debug("[{}] Discarding stale message type 0x{:02x} from attempt {}",
                          role_to_string(role_), static_cast<uint8_t>(type), envelope.attempt);
            continue;
        }

        if (type == packet::MessageType::HANDSHAKE_RETRY && envelope.attempt == attempt_) {
            auto reason = std::get<packet::HandshakeRetry>(envelope.message).reason;
            spdlog::warn("[{}] Peer abandoned attempt {}: {}",
                         role_to_string(role_), attempt_, error_to_string(reason));
            last_error_ = reason;
            in.step = Step::RETRY;
            return in;
        }

        // The responder follows the initiator's attempt numbering
        if (type == packet::MessageType::QUANTUM_STATES && expected == type &&
            role_ == Role::RESPONDER) {
            attempt_ = envelope.attempt;
        }

        if (envelope.attempt != attempt_ || type != expected) {
            spdlog::warn("[{}] Unexpected message type 0x{:02x} (attempt {}), expected 0x{:02x} (attempt {})",
                         role_to_string(role_), static_cast<uint8_t>(type), envelope.attempt,
                         static_cast<uint8_t>(expected), attempt_);
            fail(ErrorCode::PROTOCOL_ERROR);
            return in;
        }

        in.step = Step::OK;
        in.envelope = std::move(envelope);
        in.raw = std::move(raw);
        return in;
    }
}

template <typename T>
std::optional<T> SessionOrchestrator::expect(Attempt& attempt,
                                             packet::MessageType type,
                                             Step& step,
                                             bool in_transcript) {
    auto in = read_handshake(type);
    step = in.step;
    if (in.step != Step::OK) {
        return std::nullopt;
    }
    if (in_transcript) {
        attempt.transcript.update(in.raw);
    }
    return std::get<T>(std::move(in.envelope->message));
}

SessionOrchestrator::Step SessionOrchestrator::retry(ErrorCode reason) {
    spdlog::warn("[{}] Handshake attempt {} failed: {}",
                 role_to_string(role_), attempt_, error_to_string(reason));
    last_error_ = reason;
    if (!stream_.send(packet::Envelope{attempt_, packet::HandshakeRetry{reason}})) {
        fail(ErrorCode::TRANSPORT_ERROR);
        return Step::FAILED;
    }
    return Step::RETRY;
}

// ---------------------------------------------------------------------------
// Handshake stages
// ---------------------------------------------------------------------------

SessionOrchestrator::Step SessionOrchestrator::exchange_states(Attempt& attempt,
                                                               std::optional<packet::Envelope>& first) {
    advance(SessionPhase::QKD_EXCHANGE);

    if (role_ == Role::INITIATOR) {
        if (config_.raw_bits > packet::MAX_RAW_BITS) {
            spdlog::error("[{}] raw_bits {} exceeds the frame limit of {}",
                          role_to_string(role_), config_.raw_bits, packet::MAX_RAW_BITS);
            fail(ErrorCode::INVALID_PARAMETER);
            return Step::FAILED;
        }
        auto prepared = simulator_.generate(config_.raw_bits, config_.channel_error_rate);
        if (!prepared) {
            fail(simulator_.last_error());
            return Step::FAILED;
        }

        packet::QuantumStates states;
        states.bits.assign(prepared->bits().begin(), prepared->bits().end());
        states.bases.assign(prepared->bases().begin(), prepared->bases().end());
        attempt.local = std::move(*prepared);

        Step step = send_handshake(attempt, std::move(states), false);
        return step;
    }

    packet::QuantumStates states;
    if (first) {
        states = std::get<packet::QuantumStates>(std::move(first->message));
    } else {
        Step step = Step::FAILED;
        auto received = expect<packet::QuantumStates>(attempt, packet::MessageType::QUANTUM_STATES,
                                                      step, false);
        if (!received) {
            return step;
        }
        states = std::move(*received);
    }

    qkd::BitBasisStream sent(std::move(states.bits), std::move(states.bases));
    auto measured = simulator_.transmit(sent, config_.channel_error_rate);
    if (!measured) {
        spdlog::warn("[{}] Rejecting quantum states: {}",
                     role_to_string(role_), error_to_string(simulator_.last_error()));
        fail(ErrorCode::PROTOCOL_ERROR);
        return Step::FAILED;
    }
    attempt.local = std::move(*measured);
    spdlog::debug("[{}] Measured {} states", role_to_string(role_), attempt.local.size());
    return Step::OK;
}

SessionOrchestrator::Step SessionOrchestrator::sift(Attempt& attempt) {
    advance(SessionPhase::SIFTING);

    packet::BasisDisclosure mine;
    mine.bases.assign(attempt.local.bases().begin(), attempt.local.bases().end());

    Step step = Step::OK;
    if (role_ == Role::RESPONDER) {
        step = send_handshake(attempt, std::move(mine));
        if (step != Step::OK) {
            return step;
        }
    }

    auto peer = expect<packet::BasisDisclosure>(attempt, packet::MessageType::BASIS_DISCLOSURE, step);
    if (!peer) {
        return step;
    }
    attempt.peer_bases = std::move(peer->bases);

    if (role_ == Role::INITIATOR) {
        step = send_handshake(attempt, std::move(mine));
        if (step != Step::OK) {
            return step;
        }
    }

    attempt.sifted = sifter_.sift(attempt.local.bases(), attempt.peer_bases, attempt.local.bits());
    if (!attempt.sifted) {
        ErrorCode code = sifter_.last_error();
        if (is_recoverable(code)) {
            return retry(code);
        }
        fail(code);
        return Step::FAILED;
    }

    spdlog::debug("[{}] Sifted {} of {} bits", role_to_string(role_),
                  attempt.sifted->size(), attempt.local.size());
    return Step::OK;
}

SessionOrchestrator::Step SessionOrchestrator::check_qber(Attempt& attempt) {
    advance(SessionPhase::QBER_CHECK);

    auto& sifted = *attempt.sifted;
    std::vector<uint32_t> indices;
    Step step = Step::OK;

    if (role_ == Role::INITIATOR) {
        auto chosen = estimator_.choose_sample_indices(sifted.size());
        if (!chosen) {
            fail(estimator_.last_error());
            return Step::FAILED;
        }
        indices = std::move(*chosen);

        packet::SampleDisclosure mine;
        mine.indices = indices;
        mine.bits = qkd::QberEstimator::sample_bits(sifted, indices);
        step = send_handshake(attempt, std::move(mine));
        if (step != Step::OK) {
            return step;
        }

        auto peer = expect<packet::SampleDisclosure>(attempt, packet::MessageType::SAMPLE_DISCLOSURE, step);
        if (!peer) {
            return step;
        }
        if (peer->indices != indices) {
            spdlog::warn("[{}] Peer answered for different sample positions", role_to_string(role_));
            fail(ErrorCode::PROTOCOL_ERROR);
            return Step::FAILED;
        }
        attempt.report = estimator_.estimate(sifted, peer->bits, indices);
    } else {
        auto peer = expect<packet::SampleDisclosure>(attempt, packet::MessageType::SAMPLE_DISCLOSURE, step);
        if (!peer) {
            return step;
        }
        indices = std::move(peer->indices);
        attempt.report = estimator_.estimate(sifted, peer->bits, indices);

        if (attempt.report) {
            packet::SampleDisclosure mine;
            mine.indices = indices;
            mine.bits = qkd::QberEstimator::sample_bits(sifted, indices);
            step = send_handshake(attempt, std::move(mine));
            if (step != Step::OK) {
                return step;
            }
        }
    }

    if (!attempt.report) {
        ErrorCode code = estimator_.last_error();
        if (is_recoverable(code)) {
            return retry(code);
        }
        fail(ErrorCode::PROTOCOL_ERROR);
        return Step::FAILED;
    }

    const auto& report = *attempt.report;
    last_qber_ = report;
    stats_.last_qber = report.error_rate();
    spdlog::info("[{}] QBER {:.4f} ({} of {} sample bits differ)", role_to_string(role_),
                 report.error_rate(), report.mismatches(), report.sample_size());

    if (!report.accepted()) {
        spdlog::warn("[{}] QBER above threshold {:.4f}, possible eavesdropping",
                     role_to_string(role_), config_.qber_threshold);
        fail(ErrorCode::EAVESDROPPING_SUSPECTED);
        return Step::FAILED;
    }

    attempt.sifted = qkd::QberEstimator::discard_sample(sifted, indices);
    return Step::OK;
}

SessionOrchestrator::Step SessionOrchestrator::reconcile(Attempt& attempt) {
    advance(SessionPhase::RECONCILING);

    size_t passes = reconciler_.config().passes;
    size_t initial = reconciler_.initial_block_size(attempt.report->error_rate());

    for (size_t pass = 0; pass < passes; ++pass) {
        Step step = role_ == Role::INITIATOR
                        ? reconcile_reference(attempt, pass, reconciler_.block_size_for_pass(initial, pass))
                        : reconcile_correct(attempt, pass);
        if (step != Step::OK) {
            return step;
        }
    }

    stats_.bits_corrected += reconciler_.corrected_bits();
    stats_.parities_disclosed += reconciler_.disclosed_parities();
    if (role_ == Role::RESPONDER) {
        spdlog::debug("[{}] Reconciliation corrected {} bits with {} parities",
                      role_to_string(role_), reconciler_.corrected_bits(), reconciler_.disclosed_parities());
    }
    return Step::OK;
}

SessionOrchestrator::Step SessionOrchestrator::reconcile_reference(Attempt& attempt,
                                                                   size_t pass,
                                                                   size_t block_size) {
    auto& bits = attempt.sifted->bits;

    packet::ParityExchange blocks;
    blocks.kind = packet::ParityExchange::Kind::BLOCKS;
    blocks.pass = static_cast<uint32_t>(pass);
    crypto::random_bytes(blocks.seed);
    blocks.block_size = static_cast<uint32_t>(block_size);

    auto perm = qkd::Reconciler::permutation(blocks.seed, bits.size());
    blocks.parities = qkd::Reconciler::parities(bits.span(), perm,
                                                qkd::Reconciler::blocks(bits.size(), block_size));

    Step step = send_handshake(attempt, std::move(blocks));
    if (step != Step::OK) {
        return step;
    }

    for (size_t round = 0; round < MAX_PARITY_ROUNDS; ++round) {
        auto query = expect<packet::ParityExchange>(attempt, packet::MessageType::PARITY_EXCHANGE, step);
        if (!query) {
            return step;
        }
        if (query->kind != packet::ParityExchange::Kind::QUERY || query->pass != pass) {
            fail(ErrorCode::PROTOCOL_ERROR);
            return Step::FAILED;
        }
        if (query->ranges.empty()) {
            return Step::OK;
        }
        for (const auto& range : query->ranges) {
            if (range.end > bits.size()) {
                fail(ErrorCode::PROTOCOL_ERROR);
                return Step::FAILED;
            }
        }

        packet::ParityExchange reply;
        reply.kind = packet::ParityExchange::Kind::REPLY;
        reply.pass = static_cast<uint32_t>(pass);
        reply.parities = qkd::Reconciler::parities(bits.span(), perm, query->ranges);
        step = send_handshake(attempt, std::move(reply));
        if (step != Step::OK) {
            return step;
        }
    }

    spdlog::warn("[{}] Reconciliation pass {} did not converge", role_to_string(role_), pass);
    fail(ErrorCode::PROTOCOL_ERROR);
    return Step::FAILED;
}

SessionOrchestrator::Step SessionOrchestrator::reconcile_correct(Attempt& attempt, size_t pass) {
    auto& bits = attempt.sifted->bits;
    Step step = Step::OK;

    auto blocks = expect<packet::ParityExchange>(attempt, packet::MessageType::PARITY_EXCHANGE, step);
    if (!blocks) {
        return step;
    }
    if (blocks->kind != packet::ParityExchange::Kind::BLOCKS || blocks->pass != pass ||
        blocks->block_size == 0) {
        fail(ErrorCode::PROTOCOL_ERROR);
        return Step::FAILED;
    }

    auto perm = qkd::Reconciler::permutation(blocks->seed, bits.size());
    auto ranges = qkd::Reconciler::blocks(bits.size(), blocks->block_size);
    auto active = reconciler_.mismatched(bits, perm, ranges, blocks->parities);

    for (size_t round = 0; active && round < MAX_PARITY_ROUNDS; ++round) {
        packet::ParityExchange query;
        query.kind = packet::ParityExchange::Kind::QUERY;
        query.pass = static_cast<uint32_t>(pass);
        query.ranges = qkd::Reconciler::first_halves(*active);
        bool pass_done = query.ranges.empty();

        step = send_handshake(attempt, std::move(query));
        if (step != Step::OK || pass_done) {
            return step;
        }

        auto reply = expect<packet::ParityExchange>(attempt, packet::MessageType::PARITY_EXCHANGE, step);
        if (!reply) {
            return step;
        }
        if (reply->kind != packet::ParityExchange::Kind::REPLY || reply->pass != pass) {
            fail(ErrorCode::PROTOCOL_ERROR);
            return Step::FAILED;
        }
        active = reconciler_.narrow(bits, perm, *active, reply->parities);
    }

    spdlog::warn("[{}] Reconciliation pass {} failed: {}", role_to_string(role_), pass,
                 error_to_string(reconciler_.last_error()));
    fail(ErrorCode::PROTOCOL_ERROR);
    return Step::FAILED;
}

SessionOrchestrator::Step SessionOrchestrator::authenticate(Attempt& attempt) {
    advance(SessionPhase::AUTHENTICATING);

    attempt.transcript_hash = attempt.transcript.peek();
    auto ephemeral = crypto::generate_keypair();

    packet::AuthHandshake mine;
    mine.public_identity = authenticator_.public_identity();
    mine.ephemeral_public = ephemeral.public_key;
    mine.signature = authenticator_.sign(auth_message(role_, attempt.transcript_hash, ephemeral.public_key));
    auto own_signature = mine.signature;

    Step step = send_handshake(attempt, std::move(mine), false);
    if (step != Step::OK) {
        ephemeral.wipe();
        return step;
    }

    auto peer = expect<packet::AuthHandshake>(attempt, packet::MessageType::AUTH_HANDSHAKE, step, false);
    if (!peer) {
        ephemeral.wipe();
        return step;
    }

    if (!config_.peer_identity.empty() &&
        !crypto::constant_time_compare(config_.peer_identity, peer->public_identity)) {
        ephemeral.wipe();
        spdlog::warn("[{}] Peer identity does not match the configured pin", role_to_string(role_));
        fail(ErrorCode::AUTHENTICATION_FAILURE);
        return Step::FAILED;
    }

    auto signed_message = auth_message(peer_of(role_), attempt.transcript_hash, peer->ephemeral_public);
    if (!authenticator_.verify(peer->public_identity, signed_message, peer->signature)) {
        ephemeral.wipe();
        spdlog::warn("[{}] Peer handshake signature rejected", role_to_string(role_));
        fail(ErrorCode::AUTHENTICATION_FAILURE);
        return Step::FAILED;
    }

    auto shared = crypto::key_exchange(ephemeral.secret_key, peer->ephemeral_public);
    ephemeral.wipe();
    if (!shared) {
        spdlog::warn("[{}] Peer sent a weak ephemeral key", role_to_string(role_));
        fail(ErrorCode::AUTHENTICATION_FAILURE);
        return Step::FAILED;
    }
    attempt.classical = *shared;
    crypto::secure_zero(shared->data(), shared->size());

    if (role_ == Role::INITIATOR) {
        attempt.signature_initiator = std::move(own_signature);
        attempt.signature_responder = std::move(peer->signature);
    } else {
        attempt.signature_initiator = std::move(peer->signature);
        attempt.signature_responder = std::move(own_signature);
    }

    peer_identity_ = std::move(peer->public_identity);
    peer_authenticated_ = true;
    return Step::OK;
}

SessionOrchestrator::Step SessionOrchestrator::derive_and_confirm(Attempt& attempt) {
    advance(SessionPhase::KEY_DERIVATION);

    // Authenticated secret binds the transcript and both signatures to the PSK
    auto auth_secret = crypto::hmac_sha256_parts(
        config_.psk, {attempt.transcript_hash, attempt.signature_initiator, attempt.signature_responder});

    attempt.candidate = deriver_.derive(attempt.sifted->bits.span(), attempt.classical, auth_secret);
    crypto::secure_zero(auth_secret.data(), auth_secret.size());
    if (!attempt.candidate) {
        fail(deriver_.last_error());
        return Step::FAILED;
    }

    const auto& key = attempt.candidate->material();
    uint32_t generation = keys_.next_generation();

    packet::KeyConfirm mine;
    mine.generation = generation;
    mine.mac = confirm_mac(key, role_, generation);
    Step step = send_handshake(attempt, mine, false);
    if (step != Step::OK) {
        return step;
    }

    auto peer = expect<packet::KeyConfirm>(attempt, packet::MessageType::KEY_CONFIRM, step, false);
    if (!peer) {
        return step;
    }

    auto expected = confirm_mac(key, peer_of(role_), generation);
    if (peer->generation != generation || !crypto::constant_time_compare(expected, peer->mac)) {
        return retry(ErrorCode::KEY_CONFIRMATION_FAILED);
    }

    bool had_key = keys_.has_active_key();
    uint32_t previous = keys_.current_generation();

    auto activated = keys_.activate(std::move(*attempt.candidate));
    attempt.candidate.reset();
    if (!activated) {
        fail(ErrorCode::INTERNAL_ERROR);
        return Step::FAILED;
    }

    // The peer confirmed, so nothing more arrives under the old generation
    if (had_key) {
        keys_.erase(previous);
        channel_.forget_generation(previous);
    }

    rotate_requested_ = false;
    last_error_ = ErrorCode::NONE;
    spdlog::info("[{}] Session key generation {} active", role_to_string(role_), *activated);
    set_phase(SessionPhase::ACTIVE);
    return Step::OK;
}

// ---------------------------------------------------------------------------
// Application traffic
// ---------------------------------------------------------------------------

bool SessionOrchestrator::send(std::span<const uint8_t> plaintext) {
    if (phase_ != SessionPhase::ACTIVE) {
        spdlog::warn("send() in phase {}", phase_to_string(phase_));
        return false;
    }
    if (plaintext.size() > MAX_PLAINTEXT_SIZE) {
        spdlog::warn("Message of {} bytes exceeds the frame limit", plaintext.size());
        return false;
    }
    if (!maybe_rotate()) {
        return false;
    }

    auto frame = channel_.seal(plaintext);
    if (!frame) {
        fail(ErrorCode::KEY_UNAVAILABLE);
        return false;
    }
    if (!send_control(std::move(*frame))) {
        return false;
    }
    ++stats_.frames_sent;
    return true;
}

std::optional<std::vector<uint8_t>> SessionOrchestrator::receive(std::chrono::milliseconds timeout) {
    utils::Deadline deadline(timeout);

    for (;;) {
        if (!inbox_.empty()) {
            auto data = std::move(inbox_.front());
            inbox_.pop_front();
            return data;
        }
        if (phase_ != SessionPhase::ACTIVE) {
            return std::nullopt;
        }

        auto result = stream_.receive(deadline.remaining());
        switch (result.status) {
            case packet::ReceiveStatus::OK:
                break;
            case packet::ReceiveStatus::TIMEOUT:
                return std::nullopt;
            case packet::ReceiveStatus::MALFORMED:
                fail(ErrorCode::PROTOCOL_ERROR);
                return std::nullopt;
            case packet::ReceiveStatus::CLOSED:
            case packet::ReceiveStatus::ERROR:
                fail(ErrorCode::TRANSPORT_ERROR);
                return std::nullopt;
        }

        auto& envelope = *result.envelope;
        auto type = packet::get_message_type(envelope.message);

        switch (type) {
            case packet::MessageType::AEAD_FRAME: {
                std::optional<std::vector<uint8_t>> plaintext;
                if (!handle_frame(std::get<packet::AeadFrame>(envelope.message), &plaintext)) {
                    return std::nullopt;
                }
                // A failed rotation ends the session, but this frame verified
                if (!maybe_rotate()) {
                    spdlog::debug("[{}] Rotation after frame did not complete", role_to_string(role_));
                }
                return plaintext;
            }

            case packet::MessageType::ROTATE_REQUEST:
                if (role_ == Role::INITIATOR) {
                    auto requested = std::get<packet::RotateRequest>(envelope.message).generation;
                    if (requested != keys_.current_generation()) {
                        // Sent before a rotation that already replaced that key
                        spdlog::debug("[{}] Dropping rotation request for generation {} (current {})",
                                      role_to_string(role_), requested, keys_.current_generation());
                        continue;
                    }
                    spdlog::info("[{}] Peer requested key rotation", role_to_string(role_));
                    if (!rotate()) {
                        return std::nullopt;
                    }
                } else {
                    spdlog::debug("[{}] Ignoring rotation request from initiator", role_to_string(role_));
                }
                continue;

            case packet::MessageType::CLOSE:
                handle_close(std::get<packet::Close>(envelope.message));
                continue;

            case packet::MessageType::QUANTUM_STATES:
                if (role_ == Role::RESPONDER && envelope.attempt > attempt_) {
                    set_phase(SessionPhase::ROTATING);
                    rotating_ = true;
                    bool ok = run_handshake(std::move(envelope));
                    rotating_ = false;
                    if (ok) {
                        ++stats_.rotations;
                    }
                    continue;
                }
                break;

            case packet::MessageType::HANDSHAKE_RETRY:
                if (envelope.attempt == attempt_) {
                    // Peer rejected the confirmation we accepted
                    fail(ErrorCode::KEY_CONFIRMATION_FAILED);
                    return std::nullopt;
                }
                break;

            default:
                break;
        }

        if (is_handshake_type(type) && envelope.attempt < attempt_) {
            spdlog::debug("[{}] Discarding stale handshake message type 0x{:02x}",
                          role_to_string(role_), static_cast<uint8_t>(type));
            continue;
        }

        spdlog::warn("[{}] Unexpected message type 0x{:02x} in phase {}",
                     role_to_string(role_), static_cast<uint8_t>(type), phase_to_string(phase_));
        fail(ErrorCode::PROTOCOL_ERROR);
        return std::nullopt;
    }
}

bool SessionOrchestrator::rotate() {
    if (phase_ != SessionPhase::ACTIVE) {
        return false;
    }

    if (role_ == Role::RESPONDER) {
        spdlog::info("[{}] Requesting key rotation", role_to_string(role_));
        rotate_requested_ = true;
        return send_control(packet::RotateRequest{keys_.current_generation()});
    }

    set_phase(SessionPhase::ROTATING);
    rotating_ = true;
    bool ok = run_handshake(std::nullopt);
    rotating_ = false;
    if (ok) {
        ++stats_.rotations;
    }
    return ok;
}

bool SessionOrchestrator::maybe_rotate() {
    if (phase_ != SessionPhase::ACTIVE || !keys_.rotate_due()) {
        return phase_ == SessionPhase::ACTIVE;
    }
    if (role_ == Role::INITIATOR) {
        return rotate();
    }
    if (rotate_requested_) {
        return true;
    }
    return rotate();
}

bool SessionOrchestrator::handle_frame(const packet::AeadFrame& frame,
                                       std::optional<std::vector<uint8_t>>* out) {
    auto result = channel_.open(frame);
    if (!result.ok()) {
        spdlog::warn("[{}] Rejected frame (generation {}, sequence {}): {}", role_to_string(role_),
                     frame.generation, frame.sequence, error_to_string(result.error));
        fail(result.error);
        return false;
    }

    ++stats_.frames_received;
    stats_.frames_missing += result.gap;
    if (out != nullptr) {
        *out = std::move(result.plaintext);
    } else {
        inbox_.push_back(std::move(*result.plaintext));
    }
    return true;
}

void SessionOrchestrator::handle_close(const packet::Close& message) {
    if (is_terminal()) {
        return;
    }
    wipe_keys();
    if (message.reason == ErrorCode::NONE) {
        spdlog::info("[{}] Peer closed the session", role_to_string(role_));
        set_phase(SessionPhase::CLOSED);
        return;
    }
    spdlog::warn("[{}] Peer aborted the session: {}", role_to_string(role_), error_to_string(message.reason));
    last_error_ = message.reason;
    set_phase(SessionPhase::ABORTED);
}

bool SessionOrchestrator::send_control(packet::Message message) {
    if (!stream_.send(packet::Envelope{0, std::move(message)})) {
        fail(ErrorCode::TRANSPORT_ERROR);
        return false;
    }
    return true;
}

void SessionOrchestrator::close() {
    if (is_terminal()) {
        return;
    }
    if (!stream_.send(packet::Envelope{0, packet::Close{ErrorCode::NONE}})) {
        spdlog::debug("[{}] Close not delivered", role_to_string(role_));
    }
    wipe_keys();
    set_phase(SessionPhase::CLOSED);
}

void SessionOrchestrator::fail(ErrorCode code) {
    if (is_terminal()) {
        return;
    }
    last_error_ = code;
    spdlog::error("[{}] Session aborted in phase {}: {}",
                  role_to_string(role_), phase_to_string(phase_), error_to_string(code));

    // Let the peer stop waiting, unless the stream itself is gone
    if (code != ErrorCode::TRANSPORT_ERROR &&
        !stream_.send(packet::Envelope{0, packet::Close{code}})) {
        spdlog::debug("[{}] Abort notice not delivered", role_to_string(role_));
    }

    wipe_keys();
    set_phase(SessionPhase::ABORTED);
}

void SessionOrchestrator::wipe_keys() {
    keys_.erase_all();
    channel_.reset();
}

}  // namespace qline::session

#include "qline/channel/authenticated_channel.hpp"

#include "qline/crypto/chacha20poly1305.hpp"
#include "qline/crypto/hkdf.hpp"

#include <spdlog/spdlog.h>

namespace qline::channel {

namespace {

constexpr std::string_view AEAD_LABEL = "qline-aead-v1";
constexpr uint32_t RESPONDER_BIT = 0x80000000U;

uint8_t direction_byte(Role sender) {
    return sender == Role::INITIATOR ? 0x00 : 0x01;
}

}  // namespace

crypto::Nonce make_nonce(uint32_t generation, Role sender, uint64_t sequence) {
    uint32_t tagged = generation | (sender == Role::RESPONDER ? RESPONDER_BIT : 0U);
    crypto::Nonce nonce{};
    for (int i = 0; i < 4; ++i) {
        nonce[i] = static_cast<uint8_t>(tagged >> (24 - 8 * i));
    }
    for (int i = 0; i < 8; ++i) {
        nonce[4 + i] = static_cast<uint8_t>(sequence >> (56 - 8 * i));
    }
    return nonce;
}

std::vector<uint8_t> make_associated_data(uint32_t generation, Role sender, uint64_t sequence) {
    auto label = crypto::as_bytes(AEAD_LABEL);
    std::vector<uint8_t> ad(label.begin(), label.end());
    ad.push_back(direction_byte(sender));
    for (int i = 3; i >= 0; --i) {
        ad.push_back(static_cast<uint8_t>(generation >> (i * 8)));
    }
    for (int i = 7; i >= 0; --i) {
        ad.push_back(static_cast<uint8_t>(sequence >> (i * 8)));
    }
    return ad;
}

packet::AeadFrame seal_frame(const crypto::SymmetricKey& key,
                             uint32_t generation,
                             Role sender,
                             uint64_t sequence,
                             std::span<const uint8_t> plaintext) {
    packet::AeadFrame frame;
    frame.generation = generation;
    frame.sequence = sequence;
    frame.nonce = make_nonce(generation, sender, sequence);
    auto ad = make_associated_data(generation, sender, sequence);
    frame.ciphertext = crypto::encrypt_detached(key, frame.nonce, plaintext, frame.tag, ad);
    return frame;
}

std::optional<std::vector<uint8_t>> open_frame(const crypto::SymmetricKey& key,
                                               const packet::AeadFrame& frame,
                                               Role sender) {
    auto expected = make_nonce(frame.generation, sender, frame.sequence);
    if (!crypto::constant_time_compare(expected, frame.nonce)) {
        return std::nullopt;
    }
    auto ad = make_associated_data(frame.generation, sender, frame.sequence);
    return crypto::decrypt_detached(key, frame.nonce, frame.ciphertext, frame.tag, ad);
}

AuthenticatedChannel::AuthenticatedChannel(Role local_role, session::SessionKeyManager& keys)
    : role_(local_role), keys_(keys) {}

std::optional<packet::AeadFrame> AuthenticatedChannel::seal(std::span<const uint8_t> plaintext) {
    std::optional<packet::AeadFrame> frame;

    keys_.with_active_key([&](const session::HybridSessionKey& key) {
        uint64_t sequence = 0;
        {
            std::lock_guard lock(mutex_);
            sequence = generations_[key.generation()].next_send_seq++;
            ++frames_sealed_;
        }
        frame = seal_frame(key.material(), key.generation(), role_, sequence, plaintext);
    });

    if (frame) {
        keys_.record_encrypted(plaintext.size());
    }
    return frame;
}

OpenResult AuthenticatedChannel::open(const packet::AeadFrame& frame) {
    OpenResult result;
    Role sender = peer_of(role_);

    // Replay check before spending time on decryption
    {
        std::lock_guard lock(mutex_);
        auto it = generations_.find(frame.generation);
        if (it != generations_.end() && !it->second.recv_window.check(frame.sequence)) {
            result.error = ErrorCode::REPLAY_DETECTED;
            return result;
        }
    }

    std::optional<std::vector<uint8_t>> plaintext;
    bool have_key = keys_.with_key(frame.generation, [&](const session::HybridSessionKey& key) {
        plaintext = open_frame(key.material(), frame, sender);
    });

    if (!have_key) {
        result.error = ErrorCode::KEY_UNAVAILABLE;
        return result;
    }
    if (!plaintext) {
        result.error = ErrorCode::TAG_MISMATCH;
        return result;
    }

    // Commit only after the tag verified; recheck for a concurrent duplicate
    {
        std::lock_guard lock(mutex_);
        auto& window = generations_[frame.generation].recv_window;
        if (!window.check(frame.sequence)) {
            crypto::secure_zero(plaintext->data(), plaintext->size());
            result.error = ErrorCode::REPLAY_DETECTED;
            return result;
        }
        result.gap = window.update(frame.sequence);
        ++frames_opened_;
    }

    if (result.gap > 0) {
        spdlog::debug("Generation {}: {} frame(s) missing before sequence {}",
                      frame.generation, result.gap, frame.sequence);
    }
    result.plaintext = std::move(plaintext);
    return result;
}

void AuthenticatedChannel::forget_generation(uint32_t generation) {
    std::lock_guard lock(mutex_);
    generations_.erase(generation);
}

void AuthenticatedChannel::reset() {
    std::lock_guard lock(mutex_);
    generations_.clear();
}

uint64_t AuthenticatedChannel::frames_sealed() const {
    std::lock_guard lock(mutex_);
    return frames_sealed_;
}

uint64_t AuthenticatedChannel::frames_opened() const {
    std::lock_guard lock(mutex_);
    return frames_opened_;
}

}  // namespace qline::channel

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "qline/channel/replay_window.hpp"
#include "qline/common/error.hpp"
#include "qline/common/role.hpp"
#include "qline/crypto/crypto.hpp"
#include "qline/packet/wire.hpp"
#include "qline/session/session_key_manager.hpp"

namespace qline::channel {

// Nonce = generation (top bit set when the sender is the responder) || sequence
crypto::Nonce make_nonce(uint32_t generation, Role sender, uint64_t sequence);

// AD = "qline-aead-v1" || direction || generation || sequence
std::vector<uint8_t> make_associated_data(uint32_t generation, Role sender, uint64_t sequence);

// Encrypt one frame under key
packet::AeadFrame seal_frame(const crypto::SymmetricKey& key,
                             uint32_t generation,
                             Role sender,
                             uint64_t sequence,
                             std::span<const uint8_t> plaintext);

// Decrypt a frame that claims to come from sender. nullopt if the nonce does
// not match (generation, sequence, sender) or the tag does not verify.
std::optional<std::vector<uint8_t>> open_frame(const crypto::SymmetricKey& key,
                                               const packet::AeadFrame& frame,
                                               Role sender);

struct OpenResult {
    std::optional<std::vector<uint8_t>> plaintext;
    ErrorCode error{ErrorCode::NONE};
    uint64_t gap{0};  // Frames skipped before this one (loss, not an error)

    [[nodiscard]] bool ok() const { return plaintext.has_value(); }
};

// Confidentiality and integrity for application data under the keys held by
// a SessionKeyManager. seal() and open() may run concurrently.
class AuthenticatedChannel {
public:
    AuthenticatedChannel(Role local_role, session::SessionKeyManager& keys);

    AuthenticatedChannel(const AuthenticatedChannel&) = delete;
    AuthenticatedChannel& operator=(const AuthenticatedChannel&) = delete;

    // Seal under the active generation; nullopt (KEY_UNAVAILABLE) if none
    std::optional<packet::AeadFrame> seal(std::span<const uint8_t> plaintext);

    OpenResult open(const packet::AeadFrame& frame);

    // Drop sequence and replay state for an erased generation
    void forget_generation(uint32_t generation);

    // Drop all sequence and replay state
    void reset();

    [[nodiscard]] Role role() const { return role_; }
    [[nodiscard]] uint64_t frames_sealed() const;
    [[nodiscard]] uint64_t frames_opened() const;

private:
    struct GenerationState {
        uint64_t next_send_seq{0};
        ReplayWindow recv_window;
    };

    Role role_;
    session::SessionKeyManager& keys_;
    mutable std::mutex mutex_;
    std::map<uint32_t, GenerationState> generations_;
    uint64_t frames_sealed_{0};
    uint64_t frames_opened_{0};
};

}  // namespace qline::channel

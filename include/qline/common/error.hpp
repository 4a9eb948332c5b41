#pragma once

#include <cstdint>

namespace qline {

// Failure taxonomy shared by every component
enum class ErrorCode : uint8_t {
    NONE,
    INVALID_PARAMETER,          // Malformed argument or configuration
    LENGTH_MISMATCH,            // Paired sequences of different length
    INSUFFICIENT_KEY_MATERIAL,  // Sifted key below the usable minimum
    INSUFFICIENT_ENTROPY,       // Derivation inputs too short
    EAVESDROPPING_SUSPECTED,    // QBER above threshold
    AUTHENTICATION_FAILURE,     // Peer signature or identity rejected
    TAG_MISMATCH,               // AEAD tag or nonce did not verify
    REPLAY_DETECTED,            // Sequence number already accepted
    KEY_UNAVAILABLE,            // Generation unknown or erased
    KEY_CONFIRMATION_FAILED,    // Both sides derived different keys
    PROTOCOL_ERROR,             // Unexpected or malformed message
    TRANSPORT_ERROR,            // Byte stream failed or closed
    TIMEOUT,                    // Handshake read deadline expired
    INTERNAL_ERROR
};

// Human-readable name for logs
const char* error_to_string(ErrorCode code);

// Errors that allow a fresh handshake attempt with new random material
bool is_recoverable(ErrorCode code);

// TAG_MISMATCH and REPLAY_DETECTED are per-frame authentication failures
bool is_authentication_failure(ErrorCode code);

}  // namespace qline

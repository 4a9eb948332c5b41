#include "qline/common/error.hpp"

namespace qline {

const char* error_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::INVALID_PARAMETER: return "invalid parameter";
        case ErrorCode::LENGTH_MISMATCH: return "length mismatch";
        case ErrorCode::INSUFFICIENT_KEY_MATERIAL: return "insufficient key material";
        case ErrorCode::INSUFFICIENT_ENTROPY: return "insufficient entropy";
        case ErrorCode::EAVESDROPPING_SUSPECTED: return "eavesdropping suspected";
        case ErrorCode::AUTHENTICATION_FAILURE: return "authentication failure";
        case ErrorCode::TAG_MISMATCH: return "tag mismatch";
        case ErrorCode::REPLAY_DETECTED: return "replay detected";
        case ErrorCode::KEY_UNAVAILABLE: return "key unavailable";
        case ErrorCode::KEY_CONFIRMATION_FAILED: return "key confirmation failed";
        case ErrorCode::PROTOCOL_ERROR: return "protocol error";
        case ErrorCode::TRANSPORT_ERROR: return "transport error";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::INTERNAL_ERROR: return "internal error";
    }
    return "unknown";
}

bool is_recoverable(ErrorCode code) {
    return code == ErrorCode::LENGTH_MISMATCH ||
           code == ErrorCode::INSUFFICIENT_KEY_MATERIAL ||
           code == ErrorCode::KEY_CONFIRMATION_FAILED;
}

bool is_authentication_failure(ErrorCode code) {
    return code == ErrorCode::AUTHENTICATION_FAILURE ||
           code == ErrorCode::TAG_MISMATCH ||
           code == ErrorCode::REPLAY_DETECTED;
}

}  // namespace qline

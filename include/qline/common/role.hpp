#pragma once

#include <cstdint>

namespace qline {

// Endpoint role. The initiator sends the quantum states and is the
// reference side during reconciliation.
enum class Role : uint8_t {
    INITIATOR = 0,
    RESPONDER = 1
};

inline Role peer_of(Role role) {
    return role == Role::INITIATOR ? Role::RESPONDER : Role::INITIATOR;
}

inline const char* role_to_string(Role role) {
    return role == Role::INITIATOR ? "initiator" : "responder";
}

}  // namespace qline

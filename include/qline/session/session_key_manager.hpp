#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>

#include "qline/session/hybrid_key_deriver.hpp"

namespace qline::session {

// Key rotation policy; a zero value disables that trigger
struct RotationPolicy {
    std::chrono::milliseconds interval{std::chrono::hours(1)};
    uint64_t byte_limit = 1ULL << 30;  // 1 GiB under one key
};

// Owns session keys from activation to erasure.
// Readers (seal/open) hold a shared lock only while they use a key;
// activate and erase take the exclusive lock, so erasure waits for every
// in-flight user of the generation being removed.
class SessionKeyManager {
public:
    using Generation = uint32_t;

    // Generations stay below 2^31 so the AEAD nonce can carry a direction bit
    static constexpr Generation MAX_GENERATION = 0x7FFFFFFF;

    explicit SessionKeyManager(const RotationPolicy& policy = {});
    ~SessionKeyManager();

    SessionKeyManager(const SessionKeyManager&) = delete;
    SessionKeyManager& operator=(const SessionKeyManager&) = delete;

    // Install key as generation N+1 and retire generation N (kept live for
    // in-flight frames). An older retired generation is erased.
    // Returns the new generation, nullopt if the generation space is spent.
    std::optional<Generation> activate(HybridSessionKey key);

    // True once elapsed >= interval or bytes_encrypted >= byte_limit
    [[nodiscard]] bool rotate_due(std::chrono::milliseconds elapsed, uint64_t bytes_encrypted) const;

    // rotate_due() for the active key using the manager's clock and counter
    [[nodiscard]] bool rotate_due() const;

    // Zero the key of a generation and mark it unusable. A zeroed tombstone
    // is kept so the erasure can be checked. Returns false if the generation
    // is unknown or already erased.
    bool erase(Generation generation);

    // Erase every live generation
    void erase_all();

    // Account plaintext bytes sealed under the active key
    void record_encrypted(size_t bytes);

    [[nodiscard]] bool has_active_key() const;
    [[nodiscard]] Generation current_generation() const;
    [[nodiscard]] std::optional<Generation> previous_generation() const;
    // Generation the next activate() will assign
    [[nodiscard]] Generation next_generation() const;
    [[nodiscard]] bool is_live(Generation generation) const;
    [[nodiscard]] bool storage_is_zeroed(Generation generation) const;
    [[nodiscard]] uint64_t bytes_encrypted() const { return bytes_encrypted_.load(); }
    [[nodiscard]] const RotationPolicy& policy() const { return policy_; }

    // Run fn(const HybridSessionKey&) under a shared lock.
    // Returns false without calling fn if no usable key exists.
    template <typename Fn>
    bool with_active_key(Fn&& fn) const {
        std::shared_lock lock(mutex_);
        if (!active_) {
            return false;
        }
        auto it = keys_.find(*active_);
        if (it == keys_.end() || it->second.is_erased()) {
            return false;
        }
        fn(it->second);
        return true;
    }

    template <typename Fn>
    bool with_key(Generation generation, Fn&& fn) const {
        std::shared_lock lock(mutex_);
        auto it = keys_.find(generation);
        if (it == keys_.end() || it->second.is_erased()) {
            return false;
        }
        fn(it->second);
        return true;
    }

    // Update current time in milliseconds (for testing)
    void set_current_time(uint64_t time_ms);

private:
    static constexpr size_t MAX_TOMBSTONES = 8;

    RotationPolicy policy_;
    mutable std::shared_mutex mutex_;
    std::map<Generation, HybridSessionKey> keys_;
    std::optional<Generation> active_;
    std::optional<Generation> previous_;
    Generation last_generation_{0};
    uint64_t activated_at_ms_{0};
    std::atomic<uint64_t> bytes_encrypted_{0};
    std::atomic<uint64_t> current_time_{0};

    uint64_t now_ms() const;
    bool erase_locked(Generation generation);
    void prune_tombstones_locked();
};

}  // namespace qline::session

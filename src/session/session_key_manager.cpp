#include "qline/session/session_key_manager.hpp"

#include <spdlog/spdlog.h>

#include "qline/utils/time.hpp"

namespace qline::session {

SessionKeyManager::SessionKeyManager(const RotationPolicy& policy)
    : policy_(policy) {}

SessionKeyManager::~SessionKeyManager() {
    erase_all();
}

uint64_t SessionKeyManager::now_ms() const {
    uint64_t override_time = current_time_.load();
    if (override_time != 0) {
        return override_time;
    }
    return utils::time_ms();
}

void SessionKeyManager::set_current_time(uint64_t time_ms) {
    current_time_.store(time_ms);
}

std::optional<SessionKeyManager::Generation> SessionKeyManager::activate(HybridSessionKey key) {
    std::unique_lock lock(mutex_);

    if (last_generation_ >= MAX_GENERATION) {
        spdlog::error("Key generation space exhausted");
        key.erase();
        return std::nullopt;
    }

    Generation generation = ++last_generation_;
    key.generation_ = generation;

    // Only one retired generation is kept for draining
    if (previous_ && keys_.count(*previous_) && !keys_.at(*previous_).is_erased()) {
        spdlog::warn("Generation {} still live at activation of {}, erasing", *previous_, generation);
        erase_locked(*previous_);
    }

    previous_ = active_;
    active_ = generation;
    keys_.emplace(generation, std::move(key));
    activated_at_ms_ = now_ms();
    bytes_encrypted_.store(0);

    spdlog::debug("Activated key generation {}", generation);
    return generation;
}

bool SessionKeyManager::rotate_due(std::chrono::milliseconds elapsed, uint64_t bytes_encrypted) const {
    if (policy_.interval.count() > 0 && elapsed >= policy_.interval) {
        return true;
    }
    if (policy_.byte_limit > 0 && bytes_encrypted >= policy_.byte_limit) {
        return true;
    }
    return false;
}

bool SessionKeyManager::rotate_due() const {
    uint64_t activated_at = 0;
    {
        std::shared_lock lock(mutex_);
        if (!active_) {
            return false;
        }
        activated_at = activated_at_ms_;
    }
    uint64_t now = now_ms();
    auto elapsed = std::chrono::milliseconds(now > activated_at ? now - activated_at : 0);
    return rotate_due(elapsed, bytes_encrypted_.load());
}

bool SessionKeyManager::erase(Generation generation) {
    std::unique_lock lock(mutex_);
    return erase_locked(generation);
}

bool SessionKeyManager::erase_locked(Generation generation) {
    auto it = keys_.find(generation);
    if (it == keys_.end() || it->second.is_erased()) {
        return false;
    }

    it->second.erase();
    if (active_ == generation) {
        active_.reset();
    }
    if (previous_ == generation) {
        previous_.reset();
    }

    spdlog::debug("Erased key generation {}", generation);
    prune_tombstones_locked();
    return true;
}

void SessionKeyManager::prune_tombstones_locked() {
    size_t tombstones = 0;
    for (const auto& [gen, key] : keys_) {
        if (key.is_erased()) {
            ++tombstones;
        }
    }
    // Oldest generations come first in the map
    for (auto it = keys_.begin(); it != keys_.end() && tombstones > MAX_TOMBSTONES;) {
        if (it->second.is_erased()) {
            it = keys_.erase(it);
            --tombstones;
        } else {
            ++it;
        }
    }
}

void SessionKeyManager::erase_all() {
    std::unique_lock lock(mutex_);
    for (auto& [gen, key] : keys_) {
        if (!key.is_erased()) {
            key.erase();
            spdlog::debug("Erased key generation {}", gen);
        }
    }
    active_.reset();
    previous_.reset();
    prune_tombstones_locked();
}

void SessionKeyManager::record_encrypted(size_t bytes) {
    bytes_encrypted_.fetch_add(bytes);
}

bool SessionKeyManager::has_active_key() const {
    std::shared_lock lock(mutex_);
    return active_.has_value();
}

SessionKeyManager::Generation SessionKeyManager::current_generation() const {
    std::shared_lock lock(mutex_);
    return active_.value_or(0);
}

std::optional<SessionKeyManager::Generation> SessionKeyManager::previous_generation() const {
    std::shared_lock lock(mutex_);
    return previous_;
}

SessionKeyManager::Generation SessionKeyManager::next_generation() const {
    std::shared_lock lock(mutex_);
    return last_generation_ + 1;
}

bool SessionKeyManager::is_live(Generation generation) const {
    std::shared_lock lock(mutex_);
    auto it = keys_.find(generation);
    return it != keys_.end() && !it->second.is_erased();
}

bool SessionKeyManager::storage_is_zeroed(Generation generation) const {
    std::shared_lock lock(mutex_);
    auto it = keys_.find(generation);
    return it != keys_.end() && it->second.storage_is_zeroed();
}

}  // namespace qline::session

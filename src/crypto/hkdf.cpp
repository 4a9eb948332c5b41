#include "qline/crypto/hkdf.hpp"

#include <sodium.h>

#include <algorithm>
#include <stdexcept>

namespace qline::crypto {

namespace {

constexpr size_t MAX_EXPAND_BLOCKS = 255;

// Incremental HMAC-SHA256; the state is wiped on scope exit
class HmacSha256 {
public:
    explicit HmacSha256(std::span<const uint8_t> key) {
        crypto_auth_hmacsha256_init(&state_, key.data(), key.size());
    }

    ~HmacSha256() { sodium_memzero(&state_, sizeof(state_)); }

    HmacSha256(const HmacSha256&) = delete;
    HmacSha256& operator=(const HmacSha256&) = delete;

    HmacSha256& update(std::span<const uint8_t> data) {
        if (!data.empty()) {
            crypto_auth_hmacsha256_update(&state_, data.data(), data.size());
        }
        return *this;
    }

    void finish(HmacDigest& out) { crypto_auth_hmacsha256_final(&state_, out.data()); }

private:
    crypto_auth_hmacsha256_state state_;
};

}  // namespace

HmacDigest hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> message) {
    HmacSha256 mac(key);
    HmacDigest digest;
    mac.update(message).finish(digest);
    return digest;
}

HmacDigest hmac_sha256_parts(std::span<const uint8_t> key,
                             std::initializer_list<std::span<const uint8_t>> parts) {
    HmacSha256 mac(key);
    for (auto part : parts) {
        mac.update(part);
    }
    HmacDigest digest;
    mac.finish(digest);
    return digest;
}

HmacDigest hkdf_extract(std::span<const uint8_t> salt, std::span<const uint8_t> ikm) {
    const HmacDigest zero_salt{};
    return hmac_sha256(salt.empty() ? std::span<const uint8_t>(zero_salt) : salt, ikm);
}

void hkdf_expand(std::span<const uint8_t> prk,
                 std::span<const uint8_t> info,
                 std::span<uint8_t> output) {
    if (output.size() > MAX_EXPAND_BLOCKS * HMAC_SHA256_SIZE) {
        throw std::invalid_argument("HKDF output longer than 255 blocks");
    }

    // T(i) = HMAC(PRK, T(i-1) || info || i), T(0) empty
    HmacDigest block{};
    std::span<const uint8_t> previous;
    uint8_t counter = 0;

    for (size_t offset = 0; offset < output.size(); offset += block.size()) {
        ++counter;
        HmacSha256 mac(prk);
        mac.update(previous).update(info).update(std::span<const uint8_t>(&counter, 1));
        mac.finish(block);
        previous = block;

        size_t take = std::min(block.size(), output.size() - offset);
        std::copy_n(block.begin(), take, output.subspan(offset).begin());
    }

    sodium_memzero(block.data(), block.size());
}

void hkdf(std::span<const uint8_t> salt,
          std::span<const uint8_t> ikm,
          std::span<const uint8_t> info,
          std::span<uint8_t> output) {
    auto prk = hkdf_extract(salt, ikm);
    hkdf_expand(prk, info, output);
    sodium_memzero(prk.data(), prk.size());
}

SymmetricKey derive_symmetric_key(std::string_view salt_label,
                                  std::span<const uint8_t> ikm,
                                  std::string_view info_label) {
    SymmetricKey key;
    hkdf(as_bytes(salt_label), ikm, as_bytes(info_label), key);
    return key;
}

}  // namespace qline::crypto

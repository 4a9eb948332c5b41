#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace qline::crypto {

// Byte container for key material that is wiped when released.
// Move-only; capacity is reserved up front so growth never leaves stale
// copies behind in freed heap blocks.
class SecureBuffer {
public:
    SecureBuffer() = default;
    explicit SecureBuffer(size_t size);
    explicit SecureBuffer(std::span<const uint8_t> data);
    ~SecureBuffer();

    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    SecureBuffer(SecureBuffer&& other) noexcept;
    SecureBuffer& operator=(SecureBuffer&& other) noexcept;

    // Explicit deep copy
    [[nodiscard]] SecureBuffer clone() const;

    // Reserve capacity before push_back; reserving after data exists wipes
    // the old block
    void reserve(size_t capacity);
    void push_back(uint8_t value);

    // Zero the contents and release the storage
    void wipe();

    [[nodiscard]] size_t size() const { return data_.size(); }
    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] uint8_t* data() { return data_.data(); }
    [[nodiscard]] const uint8_t* data() const { return data_.data(); }

    uint8_t& operator[](size_t i) { return data_[i]; }
    const uint8_t& operator[](size_t i) const { return data_[i]; }

    [[nodiscard]] std::span<uint8_t> span() { return data_; }
    [[nodiscard]] std::span<const uint8_t> span() const { return data_; }

private:
    std::vector<uint8_t> data_;
};

}  // namespace qline::crypto

#include "qline/crypto/secure_buffer.hpp"

#include <algorithm>

#include "qline/crypto/crypto.hpp"

namespace qline::crypto {

SecureBuffer::SecureBuffer(size_t size) : data_(size, 0) {}

SecureBuffer::SecureBuffer(std::span<const uint8_t> data)
    : data_(data.begin(), data.end()) {}

SecureBuffer::~SecureBuffer() {
    wipe();
}

SecureBuffer::SecureBuffer(SecureBuffer&& other) noexcept
    : data_(std::move(other.data_)) {
    other.data_.clear();
}

SecureBuffer& SecureBuffer::operator=(SecureBuffer&& other) noexcept {
    if (this != &other) {
        wipe();
        data_ = std::move(other.data_);
        other.data_.clear();
    }
    return *this;
}

SecureBuffer SecureBuffer::clone() const {
    return SecureBuffer(span());
}

void SecureBuffer::reserve(size_t capacity) {
    if (capacity <= data_.capacity()) {
        return;
    }
    std::vector<uint8_t> grown;
    grown.reserve(capacity);
    grown.assign(data_.begin(), data_.end());
    wipe();
    data_ = std::move(grown);
}

void SecureBuffer::push_back(uint8_t value) {
    if (data_.size() == data_.capacity()) {
        reserve(std::max<size_t>(16, data_.capacity() * 2));
    }
    data_.push_back(value);
}

void SecureBuffer::wipe() {
    if (data_.capacity() > 0) {
        // Zero the whole allocation, not just the live prefix
        data_.resize(data_.capacity());
        secure_zero(data_.data(), data_.size());
    }
    data_.clear();
    data_.shrink_to_fit();
}

}  // namespace qline::crypto

#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include <sodium.h>

namespace betme {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

// Byte buffer for key material; wiped on destruction and when moved from.
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(std::size_t count) : bytes_(count) {}
    explicit SecretBytes(std::vector<unsigned char>&& bytes) : bytes_(std::move(bytes)) {}

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    SecretBytes& operator=(SecretBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    ~SecretBytes() { wipe(); }

    std::size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    unsigned char* data() { return bytes_.data(); }
    const unsigned char* data() const { return bytes_.data(); }

private:
    void wipe() {
        if (!bytes_.empty()) {
            secureZero(bytes_.data(), bytes_.size());
        }
    }

    std::vector<unsigned char> bytes_;
};

} // namespace betme

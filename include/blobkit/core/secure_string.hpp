#pragma once

#include <openssl/crypto.h>

#include <string>
#include <utility>

namespace blobkit {

// Credential holder that wipes its bytes with OPENSSL_cleanse before the
// buffer is released or overwritten.
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string value) : value_(std::move(value)) {}

    SecureString(const SecureString& other) : value_(other.value_) {}
    SecureString(SecureString&& other) noexcept : value_(std::move(other.value_)) { other.wipe(); }

    SecureString& operator=(SecureString other) noexcept {
        wipe();
        value_.swap(other.value_);
        return *this;
    }

    SecureString& operator=(const std::string& value) {
        return *this = SecureString(value);
    }

    ~SecureString() { wipe(); }

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }

private:
    // Covers the whole capacity: a moved-from short string keeps its bytes
    // in the inline buffer with size 0
    void wipe() noexcept {
        value_.resize(value_.capacity());
        OPENSSL_cleanse(value_.data(), value_.size());
        value_.clear();
    }

    std::string value_;
};

} // namespace blobkit

#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include <sodium.h>

namespace pf {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

inline void secureZero(std::string& text) {
    if (!text.empty()) {
        secureZero(&text[0], text.size());
    }
    text.clear();
}

// Move-only holder for an operator secret. The bytes are wiped when the holder is
// destroyed or overwritten; the source string handed to the constructor is wiped too.
class SecretText {
public:
    SecretText() = default;
    explicit SecretText(std::string& source) : text_(source) {
        secureZero(source);
    }

    SecretText(const SecretText&) = delete;
    SecretText& operator=(const SecretText&) = delete;

    SecretText(SecretText&& other) noexcept : text_(std::move(other.text_)) {
        secureZero(other.text_);
    }

    SecretText& operator=(SecretText&& other) noexcept {
        if (this != &other) {
            secureZero(text_);
            text_ = std::move(other.text_);
            secureZero(other.text_);
        }
        return *this;
    }

    ~SecretText() {
        secureZero(text_);
    }

    // Copy for the one place that needs the plaintext; the caller wipes it.
    std::string reveal() const { return text_; }
    std::size_t size() const { return text_.size(); }
    bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

} // namespace pf

#include "core/securememory.hpp"
#include <cstring>

namespace securemail::core {

void SecureMemory::wipe(void* ptr, size_t size) {
    if (ptr && size > 0) {
        volatile unsigned char* p = static_cast<unsigned char*>(ptr);
        while (size--) {
            *p++ = 0;
        }
    }
}

SecureMemory::SecureString::SecureString() : size_(0) {}

SecureMemory::SecureString::SecureString(std::string_view str)
    : data_(new char[str.size() + 1]), size_(str.size()) {
    std::memcpy(data_.get(), str.data(), size_);
    data_[size_] = '\0';
}

SecureMemory::SecureString::~SecureString() {
    clear();
}

SecureMemory::SecureString::SecureString(SecureString&& other) noexcept
    : data_(std::move(other.data_)), size_(other.size_) {
    other.size_ = 0;
}

SecureMemory::SecureString& SecureMemory::SecureString::operator=(SecureString&& other) noexcept {
    if (this != &other) {
        clear();
        data_ = std::move(other.data_);
        size_ = other.size_;
        other.size_ = 0;
    }
    return *this;
}

std::string SecureMemory::SecureString::toString() const {
    return data_ ? std::string(data_.get(), size_) : std::string();
}

void SecureMemory::SecureString::clear() {
    if (data_) {
        SecureMemory::wipe(data_.get(), size_ + 1);
    }
    data_.reset();
    size_ = 0;
}

} // namespace securemail::core

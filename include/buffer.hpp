#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string_view>
#include <utility>

namespace pasture {


/// Byte buffer that grows on demand but never beyond max_size().
///
/// Data is appended by reserving writable space with prepare() and then
/// committing what was actually written.
class Buffer
{
public:
    static constexpr std::size_t kDEFAULT_BUFFER_CAPACITY = 1024;

    explicit Buffer(std::size_t capacity = kDEFAULT_BUFFER_CAPACITY, std::size_t max_size = kDEFAULT_BUFFER_CAPACITY)
        : size_(0)
        , capacity_(std::min(capacity, max_size))
        , max_size_(max_size)
    {
        buf_ = static_cast<std::byte*>(std::malloc(capacity_ == 0 ? 1 : capacity_));
        if (buf_ == nullptr)
            throw std::bad_alloc();
    }

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    Buffer(Buffer&& other) noexcept
        : buf_(std::exchange(other.buf_, nullptr))
        , size_(std::exchange(other.size_, 0))
        , capacity_(std::exchange(other.capacity_, 0))
        , max_size_(std::exchange(other.max_size_, 0))
    {}

    Buffer& operator=(Buffer&& other) noexcept
    {
        if (this == &other) return *this;
        swap(*this, other);
        return *this;
    }

    friend void swap(Buffer&, Buffer&) noexcept;

    ~Buffer() {
        std::free(buf_); // its safe to free nullptr
    }

    std::size_t size() const noexcept { return size_; }
    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t max_size() const noexcept { return max_size_; }
    bool full() const noexcept { return size_ == max_size_; }

    void clear() noexcept { size_ = 0; }

    const unsigned char* data() const noexcept { return reinterpret_cast<const unsigned char*>(buf_); }

    /// Make room for up to `want` more bytes, growing geometrically but
    /// capped at max_size(). Returns the writable tail; its length is
    /// writable_size() and may be less than `want` (zero when full).
    unsigned char* prepare(std::size_t want) {
        auto needed = std::min(size_ + want, max_size_);
        if (needed > capacity_) {
            auto new_capacity = std::min(std::max(capacity_ * 2, needed), max_size_);
            auto p = static_cast<std::byte*>(std::realloc(buf_, new_capacity));
            if (p == nullptr)
                throw std::bad_alloc();
            buf_ = p;
            capacity_ = new_capacity;
        }
        return reinterpret_cast<unsigned char*>(buf_) + size_;
    }

    std::size_t writable_size() const noexcept { return capacity_ - size_; }

    void commit(std::size_t written) noexcept {
        size_ = std::min(size_ + written, capacity_);
    }

    void append(std::string_view bytes) {
        auto dst = prepare(bytes.size());
        auto n = std::min(bytes.size(), writable_size());
        std::memcpy(dst, bytes.data(), n);
        commit(n);
    }

    std::string_view to_string() const noexcept {
        return {reinterpret_cast<const char*>(buf_), size_};
    }

private:
    std::byte* buf_;
    std::size_t size_;
    std::size_t capacity_;
    std::size_t max_size_;
};

inline void swap(Buffer& a, Buffer& b) noexcept {
    using std::swap;
    swap(a.buf_, b.buf_);
    swap(a.size_, b.size_);
    swap(a.capacity_, b.capacity_);
    swap(a.max_size_, b.max_size_);
}

} // namespace pasture

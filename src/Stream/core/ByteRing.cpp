#include "Stream/core/ByteRing.hpp"
#include <algorithm>
#include <cstring>
#include <new>

namespace VPB {
namespace Stream {

std::expected<std::unique_ptr<ByteRing>, BridgeError> ByteRing::create(size_t capacity) {
    if (capacity == 0) {
        return std::unexpected(BridgeError::BadArgument);
    }
    std::unique_ptr<ByteRing> ring(new (std::nothrow) ByteRing(capacity));
    if (!ring || ring->capacity() == 0) {
        return std::unexpected(BridgeError::NoMemory);
    }
    return ring;
}

ByteRing::ByteRing(size_t capacity)
    : buf_(new (std::nothrow) uint8_t[capacity]()) {
    if (buf_) {
        capacity_ = capacity;
    }
}

size_t ByteRing::availableToRead() const noexcept {
    const size_t r = readCursor_.load(std::memory_order_acquire);
    const size_t w = writeCursor_.load(std::memory_order_acquire);
    const size_t used = w - r;
    return used > capacity_ ? capacity_ : used;
}

size_t ByteRing::availableToWrite() const noexcept {
    return capacity_ - availableToRead();
}

size_t ByteRing::write(const void* src, size_t len) noexcept {
    if (!src || len == 0 || capacity_ == 0) {
        return 0;
    }

    const uint8_t* s = static_cast<const uint8_t*>(src);
    size_t n = len;
    if (n > capacity_) {
        // Only the newest `capacity_` bytes can survive this write
        droppedBytes_.fetch_add(n - capacity_, std::memory_order_relaxed);
        s += n - capacity_;
        n = capacity_;
    }

    const size_t w = writeCursor_.load(std::memory_order_relaxed);
    size_t r = readCursor_.load(std::memory_order_acquire);
    while (w - r + n > capacity_) {
        const size_t target = w + n - capacity_;
        if (readCursor_.compare_exchange_weak(r, target,
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire)) {
            droppedBytes_.fetch_add(target - r, std::memory_order_relaxed);
            break;
        }
    }

    copyIn(w, s, n);
    writeCursor_.store(w + n, std::memory_order_release);
    return len;
}

size_t ByteRing::read(void* dst, size_t maxLen) noexcept {
    if (!dst || maxLen == 0) {
        return 0;
    }

    uint8_t* d = static_cast<uint8_t*>(dst);
    size_t r = readCursor_.load(std::memory_order_acquire);
    for (;;) {
        const size_t w = writeCursor_.load(std::memory_order_acquire);
        const size_t avail = w - r;
        if (avail > capacity_) {
            // Stale read cursor: the producer dropped bytes after we loaded it
            r = readCursor_.load(std::memory_order_acquire);
            continue;
        }
        const size_t n = std::min(avail, maxLen);
        if (n == 0) {
            return 0;
        }
        copyOut(r, d, n);
        if (readCursor_.compare_exchange_strong(r, r + n,
                                                std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
            return n;
        }
        // Drop-oldest or flush moved the cursor underneath us; r now holds the new value
    }
}

void ByteRing::flush() noexcept {
    const size_t w = writeCursor_.load(std::memory_order_acquire);
    size_t r = readCursor_.load(std::memory_order_acquire);
    while (r < w && !readCursor_.compare_exchange_weak(r, w,
                                                       std::memory_order_acq_rel,
                                                       std::memory_order_acquire)) {
    }
}

void ByteRing::copyIn(size_t cursor, const uint8_t* src, size_t len) noexcept {
    const size_t idx = cursor % capacity_;
    const size_t first = std::min(len, capacity_ - idx);
    std::memcpy(buf_.get() + idx, src, first);
    if (len > first) {
        std::memcpy(buf_.get(), src + first, len - first);
    }
}

void ByteRing::copyOut(size_t cursor, uint8_t* dst, size_t len) const noexcept {
    const size_t idx = cursor % capacity_;
    const size_t first = std::min(len, capacity_ - idx);
    std::memcpy(dst, buf_.get() + idx, first);
    if (len > first) {
        std::memcpy(dst + first, buf_.get(), len - first);
    }
}

} // namespace Stream
} // namespace VPB

#include "Stream/core/LegacyBuffers.hpp"
#include <algorithm>
#include <cstring>
#include <new>

namespace VPB {
namespace Stream {

bool LegacyCaptureBuffer::reserve(size_t bytes) {
    const size_t used = size_.load(std::memory_order_acquire);
    const size_t need = used + bytes;
    if (need <= capacity_) {
        return true;
    }
    std::unique_ptr<uint8_t[]> fresh(new (std::nothrow) uint8_t[need]);
    if (!fresh) {
        return false;
    }
    if (used > 0) {
        std::memcpy(fresh.get(), buf_.get(), used);
    }
    buf_ = std::move(fresh);
    capacity_ = need;
    return true;
}

size_t LegacyCaptureBuffer::append(const uint8_t* data, size_t len) noexcept {
    if (!data || len == 0 || !active_.load(std::memory_order_acquire)) {
        return 0;
    }
    const size_t used = size_.load(std::memory_order_relaxed);
    const size_t n = std::min(len, capacity_ - used);
    if (n > 0) {
        std::memcpy(buf_.get() + used, data, n);
        size_.store(used + n, std::memory_order_release);
    }
    if (n < len) {
        droppedBytes_.fetch_add(len - n, std::memory_order_relaxed);
    }
    return n;
}

size_t LegacyCaptureBuffer::copy(void* dst, size_t maxLen) const noexcept {
    if (!dst) {
        return 0;
    }
    const size_t n = std::min(maxLen, size());
    if (n > 0) {
        std::memcpy(dst, buf_.get(), n);
    }
    return n;
}

void LegacyCaptureBuffer::clear() noexcept {
    size_.store(0, std::memory_order_release);
}

void LegacyCaptureBuffer::release() noexcept {
    active_.store(false, std::memory_order_release);
    size_.store(0, std::memory_order_release);
    buf_.reset();
    capacity_ = 0;
}

bool LegacyPlaybackBuffer::load(const void* data, size_t len) {
    std::unique_ptr<uint8_t[]> fresh;
    if (len > 0) {
        fresh.reset(new (std::nothrow) uint8_t[len]);
        if (!fresh) {
            return false;
        }
        std::memcpy(fresh.get(), data, len);
    }
    buf_ = std::move(fresh);
    size_ = len;
    offset_.store(0, std::memory_order_release);
    return true;
}

size_t LegacyPlaybackBuffer::render(uint8_t* out, size_t bytes) noexcept {
    const size_t off = offset_.load(std::memory_order_acquire);
    const size_t remain = off < size_ ? size_ - off : 0;
    const size_t n = std::min(bytes, remain);
    if (n > 0) {
        std::memcpy(out, buf_.get() + off, n);
        offset_.store(off + n, std::memory_order_release);
    }
    if (n < bytes) {
        std::memset(out + n, 0, bytes - n);
    }
    return n;
}

void LegacyPlaybackBuffer::release() noexcept {
    buf_.reset();
    size_ = 0;
    offset_.store(0, std::memory_order_release);
}

} // namespace Stream
} // namespace VPB

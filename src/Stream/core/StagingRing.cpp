#include "Stream/core/StagingRing.hpp"
#include "Stream/core/ByteRing.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <new>

namespace VPB {
namespace Stream {

StagingRing::StagingRing(size_t initialCapacity, std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    if (initialCapacity > 0) {
        buf_.reset(new (std::nothrow) uint8_t[initialCapacity]);
        if (buf_) {
            capacity_.store(initialCapacity, std::memory_order_release);
        } else if (logger_) {
            logger_->error("StagingRing: failed to allocate {} bytes", initialCapacity);
        }
    }
}

bool StagingRing::growLocked(size_t need) {
    const size_t cap = capacity_.load(std::memory_order_relaxed);
    const size_t used = used_.load(std::memory_order_relaxed);

    size_t newCap = cap ? cap * 2 : need;
    if (newCap < need) newCap = need;
    if (newCap < need + need / 2) newCap = need + need / 2;

    std::unique_ptr<uint8_t[]> fresh(new (std::nothrow) uint8_t[newCap]);
    if (!fresh) {
        if (logger_) {
            logger_->error("StagingRing: growth to {} bytes failed", newCap);
        }
        return false;
    }

    copyOutLocked(fresh.get(), used);
    buf_ = std::move(fresh);
    readPos_ = 0;
    writePos_ = used;
    capacity_.store(newCap, std::memory_order_release);
    growthCount_.fetch_add(1, std::memory_order_relaxed);

    if (logger_) {
        logger_->debug("StagingRing: grew {} -> {} bytes ({} pending)", cap, newCap, used);
    }
    return true;
}

// Copies `len` pending bytes starting at readPos_ without consuming them
size_t StagingRing::copyOutLocked(uint8_t* dst, size_t len) {
    const size_t cap = capacity_.load(std::memory_order_relaxed);
    if (len == 0 || cap == 0) {
        return 0;
    }
    const size_t first = std::min(len, cap - readPos_);
    std::memcpy(dst, buf_.get() + readPos_, first);
    if (len > first) {
        std::memcpy(dst + first, buf_.get(), len - first);
    }
    return len;
}

size_t StagingRing::write(const void* data, size_t len) {
    if (!data || len == 0) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const size_t used = used_.load(std::memory_order_relaxed);
    if (capacity_.load(std::memory_order_relaxed) - used < len) {
        if (!growLocked(used + len)) {
            return 0;
        }
    }

    const size_t cap = capacity_.load(std::memory_order_relaxed);
    const auto* src = static_cast<const uint8_t*>(data);
    const size_t first = std::min(len, cap - writePos_);
    std::memcpy(buf_.get() + writePos_, src, first);
    if (len > first) {
        std::memcpy(buf_.get(), src + first, len - first);
    }
    writePos_ = (writePos_ + len) % cap;
    used_.store(used + len, std::memory_order_release);
    return len;
}

size_t StagingRing::read(void* dst, size_t maxLen) {
    if (!dst || maxLen == 0) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const size_t used = used_.load(std::memory_order_relaxed);
    const size_t n = std::min(maxLen, used);
    if (n == 0) {
        return 0;
    }
    copyOutLocked(static_cast<uint8_t*>(dst), n);
    readPos_ = (readPos_ + n) % capacity_.load(std::memory_order_relaxed);
    used_.store(used - n, std::memory_order_release);
    return n;
}

size_t StagingRing::drainInto(ByteRing& dst, size_t maxBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t used = used_.load(std::memory_order_relaxed);
    const size_t n = std::min({maxBytes, used, dst.availableToWrite()});
    if (n == 0) {
        return 0;
    }

    const size_t cap = capacity_.load(std::memory_order_relaxed);
    const size_t first = std::min(n, cap - readPos_);
    dst.write(buf_.get() + readPos_, first);
    if (n > first) {
        dst.write(buf_.get(), n - first);
    }
    readPos_ = (readPos_ + n) % cap;
    used_.store(used - n, std::memory_order_release);
    return n;
}

void StagingRing::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    readPos_ = 0;
    writePos_ = 0;
    used_.store(0, std::memory_order_release);
}

} // namespace Stream
} // namespace VPB

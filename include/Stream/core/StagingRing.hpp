#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace spdlog {
    class logger;
}

namespace VPB {
namespace Stream {

class ByteRing;

/**
 * @class StagingRing
 * @brief Growable circular byte buffer between the application and the pacer.
 *
 * Application writes never drop data: when the buffer is full it doubles
 * (at least to 1.5x the required size) and rebases the pending bytes to the
 * start of the new storage. Every mutation happens under one mutex; the
 * level and capacity can still be sampled without locking.
 */
class StagingRing {
public:
    /**
     * @param initialCapacity Starting capacity in bytes (may be 0, first write allocates)
     * @param logger Logger for growth events
     */
    explicit StagingRing(size_t initialCapacity, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~StagingRing() = default;

    StagingRing(const StagingRing&) = delete;
    StagingRing& operator=(const StagingRing&) = delete;

    /**
     * @brief Append all of data, growing the storage when needed.
     * @return len, or 0 if growth failed (state is unchanged in that case)
     */
    size_t write(const void* data, size_t len);

    /// Drain up to maxLen bytes in FIFO order.
    size_t read(void* dst, size_t maxLen);

    /**
     * @brief Move bytes into a playback ring without ever dropping there.
     *
     * n = min(maxBytes, pending, dst.availableToWrite()). Must be called by the
     * only producer of dst.
     * @return Bytes moved
     */
    size_t drainInto(ByteRing& dst, size_t maxBytes);

    /// Discard all pending bytes. Capacity is kept.
    void flush();

    [[nodiscard]] size_t availableToRead() const noexcept { return used_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_.load(std::memory_order_acquire); }
    [[nodiscard]] uint32_t growthCount() const noexcept { return growthCount_.load(std::memory_order_relaxed); }

private:
    bool growLocked(size_t need);
    size_t copyOutLocked(uint8_t* dst, size_t len);

    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::unique_ptr<uint8_t[]> buf_;
    size_t readPos_{0};
    size_t writePos_{0};
    std::atomic<size_t> capacity_{0};
    std::atomic<size_t> used_{0};
    std::atomic<uint32_t> growthCount_{0};
};

} // namespace Stream
} // namespace VPB

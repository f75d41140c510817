#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace VPB {
namespace Stream {

/**
 * @brief Linear buffer filled by the input callback during a blocking record().
 *
 * Storage is reserved before recording starts; append() only copies into the
 * reservation and counts whatever does not fit as dropped.
 */
class LegacyCaptureBuffer {
public:
    LegacyCaptureBuffer() = default;
    LegacyCaptureBuffer(const LegacyCaptureBuffer&) = delete;
    LegacyCaptureBuffer& operator=(const LegacyCaptureBuffer&) = delete;

    /// Ensure room for `bytes` beyond the current contents. Not real-time safe.
    bool reserve(size_t bytes);

    void begin() noexcept { active_.store(true, std::memory_order_release); }
    void end() noexcept { active_.store(false, std::memory_order_release); }
    bool isActive() const noexcept { return active_.load(std::memory_order_acquire); }

    /// Real-time safe. No-op unless begin() was called.
    size_t append(const uint8_t* data, size_t len) noexcept;

    size_t size() const noexcept { return size_.load(std::memory_order_acquire); }
    size_t capacity() const noexcept { return capacity_; }
    uint64_t droppedBytes() const noexcept { return droppedBytes_.load(std::memory_order_relaxed); }

    size_t copy(void* dst, size_t maxLen) const noexcept;
    void clear() noexcept;
    void release() noexcept;

private:
    std::unique_ptr<uint8_t[]> buf_;
    size_t capacity_{0};
    std::atomic<size_t> size_{0};
    std::atomic<bool> active_{false};
    std::atomic<uint64_t> droppedBytes_{0};
};

/**
 * @brief One-shot buffer consumed by the render callback during play().
 */
class LegacyPlaybackBuffer {
public:
    LegacyPlaybackBuffer() = default;
    LegacyPlaybackBuffer(const LegacyPlaybackBuffer&) = delete;
    LegacyPlaybackBuffer& operator=(const LegacyPlaybackBuffer&) = delete;

    /// Copy `len` bytes in and rewind. Not real-time safe.
    bool load(const void* data, size_t len);

    /**
     * @brief Copy the next chunk into out and zero-fill whatever the buffer cannot supply.
     * @return Bytes copied from the buffer
     */
    size_t render(uint8_t* out, size_t bytes) noexcept;

    bool hasPending() const noexcept { return offset_.load(std::memory_order_acquire) < size_; }
    bool finished() const noexcept { return !hasPending(); }
    size_t size() const noexcept { return size_; }
    size_t offset() const noexcept { return offset_.load(std::memory_order_acquire); }

    void release() noexcept;

private:
    std::unique_ptr<uint8_t[]> buf_;
    size_t size_{0};
    std::atomic<size_t> offset_{0};
};

} // namespace Stream
} // namespace VPB

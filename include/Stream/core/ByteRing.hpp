#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include "VPB/Error.h"

namespace VPB {
namespace Stream {

/**
 * @class ByteRing
 * @brief Fixed-capacity circular byte buffer with monotonic atomic cursors.
 *
 * Single producer / single consumer. The cursors count bytes since creation
 * and are never wrapped; the slot index is cursor % capacity.
 * Invariant: 0 <= writeCursor - readCursor <= capacity.
 *
 * write() never blocks and never grows. If the incoming data does not fit, the
 * oldest unread bytes are dropped by advancing the read cursor. The consumer
 * commits its read with a compare-and-swap so a concurrent drop or flush makes
 * it retry instead of returning overwritten bytes.
 */
class ByteRing {
public:
    /**
     * @brief Allocate a ring.
     * @param capacity Capacity in bytes, must be non-zero
     * @return The ring, or BadArgument / NoMemory
     */
    static std::expected<std::unique_ptr<ByteRing>, BridgeError> create(size_t capacity);

    /// capacity() is 0 when the storage cannot be allocated.
    explicit ByteRing(size_t capacity);

    ByteRing(const ByteRing&) = delete;
    ByteRing& operator=(const ByteRing&) = delete;
    ByteRing(ByteRing&&) = delete;
    ByteRing& operator=(ByteRing&&) = delete;
    ~ByteRing() = default;

    /**
     * @brief Append bytes, dropping the oldest unread bytes on overflow.
     * @return len (the call always succeeds from the producer's side)
     */
    size_t write(const void* src, size_t len) noexcept;

    /**
     * @brief Drain up to maxLen bytes.
     * @return Number of bytes copied, never more than availableToRead()
     */
    size_t read(void* dst, size_t maxLen) noexcept;

    /// Drop all pending unread bytes.
    void flush() noexcept;

    [[nodiscard]] size_t availableToRead() const noexcept;
    [[nodiscard]] size_t availableToWrite() const noexcept;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] size_t writeCursor() const noexcept { return writeCursor_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t readCursor() const noexcept { return readCursor_.load(std::memory_order_acquire); }

    /// Total bytes discarded by drop-oldest since creation.
    [[nodiscard]] uint64_t droppedBytes() const noexcept { return droppedBytes_.load(std::memory_order_relaxed); }

private:
    void copyIn(size_t cursor, const uint8_t* src, size_t len) noexcept;
    void copyOut(size_t cursor, uint8_t* dst, size_t len) const noexcept;

    size_t capacity_{0};
    std::unique_ptr<uint8_t[]> buf_;
    alignas(64) std::atomic<size_t> writeCursor_{0};
    alignas(64) std::atomic<size_t> readCursor_{0};
    std::atomic<uint64_t> droppedBytes_{0};
};

} // namespace Stream
} // namespace VPB

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>

namespace VPB {
namespace Stream {

/**
 * @brief Reusable capture buffer owned by a hardware binding.
 *
 * acquire() reallocates only when a larger slice than ever seen arrives, so in
 * steady state the input callback does not allocate. On allocation failure it
 * returns nullptr and the caller drops that frame.
 */
class ScratchBuffer {
public:
    ScratchBuffer() = default;
    ScratchBuffer(const ScratchBuffer&) = delete;
    ScratchBuffer& operator=(const ScratchBuffer&) = delete;

    uint8_t* acquire(size_t bytes) noexcept {
        if (bytes > capacity_) {
            std::unique_ptr<uint8_t[]> fresh(new (std::nothrow) uint8_t[bytes]);
            if (!fresh) {
                ++allocationFailures_;
                return nullptr;
            }
            buf_ = std::move(fresh);
            capacity_ = bytes;
            ++growCount_;
        }
        return buf_.get();
    }

    void release() noexcept {
        buf_.reset();
        capacity_ = 0;
    }

    size_t capacity() const noexcept { return capacity_; }
    uint32_t growCount() const noexcept { return growCount_; }
    uint32_t allocationFailures() const noexcept { return allocationFailures_; }

private:
    std::unique_ptr<uint8_t[]> buf_;
    size_t capacity_{0};
    uint32_t growCount_{0};
    uint32_t allocationFailures_{0};
};

} // namespace Stream
} // namespace VPB

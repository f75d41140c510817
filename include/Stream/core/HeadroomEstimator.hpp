#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include "VPB/BridgeConfig.hpp"

namespace VPB {
namespace Stream {

/**
 * @class HeadroomEstimator
 * @brief Tracks hardware pull sizes and derives the playback fill target.
 *
 * recordPull() runs on the real-time render callback and only touches
 * atomics. renderMax follows the largest pull seen and decays by
 * decayFraction every decayIntervalPulls pulls, never below the current pull.
 *
 * target = max(headroomMs * bytesPerMs, renderMax * guardMultiplier)
 */
class HeadroomEstimator {
public:
    explicit HeadroomEstimator(const BridgeConfig& config);

    /// Reload guard, decay and headroom settings. Call while no callbacks run.
    void configure(const BridgeConfig& config);

    void recordPull(size_t bytes) noexcept;
    void recordUnderflow() noexcept { underflowCount_.fetch_add(1, std::memory_order_relaxed); }

    size_t renderLastBytes() const noexcept { return renderLastBytes_.load(std::memory_order_relaxed); }
    size_t renderMaxBytes() const noexcept { return renderMaxBytes_.load(std::memory_order_relaxed); }

    size_t underflowCount() const noexcept { return underflowCount_.load(std::memory_order_relaxed); }
    void resetUnderflowCount() noexcept { underflowCount_.store(0, std::memory_order_relaxed); }

    /// Negative values are treated as 0.
    void setHeadroomMs(int ms) noexcept;
    int headroomMs() const noexcept { return headroomMs_.load(std::memory_order_relaxed); }

    double guardMultiplier() const noexcept { return guardMultiplier_.load(std::memory_order_relaxed); }

    size_t renderGuardBytes() const noexcept;
    size_t targetBytes(size_t bytesPerMs) const noexcept;

    /// Clear pull statistics (not the underflow counter). Safe while pulls are recorded.
    void resetStatistics() noexcept;

private:
    std::atomic<size_t> renderLastBytes_{0};
    std::atomic<size_t> renderMaxBytes_{0};
    std::atomic<size_t> underflowCount_{0};
    std::atomic<int> headroomMs_{kDefaultHeadroomMs};
    std::atomic<double> guardMultiplier_{kDefaultGuardMultiplier};

    // Incremented by the render thread, cleared by resetStatistics() while it runs
    std::atomic<uint32_t> pullCounter_{0};

    // Written by configure() only
    uint32_t decayIntervalPulls_{kDefaultDecayIntervalPulls};
    double decayFraction_{kDefaultDecayFraction};
};

} // namespace Stream
} // namespace VPB

#include "Stream/core/HeadroomEstimator.hpp"
#include <algorithm>

namespace VPB {
namespace Stream {

HeadroomEstimator::HeadroomEstimator(const BridgeConfig& config) {
    configure(config);
}

void HeadroomEstimator::configure(const BridgeConfig& config) {
    guardMultiplier_.store(clampGuardMultiplier(config.renderGuardMultiplier), std::memory_order_relaxed);
    setHeadroomMs(config.headroomMs);
    decayIntervalPulls_ = config.decayIntervalPulls > 0 ? config.decayIntervalPulls : kDefaultDecayIntervalPulls;
    decayFraction_ = (config.decayFraction >= 0.0 && config.decayFraction < 1.0)
                         ? config.decayFraction
                         : kDefaultDecayFraction;
    pullCounter_.store(0, std::memory_order_relaxed);
}

void HeadroomEstimator::recordPull(size_t bytes) noexcept {
    renderLastBytes_.store(bytes, std::memory_order_relaxed);

    size_t cur = renderMaxBytes_.load(std::memory_order_relaxed);
    if (bytes > cur) {
        renderMaxBytes_.store(bytes, std::memory_order_relaxed);
        cur = bytes;
    }

    const uint32_t pulls = pullCounter_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (pulls % decayIntervalPulls_ == 0) {
        size_t decayed = cur - static_cast<size_t>(static_cast<double>(cur) * decayFraction_);
        if (decayed < bytes) decayed = bytes;
        renderMaxBytes_.store(decayed, std::memory_order_relaxed);
    }
}

void HeadroomEstimator::setHeadroomMs(int ms) noexcept {
    headroomMs_.store(ms < 0 ? 0 : ms, std::memory_order_relaxed);
}

size_t HeadroomEstimator::renderGuardBytes() const noexcept {
    return static_cast<size_t>(static_cast<double>(renderMaxBytes()) * guardMultiplier());
}

size_t HeadroomEstimator::targetBytes(size_t bytesPerMs) const noexcept {
    const size_t headroom = static_cast<size_t>(headroomMs()) * bytesPerMs;
    return std::max(headroom, renderGuardBytes());
}

void HeadroomEstimator::resetStatistics() noexcept {
    renderLastBytes_.store(0, std::memory_order_relaxed);
    renderMaxBytes_.store(0, std::memory_order_relaxed);
    pullCounter_.store(0, std::memory_order_relaxed);
}

} // namespace Stream
} // namespace VPB

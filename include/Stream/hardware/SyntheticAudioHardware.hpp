#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "Stream/core/ScratchBuffer.hpp"
#include "Stream/interfaces/IAudioHardware.hpp"

namespace spdlog {
    class logger;
}

namespace VPB {
namespace Stream {

/// Timing of the simulated hardware.
struct SyntheticClock {
    std::chrono::microseconds period{10000};
    std::vector<uint32_t> renderPullFrames{160}; ///< Cycled through, one pull per tick
    uint32_t captureFrames{160};
    bool clockDriven{false};                     ///< false: the owner calls driveRender/driveCapture
    double toneHz{440.0};
    int16_t amplitude{3000};
};

/**
 * @class SyntheticAudioHardware
 * @brief IAudioHardware without a device, for tests and non-Apple hosts.
 *
 * Capture delivers a sine tone (or injected bytes) through a ScratchBuffer the
 * same way the voice processing binding does. Render output is kept so tests
 * can inspect what the session produced. Manual driving must not be mixed with
 * a running clock thread.
 */
class SyntheticAudioHardware : public IAudioHardware {
public:
    explicit SyntheticAudioHardware(std::shared_ptr<spdlog::logger> logger, SyntheticClock clock = {});
    ~SyntheticAudioHardware() override;

    SyntheticAudioHardware(const SyntheticAudioHardware&) = delete;
    SyntheticAudioHardware& operator=(const SyntheticAudioHardware&) = delete;

    // IAudioHardware
    std::expected<void, BridgeError> open(const BridgeConfig& config, IHardwareAudioSource& source) override;
    std::expected<void, BridgeError> start() override;
    void stop() override;
    void close() override;
    std::expected<bool, BridgeError> isVoiceProcessingBypassed() const override;
    double inputSampleRate() const override;
    double outputSampleRate() const override;
    int32_t lastPlatformStatus() const override { return 0; }
    Backend backend() const override { return Backend::Synthetic; }

    /// Pull `frames` frames of speaker output. Empty unless started.
    std::vector<uint8_t> driveRender(uint32_t frames);

    /// Deliver `frames` frames of tone. Returns bytes delivered, 0 if dropped or not wanted.
    size_t driveCapture(uint32_t frames);

    /// Deliver caller-provided capture bytes.
    size_t injectCapture(const uint8_t* data, size_t bytes);

    void setBypassed(bool bypassed) { bypassed_.store(bypassed); }

    bool isOpen() const { return opened_.load(); }
    bool isStarted() const { return started_.load(); }
    uint64_t renderPulls() const { return renderPulls_.load(); }
    uint64_t capturePulls() const { return capturePulls_.load(); }
    uint64_t renderedNonSilentBytes() const { return renderedNonSilent_.load(); }

private:
    void clockLoop();
    void renderInto(uint8_t* out, size_t bytes);
    void synthesize(int16_t* dst, uint32_t frames);

    std::shared_ptr<spdlog::logger> logger_;
    SyntheticClock clock_;
    IHardwareAudioSource* source_{nullptr};
    double sampleRate_{kDefaultSampleRate};
    double phase_{0.0};

    ScratchBuffer scratch_;
    std::vector<uint8_t> renderBuffer_;

    std::atomic<bool> opened_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> bypassed_{false};
    std::atomic<uint64_t> renderPulls_{0};
    std::atomic<uint64_t> capturePulls_{0};
    std::atomic<uint64_t> renderedNonSilent_{0};

    std::thread clockThread_;
    std::atomic<bool> shouldExit_{false};
    std::mutex condMutex_;
    std::condition_variable wakeCond_;
};

} // namespace Stream
} // namespace VPB

#pragma once

#if defined(__APPLE__)

#include <AudioToolbox/AudioToolbox.h>
#include <atomic>
#include <memory>
#include "Stream/core/ScratchBuffer.hpp"
#include "Stream/interfaces/IAudioHardware.hpp"

namespace spdlog {
    class logger;
}

namespace VPB {
namespace Stream {

/**
 * @class VoiceProcessingHardware
 * @brief IAudioHardware backed by Apple's VoiceProcessingIO audio unit.
 *
 * Bus 1 is the microphone (echo cancelled), bus 0 the speaker. Both sides are
 * configured for 16-bit signed packed mono at the configured rate. The unit
 * resamples to and from the device rate internally.
 */
class VoiceProcessingHardware : public IAudioHardware {
public:
    explicit VoiceProcessingHardware(std::shared_ptr<spdlog::logger> logger);
    ~VoiceProcessingHardware() override;

    VoiceProcessingHardware(const VoiceProcessingHardware&) = delete;
    VoiceProcessingHardware& operator=(const VoiceProcessingHardware&) = delete;

    std::expected<void, BridgeError> open(const BridgeConfig& config, IHardwareAudioSource& source) override;
    std::expected<void, BridgeError> start() override;
    void stop() override;
    void close() override;
    std::expected<bool, BridgeError> isVoiceProcessingBypassed() const override;
    double inputSampleRate() const override;
    double outputSampleRate() const override;
    int32_t lastPlatformStatus() const override { return lastStatus_.load(); }
    Backend backend() const override { return Backend::VoiceProcessing; }

private:
    static OSStatus renderProc(void* inRefCon,
                               AudioUnitRenderActionFlags* ioActionFlags,
                               const AudioTimeStamp* inTimeStamp,
                               UInt32 inBusNumber,
                               UInt32 inNumberFrames,
                               AudioBufferList* ioData);

    static OSStatus inputProc(void* inRefCon,
                              AudioUnitRenderActionFlags* ioActionFlags,
                              const AudioTimeStamp* inTimeStamp,
                              UInt32 inBusNumber,
                              UInt32 inNumberFrames,
                              AudioBufferList* ioData);

    std::unexpected<BridgeError> fail(const char* what, OSStatus status, BridgeError error);
    void setMaximumFramesPerSlice(uint32_t frames, const char* when);
    double streamSampleRate(AudioUnitScope scope, AudioUnitElement bus) const;

    std::shared_ptr<spdlog::logger> logger_;
    AudioUnit unit_{nullptr};
    IHardwareAudioSource* source_{nullptr};
    ScratchBuffer scratch_;
    bool initialized_{false};
    std::atomic<bool> started_{false};
    mutable std::atomic<int32_t> lastStatus_{0};
};

} // namespace Stream
} // namespace VPB

#endif // __APPLE__

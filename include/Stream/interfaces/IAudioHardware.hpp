#pragma once

#include <cstdint>
#include <expected>
#include "VPB/BridgeConfig.hpp"
#include "VPB/Enums.hpp"
#include "VPB/Error.h"

namespace VPB {
namespace Stream {

class IHardwareAudioSource;

class IAudioHardware {
public:
    virtual ~IAudioHardware() = default;

    // Acquire the unit, apply the fixed s16 mono format and install callbacks.
    // `source` must outlive the unit until close() returns.
    virtual std::expected<void, BridgeError> open(const BridgeConfig& config, IHardwareAudioSource& source) = 0;

    virtual std::expected<void, BridgeError> start() = 0;

    // No callbacks are delivered after stop() returns
    virtual void stop() = 0;

    // Release the unit and its scratch storage. Safe to call on a partially opened unit.
    virtual void close() = 0;

    virtual std::expected<bool, BridgeError> isVoiceProcessingBypassed() const = 0;
    virtual double inputSampleRate() const = 0;
    virtual double outputSampleRate() const = 0;

    // Last raw platform status (OSStatus on Apple), 0 when none
    virtual int32_t lastPlatformStatus() const = 0;

    virtual Backend backend() const = 0;
};

} // namespace Stream
} // namespace VPB

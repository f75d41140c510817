#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include "VPB/Enums.hpp"

namespace VPB {

// Environment variables recognized by applyEnvironment()
constexpr const char* kEnvTrace       = "VPIO_TRACE";
constexpr const char* kEnvGuardMult   = "VPIO_RENDER_GUARD_MULT";
constexpr const char* kEnvLibraryPath = "VPIO_LIB";
constexpr const char* kEnvBackend     = "VPIO_BACKEND";

/**
 * @brief Configuration parameters for a HardwareAudioSession.
 */
struct BridgeConfig {
    double sampleRate{kDefaultSampleRate};
    uint32_t channelCount{kChannelCount};
    size_t ringCapacityBytes{0};       ///< 0 selects one second of audio

    int sliceMs{kDefaultSliceMs};
    int prerollMs{kDefaultPrerollMs};
    int headroomMs{kDefaultHeadroomMs};
    double renderGuardMultiplier{kDefaultGuardMultiplier};
    uint32_t decayIntervalPulls{kDefaultDecayIntervalPulls};
    double decayFraction{kDefaultDecayFraction};
    uint32_t maxSliceMs{kMaxSliceMs};

    bool trace{false};
    Backend backend{
#if defined(__APPLE__)
        Backend::VoiceProcessing
#else
        Backend::Synthetic
#endif
    };
    std::string libraryPath;

    size_t bytesPerSecond() const {
        return static_cast<size_t>(sampleRate) * kBytesPerFrame;
    }

    // Integer math; exact for 16kHz (32 bytes/ms)
    size_t bytesPerMs() const {
        return bytesPerSecond() / 1000;
    }

    size_t sliceBytes() const {
        return bytesPerMs() * static_cast<size_t>(sliceMs > 0 ? sliceMs : kDefaultSliceMs);
    }

    size_t effectiveRingCapacity() const {
        return ringCapacityBytes < bytesPerSecond() ? bytesPerSecond() : ringCapacityBytes;
    }

    uint32_t maxFramesPerSlice() const {
        auto frames = static_cast<uint32_t>((sampleRate / 1000.0) * maxSliceMs);
        return frames < kMinFramesPerSlice ? kMinFramesPerSlice : frames;
    }

    bool isValid() const {
        if (sampleRate < 1000.0 || channelCount == 0) {
            return false;
        }
        if (renderGuardMultiplier < kMinGuardMultiplier || renderGuardMultiplier > kMaxGuardMultiplier) {
            return false;
        }
        if (decayIntervalPulls == 0 || decayFraction < 0.0 || decayFraction >= 1.0) {
            return false;
        }
        return maxSliceMs > 0;
    }

    std::string configSummary() const {
        return fmt::format("{} Hz mono s16, ring {} bytes, slice {}ms, preroll {}ms, headroom {}ms, guard x{:.2f}, backend {}",
                           sampleRate, effectiveRingCapacity(), sliceMs, prerollMs, headroomMs,
                           renderGuardMultiplier, backendToString(backend));
    }

    /**
     * @brief Apply VPIO_* environment overrides on top of this configuration.
     *
     * VPIO_TRACE enables trace logging unless empty or "0". VPIO_RENDER_GUARD_MULT
     * is clamped to [1.0, 4.0]. VPIO_LIB sets libraryPath. VPIO_BACKEND selects
     * "vpio" or "synthetic".
     */
    BridgeConfig& applyEnvironment();

    std::shared_ptr<spdlog::logger> logger;
};

double clampGuardMultiplier(double value);

namespace Presets {
    const BridgeConfig Default = {};

    const BridgeConfig Conservative = {
        .sliceMs = 10,
        .prerollMs = 80,
        .headroomMs = 30,
        .renderGuardMultiplier = 2.0
    };
}

} // namespace VPB

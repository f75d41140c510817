// include/VPB/Enums.hpp
#pragma once
#include <cstddef>
#include <cstdint>

namespace VPB {

// Fixed stream format: 16-bit signed little-endian PCM, mono.
constexpr uint32_t kBytesPerSample = 2;
constexpr uint32_t kChannelCount   = 1;
constexpr uint32_t kBytesPerFrame  = kBytesPerSample * kChannelCount;
constexpr double   kDefaultSampleRate = 16000.0;

// Pacing defaults
constexpr int    kDefaultSliceMs     = 5;
constexpr int    kDefaultPrerollMs   = 40;
constexpr int    kDefaultHeadroomMs  = 10;
constexpr double kDefaultGuardMultiplier = 1.5;
constexpr double kMinGuardMultiplier     = 1.0;
constexpr double kMaxGuardMultiplier     = 4.0;

// Render statistics decay: ~2% every 100 hardware pulls
constexpr uint32_t kDefaultDecayIntervalPulls = 100;
constexpr double   kDefaultDecayFraction      = 0.02;

// Hardware slice limits
constexpr uint32_t kMaxSliceMs        = 10;
constexpr uint32_t kMinFramesPerSlice = 80; // ~5ms at 16kHz

enum class Mode : uint32_t {
    Idle = 0,
    Recording = 1,
    Playing = 2
};

enum class Backend : uint32_t {
    VoiceProcessing = 0,
    Synthetic = 1
};

inline const char* modeToString(Mode mode) {
    switch (mode) {
        case Mode::Idle: return "Idle";
        case Mode::Recording: return "Recording";
        case Mode::Playing: return "Playing";
        default: return "Unknown";
    }
}

inline const char* backendToString(Backend backend) {
    switch (backend) {
        case Backend::VoiceProcessing: return "vpio";
        case Backend::Synthetic: return "synthetic";
        default: return "unknown";
    }
}

} // namespace VPB

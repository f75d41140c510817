#include "VPB/JsonHelpers.hpp"
#include "VPB/BridgeConfig.hpp"
#include "VPB/HardwareAudioSession.hpp"
#include <nlohmann/json.hpp>

namespace VPB::JsonHelpers {
    std::string modeToJsonString(Mode mode) {
        switch (mode) {
            case Mode::Idle: return "idle";
            case Mode::Recording: return "recording";
            case Mode::Playing: return "playing";
            default: return "unknown";
        }
    }

    json serializeSnapshot(const DebugSnapshot& s) {
        json j;
        j["mode"] = modeToJsonString(s.mode);
        j["backend"] = backendToString(s.backend);
        j["initialized"] = s.initialized;
        j["streaming"] = s.streaming;
        j["pacing"] = s.pacing;
        if (s.bypass) {
            j["bypass"] = *s.bypass;
        } else {
            j["bypass"] = nullptr;
            j["bypassStatus"] = s.bypassStatus;
        }
        j["inSampleRate"] = s.inputSampleRate;
        j["outSampleRate"] = s.outputSampleRate;
        j["captureRing"] = { {"level", s.captureLevel}, {"capacity", s.captureCapacity} };
        j["playbackRing"] = { {"level", s.playbackLevel}, {"capacity", s.playbackCapacity} };
        j["stagingRing"] = { {"level", s.stagingLevel}, {"capacity", s.stagingCapacity} };
        j["underflowCount"] = s.underflowCount;
        j["render"] = { {"lastBytes", s.renderLastBytes}, {"maxBytes", s.renderMaxBytes} };
        j["headroomMs"] = s.headroomMs;
        j["guardMultiplier"] = s.guardMultiplier;
        j["lastPlatformStatus"] = s.lastPlatformStatus;
        return j;
    }

    json serializeConfig(const BridgeConfig& c) {
        json j;
        j["sampleRate"] = c.sampleRate;
        j["channelCount"] = c.channelCount;
        j["ringCapacityBytes"] = c.effectiveRingCapacity();
        j["sliceMs"] = c.sliceMs;
        j["prerollMs"] = c.prerollMs;
        j["headroomMs"] = c.headroomMs;
        j["renderGuardMultiplier"] = c.renderGuardMultiplier;
        j["decayIntervalPulls"] = c.decayIntervalPulls;
        j["decayFraction"] = c.decayFraction;
        j["trace"] = c.trace;
        j["backend"] = backendToString(c.backend);
        if (!c.libraryPath.empty()) {
            j["libraryPath"] = c.libraryPath;
        }
        return j;
    }
}

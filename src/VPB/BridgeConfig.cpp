#include "VPB/BridgeConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace VPB {

double clampGuardMultiplier(double value) {
    if (value < kMinGuardMultiplier) return kMinGuardMultiplier;
    if (value > kMaxGuardMultiplier) return kMaxGuardMultiplier;
    return value;
}

BridgeConfig& BridgeConfig::applyEnvironment() {
    if (const char* tr = std::getenv(kEnvTrace)) {
        trace = tr[0] != '\0' && std::strcmp(tr, "0") != 0;
    }

    if (const char* rg = std::getenv(kEnvGuardMult); rg && rg[0] != '\0') {
        char* end = nullptr;
        double v = std::strtod(rg, &end);
        if (end == rg) {
            if (logger) {
                logger->warn("Ignoring {}='{}': not a number", kEnvGuardMult, rg);
            }
        } else {
            renderGuardMultiplier = clampGuardMultiplier(v);
        }
    }

    if (const char* lib = std::getenv(kEnvLibraryPath); lib && lib[0] != '\0') {
        libraryPath = lib;
    }

    if (const char* be = std::getenv(kEnvBackend); be && be[0] != '\0') {
        std::string_view name(be);
        if (name == "synthetic") {
            backend = Backend::Synthetic;
        } else if (name == "vpio") {
            backend = Backend::VoiceProcessing;
        } else if (logger) {
            logger->warn("Ignoring {}='{}': expected 'vpio' or 'synthetic'", kEnvBackend, be);
        }
    }

    return *this;
}

} // namespace VPB

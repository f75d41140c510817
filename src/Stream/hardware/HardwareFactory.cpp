#include "Stream/hardware/HardwareFactory.hpp"
#include "Stream/hardware/SyntheticAudioHardware.hpp"
#if defined(__APPLE__)
#include "Stream/hardware/VoiceProcessingHardware.hpp"
#endif
#include <spdlog/spdlog.h>

namespace VPB {
namespace Stream {

std::unique_ptr<IAudioHardware> createHardware(const BridgeConfig& config,
                                               std::shared_ptr<spdlog::logger> logger) {
    switch (config.backend) {
        case Backend::Synthetic: {
            SyntheticClock clock;
            clock.clockDriven = true;
            return std::make_unique<SyntheticAudioHardware>(std::move(logger), clock);
        }
        case Backend::VoiceProcessing:
#if defined(__APPLE__)
            return std::make_unique<VoiceProcessingHardware>(std::move(logger));
#else
            if (logger) {
                logger->error("createHardware: voice processing I/O is only available on Apple platforms");
            }
            return nullptr;
#endif
        default:
            return nullptr;
    }
}

} // namespace Stream
} // namespace VPB

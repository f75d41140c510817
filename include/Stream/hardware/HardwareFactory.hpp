#pragma once

#include <memory>
#include "Stream/interfaces/IAudioHardware.hpp"

namespace spdlog {
    class logger;
}

namespace VPB {
namespace Stream {

/**
 * @brief Create the hardware binding selected by config.backend.
 * @return nullptr when the backend is not available on this platform
 */
std::unique_ptr<IAudioHardware> createHardware(const BridgeConfig& config,
                                               std::shared_ptr<spdlog::logger> logger);

} // namespace Stream
} // namespace VPB

#pragma once
#include "VPB/Enums.hpp"
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace VPB {
struct BridgeConfig;
struct DebugSnapshot;
}

namespace VPB::JsonHelpers {
    using json = nlohmann::json;

    std::string modeToJsonString(Mode mode);
    json serializeSnapshot(const DebugSnapshot& snapshot);
    json serializeConfig(const BridgeConfig& config);
}

#pragma once

#include <string>
#include <vector>

#include "engine/EngineConfig.h"

namespace gridpilot {

// Collects every problem instead of stopping at the first one
class ConfigValidator {
public:
    static std::vector<std::string> validate(const engine::BotConfig& config);
};

} // namespace gridpilot

// Loads arena tuning from a JSON file on top of ArenaConfig::defaults().
#pragma once

#include <optional>
#include <string>

#include "ArenaConfig.h"

namespace Arena {

class ConfigLoader {
public:
    static std::optional<ArenaConfig> loadFromFile(const std::string& path);
    static std::optional<ArenaConfig> loadFromString(const std::string& text);
};

}  // namespace Arena

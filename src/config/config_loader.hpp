#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace remex::config {

// ~/.remex/config.json (or $REMEX_CONFIG) followed by REMEX_* overrides.
Config LoadConfig();
Config LoadConfigFromFile(const std::filesystem::path& path);

// Throws ConfigError when a worker or requester cannot start.
void ValidateWorkerConfig(const Config& config);

}  // namespace remex::config

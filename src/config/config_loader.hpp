#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace agentyard::config {

std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file (if present), then AGENTYARD_* environment
// overrides. "~/" prefixes in path settings are expanded.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

std::string ExpandHome(const std::string& path);

}  // namespace agentyard::config

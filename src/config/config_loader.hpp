#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace dailyfeels::config {

std::filesystem::path GetHomePath();
std::filesystem::path GetConfigPath();

// Expands a leading "~" to the home directory.
std::string ExpandHome(const std::string& path);

Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

}  // namespace dailyfeels::config

#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace codebox::config {

// ~/.codebox/config.json, then CODEBOX_* environment overrides.
Config LoadConfig();

// Explicit file, then CODEBOX_* environment overrides. A missing or
// malformed file keeps the defaults.
Config LoadConfigFromFile(const std::filesystem::path& path);

std::filesystem::path DefaultConfigPath();

// Sets the process-wide log threshold from the logging section.
void ConfigureLogging(const LoggingConfig& config);

// Expands a leading "~/" using $HOME.
std::filesystem::path ExpandHome(const std::string& path);

}  // namespace codebox::config

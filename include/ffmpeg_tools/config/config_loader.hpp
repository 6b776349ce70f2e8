#pragma once

#include <ffmpeg_tools/config/app_config.hpp>
#include <ffmpeg_tools/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace ffmpeg_tools {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Fill fields that are still unset from FFMPEG_TOOLS_SOURCE_ROOT and
// FFMPEG_TOOLS_FFMPEG.
AppConfig ApplyEnvironment(AppConfig config);

// <directory of the running executable>/../ffmpeg_src. Falls back to argv0
// when /proc/self/exe is unavailable.
std::filesystem::path DefaultSourceRoot(std::string_view argv0);

// Validate that required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace ffmpeg_tools

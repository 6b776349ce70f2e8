#pragma once

#include <ffmpeg_tools/config/app_config.hpp>
#include <ffmpeg_tools/mcp/tool_registry.hpp>
#include <ffmpeg_tools/process/process_runner.hpp>

#include <string>
#include <vector>

namespace ffmpeg_tools {

// Flags appended to every execute_ffmpeg invocation.
inline const std::vector<std::string>& FfmpegQuietFlags() {
    static const std::vector<std::string> flags = {"-v", "warning", "-y"};
    return flags;
}

// Register execute_ffmpeg, execute_ffprobe, get_ffmpeg_source_code,
// ls_ffmpeg_source_code and get_screenshot. Handlers capture `runner` by
// reference, so it must outlive the registry; `config` is copied.
void RegisterFfmpegTools(ToolRegistry& registry, IProcessRunner& runner,
                         const ToolConfig& config);

} // namespace ffmpeg_tools

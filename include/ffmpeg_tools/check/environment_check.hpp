#pragma once

#include <ffmpeg_tools/config/app_config.hpp>
#include <ffmpeg_tools/process/process_runner.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace ffmpeg_tools {

// ---------------------------------------------------------------------------
// EnvironmentReport: whether the server has what its tools need: a working
// ffmpeg binary and a source checkout to browse.
// ---------------------------------------------------------------------------
struct EnvironmentReport {
    std::string ffmpeg_path;
    bool ffmpeg_found = false;
    std::optional<std::string> ffmpeg_version;  // unset for git builds etc.
    std::string ffmpeg_error;

    std::string source_root;
    bool source_root_found = false;

    [[nodiscard]] bool Ok() const noexcept {
        return ffmpeg_found && source_root_found;
    }
};

// Extract "X.Y[.Z]" from `ffmpeg -version` output ("ffmpeg version 6.1.1 ...").
std::optional<std::string> ParseFfmpegVersion(std::string_view version_output);

// Run `<ffmpeg> -version` and stat the source root. Never throws.
EnvironmentReport CheckEnvironment(IProcessRunner& runner, const ToolConfig& config);

// Log the report: info for what is present, warnings for what is missing.
void LogEnvironmentReport(const EnvironmentReport& report);

// Human-readable summary for the `check` command.
void PrintEnvironmentReport(const EnvironmentReport& report, std::ostream& out,
                            bool use_color);

} // namespace ffmpeg_tools

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ffmpeg_tools {

// Settings injected into the tool handlers at registration.
struct ToolConfig {
    std::filesystem::path source_root;   // root of the ffmpeg source checkout
    std::string ffmpeg_path = "ffmpeg";  // binary used by get_screenshot and `check`
    int timeout_seconds = 0;             // per process; 0 = no limit
};

enum class Command {
    Serve,
    Check,
};

struct AppConfig {
    ToolConfig tools;
    Command command = Command::Serve;
    std::optional<std::string> config_file;
    std::optional<std::string> log_file;
    bool json_logs = false;
    int verbosity = 0;          // 0 = warn, 1 = info, 2+ = debug
    bool force_color = false;
    bool no_color = false;
};

} // namespace ffmpeg_tools

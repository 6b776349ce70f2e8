#include <ffmpeg_tools/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace ffmpeg_tools {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ResolveLogColor(bool force_color, bool force_no_color) {
    if (force_no_color) return false;
    if (force_color) return true;
    if (NoColorEnvSet()) return false;
    return IsStderrTty();
}

} // namespace ffmpeg_tools

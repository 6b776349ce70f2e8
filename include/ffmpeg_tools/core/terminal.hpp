#pragma once

namespace ffmpeg_tools {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve whether log output should be colored: explicit flags win, then
/// NO_COLOR, then whether stderr is a terminal.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace ffmpeg_tools

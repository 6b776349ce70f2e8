#pragma once

#include <string>
#include <string_view>

namespace ffmpeg_tools {

// Copy of `bytes` where every ill-formed UTF-8 sequence is replaced by
// U+FFFD. Well-formed input is returned unchanged.
std::string SanitizeUtf8(std::string_view bytes);

} // namespace ffmpeg_tools

#include <ffmpeg_tools/core/result.hpp>

#include <sstream>

namespace ffmpeg_tools {

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    oss << ": " << message;
    return oss.str();
}

} // namespace ffmpeg_tools

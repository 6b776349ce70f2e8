#include <ffmpeg_tools/source/source_tree.hpp>

#include <ffmpeg_tools/core/log.hpp>
#include <ffmpeg_tools/core/text.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace ffmpeg_tools {

namespace {

constexpr const char* kComponent = "source";

fs::path NormaliseRoot(const fs::path& root) {
    auto normal = root.lexically_normal();
    // "src/" -> "src" so lexically_relative sees matching components.
    if (!normal.has_filename() && normal.has_parent_path() &&
        normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // anonymous namespace

SourceTree::SourceTree(fs::path root) : root_(NormaliseRoot(root)) {}

Result<fs::path, Error> SourceTree::Resolve(std::string_view relative) const {
    const auto first = relative.find_first_not_of('/');
    const std::string trimmed =
        first == std::string_view::npos ? std::string() : std::string(relative.substr(first));

    auto joined = (root_ / trimmed).lexically_normal();

    const auto inside = joined.lexically_relative(root_);
    if (inside.empty() || *inside.begin() == "..") {
        LogWarn(kComponent, "rejected path outside source root: " +
                std::string(relative));
        return Result<fs::path, Error>::Err(Error::Make(
            "ResolveSourcePath", std::string(relative),
            "Path escapes source root: " + std::string(relative),
            ErrorCategory::InvalidPath));
    }
    return Result<fs::path, Error>::Ok(std::move(joined));
}

Result<std::string, Error> SourceTree::ReadText(const fs::path& resolved) const {
    std::error_code ec;
    if (!fs::is_regular_file(resolved, ec)) {
        return Result<std::string, Error>::Err(Error::Make(
            "ReadSourceFile", resolved.string(),
            "Invalid path: " + resolved.string(), ErrorCategory::NotFound));
    }

    std::ifstream in(resolved, std::ios::binary);
    if (!in) {
        return Result<std::string, Error>::Err(Error::Make(
            "ReadSourceFile", resolved.string(),
            std::string("Error reading file: ") + std::strerror(errno),
            ErrorCategory::Io));
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return Result<std::string, Error>::Err(Error::Make(
            "ReadSourceFile", resolved.string(),
            "Error reading file: read failed", ErrorCategory::Io));
    }

    LogDebug(kComponent, "read " + resolved.string());
    return Result<std::string, Error>::Ok(SanitizeUtf8(contents.str()));
}

Result<std::vector<std::string>, Error> SourceTree::List(
    const fs::path& resolved) const {
    std::error_code ec;
    fs::directory_iterator it(resolved, ec);
    if (ec) {
        return Result<std::vector<std::string>, Error>::Err(Error::Make(
            "ListSourceDirectory", resolved.string(),
            "Error reading directory " + resolved.string() + ": " + ec.message(),
            ErrorCategory::Io));
    }

    std::vector<std::string> names;
    while (it != fs::directory_iterator()) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) break;
    }
    if (ec) {
        return Result<std::vector<std::string>, Error>::Err(Error::Make(
            "ListSourceDirectory", resolved.string(),
            "Error reading directory " + resolved.string() + ": " + ec.message(),
            ErrorCategory::Io));
    }

    std::sort(names.begin(), names.end());
    return Result<std::vector<std::string>, Error>::Ok(std::move(names));
}

} // namespace ffmpeg_tools

#pragma once

#include <ffmpeg_tools/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ffmpeg_tools {

// ---------------------------------------------------------------------------
// SourceTree: read-only view of the ffmpeg source checkout.
//
// Client paths are joined onto the root as plain strings ("/libavfilter/"
// and "libavfilter" name the same directory). A joined path that normalises
// to somewhere outside the root is rejected with ErrorCategory::InvalidPath.
// ---------------------------------------------------------------------------
class SourceTree {
public:
    explicit SourceTree(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& Root() const noexcept {
        return root_;
    }

    // Root-relative join plus the containment check. Does not touch the
    // filesystem.
    [[nodiscard]] Result<std::filesystem::path, Error> Resolve(
        std::string_view relative) const;

    // Contents of a regular file as text; invalid UTF-8 is replaced.
    // NotFound when `resolved` is not a regular file, Io on read failure.
    [[nodiscard]] Result<std::string, Error> ReadText(
        const std::filesystem::path& resolved) const;

    // Names of the immediate entries of a directory, sorted. No recursion.
    [[nodiscard]] Result<std::vector<std::string>, Error> List(
        const std::filesystem::path& resolved) const;

private:
    std::filesystem::path root_;
};

} // namespace ffmpeg_tools

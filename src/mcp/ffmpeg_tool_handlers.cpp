#include <ffmpeg_tools/mcp/ffmpeg_tool_handlers.hpp>

#include <ffmpeg_tools/core/log.hpp>
#include <ffmpeg_tools/core/text.hpp>
#include <ffmpeg_tools/source/source_tree.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace ffmpeg_tools {

namespace {

constexpr const char* kComponent = "tools";

using HandlerResult = Result<ToolOutput, ToolError>;

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

HandlerResult Ok(ToolOutput output) {
    return HandlerResult::Ok(std::move(output));
}

HandlerResult Fail(const std::string& message) {
    return HandlerResult::Err(ToolError::HandlerFailed(message));
}

HandlerResult BadArgs(const std::string& message) {
    return HandlerResult::Err(ToolError::InvalidArguments(message));
}

// Arguments have been validated against the schema before handlers run, so
// these accessors only convert.
std::vector<std::string> StringList(const nlohmann::json& params,
                                    const std::string& key) {
    return params.at(key).get<std::vector<std::string>>();
}

std::string String(const nlohmann::json& params, const std::string& key) {
    return params.at(key).get<std::string>();
}

ProcessOptions MakeProcessOptions(const ToolConfig& config) {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(config.timeout_seconds);
    return options;
}

// {returncode, stdout, stderr}. A non-zero returncode is ordinary output.
nlohmann::json ProcessResultJson(const ProcessResult& result) {
    return {{"returncode", result.exit_code},
            {"stdout", SanitizeUtf8(result.stdout_data)},
            {"stderr", SanitizeUtf8(result.stderr_data)}};
}

std::string KilledMessage(const std::string& executable,
                          const ProcessResult& result,
                          const ToolConfig& config) {
    if (result.cancelled) {
        return executable + " was cancelled";
    }
    return executable + " timed out after " +
           std::to_string(config.timeout_seconds) + " s";
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

// Source paths must name something below the root.
nlohmann::json PathProp(const std::string& desc) {
    auto prop = StringProp(desc);
    prop["minLength"] = 1;
    return prop;
}

nlohmann::json StringListProp(const std::string& desc) {
    return {{"type", "array"},
            {"description", desc},
            {"items", {{"type", "string"}}},
            {"minItems", 1}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// execute_ffmpeg / execute_ffprobe: args[0] is the executable.
HandlerResult HandleExecute(IProcessRunner& runner, const ToolConfig& config,
                            const nlohmann::json& params,
                            const std::vector<std::string>& extra_flags) {
    auto args = StringList(params, "args");
    if (args.empty()) {
        return BadArgs("Parameter 'args' must not be empty");
    }

    const std::string executable = args.front();
    std::vector<std::string> rest(args.begin() + 1, args.end());
    rest.insert(rest.end(), extra_flags.begin(), extra_flags.end());

    auto result = runner.Run(executable, rest, MakeProcessOptions(config));
    if (result.Killed()) {
        return Fail(KilledMessage(executable, result, config));
    }
    if (result.exit_code != 0) {
        LogInfo(kComponent, executable + " exited with " +
                std::to_string(result.exit_code));
    }
    return Ok(StructuredContent{ProcessResultJson(result)});
}

// get_ffmpeg_source_code
HandlerResult HandleReadSource(const SourceTree& tree,
                               const nlohmann::json& params) {
    const auto path = String(params, "path");
    if (path.empty()) {
        return BadArgs("Missing file path");
    }

    auto resolved = tree.Resolve(path);
    if (resolved.IsErr()) {
        return BadArgs(resolved.Error().message);
    }

    // Missing files and read errors are answered as text, not as failures.
    auto text = tree.ReadText(resolved.Value());
    if (text.IsErr()) {
        return Ok(TextContent{text.Error().message});
    }
    return Ok(TextContent{std::move(text).Value()});
}

// ls_ffmpeg_source_code
HandlerResult HandleListSource(const SourceTree& tree,
                               const nlohmann::json& params) {
    const auto path = String(params, "path");
    if (path.empty()) {
        return BadArgs("Missing file path");
    }

    auto resolved = tree.Resolve(path);
    if (resolved.IsErr()) {
        return BadArgs(resolved.Error().message);
    }

    auto names = tree.List(resolved.Value());
    if (names.IsErr()) {
        return Fail(names.Error().message);
    }
    return Ok(StructuredContent{nlohmann::json(names.Value())});
}

// get_screenshot: one PNG frame streamed to stdout.
HandlerResult HandleScreenshot(IProcessRunner& runner, const ToolConfig& config,
                               const nlohmann::json& params) {
    const auto file_path = String(params, "file_path");
    const auto timestamp = String(params, "timestamp");

    const std::vector<std::string> args = {
        "-ss", timestamp,
        "-i", file_path,
        "-frames:v", "1",
        "-f", "image2pipe",
        "-vcodec", "png",
        "-v", "error",
        "-y",
        "-",
    };

    auto result = runner.Run(config.ffmpeg_path, args, MakeProcessOptions(config));
    if (result.Killed()) {
        return Fail(KilledMessage(config.ffmpeg_path, result, config));
    }
    if (result.exit_code != 0 || result.stdout_data.empty()) {
        auto stderr_text = SanitizeUtf8(result.stderr_data);
        if (stderr_text.empty()) {
            stderr_text = "no frame produced (exit code " +
                          std::to_string(result.exit_code) + ")";
        }
        return Fail("ffmpeg error: " + stderr_text);
    }

    LogDebug(kComponent, "screenshot " + file_path + " @ " + timestamp + ": " +
             std::to_string(result.stdout_data.size()) + " bytes");
    return Ok(ImageContent{std::move(result.stdout_data), "png"});
}

} // anonymous namespace

void RegisterFfmpegTools(ToolRegistry& registry, IProcessRunner& runner,
                         const ToolConfig& config) {
    auto tree = std::make_shared<const SourceTree>(config.source_root);
    const ToolConfig cfg = config;

    registry.Register(
        "execute_ffmpeg",
        "Full list of ffmpeg command arguments. "
        "Example: ['ffmpeg', '-i', 'in.mp4', 'out.mp4']",
        MakeSchema({{"args", StringListProp("Command line, executable first")}},
                   nlohmann::json::array({"args"})),
        [&runner, cfg](const nlohmann::json& params) {
            return HandleExecute(runner, cfg, params, FfmpegQuietFlags());
        });

    registry.Register(
        "execute_ffprobe",
        "Full list of ffprobe command arguments. Example: ['ffprobe', 'in.mp4']",
        MakeSchema({{"args", StringListProp("Command line, executable first")}},
                   nlohmann::json::array({"args"})),
        [&runner, cfg](const nlohmann::json& params) {
            return HandleExecute(runner, cfg, params, {});
        });

    registry.Register(
        "get_ffmpeg_source_code",
        "Returns file contents or an error message. Example: /libavfilter/src_movie.c",
        MakeSchema({{"path", PathProp("File path relative to the ffmpeg source root")}},
                   nlohmann::json::array({"path"})),
        [tree](const nlohmann::json& params) {
            return HandleReadSource(*tree, params);
        });

    registry.Register(
        "ls_ffmpeg_source_code",
        "Returns files or an error message. Example: /libavfilter/",
        MakeSchema({{"path", PathProp("Directory path relative to the ffmpeg source root")}},
                   nlohmann::json::array({"path"})),
        [tree](const nlohmann::json& params) {
            return HandleListSource(*tree, params);
        });

    registry.Register(
        "get_screenshot",
        "Get a screenshot from a media file at a given timestamp. "
        "Parameters: file path and timestamp (format '00:00:00'). "
        "Return an Image object.",
        MakeSchema({{"file_path", StringProp("Path of the media file")},
                    {"timestamp", StringProp("Seek position, e.g. '00:01:30'")}},
                   nlohmann::json::array({"file_path", "timestamp"})),
        [&runner, cfg](const nlohmann::json& params) {
            return HandleScreenshot(runner, cfg, params);
        });

    LogDebug(kComponent, "registered ffmpeg tools, source root " +
             tree->Root().string());
}

} // namespace ffmpeg_tools

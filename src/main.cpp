#include <ffmpeg_tools/check/environment_check.hpp>
#include <ffmpeg_tools/config/config_loader.hpp>
#include <ffmpeg_tools/core/log.hpp>
#include <ffmpeg_tools/core/terminal.hpp>
#include <ffmpeg_tools/core/version.hpp>
#include <ffmpeg_tools/mcp/ffmpeg_tool_handlers.hpp>
#include <ffmpeg_tools/mcp/mcp_server.hpp>
#include <ffmpeg_tools/process/process_runner.hpp>

#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess     = 0;
constexpr int kExitCheckFailed = 2;
constexpr int kExitInternal    = 99;

constexpr const char* kComponent = "main";

ffmpeg_tools::LogLevel LevelFromVerbosity(int verbosity) {
    using ffmpeg_tools::LogLevel;
    if (verbosity >= 2) return LogLevel::Debug;
    if (verbosity == 1) return LogLevel::Info;
    return LogLevel::Warn;
}

// Resolve CLI, YAML file and environment into one validated config.
ffmpeg_tools::Result<ffmpeg_tools::AppConfig, ffmpeg_tools::Error> ResolveConfig(
    int argc, const char* const* argv) {
    using namespace ffmpeg_tools;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) return cli;

    AppConfig config = cli.Value();
    if (config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*config.config_file);
        if (yaml.IsErr()) return yaml;
        config = MergeConfigs(yaml.Value(), cli.Value());
    }

    config = ApplyEnvironment(std::move(config));
    if (config.tools.source_root.empty()) {
        config.tools.source_root = DefaultSourceRoot(argc > 0 ? argv[0] : "");
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// Logs go to stderr (and optionally a file); stdout is the MCP channel.
bool InstallLogger(const ffmpeg_tools::AppConfig& config) {
    using namespace ffmpeg_tools;

    const bool use_color = ResolveLogColor(config.force_color, config.no_color);
    std::unique_ptr<ILogSink> sink;
    if (config.json_logs) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ConsoleSink>(use_color, std::cerr);
    }

    bool file_ok = true;
    if (config.log_file.has_value()) {
        // Outlives the global logger, which is destroyed at static teardown.
        static std::ofstream log_stream;
        log_stream.open(*config.log_file, std::ios::app);
        if (log_stream) {
            sink = std::make_unique<TeeSink>(std::move(sink),
                                             std::make_unique<JsonSink>(log_stream));
        } else {
            file_ok = false;
        }
    }

    InitGlobalLogger(std::move(sink), LevelFromVerbosity(config.verbosity));
    return file_ok;
}

int RunCheck(const ffmpeg_tools::AppConfig& config) {
    using namespace ffmpeg_tools;

    ProcessRunner runner;
    auto report = CheckEnvironment(runner, config.tools);
    PrintEnvironmentReport(report, std::cout,
                           ResolveLogColor(config.force_color, config.no_color));
    return report.Ok() ? kExitSuccess : kExitCheckFailed;
}

int RunServer(const ffmpeg_tools::AppConfig& config) {
    using namespace ffmpeg_tools;

    ProcessRunner runner;
    LogEnvironmentReport(CheckEnvironment(runner, config.tools));

    ToolRegistry registry;
    RegisterFfmpegTools(registry, runner, config.tools);

    // Blocks until the client closes stdin.
    McpServer server(std::move(registry));
    server.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ffmpeg_tools;

    auto config = ResolveConfig(argc, argv);
    if (config.IsErr()) {
        std::cerr << "ffmpeg-tools: " << config.Error().ToString() << '\n';
        return config.Error().ExitCode();
    }

    if (!InstallLogger(config.Value())) {
        LogWarn(kComponent, "cannot open log file " + *config.Value().log_file);
    }
    LogInfo(kComponent, std::string("ffmpeg-tools ") + kVersion);

    try {
        if (config.Value().command == Command::Check) {
            return RunCheck(config.Value());
        }
        return RunServer(config.Value());
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("fatal: ") + e.what());
        return kExitInternal;
    }
}

#include <ffmpeg_tools/config/config_loader.hpp>

#include <ffmpeg_tools/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace ffmpeg_tools {

namespace {

constexpr const char* kDefaultFfmpeg = "ffmpeg";
constexpr const char* kEnvSourceRoot = "FFMPEG_TOOLS_SOURCE_ROOT";
constexpr const char* kEnvFfmpeg = "FFMPEG_TOOLS_FFMPEG";

Error MakeConfigError(const std::string& message,
                      const std::string& target = "") {
    return Error::Make("ConfigLoader", target, message, ErrorCategory::Config);
}

Result<Command, Error> ParseCommand(const std::string& name) {
    if (name == "serve") return Result<Command, Error>::Ok(Command::Serve);
    if (name == "check") return Result<Command, Error>::Ok(Command::Check);
    return Result<Command, Error>::Err(MakeConfigError(
        "Unknown command '" + name + "' (expected 'serve' or 'check')"));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    AppConfig config;
    config.config_file = path;

    try {
        const YAML::Node root = YAML::LoadFile(path);

        if (root["source_root"]) {
            config.tools.source_root = root["source_root"].as<std::string>();
        }
        if (root["ffmpeg"]) {
            config.tools.ffmpeg_path = root["ffmpeg"].as<std::string>();
        }
        if (root["timeout"]) {
            config.tools.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
        if (root["verbosity"]) {
            config.verbosity = root["verbosity"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "Failed to parse YAML file: " + std::string(e.what()), path));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("ffmpeg-tools", kVersion);
    program.add_description(
        "MCP server exposing ffmpeg, ffprobe and the ffmpeg source tree as tools.");

    int verbosity = 0;

    program.add_argument("command")
        .help("serve (default): run the MCP server on stdio; "
              "check: verify ffmpeg and the source tree")
        .default_value(std::string("serve"))
        .nargs(argparse::nargs_pattern::optional);
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--source-root")
        .help("Root directory of the ffmpeg source checkout");
    program.add_argument("--ffmpeg")
        .help("ffmpeg binary used for screenshots and checks");
    program.add_argument("--timeout")
        .help("Per-process timeout in seconds (0 = none)")
        .scan<'i', int>();
    program.add_argument("--log-file")
        .help("Also write JSON log lines to this file");
    program.add_argument("--json-logs")
        .help("Log JSON lines to stderr instead of text")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v info, -vv debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    auto command = ParseCommand(program.get<std::string>("command"));
    if (command.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(command).Error());
    }
    config.command = command.Value();

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--source-root")) {
        config.tools.source_root = *val;
    }
    if (auto val = program.present("--ffmpeg")) {
        config.tools.ffmpeg_path = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.tools.timeout_seconds = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.json_logs = program.get<bool>("--json-logs");
    config.verbosity = verbosity;
    config.force_color = program.get<bool>("--color");
    config.no_color = program.get<bool>("--no-color");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    merged.command = cli_overrides.command;
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    if (!cli_overrides.tools.source_root.empty()) {
        merged.tools.source_root = cli_overrides.tools.source_root;
    }
    if (cli_overrides.tools.ffmpeg_path != kDefaultFfmpeg) {
        merged.tools.ffmpeg_path = cli_overrides.tools.ffmpeg_path;
    }
    if (cli_overrides.tools.timeout_seconds != 0) {
        merged.tools.timeout_seconds = cli_overrides.tools.timeout_seconds;
    }

    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.verbosity > merged.verbosity) {
        merged.verbosity = cli_overrides.verbosity;
    }
    merged.force_color = cli_overrides.force_color;
    merged.no_color = cli_overrides.no_color;

    return merged;
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config) {
    if (config.tools.source_root.empty()) {
        if (const char* root = std::getenv(kEnvSourceRoot); root && *root) {
            config.tools.source_root = root;
        }
    }
    if (config.tools.ffmpeg_path == kDefaultFfmpeg) {
        if (const char* ffmpeg = std::getenv(kEnvFfmpeg); ffmpeg && *ffmpeg) {
            config.tools.ffmpeg_path = ffmpeg;
        }
    }
    return config;
}

// ---------------------------------------------------------------------------
// DefaultSourceRoot
// ---------------------------------------------------------------------------
fs::path DefaultSourceRoot(std::string_view argv0) {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        exe = fs::absolute(fs::path(std::string(argv0)), ec);
    }
    return (exe.parent_path() / ".." / "ffmpeg_src").lexically_normal();
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.tools.source_root.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: source_root"));
    }
    if (config.tools.ffmpeg_path.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("ffmpeg path must not be empty"));
    }
    if (config.tools.timeout_seconds < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must not be negative, got " +
                            std::to_string(config.tools.timeout_seconds)));
    }
    if (config.verbosity < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Verbosity must not be negative"));
    }
    return Result<void, Error>::Ok();
}

} // namespace ffmpeg_tools

#include <ffmpeg_tools/check/environment_check.hpp>

#include <ffmpeg_tools/core/ansi.hpp>
#include <ffmpeg_tools/core/log.hpp>

#include <chrono>
#include <filesystem>
#include <regex>
#include <sstream>
#include <system_error>

namespace ffmpeg_tools {

namespace {

constexpr const char* kComponent = "check";

// `ffmpeg -version` answers instantly; never let a broken binary hang startup.
constexpr std::chrono::seconds kVersionProbeTimeout{10};

} // anonymous namespace

std::optional<std::string> ParseFfmpegVersion(std::string_view version_output) {
    static const std::regex pattern(R"(ffmpeg version (\d+(\.\d+)*))");

    std::istringstream lines{std::string(version_output)};
    std::string line;
    while (std::getline(lines, line)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

EnvironmentReport CheckEnvironment(IProcessRunner& runner, const ToolConfig& config) {
    EnvironmentReport report;
    report.ffmpeg_path = config.ffmpeg_path;
    report.source_root = config.source_root.string();

    ProcessOptions options;
    options.timeout = kVersionProbeTimeout;
    auto result = runner.Run(config.ffmpeg_path, {"-version"}, options);
    if (result.exit_code == 0) {
        report.ffmpeg_found = true;
        report.ffmpeg_version = ParseFfmpegVersion(result.stdout_data);
    } else if (result.Killed()) {
        report.ffmpeg_error = "'" + config.ffmpeg_path + " -version' did not finish";
    } else if (!result.stderr_data.empty()) {
        report.ffmpeg_error = result.stderr_data;
        while (!report.ffmpeg_error.empty() && report.ffmpeg_error.back() == '\n') {
            report.ffmpeg_error.pop_back();
        }
    } else {
        report.ffmpeg_error = "exited with " + std::to_string(result.exit_code);
    }

    std::error_code ec;
    report.source_root_found = std::filesystem::is_directory(config.source_root, ec);

    return report;
}

void LogEnvironmentReport(const EnvironmentReport& report) {
    if (report.ffmpeg_found) {
        LogInfo(kComponent, "found ffmpeg version " +
                report.ffmpeg_version.value_or("(unknown)") + " at " +
                report.ffmpeg_path);
    } else {
        LogWarn(kComponent, "ffmpeg not usable (" + report.ffmpeg_path + "): " +
                report.ffmpeg_error);
    }

    if (report.source_root_found) {
        LogInfo(kComponent, "source root " + report.source_root);
    } else {
        LogWarn(kComponent, "source root " + report.source_root +
                " is not a directory; source tools will report errors");
    }
}

void PrintEnvironmentReport(const EnvironmentReport& report, std::ostream& out,
                            bool use_color) {
    auto mark = [&](bool ok) {
        if (!use_color) return std::string(ok ? "[ok]  " : "[FAIL]");
        return std::string(ok ? ansi::kGreen : ansi::kRed) +
               (ok ? "[ok]  " : "[FAIL]") + ansi::kReset;
    };

    out << mark(report.ffmpeg_found) << " ffmpeg      " << report.ffmpeg_path;
    if (report.ffmpeg_found) {
        out << " (version " << report.ffmpeg_version.value_or("unknown") << ")";
    } else {
        out << ": " << report.ffmpeg_error;
    }
    out << '\n';

    out << mark(report.source_root_found) << " source root " << report.source_root;
    if (!report.source_root_found) {
        out << ": not a directory";
    }
    out << '\n';
}

} // namespace ffmpeg_tools

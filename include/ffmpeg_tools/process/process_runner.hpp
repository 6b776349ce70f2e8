#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace ffmpeg_tools {

// ---------------------------------------------------------------------------
// ProcessOptions: per-invocation limits. Defaults wait forever.
// ---------------------------------------------------------------------------
struct ProcessOptions {
    // Zero means no timeout.
    std::chrono::milliseconds timeout{0};
    // Polled while the child runs; setting it kills the child.
    const std::atomic<bool>* cancel = nullptr;
};

// ---------------------------------------------------------------------------
// ProcessResult: outcome of one external process invocation.
//
// exit_code is the child's exit status, -N when it was terminated by signal
// N, and -1 when it could not be started at all (stderr_data then holds the
// reason). stdout_data/stderr_data are raw bytes.
// ---------------------------------------------------------------------------
struct ProcessResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    bool cancelled = false;

    [[nodiscard]] bool Killed() const noexcept { return timed_out || cancelled; }
};

// ---------------------------------------------------------------------------
// IProcessRunner: synchronous process execution.
//
// Tool handlers depend on this interface rather than on fork/exec directly,
// so tests can run them against MockProcessRunner without spawning anything.
// Implementations never throw on non-zero exit or spawn failure.
// ---------------------------------------------------------------------------
class IProcessRunner {
public:
    IProcessRunner() = default;
    virtual ~IProcessRunner() = default;

    IProcessRunner(const IProcessRunner&) = delete;
    IProcessRunner& operator=(const IProcessRunner&) = delete;
    IProcessRunner(IProcessRunner&&) = delete;
    IProcessRunner& operator=(IProcessRunner&&) = delete;

    // Run `executable` with `args` (argv[1..]). No shell is involved; PATH
    // is searched when `executable` contains no '/'.
    [[nodiscard]] virtual ProcessResult Run(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}) = 0;
};

// ---------------------------------------------------------------------------
// ProcessRunner: POSIX fork/execvp implementation.
//
// The child's stdin is /dev/null; stdout and stderr are drained concurrently
// through pipes. Each call owns its pipes and pid; nothing is shared.
// ---------------------------------------------------------------------------
class ProcessRunner : public IProcessRunner {
public:
    ProcessRunner() = default;

    [[nodiscard]] ProcessResult Run(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}) override;
};

// Render an argv for log messages, quoting arguments that contain spaces.
std::string FormatCommandLine(const std::string& executable,
                              const std::vector<std::string>& args);

} // namespace ffmpeg_tools

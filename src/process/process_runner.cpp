#include <ffmpeg_tools/process/process_runner.hpp>

#include <ffmpeg_tools/core/log.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ffmpeg_tools {

namespace {

constexpr const char* kComponent = "process";

// Poll granularity when a timeout or cancel flag has to be observed.
constexpr int kPollSliceMs = 50;

void CloseFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ProcessResult SpawnFailure(const std::string& executable, int err) {
    ProcessResult result;
    result.exit_code = -1;
    result.stderr_data =
        "Failed to execute '" + executable + "': " + std::strerror(err);
    return result;
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

// Tracks the optional deadline and cancel flag for one invocation.
class Watchdog {
public:
    explicit Watchdog(const ProcessOptions& options)
        : options_(options),
          deadline_(std::chrono::steady_clock::now() + options.timeout) {}

    [[nodiscard]] bool Bounded() const {
        return options_.timeout.count() > 0 || options_.cancel != nullptr;
    }

    // Poll timeout in ms: -1 when unbounded, otherwise a short slice.
    [[nodiscard]] int PollTimeoutMs() const { return Bounded() ? kPollSliceMs : -1; }

    [[nodiscard]] bool Cancelled() const {
        return options_.cancel != nullptr &&
               options_.cancel->load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool Expired() const {
        return options_.timeout.count() > 0 &&
               std::chrono::steady_clock::now() >= deadline_;
    }

private:
    const ProcessOptions& options_;
    std::chrono::steady_clock::time_point deadline_;
};

} // anonymous namespace

std::string FormatCommandLine(const std::string& executable,
                              const std::vector<std::string>& args) {
    auto quote = [](const std::string& s) {
        if (!s.empty() && s.find_first_of(" \t\"'") == std::string::npos) {
            return s;
        }
        std::string q = "\"";
        for (char c : s) {
            if (c == '"' || c == '\\') q.push_back('\\');
            q.push_back(c);
        }
        q.push_back('"');
        return q;
    };

    std::string line = quote(executable);
    for (const auto& arg : args) {
        line += ' ';
        line += quote(arg);
    }
    return line;
}

ProcessResult ProcessRunner::Run(const std::string& executable,
                                 const std::vector<std::string>& args,
                                 const ProcessOptions& options) {
    LogDebug(kComponent, "exec: " + FormatCommandLine(executable, args));

    // argv must be prepared before fork(): only async-signal-safe calls are
    // allowed in the child.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // child reports execvp errno here
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return SpawnFailure(executable, err);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return SpawnFailure(executable, err);
    }

    if (pid == 0) {
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(executable.c_str(), argv.data());
        const int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(exec_pipe[1]);

    // EOF on the exec pipe means execvp succeeded (O_CLOEXEC closed it).
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        CloseFd(out_pipe[0]);
        CloseFd(err_pipe[0]);
        LogDebug(kComponent, "spawn failed: " + executable);
        return SpawnFailure(executable, exec_errno);
    }

    ProcessResult result;
    Watchdog watchdog(options);

    auto kill_child = [&]() {
        if (watchdog.Cancelled()) {
            result.cancelled = true;
        } else {
            result.timed_out = true;
        }
        kill(pid, SIGKILL);
    };

    std::array<pollfd, 2> fds{};
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    std::array<char, 8192> buffer{};

    int open_fds = 2;
    while (open_fds > 0) {
        const int ret = poll(fds.data(), fds.size(), watchdog.PollTimeoutMs());
        if (ret < 0) {
            if (errno == EINTR) continue;
            LogWarn(kComponent, std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        if (watchdog.Cancelled() || watchdog.Expired()) {
            kill_child();
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            const ssize_t got = read(fds[i].fd, buffer.data(), buffer.size());
            if (got > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                CloseFd(fds[i].fd);
                --open_fds;
            }
        }
    }
    CloseFd(fds[0].fd);
    CloseFd(fds[1].fd);

    int status = 0;
    if (result.Killed() || !watchdog.Bounded()) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    } else {
        // Streams are closed but the child may linger; keep honouring the
        // deadline while reaping.
        while (true) {
            const pid_t done = waitpid(pid, &status, WNOHANG);
            if (done == pid || (done < 0 && errno != EINTR)) break;
            if (watchdog.Cancelled() || watchdog.Expired()) {
                kill_child();
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollSliceMs));
        }
    }

    result.exit_code = DecodeWaitStatus(status);
    if (result.timed_out) {
        LogWarn(kComponent, "killed after " +
                std::to_string(options.timeout.count()) + " ms: " + executable);
    } else if (result.cancelled) {
        LogInfo(kComponent, "cancelled: " + executable);
    }
    LogDebug(kComponent, executable + " exited with " +
             std::to_string(result.exit_code) + " (stdout " +
             std::to_string(result.stdout_data.size()) + " bytes, stderr " +
             std::to_string(result.stderr_data.size()) + " bytes)");
    return result;
}

} // namespace ffmpeg_tools

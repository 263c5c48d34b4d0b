/**
 * @file command_runner.cpp
 * @brief fork/exec process runner with captured output and hard deadlines
 *
 * The child calls setsid() so that a timeout can kill the whole process group
 * (docker and terraform both fork helpers). Pipes are drained while polling
 * waitpid to avoid the child blocking on a full pipe buffer.
 *
 * @date 2025
 */

#include "cerberus/utils/command_runner.hpp"
#include "cerberus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace cerberus {
namespace utils {

namespace {

void AppendLimited(std::string& dst, const char* src, ssize_t n, std::size_t limit) {
    if (n <= 0) {
        return;
    }
    const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    dst.append(src, std::min<std::size_t>(static_cast<std::size_t>(n), avail));
}

/// Inherited environment with @p extra layered on top
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& extra) {
    std::vector<std::string> envs;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && extra.count(entry.substr(0, eq)) > 0) {
            continue;
        }
        envs.push_back(std::move(entry));
    }
    for (const auto& [key, value] : extra) {
        envs.push_back(key + "=" + value);
    }
    return envs;
}

/**
 * argv/envp storage built in the parent, since the child of a
 * multithreaded process must not allocate between fork and exec.
 */
struct PreparedExec {
    std::vector<std::string> args;
    std::vector<std::string> envs;
    std::vector<char*> argv;
    std::vector<char*> envp;

    explicit PreparedExec(const CommandSpec& spec)
        : args(spec.argv), envs(BuildEnvironment(spec.env)) {
        argv.reserve(args.size() + 1);
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        envp.reserve(envs.size() + 1);
        for (auto& e : envs) {
            envp.push_back(e.data());
        }
        envp.push_back(nullptr);
    }
};

[[noreturn]] void ExecChild(const CommandSpec& spec, PreparedExec& exec) {
    if (spec.working_directory && chdir(spec.working_directory->c_str()) != 0) {
        _exit(127);
    }
    execvpe(exec.argv[0], exec.argv.data(), exec.envp.data());
    _exit(127);
}

} // anonymous namespace

std::string CommandSpec::ToString() const {
    return StringUtils::Join(argv, " ");
}

std::string CommandResult::ErrorText() const {
    std::string err = StringUtils::Trim(stderr_text);
    if (!err.empty()) {
        return err;
    }
    if (timed_out) {
        return "command timed out";
    }
    return StringUtils::Trim(stdout_text);
}

// ============================================================================
// ProcessRunner
// ============================================================================

CommandResult ProcessRunner::Run(const CommandSpec& spec) {
    CommandResult result;
    if (spec.argv.empty()) {
        result.spawn_failed = true;
        result.stderr_text = "empty command";
        return result;
    }

    PreparedExec exec(spec);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.spawn_failed = true;
        result.stderr_text = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.spawn_failed = true;
        result.stderr_text = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            close(fd);
        }
        result.spawn_failed = true;
        result.stderr_text = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        ExecChild(spec, exec);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    char buf[4096];
    int status = 0;

    while (true) {
        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        AppendLimited(result.stdout_text, buf, n, spec.max_output_bytes);
        n = read(err_pipe[0], buf, sizeof(buf));
        AppendLimited(result.stderr_text, buf, n, spec.max_output_bytes);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            spdlog::warn("Command timed out after {}ms: {}", spec.timeout.count(), spec.argv[0]);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    // Drain whatever is left in the pipes
    for (int fd : {out_pipe[0], err_pipe[0]}) {
        std::string& dst = (fd == out_pipe[0]) ? result.stdout_text : result.stderr_text;
        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n <= 0) {
                break;
            }
            AppendLimited(dst, buf, n, spec.max_output_bytes);
        }
        close(fd);
    }

    if (result.timed_out) {
        result.exit_code = 124;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    spdlog::debug("Command exited {}: {}", result.exit_code, spec.ToString());
    return result;
}

long ProcessRunner::StartBackground(const CommandSpec& spec) {
    if (spec.argv.empty()) {
        return -1;
    }

    PreparedExec exec(spec);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("fork failed for {}: {}", spec.argv[0], std::strerror(errno));
        return -1;
    }

    if (pid == 0) {
        setsid();
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        if (spec.output_file) {
            int out = open(spec.output_file->c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0640);
            if (out >= 0) {
                dup2(out, STDOUT_FILENO);
                dup2(out, STDERR_FILENO);
                close(out);
            }
        }
        ExecChild(spec, exec);
    }

    spdlog::debug("Started background process {}: {}", pid, spec.ToString());
    return static_cast<long>(pid);
}

bool ProcessRunner::IsRunning(long pid) {
    if (pid <= 0) {
        return false;
    }

    int status = 0;
    pid_t w = waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
    if (w == 0) {
        return true;
    }
    if (w == static_cast<pid_t>(pid)) {
        return false;
    }

    // Not our child (e.g. after a restart): fall back to a signal probe
    return kill(static_cast<pid_t>(pid), 0) == 0;
}

void ProcessRunner::Terminate(long pid, std::chrono::milliseconds grace) {
    if (pid <= 0) {
        return;
    }

    auto p = static_cast<pid_t>(pid);
    if (kill(p, SIGTERM) != 0) {
        // Already gone; reap if it is ours
        waitpid(p, nullptr, WNOHANG);
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!IsRunning(pid)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    spdlog::warn("Process {} ignored SIGTERM, killing", pid);
    kill(-p, SIGKILL);
    kill(p, SIGKILL);
    waitpid(p, nullptr, 0);
}

} // namespace utils
} // namespace cerberus

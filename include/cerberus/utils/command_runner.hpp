/**
 * @file command_runner.hpp
 * @brief External process execution with timeouts
 *
 * Every sandbox backend is driven through an external CLI (docker, jailer,
 * ip, terraform). CommandRunner is the single seam through which those tools
 * are invoked, which lets the providers be exercised against scripted
 * runners in tests.
 *
 * **Execution model**:
 * - argv is passed straight to execvp, no shell is involved
 * - stdout and stderr are captured separately through non-blocking pipes
 * - on timeout the whole process group receives SIGKILL and exit code 124
 *   is reported
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cerberus {
namespace utils {

/**
 * @struct CommandSpec
 * @brief One process invocation
 */
struct CommandSpec {
    std::vector<std::string> argv;                  ///< argv[0] is resolved through PATH
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> env;         ///< Added on top of the inherited environment
    std::chrono::milliseconds timeout{60000};
    std::size_t max_output_bytes{4 * 1024 * 1024};  ///< Per stream
    std::optional<std::string> output_file;         ///< StartBackground only: append stdout/stderr here

    /// Space-separated argv, for logging only
    std::string ToString() const;
};

/**
 * @struct CommandResult
 * @brief Captured outcome of a finished (or killed) process
 */
struct CommandResult {
    int exit_code{-1};         ///< 124 on timeout, 127 when exec failed, 128+N when killed by signal N
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out{false};
    bool spawn_failed{false};  ///< fork/pipe failed; nothing was run

    bool Ok() const { return !timed_out && !spawn_failed && exit_code == 0; }

    /// stderr if non-empty, otherwise stdout, trimmed
    std::string ErrorText() const;
};

/**
 * @class CommandRunner
 * @brief Abstract process launcher
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run to completion (or timeout) and capture output
    virtual CommandResult Run(const CommandSpec& spec) = 0;

    /**
     * @brief Start a long-lived process without waiting for it
     *
     * Output goes to spec.output_file when set, otherwise to /dev/null; the
     * process gets its own session.
     *
     * @return PID of the child, or -1 if it could not be started
     */
    virtual long StartBackground(const CommandSpec& spec) = 0;

    /**
     * @brief Check whether a background process is still alive
     *
     * Reaps the child if it has exited.
     */
    virtual bool IsRunning(long pid) = 0;

    /**
     * @brief SIGTERM, wait up to @p grace, then SIGKILL
     */
    virtual void Terminate(long pid, std::chrono::milliseconds grace) = 0;
};

/**
 * @class ProcessRunner
 * @brief fork/exec implementation of CommandRunner
 *
 * **Thread Safety**: Run() may be called concurrently from multiple threads.
 */
class ProcessRunner : public CommandRunner {
public:
    CommandResult Run(const CommandSpec& spec) override;
    long StartBackground(const CommandSpec& spec) override;
    bool IsRunning(long pid) override;
    void Terminate(long pid, std::chrono::milliseconds grace) override;
};

} // namespace utils
} // namespace cerberus

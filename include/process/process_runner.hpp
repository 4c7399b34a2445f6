#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace cellbuild {

/**
 * ProcessRunner - Runs one external executable to completion
 *
 * Responsibilities:
 * - Resolve the executable from an explicit directory or via PATH
 * - Overlay caller-supplied variables on the current process environment
 * - Stream stdout/stderr line-by-line to callbacks as output arrives
 * - Enforce an optional timeout and honour a cancellation flag
 * - Never leave a child behind: every exit path kills and reaps it
 *
 * Platform Support: POSIX (fork/exec/poll)
 */
class ProcessRunner {
public:
    using LineCallback = std::function<void(const std::string&)>;
    using EnvironmentOverrides = std::vector<std::pair<std::string, std::string>>;

    /**
     * One process invocation
     */
    struct ProcessRequest {
        std::string working_directory;       // Empty = inherit
        std::string executable;              // Name (PATH lookup) or path
        std::string executable_path;         // Optional directory holding `executable`
        std::vector<std::string> args;       // Arguments, excluding argv[0]
        EnvironmentOverrides environment;    // Merged over the current environment
        std::chrono::milliseconds timeout{0};// Zero = wait indefinitely

        // Called once per line, without the line terminator.
        // Empty callbacks echo to std::cout / std::cerr.
        LineCallback on_stdout;
        LineCallback on_stderr;

        // Polled while the child runs; when set the child is killed
        const std::atomic<bool>* cancel_flag = nullptr;
    };

    ProcessRunner() = default;
    virtual ~ProcessRunner() = default;

    /**
     * Run the process and block until it exits.
     *
     * Process:
     * 1. Build argv/envp in the parent
     * 2. Fork; child joins its own process group, redirects stdout/stderr
     *    to pipes, changes directory, execs
     * 3. Child chdir/exec failures are reported through a close-on-exec pipe
     * 4. Parent polls the pipes, forwarding complete lines, and checks the
     *    deadline and cancellation flag between polls
     *
     * @return Exit status (WEXITSTATUS, or 128 + signal number)
     * @throws ProcessInvocationError if the executable could not be started
     * @throws ProcessTimeoutError if the timeout elapsed (child killed)
     * @throws ProcessCancelledError if cancel_flag was raised (child killed)
     * @throws std::runtime_error on pipe/fork failure
     */
    virtual int run(const ProcessRequest& request);

    /**
     * Full command line as it would be executed, for logging.
     */
    static std::string describe(const ProcessRequest& request);

    /**
     * Merge overrides into `base` ("NAME=VALUE" entries). Existing names are
     * replaced in place, new names are appended.
     */
    static std::vector<std::string> merge_environment(
        const std::vector<std::string>& base,
        const EnvironmentOverrides& overrides);

private:
    /**
     * Path handed to execvp: `executable_path/executable` when a directory is
     * supplied, otherwise `executable` unchanged.
     */
    static std::string resolve_executable(const ProcessRequest& request);
};

} // namespace cellbuild

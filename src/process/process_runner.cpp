#include "process/process_runner.hpp"
#include "core/errors.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

extern char** environ;

namespace cellbuild {

namespace {

// Console echo is shared by every runner on every thread
std::mutex& console_mutex() {
    static std::mutex m;
    return m;
}

void echo_stdout(const std::string& line) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cout << line << "\n";
}

void echo_stderr(const std::string& line) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << line << "\n";
}

/**
 * Splits a byte stream into lines and forwards each complete one.
 */
class LineSplitter {
public:
    explicit LineSplitter(const ProcessRunner::LineCallback& cb) : cb_(cb) {}

    void feed(const char* data, size_t size) {
        pending_.append(data, size);
        size_t start = 0;
        size_t nl;
        while ((nl = pending_.find('\n', start)) != std::string::npos) {
            emit(pending_.substr(start, nl - start));
            start = nl + 1;
        }
        pending_.erase(0, start);
    }

    void flush() {
        if (!pending_.empty()) {
            emit(pending_);
            pending_.clear();
        }
    }

private:
    void emit(std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        cb_(line);
    }

    const ProcessRunner::LineCallback& cb_;
    std::string pending_;
};

/**
 * Owns a file descriptor, closing it on scope exit.
 */
class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

/**
 * Kills and reaps the child's process group unless it was already reaped.
 */
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (!reaped_) kill_and_reap();
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    pid_t pid() const { return pid_; }

    void mark_reaped(int status) {
        reaped_ = true;
        status_ = status;
    }

    int status() const { return status_; }

    void kill_and_reap() {
        if (reaped_) return;
        kill(-pid_, SIGKILL);
        kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        mark_reaped(status);
    }

private:
    pid_t pid_;
    bool reaped_ = false;
    int status_ = 0;
};

// Close-on-exec from creation so children spawned concurrently by other
// threads never inherit another invocation's pipe ends
void make_pipe(int fds[2], const char* what) {
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(
            std::string("Failed to create ") + what + " pipe: " + strerror(errno));
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Reads whatever is available. Returns false once the write end is closed.
bool drain(int fd, LineSplitter& splitter) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            splitter.feed(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        // Process was killed by signal
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

// =============================================================================
// Helpers
// =============================================================================

std::string ProcessRunner::resolve_executable(const ProcessRequest& request) {
    if (request.executable_path.empty()) {
        return request.executable;
    }
    std::string dir = request.executable_path;
    while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
    return dir + "/" + request.executable;
}

std::string ProcessRunner::describe(const ProcessRequest& request) {
    std::ostringstream cmd;
    cmd << resolve_executable(request);
    for (const auto& arg : request.args) {
        if (arg.find(' ') != std::string::npos) {
            cmd << " \"" << arg << "\"";
        } else {
            cmd << " " << arg;
        }
    }
    return cmd.str();
}

std::vector<std::string> ProcessRunner::merge_environment(
    const std::vector<std::string>& base,
    const EnvironmentOverrides& overrides) {

    std::vector<std::string> merged = base;
    for (const auto& [name, value] : overrides) {
        if (name.empty()) continue;
        std::string prefix = name + "=";
        bool replaced = false;
        for (auto& entry : merged) {
            if (entry.compare(0, prefix.size(), prefix) == 0) {
                entry = prefix + value;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            merged.push_back(prefix + value);
        }
    }
    return merged;
}

// =============================================================================
// run
// =============================================================================

int ProcessRunner::run(const ProcessRequest& request) {
    if (request.executable.empty()) {
        throw ProcessInvocationError("Cannot execute empty command");
    }

    LineCallback out_cb = request.on_stdout ? request.on_stdout : LineCallback(echo_stdout);
    LineCallback err_cb = request.on_stderr ? request.on_stderr : LineCallback(echo_stderr);

    // Everything the child needs is built before fork
    const std::string exe = resolve_executable(request);

    std::vector<std::string> args;
    args.reserve(request.args.size() + 1);
    args.push_back(exe);
    args.insert(args.end(), request.args.begin(), request.args.end());

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> current_env;
    for (char** e = environ; e && *e; ++e) {
        current_env.emplace_back(*e);
    }
    std::vector<std::string> env_entries = merge_environment(current_env, request.environment);
    std::vector<char*> envp;
    for (auto& entry : env_entries) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    int status_pipe[2];

    make_pipe(stdout_pipe, "stdout");
    FdGuard out_read(stdout_pipe[0]);
    FdGuard out_write(stdout_pipe[1]);

    make_pipe(stderr_pipe, "stderr");
    FdGuard err_read(stderr_pipe[0]);
    FdGuard err_write(stderr_pipe[1]);

    make_pipe(status_pipe, "status");
    FdGuard status_read(status_pipe[0]);
    FdGuard status_write(status_pipe[1]);

    auto start_time = std::chrono::steady_clock::now();

    pid_t pid = fork();

    if (pid < 0) {
        throw std::runtime_error(
            std::string("Failed to fork process: ") + strerror(errno));
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        close(status_pipe[0]);

        int child_errno = 0;
        if (!request.working_directory.empty() &&
            chdir(request.working_directory.c_str()) != 0) {
            child_errno = errno;
        } else {
            environ = envp.data();
            execvp(argv[0], argv.data());
            child_errno = errno;
        }

        // If we get here, chdir or execvp failed
        ssize_t ignored = write(status_pipe[1], &child_errno, sizeof(child_errno));
        (void)ignored;
        _exit(127);  // Use _exit to avoid flushing parent's buffers
    }

    // Parent process
    setpgid(pid, pid);
    ChildGuard child(pid);

    out_write.reset();
    err_write.reset();
    status_write.reset();

    // Blocks until exec succeeds (pipe closed by CLOEXEC) or the child reports
    int child_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        child.kill_and_reap();
        throw ProcessInvocationError(
            "Failed to execute " + exe +
            (request.working_directory.empty() ? "" : " in " + request.working_directory) +
            ": " + strerror(child_errno));
    }

    set_nonblocking(out_read.get());
    set_nonblocking(err_read.get());

    LineSplitter out_lines(out_cb);
    LineSplitter err_lines(err_cb);
    bool stdout_open = true;
    bool stderr_open = true;

    const bool has_timeout = request.timeout.count() > 0;
    const auto deadline = start_time + request.timeout;

    while (true) {
        if (request.cancel_flag && request.cancel_flag->load()) {
            child.kill_and_reap();
            throw ProcessCancelledError("Process cancelled: " + exe);
        }

        if (has_timeout && std::chrono::steady_clock::now() >= deadline) {
            child.kill_and_reap();
            throw ProcessTimeoutError(
                "Process timed out after " + std::to_string(request.timeout.count()) +
                "ms: " + exe);
        }

        if (stdout_open || stderr_open) {
            pollfd fds[2];
            nfds_t nfds = 0;
            if (stdout_open) fds[nfds++] = pollfd{out_read.get(), POLLIN, 0};
            if (stderr_open) fds[nfds++] = pollfd{err_read.get(), POLLIN, 0};

            // Wait for data with timeout
            int ready = poll(fds, nfds, 10);
            if (ready < 0 && errno != EINTR) {
                throw std::runtime_error(
                    std::string("Failed to poll child output: ") + strerror(errno));
            }
            if (ready > 0) {
                if (stdout_open) stdout_open = drain(out_read.get(), out_lines);
                if (stderr_open) stderr_open = drain(err_read.get(), err_lines);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        // Check if child has exited
        int status = 0;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            child.mark_reaped(status);

            // Final reads; grandchildren may still hold the pipes open
            if (stdout_open) drain(out_read.get(), out_lines);
            if (stderr_open) drain(err_read.get(), err_lines);
            break;
        }
        if (result < 0 && errno != EINTR) {
            throw std::runtime_error(
                std::string("Failed to wait for child process: ") + strerror(errno));
        }
    }

    out_lines.flush();
    err_lines.flush();

    return decode_status(child.status());
}

} // namespace cellbuild

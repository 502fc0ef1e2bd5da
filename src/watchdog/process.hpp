#pragma once

#include "core/environment.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// How a child process ended. `code` is set for a normal exit,
/// `signal` is non-zero when it was killed by a signal.
struct ExitStatus {
    std::optional<int> code;
    int signal = 0;
};

/// Child process with piped stdout/stderr and stdin on /dev/null.
/// The child leads its own process group so kill() also reaches anything it
/// forked. Destroying a still-running child kills and reaps it.
class ChildProcess {
public:
    /// Start argv[0] (PATH lookup) with the Environment marker injected.
    /// Returns nullptr and fills `error` if the pipes, fork or exec fail.
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                               std::string& error);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    /// Non-blocking wait; nullopt while the child is alive
    std::optional<ExitStatus> try_wait();

    /// Blocking wait
    ExitStatus wait();

    /// SIGKILL the child's process group
    void kill();

    bool exited() const { return status_.has_value(); }

private:
    ChildProcess(pid_t pid, int out_fd, int err_fd);

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<ExitStatus> status_;
};

/// Cut `line` to MAX_LINE_BYTES (on a UTF-8 boundary) plus TRUNCATION_MARKER
std::string truncate_line(std::string line);

/// Read `fd` until EOF and hand each line (without the newline) to `on_line`.
/// A trailing partial line is delivered at EOF. A line longer than
/// MAX_LINE_BYTES is delivered once through truncate_line() and the rest of
/// it is dropped. When `abandon` is given the reader also gives up once it
/// is set and the pipe has been idle for one 50 ms poll, so a grandchild
/// holding the pipe open cannot stall a stop.
void read_lines(int fd, const std::function<void(std::string)>& on_line,
                const std::atomic<bool>* abandon = nullptr);

/// Expand, split and run a command line with all output discarded.
/// Returns the exit code, or nullopt on a split/spawn failure or a signal.
std::optional<int> run_command_quiet(const std::string& cmdline, const Environment& env);

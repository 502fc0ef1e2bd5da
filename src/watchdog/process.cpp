#include "watchdog/process.hpp"
#include "core/cmdline.hpp"
#include "watchdog/watchdog_config.hpp"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

// Workers fork concurrently; the flag must be set before another fork can
// inherit the descriptors.
int make_cloexec_pipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC);
#else
    if (::pipe(fds) != 0) return -1;
    for (int i = 0; i < 2; ++i) {
        int flags = ::fcntl(fds[i], F_GETFD);
        if (flags < 0 || ::fcntl(fds[i], F_SETFD, flags | FD_CLOEXEC) < 0) {
            ::close(fds[0]);
            ::close(fds[1]);
            return -1;
        }
    }
    return 0;
#endif
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ExitStatus decode_status(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

// Environment block for the child: the current environment plus the marker.
// Built before fork so the child only has to assign `environ`.
class ChildEnv {
public:
    ChildEnv() {
        std::string marker_prefix = std::string(Environment::MARKER_NAME) + "=";
        for (char** e = environ; e && *e; ++e) {
            if (std::strncmp(*e, marker_prefix.c_str(), marker_prefix.size()) == 0) continue;
            storage_.emplace_back(*e);
        }
        storage_.push_back(marker_prefix + Environment::MARKER_VALUE);
        for (auto& s : storage_) ptrs_.push_back(const_cast<char*>(s.c_str()));
        ptrs_.push_back(nullptr);
    }

    char** data() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

// fork + exec with the given descriptors wired to stdout/stderr.
// Exec failures are reported through a close-on-exec status pipe.
pid_t fork_exec(const std::vector<std::string>& argv, int out_fd, int err_fd, std::string& error) {
    if (argv.empty()) {
        error = "empty command";
        return -1;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    ChildEnv env;

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull < 0) {
        error = std::string("open /dev/null: ") + std::strerror(errno);
        return -1;
    }

    int status_pipe[2];
    if (make_cloexec_pipe(status_pipe) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        ::close(devnull);
        return -1;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        ::close(devnull);
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return -1;
    }

    if (pid == 0) {
        // Child process
        ::setpgid(0, 0);
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_fd >= 0 ? out_fd : devnull, STDOUT_FILENO);
        ::dup2(err_fd >= 0 ? err_fd : devnull, STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        environ = env.data();
        ::execvp(args[0], args.data());

        int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    ::setpgid(pid, pid);
    ::close(devnull);
    ::close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        error = argv[0] + ": " + std::strerror(child_errno);
        return -1;
    }
    return pid;
}

} // namespace

std::string truncate_line(std::string line) {
    if (line.size() <= MAX_LINE_BYTES) return line;
    std::size_t cut = MAX_LINE_BYTES;
    // Do not split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(line[cut]) & 0xC0) == 0x80) --cut;
    line.resize(cut);
    line += TRUNCATION_MARKER;
    return line;
}

ChildProcess::ChildProcess(pid_t pid, int out_fd, int err_fd)
    : pid_(pid), stdout_fd_(out_fd), stderr_fd_(err_fd) {}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                  std::string& error) {
    int out_pipe[2];
    int err_pipe[2];
    if (make_cloexec_pipe(out_pipe) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        return nullptr;
    }
    if (make_cloexec_pipe(err_pipe) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return nullptr;
    }

    pid_t pid = fork_exec(argv, out_pipe[1], err_pipe[1], error);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    if (pid < 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        spdlog::debug("[spawn] failed: {}", error);
        return nullptr;
    }

    spdlog::debug("[spawn] pid={} cmd={}", pid, argv[0]);
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, out_pipe[0], err_pipe[0]));
}

ChildProcess::~ChildProcess() {
    if (!status_ && pid_ > 0) {
        kill();
        wait();
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

std::optional<ExitStatus> ChildProcess::try_wait() {
    if (status_) return status_;

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        status_ = decode_status(status);
    } else if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more to learn
        status_ = ExitStatus{};
    }
    return status_;
}

ExitStatus ChildProcess::wait() {
    if (status_) return *status_;

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    status_ = result == pid_ ? decode_status(status) : ExitStatus{};
    return *status_;
}

void ChildProcess::kill() {
    if (status_ || pid_ <= 0) return;
    if (::kill(-pid_, SIGKILL) != 0) {
        ::kill(pid_, SIGKILL);
    }
}

void read_lines(int fd, const std::function<void(std::string)>& on_line,
                const std::atomic<bool>* abandon) {
    std::string pending;
    bool discarding = false;  // past MAX_LINE_BYTES, dropping until newline
    char buf[4096];
    while (true) {
        if (abandon) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ready = ::poll(&pfd, 1, 50);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (ready == 0) {
                if (abandon->load()) break;
                continue;
            }
        }

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;

        std::size_t pos = 0;
        const std::size_t size = static_cast<std::size_t>(n);
        while (pos < size) {
            const char* nl = static_cast<const char*>(std::memchr(buf + pos, '\n', size - pos));
            std::size_t seg_end = nl ? static_cast<std::size_t>(nl - buf) : size;

            if (!discarding) {
                pending.append(buf + pos, seg_end - pos);
                if (pending.size() > MAX_LINE_BYTES) {
                    on_line(truncate_line(std::move(pending)));
                    pending.clear();
                    discarding = true;
                }
            }

            if (!nl) break;
            if (!discarding) {
                if (!pending.empty() && pending.back() == '\r') pending.pop_back();
                on_line(std::move(pending));
                pending.clear();
            }
            discarding = false;
            pos = seg_end + 1;
        }
    }
    if (!pending.empty() && !discarding) {
        on_line(std::move(pending));
    }
}

std::optional<int> run_command_quiet(const std::string& cmdline, const Environment& env) {
    auto argv = split_command_line(env.expand(cmdline));
    if (!argv || argv->empty()) {
        return std::nullopt;
    }

    std::string error;
    pid_t pid = fork_exec(*argv, -1, -1, error);
    if (pid < 0) {
        spdlog::debug("[spawn] quiet run failed: {}", error);
        return std::nullopt;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    if (result != pid) return std::nullopt;

    return decode_status(status).code;
}

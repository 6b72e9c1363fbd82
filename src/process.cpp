#include "process.h"
#include "constants.h"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <utility>

namespace confrun {

namespace {

// Owns a file descriptor and closes it on scope exit
class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

// One captured output stream
struct Capture {
    ScopedFd fd;
    std::string data;
    bool truncated = false;
    bool open = true;
};

bool make_pipe(ScopedFd& read_end, ScopedFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Read whatever is available without blocking; marks the capture closed on EOF
void drain(Capture& capture) {
    char buffer[PIPE_BUFFER_SIZE];
    while (capture.open) {
        ssize_t n = read(capture.fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = MAX_OUTPUT_SIZE - std::min(MAX_OUTPUT_SIZE, capture.data.size());
            size_t take = std::min(room, static_cast<size_t>(n));
            capture.data.append(buffer, take);
            if (take < static_cast<size_t>(n)) {
                capture.truncated = true;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EOF or hard error
        capture.open = false;
        capture.fd.reset();
    }
}

std::string finish(Capture& capture) {
    if (capture.truncated) {
        capture.data += "\n[output truncated]\n";
    }
    return std::move(capture.data);
}

// Negative pid targets the whole process group. The direct child is only
// signalled by pid while it is known to be unreaped.
void kill_group(pid_t pid, bool leader_unreaped) {
    if (kill(-pid, SIGKILL) < 0 && errno == ESRCH && leader_unreaped) {
        kill(pid, SIGKILL);
    }
}

std::string describe_signal(int sig) {
    const char* name = strsignal(sig);
    return "terminated by signal " + std::to_string(sig) +
           (name ? std::string(" (") + name + ")" : std::string());
}

} // namespace

ProcessOutcome run_process(const std::vector<std::string>& argv,
                           std::chrono::milliseconds timeout) {
    ProcessOutcome outcome;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    if (argv.empty() || argv[0].empty()) {
        outcome.error = "empty command";
        return outcome;
    }

    Capture out;
    Capture err;
    ScopedFd out_write, err_write;
    ScopedFd exec_read, exec_write;
    if (!make_pipe(out.fd, out_write) || !make_pipe(err.fd, err_write) ||
        !make_pipe(exec_read, exec_write)) {
        outcome.error = std::string("pipe: ") + std::strerror(errno);
        return outcome;
    }

    ScopedFd dev_null(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.valid()) {
        outcome.error = std::string("open /dev/null: ") + std::strerror(errno);
        return outcome;
    }

    // Build the argument vector before fork; the child must not allocate
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        outcome.error = std::string("fork: ") + std::strerror(errno);
        return outcome;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        setpgid(0, 0);

        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &sa, nullptr);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (dup2(dev_null.get(), STDIN_FILENO) < 0 ||
            dup2(out_write.get(), STDOUT_FILENO) < 0 ||
            dup2(err_write.get(), STDERR_FILENO) < 0) {
            int code = errno;
            ssize_t ignored = write(exec_write.get(), &code, sizeof(code));
            (void)ignored;
            _exit(127);
        }

        execv(args[0], args.data());

        int code = errno;
        ssize_t ignored = write(exec_write.get(), &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    // Parent. Also set the group here to close the race with kill_group().
    setpgid(pid, pid);
    out_write.reset();
    err_write.reset();
    exec_write.reset();
    dev_null.reset();

    // exec_read reaches EOF once execv succeeds (close-on-exec)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_read.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    exec_read.reset();

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        outcome.error = "cannot execute " + argv[0] + ": " + std::strerror(exec_errno);
        return outcome;
    }

    fcntl(out.fd.get(), F_SETFL, fcntl(out.fd.get(), F_GETFL) | O_NONBLOCK);
    fcntl(err.fd.get(), F_SETFL, fcntl(err.fd.get(), F_GETFL) | O_NONBLOCK);

    int status = 0;
    bool exited = false;
    bool timed_out = false;

    while (!exited) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill_group(pid, true);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, POLL_INTERVAL_MS));

        struct pollfd fds[2];
        nfds_t nfds = 0;
        Capture* targets[2];
        for (Capture* capture : {&out, &err}) {
            if (capture->open) {
                fds[nfds].fd = capture->fd.get();
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                targets[nfds] = capture;
                ++nfds;
            }
        }

        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0 && errno != EINTR) {
            int code = errno;
            kill_group(pid, true);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            outcome.error = std::string("poll: ") + std::strerror(code);
            return outcome;
        }
        for (nfds_t i = 0; ready > 0 && i < nfds; ++i) {
            if (fds[i].revents != 0) {
                drain(*targets[i]);
            }
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
        } else if (waited < 0 && errno != EINTR) {
            int code = errno;
            kill_group(pid, false);
            outcome.error = std::string("waitpid: ") + std::strerror(code);
            return outcome;
        }
    }

    // Collect what is left in the pipes, then kill any descendants still
    // holding them open.
    if (out.open) drain(out);
    if (err.open) drain(err);
    kill_group(pid, false);

    outcome.stdout_output = finish(out);
    outcome.stderr_output = finish(err);

    if (timed_out) {
        outcome.kind = ProcessOutcome::Kind::TIMED_OUT;
        outcome.error = "deadline of " + std::to_string(timeout.count()) + " ms exceeded";
    } else if (WIFEXITED(status)) {
        outcome.kind = ProcessOutcome::Kind::EXITED;
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.kind = ProcessOutcome::Kind::LAUNCH_FAILED;
        outcome.term_signal = WTERMSIG(status);
        outcome.error = describe_signal(outcome.term_signal);
    } else {
        outcome.kind = ProcessOutcome::Kind::LAUNCH_FAILED;
        outcome.error = "unexpected wait status " + std::to_string(status);
    }

    return outcome;
}

} // namespace confrun

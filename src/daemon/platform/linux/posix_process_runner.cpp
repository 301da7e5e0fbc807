#include "platform/linux/posix_process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Owns one descriptor; closing twice is harmless.
struct Fd {
    int fd = -1;

    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    bool open() const { return fd >= 0; }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

std::string errno_message(const char* what) {
    return std::format("{} failed: {}", what, std::strerror(errno));
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Reads whatever is available. Closes the descriptor on EOF or error.
void read_available(Fd& fd, std::string& sink) {
    char buf[4096];
    while (fd.open()) {
        ssize_t n = ::read(fd.fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        fd.reset();
    }
}

} // namespace

std::expected<ProcessResult, std::string>
PosixProcessRunner::run(const std::vector<std::string>& argv, const std::string& stdin_data,
                        std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    // stdin is a socket so writes to a child that stopped reading fail with
    // EPIPE instead of raising SIGPIPE.
    int in_pair[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, in_pair) < 0) {
        return std::unexpected(errno_message("socketpair()"));
    }
    Fd in_parent(in_pair[0]), in_child(in_pair[1]);

    int p[2];
    if (::pipe2(p, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe2()"));
    Fd out_r(p[0]), out_w(p[1]);
    if (::pipe2(p, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe2()"));
    Fd err_r(p[0]), err_w(p[1]);
    // Carries errno back from a failed exec; closed by a successful one.
    if (::pipe2(p, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe2()"));
    Fd exec_r(p[0]), exec_w(p[1]);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        // Own process group, so a timeout can kill anything the child spawned.
        ::setpgid(0, 0);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(in_child.fd, STDIN_FILENO);
        ::dup2(out_w.fd, STDOUT_FILENO);
        ::dup2(err_w.fd, STDERR_FILENO);
        ::execvp(args[0], args.data());

        int e = errno;
        ssize_t ignored = ::write(exec_w.fd, &e, sizeof(e));
        (void)ignored;
        ::_exit(127);
    }

    in_child.reset();
    out_w.reset();
    err_w.reset();
    exec_w.reset();

    int exec_errno = 0;
    ssize_t n;
    while ((n = ::read(exec_r.fd, &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        return std::unexpected(std::format("cannot execute {}: {}",
                                           argv[0], std::strerror(exec_errno)));
    }

    if (stdin_data.empty()) {
        in_parent.reset();
    } else {
        set_nonblocking(in_parent.fd);
    }
    set_nonblocking(out_r.fd);
    set_nonblocking(err_r.fd);

    ProcessResult result;
    size_t written = 0;
    int status = 0;
    bool reaped = false;
    bool have_status = false;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            have_status = true;
        } else if (w < 0 && errno != EINTR) {
            reaped = true;
        }
        if (reaped) {
            // A backgrounded grandchild may keep the pipes open; take what is
            // already there and stop.
            read_available(out_r, result.out);
            read_available(err_r, result.err);
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            break;
        }
        auto step = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
                             std::chrono::milliseconds(50));

        pollfd fds[3];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_r.open()) { out_idx = static_cast<int>(nfds); fds[nfds++] = {out_r.fd, POLLIN, 0}; }
        if (err_r.open()) { err_idx = static_cast<int>(nfds); fds[nfds++] = {err_r.fd, POLLIN, 0}; }
        if (in_parent.open()) { in_idx = static_cast<int>(nfds); fds[nfds++] = {in_parent.fd, POLLOUT, 0}; }

        int rc = ::poll(nfds ? fds : nullptr, nfds, static_cast<int>(std::min<int64_t>(step.count(), INT_MAX)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            auto msg = errno_message("poll()");
            ::kill(-pid, SIGKILL);
            while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
            return std::unexpected(msg);
        }
        if (rc == 0) continue;

        if (out_idx >= 0 && fds[out_idx].revents) read_available(out_r, result.out);
        if (err_idx >= 0 && fds[err_idx].revents) read_available(err_r, result.err);

        if (in_idx >= 0 && fds[in_idx].revents) {
            if (fds[in_idx].revents & POLLOUT) {
                ssize_t s = ::send(in_parent.fd, stdin_data.data() + written,
                                   stdin_data.size() - written, MSG_NOSIGNAL);
                if (s > 0) written += static_cast<size_t>(s);
                else if (s < 0 && errno != EAGAIN && errno != EINTR) in_parent.reset();
                // Closing signals EOF to the child.
                if (written == stdin_data.size()) in_parent.reset();
            } else {
                in_parent.reset();
            }
        }
    }

    if (!reaped) {
        pid_t w;
        while ((w = ::waitpid(pid, &status, 0)) < 0 && errno == EINTR) {}
        have_status = (w == pid);
    }

    if (have_status) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }
    }

    return result;
}

#include "kiln/process_exec.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kiln {

namespace {

void close_fd(int &fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

} // namespace

Result<ProcessOutput> process_exec(std::vector<std::string> args, std::optional<std::chrono::milliseconds> timeout) {
    if (args.empty()) {
        return fail(ErrorKind::Io, "Cannot execute an empty command");
    }

    std::vector<char *> c_args;
    c_args.reserve(args.size() + 1);
    for (auto &a : args)
        c_args.push_back(a.data());
    c_args.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        return fail(ErrorKind::Io, std::format("pipe: {}", std::strerror(errno)));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return fail(ErrorKind::Io, std::format("pipe: {}", std::strerror(saved)));
    }

    // A group of its own lets a timeout take down everything the command
    // started. Without a timeout the child stays in ours and sees terminal
    // signals such as Ctrl-C.
    const bool own_group = timeout.has_value();
    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        for (int *fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]})
            close_fd(*fd);
        return fail(ErrorKind::Io, std::format("fork: {}", std::strerror(saved)));
    }
    if (pid == 0) {
        // Only async-signal-safe calls from here on.
        if (own_group)
            setpgid(0, 0);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    // Both sides set the group so a kill never races the child's setpgid.
    if (own_group)
        setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    // The whole group goes: `sh -c "a; b"` must not leave `b` running.
    auto kill_group = [pid, own_group] {
        if (!own_group || kill(-pid, SIGKILL) != 0)
            kill(pid, SIGKILL);
    };
    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds{0});
    auto millis_left = [&deadline] {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return std::max<long long>(left.count(), 0);
    };

    ProcessOutput result;
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string *sinks[2] = {&result.out, &result.err};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int wait_ms = -1;
        if (timeout) {
            if (millis_left() == 0) {
                kill_group();
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(millis_left());
        }

        int rc = poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            int saved = errno;
            kill_group();
            waitpid(pid, nullptr, 0);
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            return fail(ErrorKind::Io, std::format("poll: {}", std::strerror(saved)));
        }

        for (int k = 0; k < 2; ++k) {
            if (fds[k].fd < 0 || (fds[k].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                continue;
            ssize_t n = read(fds[k].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[k]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[k].fd = -1;
                --open_fds;
            }
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    // A child that closed its output early is still bound by the deadline.
    int status = 0;
    constexpr int TUNABLE__reap_poll_ms = 10;
    while (true) {
        pid_t rc = waitpid(pid, &status, (timeout && !result.timed_out) ? WNOHANG : 0);
        if (rc == pid)
            break;
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            int saved = errno;
            kill_group();
            return fail(ErrorKind::Io, std::format("waitpid: {}", std::strerror(saved)));
        }
        if (millis_left() == 0) {
            kill_group();
            result.timed_out = true;
            continue;
        }
        poll(nullptr, 0, static_cast<int>(std::min<long long>(millis_left(), TUNABLE__reap_poll_ms)));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = 1;
    }
    return result;
}

} // namespace kiln

#include "CodeCapture.h"

namespace Capture {

namespace {

constexpr size_t kMaxCapturedBytes = 4 * 1024 * 1024;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Reads whatever is available. Closes the descriptor on EOF or error.
void drain_fd(int& fd, std::string& sink, bool& truncated) {
    char chunk[4096];
    while (fd >= 0) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            size_t room = sink.size() < kMaxCapturedBytes ? kMaxCapturedBytes - sink.size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            sink.append(chunk, take);
            if (take < static_cast<size_t>(n)) truncated = true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        close_fd(fd);
    }
}

void kill_group(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    TRACE_FN("argv=", join_args(argv), ", cwd=", options.cwd);
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    const char* child_cwd = options.cwd.empty() ? nullptr : options.cwd.c_str();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(status_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe() failed: ") + strerror(errno);
        for (int* p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    pid_t pid = fork();

    if (pid < 0) {
        result.error = std::string("fork() failed: ") + strerror(errno);
        for (int* p : {out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process: own process group so a timeout can take down
        // anything the script spawned.
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        int child_errno = 0;
        if (child_cwd && chdir(child_cwd) != 0) {
            child_errno = errno;
            if (write(status_pipe[1], &child_errno, sizeof(child_errno)) < 0) {}
            _exit(127);
        }

        execvp(cargv[0], cargv.data());

        // If execvp returns, it failed
        child_errno = errno;
        if (write(status_pipe[1], &child_errno, sizeof(child_errno)) < 0) {}
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    int status = 0;

    // The status pipe closes on successful exec; an errno arriving means
    // chdir or exec failed in the child.
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_fd);
        close_fd(err_fd);
        result.error = "cannot start '" + argv[0] + "': " + strerror(child_errno);
        return result;
    }

    result.started = true;

    for (int fd : {out_fd, err_fd}) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    using clock = std::chrono::steady_clock;
    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = clock::now() + options.timeout;
    bool reaped = false;
    bool out_truncated = false;
    bool err_truncated = false;

    while (true) {
        if (has_deadline && clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        if (out_fd < 0 && err_fd < 0) {
            // Streams closed; wait for the exit status.
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                reaped = true;
                break;
            }
            if (r < 0 && errno != EINTR) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        int wait_ms = -1;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            wait_ms = static_cast<int>(std::max<long long>(0, std::min<long long>(remaining, 1000)));
        }

        struct pollfd pfds[2];
        nfds_t count = 0;
        if (out_fd >= 0) pfds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) pfds[count++] = {err_fd, POLLIN, 0};

        int poll_result = poll(pfds, count, wait_ms);
        if (poll_result < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll() failed: ") + strerror(errno);
            kill_group(pid);
            break;
        }
        if (poll_result == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (pfds[i].revents == 0) continue;
            if (pfds[i].fd == out_fd) drain_fd(out_fd, result.out, out_truncated);
            else if (pfds[i].fd == err_fd) drain_fd(err_fd, result.err, err_truncated);
        }
    }

    if (result.timed_out) kill_group(pid);

    close_fd(out_fd);
    close_fd(err_fd);

    if (!reaped) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    if (out_truncated) result.out += "\n[output truncated]\n";
    if (err_truncated) result.err += "\n[output truncated]\n";

    TRACE_MSG("run_process done exit=", result.exit_code, " signal=", result.term_signal,
              " timed_out=", result.timed_out);
    return result;
}

int run_attached(const std::vector<std::string>& argv) {
    if (argv.empty()) return -1;

    std::vector<char*> cargv;
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return -1;
    if (pid == 0) {
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

}

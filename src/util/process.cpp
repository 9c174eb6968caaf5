#include "util/process.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <tuple>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandpool::util {

namespace {

// Writes to a child that exited early must fail with EPIPE, not kill us
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Pipe ends never leak into children forked by concurrent calls
bool make_pipe(int fds[2]) {
    return pipe2(fds, O_CLOEXEC) == 0;
}

// Child side: dup2 onto a standard fd, which clears FD_CLOEXEC on the copy
void redirect(int fd, int target) {
    if (fd == target) {
        fcntl(fd, F_SETFD, 0);
    } else {
        dup2(fd, target);
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    ignore_sigpipe();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (!make_pipe(stdin_pipe) || !make_pipe(stdout_pipe) || !make_pipe(stderr_pipe)) {
        result.error = std::string("pipe() failed: ") + strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        result.error = std::string("fork() failed: ") + strerror(errno);
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        redirect(stdin_pipe[0], STDIN_FILENO);
        redirect(stdout_pipe[1], STDOUT_FILENO);
        redirect(stderr_pipe[1], STDERR_FILENO);

        // Remaining pipe ends are close-on-exec
        execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    result.started = true;

    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];
    fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL, 0) | O_NONBLOCK);

    size_t written = 0;
    if (options.stdin_data.empty()) {
        close_fd(in_fd);
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options.timeout_ms);
    char buffer[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = -1;
        if (options.timeout_ms > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_fd >= 0) { out_idx = nfds; fds[nfds++] = {out_fd, POLLIN, 0}; }
        if (err_fd >= 0) { err_idx = nfds; fds[nfds++] = {err_fd, POLLIN, 0}; }
        if (in_fd >= 0)  { in_idx = nfds;  fds[nfds++] = {in_fd, POLLOUT, 0}; }

        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll() failed: ") + strerror(errno);
            break;
        }
        if (ready == 0) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t n = write(in_fd, options.stdin_data.data() + written,
                              options.stdin_data.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            }
            if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
                written >= options.stdin_data.size()) {
                close_fd(in_fd);
            }
        }

        for (auto [idx, fd, sink] : {std::make_tuple(out_idx, &out_fd, &result.stdout_data),
                                     std::make_tuple(err_idx, &err_fd, &result.stderr_data)}) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(*fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(*fd);
            }
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    if (result.timed_out) {
        spdlog::debug("Process {} (pid={}) timed out after {}ms, killing",
                      argv[0], pid, options.timeout_ms);
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("waitpid() failed: ") + strerror(errno);
            return result;
        }
    }
    result.exit_code = decode_status(status);

    if (result.exit_code == 127 && result.stdout_data.empty() && result.stderr_data.empty()) {
        result.error = "failed to execute " + argv[0];
    }
    return result;
}

} // namespace sandpool::util

#include "process_runner.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace svcdeck {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads whatever is available; returns false on EOF or error
bool drain(int fd, std::string& out) {
    char buffer[4096];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

ProcessOutput run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcessOutput result;
    if (argv.empty()) {
        result.error_message = "empty command line";
        return result;
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::format("pipe failed: {}", std::strerror(errno));
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return result;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::format("fork failed: {}", std::strerror(errno));
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) ::dup2(null_fd, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());

        int err = errno;
        ssize_t written = ::write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on successful exec (CLOEXEC); otherwise it carries errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_child(pid);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.error_message = std::format("cannot execute {}: {}", argv[0], std::strerror(exec_errno));
        return result;
    }
    result.started = true;

    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_pipe[0] >= 0) fds[count++] = {out_pipe[0], POLLIN, 0};
        if (err_pipe[0] >= 0) fds[count++] = {err_pipe[0], POLLIN, 0};

        int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error_message = std::format("poll failed: {}", std::strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_pipe[0]) {
                if (!drain(out_pipe[0], result.stdout_text)) close_fd(out_pipe[0]);
            } else if (fds[i].fd == err_pipe[0]) {
                if (!drain(err_pipe[0], result.stderr_text)) close_fd(err_pipe[0]);
            }
        }
    }

    if (result.timed_out || !result.error_message.empty()) {
        ::kill(pid, SIGKILL);
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    result.exit_code = wait_child(pid);
    if (result.timed_out) {
        spdlog::warn("{} timed out after {} ms, killed", argv[0], timeout.count());
        result.error_message = std::format("{} timed out after {} s", argv[0], timeout.count() / 1000.0);
    }
    return result;
}

std::string describe_failure(const ProcessOutput& output, const std::string& program) {
    if (!output.error_message.empty()) return output.error_message;

    std::string text = output.stderr_text;
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) text.pop_back();
    if (text.empty()) {
        return std::format("{} exited with status {}", program, output.exit_code);
    }
    return text;
}

} // namespace svcdeck

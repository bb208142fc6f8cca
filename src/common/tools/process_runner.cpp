// common/tools/process_runner.cpp
#include "common/tools/process_runner.h"
#include "common/utils/text_utils.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentgraph {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads what is available; returns false on EOF.
bool drain(int fd, std::string& out, size_t cap) {
    char buf[4096];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        size_t room = out.size() < cap ? cap - out.size() : 0;
        out.append(buf, std::min(room, static_cast<size_t>(n)));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // namespace

ProcessResult PosixProcessRunner::run(const std::string& executable,
                                      const std::vector<std::string>& args,
                                      int timeout_sec,
                                      const std::string& working_dir) {
    ProcessResult result = capture(executable, args, timeout_sec, working_dir);
    // 截断可能切开多字节字符，子进程也可能输出任意字节
    result.stdout_text = truncate(sanitize_utf8(result.stdout_text), max_output_bytes_);
    result.stderr_text = truncate(sanitize_utf8(result.stderr_text), max_output_bytes_);
    return result;
}

ProcessResult PosixProcessRunner::capture(const std::string& executable,
                                          const std::vector<std::string>& args,
                                          int timeout_sec,
                                          const std::string& working_dir) {
    ProcessResult result;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // CLOEXEC：exec 成功时自动关闭
    if (::pipe(out_pipe) != 0 || ::pipe(err_pipe) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(executable);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    if (child == 0) {
        // 子进程：独立进程组，超时时可整体终止
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        ::close(exec_pipe[0]);
        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int err = errno;
            (void)::write(exec_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvp(executable.c_str(), argv.data());
        int err = errno;
        (void)::write(exec_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::setpgid(child, child);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    close_fd(exec_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(child, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.exit_code = 127;
        result.error = "Failed to launch '" + executable + "': " + std::strerror(exec_errno);
        result.stderr_text = result.error;
        spdlog::warn("{}", result.error);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(timeout_sec, 0));
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (remain <= 0) {
            result.timed_out = true;
            break;
        }
        struct pollfd fds[2];
        nfds_t n = 0;
        if (out_open) fds[n++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[n++] = {err_pipe[0], POLLIN, 0};

        int rc = ::poll(fds, n, static_cast<int>(std::min<long long>(remain, 100)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool is_out = fds[i].fd == out_pipe[0];
            std::string& sink = is_out ? result.stdout_text : result.stderr_text;
            if (!drain(fds[i].fd, sink, max_output_bytes_)) {
                (is_out ? out_open : err_open) = false;
            }
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    if (result.timed_out || !result.error.empty()) {
        ::killpg(child, SIGTERM);
        for (int i = 0; i < 20; ++i) {
            if (::waitpid(child, &status, WNOHANG) == child) {
                child = -1;
                break;
            }
            ::usleep(10000);
        }
        if (child > 0) {
            ::killpg(child, SIGKILL); // 强制终止整个进程组
            ::waitpid(child, &status, 0);
        }
        if (result.timed_out) {
            result.error = "Process '" + executable + "' timed out after " + std::to_string(timeout_sec) + "s";
            spdlog::warn("{}", result.error);
        }
        result.exit_code = -1;
        return result;
    }

    // 输出已关闭，等待进程退出（同样受超时约束）
    while (true) {
        pid_t w = ::waitpid(child, &status, WNOHANG);
        if (w == child) {
            result.exit_code = decode_status(status);
            break;
        }
        if (w < 0 && errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::killpg(child, SIGKILL);
            ::waitpid(child, &status, 0);
            result.timed_out = true;
            result.exit_code = -1;
            result.error = "Process '" + executable + "' timed out after " + std::to_string(timeout_sec) + "s";
            break;
        }
        ::usleep(5000);
    }
    return result;
}

} // namespace agentgraph

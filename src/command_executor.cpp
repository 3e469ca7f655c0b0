#include "command_executor.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

namespace queuectl {

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void append_bounded(std::string& out, const char* data, size_t n, size_t max_output) {
    if (out.size() >= max_output) return;
    size_t room = max_output - out.size();
    if (n > room) {
        out.append(data, room);
        out += "\n...[truncated]";
    } else {
        out.append(data, n);
    }
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ExecResult ShellExecutor::execute(const std::string& command, std::chrono::seconds timeout) {
    int pipe_out[2], pipe_err[2];
    if (pipe(pipe_out) != 0) {
        throw ExecError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe(pipe_err) != 0) {
        int saved = errno;
        close(pipe_out[0]); close(pipe_out[1]);
        throw ExecError(std::string("Failed to create pipes: ") + std::strerror(saved));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(pipe_out[0]); close(pipe_out[1]);
        close(pipe_err[0]); close(pipe_err[1]);
        throw ExecError(std::string("Fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: own process group so a timeout can take down everything it started
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        dup2(pipe_out[1], STDOUT_FILENO);
        dup2(pipe_err[1], STDERR_FILENO);
        close(pipe_out[0]); close(pipe_out[1]);
        close(pipe_err[0]); close(pipe_err[1]);

        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    close(pipe_out[1]);
    close(pipe_err[1]);
    int out_fd = pipe_out[0];
    int err_fd = pipe_err[0];

    ExecResult result;
    const size_t max_output = static_cast<size_t>(max_output_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfds[2];
        pfds[0].fd = out_fd;
        pfds[0].events = POLLIN;
        pfds[0].revents = 0;
        pfds[1].fd = err_fd;
        pfds[1].events = POLLIN;
        pfds[1].revents = 0;

        int ret = poll(pfds, 2, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        for (int i = 0; i < 2; i++) {
            if (pfds[i].fd < 0 || !(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int& fd = (i == 0) ? out_fd : err_fd;
            std::string& sink = (i == 0) ? result.stdout_output : result.stderr_output;
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                append_bounded(sink, buffer, static_cast<size_t>(n), max_output);
            } else if (n == 0 || errno != EINTR) {
                close_fd(fd);
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    // Output closed but the shell may still be running
    while (!result.timed_out) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
            else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);
            return result;
        }
        if (r < 0 && errno != EINTR) {
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        usleep(10000);
    }

    if (kill(-pid, SIGKILL) != 0) kill(pid, SIGKILL);
    result.exit_code = wait_child(pid);
    return result;
}

} // namespace queuectl

#include "supervisor.hpp"
#include <algorithm>
#include <iostream>
#include <thread>
#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>

namespace queuectl {

bool send_terminate(pid_t pid) {
    if (kill(pid, SIGTERM) == 0) return true;
    std::cerr << "[supervisor] kill(" << pid << ", SIGTERM): " << std::strerror(errno) << "\n";
    return false;
}

Supervisor::Supervisor(LivenessRegistry& registry, WorkerLauncher launcher,
                       SupervisorOptions opts, TerminateFn terminate)
    : registry_(registry)
    , launcher_(std::move(launcher))
    , opts_(opts)
    , terminate_(std::move(terminate))
{}

void Supervisor::reap_children() {
    auto it = children_.begin();
    while (it != children_.end()) {
        int status = 0;
        pid_t r = waitpid(*it, &status, WNOHANG);
        if (r == *it || (r < 0 && errno == ECHILD)) {
            it = children_.erase(it);
        } else {
            ++it;
        }
    }
}

StartReport Supervisor::start(int count) {
    StartReport report;
    for (int ordinal = 1; ordinal <= count; ordinal++) {
        pid_t pid = launcher_(ordinal);
        if (pid > 0) {
            report.launched.push_back(pid);
            children_.push_back(pid);
        } else {
            std::cerr << "[supervisor] Failed to launch worker " << ordinal << "\n";
        }
    }

    // Workers register themselves; give them a moment to show up
    auto deadline = std::chrono::steady_clock::now() + opts_.start_wait;
    while (true) {
        auto alive = active_workers();
        report.registered = static_cast<int>(std::count_if(
            report.launched.begin(), report.launched.end(), [&](pid_t pid) {
                return std::any_of(alive.begin(), alive.end(), [pid](pid_t a) { return a == pid; });
            }));
        if (report.registered == static_cast<int>(report.launched.size())) break;
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return report;
}

std::vector<pid_t> Supervisor::active_workers() {
    reap_children();
    std::vector<pid_t> pids;
    for (auto& e : registry_.list_alive()) pids.push_back(e.pid);
    return pids;
}

StopResult Supervisor::stop() {
    auto pids = active_workers();
    if (pids.empty()) {
        return StopResult::nothing_to_do;
    }

    std::cerr << "[supervisor] Stopping " << pids.size() << " active worker(s)...\n";
    for (pid_t pid : pids) {
        if (!terminate_(pid)) {
            std::cerr << "[supervisor] Could not signal worker " << pid << "\n";
        }
    }

    for (int i = 0; i < opts_.stop_poll_attempts; i++) {
        if (active_workers().empty()) break;
        std::this_thread::sleep_for(opts_.stop_poll_interval);
    }

    return active_workers().empty() ? StopResult::stopped : StopResult::timed_out;
}

// ── Process spawning ────────────────────────────────────────────────

std::string current_executable() {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        return buf;
    }
    return "queuectl";
}

pid_t spawn_worker_process(const std::string& exe, int ordinal, const std::string& log_path) {
    // Built before fork; the child only execs
    std::vector<std::string> argv_strs = {
        exe, "worker", "run", "--id", std::to_string(ordinal)
    };
    std::vector<char*> argv;
    for (auto& s : argv_strs) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == 0) {
        // Child: detach from the terminal so ^C on the caller doesn't reach it
        setsid();
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            close(devnull);
        }
        int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (log_fd >= 0) {
            dup2(log_fd, STDERR_FILENO);
            close(log_fd);
        }

        execv(exe.c_str(), argv.data());
        _exit(127);
    } else if (pid > 0) {
        std::cerr << "[supervisor] Spawned worker " << ordinal << " (PID " << pid << ")\n";
        return pid;
    }
    std::cerr << "[supervisor] Fork failed for worker " << ordinal << ": " << std::strerror(errno) << "\n";
    return -1;
}

} // namespace queuectl

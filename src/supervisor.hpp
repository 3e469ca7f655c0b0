#pragma once
#include "liveness_registry.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace queuectl {

// Starts one worker process with the given ordinal; returns its pid or -1
using WorkerLauncher = std::function<pid_t(int ordinal)>;
// Asks a worker to stop; returns false if the request could not be delivered
using TerminateFn = std::function<bool(pid_t)>;

bool send_terminate(pid_t pid);

struct SupervisorOptions {
    std::chrono::milliseconds stop_poll_interval{500};
    int stop_poll_attempts = 10;
    std::chrono::milliseconds start_wait{2000};
};

struct StartReport {
    std::vector<pid_t> launched;
    int registered = 0;     // launched workers seen in the registry
};

enum class StopResult {
    nothing_to_do,
    stopped,
    timed_out,      // some workers still alive; left running
};

class Supervisor {
public:
    Supervisor(LivenessRegistry& registry, WorkerLauncher launcher,
               SupervisorOptions opts = {}, TerminateFn terminate = send_terminate);

    StartReport start(int count);
    std::vector<pid_t> active_workers();
    StopResult stop();

private:
    LivenessRegistry& registry_;
    WorkerLauncher launcher_;
    SupervisorOptions opts_;
    TerminateFn terminate_;
    std::vector<pid_t> children_;

    void reap_children();
};

// Path of the running binary (/proc/self/exe)
std::string current_executable();

// fork + exec "<exe> worker run --id <ordinal>" in a new session, stdout to
// /dev/null, stderr appended to log_path.
pid_t spawn_worker_process(const std::string& exe, int ordinal, const std::string& log_path);

} // namespace queuectl

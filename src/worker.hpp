#pragma once
#include "job_store.hpp"
#include "settings_store.hpp"
#include "command_executor.hpp"
#include "shutdown.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace queuectl {

struct WorkerOptions {
    int worker_id = 1;
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::seconds job_timeout{300};
    std::chrono::seconds max_backoff{0};   // 0 = uncapped
};

// One worker's poll -> claim -> execute -> record cycle. Single threaded; a
// job that has started always runs to completion or timeout before the
// shutdown flag is looked at again.
class Worker {
public:
    Worker(JobStore& store, SettingsStore& settings, CommandExecutor& executor,
           const ShutdownFlag& shutdown, WorkerOptions opts = {});

    // Loops until shutdown is requested
    void run();

    // One poll. Returns true if a job was claimed and handled.
    bool run_once();

    void process(const Job& job);

private:
    JobStore& store_;
    SettingsStore& settings_;
    CommandExecutor& executor_;
    const ShutdownFlag& shutdown_;
    WorkerOptions opts_;

    void handle_failure(const Job& job);
    // Runs write until it gets past a busy store. False only if shutdown
    // was requested before the write went through.
    bool record_outcome(const Job& job, const std::function<void()>& write);
    std::string tag() const { return "[worker " + std::to_string(opts_.worker_id) + "]"; }
};

} // namespace queuectl

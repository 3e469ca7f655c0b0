#include "worker.hpp"
#include "retry_policy.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>
#include <unistd.h>

namespace queuectl {

Worker::Worker(JobStore& store, SettingsStore& settings, CommandExecutor& executor,
               const ShutdownFlag& shutdown, WorkerOptions opts)
    : store_(store)
    , settings_(settings)
    , executor_(executor)
    , shutdown_(shutdown)
    , opts_(opts)
{}

void Worker::run() {
    std::cerr << tag() << " Started (PID " << getpid() << ")\n";
    while (!shutdown_.requested()) {
        bool worked = false;
        try {
            worked = run_once();
        } catch (const std::exception& e) {
            std::cerr << tag() << " Error: " << e.what() << "\n";
        }
        if (!worked) {
            shutdown_.sleep_for(opts_.poll_interval);
        }
    }
    std::cerr << tag() << " Stopped (PID " << getpid() << ")\n";
}

bool Worker::run_once() {
    std::optional<Job> job;
    try {
        job = store_.claim_next();
    } catch (const std::exception& e) {
        std::cerr << tag() << " Claim failed: " << e.what() << "\n";
        return false;
    }
    if (!job) return false;

    std::cerr << tag() << " Processing job " << job->id << "...\n";
    process(*job);
    return true;
}

void Worker::process(const Job& job) {
    ExecResult result;
    try {
        result = executor_.execute(job.command, opts_.job_timeout);
    } catch (const std::exception& e) {
        std::cerr << tag() << " Job " << job.id << " failed with an unexpected error: " << e.what() << "\n";
        handle_failure(job);
        return;
    }

    if (result.succeeded()) {
        if (record_outcome(job, [&] { store_.update_status(job.id, JobState::completed); })) {
            std::cerr << tag() << " Job " << job.id << " completed successfully.\n";
        }
        return;
    }

    if (result.timed_out) {
        std::cerr << tag() << " Job " << job.id << " timed out after "
                  << opts_.job_timeout.count() << "s.\n";
    } else {
        std::cerr << tag() << " Job " << job.id << " failed with exit code " << result.exit_code << ".\n";
    }
    if (!result.stderr_output.empty()) {
        std::cerr << tag() << " Stderr: " << result.stderr_output;
        if (result.stderr_output.back() != '\n') std::cerr << "\n";
    }
    handle_failure(job);
}

void Worker::handle_failure(const Job& job) {
    int attempts = job.attempts + 1;

    double base = SettingsStore::kDefaultBackoffBase;
    try {
        base = settings_.backoff_base();
    } catch (const std::exception& e) {
        std::cerr << tag() << " Could not read " << SettingsStore::kBackoffBase
                  << ", using " << base << ": " << e.what() << "\n";
    }

    RetryDecision d = next_retry(attempts, job.retry_limit, base, opts_.max_backoff);
    if (d.exhausted) {
        if (record_outcome(job, [&] { store_.update_status(job.id, JobState::dead, attempts); })) {
            std::cerr << tag() << " Job " << job.id << " reached max retries. Moved to DLQ.\n";
        }
        return;
    }

    TimePoint next_run = Clock::now() + d.delay;
    if (record_outcome(job, [&] {
            store_.update_status(job.id, JobState::pending, attempts, next_run);
        })) {
        std::cerr << tag() << " Job " << job.id << " failed. Retrying in "
                  << (d.delay.count() / 1000.0) << "s (Attempt " << attempts << ").\n";
    }
}

bool Worker::record_outcome(const Job& job, const std::function<void()>& write) {
    const auto backoff = std::min<std::chrono::milliseconds>(opts_.poll_interval,
                                                             std::chrono::milliseconds(100));
    bool warned = false;
    while (true) {
        try {
            write();
            return true;
        } catch (const StoreBusyError& e) {
            if (shutdown_.requested()) {
                std::cerr << tag() << " Shutting down before the outcome of job " << job.id
                          << " could be recorded; it stays in processing: " << e.what() << "\n";
                return false;
            }
            if (!warned) {
                std::cerr << tag() << " Store busy while recording job " << job.id
                          << ", retrying: " << e.what() << "\n";
                warned = true;
            }
        }
        shutdown_.sleep_for(backoff);
    }
}

} // namespace queuectl

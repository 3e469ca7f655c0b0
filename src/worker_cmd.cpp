#include "worker_cmd.hpp"
#include "worker.hpp"
#include "supervisor.hpp"
#include "liveness_registry.hpp"
#include <iostream>
#include <unistd.h>

namespace queuectl {

int run_worker_process(const Config& cfg, int ordinal) {
    ShutdownFlag shutdown;
    install_shutdown_handlers(&shutdown);

    int rc = 0;
    try {
        Database db(cfg.database_path(), cfg.busy_timeout_ms);
        JobStore store(db);
        SettingsStore settings(db);
        ShellExecutor executor(cfg.max_captured_output);
        PidFileRegistry registry(cfg.registry_path());
        WorkerRegistration registration(registry, getpid(), ordinal);

        WorkerOptions opts;
        opts.worker_id = ordinal;
        opts.poll_interval = std::chrono::milliseconds(cfg.poll_interval_ms);
        opts.job_timeout = std::chrono::seconds(cfg.job_timeout_seconds);
        opts.max_backoff = std::chrono::seconds(cfg.max_backoff_seconds);

        Worker worker(store, settings, executor, shutdown, opts);
        worker.run();
    } catch (const std::exception& e) {
        std::cerr << "[worker " << ordinal << "] Fatal: " << e.what() << "\n";
        rc = 1;
    }

    install_shutdown_handlers(nullptr);
    return rc;
}

static SupervisorOptions supervisor_options(const Config& cfg) {
    SupervisorOptions opts;
    opts.stop_poll_interval = std::chrono::milliseconds(cfg.stop_poll_interval_ms);
    opts.stop_poll_attempts = cfg.stop_poll_attempts;
    opts.start_wait = std::chrono::milliseconds(cfg.start_wait_ms);
    return opts;
}

static int worker_start(const Config& cfg, int count) {
    // Schema exists before any worker races to create it
    { Database db(cfg.database_path(), cfg.busy_timeout_ms); }
    fs::create_directories(cfg.data_path());

    std::string exe = current_executable();
    std::string log_path = cfg.worker_log_path();
    PidFileRegistry registry(cfg.registry_path());
    Supervisor supervisor(registry, [&](int ordinal) {
        return spawn_worker_process(exe, ordinal, log_path);
    }, supervisor_options(cfg));

    StartReport report = supervisor.start(count);
    if (report.launched.empty()) {
        std::cerr << "Error: no workers could be started.\n";
        return 1;
    }
    std::cout << "Successfully started " << report.launched.size() << " worker(s).\n";
    if (report.registered < static_cast<int>(report.launched.size())) {
        std::cerr << "Warning: only " << report.registered << " of " << report.launched.size()
                  << " worker(s) have registered so far; see " << log_path << "\n";
    }
    std::cout << "They will run in the background. Use 'queuectl worker stop' to stop them.\n";
    return 0;
}

static int worker_stop(const Config& cfg) {
    PidFileRegistry registry(cfg.registry_path());
    Supervisor supervisor(registry, [](int) { return static_cast<pid_t>(-1); },
                          supervisor_options(cfg));

    switch (supervisor.stop()) {
    case StopResult::nothing_to_do:
        std::cout << "No active workers found.\n";
        return 0;
    case StopResult::stopped:
        std::cout << "All workers stopped gracefully.\n";
        return 0;
    case StopResult::timed_out:
        std::cout << "Some workers did not stop in time. They may need to be killed manually.\n";
        return 1;
    }
    return 1;
}

int cmd_worker(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: queuectl worker <start [--count N]|stop>\n";
        return 1;
    }

    Config cfg = Config::load(default_config_path());
    std::string subcmd = args[0];

    if (subcmd == "start" || subcmd == "run") {
        int n = subcmd == "start" ? 1 : 0;
        const std::string flag = subcmd == "start" ? "--count" : "--id";
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i] == flag && i + 1 < args.size()) {
                try {
                    n = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    n = 0;
                }
            }
        }
        if (n < 1) {
            std::cerr << "Error: " << flag << " must be a positive integer\n";
            return 1;
        }

        if (subcmd == "run") {
            return run_worker_process(cfg, n);
        }
        try {
            return worker_start(cfg, n);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }
    else if (subcmd == "stop") {
        try {
            return worker_stop(cfg);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    std::cerr << "Unknown worker subcommand: " << subcmd << "\n";
    return 1;
}

} // namespace queuectl

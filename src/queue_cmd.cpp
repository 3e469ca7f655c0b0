#include "queue_cmd.hpp"
#include "queue_service.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <cctype>
#include <iostream>
#include <iterator>

namespace queuectl {

static void print_job(const Job& job) {
    std::cout << job.to_json().dump(2) << "\n";
}

int cmd_init_db() {
    try {
        std::string config_path = default_config_path();
        Config cfg = Config::load(config_path);
        if (!fs::exists(config_path)) {
            cfg.save(config_path);
            std::cout << "Config written to: " << config_path << "\n";
        }
        Database db(cfg.database_path(), cfg.busy_timeout_ms);
        std::cout << "Database initialized at: " << db.path() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_enqueue(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: queuectl enqueue '{\"id\":\"job1\",\"command\":\"echo hello\"}'\n";
        return 1;
    }

    try {
        Config cfg = Config::load(default_config_path());
        Database db(cfg.database_path(), cfg.busy_timeout_ms);
        JobStore store(db);
        SettingsStore settings(db);
        QueueService queue(store, settings);

        std::string id = queue.enqueue(args[0]);
        std::cout << "Job enqueued with ID: " << id << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_status() {
    try {
        Config cfg = Config::load(default_config_path());
        Database db(cfg.database_path(), cfg.busy_timeout_ms);
        JobStore store(db);
        SettingsStore settings(db);
        PidFileRegistry registry(cfg.registry_path());
        QueueService queue(store, settings, &registry);

        QueueSummary s = queue.summary();
        std::cout << "--- Queue Status ---\n";
        std::cout << "Active Workers: " << s.active_workers << "\n";
        std::cout << "Pending:        " << s.counts[JobState::pending] << "\n";
        std::cout << "Processing:     " << s.counts[JobState::processing] << "\n";
        std::cout << "Completed:      " << s.counts[JobState::completed] << "\n";
        std::cout << "Dead (DLQ):     " << s.counts[JobState::dead] << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_list(const std::vector<std::string>& args) {
    std::optional<JobState> filter;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--state" && i + 1 < args.size()) {
            filter = parse_job_state(args[++i]);
            if (!filter) {
                std::cerr << "Error: invalid state '" << args[i]
                          << "' (expected pending, processing, completed or dead)\n";
                return 1;
            }
        } else {
            std::cerr << "Usage: queuectl list [--state pending|processing|completed|dead]\n";
            return 1;
        }
    }

    try {
        Config cfg = Config::load(default_config_path());
        Database db(cfg.database_path(), cfg.busy_timeout_ms);
        JobStore store(db);
        SettingsStore settings(db);
        QueueService queue(store, settings);

        std::vector<JobState> states;
        if (filter) {
            states.push_back(*filter);
        } else {
            std::cout << "Listing all jobs (use --state to filter):\n";
            states.assign(std::begin(kAllStates), std::end(kAllStates));
        }

        for (JobState s : states) {
            auto jobs = queue.list(s);
            if (jobs.empty()) continue;
            std::string upper = to_string(s);
            for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            std::cout << "\n--- State: " << upper << " (" << jobs.size() << ") ---\n";
            for (auto& j : jobs) print_job(j);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_dlq(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: queuectl dlq <list|retry> [job_id]\n";
        return 1;
    }

    const std::string& subcmd = args[0];
    try {
        Config cfg = Config::load(default_config_path());
        Database db(cfg.database_path(), cfg.busy_timeout_ms);
        JobStore store(db);
        SettingsStore settings(db);
        QueueService queue(store, settings);

        if (subcmd == "list") {
            auto jobs = queue.dlq();
            if (jobs.empty()) {
                std::cout << "Dead Letter Queue is empty.\n";
                return 0;
            }
            std::cout << "--- DLQ Jobs (" << jobs.size() << ") ---\n";
            for (auto& j : jobs) print_job(j);
            return 0;
        }
        else if (subcmd == "retry") {
            if (args.size() < 2) {
                std::cerr << "Usage: queuectl dlq retry <job_id>\n";
                return 1;
            }
            const std::string& id = args[1];
            if (!queue.retry_dead(id)) {
                std::cerr << "Error: Job ID '" << id << "' not found in DLQ.\n";
                return 1;
            }
            std::cout << "Job '" << id << "' moved from DLQ to 'pending' queue.\n";
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown dlq subcommand: " << subcmd << "\n";
    return 1;
}

} // namespace queuectl

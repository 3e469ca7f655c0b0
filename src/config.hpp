#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace queuectl {

struct Config {
    std::string data_dir = "~/.queuectl";
    std::string db_path;            // empty = <data_dir>/queue.db
    std::string workers_dir;        // empty = <data_dir>/workers

    int poll_interval_ms = 1000;
    int job_timeout_seconds = 300;
    int busy_timeout_ms = 10000;    // sqlite busy handler wait

    // worker stop: poll every stop_poll_interval_ms, stop_poll_attempts times
    int stop_poll_interval_ms = 500;
    int stop_poll_attempts = 10;
    int start_wait_ms = 2000;

    int max_backoff_seconds = 0;    // 0 = uncapped
    int max_captured_output = 65536;

    // Derived helpers
    std::string data_path() const { return expand_path(data_dir); }
    std::string database_path() const {
        return db_path.empty() ? data_path() + "/queue.db" : expand_path(db_path);
    }
    std::string registry_path() const {
        return workers_dir.empty() ? data_path() + "/workers" : expand_path(workers_dir);
    }
    std::string worker_log_path() const { return data_path() + "/worker.log"; }

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace queuectl

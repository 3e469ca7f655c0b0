#include "config.hpp"
#include <fstream>
#include <iostream>

namespace queuectl {

Config Config::make_default() {
    Config c;
    c.data_dir = default_data_dir();
    return c;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["data_dir"] = data_dir;
    if (!db_path.empty()) j["db_path"] = db_path;
    if (!workers_dir.empty()) j["workers_dir"] = workers_dir;

    j["poll_interval_ms"] = poll_interval_ms;
    j["job_timeout_seconds"] = job_timeout_seconds;
    j["busy_timeout_ms"] = busy_timeout_ms;
    j["stop_poll_interval_ms"] = stop_poll_interval_ms;
    j["stop_poll_attempts"] = stop_poll_attempts;
    j["start_wait_ms"] = start_wait_ms;
    if (max_backoff_seconds > 0) j["max_backoff_seconds"] = max_backoff_seconds;
    j["max_captured_output"] = max_captured_output;
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c = make_default();

    c.data_dir = j.value("data_dir", c.data_dir);
    c.db_path = j.value("db_path", c.db_path);
    c.workers_dir = j.value("workers_dir", c.workers_dir);

    c.poll_interval_ms = j.value("poll_interval_ms", c.poll_interval_ms);
    c.job_timeout_seconds = j.value("job_timeout_seconds", c.job_timeout_seconds);
    c.busy_timeout_ms = j.value("busy_timeout_ms", c.busy_timeout_ms);
    c.stop_poll_interval_ms = j.value("stop_poll_interval_ms", c.stop_poll_interval_ms);
    c.stop_poll_attempts = j.value("stop_poll_attempts", c.stop_poll_attempts);
    c.start_wait_ms = j.value("start_wait_ms", c.start_wait_ms);
    c.max_backoff_seconds = j.value("max_backoff_seconds", c.max_backoff_seconds);
    c.max_captured_output = j.value("max_captured_output", c.max_captured_output);

    // Nonsense values fall back to defaults rather than spinning or hanging
    if (c.poll_interval_ms < 1) c.poll_interval_ms = 1000;
    if (c.job_timeout_seconds < 1) c.job_timeout_seconds = 300;
    if (c.busy_timeout_ms < 0) c.busy_timeout_ms = 10000;
    if (c.stop_poll_interval_ms < 1) c.stop_poll_interval_ms = 500;
    if (c.stop_poll_attempts < 1) c.stop_poll_attempts = 10;
    if (c.start_wait_ms < 0) c.start_wait_ms = 0;
    if (c.max_backoff_seconds < 0) c.max_backoff_seconds = 0;
    if (c.max_captured_output < 1024) c.max_captured_output = 65536;

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[config] Warning: failed to parse " << path << ": " << e.what()
                  << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace queuectl

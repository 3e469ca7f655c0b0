#include "liveness_registry.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <cerrno>
#include <climits>
#include <sstream>
#include <signal.h>

namespace queuectl {

bool process_alive(pid_t pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

std::optional<unsigned long long> process_start_time(pid_t pid) {
    if (pid <= 0) return std::nullopt;
    std::string stat = read_file("/proc/" + std::to_string(pid) + "/stat");
    // comm may contain spaces and parens; fields resume after the last ')'
    size_t close = stat.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream in(stat.substr(close + 1));
    std::string field;
    // field 3 (state) through field 21
    for (int i = 3; i <= 21; i++) {
        if (!(in >> field)) return std::nullopt;
    }
    unsigned long long start = 0;
    if (!(in >> start)) return std::nullopt;
    return start;
}

PidFileRegistry::PidFileRegistry(const std::string& dir, ProcessProbe probe)
    : dir_(dir)
    , probe_(std::move(probe))
{}

std::string PidFileRegistry::marker_path(pid_t pid) const {
    return dir_ + "/worker." + std::to_string(pid) + ".pid";
}

void PidFileRegistry::register_worker(pid_t pid, int ordinal) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw QueueError("Failed to create registry dir " + dir_ + ": " + ec.message());
    }

    // write then rename, so a concurrent scan never sees a half-written marker
    std::string path = marker_path(pid);
    std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw QueueError("Failed to write " + tmp);
        f << ordinal;
        if (auto start = process_start_time(pid)) f << " " << *start;
        f << "\n";
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw QueueError("Failed to register worker " + std::to_string(pid) + ": " + ec.message());
    }
}

void PidFileRegistry::deregister_worker(pid_t pid) {
    std::error_code ec;
    fs::remove(marker_path(pid), ec);
}

std::vector<WorkerEntry> PidFileRegistry::scan(int& pruned) {
    std::vector<WorkerEntry> alive;
    pruned = 0;

    std::error_code ec;
    if (!fs::exists(dir_, ec)) return alive;

    for (auto it = fs::directory_iterator(dir_, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path& p = it->path();
        std::string name = p.filename().string();
        // worker.<pid>.pid
        if (name.size() <= 11 || name.compare(0, 7, "worker.") != 0 ||
            name.compare(name.size() - 4, 4, ".pid") != 0) {
            continue;
        }

        std::string pid_str = name.substr(7, name.size() - 11);
        pid_t pid = 0;
        bool valid = !pid_str.empty() &&
            std::all_of(pid_str.begin(), pid_str.end(), [](char c) { return c >= '0' && c <= '9'; });
        if (valid) {
            try {
                long long v = std::stoll(pid_str);
                if (v <= 0 || v > INT_MAX) valid = false;
                else pid = static_cast<pid_t>(v);
            } catch (const std::exception&) {
                valid = false;
            }
        }

        WorkerEntry e;
        std::optional<unsigned long long> recorded_start;
        if (valid) {
            std::istringstream in(read_file(p.string()));
            unsigned long long start = 0;
            if (in >> e.ordinal) {
                if (in >> start) recorded_start = start;
            } else {
                e.ordinal = 0;
            }
        }

        bool stale = !valid || !probe_(pid);
        if (!stale && recorded_start) {
            // pid reused by a process started at another time
            auto current = process_start_time(pid);
            if (current && *current != *recorded_start) stale = true;
        }

        if (stale) {
            std::error_code rm_ec;
            fs::remove(p, rm_ec);
            pruned++;
            continue;
        }

        e.pid = pid;
        alive.push_back(e);
    }

    std::sort(alive.begin(), alive.end(),
              [](const WorkerEntry& a, const WorkerEntry& b) { return a.pid < b.pid; });
    return alive;
}

std::vector<WorkerEntry> PidFileRegistry::list_alive() {
    int pruned = 0;
    return scan(pruned);
}

int PidFileRegistry::prune_stale() {
    int pruned = 0;
    scan(pruned);
    return pruned;
}

// ── WorkerRegistration ──────────────────────────────────────────────

WorkerRegistration::WorkerRegistration(LivenessRegistry& registry, pid_t pid, int ordinal)
    : registry_(registry)
    , pid_(pid) {
    registry_.register_worker(pid_, ordinal);
}

WorkerRegistration::~WorkerRegistration() {
    try {
        registry_.deregister_worker(pid_);
    } catch (const std::exception& e) {
        std::cerr << "[registry] Failed to deregister " << pid_ << ": " << e.what() << "\n";
    }
}

} // namespace queuectl

#pragma once
#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <sys/types.h>

namespace queuectl {

struct WorkerEntry {
    pid_t pid = 0;
    int ordinal = 0;
};

using ProcessProbe = std::function<bool(pid_t)>;

// kill(pid, 0) without delivering anything; EPERM still means "exists"
bool process_alive(pid_t pid);

// Start time of pid in clock ticks since boot (/proc/<pid>/stat field 22).
// Nothing when the process is gone or /proc is unavailable.
std::optional<unsigned long long> process_start_time(pid_t pid);

// Which worker processes are running. Not a source of job state.
class LivenessRegistry {
public:
    virtual ~LivenessRegistry() = default;

    virtual void register_worker(pid_t pid, int ordinal) = 0;
    virtual void deregister_worker(pid_t pid) = 0;

    // Entries whose process is still alive. Stale entries are pruned.
    virtual std::vector<WorkerEntry> list_alive() = 0;

    // Returns the number of stale entries removed
    virtual int prune_stale() = 0;
};

// One marker file per worker: <dir>/worker.<pid>.pid holding the ordinal and
// the process start time. A marker whose pid now belongs to a process with a
// different start time is stale.
class PidFileRegistry : public LivenessRegistry {
public:
    explicit PidFileRegistry(const std::string& dir, ProcessProbe probe = process_alive);

    void register_worker(pid_t pid, int ordinal) override;
    void deregister_worker(pid_t pid) override;
    std::vector<WorkerEntry> list_alive() override;
    int prune_stale() override;

private:
    std::string dir_;
    ProcessProbe probe_;

    std::string marker_path(pid_t pid) const;
    std::vector<WorkerEntry> scan(int& pruned);
};

// Registers on construction and deregisters on destruction, so a worker
// leaves the registry on every clean exit path.
class WorkerRegistration {
public:
    WorkerRegistration(LivenessRegistry& registry, pid_t pid, int ordinal);
    ~WorkerRegistration();

    WorkerRegistration(const WorkerRegistration&) = delete;
    WorkerRegistration& operator=(const WorkerRegistration&) = delete;

private:
    LivenessRegistry& registry_;
    pid_t pid_;
};

} // namespace queuectl

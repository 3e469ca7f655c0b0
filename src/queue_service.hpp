#pragma once
#include "job_store.hpp"
#include "settings_store.hpp"
#include "liveness_registry.hpp"
#include <map>
#include <string>
#include <vector>

namespace queuectl {

struct QueueSummary {
    std::map<JobState, int> counts;
    int active_workers = 0;
};

class QueueService {
public:
    // registry may be null when worker counts are not needed
    QueueService(JobStore& store, SettingsStore& settings, LivenessRegistry* registry = nullptr)
        : store_(store), settings_(settings), registry_(registry) {}

    // Returns the job id. Throws ValidationError or DuplicateJobError.
    std::string enqueue(const std::string& spec_json);
    std::string enqueue(const JobSpec& spec);

    QueueSummary summary();
    std::vector<Job> list(JobState state) { return store_.find_by_state(state); }
    std::vector<Job> dlq() { return store_.find_by_state(JobState::dead); }
    bool retry_dead(const std::string& id) { return store_.resurrect(id); }

private:
    JobStore& store_;
    SettingsStore& settings_;
    LivenessRegistry* registry_;
};

} // namespace queuectl

#include "queue_service.hpp"

namespace queuectl {

std::string QueueService::enqueue(const std::string& spec_json) {
    return enqueue(JobSpec::parse(spec_json));
}

std::string QueueService::enqueue(const JobSpec& spec) {
    Job job;
    job.id = spec.id ? *spec.id : generate_uuid();
    job.command = spec.command;
    job.state = JobState::pending;
    job.attempts = 0;
    if (spec.max_retries) {
        job.retry_limit = *spec.max_retries;
    } else {
        int def = settings_.max_retries();
        job.retry_limit = def > 0 ? def : SettingsStore::kDefaultMaxRetries;
    }
    job.created_at = Clock::now();
    job.updated_at = job.created_at;

    store_.add(job);
    return job.id;
}

QueueSummary QueueService::summary() {
    QueueSummary s;
    s.counts = store_.count_by_state();
    if (registry_) {
        s.active_workers = static_cast<int>(registry_->list_alive().size());
    }
    return s;
}

} // namespace queuectl

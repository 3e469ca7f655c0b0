#pragma once
#include "database.hpp"
#include "job.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace queuectl {

class JobStore {
public:
    explicit JobStore(Database& db) : db_(db) {}

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // Throws DuplicateJobError if the id is taken; the stored job is untouched.
    void add(const Job& job);

    std::optional<Job> get(const std::string& id);

    // Atomically moves the oldest eligible pending job to processing and
    // returns it. Returns nothing when there is no eligible job or when the
    // database is busy; callers poll again later.
    std::optional<Job> claim_next();
    std::optional<Job> claim_next(TimePoint now);

    // Writes state and updated_at. When attempts is given, attempts and
    // next_run_at (NULL unless given) are written as well.
    void update_status(const std::string& id, JobState state,
                       std::optional<int> attempts = std::nullopt,
                       std::optional<TimePoint> next_run_at = std::nullopt);

    std::vector<Job> find_by_state(JobState state);
    std::map<JobState, int> count_by_state();

    // dead -> pending with attempts reset. False (and no change) when the job
    // is unknown or not dead.
    bool resurrect(const std::string& id);

private:
    Database& db_;
};

} // namespace queuectl

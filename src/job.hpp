#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace queuectl {

enum class JobState {
    pending,
    processing,
    completed,
    dead,
};

const char* to_string(JobState state);
std::optional<JobState> parse_job_state(const std::string& s);

// All states, in the order the CLI lists them
constexpr JobState kAllStates[] = {
    JobState::pending, JobState::processing, JobState::completed, JobState::dead,
};

struct Job {
    std::string id;
    std::string command;
    JobState state = JobState::pending;
    int attempts = 0;
    int retry_limit = 3;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<TimePoint> next_run_at;

    nlohmann::json to_json() const;
};

// What a client asks for; id and retry limit are optional
struct JobSpec {
    std::optional<std::string> id;
    std::string command;
    std::optional<int> max_retries;

    static JobSpec from_json(const nlohmann::json& j);
    // Throws ValidationError on malformed input
    static JobSpec parse(const std::string& text);
};

} // namespace queuectl

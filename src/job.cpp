#include "job.hpp"
#include "errors.hpp"
#include <cctype>

namespace queuectl {

const char* to_string(JobState state) {
    switch (state) {
    case JobState::pending:    return "pending";
    case JobState::processing: return "processing";
    case JobState::completed:  return "completed";
    case JobState::dead:       return "dead";
    }
    return "pending";
}

std::optional<JobState> parse_job_state(const std::string& s) {
    std::string lower;
    for (char c : s) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "pending")    return JobState::pending;
    if (lower == "processing") return JobState::processing;
    if (lower == "completed")  return JobState::completed;
    if (lower == "dead")       return JobState::dead;
    return std::nullopt;
}

nlohmann::json Job::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["command"] = command;
    j["state"] = to_string(state);
    j["attempts"] = attempts;
    j["retry_limit"] = retry_limit;
    j["created_at"] = format_iso8601(created_at);
    j["updated_at"] = format_iso8601(updated_at);
    if (next_run_at) j["next_run_at"] = format_iso8601(*next_run_at);
    else j["next_run_at"] = nullptr;
    return j;
}

JobSpec JobSpec::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("Job description must be a JSON object.");
    }

    JobSpec spec;
    if (!j.contains("command")) {
        throw ValidationError("Job must contain a 'command' field.");
    }
    if (!j["command"].is_string() || j["command"].get<std::string>().empty()) {
        throw ValidationError("Job 'command' must be a non-empty string.");
    }
    spec.command = j["command"].get<std::string>();

    if (j.contains("id") && !j["id"].is_null()) {
        if (!j["id"].is_string() || j["id"].get<std::string>().empty()) {
            throw ValidationError("Job 'id' must be a non-empty string.");
        }
        spec.id = j["id"].get<std::string>();
    }

    if (j.contains("max_retries") && !j["max_retries"].is_null()) {
        auto& mr = j["max_retries"];
        if (!mr.is_number_integer() || mr.get<int64_t>() < 1 || mr.get<int64_t>() > 1000000) {
            throw ValidationError("Job 'max_retries' must be a positive integer.");
        }
        spec.max_retries = mr.get<int>();
    }
    return spec;
}

JobSpec JobSpec::parse(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error&) {
        throw ValidationError("Invalid JSON provided.");
    }
    return from_json(j);
}

} // namespace queuectl

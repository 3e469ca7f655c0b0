#include "job_store.hpp"
#include "errors.hpp"

namespace queuectl {

static const char* kJobColumns =
    "id, command, state, attempts, retry_limit, created_at, updated_at, next_run_at";

static Job row_to_job(const Statement& stmt) {
    Job j;
    j.id = stmt.column_text(0);
    j.command = stmt.column_text(1);
    j.state = parse_job_state(stmt.column_text(2)).value_or(JobState::pending);
    j.attempts = static_cast<int>(stmt.column_int64(3));
    j.retry_limit = static_cast<int>(stmt.column_int64(4));
    j.created_at = parse_iso8601(stmt.column_text(5)).value_or(TimePoint{});
    j.updated_at = parse_iso8601(stmt.column_text(6)).value_or(TimePoint{});
    if (!stmt.column_is_null(7)) {
        j.next_run_at = parse_iso8601(stmt.column_text(7));
    }
    return j;
}

void JobStore::add(const Job& job) {
    Statement stmt(db_,
        "INSERT INTO jobs (id, command, state, attempts, retry_limit, created_at, updated_at, next_run_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind_text(1, job.id);
    stmt.bind_text(2, job.command);
    stmt.bind_text(3, to_string(job.state));
    stmt.bind_int64(4, job.attempts);
    stmt.bind_int64(5, job.retry_limit);
    stmt.bind_text(6, format_iso8601(job.created_at));
    stmt.bind_text(7, format_iso8601(job.updated_at));
    if (job.next_run_at) stmt.bind_text(8, format_iso8601(*job.next_run_at));
    else stmt.bind_null(8);

    try {
        stmt.step();
    } catch (const StoreConstraintError&) {
        throw DuplicateJobError(job.id);
    }
}

std::optional<Job> JobStore::get(const std::string& id) {
    std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id = ?";
    Statement stmt(db_, sql.c_str());
    stmt.bind_text(1, id);
    if (!stmt.step()) return std::nullopt;
    return row_to_job(stmt);
}

std::optional<Job> JobStore::claim_next() {
    return claim_next(Clock::now());
}

std::optional<Job> JobStore::claim_next(TimePoint now) {
    std::string now_iso = format_iso8601(now);

    try {
        Transaction tx(db_);

        std::string job_id;
        {
            Statement select(db_,
                "SELECT id FROM jobs "
                "WHERE state = 'pending' AND (next_run_at IS NULL OR next_run_at <= ?) "
                "ORDER BY created_at ASC, rowid ASC LIMIT 1");
            select.bind_text(1, now_iso);
            if (!select.step()) {
                tx.commit();
                return std::nullopt;
            }
            job_id = select.column_text(0);
        }

        {
            Statement update(db_,
                "UPDATE jobs SET state = 'processing', updated_at = ? "
                "WHERE id = ? AND state = 'pending'");
            update.bind_text(1, now_iso);
            update.bind_text(2, job_id);
            update.step();
        }
        if (db_.changes() == 0) {
            // someone else got there first
            tx.commit();
            return std::nullopt;
        }

        std::optional<Job> job = get(job_id);
        tx.commit();
        return job;
    } catch (const StoreBusyError&) {
        return std::nullopt;
    }
}

void JobStore::update_status(const std::string& id, JobState state,
                             std::optional<int> attempts,
                             std::optional<TimePoint> next_run_at) {
    std::string now_iso = now_iso8601();

    if (attempts) {
        Statement stmt(db_,
            "UPDATE jobs SET state = ?, attempts = ?, next_run_at = ?, updated_at = ? WHERE id = ?");
        stmt.bind_text(1, to_string(state));
        stmt.bind_int64(2, *attempts);
        if (next_run_at) stmt.bind_text(3, format_iso8601(*next_run_at));
        else stmt.bind_null(3);
        stmt.bind_text(4, now_iso);
        stmt.bind_text(5, id);
        stmt.step();
    } else {
        Statement stmt(db_, "UPDATE jobs SET state = ?, updated_at = ? WHERE id = ?");
        stmt.bind_text(1, to_string(state));
        stmt.bind_text(2, now_iso);
        stmt.bind_text(3, id);
        stmt.step();
    }
}

std::vector<Job> JobStore::find_by_state(JobState state) {
    std::vector<Job> jobs;
    std::string sql = std::string("SELECT ") + kJobColumns +
        " FROM jobs WHERE state = ? ORDER BY created_at ASC, rowid ASC";
    Statement stmt(db_, sql.c_str());
    stmt.bind_text(1, to_string(state));
    while (stmt.step()) {
        jobs.push_back(row_to_job(stmt));
    }
    return jobs;
}

std::map<JobState, int> JobStore::count_by_state() {
    std::map<JobState, int> counts;
    for (JobState s : kAllStates) counts[s] = 0;

    Statement stmt(db_, "SELECT state, COUNT(*) FROM jobs GROUP BY state");
    while (stmt.step()) {
        auto state = parse_job_state(stmt.column_text(0));
        if (state) counts[*state] = static_cast<int>(stmt.column_int64(1));
    }
    return counts;
}

bool JobStore::resurrect(const std::string& id) {
    Statement stmt(db_,
        "UPDATE jobs SET state = 'pending', attempts = 0, next_run_at = NULL, updated_at = ? "
        "WHERE id = ? AND state = 'dead'");
    stmt.bind_text(1, now_iso8601());
    stmt.bind_text(2, id);
    stmt.step();
    return db_.changes() > 0;
}

} // namespace queuectl

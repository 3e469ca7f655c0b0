#include "worker.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

using namespace queuectl;
using namespace std::chrono_literals;

namespace {

// Answers by command string; unknown commands succeed
class FakeExecutor : public CommandExecutor {
public:
    std::map<std::string, ExecResult> results;
    std::function<void(const std::string&)> on_execute;
    bool throw_exec_error = false;

    ExecResult execute(const std::string& command, std::chrono::seconds) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(command);
        }
        if (on_execute) on_execute(command);
        if (throw_exec_error) throw ExecError("Fork failed: out of processes");
        auto it = results.find(command);
        if (it != results.end()) return it->second;
        ExecResult ok;
        ok.exit_code = 0;
        return ok;
    }

    size_t call_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    std::mutex mutex_;
    std::vector<std::string> calls_;
};

ExecResult exit_with(int code)
{
    ExecResult r;
    r.exit_code = code;
    return r;
}

class WorkerTest : public ::testing::Test {
protected:
    TempDir dir;
    Database db{dir.file("queue.db")};
    JobStore store{db};
    SettingsStore settings{db};
    FakeExecutor executor;
    ShutdownFlag shutdown;

    WorkerOptions options() {
        WorkerOptions o;
        o.poll_interval = 20ms;
        o.job_timeout = 5s;
        return o;
    }

    void add(const std::string& id, const std::string& command, int retry_limit = 3) {
        Job j;
        j.id = id;
        j.command = command;
        j.retry_limit = retry_limit;
        j.created_at = Clock::now();
        j.updated_at = j.created_at;
        store.add(j);
    }
};

} // namespace

TEST_F(WorkerTest, SuccessfulJobCompletes)
{
    add("ok", "echo hi");
    Worker worker(store, settings, executor, shutdown, options());

    EXPECT_TRUE(worker.run_once());
    auto j = store.get("ok");
    EXPECT_EQ(j->state, JobState::completed);
    EXPECT_EQ(j->attempts, 0);
    EXPECT_FALSE(worker.run_once());
}

TEST_F(WorkerTest, FailureSchedulesRetry)
{
    executor.results["exit 1"] = exit_with(1);
    add("f", "exit 1", 3);
    Worker worker(store, settings, executor, shutdown, options());

    TimePoint before = Clock::now();
    EXPECT_TRUE(worker.run_once());
    TimePoint after = Clock::now();

    auto j = store.get("f");
    EXPECT_EQ(j->state, JobState::pending);
    EXPECT_EQ(j->attempts, 1);
    ASSERT_TRUE(j->next_run_at.has_value());
    // default base is 2, so the first retry is 2s out
    EXPECT_GE(*j->next_run_at, before + 2s - 1ms);
    EXPECT_LE(*j->next_run_at, after + 2s + 1ms);

    // not eligible yet
    EXPECT_FALSE(worker.run_once());
}

TEST_F(WorkerTest, BackoffGrowsUntilDead)
{
    settings.set("backoff_base_seconds", "3");
    executor.results["false"] = exit_with(1);
    add("b", "false", 4);
    Worker worker(store, settings, executor, shutdown, options());

    for (int k = 1; k < 4; k++) {
        TimePoint before = Clock::now();
        worker.process(*store.get("b"));
        auto j = store.get("b");
        EXPECT_EQ(j->state, JobState::pending);
        EXPECT_EQ(j->attempts, k);

        auto delay = std::chrono::seconds(static_cast<int>(std::pow(3, k)));
        ASSERT_TRUE(j->next_run_at.has_value());
        EXPECT_GE(*j->next_run_at, before + delay - 1ms);
        EXPECT_LE(*j->next_run_at, Clock::now() + delay + 1ms);
    }

    worker.process(*store.get("b"));
    auto j = store.get("b");
    EXPECT_EQ(j->state, JobState::dead);
    EXPECT_EQ(j->attempts, 4);
    EXPECT_FALSE(j->next_run_at.has_value());
}

TEST_F(WorkerTest, RetryThenDeadInRealTime)
{
    settings.set("backoff_base_seconds", "1");
    executor.results["exit 1"] = exit_with(1);
    add("J1", "exit 1", 2);
    Worker worker(store, settings, executor, shutdown, options());

    EXPECT_TRUE(worker.run_once());
    EXPECT_EQ(store.get("J1")->attempts, 1);
    EXPECT_EQ(store.get("J1")->state, JobState::pending);
    EXPECT_FALSE(worker.run_once());

    std::this_thread::sleep_for(1100ms);
    EXPECT_TRUE(worker.run_once());
    auto j = store.get("J1");
    EXPECT_EQ(j->state, JobState::dead);
    EXPECT_EQ(j->attempts, 2);
    EXPECT_EQ(executor.call_count(), 2u);
}

TEST_F(WorkerTest, TimeoutIsAFailure)
{
    ExecResult r;
    r.timed_out = true;
    r.exit_code = 137;
    executor.results["sleep 100"] = r;
    add("t", "sleep 100", 1);
    Worker worker(store, settings, executor, shutdown, options());

    EXPECT_TRUE(worker.run_once());
    EXPECT_EQ(store.get("t")->state, JobState::dead);
}

TEST_F(WorkerTest, ExecutorFaultCountsAsAttempt)
{
    executor.throw_exec_error = true;
    add("e", "echo hi", 3);
    Worker worker(store, settings, executor, shutdown, options());

    EXPECT_TRUE(worker.run_once());
    auto j = store.get("e");
    EXPECT_EQ(j->state, JobState::pending);
    EXPECT_EQ(j->attempts, 1);
}

TEST_F(WorkerTest, RunDrainsQueueUntilShutdown)
{
    add("a", "echo a");
    add("b", "echo b");
    Worker worker(store, settings, executor, shutdown, options());

    std::thread th([&] { worker.run(); });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (executor.call_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    shutdown.request();
    th.join();

    EXPECT_EQ(store.get("a")->state, JobState::completed);
    EXPECT_EQ(store.get("b")->state, JobState::completed);
}

TEST_F(WorkerTest, InFlightJobFinishesAfterShutdownRequest)
{
    add("slow", "slow");
    add("next", "next");
    executor.on_execute = [&](const std::string&) { shutdown.request(); };
    Worker worker(store, settings, executor, shutdown, options());

    worker.run();

    // the job that was running completes; nothing new is claimed
    EXPECT_EQ(store.get("slow")->state, JobState::completed);
    EXPECT_EQ(store.get("next")->state, JobState::pending);
    EXPECT_EQ(executor.call_count(), 1u);
}

TEST_F(WorkerTest, RunReturnsImmediatelyWhenAlreadyStopped)
{
    add("a", "echo a");
    shutdown.request();
    Worker worker(store, settings, executor, shutdown, options());

    worker.run();
    EXPECT_EQ(executor.call_count(), 0u);
    EXPECT_EQ(store.get("a")->state, JobState::pending);
}

TEST_F(WorkerTest, FailureRecordedOnceLockIsReleased)
{
    executor.results["exit 1"] = exit_with(1);
    add("J1", "exit 1", 3);

    // the worker's own connection gives up on a lock immediately
    Database worker_db(dir.file("queue.db"), 0);
    JobStore worker_store(worker_db);
    SettingsStore worker_settings(worker_db);

    Database locker(dir.file("queue.db"));
    std::thread releaser;
    executor.on_execute = [&](const std::string&) {
        locker.exec("BEGIN IMMEDIATE");
        releaser = std::thread([&] {
            std::this_thread::sleep_for(300ms);
            locker.exec("ROLLBACK");
        });
    };

    Worker worker(worker_store, worker_settings, executor, shutdown, options());
    EXPECT_TRUE(worker.run_once());
    releaser.join();

    auto j = store.get("J1");
    EXPECT_EQ(j->state, JobState::pending);
    EXPECT_EQ(j->attempts, 1);
    EXPECT_TRUE(j->next_run_at.has_value());
}

TEST_F(WorkerTest, CompletionRecordedOnceLockIsReleased)
{
    add("ok", "echo ok");

    Database worker_db(dir.file("queue.db"), 0);
    JobStore worker_store(worker_db);
    SettingsStore worker_settings(worker_db);

    Database locker(dir.file("queue.db"));
    std::thread releaser;
    executor.on_execute = [&](const std::string&) {
        locker.exec("BEGIN IMMEDIATE");
        releaser = std::thread([&] {
            std::this_thread::sleep_for(300ms);
            locker.exec("ROLLBACK");
        });
    };

    Worker worker(worker_store, worker_settings, executor, shutdown, options());
    EXPECT_TRUE(worker.run_once());
    releaser.join();

    EXPECT_EQ(store.get("ok")->state, JobState::completed);
}

TEST_F(WorkerTest, ShutdownAbandonsOutcomeWriteWhileLocked)
{
    add("stuck", "echo stuck");

    Database worker_db(dir.file("queue.db"), 0);
    JobStore worker_store(worker_db);
    SettingsStore worker_settings(worker_db);

    Database locker(dir.file("queue.db"));
    std::thread stopper;
    executor.on_execute = [&](const std::string&) {
        locker.exec("BEGIN IMMEDIATE");
        stopper = std::thread([&] {
            std::this_thread::sleep_for(200ms);
            shutdown.request();
        });
    };

    Worker worker(worker_store, worker_settings, executor, shutdown, options());
    EXPECT_TRUE(worker.run_once());
    stopper.join();
    locker.exec("ROLLBACK");

    EXPECT_EQ(store.get("stuck")->state, JobState::processing);
}

TEST_F(WorkerTest, RunKeepsPollingThroughClaimErrors)
{
    add("a", "echo a");

    // every claim fails with a constraint error until the trigger is dropped
    Database admin(dir.file("queue.db"));
    admin.exec("CREATE TRIGGER reject_claim BEFORE UPDATE ON jobs "
               "WHEN NEW.state = 'processing' "
               "BEGIN SELECT RAISE(ABORT, 'claims rejected'); END;");

    Worker worker(store, settings, executor, shutdown, options());
    std::thread th([&] { worker.run(); });

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(executor.call_count(), 0u);
    admin.exec("DROP TRIGGER reject_claim");

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (executor.call_count() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    shutdown.request();
    th.join();

    EXPECT_EQ(store.get("a")->state, JobState::completed);
}

TEST_F(WorkerTest, RunSurvivesFailedOutcomeWrite)
{
    add("bad", "echo bad");
    add("good", "echo good");

    // completing "bad" fails with a non-busy store error
    Database admin(dir.file("queue.db"));
    admin.exec("CREATE TRIGGER reject_bad BEFORE UPDATE ON jobs "
               "WHEN NEW.id = 'bad' AND NEW.state = 'completed' "
               "BEGIN SELECT RAISE(ABORT, 'rejected'); END;");

    Worker worker(store, settings, executor, shutdown, options());
    std::thread th([&] { worker.run(); });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (executor.call_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    shutdown.request();
    th.join();

    EXPECT_EQ(store.get("bad")->state, JobState::processing);
    EXPECT_EQ(store.get("good")->state, JobState::completed);
}

TEST(ShutdownFlag, FirstRequestWins)
{
    ShutdownFlag flag;
    EXPECT_FALSE(flag.requested());
    EXPECT_TRUE(flag.request());
    EXPECT_FALSE(flag.request());
    EXPECT_TRUE(flag.requested());

    auto start = std::chrono::steady_clock::now();
    flag.sleep_for(5s);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

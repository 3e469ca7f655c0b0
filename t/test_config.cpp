#include "config.hpp"
#include "queue_cmd.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

using namespace queuectl;

TEST(Config, DataDirFollowsEnvironment)
{
    TempDir dir;
    setenv("QUEUECTL_HOME", dir.path().c_str(), 1);
    Config c = Config::make_default();
    unsetenv("QUEUECTL_HOME");

    EXPECT_EQ(c.data_path(), dir.path());
    EXPECT_EQ(c.database_path(), dir.path() + "/queue.db");
    EXPECT_EQ(c.registry_path(), dir.path() + "/workers");
    EXPECT_EQ(c.poll_interval_ms, 1000);
    EXPECT_EQ(c.job_timeout_seconds, 300);
    EXPECT_EQ(c.stop_poll_interval_ms, 500);
    EXPECT_EQ(c.stop_poll_attempts, 10);
}

TEST(Config, FromJsonOverrides)
{
    Config c = Config::from_json({
        {"data_dir", "/var/lib/queuectl"},
        {"db_path", "/tmp/other.db"},
        {"poll_interval_ms", 250},
        {"job_timeout_seconds", 5},
        {"max_backoff_seconds", 60},
    });
    EXPECT_EQ(c.database_path(), "/tmp/other.db");
    EXPECT_EQ(c.registry_path(), "/var/lib/queuectl/workers");
    EXPECT_EQ(c.poll_interval_ms, 250);
    EXPECT_EQ(c.job_timeout_seconds, 5);
    EXPECT_EQ(c.max_backoff_seconds, 60);
}

TEST(Config, NonsenseValuesFallBack)
{
    Config c = Config::from_json({{"poll_interval_ms", 0}, {"stop_poll_attempts", -3}});
    EXPECT_EQ(c.poll_interval_ms, 1000);
    EXPECT_EQ(c.stop_poll_attempts, 10);
}

TEST(Config, LoadMissingOrBrokenFileGivesDefaults)
{
    TempDir dir;
    Config missing = Config::load(dir.file("nope.json"));
    EXPECT_EQ(missing.poll_interval_ms, 1000);

    {
        std::ofstream f(dir.file("broken.json"));
        f << "{ not json";
    }
    Config broken = Config::load(dir.file("broken.json"));
    EXPECT_EQ(broken.job_timeout_seconds, 300);
}

TEST(Config, SaveThenLoad)
{
    TempDir dir;
    Config c = Config::make_default();
    c.data_dir = dir.path();
    c.poll_interval_ms = 200;
    c.save(dir.file("sub/config.json"));

    Config loaded = Config::load(dir.file("sub/config.json"));
    EXPECT_EQ(loaded.data_path(), dir.path());
    EXPECT_EQ(loaded.poll_interval_ms, 200);
}

TEST(Config, InitDbWritesDefaultConfigOnce)
{
    TempDir dir;
    setenv("QUEUECTL_HOME", dir.path().c_str(), 1);

    EXPECT_EQ(cmd_init_db(), 0);
    EXPECT_TRUE(fs::exists(dir.file("config.json")));
    EXPECT_TRUE(fs::exists(dir.file("queue.db")));

    // an existing file is left alone
    {
        std::ofstream f(dir.file("config.json"));
        f << R"({"poll_interval_ms": 250})";
    }
    EXPECT_EQ(cmd_init_db(), 0);
    unsetenv("QUEUECTL_HOME");

    EXPECT_EQ(Config::load(dir.file("config.json")).poll_interval_ms, 250);
}

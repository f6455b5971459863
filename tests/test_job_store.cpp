#include <gtest/gtest.h>
#include "job_store.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <sqlite3.h>

using namespace motus;

class JobStoreTest : public ::testing::Test {
protected:
    SqliteJobStore store{":memory:"};

    void set_status(int job_id, JobStatus status) {
        JobUpdate update;
        update.status = status;
        ASSERT_TRUE(store.update(job_id, update));
    }
};

TEST_F(JobStoreTest, CreateAndGet) {
    store.create(1, Operation::Move, "/src", "remote:dst");

    auto job = store.get(1);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->job_id, 1);
    EXPECT_EQ(job->operation, Operation::Move);
    EXPECT_EQ(job->source, "/src");
    EXPECT_EQ(job->destination, "remote:dst");
    EXPECT_EQ(job->status, JobStatus::Pending);
    EXPECT_EQ(job->progress, 0);
    EXPECT_EQ(job->exit_status, -1);
    EXPECT_EQ(job->resumed_by_job_id, 0);
    EXPECT_EQ(job->finished_at, 0);
    EXPECT_GT(job->created_at, 0);

    EXPECT_FALSE(store.get(2).has_value());
}

TEST_F(JobStoreTest, DuplicateCreateRejected) {
    store.create(1, Operation::Copy, "/a", "/b");
    try {
        store.create(1, Operation::Copy, "/a", "/b");
        FAIL() << "expected DuplicateJob";
    } catch (const MotusError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateJob);
    }
}

TEST_F(JobStoreTest, PartialUpdate) {
    store.create(1, Operation::Copy, "/a", "/b");

    JobUpdate progress;
    progress.status = JobStatus::Running;
    progress.progress = 40;
    progress.status_text = "Transferred: 40%";
    EXPECT_TRUE(store.update(1, progress));

    JobUpdate errors;
    errors.error_text = "ERROR : x\n";
    EXPECT_TRUE(store.update(1, errors));

    auto job = store.get(1);
    EXPECT_EQ(job->status, JobStatus::Running);
    EXPECT_EQ(job->progress, 40);
    EXPECT_EQ(job->status_text, "Transferred: 40%");
    EXPECT_EQ(job->error_text, "ERROR : x\n");
    EXPECT_EQ(job->finished_at, 0);

    EXPECT_FALSE(store.update(42, errors));
}

TEST_F(JobStoreTest, FinishedAtOnlyForTerminalStatus) {
    store.create(1, Operation::Copy, "/a", "/b");
    set_status(1, JobStatus::Running);
    EXPECT_EQ(store.get(1)->finished_at, 0);

    set_status(1, JobStatus::Cancelled);
    int64_t finished = store.get(1)->finished_at;
    EXPECT_GT(finished, 0);

    JobUpdate exit;
    exit.exit_status = -15;
    store.update(1, exit);
    EXPECT_EQ(store.get(1)->finished_at, finished);
    EXPECT_EQ(store.get(1)->exit_status, -15);
}

TEST_F(JobStoreTest, MaxJobId) {
    EXPECT_EQ(store.max_job_id(), 0);
    store.create(5, Operation::Copy, "/a", "/b");
    store.create(3, Operation::Copy, "/a", "/b");
    EXPECT_EQ(store.max_job_id(), 5);
}

TEST_F(JobStoreTest, MarkRunningAsInterrupted) {
    store.create(1, Operation::Copy, "/a", "/b", JobStatus::Running, 100);
    store.create(2, Operation::Copy, "/a", "/b", JobStatus::Completed, 100);
    store.create(3, Operation::Copy, "/a", "/b", JobStatus::Pending, 100);
    store.create(4, Operation::Copy, "/a", "/b", JobStatus::Running, 200);
    int64_t completed_at = store.get(2)->finished_at;

    std::vector<int> owners = store.active_owners();
    std::sort(owners.begin(), owners.end());
    EXPECT_EQ(owners, (std::vector<int>{100, 200}));

    EXPECT_EQ(store.mark_running_as_interrupted({100}), 2);

    auto interrupted = store.get(1);
    EXPECT_EQ(interrupted->status, JobStatus::Interrupted);
    EXPECT_GT(interrupted->finished_at, 0);
    EXPECT_EQ(store.get(3)->status, JobStatus::Interrupted);

    auto completed = store.get(2);
    EXPECT_EQ(completed->status, JobStatus::Completed);
    EXPECT_EQ(completed->finished_at, completed_at);

    auto other_owner = store.get(4);
    EXPECT_EQ(other_owner->status, JobStatus::Running);
    EXPECT_EQ(other_owner->owner_pid, 200);

    EXPECT_EQ(store.mark_running_as_interrupted({100}), 0);
    EXPECT_EQ(store.mark_running_as_interrupted({}), 0);
    EXPECT_EQ(store.active_owners(), (std::vector<int>{200}));
}

TEST_F(JobStoreTest, ListNewestFirstWithFilter) {
    store.create(1, Operation::Copy, "/a", "/b", JobStatus::Completed);
    store.create(2, Operation::Sync, "/a", "/b", JobStatus::Failed);
    store.create(3, Operation::Move, "/a", "/b", JobStatus::Completed);

    auto all = store.list(std::nullopt);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].job_id, 3);
    EXPECT_EQ(all[2].job_id, 1);

    auto completed = store.list(JobStatus::Completed);
    ASSERT_EQ(completed.size(), 2u);
    EXPECT_EQ(completed[0].job_id, 3);

    auto page = store.list(std::nullopt, 1, 1);
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].job_id, 2);
}

TEST_F(JobStoreTest, ResumeLinkRules) {
    store.create(1, Operation::Copy, "/a", "/b", JobStatus::Interrupted);
    store.create(2, Operation::Copy, "/a", "/b", JobStatus::Failed);
    store.create(3, Operation::Copy, "/a", "/b", JobStatus::Completed);

    EXPECT_EQ(store.list_aborted().size(), 2u);
    ASSERT_EQ(store.list_resumable().size(), 1u);

    EXPECT_FALSE(store.set_resumed_by(3, 10));
    EXPECT_TRUE(store.set_resumed_by(1, 10));
    EXPECT_FALSE(store.set_resumed_by(1, 11));

    auto resumed = store.get(1);
    EXPECT_EQ(resumed->resumed_by_job_id, 10);
    EXPECT_EQ(resumed->status, JobStatus::Interrupted);

    EXPECT_TRUE(store.list_resumable().empty());
    ASSERT_EQ(store.list_aborted().size(), 1u);
    EXPECT_EQ(store.list_aborted()[0].job_id, 2);
}

TEST_F(JobStoreTest, RemoveAndRemoveStopped) {
    store.create(1, Operation::Copy, "/a", "/b", JobStatus::Running);
    store.create(2, Operation::Copy, "/a", "/b", JobStatus::Completed);
    store.create(3, Operation::Copy, "/a", "/b", JobStatus::Cancelled);
    store.create(4, Operation::Copy, "/a", "/b", JobStatus::Pending);

    EXPECT_TRUE(store.remove(3));
    EXPECT_FALSE(store.remove(3));

    std::vector<int> removed = store.remove_stopped();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], 2);
    EXPECT_TRUE(store.get(1).has_value());
    EXPECT_TRUE(store.get(4).has_value());
    EXPECT_EQ(store.max_job_id(), 4);
}

TEST_F(JobStoreTest, CleanupKeepsRecentJobs) {
    store.create(1, Operation::Copy, "/a", "/b", JobStatus::Completed);
    EXPECT_EQ(store.cleanup_old_jobs(7), 0);
    EXPECT_TRUE(store.get(1).has_value());
}

TEST(JobStoreFile, PersistsAcrossReopen) {
    motus_test::TempDir dir;
    std::string db_path = dir.file("data/motus.db");
    {
        SqliteJobStore store(db_path);
        store.create(12, Operation::Copy, "/a", "/b", JobStatus::Running);
    }
    SqliteJobStore reopened(db_path);
    EXPECT_EQ(reopened.max_job_id(), 12);
    EXPECT_EQ(reopened.get(12)->status, JobStatus::Running);
}

TEST(JobStoreFile, AddsOwnerColumnToOlderDatabases) {
    motus_test::TempDir dir;
    std::string db_path = dir.file("old.db");
    {
        sqlite3* db = nullptr;
        ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
        const char* sql =
            "CREATE TABLE jobs (id INTEGER PRIMARY KEY AUTOINCREMENT, job_id INTEGER NOT NULL UNIQUE,"
            " operation TEXT NOT NULL, src_path TEXT NOT NULL, dst_path TEXT NOT NULL,"
            " status TEXT NOT NULL DEFAULT 'pending', progress INTEGER NOT NULL DEFAULT 0,"
            " status_text TEXT, error_text TEXT, log_text TEXT, exit_status INTEGER NOT NULL DEFAULT -1,"
            " resumed_by_job_id INTEGER, created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL,"
            " finished_at INTEGER);"
            "INSERT INTO jobs (job_id, operation, src_path, dst_path, status, created_at, updated_at)"
            " VALUES (3, 'copy', '/a', '/b', 'running', 1, 1);";
        ASSERT_EQ(sqlite3_exec(db, sql, nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);
    }

    SqliteJobStore store(db_path);
    auto job = store.get(3);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->owner_pid, 0);
    EXPECT_EQ(store.mark_running_as_interrupted({0}), 1);
}

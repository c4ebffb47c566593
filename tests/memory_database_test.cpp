#include "batchforge/storage/memory_database.hpp"

#include <gtest/gtest.h>

using namespace batchforge;
using namespace batchforge::storage;

class MemoryDatabaseTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(db_.open().has_value()); }

  static auto make_job(std::string_view id) -> Job {
    Job job;
    job.id = JobId{id};
    job.tenant_id = TenantId{"t"};
    job.name = "job";
    return job;
  }

  MemoryDatabase db_;
};

TEST_F(MemoryDatabaseTest, InsertThenUpdateBumpsVersion) {
  auto job = make_job("job-1");
  auto v1 = db_.save_job(job);
  ASSERT_TRUE(v1.has_value());
  EXPECT_EQ(*v1, 1u);

  job.version = *v1;
  job.progress_percent = 50;
  auto v2 = db_.save_job(job);
  ASSERT_TRUE(v2.has_value());
  EXPECT_EQ(*v2, 2u);

  auto loaded = db_.load_job(job.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->version, 2u);
  EXPECT_EQ(loaded->progress_percent, 50);
}

TEST_F(MemoryDatabaseTest, StaleVersionConflicts) {
  auto job = make_job("job-1");
  ASSERT_TRUE(db_.save_job(job).has_value());

  auto duplicate = db_.save_job(job);
  ASSERT_FALSE(duplicate.has_value());
  EXPECT_EQ(duplicate.error(), Error::AlreadyExists);

  job.version = 7;
  auto stale = db_.save_job(job);
  ASSERT_FALSE(stale.has_value());
  EXPECT_EQ(stale.error(), Error::VersionConflict);

  auto orphan = make_job("job-2");
  orphan.version = 3;
  EXPECT_EQ(db_.save_job(orphan).error(), Error::VersionConflict);
}

TEST_F(MemoryDatabaseTest, HistoryIsWrittenWithEntityAndOrdered) {
  auto job = make_job("job-1");
  JobHistoryEntry second{.sequence = 9,
                         .job_id = job.id,
                         .new_status = JobStatus::Queued};
  JobHistoryEntry first{.sequence = 4,
                        .job_id = job.id,
                        .new_status = JobStatus::Pending};
  auto v1 = db_.save_job(job, &second);
  ASSERT_TRUE(v1.has_value());
  job.version = *v1;
  ASSERT_TRUE(db_.save_job(job, &first).has_value());

  auto rows = db_.load_job_history(job.id);
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(rows->size(), 2u);
  EXPECT_EQ((*rows)[0].sequence, 4u);
  EXPECT_EQ((*rows)[1].sequence, 9u);
  EXPECT_EQ(db_.last_history_sequence().value(), 9u);

  auto none = db_.load_task_history(TaskId{"missing"});
  ASSERT_TRUE(none.has_value());
  EXPECT_TRUE(none->empty());
}

TEST_F(MemoryDatabaseTest, FailedWriteLeavesNothingBehind) {
  auto job = make_job("job-1");
  JobHistoryEntry entry{.sequence = 1, .job_id = job.id};
  db_.inject_write_failures(1, make_error_code(Error::Unknown));

  auto failed = db_.save_job(job, &entry);
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error(), Error::Unknown);
  EXPECT_EQ(db_.load_job(job.id).error(), Error::NotFound);
  EXPECT_TRUE(db_.load_job_history(job.id).value().empty());
  EXPECT_EQ(db_.write_count(), 0u);

  EXPECT_TRUE(db_.save_job(job, &entry).has_value());
  EXPECT_EQ(db_.write_count(), 1u);
}

TEST_F(MemoryDatabaseTest, ClosedDatabaseRejectsWrites) {
  db_.close();
  EXPECT_FALSE(db_.is_open());
  EXPECT_EQ(db_.save_job(make_job("job-1")).error(), Error::SystemNotRunning);
}

TEST_F(MemoryDatabaseTest, LoadAllReturnsEverything) {
  Worker w;
  w.id = WorkerId{"worker-1"};
  ASSERT_TRUE(db_.save_worker(w).has_value());
  Task t;
  t.id = TaskId{"task-1"};
  ASSERT_TRUE(db_.save_task(t).has_value());
  ASSERT_TRUE(db_.save_job(make_job("job-1")).has_value());
  ASSERT_TRUE(db_.save_job(make_job("job-2")).has_value());

  EXPECT_EQ(db_.load_workers().value().size(), 1u);
  EXPECT_EQ(db_.load_tasks().value().size(), 1u);
  EXPECT_EQ(db_.load_jobs().value().size(), 2u);
  EXPECT_EQ(db_.load_worker(WorkerId{"nope"}).error(), Error::NotFound);
}

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace batchforge;
using namespace batchforge::test;
using namespace std::chrono_literals;

// Exercises JobStore directly; the scheduler is only used to move tasks
// through the states that drive job progress.
class JobStoreTest : public SchedulerFixture {
protected:
  auto history_reasons(const JobId &id) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto &row : jobs_.job_history(kTenant, id)->items) {
      out.push_back(row.reason);
    }
    return out;
  }
};

TEST_F(JobStoreTest, CreateStartsPending) {
  auto id = jobs_.create_job(make_job_spec("nightly")).value();
  auto j = job(id);
  EXPECT_EQ(j.status, JobStatus::Pending);
  EXPECT_EQ(j.progress_percent, 0);
  EXPECT_EQ(j.retry_count, 0);
  EXPECT_EQ(j.created_by, kUser);
  EXPECT_EQ(history_reasons(id), std::vector<std::string>{"Job created"});
}

TEST_F(JobStoreTest, CreateRejectsInvalidSpec) {
  auto r = jobs_.create_job(make_job_spec(""));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidSpec);
  EXPECT_EQ(jobs_.list_jobs(kTenant).total, 0u);
}

TEST_F(JobStoreTest, QueueOnlyFromPending) {
  auto id = jobs_.create_job(make_job_spec("j")).value();
  ASSERT_TRUE(jobs_.queue_job(id).has_value());
  EXPECT_EQ(job(id).status, JobStatus::Queued);
  EXPECT_EQ(jobs_.queue_job(id).error(), Error::InvalidTransition);
}

TEST_F(JobStoreTest, FirstTaskStartMarksRunning) {
  add_worker("w");
  auto id = submit(make_job_spec("j"), make_task_specs(2));
  EXPECT_EQ(job(id).status, JobStatus::Queued);

  auto sent = dispatcher_.sent();
  ASSERT_EQ(sent.size(), 1u);
  ASSERT_TRUE(scheduler_.on_task_started(sent[0].task).has_value());
  auto j = job(id);
  EXPECT_EQ(j.status, JobStatus::Running);
  EXPECT_TRUE(j.actual_start.has_value());
  EXPECT_EQ(history_reasons(id).back(), "First task started");
}

TEST_F(JobStoreTest, ProgressIsFloorOfCompletedShare) {
  add_worker("w", 3);
  auto id = submit(make_job_spec("j"), make_task_specs(3));
  auto sent = dispatcher_.sent();
  ASSERT_EQ(sent.size(), 3u);

  run_to_completion(sent[0].task);
  EXPECT_EQ(job(id).progress_percent, 33);
  run_to_completion(sent[1].task);
  EXPECT_EQ(job(id).progress_percent, 66);
  EXPECT_EQ(job(id).status, JobStatus::Running);
  run_to_completion(sent[2].task);

  auto j = job(id);
  EXPECT_EQ(j.progress_percent, 100);
  EXPECT_EQ(j.status, JobStatus::Completed);
  EXPECT_TRUE(j.completed_at.has_value());

  // Recompute is idempotent once complete.
  EXPECT_EQ(jobs_.recompute_progress(id).value(), 100);
  EXPECT_EQ(history_reasons(id).back(), "All tasks completed");
}

TEST_F(JobStoreTest, FailedTaskDoesNotFailJob) {
  add_worker("w", 2);
  auto id = submit(make_job_spec("j"), make_task_specs(2));
  auto sent = dispatcher_.sent();
  ASSERT_EQ(sent.size(), 2u);
  run_to_failure(sent[0].task);
  run_to_completion(sent[1].task);

  auto j = job(id);
  EXPECT_EQ(j.status, JobStatus::Running);
  EXPECT_EQ(j.progress_percent, 50);
}

TEST_F(JobStoreTest, EmptyJobStaysAtZero) {
  auto id = submit(make_job_spec("empty"), {});
  EXPECT_EQ(job(id).status, JobStatus::Queued);
  EXPECT_EQ(jobs_.recompute_progress(id).value(), 0);
  EXPECT_EQ(job(id).status, JobStatus::Queued);
}

TEST_F(JobStoreTest, FailJobOnlyFromRunning) {
  add_worker("w");
  auto id = submit(make_job_spec("j"), make_task_specs(1));
  EXPECT_EQ(jobs_.fail_job(kTenant, id, error_payload("x"), kUser).error(),
            Error::InvalidTransition);

  ASSERT_TRUE(scheduler_.on_task_started(dispatcher_.sent()[0].task));
  ASSERT_TRUE(jobs_.fail_job(kTenant, id, error_payload("x"), kUser));
  EXPECT_EQ(job(id).status, JobStatus::Failed);
}

TEST_F(JobStoreTest, RetryResetsTasksAndCountsAttempt) {
  add_worker("w", 2);
  auto id = submit(make_job_spec("j", 2), make_task_specs(2));
  auto sent = dispatcher_.sent();
  run_to_failure(sent[0].task);
  run_to_completion(sent[1].task);

  ASSERT_TRUE(jobs_.retry_job(kTenant, id, kUser).has_value());
  auto j = job(id);
  EXPECT_EQ(j.status, JobStatus::Pending);
  EXPECT_EQ(j.retry_count, 1);
  EXPECT_EQ(j.progress_percent, 0);
  for (const auto &t : job_tasks(id)) {
    EXPECT_EQ(t.status, TaskStatus::Pending);
  }
  EXPECT_EQ(task(sent[0].task).retry_count, 1);
  EXPECT_EQ(task(sent[1].task).retry_count, 0);

  auto reasons = history_reasons(id);
  ASSERT_GE(reasons.size(), 2u);
  EXPECT_EQ(reasons[reasons.size() - 2], "Task failures block completion");
  EXPECT_EQ(reasons.back(), "Job retry attempt 1");
}

TEST_F(JobStoreTest, RetryWithoutFailuresIsInvalid) {
  add_worker("w");
  auto id = submit(make_job_spec("j"), make_task_specs(2));
  ASSERT_TRUE(scheduler_.on_task_started(dispatcher_.sent()[0].task));
  EXPECT_EQ(jobs_.retry_job(kTenant, id, kUser).error(),
            Error::InvalidTransition);
  EXPECT_EQ(job(id).status, JobStatus::Running);
}

TEST_F(JobStoreTest, RetryExhaustedChangesNothing) {
  add_worker("w");
  auto id = submit(make_job_spec("j", 0), make_task_specs(1));
  run_to_failure(dispatcher_.sent()[0].task);
  const auto before = job(id);

  auto r = jobs_.retry_job(kTenant, id, kUser);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::RetryExhausted);
  auto after = job(id);
  EXPECT_EQ(after.status, before.status);
  EXPECT_EQ(after.version, before.version);
  EXPECT_EQ(after.retry_count, 0);
}

TEST_F(JobStoreTest, CancelIsTerminalAndCascades) {
  auto w = add_worker("w");
  auto id = submit(make_job_spec("j"), make_task_specs(3));
  ASSERT_EQ(worker(w).current_task_count, 1);

  ASSERT_TRUE(jobs_.cancel_job(kTenant, id, kUser).has_value());
  EXPECT_EQ(job(id).status, JobStatus::Cancelled);
  for (const auto &t : job_tasks(id)) {
    EXPECT_EQ(t.status, TaskStatus::Cancelled);
  }
  EXPECT_EQ(worker(w).current_task_count, 0);

  const auto version = job(id).version;
  auto again = jobs_.cancel_job(kTenant, id, kUser);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), Error::TerminalState);
  EXPECT_EQ(job(id).version, version);
}

TEST_F(JobStoreTest, CancelledTaskHistoryNamesCascade) {
  auto id = submit(make_job_spec("j"), make_task_specs(1));
  ASSERT_TRUE(jobs_.cancel_job(kTenant, id, kUser).has_value());
  auto t = job_tasks(id).front();
  auto rows = tasks_.task_history(kTenant, t.id).value();
  EXPECT_EQ(rows.items.back().reason,
            "Task cancelled due to job cancellation");
  EXPECT_EQ(rows.items.back().actor, kUser);
}

TEST_F(JobStoreTest, CompletedJobRejectsMutations) {
  add_worker("w");
  auto id = submit(make_job_spec("j"), make_task_specs(1));
  run_to_completion(dispatcher_.sent()[0].task);
  ASSERT_EQ(job(id).status, JobStatus::Completed);

  EXPECT_EQ(jobs_.cancel_job(kTenant, id, kUser).error(), Error::TerminalState);
  EXPECT_EQ(jobs_.pause_job(kTenant, id, kUser).error(), Error::TerminalState);
  EXPECT_EQ(
      jobs_.update_job(kTenant, id, JobUpdate{.name = "x"}, kUser).error(),
      Error::TerminalState);
}

TEST_F(JobStoreTest, PauseFreezesProgressUntilResume) {
  add_worker("w", 2);
  auto id = submit(make_job_spec("j"), make_task_specs(2));
  auto sent = dispatcher_.sent();
  ASSERT_TRUE(scheduler_.on_task_started(sent[0].task));

  ASSERT_TRUE(jobs_.pause_job(kTenant, id, kUser).has_value());
  auto paused = job(id);
  EXPECT_EQ(paused.status, JobStatus::Paused);
  EXPECT_EQ(paused.paused_from, JobStatus::Running);

  ASSERT_TRUE(scheduler_.on_task_completed(sent[0].task, JsonValue{}));
  run_to_completion(sent[1].task);
  EXPECT_EQ(job(id).status, JobStatus::Paused);
  EXPECT_EQ(job(id).progress_percent, 0);

  auto resumed = jobs_.resume_job(kTenant, id, kUser);
  ASSERT_TRUE(resumed.has_value());
  EXPECT_EQ(*resumed, JobStatus::Completed);
  EXPECT_EQ(job(id).progress_percent, 100);
}

TEST_F(JobStoreTest, TaskStartingWhilePausedFromQueuedResumesRunning) {
  add_worker("w");
  auto id = submit(make_job_spec("j"), make_task_specs(2));
  ASSERT_TRUE(jobs_.pause_job(kTenant, id, kUser).has_value());
  EXPECT_EQ(job(id).paused_from, JobStatus::Queued);

  ASSERT_TRUE(scheduler_.on_task_started(dispatcher_.sent()[0].task));
  EXPECT_EQ(job(id).status, JobStatus::Paused);
  EXPECT_EQ(job(id).paused_from, JobStatus::Running);

  EXPECT_EQ(jobs_.resume_job(kTenant, id, kUser).value(), JobStatus::Running);
}

TEST_F(JobStoreTest, ResumeRequiresPaused) {
  auto id = jobs_.create_job(make_job_spec("j")).value();
  EXPECT_EQ(jobs_.resume_job(kTenant, id, kUser).error(),
            Error::InvalidTransition);
}

TEST_F(JobStoreTest, UpdateEditsFieldsWithoutHistory) {
  auto id = jobs_.create_job(make_job_spec("j")).value();
  const auto rows = jobs_.job_history(kTenant, id)->total;

  auto updated = jobs_.update_job(
      kTenant, id,
      JobUpdate{.name = "renamed",
                .priority = JobPriority::Urgent,
                .max_retries = 5},
      UserId{"bob"});
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->name, "renamed");
  EXPECT_EQ(updated->priority, JobPriority::Urgent);
  EXPECT_EQ(updated->max_retries, 5);
  EXPECT_EQ(updated->last_updated_by, UserId{"bob"});
  EXPECT_EQ(jobs_.job_history(kTenant, id)->total, rows);

  EXPECT_EQ(jobs_
                .update_job(kTenant, id,
                            JobUpdate{.scheduled_start =
                                          std::chrono::system_clock::now() -
                                          1h},
                            kUser)
                .error(),
            Error::InvalidSpec);
}

TEST_F(JobStoreTest, TenantIsolation) {
  auto id = jobs_.create_job(make_job_spec("j")).value();
  EXPECT_EQ(jobs_.get_job(kOtherTenant, id).error(), Error::NotFound);
  EXPECT_EQ(jobs_.cancel_job(kOtherTenant, id, kUser).error(),
            Error::NotFound);
  EXPECT_EQ(jobs_.job_history(kOtherTenant, id).error(), Error::NotFound);
  EXPECT_EQ(jobs_.list_jobs(kOtherTenant).total, 0u);
  EXPECT_EQ(job(id).status, JobStatus::Pending);
}

TEST_F(JobStoreTest, ListNewestFirstWithFilters) {
  auto old_job = jobs_.create_job(make_job_spec("old")).value();
  std::this_thread::sleep_for(2ms);
  auto spec = make_job_spec("new");
  spec.type = JobType::Billing;
  auto new_job = jobs_.create_job(spec).value();

  auto all = jobs_.list_jobs(kTenant);
  ASSERT_EQ(all.items.size(), 2u);
  EXPECT_EQ(all.items[0].id, new_job);
  EXPECT_EQ(all.items[1].id, old_job);

  auto billing = jobs_.list_jobs(kTenant, JobFilter{.type = JobType::Billing});
  ASSERT_EQ(billing.total, 1u);
  EXPECT_EQ(billing.items[0].id, new_job);
}

TEST_F(JobStoreTest, ActiveJobsOrderedByPriorityThenAge) {
  auto low = make_job_spec("low");
  low.priority = JobPriority::Low;
  auto urgent = make_job_spec("urgent");
  urgent.priority = JobPriority::Urgent;

  auto low_id = submit(low, {});
  std::this_thread::sleep_for(2ms);
  auto normal_id = submit(make_job_spec("normal"), {});
  auto urgent_id = submit(urgent, {});
  auto pending_id = jobs_.create_job(make_job_spec("pending")).value();

  auto active = jobs_.active_jobs();
  EXPECT_EQ(active, (std::vector<JobId>{urgent_id, normal_id, low_id}));
  EXPECT_EQ(jobs_.due_jobs(std::chrono::system_clock::now()),
            std::vector<JobId>{pending_id});
}

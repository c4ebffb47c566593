#include "batchforge/app/application.hpp"
#include "batchforge/scheduler/local_dispatcher.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace batchforge;
using namespace batchforge::test;
using namespace std::chrono_literals;

namespace {

[[nodiscard]] auto quiet_config() -> Config {
  Config cfg;
  cfg.scheduler.log_level = "error";
  cfg.scheduler.io_threads = 2;
  cfg.scheduler.sweep_interval_sec = 30;
  return cfg;
}

[[nodiscard]] auto fast_options() -> LocalDispatcherOptions {
  return LocalDispatcherOptions{
      .threads = 2,
      .min_duration = 1ms,
      .max_duration = 5ms,
  };
}

} // namespace

class ApplicationTest : public ::testing::Test {
protected:
  auto make_app(LocalDispatcherOptions options) -> void {
    auto dispatcher = std::make_unique<LocalDispatcher>(options);
    local_ = dispatcher.get();
    app_ = std::make_unique<Application>(quiet_config(), std::move(dispatcher));
    ASSERT_TRUE(app_->start().has_value());
  }

  void TearDown() override {
    if (app_) {
      app_->stop();
    }
  }

  auto job_status(const JobId &id) -> JobStatus {
    return app_->jobs().find_job(id).value().status;
  }

  LocalDispatcher *local_{nullptr};
  std::unique_ptr<Application> app_;
};

TEST_F(ApplicationTest, StartAndStopAreIdempotent) {
  make_app(fast_options());
  EXPECT_TRUE(app_->is_running());
  EXPECT_TRUE(app_->scheduler().is_running());
  EXPECT_TRUE(app_->start().has_value());
  EXPECT_TRUE(app_->database().is_open());

  app_->stop();
  EXPECT_FALSE(app_->is_running());
  EXPECT_FALSE(app_->scheduler().is_running());
  app_->stop();
}

TEST_F(ApplicationTest, LocalDispatcherDrivesJobToCompletion) {
  make_app(fast_options());
  ASSERT_TRUE(app_->workers()
                  .register_worker(make_worker_spec("w1", 2))
                  .has_value());
  ASSERT_TRUE(app_->workers()
                  .register_worker(make_worker_spec("w2", 1))
                  .has_value());

  auto id = app_->scheduler().submit_job(make_job_spec("batch"),
                                         make_task_specs(6));
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(poll_until(
      [&] { return job_status(*id) == JobStatus::Completed; }, 10s));
  auto j = app_->jobs().find_job(*id).value();
  EXPECT_EQ(j.progress_percent, 100);
  EXPECT_EQ(app_->tasks().counts_for_job(*id).completed, 6u);
  EXPECT_GE(local_->dispatched(), 6u);

  ASSERT_TRUE(poll_until([&] { return local_->in_flight() == 0; }, 5s));
  for (const auto &w : app_->workers().list_workers().items) {
    EXPECT_EQ(w.current_task_count, 0) << w.name;
  }
}

TEST_F(ApplicationTest, FailingTasksLeaveJobRunning) {
  auto options = fast_options();
  options.fail_rate = 1.0;
  make_app(options);
  ASSERT_TRUE(app_->workers()
                  .register_worker(make_worker_spec("w", 1))
                  .has_value());

  auto id = app_->scheduler().submit_job(make_job_spec("doomed"),
                                         make_task_specs(3));
  ASSERT_TRUE(id.has_value());

  ASSERT_TRUE(poll_until(
      [&] { return app_->tasks().counts_for_job(*id).failed == 3; }, 10s));
  EXPECT_EQ(job_status(*id), JobStatus::Running);
  EXPECT_TRUE(poll_until([&] { return local_->failed() == 3u; }, 5s));

  auto failed = app_->tasks().find_task(app_->tasks().tasks_for_job(*id)[0]);
  ASSERT_TRUE(failed.has_value());
  EXPECT_FALSE(is_null_json(failed->error_details));
}

TEST_F(ApplicationTest, RejectedDispatchLeavesTaskPending) {
  auto options = fast_options();
  options.reject_rate = 1.0;
  make_app(options);
  auto w = app_->workers().register_worker(make_worker_spec("w", 1)).value();

  auto id = app_->scheduler().submit_job(make_job_spec("bounced"),
                                         make_task_specs(1));
  ASSERT_TRUE(id.has_value());

  EXPECT_GE(local_->rejected(), 1u);
  EXPECT_EQ(local_->dispatched(), 0u);
  auto counts = app_->tasks().counts_for_job(*id);
  EXPECT_EQ(counts.pending, 1u);
  EXPECT_EQ(counts.in_flight(), 0u);
  EXPECT_EQ(app_->workers().get_worker(w).value().current_task_count, 0);
  EXPECT_EQ(job_status(*id), JobStatus::Queued);
}

TEST_F(ApplicationTest, StopWaitsForRunningTasksToSettle) {
  auto options = fast_options();
  options.min_duration = 50ms;
  options.max_duration = 50ms;
  make_app(options);
  ASSERT_TRUE(app_->workers()
                  .register_worker(make_worker_spec("w", 1))
                  .has_value());

  auto id = app_->scheduler().submit_job(make_job_spec("slow"),
                                         make_task_specs(1));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(poll_until(
      [&] { return app_->tasks().counts_for_job(*id).running == 1; }, 5s));

  app_->stop();
  EXPECT_EQ(local_->dispatched(), 1u);
  EXPECT_EQ(local_->in_flight(), 0u);
  EXPECT_EQ(local_->failed(), 0u);
}

TEST_F(ApplicationTest, ScheduledJobDispatchesWhenDue) {
  make_app(fast_options());
  ASSERT_TRUE(app_->workers()
                  .register_worker(make_worker_spec("w", 1))
                  .has_value());

  auto spec = make_job_spec("later");
  spec.scheduled_start = std::chrono::system_clock::now() + 200ms;
  auto id = app_->scheduler().submit_job(spec, make_task_specs(2));
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(job_status(*id), JobStatus::Pending);

  ASSERT_TRUE(poll_until(
      [&] { return job_status(*id) == JobStatus::Completed; }, 10s));
  EXPECT_EQ(app_->scheduler().deferred_count(), 0u);
}

#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/job.hpp"
#include "batchforge/domain/task.hpp"
#include "batchforge/domain/worker.hpp"
#include "batchforge/scheduler/dispatcher.hpp"
#include "batchforge/scheduler/scheduler.hpp"
#include "batchforge/storage/memory_database.hpp"
#include "batchforge/store/history_recorder.hpp"
#include "batchforge/store/job_store.hpp"
#include "batchforge/store/task_store.hpp"
#include "batchforge/util/id.hpp"
#include "batchforge/worker/worker_registry.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <format>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace batchforge::test {

inline const TenantId kTenant{"tenant-a"};
inline const TenantId kOtherTenant{"tenant-b"};
inline const UserId kUser{"alice"};

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto make_job_spec(std::string_view name,
                                        int max_retries = 3) -> JobSpec {
  return JobSpec{
      .tenant_id = kTenant,
      .created_by = kUser,
      .name = std::string(name),
      .max_retries = max_retries,
  };
}

[[nodiscard]] inline auto make_task_specs(int count) -> std::vector<TaskSpec> {
  std::vector<TaskSpec> specs;
  for (int i = 1; i <= count; ++i) {
    specs.push_back(TaskSpec{.name = std::format("step-{}", i),
                             .sequence_number = i});
  }
  return specs;
}

[[nodiscard]] inline auto make_worker_spec(std::string_view name,
                                           int capacity = 1) -> WorkerSpec {
  return WorkerSpec{.name = std::string(name),
                    .host = "localhost",
                    .max_concurrent_tasks = capacity};
}

// Accepts every dispatch and remembers it; the test decides when tasks start
// and finish.
class RecordingDispatcher final : public Dispatcher {
public:
  struct Dispatch {
    WorkerId worker;
    TaskId task;
  };

  auto dispatch(const WorkerId &worker, const TaskId &task,
                const JsonValue & /*parameters*/) -> Result<void> override {
    std::scoped_lock lock(mu_);
    if (failures_ > 0) {
      --failures_;
      return fail(Error::DispatchFailed);
    }
    sent_.push_back({worker, task});
    return ok();
  }

  auto fail_next(std::size_t count) -> void {
    std::scoped_lock lock(mu_);
    failures_ = count;
  }

  [[nodiscard]] auto sent() const -> std::vector<Dispatch> {
    std::scoped_lock lock(mu_);
    return sent_;
  }

  [[nodiscard]] auto count() const -> std::size_t {
    std::scoped_lock lock(mu_);
    return sent_.size();
  }

private:
  mutable std::mutex mu_;
  std::vector<Dispatch> sent_;
  std::size_t failures_{0};
};

// Full in-memory stack without io threads: deferred timers only fire while a
// test runs io_ itself.
class SchedulerFixture : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(db_.open().has_value());
    scheduler_.start();
  }

  void TearDown() override { scheduler_.stop(); }

  auto add_worker(std::string_view name, int capacity = 1) -> WorkerId {
    return workers_.register_worker(make_worker_spec(name, capacity)).value();
  }

  auto submit(const JobSpec &spec, const std::vector<TaskSpec> &tasks)
      -> JobId {
    return scheduler_.submit_job(spec, tasks).value();
  }

  auto job(const JobId &id) -> Job { return jobs_.find_job(id).value(); }
  auto task(const TaskId &id) -> Task { return tasks_.find_task(id).value(); }
  auto worker(const WorkerId &id) -> Worker {
    return workers_.get_worker(id).value();
  }

  auto job_tasks(const JobId &id) -> std::vector<Task> {
    std::vector<Task> out;
    for (const auto &t : tasks_.tasks_for_job(id)) {
      out.push_back(task(t));
    }
    return out;
  }

  // Drives one dispatched task through start and completion.
  auto run_to_completion(const TaskId &id) -> void {
    ASSERT_TRUE(scheduler_.on_task_started(id).has_value());
    ASSERT_TRUE(scheduler_.on_task_completed(id, JsonValue{}).has_value());
  }

  auto run_to_failure(const TaskId &id, std::string_view message = "boom")
      -> void {
    ASSERT_TRUE(scheduler_.on_task_started(id).has_value());
    ASSERT_TRUE(
        scheduler_.on_task_failed(id, error_payload(message)).has_value());
  }

  storage::MemoryDatabase db_;
  HistoryRecorder history_{db_};
  WorkerRegistry workers_{db_};
  TaskStore tasks_{db_, workers_, history_};
  JobStore jobs_{db_, tasks_, history_};
  boost::asio::io_context io_;
  RecordingDispatcher dispatcher_;
  Scheduler scheduler_{io_, jobs_, tasks_, workers_, dispatcher_};
};

} // namespace batchforge::test

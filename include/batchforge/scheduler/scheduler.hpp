#pragma once

#include "batchforge/core/coroutine.hpp"
#include "batchforge/core/error.hpp"
#include "batchforge/domain/job.hpp"
#include "batchforge/domain/task.hpp"
#include "batchforge/scheduler/dispatcher.hpp"
#include "batchforge/store/job_store.hpp"
#include "batchforge/store/task_store.hpp"
#include "batchforge/util/id.hpp"
#include "batchforge/worker/worker_registry.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace batchforge {

struct SweepReport {
  std::size_t workers_marked_offline{0};
  std::size_t jobs_dispatched{0};
  std::size_t tasks_assigned{0};
};

// Orchestrates jobs, tasks and workers. Holds no entity state of its own:
// everything goes through the stores. Deferred jobs wait on a steady_timer
// coroutine on `io`; assignment is otherwise driven by submissions,
// completions, heartbeats and periodic sweeps.
class Scheduler final : public CompletionHandler {
public:
  Scheduler(boost::asio::io_context &io, JobStore &jobs, TaskStore &tasks,
            WorkerRegistry &workers, Dispatcher &dispatcher);
  ~Scheduler() override;

  Scheduler(const Scheduler &) = delete;
  auto operator=(const Scheduler &) -> Scheduler & = delete;

  auto set_task_planner(TaskPlanner *planner) -> void { planner_ = planner; }
  auto set_heartbeat_timeout(std::chrono::seconds timeout) -> void {
    heartbeat_timeout_ = timeout;
  }

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Creates the job and its tasks, then dispatches now or at scheduled_start.
  // Without explicit tasks the planner expands the job.
  [[nodiscard]] auto submit_job(const JobSpec &spec,
                                std::span<const TaskSpec> tasks = {})
      -> Result<JobId>;
  [[nodiscard]] auto add_task(const TenantId &tenant, const JobId &job,
                              const TaskSpec &spec, const UserId &actor)
      -> Result<TaskId>;

  // Assigns Pending tasks of the job in sequence order until it runs out of
  // tasks or eligible workers. Returns how many were dispatched.
  auto assign_pending_tasks(const JobId &job) -> std::size_t;

  auto on_task_started(const TaskId &task) -> Result<void> override;
  auto on_task_completed(const TaskId &task, JsonValue result)
      -> Result<void> override;
  auto on_task_failed(const TaskId &task, JsonValue error)
      -> Result<void> override;

  [[nodiscard]] auto on_worker_heartbeat(
      const WorkerId &worker, std::chrono::system_clock::time_point at)
      -> Result<void>;
  // Re-runs assignment, `first` before the other active jobs.
  auto on_capacity_released(const std::optional<JobId> &first = std::nullopt)
      -> std::size_t;

  [[nodiscard]] auto retry_job(const TenantId &tenant, const JobId &job,
                               const UserId &actor) -> Result<void>;
  [[nodiscard]] auto cancel_job(const TenantId &tenant, const JobId &job,
                                const UserId &actor) -> Result<void>;
  [[nodiscard]] auto pause_job(const TenantId &tenant, const JobId &job,
                               const UserId &actor) -> Result<void>;
  [[nodiscard]] auto resume_job(const TenantId &tenant, const JobId &job,
                                const UserId &actor) -> Result<void>;
  [[nodiscard]] auto fail_job(const TenantId &tenant, const JobId &job,
                              JsonValue error, const UserId &actor)
      -> Result<void>;

  // Marks stale workers Offline, dispatches due Pending jobs and re-runs
  // assignment for Queued and Running jobs.
  auto sweep(std::chrono::system_clock::time_point now) -> SweepReport;

  [[nodiscard]] auto deferred_count() const -> std::size_t;

private:
  [[nodiscard]] auto dispatch_job(const JobId &job) -> Result<std::size_t>;
  [[nodiscard]] auto expand_tasks(const JobSpec &spec, const JobId &job,
                                  std::span<const TaskSpec> tasks)
      -> Result<void>;
  auto schedule_deferred(const JobId &job,
                         std::chrono::system_clock::time_point when) -> void;
  auto cancel_deferred(const JobId &job) -> void;
  auto run_deferred(JobId job, std::shared_ptr<boost::asio::steady_timer> timer,
                    std::chrono::system_clock::time_point when)
      -> spawn_task;

  boost::asio::io_context &io_;
  JobStore &jobs_;
  TaskStore &tasks_;
  WorkerRegistry &workers_;
  Dispatcher &dispatcher_;
  TaskPlanner *planner_{nullptr};
  std::chrono::seconds heartbeat_timeout_{90};

  std::atomic<bool> running_{false};
  mutable std::mutex deferred_mu_;
  ankerl::unordered_dense::map<JobId,
                               std::shared_ptr<boost::asio::steady_timer>>
      deferred_;
};

} // namespace batchforge

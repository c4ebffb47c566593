#include "batchforge/scheduler/scheduler.hpp"

#include "batchforge/core/coroutine.hpp"
#include "batchforge/util/log.hpp"
#include "batchforge/util/time.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <ankerl/unordered_dense.h>

#include <format>
#include <string>
#include <utility>

namespace batchforge {

namespace {

[[nodiscard]] auto validate_task_list(std::span<const TaskSpec> tasks)
    -> Result<void> {
  ankerl::unordered_dense::set<int> sequences;
  for (const auto &spec : tasks) {
    if (auto valid = validate_task_spec(spec); !valid) {
      return valid;
    }
    if (!sequences.insert(spec.sequence_number).second) {
      return fail(Error::InvalidSpec);
    }
  }
  return ok();
}

[[nodiscard]] auto accepts_assignment(JobStatus status) noexcept -> bool {
  return status == JobStatus::Queued || status == JobStatus::Running;
}

} // namespace

Scheduler::Scheduler(boost::asio::io_context &io, JobStore &jobs,
                     TaskStore &tasks, WorkerRegistry &workers,
                     Dispatcher &dispatcher)
    : io_(io), jobs_(jobs), tasks_(tasks), workers_(workers),
      dispatcher_(dispatcher) {}

Scheduler::~Scheduler() { stop(); }

auto Scheduler::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  log::info("Scheduler started");
}

auto Scheduler::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  std::scoped_lock lock(deferred_mu_);
  for (auto &[_, timer] : deferred_) {
    timer->cancel();
  }
  deferred_.clear();
  log::info("Scheduler stopped");
}

auto Scheduler::submit_job(const JobSpec &spec,
                           std::span<const TaskSpec> tasks) -> Result<JobId> {
  if (!is_running()) {
    return fail(Error::SystemNotRunning);
  }
  if (auto valid = validate_task_list(tasks); !valid) {
    return fail(valid.error());
  }

  auto job = jobs_.create_job(spec);
  if (!job) {
    return job;
  }
  if (auto expanded = expand_tasks(spec, *job, tasks); !expanded) {
    log::error("Job {}: task expansion failed: {}", *job,
               expanded.error().message());
    if (auto c = jobs_.cancel_job(spec.tenant_id, *job, kSystemActor); !c) {
      log::error("Job {}: could not cancel after failed expansion: {}", *job,
                 c.error().message());
    }
    return fail(expanded.error());
  }

  if (spec.scheduled_start) {
    schedule_deferred(*job, *spec.scheduled_start);
    return job;
  }
  if (auto dispatched = dispatch_job(*job); !dispatched) {
    log::warn("Job {}: immediate dispatch failed: {}", *job,
              dispatched.error().message());
  }
  return job;
}

auto Scheduler::expand_tasks(const JobSpec &spec, const JobId &job,
                             std::span<const TaskSpec> tasks) -> Result<void> {
  std::vector<TaskSpec> planned;
  if (tasks.empty() && planner_ != nullptr) {
    auto created = jobs_.find_job(job);
    if (!created) {
      return fail(created.error());
    }
    auto plan = planner_->plan(*created);
    if (!plan) {
      return fail(plan.error());
    }
    if (auto valid = validate_task_list(*plan); !valid) {
      return valid;
    }
    planned = std::move(*plan);
    tasks = planned;
  }

  for (const auto &task_spec : tasks) {
    auto created =
        tasks_.create_task(spec.tenant_id, job, task_spec, spec.created_by);
    if (!created) {
      return fail(created.error());
    }
  }
  log::debug("Job {} expanded into {} tasks", job, tasks.size());
  return ok();
}

auto Scheduler::add_task(const TenantId &tenant, const JobId &job,
                         const TaskSpec &spec, const UserId &actor)
    -> Result<TaskId> {
  auto current = jobs_.get_job(tenant, job);
  if (!current) {
    return fail(current.error());
  }
  if (is_terminal(current->status)) {
    return transition_error(current->status);
  }
  auto task = tasks_.create_task(tenant, job, spec, actor);
  if (!task) {
    return task;
  }
  if (accepts_assignment(current->status)) {
    if (auto r = jobs_.recompute_progress(job); !r) {
      log::warn("Job {}: progress recompute after add failed: {}", job,
                r.error().message());
    }
    assign_pending_tasks(job);
  }
  return task;
}

auto Scheduler::dispatch_job(const JobId &job) -> Result<std::size_t> {
  if (auto queued = jobs_.queue_job(job); !queued) {
    return fail(queued.error());
  }
  log::info("Job {} queued", job);
  return ok(assign_pending_tasks(job));
}

auto Scheduler::assign_pending_tasks(const JobId &job) -> std::size_t {
  auto counts = tasks_.counts_for_job(job);
  // Each failed attempt is another caller's progress; bound the loop anyway.
  const auto budget = 2 * counts.total + 8;

  std::size_t assigned = 0;
  for (std::size_t attempt = 0; attempt < budget; ++attempt) {
    auto current = jobs_.find_job(job);
    if (!current || !accepts_assignment(current->status)) {
      break;
    }
    auto task = tasks_.claim_next_task(job);
    if (!task) {
      break;
    }
    auto worker = workers_.select_candidate();
    if (!worker) {
      log::debug("Job {}: no eligible worker for task {}", job, *task);
      break;
    }

    auto reserved = workers_.reserve_capacity(*worker);
    if (!reserved) {
      log::warn("Job {}: reserving worker {} failed: {}", job, *worker,
                reserved.error().message());
      break;
    }
    if (!*reserved) {
      continue;
    }

    if (auto r = tasks_.assign_task(*task, *worker); !r) {
      log::debug("Job {}: task {} claimed elsewhere ({})", job, *task,
                 r.error().message());
      if (auto a = workers_.abandon_reservation(*worker); !a) {
        log::error("Worker {}: abandoning reservation failed: {}", *worker,
                   a.error().message());
      }
      continue;
    }

    auto assigned_task = tasks_.find_task(*task);
    if (!assigned_task) {
      break;
    }
    if (auto sent = dispatcher_.dispatch(*worker, *task,
                                         assigned_task->parameters);
        !sent) {
      log::warn("Dispatch of task {} to worker {} failed: {}", *task, *worker,
                sent.error().message());
      if (auto u = tasks_.unassign_task(
              *task, std::format("Dispatch failed: {}", sent.error().message()));
          !u) {
        log::error("Task {}: unassign after failed dispatch: {}", *task,
                   u.error().message());
      }
      break;
    }
    log::debug("Task {} dispatched to worker {}", *task, *worker);
    ++assigned;
  }
  return assigned;
}

auto Scheduler::on_task_started(const TaskId &task) -> Result<void> {
  return tasks_.start_task(task);
}

auto Scheduler::on_task_completed(const TaskId &task, JsonValue result)
    -> Result<void> {
  auto current = tasks_.find_task(task);
  if (!current) {
    return fail(current.error());
  }
  if (auto r = tasks_.complete_task(task, std::move(result)); !r) {
    return r;
  }
  on_capacity_released(current->job_id);
  return ok();
}

auto Scheduler::on_task_failed(const TaskId &task, JsonValue error)
    -> Result<void> {
  auto current = tasks_.find_task(task);
  if (!current) {
    return fail(current.error());
  }
  if (auto r = tasks_.fail_task(task, std::move(error)); !r) {
    return r;
  }
  on_capacity_released(current->job_id);
  return ok();
}

auto Scheduler::on_worker_heartbeat(const WorkerId &worker,
                                    std::chrono::system_clock::time_point at)
    -> Result<void> {
  if (auto r = workers_.heartbeat(worker, at); !r) {
    return r;
  }
  on_capacity_released();
  return ok();
}

auto Scheduler::on_capacity_released(const std::optional<JobId> &first)
    -> std::size_t {
  std::size_t assigned = 0;
  if (first) {
    assigned += assign_pending_tasks(*first);
  }
  for (const auto &job : jobs_.active_jobs()) {
    if (first && job == *first) {
      continue;
    }
    assigned += assign_pending_tasks(job);
  }
  return assigned;
}

auto Scheduler::retry_job(const TenantId &tenant, const JobId &job,
                          const UserId &actor) -> Result<void> {
  if (auto r = jobs_.retry_job(tenant, job, actor); !r) {
    return r;
  }
  if (auto dispatched = dispatch_job(job); !dispatched) {
    log::warn("Job {}: re-queue after retry failed: {}", job,
              dispatched.error().message());
  }
  on_capacity_released();
  return ok();
}

auto Scheduler::cancel_job(const TenantId &tenant, const JobId &job,
                           const UserId &actor) -> Result<void> {
  if (auto r = jobs_.cancel_job(tenant, job, actor); !r) {
    return r;
  }
  cancel_deferred(job);
  on_capacity_released();
  return ok();
}

auto Scheduler::pause_job(const TenantId &tenant, const JobId &job,
                          const UserId &actor) -> Result<void> {
  return jobs_.pause_job(tenant, job, actor);
}

auto Scheduler::resume_job(const TenantId &tenant, const JobId &job,
                           const UserId &actor) -> Result<void> {
  auto status = jobs_.resume_job(tenant, job, actor);
  if (!status) {
    return fail(status.error());
  }
  if (accepts_assignment(*status)) {
    assign_pending_tasks(job);
    return ok();
  }
  if (*status != JobStatus::Pending) {
    return ok();
  }
  auto current = jobs_.find_job(job);
  if (!current) {
    return fail(current.error());
  }
  if (current->scheduled_start &&
      *current->scheduled_start > std::chrono::system_clock::now()) {
    schedule_deferred(job, *current->scheduled_start);
    return ok();
  }
  if (auto dispatched = dispatch_job(job); !dispatched) {
    log::warn("Job {}: dispatch after resume failed: {}", job,
              dispatched.error().message());
  }
  return ok();
}

auto Scheduler::fail_job(const TenantId &tenant, const JobId &job,
                         JsonValue error, const UserId &actor) -> Result<void> {
  return jobs_.fail_job(tenant, job, std::move(error), actor);
}

auto Scheduler::sweep(std::chrono::system_clock::time_point now)
    -> SweepReport {
  SweepReport report;
  report.workers_marked_offline =
      workers_.mark_stale_offline(now, heartbeat_timeout_);

  for (const auto &job : jobs_.due_jobs(now)) {
    cancel_deferred(job);
    if (auto dispatched = dispatch_job(job); dispatched) {
      ++report.jobs_dispatched;
      report.tasks_assigned += *dispatched;
    }
  }
  for (const auto &job : jobs_.active_jobs()) {
    report.tasks_assigned += assign_pending_tasks(job);
  }

  if (report.workers_marked_offline > 0 || report.jobs_dispatched > 0 ||
      report.tasks_assigned > 0) {
    log::info("Sweep: {} workers offline, {} jobs dispatched, {} tasks "
              "assigned",
              report.workers_marked_offline, report.jobs_dispatched,
              report.tasks_assigned);
  }
  return report;
}

auto Scheduler::deferred_count() const -> std::size_t {
  std::scoped_lock lock(deferred_mu_);
  return deferred_.size();
}

auto Scheduler::schedule_deferred(const JobId &job,
                                  std::chrono::system_clock::time_point when)
    -> void {
  auto timer = std::make_shared<boost::asio::steady_timer>(io_);
  {
    std::scoped_lock lock(deferred_mu_);
    auto &slot = deferred_[job];
    if (slot) {
      slot->cancel();
    }
    slot = timer;
  }
  log::info("Job {} deferred until {}", job, util::format_iso8601(when));
  boost::asio::co_spawn(io_, run_deferred(job, std::move(timer), when),
                        boost::asio::detached);
}

auto Scheduler::cancel_deferred(const JobId &job) -> void {
  std::scoped_lock lock(deferred_mu_);
  auto it = deferred_.find(job);
  if (it == deferred_.end()) {
    return;
  }
  it->second->cancel();
  deferred_.erase(it);
}

auto Scheduler::run_deferred(JobId job,
                             std::shared_ptr<boost::asio::steady_timer> timer,
                             std::chrono::system_clock::time_point when)
    -> spawn_task {
  auto delay = when - std::chrono::system_clock::now();
  if (delay < std::chrono::milliseconds(0)) {
    delay = std::chrono::milliseconds(0);
  }
  timer->expires_after(
      std::chrono::duration_cast<boost::asio::steady_timer::duration>(delay));

  auto ec = co_await await_timer(*timer);
  if (ec == boost::asio::error::operation_aborted) {
    co_return;
  }
  if (ec) {
    log::warn("Deferred dispatch timer for job {} failed: {}", job,
              ec.message());
    co_return;
  }

  {
    std::scoped_lock lock(deferred_mu_);
    auto it = deferred_.find(job);
    if (it == deferred_.end() || it->second.get() != timer.get()) {
      co_return;
    }
    deferred_.erase(it);
  }
  if (!is_running()) {
    co_return;
  }
  if (auto dispatched = dispatch_job(job); !dispatched) {
    log::debug("Deferred job {} not dispatched: {}", job,
               dispatched.error().message());
  }
}

} // namespace batchforge

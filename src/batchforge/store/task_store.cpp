#include "batchforge/store/task_store.hpp"

#include "batchforge/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <ranges>
#include <tuple>

namespace batchforge {

namespace {

[[nodiscard]] auto now() -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::now();
}

[[nodiscard]] auto run_duration(const Task &task)
    -> std::optional<std::chrono::milliseconds> {
  if (!task.started_at || !task.completed_at) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      *task.completed_at - *task.started_at);
}

} // namespace

TaskStore::TaskStore(storage::DatabaseService &db, WorkerRegistry &workers,
                     HistoryRecorder &history)
    : db_(db), workers_(workers), history_(history) {}

auto TaskStore::set_on_task_started(TaskEventCallback cb) -> void {
  on_started_ = std::move(cb);
}

auto TaskStore::set_on_task_finished(TaskEventCallback cb) -> void {
  on_finished_ = std::move(cb);
}

auto TaskStore::load_from_database() -> Result<void> {
  auto rows = db_.load_tasks();
  if (!rows) {
    log::error("Failed to load tasks: {}", rows.error().message());
    return fail(rows.error());
  }
  std::unique_lock lock(mu_);
  tasks_.clear();
  by_job_.clear();
  for (auto &t : *rows) {
    auto slot = std::make_shared<Slot>(std::move(t));
    tasks_.emplace(slot->task.id, slot);
    by_job_[slot->job_id].push_back(slot);
  }
  for (auto &[_, slots] : by_job_) {
    std::ranges::sort(slots, {}, [](const SlotPtr &s) { return s->sequence; });
  }
  log::info("Loaded {} tasks across {} jobs", tasks_.size(), by_job_.size());
  return ok();
}

auto TaskStore::find_slot(const TaskId &id) const -> SlotPtr {
  std::shared_lock lock(mu_);
  auto it = tasks_.find(id);
  return it != tasks_.end() ? it->second : nullptr;
}

auto TaskStore::job_slots(const JobId &job) const -> std::vector<SlotPtr> {
  std::shared_lock lock(mu_);
  auto it = by_job_.find(job);
  return it != by_job_.end() ? it->second : std::vector<SlotPtr>{};
}

auto TaskStore::transition(Slot &slot, Task next, std::string_view reason,
                           const UserId &actor) -> Result<void> {
  const auto previous = slot.task.status;
  next.updated_at = now();
  auto version = history_.commit_task(next, previous, reason, actor);
  if (!version) {
    return fail(version.error());
  }
  next.version = *version;
  slot.task = std::move(next);
  return ok();
}

auto TaskStore::release_held_capacity(const Task &task, TaskOutcome outcome)
    -> void {
  if (!holds_capacity(task.status) || !task.worker_id) {
    return;
  }
  if (auto r = workers_.release_capacity(*task.worker_id, outcome,
                                         run_duration(task));
      !r) {
    log::error("Task {}: failed to release capacity on worker {}: {}", task.id,
               *task.worker_id, r.error().message());
  }
}

auto TaskStore::notify(TaskEventCallback &cb, const Task &task) -> void {
  if (cb) {
    cb(task);
  }
}

auto TaskStore::create_task(const TenantId &tenant, const JobId &job,
                            const TaskSpec &spec, const UserId &actor)
    -> Result<TaskId> {
  if (auto valid = validate_task_spec(spec); !valid) {
    return fail(valid.error());
  }
  const auto ts = now();
  Task task{
      .id = generate_task_id(),
      .job_id = job,
      .tenant_id = tenant,
      .name = spec.name,
      .sequence_number = spec.sequence_number,
      .status = TaskStatus::Pending,
      .max_retries = spec.max_retries,
      .timeout = spec.timeout,
      .parameters = spec.parameters,
      .created_at = ts,
      .updated_at = ts,
  };

  std::unique_lock lock(mu_);
  auto &siblings = by_job_[job];
  const auto pos = std::ranges::lower_bound(
      siblings, spec.sequence_number, {},
      [](const SlotPtr &s) { return s->sequence; });
  if (pos != siblings.end() && (*pos)->sequence == spec.sequence_number) {
    return fail(Error::AlreadyExists);
  }

  auto version = history_.commit_task(task, std::nullopt, "Task created", actor);
  if (!version) {
    if (siblings.empty()) {
      by_job_.erase(job);
    }
    return fail(version.error());
  }
  task.version = *version;
  auto id = task.id;
  auto slot = std::make_shared<Slot>(std::move(task));
  siblings.insert(pos, slot);
  tasks_.emplace(id, std::move(slot));
  return ok(std::move(id));
}

auto TaskStore::claim_next_task(const JobId &job) const
    -> std::optional<TaskId> {
  for (const auto &slot : job_slots(job)) {
    std::scoped_lock lock(slot->mu);
    if (slot->task.status == TaskStatus::Pending) {
      return slot->task.id;
    }
  }
  return std::nullopt;
}

auto TaskStore::assign_task(const TaskId &id, const WorkerId &worker)
    -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  const auto &current = slot->task;
  if (!can_transition(current.status, TaskStatus::Assigned)) {
    return transition_error(current.status);
  }
  if (!workers_.has_reservation(worker)) {
    return fail(Error::CapacityUnavailable);
  }

  auto next = current;
  next.status = TaskStatus::Assigned;
  next.worker_id = worker;
  next.assigned_at = now();
  if (auto r = transition(*slot, std::move(next),
                          std::format("Assigned to worker {}", worker),
                          kSystemActor);
      !r) {
    return r;
  }

  if (auto bound = workers_.bind_reservation(worker); !bound) {
    // Another caller consumed the reservation between the check and the bind.
    log::error("Task {}: reservation on worker {} vanished, reverting", id,
               worker);
    auto back = slot->task;
    back.status = TaskStatus::Pending;
    back.worker_id.reset();
    back.assigned_at.reset();
    if (auto r = transition(*slot, std::move(back), "Reservation lost",
                            kSystemActor);
        !r) {
      log::error("Task {}: revert failed: {}", id, r.error().message());
    }
    return fail(Error::CapacityUnavailable);
  }
  return ok();
}

auto TaskStore::unassign_task(const TaskId &id, std::string_view reason)
    -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  const auto before = slot->task;
  if (before.status != TaskStatus::Assigned) {
    return transition_error(before.status);
  }
  auto next = before;
  next.status = TaskStatus::Pending;
  next.worker_id.reset();
  next.assigned_at.reset();
  if (auto r = transition(*slot, std::move(next), reason, kSystemActor); !r) {
    return r;
  }
  release_held_capacity(before, TaskOutcome::Unassigned);
  return ok();
}

auto TaskStore::start_task(const TaskId &id) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  Task started;
  {
    std::scoped_lock lock(slot->mu);
    const auto &current = slot->task;
    if (!can_transition(current.status, TaskStatus::Running)) {
      return transition_error(current.status);
    }
    auto next = current;
    next.status = TaskStatus::Running;
    next.started_at = now();
    if (auto r = transition(*slot, std::move(next), "Task started",
                            kSystemActor);
        !r) {
      return r;
    }
    started = slot->task;
  }
  notify(on_started_, started);
  return ok();
}

auto TaskStore::complete_task(const TaskId &id, JsonValue result)
    -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  Task finished;
  {
    std::scoped_lock lock(slot->mu);
    const auto &current = slot->task;
    if (!can_transition(current.status, TaskStatus::Completed)) {
      return transition_error(current.status);
    }
    auto next = current;
    next.status = TaskStatus::Completed;
    next.progress_percent = 100;
    next.result_data = std::move(result);
    next.completed_at = now();
    if (auto r = transition(*slot, std::move(next), "Task completed",
                            kSystemActor);
        !r) {
      return r;
    }
    finished = slot->task;
    // Duration comes from the finished copy; status from the running one.
    auto held = finished;
    held.status = TaskStatus::Running;
    release_held_capacity(held, TaskOutcome::Completed);
  }
  notify(on_finished_, finished);
  return ok();
}

auto TaskStore::fail_task(const TaskId &id, JsonValue error) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  Task finished;
  {
    std::scoped_lock lock(slot->mu);
    const auto &current = slot->task;
    if (!can_transition(current.status, TaskStatus::Failed)) {
      return transition_error(current.status);
    }
    auto next = current;
    next.status = TaskStatus::Failed;
    next.error_details = std::move(error);
    next.completed_at = now();
    if (auto r = transition(*slot, std::move(next), "Task failed",
                            kSystemActor);
        !r) {
      return r;
    }
    finished = slot->task;
    auto held = finished;
    held.status = TaskStatus::Running;
    release_held_capacity(held, TaskOutcome::Failed);
  }
  log::warn("Task {} of job {} failed: {}", id, finished.job_id,
            dump_json(finished.error_details));
  notify(on_finished_, finished);
  return ok();
}

auto TaskStore::cancel_task(const TaskId &id, std::string_view reason,
                            const UserId &actor) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  const auto before = slot->task;
  if (!can_transition(before.status, TaskStatus::Cancelled)) {
    return transition_error(before.status);
  }
  auto next = before;
  next.status = TaskStatus::Cancelled;
  next.completed_at = now();
  if (auto r = transition(*slot, std::move(next), reason, actor); !r) {
    return r;
  }
  release_held_capacity(before, TaskOutcome::Cancelled);
  return ok();
}

auto TaskStore::reset_for_retry(const TaskId &id, const UserId &actor)
    -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  const auto before = slot->task;
  if (before.status == TaskStatus::Pending) {
    return ok();
  }
  auto next = before;
  next.status = TaskStatus::Pending;
  next.worker_id.reset();
  next.assigned_at.reset();
  next.started_at.reset();
  next.completed_at.reset();
  next.progress_percent = 0;
  next.result_data = JsonValue{};
  next.error_details = JsonValue{};
  if (before.status == TaskStatus::Failed &&
      next.retry_count < next.max_retries) {
    ++next.retry_count;
  }
  if (auto r = transition(*slot, std::move(next), "Reset for job retry", actor);
      !r) {
    return r;
  }
  release_held_capacity(before, TaskOutcome::Unassigned);
  return ok();
}

auto TaskStore::get_task(const TenantId &tenant, const TaskId &id) const
    -> Result<Task> {
  auto slot = find_slot(id);
  if (!slot || slot->tenant_id != tenant) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  return ok(slot->task);
}

auto TaskStore::find_task(const TaskId &id) const -> Result<Task> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  return ok(slot->task);
}

auto TaskStore::list_tasks(const TenantId &tenant,
                           const TaskFilter &filter) const -> Page<Task> {
  std::vector<SlotPtr> candidates;
  if (filter.job_id) {
    candidates = job_slots(*filter.job_id);
  } else {
    std::shared_lock lock(mu_);
    candidates.reserve(tasks_.size());
    for (const auto &[_, slot] : tasks_) {
      candidates.push_back(slot);
    }
  }

  std::vector<Task> rows;
  for (const auto &slot : candidates) {
    if (slot->tenant_id != tenant) {
      continue;
    }
    std::scoped_lock lock(slot->mu);
    const auto &t = slot->task;
    if (filter.worker_id && t.worker_id != filter.worker_id) {
      continue;
    }
    if (filter.status && t.status != *filter.status) {
      continue;
    }
    rows.push_back(t);
  }
  std::ranges::sort(rows, [](const Task &a, const Task &b) {
    return std::tie(a.sequence_number, a.created_at, a.id) <
           std::tie(b.sequence_number, b.created_at, b.id);
  });
  return paginate(std::move(rows), filter.offset, filter.limit);
}

auto TaskStore::task_history(const TenantId &tenant, const TaskId &id,
                             std::size_t offset, std::size_t limit) const
    -> Result<Page<TaskHistoryEntry>> {
  auto slot = find_slot(id);
  if (!slot || slot->tenant_id != tenant) {
    return fail(Error::NotFound);
  }
  return history_.task_history(id, offset, limit);
}

auto TaskStore::tasks_for_job(const JobId &job) const -> std::vector<TaskId> {
  std::vector<TaskId> ids;
  for (const auto &slot : job_slots(job)) {
    std::scoped_lock lock(slot->mu);
    ids.push_back(slot->task.id);
  }
  return ids;
}

auto TaskStore::counts_for_job(const JobId &job) const -> TaskCounts {
  TaskCounts counts;
  for (const auto &slot : job_slots(job)) {
    std::scoped_lock lock(slot->mu);
    ++counts.total;
    switch (slot->task.status) {
    case TaskStatus::Pending:
      ++counts.pending;
      break;
    case TaskStatus::Assigned:
      ++counts.assigned;
      break;
    case TaskStatus::Running:
      ++counts.running;
      break;
    case TaskStatus::Completed:
      ++counts.completed;
      break;
    case TaskStatus::Failed:
      ++counts.failed;
      break;
    case TaskStatus::Cancelled:
      ++counts.cancelled;
      break;
    }
  }
  return counts;
}

} // namespace batchforge

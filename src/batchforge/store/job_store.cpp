#include "batchforge/store/job_store.hpp"

#include "batchforge/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <tuple>

namespace batchforge {

namespace {

[[nodiscard]] auto now() -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::now();
}

// Losing a race against a concurrent completion or failure is expected while
// cascading a cancel.
[[nodiscard]] auto lost_race(std::error_code ec) -> bool {
  return ec == Error::TerminalState || ec == Error::InvalidTransition;
}

} // namespace

JobStore::JobStore(storage::DatabaseService &db, TaskStore &tasks,
                   HistoryRecorder &history)
    : db_(db), tasks_(tasks), history_(history) {
  tasks_.set_on_task_started([this](const Task &task) {
    if (auto r = mark_running(task.job_id); !r) {
      log::warn("Job {}: could not mark running after task {} started: {}",
                task.job_id, task.id, r.error().message());
    }
  });
  tasks_.set_on_task_finished([this](const Task &task) {
    if (auto r = recompute_progress(task.job_id); !r) {
      log::warn("Job {}: progress recompute after task {} failed: {}",
                task.job_id, task.id, r.error().message());
    }
  });
}

auto JobStore::load_from_database() -> Result<void> {
  auto rows = db_.load_jobs();
  if (!rows) {
    log::error("Failed to load jobs: {}", rows.error().message());
    return fail(rows.error());
  }
  std::unique_lock lock(mu_);
  jobs_.clear();
  for (auto &j : *rows) {
    auto id = j.id;
    jobs_.emplace(std::move(id), std::make_shared<Slot>(std::move(j)));
  }
  log::info("Loaded {} jobs", jobs_.size());
  return ok();
}

auto JobStore::find_slot(const JobId &id) const -> SlotPtr {
  std::shared_lock lock(mu_);
  auto it = jobs_.find(id);
  return it != jobs_.end() ? it->second : nullptr;
}

auto JobStore::scoped_slot(const TenantId &tenant, const JobId &id) const
    -> SlotPtr {
  auto slot = find_slot(id);
  if (!slot || slot->tenant_id != tenant) {
    return nullptr;
  }
  return slot;
}

auto JobStore::snapshot_slots() const -> std::vector<SlotPtr> {
  std::shared_lock lock(mu_);
  std::vector<SlotPtr> out;
  out.reserve(jobs_.size());
  for (const auto &[_, slot] : jobs_) {
    out.push_back(slot);
  }
  return out;
}

auto JobStore::transition(Slot &slot, Job next, std::string_view reason,
                          const UserId &actor) -> Result<void> {
  const auto previous = slot.job.status;
  next.updated_at = now();
  next.last_updated_by = actor;
  auto version = history_.commit_job(next, previous, reason, actor);
  if (!version) {
    return fail(version.error());
  }
  next.version = *version;
  slot.job = std::move(next);
  return ok();
}

auto JobStore::save(Slot &slot, Job next) -> Result<void> {
  next.updated_at = now();
  auto version = db_.save_job(next);
  if (!version) {
    log::error("Failed to persist job {}: {}", next.id,
               version.error().message());
    return fail(version.error());
  }
  next.version = *version;
  slot.job = std::move(next);
  return ok();
}

auto JobStore::create_job(const JobSpec &spec) -> Result<JobId> {
  const auto ts = now();
  if (auto valid = validate_job_spec(spec, ts); !valid) {
    return fail(valid.error());
  }
  Job job{
      .id = generate_job_id(),
      .tenant_id = spec.tenant_id,
      .created_by = spec.created_by,
      .last_updated_by = spec.created_by,
      .name = spec.name,
      .description = spec.description,
      .type = spec.type,
      .priority = spec.priority,
      .status = JobStatus::Pending,
      .max_retries = spec.max_retries,
      .scheduled_start = spec.scheduled_start,
      .timeout = spec.timeout,
      .parent_job_id = spec.parent_job_id,
      .parameters = spec.parameters,
      .created_at = ts,
      .updated_at = ts,
  };
  auto version =
      history_.commit_job(job, std::nullopt, "Job created", spec.created_by);
  if (!version) {
    return fail(version.error());
  }
  job.version = *version;
  auto id = job.id;
  {
    std::unique_lock lock(mu_);
    jobs_.emplace(id, std::make_shared<Slot>(std::move(job)));
  }
  log::info("Job {} '{}' created for tenant {} ({}, {})", id, spec.name,
            spec.tenant_id, to_string_view(spec.type),
            to_string_view(spec.priority));
  return ok(std::move(id));
}

auto JobStore::queue_job(const JobId &id) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (slot->job.status != JobStatus::Pending) {
    return transition_error(slot->job.status);
  }
  auto next = slot->job;
  next.status = JobStatus::Queued;
  return transition(*slot, std::move(next), "Job queued for dispatch",
                    kSystemActor);
}

auto JobStore::mark_running(const JobId &id) -> Result<void> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  const auto &job = slot->job;
  if (job.status == JobStatus::Paused &&
      job.paused_from == JobStatus::Queued) {
    // A task dispatched before the pause has started; resume into Running.
    auto next = job;
    next.paused_from = JobStatus::Running;
    next.actual_start = next.actual_start.value_or(now());
    return save(*slot, std::move(next));
  }
  if (job.status != JobStatus::Queued) {
    return ok();
  }
  auto next = job;
  next.status = JobStatus::Running;
  next.actual_start = now();
  return transition(*slot, std::move(next), "First task started",
                    kSystemActor);
}

auto JobStore::recompute_progress(const JobId &id) -> Result<int> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  return recompute_locked(*slot);
}

auto JobStore::recompute_locked(Slot &slot) -> Result<int> {
  const auto &job = slot.job;
  // Terminal jobs are final; paused jobs pick up their progress on resume.
  if (job.status != JobStatus::Queued && job.status != JobStatus::Running) {
    return ok(job.progress_percent);
  }

  const auto counts = tasks_.counts_for_job(job.id);
  const int progress = progress_percent(counts);
  if (progress < 100) {
    if (progress == job.progress_percent) {
      return ok(progress);
    }
    auto next = job;
    next.progress_percent = progress;
    if (auto r = save(slot, std::move(next)); !r) {
      return fail(r.error());
    }
    return ok(progress);
  }

  if (job.status == JobStatus::Queued) {
    auto next = job;
    next.status = JobStatus::Running;
    next.actual_start = next.actual_start.value_or(now());
    if (auto r = transition(slot, std::move(next), "First task started",
                            kSystemActor);
        !r) {
      return fail(r.error());
    }
  }

  auto next = slot.job;
  next.status = JobStatus::Completed;
  next.progress_percent = 100;
  next.completed_at = now();
  if (auto r = transition(slot, std::move(next), "All tasks completed",
                          kSystemActor);
      !r) {
    return fail(r.error());
  }
  log::info("Job {} completed ({} tasks)", slot.job.id, counts.total);
  return ok(100);
}

auto JobStore::fail_job(const TenantId &tenant, const JobId &id,
                        JsonValue error, const UserId &actor) -> Result<void> {
  auto slot = scoped_slot(tenant, id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (!can_transition(slot->job.status, JobStatus::Failed)) {
    return transition_error(slot->job.status);
  }
  auto next = slot->job;
  next.status = JobStatus::Failed;
  next.error_details = std::move(error);
  next.completed_at = now();
  if (auto r = transition(*slot, std::move(next), "Job failure reported",
                          actor);
      !r) {
    return r;
  }
  log::warn("Job {} failed: {}", id, dump_json(slot->job.error_details));
  return ok();
}

auto JobStore::reset_tasks(const JobId &id, const UserId &actor) -> void {
  for (const auto &task_id : tasks_.tasks_for_job(id)) {
    if (auto r = tasks_.reset_for_retry(task_id, actor); !r) {
      log::error("Job {}: failed to reset task {}: {}", id, task_id,
                 r.error().message());
    }
  }
}

auto JobStore::retry_job(const TenantId &tenant, const JobId &id,
                         const UserId &actor) -> Result<void> {
  auto slot = scoped_slot(tenant, id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (slot->job.retry_count >= slot->job.max_retries) {
    return fail(Error::RetryExhausted);
  }

  // Attempts still held by workers must settle or be cancelled first.
  const auto counts = tasks_.counts_for_job(id);
  if (counts.in_flight() > 0) {
    log::debug("Job {} retry rejected: {} tasks in flight", id,
               counts.in_flight());
    return fail(Error::InvalidTransition);
  }

  // A failed task leaves its job Running; retrying it records the failure
  // first so the job still goes through Failed -> Pending.
  if (slot->job.status == JobStatus::Running) {
    if (counts.failed == 0) {
      return fail(Error::InvalidTransition);
    }
    auto failed = slot->job;
    failed.status = JobStatus::Failed;
    failed.error_details = error_payload(
        std::format("{} of {} tasks failed", counts.failed, counts.total));
    failed.completed_at = now();
    if (auto r = transition(*slot, std::move(failed),
                            "Task failures block completion", actor);
        !r) {
      return r;
    }
  }

  if (slot->job.status != JobStatus::Failed) {
    return transition_error(slot->job.status);
  }

  auto next = slot->job;
  next.status = JobStatus::Pending;
  ++next.retry_count;
  next.progress_percent = 0;
  next.error_details = JsonValue{};
  next.result_data = JsonValue{};
  next.actual_start.reset();
  next.completed_at.reset();
  if (auto r = transition(*slot, std::move(next),
                          std::format("Job retry attempt {}",
                                      slot->job.retry_count + 1),
                          actor);
      !r) {
    return r;
  }
  reset_tasks(id, actor);
  log::info("Job {} retry {}/{}", id, slot->job.retry_count,
            slot->job.max_retries);
  return ok();
}

auto JobStore::cancel_job(const TenantId &tenant, const JobId &id,
                          const UserId &actor) -> Result<void> {
  auto slot = scoped_slot(tenant, id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (!can_transition(slot->job.status, JobStatus::Cancelled)) {
    return transition_error(slot->job.status);
  }
  auto next = slot->job;
  next.status = JobStatus::Cancelled;
  next.paused_from.reset();
  if (auto r = transition(*slot, std::move(next), "Job cancelled by user",
                          actor);
      !r) {
    return r;
  }

  std::size_t cancelled = 0;
  for (const auto &task_id : tasks_.tasks_for_job(id)) {
    auto r = tasks_.cancel_task(task_id,
                                "Task cancelled due to job cancellation", actor);
    if (r) {
      ++cancelled;
    } else if (!lost_race(r.error())) {
      log::error("Job {}: failed to cancel task {}: {}", id, task_id,
                 r.error().message());
    }
  }
  log::info("Job {} cancelled by {} ({} tasks cancelled)", id, actor,
            cancelled);
  return ok();
}

auto JobStore::pause_job(const TenantId &tenant, const JobId &id,
                         const UserId &actor) -> Result<void> {
  auto slot = scoped_slot(tenant, id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (!can_transition(slot->job.status, JobStatus::Paused)) {
    return transition_error(slot->job.status);
  }
  auto next = slot->job;
  next.paused_from = next.status;
  next.status = JobStatus::Paused;
  return transition(*slot, std::move(next), "Job paused", actor);
}

auto JobStore::resume_job(const TenantId &tenant, const JobId &id,
                          const UserId &actor) -> Result<JobStatus> {
  auto slot = scoped_slot(tenant, id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  if (slot->job.status != JobStatus::Paused) {
    return transition_error(slot->job.status);
  }
  auto next = slot->job;
  next.status = next.paused_from.value_or(JobStatus::Pending);
  next.paused_from.reset();
  if (auto r = transition(*slot, std::move(next), "Job resumed", actor); !r) {
    return fail(r.error());
  }
  // Tasks may have finished while the job was paused.
  if (auto r = recompute_locked(*slot); !r) {
    return fail(r.error());
  }
  return ok(slot->job.status);
}

auto JobStore::update_job(const TenantId &tenant, const JobId &id,
                          const JobUpdate &update, const UserId &actor)
    -> Result<Job> {
  auto slot = scoped_slot(tenant, id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  const auto &job = slot->job;
  if (job.status == JobStatus::Completed ||
      job.status == JobStatus::Cancelled) {
    return fail(Error::TerminalState);
  }
  if (auto valid = validate_job_update(job, update, now()); !valid) {
    return fail(valid.error());
  }

  auto next = job;
  if (update.name) {
    next.name = *update.name;
  }
  if (update.description) {
    next.description = *update.description;
  }
  if (update.priority) {
    next.priority = *update.priority;
  }
  if (update.parameters) {
    next.parameters = *update.parameters;
  }
  if (update.scheduled_start) {
    next.scheduled_start = update.scheduled_start;
  }
  if (update.timeout) {
    next.timeout = update.timeout;
  }
  if (update.max_retries) {
    next.max_retries = *update.max_retries;
  }
  next.last_updated_by = actor;
  if (auto r = save(*slot, std::move(next)); !r) {
    return fail(r.error());
  }
  return ok(slot->job);
}

auto JobStore::get_job(const TenantId &tenant, const JobId &id) const
    -> Result<Job> {
  auto slot = scoped_slot(tenant, id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  return ok(slot->job);
}

auto JobStore::find_job(const JobId &id) const -> Result<Job> {
  auto slot = find_slot(id);
  if (!slot) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(slot->mu);
  return ok(slot->job);
}

auto JobStore::list_jobs(const TenantId &tenant, const JobFilter &filter) const
    -> Page<Job> {
  std::vector<Job> rows;
  for (const auto &slot : snapshot_slots()) {
    if (slot->tenant_id != tenant) {
      continue;
    }
    std::scoped_lock lock(slot->mu);
    const auto &j = slot->job;
    if (filter.status && j.status != *filter.status) {
      continue;
    }
    if (filter.type && j.type != *filter.type) {
      continue;
    }
    if (filter.priority && j.priority != *filter.priority) {
      continue;
    }
    rows.push_back(j);
  }
  // Newest first.
  std::ranges::sort(rows, [](const Job &a, const Job &b) {
    return std::tie(b.created_at, b.id) < std::tie(a.created_at, a.id);
  });
  return paginate(std::move(rows), filter.offset, filter.limit);
}

auto JobStore::job_history(const TenantId &tenant, const JobId &id,
                           std::size_t offset, std::size_t limit) const
    -> Result<Page<JobHistoryEntry>> {
  if (!scoped_slot(tenant, id)) {
    return fail(Error::NotFound);
  }
  return history_.job_history(id, offset, limit);
}

auto JobStore::active_jobs() const -> std::vector<JobId> {
  struct Entry {
    JobPriority priority;
    std::chrono::system_clock::time_point created_at;
    JobId id;
  };
  std::vector<Entry> active;
  for (const auto &slot : snapshot_slots()) {
    std::scoped_lock lock(slot->mu);
    const auto &j = slot->job;
    if (j.status == JobStatus::Queued || j.status == JobStatus::Running) {
      active.push_back({j.priority, j.created_at, j.id});
    }
  }
  // Urgent first, then oldest first.
  std::ranges::sort(active, [](const Entry &a, const Entry &b) {
    return std::tie(b.priority, a.created_at, a.id) <
           std::tie(a.priority, b.created_at, b.id);
  });
  std::vector<JobId> ids;
  ids.reserve(active.size());
  for (auto &e : active) {
    ids.push_back(std::move(e.id));
  }
  return ids;
}

auto JobStore::due_jobs(std::chrono::system_clock::time_point at) const
    -> std::vector<JobId> {
  std::vector<JobId> ids;
  for (const auto &slot : snapshot_slots()) {
    std::scoped_lock lock(slot->mu);
    const auto &j = slot->job;
    if (j.status == JobStatus::Pending &&
        (!j.scheduled_start || *j.scheduled_start <= at)) {
      ids.push_back(j.id);
    }
  }
  return ids;
}

} // namespace batchforge

#include "batchforge/domain/job.hpp"
#include "batchforge/domain/task.hpp"
#include "batchforge/domain/worker.hpp"

namespace batchforge {

namespace {

[[nodiscard]] auto valid_name(std::string_view name) noexcept -> bool {
  return !name.empty() && name.size() <= kMaxNameLength;
}

[[nodiscard]] auto valid_timeout(
    const std::optional<std::chrono::seconds> &timeout) noexcept -> bool {
  return !timeout || timeout->count() > 0;
}

} // namespace

auto validate_job_spec(const JobSpec &spec,
                       std::chrono::system_clock::time_point now)
    -> Result<void> {
  if (spec.tenant_id.empty() || spec.created_by.empty()) {
    return fail(Error::InvalidSpec);
  }
  if (!valid_name(spec.name) || spec.max_retries < 0 ||
      !valid_timeout(spec.timeout)) {
    return fail(Error::InvalidSpec);
  }
  if (spec.scheduled_start && *spec.scheduled_start <= now) {
    return fail(Error::InvalidSpec);
  }
  return ok();
}

auto validate_job_update(const Job &job, const JobUpdate &update,
                         std::chrono::system_clock::time_point now)
    -> Result<void> {
  if (update.name && !valid_name(*update.name)) {
    return fail(Error::InvalidSpec);
  }
  if (update.max_retries &&
      (*update.max_retries < 0 || *update.max_retries < job.retry_count)) {
    return fail(Error::InvalidSpec);
  }
  if (update.timeout && !valid_timeout(update.timeout)) {
    return fail(Error::InvalidSpec);
  }
  // Rescheduling only makes sense before the job has been queued.
  if (update.scheduled_start &&
      (*update.scheduled_start <= now || job.status != JobStatus::Pending)) {
    return fail(Error::InvalidSpec);
  }
  return ok();
}

auto validate_task_spec(const TaskSpec &spec) -> Result<void> {
  if (!valid_name(spec.name) || spec.sequence_number < 0 ||
      spec.max_retries < 0 || !valid_timeout(spec.timeout)) {
    return fail(Error::InvalidSpec);
  }
  return ok();
}

auto validate_worker_spec(const WorkerSpec &spec) -> Result<void> {
  if (!valid_name(spec.name) || spec.host.empty() ||
      spec.host.size() > kMaxHostLength || spec.max_concurrent_tasks < 1) {
    return fail(Error::InvalidSpec);
  }
  return ok();
}

} // namespace batchforge

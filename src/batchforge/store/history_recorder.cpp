#include "batchforge/store/history_recorder.hpp"

#include "batchforge/util/log.hpp"

#include <chrono>
#include <string>

namespace batchforge {

HistoryRecorder::HistoryRecorder(storage::DatabaseService &db) : db_(db) {}

auto HistoryRecorder::load_from_database() -> Result<void> {
  auto last = db_.last_history_sequence();
  if (!last) {
    return fail(last.error());
  }
  next_sequence_.store(*last + 1, std::memory_order_relaxed);
  return ok();
}

auto HistoryRecorder::commit_job(const Job &next,
                                 std::optional<JobStatus> previous,
                                 std::string_view reason, const UserId &actor)
    -> Result<std::uint64_t> {
  JobHistoryEntry entry{
      .sequence = next_sequence(),
      .job_id = next.id,
      .previous_status = previous,
      .new_status = next.status,
      .reason = std::string(reason),
      .progress_percent = next.progress_percent,
      .error_details = next.error_details,
      .actor = actor,
      .created_at = std::chrono::system_clock::now(),
  };
  auto version = db_.save_job(next, &entry);
  if (!version) {
    log::error("Failed to persist job {} transition to {}: {}", next.id,
               to_string_view(next.status), version.error().message());
    return version;
  }
  recorded_.fetch_add(1, std::memory_order_relaxed);
  log::debug("Job {}: {} -> {} ({})", next.id,
             previous ? to_string_view(*previous) : std::string_view{"none"},
             to_string_view(next.status), reason);
  return version;
}

auto HistoryRecorder::commit_task(const Task &next,
                                  std::optional<TaskStatus> previous,
                                  std::string_view reason, const UserId &actor)
    -> Result<std::uint64_t> {
  TaskHistoryEntry entry{
      .sequence = next_sequence(),
      .task_id = next.id,
      .job_id = next.job_id,
      .previous_status = previous,
      .new_status = next.status,
      .reason = std::string(reason),
      .worker_id = next.worker_id,
      .error_details = next.error_details,
      .actor = actor,
      .created_at = std::chrono::system_clock::now(),
  };
  auto version = db_.save_task(next, &entry);
  if (!version) {
    log::error("Failed to persist task {} transition to {}: {}", next.id,
               to_string_view(next.status), version.error().message());
    return version;
  }
  recorded_.fetch_add(1, std::memory_order_relaxed);
  log::debug("Task {}: {} -> {} ({})", next.id,
             previous ? to_string_view(*previous) : std::string_view{"none"},
             to_string_view(next.status), reason);
  return version;
}

auto HistoryRecorder::job_history(const JobId &id, std::size_t offset,
                                  std::size_t limit) const
    -> Result<Page<JobHistoryEntry>> {
  return db_.load_job_history(id).transform(
      [&](std::vector<JobHistoryEntry> rows) {
        return paginate(std::move(rows), offset, limit);
      });
}

auto HistoryRecorder::task_history(const TaskId &id, std::size_t offset,
                                   std::size_t limit) const
    -> Result<Page<TaskHistoryEntry>> {
  return db_.load_task_history(id).transform(
      [&](std::vector<TaskHistoryEntry> rows) {
        return paginate(std::move(rows), offset, limit);
      });
}

} // namespace batchforge

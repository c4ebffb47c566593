#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/history.hpp"
#include "batchforge/domain/job.hpp"
#include "batchforge/domain/task.hpp"
#include "batchforge/domain/worker.hpp"
#include "batchforge/util/id.hpp"

#include <cstdint>
#include <vector>

namespace batchforge::storage {

// Synchronous persistence boundary. Stores call it while holding the lock of
// the entity being written, so implementations must not call back into them.
//
// Saves use optimistic versioning: `entity.version` is the version the caller
// last read (0 for an insert). The save succeeds only when the stored version
// still matches and returns the new version; otherwise VersionConflict (or
// AlreadyExists for a duplicate insert). A history row passed alongside is
// appended in the same unit of work as the entity write.
class DatabaseService {
public:
  virtual ~DatabaseService() = default;

  // Lifecycle
  virtual auto open() -> Result<void> = 0;
  virtual auto close() -> void = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  // === Jobs ===
  virtual auto save_job(const Job &job, const JobHistoryEntry *history = nullptr)
      -> Result<std::uint64_t> = 0;
  virtual auto load_job(const JobId &id) const -> Result<Job> = 0;
  virtual auto load_jobs() const -> Result<std::vector<Job>> = 0;

  // === Tasks ===
  virtual auto save_task(const Task &task,
                         const TaskHistoryEntry *history = nullptr)
      -> Result<std::uint64_t> = 0;
  virtual auto load_task(const TaskId &id) const -> Result<Task> = 0;
  virtual auto load_tasks() const -> Result<std::vector<Task>> = 0;

  // === Workers ===
  virtual auto save_worker(const Worker &worker) -> Result<std::uint64_t> = 0;
  virtual auto load_worker(const WorkerId &id) const -> Result<Worker> = 0;
  virtual auto load_workers() const -> Result<std::vector<Worker>> = 0;

  // === History ===
  // Rows come back ordered by sequence.
  virtual auto load_job_history(const JobId &id) const
      -> Result<std::vector<JobHistoryEntry>> = 0;
  virtual auto load_task_history(const TaskId &id) const
      -> Result<std::vector<TaskHistoryEntry>> = 0;
  [[nodiscard]] virtual auto last_history_sequence() const
      -> Result<std::uint64_t> = 0;
};

} // namespace batchforge::storage

#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/page.hpp"
#include "batchforge/domain/task.hpp"
#include "batchforge/storage/database_service.hpp"
#include "batchforge/store/history_recorder.hpp"
#include "batchforge/util/id.hpp"
#include "batchforge/util/json.hpp"
#include "batchforge/worker/worker_registry.hpp"

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace batchforge {

using TaskEventCallback = std::move_only_function<void(const Task &)>;

// Owns Task entities. Every status change is a compare-and-set under the
// task's own mutex; the history row and any worker capacity release happen
// under that same lock, so whichever caller wins a race is the only one whose
// side effects fire.
class TaskStore {
public:
  TaskStore(storage::DatabaseService &db, WorkerRegistry &workers,
            HistoryRecorder &history);

  TaskStore(const TaskStore &) = delete;
  auto operator=(const TaskStore &) -> TaskStore & = delete;

  [[nodiscard]] auto load_from_database() -> Result<void>;

  // Invoked after the task lock is released. Set before the store is shared.
  auto set_on_task_started(TaskEventCallback cb) -> void;
  auto set_on_task_finished(TaskEventCallback cb) -> void;

  [[nodiscard]] auto create_task(const TenantId &tenant, const JobId &job,
                                 const TaskSpec &spec, const UserId &actor)
      -> Result<TaskId>;

  // Lowest sequence_number Pending task of the job.
  [[nodiscard]] auto claim_next_task(const JobId &job) const
      -> std::optional<TaskId>;

  // The caller must already hold a reservation on `worker`. On failure the
  // reservation is still the caller's to abandon.
  [[nodiscard]] auto assign_task(const TaskId &id, const WorkerId &worker)
      -> Result<void>;
  [[nodiscard]] auto unassign_task(const TaskId &id, std::string_view reason)
      -> Result<void>;
  [[nodiscard]] auto start_task(const TaskId &id) -> Result<void>;
  [[nodiscard]] auto complete_task(const TaskId &id, JsonValue result)
      -> Result<void>;
  [[nodiscard]] auto fail_task(const TaskId &id, JsonValue error)
      -> Result<void>;
  [[nodiscard]] auto cancel_task(const TaskId &id, std::string_view reason,
                                 const UserId &actor) -> Result<void>;
  [[nodiscard]] auto reset_for_retry(const TaskId &id, const UserId &actor)
      -> Result<void>;

  [[nodiscard]] auto get_task(const TenantId &tenant, const TaskId &id) const
      -> Result<Task>;
  [[nodiscard]] auto find_task(const TaskId &id) const -> Result<Task>;
  [[nodiscard]] auto list_tasks(const TenantId &tenant,
                                const TaskFilter &filter = {}) const
      -> Page<Task>;
  [[nodiscard]] auto task_history(const TenantId &tenant, const TaskId &id,
                                  std::size_t offset = 0,
                                  std::size_t limit = kDefaultPageLimit) const
      -> Result<Page<TaskHistoryEntry>>;

  [[nodiscard]] auto tasks_for_job(const JobId &job) const
      -> std::vector<TaskId>;
  [[nodiscard]] auto counts_for_job(const JobId &job) const -> TaskCounts;

private:
  // job_id, tenant_id and sequence never change after creation and may be
  // read without the lock.
  struct Slot {
    explicit Slot(Task t)
        : job_id(t.job_id), tenant_id(t.tenant_id),
          sequence(t.sequence_number), task(std::move(t)) {}

    const JobId job_id;
    const TenantId tenant_id;
    const int sequence;
    mutable std::mutex mu;
    Task task;
  };
  using SlotPtr = std::shared_ptr<Slot>;

  [[nodiscard]] auto find_slot(const TaskId &id) const -> SlotPtr;
  [[nodiscard]] auto job_slots(const JobId &job) const -> std::vector<SlotPtr>;
  // Caller holds slot.mu. Persists `next` with its history row, then
  // publishes it.
  [[nodiscard]] auto transition(Slot &slot, Task next, std::string_view reason,
                                const UserId &actor) -> Result<void>;
  // Caller holds slot.mu; `task` is the state before the transition.
  auto release_held_capacity(const Task &task, TaskOutcome outcome) -> void;
  auto notify(TaskEventCallback &cb, const Task &task) -> void;

  storage::DatabaseService &db_;
  WorkerRegistry &workers_;
  HistoryRecorder &history_;

  mutable std::shared_mutex mu_;
  ankerl::unordered_dense::map<TaskId, SlotPtr> tasks_;
  // Per job, ordered by sequence_number.
  ankerl::unordered_dense::map<JobId, std::vector<SlotPtr>> by_job_;

  TaskEventCallback on_started_;
  TaskEventCallback on_finished_;
};

} // namespace batchforge

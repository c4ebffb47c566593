#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/job.hpp"
#include "batchforge/domain/page.hpp"
#include "batchforge/storage/database_service.hpp"
#include "batchforge/store/history_recorder.hpp"
#include "batchforge/store/task_store.hpp"
#include "batchforge/util/id.hpp"
#include "batchforge/util/json.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace batchforge {

// Owns Job entities and derives their progress from the task store. One mutex
// per job serializes progress recomputation, retry, cancel, pause and resume.
// The job lock may be held while task locks are taken, never the reverse.
class JobStore {
public:
  // Registers itself on the task store's start/finish callbacks.
  JobStore(storage::DatabaseService &db, TaskStore &tasks,
           HistoryRecorder &history);

  JobStore(const JobStore &) = delete;
  auto operator=(const JobStore &) -> JobStore & = delete;

  [[nodiscard]] auto load_from_database() -> Result<void>;

  [[nodiscard]] auto create_job(const JobSpec &spec) -> Result<JobId>;

  // Pending -> Queued.
  [[nodiscard]] auto queue_job(const JobId &id) -> Result<void>;
  // Queued -> Running on the first task start; no-op otherwise.
  [[nodiscard]] auto mark_running(const JobId &id) -> Result<void>;
  // Idempotent. Returns the progress now stored on the job.
  [[nodiscard]] auto recompute_progress(const JobId &id) -> Result<int>;

  [[nodiscard]] auto fail_job(const TenantId &tenant, const JobId &id,
                              JsonValue error, const UserId &actor)
      -> Result<void>;
  [[nodiscard]] auto retry_job(const TenantId &tenant, const JobId &id,
                               const UserId &actor) -> Result<void>;
  [[nodiscard]] auto cancel_job(const TenantId &tenant, const JobId &id,
                                const UserId &actor) -> Result<void>;
  [[nodiscard]] auto pause_job(const TenantId &tenant, const JobId &id,
                               const UserId &actor) -> Result<void>;
  [[nodiscard]] auto resume_job(const TenantId &tenant, const JobId &id,
                                const UserId &actor) -> Result<JobStatus>;
  [[nodiscard]] auto update_job(const TenantId &tenant, const JobId &id,
                                const JobUpdate &update, const UserId &actor)
      -> Result<Job>;

  [[nodiscard]] auto get_job(const TenantId &tenant, const JobId &id) const
      -> Result<Job>;
  [[nodiscard]] auto find_job(const JobId &id) const -> Result<Job>;
  [[nodiscard]] auto list_jobs(const TenantId &tenant,
                               const JobFilter &filter = {}) const
      -> Page<Job>;
  [[nodiscard]] auto job_history(const TenantId &tenant, const JobId &id,
                                 std::size_t offset = 0,
                                 std::size_t limit = kDefaultPageLimit) const
      -> Result<Page<JobHistoryEntry>>;

  // Queued and Running jobs, for assignment sweeps.
  [[nodiscard]] auto active_jobs() const -> std::vector<JobId>;
  // Pending, unpaused jobs whose scheduled_start is absent or not after `now`.
  [[nodiscard]] auto due_jobs(std::chrono::system_clock::time_point now) const
      -> std::vector<JobId>;

private:
  struct Slot {
    explicit Slot(Job j) : tenant_id(j.tenant_id), job(std::move(j)) {}

    const TenantId tenant_id;
    mutable std::mutex mu;
    Job job;
  };
  using SlotPtr = std::shared_ptr<Slot>;

  [[nodiscard]] auto find_slot(const JobId &id) const -> SlotPtr;
  [[nodiscard]] auto scoped_slot(const TenantId &tenant, const JobId &id) const
      -> SlotPtr;
  [[nodiscard]] auto snapshot_slots() const -> std::vector<SlotPtr>;
  // Caller holds slot.mu.
  [[nodiscard]] auto transition(Slot &slot, Job next, std::string_view reason,
                                const UserId &actor) -> Result<void>;
  [[nodiscard]] auto save(Slot &slot, Job next) -> Result<void>;
  [[nodiscard]] auto recompute_locked(Slot &slot) -> Result<int>;
  auto reset_tasks(const JobId &id, const UserId &actor) -> void;

  storage::DatabaseService &db_;
  TaskStore &tasks_;
  HistoryRecorder &history_;

  mutable std::shared_mutex mu_;
  ankerl::unordered_dense::map<JobId, SlotPtr> jobs_;
};

} // namespace batchforge

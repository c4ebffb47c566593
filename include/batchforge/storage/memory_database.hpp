#pragma once

#include "batchforge/storage/database_service.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <system_error>

namespace batchforge::storage {

// In-process DatabaseService. Used by the simulator, the tests and any
// embedding that keeps state only for the lifetime of the process.
class MemoryDatabase final : public DatabaseService {
public:
  MemoryDatabase() = default;
  MemoryDatabase(const MemoryDatabase &) = delete;
  auto operator=(const MemoryDatabase &) -> MemoryDatabase & = delete;

  auto open() -> Result<void> override;
  auto close() -> void override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto save_job(const Job &job, const JobHistoryEntry *history = nullptr)
      -> Result<std::uint64_t> override;
  auto load_job(const JobId &id) const -> Result<Job> override;
  auto load_jobs() const -> Result<std::vector<Job>> override;

  auto save_task(const Task &task, const TaskHistoryEntry *history = nullptr)
      -> Result<std::uint64_t> override;
  auto load_task(const TaskId &id) const -> Result<Task> override;
  auto load_tasks() const -> Result<std::vector<Task>> override;

  auto save_worker(const Worker &worker) -> Result<std::uint64_t> override;
  auto load_worker(const WorkerId &id) const -> Result<Worker> override;
  auto load_workers() const -> Result<std::vector<Worker>> override;

  auto load_job_history(const JobId &id) const
      -> Result<std::vector<JobHistoryEntry>> override;
  auto load_task_history(const TaskId &id) const
      -> Result<std::vector<TaskHistoryEntry>> override;
  [[nodiscard]] auto last_history_sequence() const
      -> Result<std::uint64_t> override;

  // Makes the next `count` writes fail with `ec` without touching state.
  auto inject_write_failures(std::size_t count, std::error_code ec) -> void;

  [[nodiscard]] auto write_count() const noexcept -> std::size_t {
    return writes_.load(std::memory_order_relaxed);
  }

private:
  template <typename Map, typename Entity>
  auto save_versioned(Map &map, const Entity &entity) -> Result<std::uint64_t>;

  [[nodiscard]] auto take_injected_failure() -> std::error_code;

  mutable std::mutex mu_;
  bool open_{false};
  ankerl::unordered_dense::map<JobId, Job> jobs_;
  ankerl::unordered_dense::map<TaskId, Task> tasks_;
  ankerl::unordered_dense::map<WorkerId, Worker> workers_;
  ankerl::unordered_dense::map<JobId, std::vector<JobHistoryEntry>>
      job_history_;
  ankerl::unordered_dense::map<TaskId, std::vector<TaskHistoryEntry>>
      task_history_;
  std::uint64_t last_sequence_{0};

  std::size_t injected_failures_{0};
  std::error_code injected_error_;
  std::atomic<std::size_t> writes_{0};
};

} // namespace batchforge::storage

#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/history.hpp"
#include "batchforge/domain/page.hpp"
#include "batchforge/storage/database_service.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>

namespace batchforge {

// Append-only audit trail. Every status transition goes through
// commit_job/commit_task, which persist the entity and exactly one history row
// together; a failed commit leaves neither behind.
class HistoryRecorder {
public:
  explicit HistoryRecorder(storage::DatabaseService &db);

  HistoryRecorder(const HistoryRecorder &) = delete;
  auto operator=(const HistoryRecorder &) -> HistoryRecorder & = delete;

  // Resumes the sequence after the last persisted row.
  [[nodiscard]] auto load_from_database() -> Result<void>;

  [[nodiscard]] auto commit_job(const Job &next,
                                std::optional<JobStatus> previous,
                                std::string_view reason, const UserId &actor)
      -> Result<std::uint64_t>;

  [[nodiscard]] auto commit_task(const Task &next,
                                 std::optional<TaskStatus> previous,
                                 std::string_view reason, const UserId &actor)
      -> Result<std::uint64_t>;

  [[nodiscard]] auto job_history(const JobId &id, std::size_t offset = 0,
                                 std::size_t limit = kDefaultPageLimit) const
      -> Result<Page<JobHistoryEntry>>;

  [[nodiscard]] auto task_history(const TaskId &id, std::size_t offset = 0,
                                  std::size_t limit = kDefaultPageLimit) const
      -> Result<Page<TaskHistoryEntry>>;

  [[nodiscard]] auto recorded() const noexcept -> std::uint64_t {
    return recorded_.load(std::memory_order_relaxed);
  }

private:
  [[nodiscard]] auto next_sequence() noexcept -> std::uint64_t {
    return next_sequence_.fetch_add(1, std::memory_order_relaxed);
  }

  storage::DatabaseService &db_;
  std::atomic<std::uint64_t> next_sequence_{1};
  std::atomic<std::uint64_t> recorded_{0};
};

} // namespace batchforge

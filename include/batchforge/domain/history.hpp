#pragma once

#include "batchforge/domain/job.hpp"
#include "batchforge/domain/task.hpp"
#include "batchforge/util/id.hpp"
#include "batchforge/util/json.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace batchforge {

// Append-only audit rows. `sequence` is global and strictly increasing, so it
// orders rows that share a timestamp.
struct JobHistoryEntry {
  std::uint64_t sequence{0};
  JobId job_id;
  std::optional<JobStatus> previous_status;
  JobStatus new_status{JobStatus::Pending};
  std::string reason;
  int progress_percent{0};
  JsonValue error_details{};
  UserId actor;
  std::chrono::system_clock::time_point created_at;
};

struct TaskHistoryEntry {
  std::uint64_t sequence{0};
  TaskId task_id;
  JobId job_id;
  std::optional<TaskStatus> previous_status;
  TaskStatus new_status{TaskStatus::Pending};
  std::string reason;
  std::optional<WorkerId> worker_id;
  JsonValue error_details{};
  UserId actor;
  std::chrono::system_clock::time_point created_at;
};

} // namespace batchforge

#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/page.hpp"
#include "batchforge/util/enum.hpp"
#include "batchforge/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace batchforge {

enum class WorkerStatus : std::uint8_t {
  Idle,
  Busy,
  Offline,
  Maintenance,
  Error,
};
BOOST_DESCRIBE_ENUM(WorkerStatus, Idle, Busy, Offline, Maintenance, Error)
BATCHFORGE_DEFINE_ENUM_SERDE(WorkerStatus)

// How a unit of capacity was given back. Unassigned covers dispatch failures
// and retry resets, which do not count toward the worker metrics.
enum class TaskOutcome : std::uint8_t {
  Completed,
  Failed,
  Cancelled,
  Unassigned,
};
BOOST_DESCRIBE_ENUM(TaskOutcome, Completed, Failed, Cancelled, Unassigned)
BATCHFORGE_DEFINE_ENUM_SERDE(TaskOutcome)

struct WorkerSpec {
  std::string name;
  std::string host;
  int max_concurrent_tasks{1};
  bool is_active{true};
};

struct Worker {
  WorkerId id;
  std::string name;
  std::string host;
  int max_concurrent_tasks{1};
  int current_task_count{0};
  WorkerStatus status{WorkerStatus::Idle};
  bool is_active{true};

  std::chrono::system_clock::time_point last_heartbeat;
  std::int64_t total_tasks_processed{0};
  std::int64_t failed_task_count{0};
  std::optional<std::chrono::milliseconds> average_task_duration;

  std::chrono::system_clock::time_point registered_at;
  std::chrono::system_clock::time_point updated_at;
  std::uint64_t version{0};
};

struct WorkerUpdate {
  std::optional<std::string> name;
  std::optional<WorkerStatus> status;
  std::optional<bool> is_active;
  std::optional<int> max_concurrent_tasks;
};

struct WorkerFilter {
  std::optional<WorkerStatus> status;
  std::optional<bool> is_active;
  std::size_t offset{0};
  std::size_t limit{kDefaultPageLimit};
};

inline constexpr std::size_t kMaxHostLength = 200;

[[nodiscard]] inline auto accepts_work(const Worker &w) noexcept -> bool {
  return w.is_active &&
         (w.status == WorkerStatus::Idle || w.status == WorkerStatus::Busy) &&
         w.current_task_count < w.max_concurrent_tasks;
}

[[nodiscard]] auto validate_worker_spec(const WorkerSpec &spec) -> Result<void>;

} // namespace batchforge

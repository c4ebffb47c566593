#pragma once

#include "batchforge/core/error.hpp"
#include "batchforge/domain/page.hpp"
#include "batchforge/util/enum.hpp"
#include "batchforge/util/id.hpp"
#include "batchforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace batchforge {

enum class TaskStatus : std::uint8_t {
  Pending,
  Assigned,
  Running,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, Assigned, Running, Completed, Failed,
                    Cancelled)
BATCHFORGE_DEFINE_ENUM_SERDE(TaskStatus)

[[nodiscard]] constexpr bool is_terminal(TaskStatus s) noexcept {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled;
}

// A task that holds a unit of worker capacity.
[[nodiscard]] constexpr bool holds_capacity(TaskStatus s) noexcept {
  return s == TaskStatus::Assigned || s == TaskStatus::Running;
}

namespace detail {
// kTaskTransitions[from][to]. Assigned -> Pending is the dispatch-failure
// unassign edge. Resetting for a job retry bypasses this table.
inline constexpr std::array<std::array<bool, 6>, 6> kTaskTransitions = {{
    //  Pend   Asgn   Runn   Comp   Fail   Canc
    {false, true, false, false, false, true},   // Pending
    {true, false, true, false, false, true},    // Assigned
    {false, false, false, true, true, true},    // Running
    {false, false, false, false, false, false}, // Completed
    {false, false, false, false, false, false}, // Failed
    {false, false, false, false, false, false}, // Cancelled
}};
} // namespace detail

[[nodiscard]] constexpr bool can_transition(TaskStatus from,
                                            TaskStatus to) noexcept {
  return detail::kTaskTransitions[std::to_underlying(from)]
                                 [std::to_underlying(to)];
}

[[nodiscard]] inline auto transition_error(TaskStatus from)
    -> std::unexpected<std::error_code> {
  if (from == TaskStatus::Completed || from == TaskStatus::Cancelled) {
    return fail(Error::TerminalState);
  }
  return fail(Error::InvalidTransition);
}

struct TaskSpec {
  std::string name;
  int sequence_number{0};
  JsonValue parameters{};
  std::optional<std::chrono::seconds> timeout;
  int max_retries{3};
};

struct Task {
  TaskId id;
  JobId job_id;
  TenantId tenant_id;
  std::string name;
  int sequence_number{0};

  TaskStatus status{TaskStatus::Pending};
  std::optional<WorkerId> worker_id;
  int progress_percent{0};
  int retry_count{0};
  int max_retries{3};
  std::optional<std::chrono::seconds> timeout;

  JsonValue parameters{};
  JsonValue result_data{};
  JsonValue error_details{};

  std::optional<std::chrono::system_clock::time_point> assigned_at;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
  std::uint64_t version{0};
};

struct TaskFilter {
  std::optional<JobId> job_id;
  std::optional<WorkerId> worker_id;
  std::optional<TaskStatus> status;
  std::size_t offset{0};
  std::size_t limit{kDefaultPageLimit};
};

struct TaskCounts {
  std::size_t total{0};
  std::size_t pending{0};
  std::size_t assigned{0};
  std::size_t running{0};
  std::size_t completed{0};
  std::size_t failed{0};
  std::size_t cancelled{0};

  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return assigned + running;
  }
};

// 0 for a job without tasks, otherwise floor(100 * completed / total).
[[nodiscard]] constexpr auto progress_percent(const TaskCounts &counts) noexcept
    -> int {
  if (counts.total == 0) {
    return 0;
  }
  return static_cast<int>(counts.completed * 100 / counts.total);
}

[[nodiscard]] auto validate_task_spec(const TaskSpec &spec) -> Result<void>;

} // namespace batchforge

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

enum class JobStatus : std::uint8_t {
  Pending,
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled,
  Paused,
};
BOOST_DESCRIBE_ENUM(JobStatus, Pending, Queued, Running, Completed, Failed,
                    Cancelled, Paused)
BATCHFORGE_DEFINE_ENUM_SERDE(JobStatus)

enum class JobType : std::uint8_t {
  Billing,
  Inventory,
  Report,
  DataProcessing,
};
BOOST_DESCRIBE_ENUM(JobType, Billing, Inventory, Report, DataProcessing)
BATCHFORGE_DEFINE_ENUM_SERDE(JobType)

enum class JobPriority : std::uint8_t {
  Low,
  Normal,
  High,
  Urgent,
};
BOOST_DESCRIBE_ENUM(JobPriority, Low, Normal, High, Urgent)
BATCHFORGE_DEFINE_ENUM_SERDE(JobPriority)

[[nodiscard]] constexpr bool is_terminal(JobStatus s) noexcept {
  return s == JobStatus::Completed || s == JobStatus::Failed ||
         s == JobStatus::Cancelled;
}

namespace detail {
// kJobTransitions[from][to]
inline constexpr std::array<std::array<bool, 7>, 7> kJobTransitions = {{
    //  Pend   Queu   Runn   Comp   Fail   Canc   Paus
    {false, true, false, false, false, true, true},   // Pending
    {false, false, true, false, false, true, true},   // Queued
    {false, false, false, true, true, true, true},    // Running
    {false, false, false, false, false, false, false}, // Completed
    {true, false, false, false, false, true, false},  // Failed
    {false, false, false, false, false, false, false}, // Cancelled
    {true, true, true, false, false, true, false},    // Paused
}};
} // namespace detail

// Paused may only return to the status it was paused from; JobStore checks
// that on top of this table.
[[nodiscard]] constexpr bool can_transition(JobStatus from,
                                            JobStatus to) noexcept {
  return detail::kJobTransitions[std::to_underlying(from)]
                                [std::to_underlying(to)];
}

// Completed and Cancelled reject every mutation with TerminalState; any other
// disallowed edge is InvalidTransition.
[[nodiscard]] inline auto transition_error(JobStatus from)
    -> std::unexpected<std::error_code> {
  if (from == JobStatus::Completed || from == JobStatus::Cancelled) {
    return fail(Error::TerminalState);
  }
  return fail(Error::InvalidTransition);
}

struct JobSpec {
  TenantId tenant_id;
  UserId created_by;
  std::string name;
  std::string description;
  JobType type{JobType::DataProcessing};
  JobPriority priority{JobPriority::Normal};
  JsonValue parameters{};
  std::optional<std::chrono::system_clock::time_point> scheduled_start;
  std::optional<std::chrono::seconds> timeout;
  std::optional<JobId> parent_job_id;
  int max_retries{3};
};

struct Job {
  JobId id;
  TenantId tenant_id;
  UserId created_by;
  UserId last_updated_by;
  std::string name;
  std::string description;
  JobType type{JobType::DataProcessing};
  JobPriority priority{JobPriority::Normal};

  JobStatus status{JobStatus::Pending};
  std::optional<JobStatus> paused_from;
  int progress_percent{0};
  int retry_count{0};
  int max_retries{3};

  std::optional<std::chrono::system_clock::time_point> scheduled_start;
  std::optional<std::chrono::system_clock::time_point> actual_start;
  std::optional<std::chrono::system_clock::time_point> completed_at;
  std::optional<std::chrono::seconds> timeout;
  std::optional<JobId> parent_job_id;

  JsonValue parameters{};
  JsonValue result_data{};
  JsonValue error_details{};

  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
  std::uint64_t version{0};
};

struct JobUpdate {
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<JobPriority> priority;
  std::optional<JsonValue> parameters;
  std::optional<std::chrono::system_clock::time_point> scheduled_start;
  std::optional<std::chrono::seconds> timeout;
  std::optional<int> max_retries;
};

struct JobFilter {
  std::optional<JobStatus> status;
  std::optional<JobType> type;
  std::optional<JobPriority> priority;
  std::size_t offset{0};
  std::size_t limit{kDefaultPageLimit};
};

inline constexpr std::size_t kMaxNameLength = 100;

[[nodiscard]] auto validate_job_spec(const JobSpec &spec,
                                     std::chrono::system_clock::time_point now)
    -> Result<void>;

[[nodiscard]] auto validate_job_update(const Job &job, const JobUpdate &update,
                                       std::chrono::system_clock::time_point now)
    -> Result<void>;

} // namespace batchforge

#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace batchforge {

struct JobTag {};
struct TaskTag {};
struct WorkerTag {};
struct TenantTag {};
struct UserTag {};

// Phantom-typed identifier: a JobId cannot be passed where a TaskId is
// expected even though both wrap an opaque string.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using JobId = TypedId<JobTag>;
using TaskId = TypedId<TaskTag>;
using WorkerId = TypedId<WorkerTag>;
using TenantId = TypedId<TenantTag>;
using UserId = TypedId<UserTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

// Actor recorded in history rows for transitions the scheduler makes on its
// own (dispatch, progress aggregation, sweeps).
inline const UserId kSystemActor{"system"};

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_job_id() -> JobId {
  return JobId{"job-" + detail::generate_uuid_v7_like()};
}

[[nodiscard]] inline auto generate_task_id() -> TaskId {
  return TaskId{"task-" + detail::generate_uuid_v7_like()};
}

[[nodiscard]] inline auto generate_worker_id() -> WorkerId {
  return WorkerId{"worker-" + detail::generate_uuid_v7_like()};
}

} // namespace batchforge

// `is_avalanching` lets ankerl::unordered_dense::hash use this directly
// instead of hashing the object bytes.
template <typename Tag> struct std::hash<batchforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const batchforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<batchforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const batchforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

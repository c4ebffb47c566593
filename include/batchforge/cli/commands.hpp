#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace batchforge::cli {

struct ValidateOptions {
  std::string config_file;
  bool json{false};
};

struct SimulateOptions {
  std::string config_file;
  int workers{4};
  int jobs{8};
  int tasks{5};
  std::optional<int> capacity; // default: [workers] default_max_concurrent_tasks
  double fail_rate{0.0};
  double reject_rate{0.0};
  std::uint64_t seed{42};
  int timeout_sec{60};
  std::optional<std::string> log_level;
  bool json{false};
};

[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_simulate(const SimulateOptions &opts) -> int;

} // namespace batchforge::cli

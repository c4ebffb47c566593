#pragma once

#include <string>

namespace batchforge {

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
  int io_threads{2};
  int sweep_interval_sec{30};
  int heartbeat_timeout_sec{90};
  int default_max_retries{3};

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct WorkersConfig {
  int default_max_concurrent_tasks{1};
  std::string default_host{"localhost"};

  auto operator==(const WorkersConfig &) const -> bool = default;
};

struct SystemConfig {
  SchedulerConfig scheduler;
  WorkersConfig workers;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace batchforge

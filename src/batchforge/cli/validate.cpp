#include "batchforge/cli/commands.hpp"
#include "batchforge/cli/formatting.hpp"
#include "batchforge/config/config.hpp"
#include "batchforge/util/json.hpp"

#include <cstdint>
#include <print>

namespace batchforge::cli {

namespace {

auto config_to_json(const SystemConfig &config) -> JsonValue {
  const auto &s = config.scheduler;
  const auto &w = config.workers;
  return JsonValue{
      {"scheduler",
       JsonValue{
           {"log_level", s.log_level},
           {"log_file", s.log_file},
           {"io_threads", static_cast<std::int64_t>(s.io_threads)},
           {"sweep_interval_sec",
            static_cast<std::int64_t>(s.sweep_interval_sec)},
           {"heartbeat_timeout_sec",
            static_cast<std::int64_t>(s.heartbeat_timeout_sec)},
           {"default_max_retries",
            static_cast<std::int64_t>(s.default_max_retries)},
       }},
      {"workers",
       JsonValue{
           {"default_max_concurrent_tasks",
            static_cast<std::int64_t>(w.default_max_concurrent_tasks)},
           {"default_host", w.default_host},
       }},
  };
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  auto config = ConfigLoader::load_from_file(opts.config_file);

  if (opts.json) {
    JsonValue output{
        {"file", opts.config_file},
        {"valid", config.has_value()},
    };
    if (config) {
      output.get_object().emplace("config", config_to_json(*config));
    } else {
      output.get_object().emplace("error", config.error().message());
    }
    std::println("{}", dump_json(output));
    return config ? 0 : 1;
  }

  if (!config) {
    std::println("{} {} - {}", fmt::paint("✗", fmt::Tone::Red),
                 opts.config_file,
                 fmt::paint(config.error().message(), fmt::Tone::Red));
    return 1;
  }

  const auto &s = config->scheduler;
  const auto &w = config->workers;
  std::println("{} {} - {}", fmt::paint("✓", fmt::Tone::Green),
               opts.config_file, fmt::paint("Valid", fmt::Tone::Green));
  std::println("");
  std::println("  {}", fmt::paint("[scheduler]", fmt::Tone::Bold));
  std::println("  log_level             {}", s.log_level);
  std::println("  log_file              {}",
               s.log_file.empty() ? "-" : s.log_file);
  std::println("  io_threads            {}", s.io_threads);
  std::println("  sweep_interval_sec    {}", s.sweep_interval_sec);
  std::println("  heartbeat_timeout_sec {}", s.heartbeat_timeout_sec);
  std::println("  default_max_retries   {}", s.default_max_retries);
  std::println("  {}", fmt::paint("[workers]", fmt::Tone::Bold));
  std::println("  default_max_concurrent_tasks {}",
               w.default_max_concurrent_tasks);
  std::println("  default_host                 {}", w.default_host);
  return 0;
}

} // namespace batchforge::cli

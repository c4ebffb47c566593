#include "batchforge/config/config.hpp"

#include "batchforge/core/error.hpp"
#include "batchforge/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace batchforge {
namespace detail {

struct SchedulerToml {
  std::string log_level{"info"};
  std::string log_file;
  int io_threads{2};
  int sweep_interval_sec{30};
  int heartbeat_timeout_sec{90};
  int default_max_retries{3};
};

struct WorkersToml {
  int default_max_concurrent_tasks{1};
  std::string default_host{"localhost"};
};

struct SystemToml {
  SchedulerToml scheduler{};
  WorkersToml workers{};
};

} // namespace detail
} // namespace batchforge

namespace glz {
template <> struct meta<batchforge::detail::SchedulerToml> {
  using T = batchforge::detail::SchedulerToml;
  static constexpr auto value =
      object("log_level", &T::log_level, "log_file", &T::log_file,
             "io_threads", &T::io_threads, "sweep_interval_sec",
             &T::sweep_interval_sec, "heartbeat_timeout_sec",
             &T::heartbeat_timeout_sec, "default_max_retries",
             &T::default_max_retries);
};

template <> struct meta<batchforge::detail::WorkersToml> {
  using T = batchforge::detail::WorkersToml;
  static constexpr auto value =
      object("default_max_concurrent_tasks", &T::default_max_concurrent_tasks,
             "default_host", &T::default_host);
};

template <> struct meta<batchforge::detail::SystemToml> {
  using T = batchforge::detail::SystemToml;
  static constexpr auto value =
      object("scheduler", &T::scheduler, "workers", &T::workers);
};
} // namespace glz

namespace batchforge {
namespace {

constexpr std::array<std::string_view, 5> kLogLevels = {"trace", "debug",
                                                        "info", "warn", "error"};

[[nodiscard]] auto known_log_level(std::string_view level) -> bool {
  return std::ranges::find(kLogLevels, level) != kLogLevels.end();
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("BATCHFORGE_LOG_LEVEL"); v != nullptr) {
    cfg.scheduler.log_level = v;
  }
  if (const char *v = std::getenv("BATCHFORGE_LOG_FILE"); v != nullptr) {
    cfg.scheduler.log_file = v;
  }
  if (const char *v = std::getenv("BATCHFORGE_IO_THREADS"); v != nullptr) {
    cfg.scheduler.io_threads = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("BATCHFORGE_SWEEP_INTERVAL_SEC");
      v != nullptr) {
    cfg.scheduler.sweep_interval_sec = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("BATCHFORGE_HEARTBEAT_TIMEOUT_SEC");
      v != nullptr) {
    cfg.scheduler.heartbeat_timeout_sec = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("BATCHFORGE_DEFAULT_MAX_RETRIES");
      v != nullptr) {
    cfg.scheduler.default_max_retries = boost::lexical_cast<int>(v);
  }
}

[[nodiscard]] auto read_config_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in{std::string(path), std::ios::binary};
  if (!in) {
    log::error("Config file {} not readable", path);
    return fail(Error::FileNotFound);
  }
  return ok(std::string(std::istreambuf_iterator<char>(in),
                        std::istreambuf_iterator<char>()));
}

// Sections and keys this binary does not know are skipped.
[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  detail::SystemToml raw{};
  constexpr auto kTomlOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kTomlOpts>(raw, toml_text); ec) {
    log::error("System config TOML invalid: {}",
               glz::format_error(ec, toml_text));
    return fail(Error::ParseError);
  }

  SystemConfig cfg{};
  cfg.scheduler.log_level = std::move(raw.scheduler.log_level);
  cfg.scheduler.log_file = std::move(raw.scheduler.log_file);
  cfg.scheduler.io_threads = raw.scheduler.io_threads;
  cfg.scheduler.sweep_interval_sec = raw.scheduler.sweep_interval_sec;
  cfg.scheduler.heartbeat_timeout_sec = raw.scheduler.heartbeat_timeout_sec;
  cfg.scheduler.default_max_retries = raw.scheduler.default_max_retries;

  cfg.workers.default_max_concurrent_tasks =
      raw.workers.default_max_concurrent_tasks;
  cfg.workers.default_host = std::move(raw.workers.default_host);

  apply_env_overrides(cfg);

  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &config) -> Result<void> {
  const auto &s = config.scheduler;
  const auto &w = config.workers;
  // A worker is declared stale only after missing at least one full sweep.
  if (s.io_threads <= 0 || s.sweep_interval_sec <= 0 ||
      s.heartbeat_timeout_sec <= s.sweep_interval_sec ||
      s.default_max_retries < 0 || w.default_max_concurrent_tasks < 1 ||
      w.default_host.empty() || !known_log_level(s.log_level)) {
    log::warn("System config rejected: io_threads={} sweep_interval_sec={} "
               "heartbeat_timeout_sec={} default_max_retries={} "
               "default_max_concurrent_tasks={} log_level={}",
               s.io_threads, s.sweep_interval_sec, s.heartbeat_timeout_sec,
               s.default_max_retries, w.default_max_concurrent_tasks,
               s.log_level);
    return fail(Error::ParseError);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = read_config_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid numeric environment override: {}", e.what());
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace batchforge

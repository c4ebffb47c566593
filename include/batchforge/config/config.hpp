#pragma once

#include "batchforge/config/system_config.hpp"
#include "batchforge/core/error.hpp"

#include <string_view>

namespace batchforge {

using Config = SystemConfig;

// TOML loading with BATCHFORGE_* environment overrides applied on top.
// Every loaded config has passed validate().
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;

  // ParseError when a value is out of range, the log level is unknown or
  // heartbeat_timeout_sec does not exceed sweep_interval_sec.
  [[nodiscard]] static auto validate(const SystemConfig &config)
      -> Result<void>;
};

} // namespace batchforge

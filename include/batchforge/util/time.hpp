#pragma once

#include <chrono>
#include <format>
#include <optional>
#include <string>

namespace batchforge::util {

using TimePoint = std::chrono::system_clock::time_point;

// Formats time point to ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{})
    return {};
  auto const sec_tp = std::chrono::floor<std::chrono::seconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", sec_tp);
}

[[nodiscard]] inline auto format_iso8601(const std::optional<TimePoint> &tp)
    -> std::string {
  return tp ? format_iso8601(*tp) : std::string{};
}

[[nodiscard]] inline auto
format_duration(std::chrono::milliseconds d) -> std::string {
  if (d < std::chrono::seconds(1)) {
    return std::format("{}ms", d.count());
  }
  return std::format("{:.2f}s", static_cast<double>(d.count()) / 1000.0);
}

} // namespace batchforge::util

#pragma once

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace batchforge {

// Opaque payload carried by jobs and tasks (parameters, result_data,
// error_details). The scheduler never looks inside.
using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto is_null_json(const JsonValue &value) -> bool {
  return value.is_null();
}

// Wraps a plain message as {"message": "..."} for error_details.
[[nodiscard]] inline auto error_payload(std::string_view message)
    -> JsonValue {
  JsonValue value{};
  value["message"] = std::string(message);
  return value;
}

} // namespace batchforge

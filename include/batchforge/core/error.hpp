#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace batchforge {

enum class Error : std::uint8_t {
  Success,
  NotFound,
  InvalidTransition,
  InvalidSpec,
  RetryExhausted,
  CapacityUnavailable,
  TerminalState,
  AlreadyExists,
  VersionConflict,
  DispatchFailed,
  FileNotFound,
  ParseError,
  InvalidArgument,
  SystemNotRunning,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 15> messages = {
      "success",
      "not found",
      "invalid state transition",
      "invalid specification",
      "retry attempts exhausted",
      "worker capacity unavailable",
      "entity is in a terminal state",
      "already exists",
      "version conflict",
      "dispatch failed",
      "file not found",
      "parse error",
      "invalid argument",
      "system not running",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "batchforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace batchforge

template <>
struct std::is_error_code_enum<batchforge::Error> : std::true_type {};

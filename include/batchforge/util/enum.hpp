#pragma once

#include "batchforge/core/error.hpp"

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

namespace batchforge {

// Unknown names are InvalidSpec.
template <typename E>
[[nodiscard]] auto parse(std::string_view s) -> Result<E>;

namespace util {

// Case, '_' and '-' are ignored when matching names.
[[nodiscard]] inline auto enum_match_key(std::string_view token)
    -> std::string {
  auto key = token | std::views::filter([](char c) {
               return std::isalnum(static_cast<unsigned char>(c)) != 0;
             }) |
             std::views::transform([](char c) {
               return static_cast<char>(
                   std::tolower(static_cast<unsigned char>(c)));
             });
  return std::string(key.begin(), key.end());
}

// "DataProcessing" -> "data_processing"
[[nodiscard]] inline auto snake_case(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uch = static_cast<unsigned char>(name[i]);
    if (std::isupper(uch) != 0 && i > 0 &&
        std::islower(static_cast<unsigned char>(name[i - 1])) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

template <typename E> struct EnumNames {
  using descriptors = boost::describe::describe_enumerators<E>;
  static constexpr std::size_t kCount =
      boost::mp11::mp_size<descriptors>::value;

  std::array<std::pair<E, std::string>, kCount> wire{};
  std::array<std::string, kCount> keys{};

  [[nodiscard]] static auto get() -> const EnumNames & {
    static const EnumNames names = [] {
      EnumNames out;
      std::size_t i = 0;
      boost::mp11::mp_for_each<descriptors>([&](auto d) {
        out.wire[i] = {d.value, snake_case(d.name)};
        out.keys[i] = enum_match_key(d.name);
        ++i;
      });
      return out;
    }();
    return names;
  }
};

template <typename E>
[[nodiscard]] inline auto enum_wire_name(E value) noexcept -> std::string_view {
  for (const auto &[v, name] : EnumNames<E>::get().wire) {
    if (v == value) {
      return name;
    }
  }
  return "unknown";
}

// Accepts "DataProcessing", "data_processing", "DATA-PROCESSING", ...
template <typename E>
[[nodiscard]] inline auto enum_from_name(std::string_view input)
    -> Result<E> {
  const auto &names = EnumNames<E>::get();
  const auto key = enum_match_key(input);
  for (std::size_t i = 0; i < names.keys.size(); ++i) {
    if (names.keys[i] == key) {
      return ok(names.wire[i].first);
    }
  }
  return fail(Error::InvalidSpec);
}

} // namespace util

#define BATCHFORGE_DEFINE_ENUM_SERDE(EnumType)                                 \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::batchforge::util::enum_wire_name(value);                          \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s)                \
      -> Result<EnumType> {                                                    \
    return ::batchforge::util::enum_from_name<EnumType>(s);                    \
  }

} // namespace batchforge

#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <vector>

namespace batchforge {

inline constexpr std::size_t kDefaultPageLimit = 100;

template <typename T> struct Page {
  std::vector<T> items;
  std::size_t total{0};
  std::size_t offset{0};
  std::size_t limit{kDefaultPageLimit};
};

// Slices an already filtered and ordered result set.
template <typename T>
[[nodiscard]] auto paginate(std::vector<T> rows, std::size_t offset,
                            std::size_t limit) -> Page<T> {
  Page<T> page;
  page.total = rows.size();
  page.offset = offset;
  page.limit = limit;
  if (offset >= rows.size()) {
    return page;
  }
  const auto first = rows.begin() + static_cast<std::ptrdiff_t>(offset);
  const auto count = std::min(limit, rows.size() - offset);
  page.items.assign(std::make_move_iterator(first),
                    std::make_move_iterator(
                        first + static_cast<std::ptrdiff_t>(count)));
  return page;
}

} // namespace batchforge

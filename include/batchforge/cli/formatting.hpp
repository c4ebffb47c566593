#pragma once

#include "batchforge/domain/job.hpp"
#include "batchforge/domain/worker.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

namespace batchforge::cli::fmt {

enum class Tone : std::uint8_t { Plain, Bold, Dim, Green, Red, Yellow, Blue };

[[nodiscard]] inline auto stdout_is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  return tty;
}

[[nodiscard]] constexpr auto escape_for(Tone tone) noexcept
    -> std::string_view {
  switch (tone) {
  case Tone::Bold:
    return "\033[1m";
  case Tone::Dim:
    return "\033[2m";
  case Tone::Green:
    return "\033[32m";
  case Tone::Red:
    return "\033[31m";
  case Tone::Yellow:
    return "\033[33m";
  case Tone::Blue:
    return "\033[34m";
  case Tone::Plain:
    break;
  }
  return {};
}

// Escapes are only emitted when stdout is a terminal.
[[nodiscard]] inline auto paint(std::string_view text, Tone tone)
    -> std::string {
  if (tone == Tone::Plain || !stdout_is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}\033[0m", escape_for(tone), text);
}

[[nodiscard]] constexpr auto tone_of(JobStatus status) noexcept -> Tone {
  switch (status) {
  case JobStatus::Completed:
    return Tone::Green;
  case JobStatus::Failed:
  case JobStatus::Cancelled:
    return Tone::Red;
  case JobStatus::Running:
    return Tone::Blue;
  case JobStatus::Paused:
    return Tone::Yellow;
  default:
    return Tone::Dim;
  }
}

[[nodiscard]] constexpr auto tone_of(WorkerStatus status) noexcept -> Tone {
  switch (status) {
  case WorkerStatus::Idle:
    return Tone::Green;
  case WorkerStatus::Busy:
    return Tone::Blue;
  case WorkerStatus::Offline:
  case WorkerStatus::Error:
    return Tone::Red;
  default:
    return Tone::Yellow;
  }
}

template <typename Status>
[[nodiscard]] inline auto status_cell(Status status) -> std::string {
  return paint(to_string_view(status), tone_of(status));
}

// Printable width, skipping SGR escape sequences.
[[nodiscard]] inline auto display_width(std::string_view s) noexcept
    -> std::size_t {
  std::size_t width = 0;
  bool escape = false;
  for (char c : s) {
    if (escape) {
      escape = c != 'm';
    } else if (c == '\033') {
      escape = true;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++width;
    }
  }
  return width;
}

// Column widths follow the widest cell; rows are buffered until print().
class Table {
public:
  struct Column {
    std::string header;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {
    widths_.reserve(columns_.size());
    for (const auto &c : columns_) {
      widths_.push_back(display_width(c.header));
    }
  }

  auto add_row(std::vector<std::string> cells) -> void {
    cells.resize(columns_.size());
    for (std::size_t i = 0; i < cells.size(); ++i) {
      widths_[i] = std::max(widths_[i], display_width(cells[i]));
    }
    rows_.push_back(std::move(cells));
  }

  auto print() const -> void {
    std::vector<std::string> header;
    header.reserve(columns_.size());
    std::size_t rule = columns_.empty() ? 0 : (columns_.size() - 1) * 2;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      header.push_back(columns_[i].header);
      rule += widths_[i];
    }
    print_line(header);
    std::println("{}", std::string(rule, '-'));
    for (const auto &row : rows_) {
      print_line(row);
    }
  }

private:
  auto print_line(const std::vector<std::string> &cells) const -> void {
    std::string line;
    for (std::size_t i = 0; i < cells.size(); ++i) {
      const auto pad = std::string(widths_[i] - display_width(cells[i]), ' ');
      if (i > 0) {
        line += "  ";
      }
      line += columns_[i].right_align ? pad + cells[i] : cells[i] + pad;
    }
    while (!line.empty() && line.back() == ' ') {
      line.pop_back();
    }
    std::println("{}", line);
  }

  std::vector<Column> columns_;
  std::vector<std::size_t> widths_;
  std::vector<std::vector<std::string>> rows_;
};

[[nodiscard]] inline auto progress_bar(int percent, std::size_t width = 20)
    -> std::string {
  const auto clamped = static_cast<std::size_t>(std::clamp(percent, 0, 100));
  const auto filled = clamped * width / 100;
  return std::format("[{}{}] {:>3}%", std::string(filled, '#'),
                     std::string(width - filled, '.'), clamped);
}

} // namespace batchforge::cli::fmt

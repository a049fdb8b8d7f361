#pragma once

#include "event.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fxlog {

// Render state of one progress bar.
struct bar_state {
  std::uint64_t sequence_id;
  std::uint64_t current{ 0 };
  std::optional<std::uint64_t> total;
  std::string description;
  std::chrono::steady_clock::time_point start_time;
  bool finished{ false };
};

struct log_format {
  bool color{ false };      // SGR-colored level name; when false, SGR is stripped from text
  bool decorated{ false };  // timestamp + pid prefix, block markers on multi-line text
};

// One newline-terminated record: "[LEVEL] message\n". Decorated records look like
// "[2026-01-02 03:04:05.678] [INFO] (4242) message\n"; a multi-line message becomes one
// record per line, marked "+ ", "| ", ..., "+ ".
std::string format_log_line(log_event const &event, log_format const &fmt);

// Single progress line without trailing newline, truncated to `width` columns.
//   known total:   "desc: 42% [========>           ] 3/7 [ 1s< 2s, 2.50it/s]"
//   unknown total: "desc: | 3 [ 1s, 2.50it/s]"  (spinner frame from elapsed time)
//   unknown, done: "desc: done 3 [ 1s, 2.50it/s]"
std::string format_progress_line(bar_state const &bar,
                                 int width,
                                 std::chrono::steady_clock::time_point now);

// Count printable columns, skipping SGR escape sequences. Tabs count as 8.
int calculate_visible_length(std::string_view str);

// Cut to at most `target_width` visible columns; escape sequences are kept intact.
std::string truncate_to_width_ansi_aware(std::string const &str, int target_width);

}  // namespace fxlog

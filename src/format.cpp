#include "format.h"

#include "platform.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace fxlog {

namespace {

constexpr int kBarChars{ 20 };
constexpr char const *kSpinnerFrames[]{ "|", "/", "-", "\\" };
constexpr char const *kSgrReset{ "\x1b[0m" };

char const *level_color(log_level level) {
  switch (level) {
    case log_level::LOG_DEBUG: return "\x1b[90m";
    case log_level::LOG_WARNING: return "\x1b[33m";
    case log_level::LOG_ERROR: return "\x1b[31m";
    default: return nullptr;
  }
}

std::string format_timestamp() {
  auto const now{ std::chrono::system_clock::now() };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000
  };
  std::time_t const seconds{ std::chrono::system_clock::to_time_t(now) };

  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif

  char date[32]{};
  if (std::strftime(date, sizeof date, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char stamp[48]{};
  std::snprintf(stamp, sizeof stamp, "%s.%03d", date, static_cast<int>(millis));
  return stamp;
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start{ 0 };
  while (true) {
    auto const pos{ text.find('\n', start) };
    if (pos == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

std::string render_bar_cells(std::uint64_t current, std::uint64_t total) {
  int const filled{ static_cast<int>((static_cast<double>(current) / total) * kBarChars) };

  std::string cells(kBarChars, ' ');
  std::fill_n(cells.begin(), std::min(filled, kBarChars), '=');
  if (filled < kBarChars) { cells[filled] = '>'; }
  return cells;
}

// Byte offset just past the last column that fits in `limit`. SGR sequences are
// zero-width and never split; tabs take 8 columns. `columns` gets the width used.
std::size_t scan_columns(std::string_view str, int limit, int &columns) {
  columns = 0;
  std::size_t end{ 0 };
  std::size_t i{ 0 };
  while (i < str.size()) {
    if (str[i] == '\x1b' && i + 1 < str.size() && str[i + 1] == '[') {
      auto const terminator{ str.find('m', i + 2) };
      i = terminator == std::string_view::npos ? str.size() : terminator + 1;
      end = i;
      continue;
    }

    int const cell{ str[i] == '\t' ? 8 : 1 };
    if (columns + cell > limit) { break; }
    columns += cell;
    end = ++i;
  }
  return end;
}

}  // namespace

std::string format_log_line(log_event const &event, log_format const &fmt) {
  std::string level_label{ level_name(event.level) };
  if (fmt.color) {
    if (char const *color{ level_color(event.level) }) {
      level_label = color + level_label + kSgrReset;
    }
  }

  std::string const message{ fmt.color ? event.message.str()
                                       : util_strip_ansi(event.message.str()) };

  if (!fmt.decorated) { return "[" + level_label + "] " + message + "\n"; }

  std::ostringstream prefix;
  prefix << "[" << format_timestamp() << "] [" << level_label << "] ("
         << platform::process_id() << ") ";

  auto const lines{ split_lines(message) };
  std::string out;
  for (std::size_t i{ 0 }; i < lines.size(); ++i) {
    out += prefix.str();
    if (lines.size() > 1) { out += (i == 0 || i + 1 == lines.size()) ? "+ " : "| "; }
    out.append(lines[i]);
    out.push_back('\n');
  }
  return out;
}

std::string format_progress_line(bar_state const &bar,
                                 int width,
                                 std::chrono::steady_clock::time_point now) {
  double const elapsed{ std::chrono::duration<double>(now - bar.start_time).count() };

  std::ostringstream oss;
  if (!bar.description.empty()) { oss << bar.description << ": "; }

  if (bar.total && *bar.total > 0) {
    std::uint64_t const total{ std::max(bar.current, *bar.total) };
    int const percent{
      static_cast<int>(std::min<std::uint64_t>(100, 100 * bar.current / total))
    };
    double const eta{ bar.current > 0
                          ? elapsed / static_cast<double>(bar.current) *
                                static_cast<double>(total - bar.current)
                          : std::numeric_limits<double>::infinity() };

    oss << std::setw(3) << percent << "%"
        << " [" << render_bar_cells(bar.current, total) << "] " << bar.current << "/"
        << total << " [" << util_format_duration(elapsed) << "<"
        << util_format_duration(eta) << ", " << util_format_rate(bar.current, elapsed)
        << "]";
  } else {
    if (bar.finished) {
      oss << "done";
    } else {
      auto const elapsed_ms{
        std::chrono::duration_cast<std::chrono::milliseconds>(now - bar.start_time).count()
      };
      std::size_t const frame_index{
        static_cast<std::size_t>((std::max<long long>(elapsed_ms, 0) / 100) % 4)
      };
      oss << kSpinnerFrames[frame_index];
    }
    oss << " " << bar.current << " [" << util_format_duration(elapsed) << ", "
        << util_format_rate(bar.current, elapsed) << "]";
  }

  return truncate_to_width_ansi_aware(oss.str(), width > 0 ? width : 80);
}

int calculate_visible_length(std::string_view str) {
  int columns{ 0 };
  scan_columns(str, std::numeric_limits<int>::max(), columns);
  return columns;
}

std::string truncate_to_width_ansi_aware(std::string const &str, int target_width) {
  if (target_width <= 0) { return ""; }
  int columns{ 0 };
  return str.substr(0, scan_columns(str, target_width, columns));
}

}  // namespace fxlog

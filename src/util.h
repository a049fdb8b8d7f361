#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace fxlog {

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
// On Windows, uses _wfopen for proper Unicode path support.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Compact duration for progress lines. Days/hours/minutes are shown only when
// non-zero, seconds only below one hour. Fields are right-aligned to two columns.
// Examples: 3.2 -> " 3s", 65 -> " 1m 5s", 3700 -> " 1h 1m", inf -> "inf".
std::string util_format_duration(double total_seconds);

// Throughput suffix: "2.50it/s" at or above one item per second, "4.00s/it" below.
// Returns "0.00it/s" when nothing has completed yet.
std::string util_format_rate(std::uint64_t items, double elapsed_seconds);

// Remove every CSI sequence (colours, cursor movement, erase, mode switches) and any
// other ESC byte from text.
std::string util_strip_ansi(std::string_view text);

}  // namespace fxlog

#include "util.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>

namespace fxlog {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
#if defined(_WIN32)
  std::wstring wide_mode;
  wide_mode.reserve(std::strlen(mode));
  for (char const *p{ mode }; *p != '\0'; ++p) {
    wide_mode.push_back(static_cast<wchar_t>(*p));
  }
  return file_ptr_t{ _wfopen(path.c_str(), wide_mode.c_str()) };
#else
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
#endif
}

std::string util_format_duration(double total_seconds) {
  if (std::isinf(total_seconds)) { return "inf"; }
  if (total_seconds < 0.0) { total_seconds = 0.0; }

  constexpr double kDay{ 24.0 * 3600.0 };
  long long const days{ static_cast<long long>(total_seconds / kDay) };
  double remaining{ std::fmod(total_seconds, kDay) };
  int const hours{ static_cast<int>(remaining / 3600.0) };
  remaining = std::fmod(remaining, 3600.0);
  int const minutes{ static_cast<int>(remaining / 60.0) };
  double const seconds{ std::fmod(remaining, 60.0) };

  std::string out;
  char buf[32];
  if (days > 0) {
    std::snprintf(buf, sizeof buf, "%lldd", days);
    out += buf;
  }
  if (days > 0 || hours > 0) {
    std::snprintf(buf, sizeof buf, "%2dh", hours);
    out += buf;
  }
  if (days > 0 || hours > 0 || minutes > 0) {
    std::snprintf(buf, sizeof buf, "%2dm", minutes);
    out += buf;
  }
  if (days == 0 && hours == 0) {
    std::snprintf(buf, sizeof buf, "%2.0fs", seconds);
    out += buf;
  }
  return out;
}

std::string util_format_rate(std::uint64_t items, double elapsed_seconds) {
  if (items == 0 || elapsed_seconds <= 0.0) { return "0.00it/s"; }

  double const rate{ static_cast<double>(items) / elapsed_seconds };
  char buf[48];
  if (rate >= 1.0) {
    std::snprintf(buf, sizeof buf, "%.2fit/s", rate);
  } else {
    std::snprintf(buf, sizeof buf, "%.2fs/it", 1.0 / rate);
  }
  return buf;
}

std::string util_strip_ansi(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  std::size_t i{ 0 };
  while (i < text.size()) {
    if (text[i] != '\x1b') {
      out.push_back(text[i++]);
      continue;
    }

    ++i;  // ESC never survives, even when it starts no recognisable sequence
    if (i >= text.size() || text[i] != '[') { continue; }

    // CSI: parameter bytes 0x30-0x3F, intermediate bytes 0x20-0x2F, final byte 0x40-0x7E.
    ++i;
    while (i < text.size() && text[i] >= 0x30 && text[i] <= 0x3F) { ++i; }
    while (i < text.size() && text[i] >= 0x20 && text[i] <= 0x2F) { ++i; }
    if (i < text.size() && text[i] >= 0x40 && text[i] <= 0x7E) { ++i; }
  }

  return out;
}

}  // namespace fxlog

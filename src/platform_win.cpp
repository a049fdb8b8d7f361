#include "platform.h"

namespace fxlog::platform {

namespace {

HANDLE handle_for(std::FILE *stream) {
  if (!stream) { return INVALID_HANDLE_VALUE; }
  return reinterpret_cast<HANDLE>(::_get_osfhandle(::_fileno(stream)));
}

}  // namespace

bool is_tty(std::FILE *stream) {
  if (!stream) { return false; }
  return ::_isatty(::_fileno(stream)) != 0;
}

bool ansi_supported(std::FILE *stream) {
  if (!is_tty(stream)) { return false; }

  HANDLE const h{ handle_for(stream) };
  DWORD mode{ 0 };
  if (GetConsoleMode(h, &mode)) {
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(h, mode)) { return true; }
  }
  return false;
}

int terminal_width(std::FILE *stream) {
  CONSOLE_SCREEN_BUFFER_INFO csbi;
  if (GetConsoleScreenBufferInfo(handle_for(stream), &csbi)) {
    return csbi.srWindow.Right - csbi.srWindow.Left + 1;
  }
  return 80;
}

int process_id() { return static_cast<int>(::GetCurrentProcessId()); }

}  // namespace fxlog::platform

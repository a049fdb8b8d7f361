#include "platform.h"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>

namespace fxlog::platform {

bool is_tty(std::FILE *stream) {
  if (!stream) { return false; }
  return ::isatty(::fileno(stream)) != 0;
}

bool ansi_supported(std::FILE *stream) {
  if (!is_tty(stream)) { return false; }
  char const *const term{ std::getenv("TERM") };
  return term && std::strcmp(term, "dumb") != 0;
}

int terminal_width(std::FILE *stream) {
  if (!stream) { return 80; }
  struct winsize ws;
  if (::ioctl(::fileno(stream), TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
    return ws.ws_col;
  }
  return 80;
}

int process_id() { return static_cast<int>(::getpid()); }

}  // namespace fxlog::platform

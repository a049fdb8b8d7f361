#include "sink.h"

#include "platform.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace fxlog {

file_sink::file_sink(std::FILE *stream) : stream_{ stream } {
  if (!stream_) { throw std::invalid_argument{ "fxlog::file_sink: null stream" }; }
}

file_sink::file_sink(file_ptr_t owned) : owned_{ std::move(owned) }, stream_{ owned_.get() } {
  if (!stream_) { throw std::invalid_argument{ "fxlog::file_sink: null stream" }; }
}

std::unique_ptr<file_sink> file_sink::open(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("fxlog::file_sink: failed to open " + path.string() + ": " +
                             std::strerror(errno));
  }
  return std::make_unique<file_sink>(std::move(file));
}

void file_sink::write(std::string_view bytes) {
  if (bytes.empty()) { return; }
  if (std::fwrite(bytes.data(), 1, bytes.size(), stream_) != bytes.size()) {
    throw std::runtime_error("fxlog::file_sink: write failed: " +
                             std::string{ std::strerror(errno) });
  }
}

void file_sink::flush() {
  if (std::fflush(stream_) != 0) {
    throw std::runtime_error("fxlog::file_sink: flush failed: " +
                             std::string{ std::strerror(errno) });
  }
}

bool file_sink::is_tty() const { return platform::ansi_supported(stream_); }

int file_sink::width() const { return platform::terminal_width(stream_); }

callback_sink::callback_sink(write_fn_t on_write, bool tty, int width)
    : on_write_{ std::move(on_write) }, tty_{ tty }, width_{ width } {
  if (!on_write_) { throw std::invalid_argument{ "fxlog::callback_sink: empty callback" }; }
}

void callback_sink::write(std::string_view bytes) {
  if (!bytes.empty()) { on_write_(bytes); }
}

}  // namespace fxlog

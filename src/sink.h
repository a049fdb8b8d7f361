#pragma once

#include "util.h"

#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

namespace fxlog {

// Destination stream for a text_writer. A writer takes ownership of its sink, so one
// sink can never be driven by two writers.
class sink : unmovable {
 public:
  virtual ~sink() = default;

  // Throws std::runtime_error when the destination stops accepting bytes.
  virtual void write(std::string_view bytes) = 0;
  virtual void flush() = 0;

  // Interactive terminal that understands ANSI cursor control.
  virtual bool is_tty() const = 0;
  virtual int width() const = 0;

 protected:
  sink() = default;
};

class file_sink : public sink {
 public:
  explicit file_sink(std::FILE *stream);  // not owned (stderr, stdout)
  explicit file_sink(file_ptr_t owned);

  // Opens `path` for writing (truncating). Throws std::runtime_error on failure.
  static std::unique_ptr<file_sink> open(std::filesystem::path const &path);

  void write(std::string_view bytes) override;
  void flush() override;
  bool is_tty() const override;
  int width() const override;

 private:
  file_ptr_t owned_;
  std::FILE *stream_;
};

// Hands every write to a callback; used to capture output or bridge to foreign
// streams. TTY-ness and width are whatever the creator declares.
class callback_sink : public sink {
 public:
  using write_fn_t = std::function<void(std::string_view)>;

  explicit callback_sink(write_fn_t on_write, bool tty = false, int width = 80);

  void write(std::string_view bytes) override;
  void flush() override {}
  bool is_tty() const override { return tty_; }
  int width() const override { return width_; }

 private:
  write_fn_t on_write_;
  bool tty_;
  int width_;
};

}  // namespace fxlog

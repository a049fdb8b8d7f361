#pragma once

#include "context.h"
#include "event.h"
#include "format.h"
#include "sink.h"
#include "util.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fxlog {

struct writer_options {
  bool async{ false };  // redraw progress from a background thread
  std::chrono::milliseconds refresh_interval{ 100 };
  std::optional<log_level> threshold;  // skip rendering below this level
  bool decorated{ false };
  std::optional<bool> force_tty;  // override sink detection
};

// Terminal renderer. Constructing one installs it in the context; close() or the
// destructor removes it. Every event it processes is shared onward so sibling writers on
// other sinks see it too.
//
// TTY-ness is decided once at construction. A non-TTY writer renders log lines only,
// with escape sequences stripped, and never emits cursor control.
class text_writer : public handler, unmovable {
 public:
  explicit text_writer(context &ctx, writer_options options = {});  // stderr
  text_writer(context &ctx, std::unique_ptr<sink> destination, writer_options options = {});
  ~text_writer() override;

  // Unregisters, stops and joins the redraw thread, renders pending bar state, moves the
  // cursor below the bar region and shows it again, then flushes. Rethrows a rendering
  // error raised on the redraw thread. Further calls do nothing.
  void close();

  bool is_tty() const { return tty_; }
  bool is_async() const { return worker_.joinable(); }
  std::vector<std::uint64_t> active_bar_ids() const;  // outermost first

  log_disposition on_log(log_event const &event) override;
  progress_disposition on_progress(progress_event const &event) override;

 private:
  void worker_loop();
  void stop_worker();
  void rethrow_worker_error();

  // All *_unlocked helpers require mutex_. The builders only return bytes; callers
  // update drawn_lines_ once the sink write has gone through.
  std::string clear_region_unlocked(int lines) const;
  std::string draw_region_unlocked(std::chrono::steady_clock::time_point now) const;
  std::string repaint_region_unlocked(std::chrono::steady_clock::time_point now) const;
  std::string redraw_line_unlocked(std::size_t index,
                                   std::chrono::steady_clock::time_point now) const;
  void write_unlocked(std::string const &bytes);

  std::unique_ptr<sink> sink_;
  writer_options options_;
  bool tty_;
  log_format log_format_;

  mutable std::mutex mutex_;  // protects everything below and all sink writes
  std::vector<bar_state> bars_;
  int drawn_lines_{ 0 };
  bool dirty_{ false };
  bool cursor_hidden_{ false };
  std::exception_ptr worker_error_;

  std::thread worker_;
  std::condition_variable cv_;
  std::atomic_bool stop_requested_{ false };
  bool closed_{ false };

  context::registration registration_;
};

#ifdef FXLOG_UNIT_TEST
namespace test {
extern std::chrono::steady_clock::time_point g_now;
}  // namespace test
#endif

}  // namespace fxlog

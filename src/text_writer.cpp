#include "text_writer.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

#ifdef FXLOG_UNIT_TEST
namespace fxlog::test {
std::chrono::steady_clock::time_point g_now{};
}  // namespace fxlog::test
#endif

namespace fxlog {

namespace {

constexpr char const *kHideCursor{ "\x1b[?25l" };
constexpr char const *kShowCursor{ "\x1b[?25h" };
constexpr char const *kClearToLineEnd{ "\x1b[K" };
constexpr char const *kClearToScreenEnd{ "\x1b[J" };

std::chrono::steady_clock::time_point get_now() {
#ifdef FXLOG_UNIT_TEST
  if (test::g_now.time_since_epoch().count() > 0) { return test::g_now; }
#endif
  return std::chrono::steady_clock::now();
}

std::string cursor_up(int lines) { return "\x1b[" + std::to_string(lines) + "A"; }

std::string cursor_down(int lines) { return "\x1b[" + std::to_string(lines) + "B"; }

std::unique_ptr<sink> require_sink(std::unique_ptr<sink> destination) {
  if (!destination) { throw std::invalid_argument{ "fxlog::text_writer: null sink" }; }
  return destination;
}

}  // namespace

text_writer::text_writer(context &ctx, writer_options options)
    : text_writer{ ctx, std::make_unique<file_sink>(stderr), std::move(options) } {}

text_writer::text_writer(context &ctx,
                         std::unique_ptr<sink> destination,
                         writer_options options)
    : sink_{ require_sink(std::move(destination)) },
      options_{ std::move(options) },
      tty_{ options_.force_tty.value_or(sink_->is_tty()) },
      log_format_{ .color = tty_, .decorated = options_.decorated },
      registration_{ ctx.install(*this) } {
  // Progress is never drawn on a non-TTY sink, so the redraw thread would have no work.
  if (options_.async && tty_) { worker_ = std::thread{ [this] { worker_loop(); } }; }
}

text_writer::~text_writer() {
  try {
    close();
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[fxlog text_writer close failed: %s]\n", e.what());
    std::fflush(stderr);
  }
}

void text_writer::close() {
  if (closed_) { return; }
  closed_ = true;

  registration_.reset();
  stop_worker();

  std::lock_guard lock{ mutex_ };
  if (worker_error_) { std::rethrow_exception(std::exchange(worker_error_, nullptr)); }

  if (!tty_) { return; }

  std::string out;
  int lines{ drawn_lines_ };
  if (dirty_) {
    out += repaint_region_unlocked(get_now());
    lines = static_cast<int>(bars_.size());
  }
  if (lines > 0) { out += "\n"; }
  if (cursor_hidden_) { out += kShowCursor; }
  write_unlocked(out);

  drawn_lines_ = 0;
  dirty_ = false;
  cursor_hidden_ = false;
}

std::vector<std::uint64_t> text_writer::active_bar_ids() const {
  std::lock_guard lock{ mutex_ };
  std::vector<std::uint64_t> ids;
  ids.reserve(bars_.size());
  for (auto const &bar : bars_) { ids.push_back(bar.sequence_id); }
  return ids;
}

log_disposition text_writer::on_log(log_event const &event) {
  rethrow_worker_error();

  if (options_.threshold && event.level < *options_.threshold) {
    return log_disposition::share(event);
  }

  std::string const line{ format_log_line(event, log_format_) };

  std::lock_guard lock{ mutex_ };
  if (tty_ && drawn_lines_ > 0) {
    // Lift the bar region out of the way, print the record, put the bars back beneath.
    std::string out{ clear_region_unlocked(drawn_lines_) };
    out += line;
    out += draw_region_unlocked(get_now());
    write_unlocked(out);
    drawn_lines_ = static_cast<int>(bars_.size());
    dirty_ = false;
  } else {
    write_unlocked(line);
  }

  return log_disposition::share(event);
}

progress_disposition text_writer::on_progress(progress_event const &event) {
  rethrow_worker_error();
  if (!tty_) { return progress_disposition::share(event); }

  std::lock_guard lock{ mutex_ };
  auto const now{ get_now() };

  auto it{ std::ranges::find_if(bars_, [&](bar_state const &bar) {
    return bar.sequence_id == event.sequence_id;
  }) };

  if (event.phase == progress_phase::start) {
    if (it != bars_.end()) { return progress_disposition::share(event); }

    std::string out{ cursor_hidden_ ? "" : kHideCursor };
    out += clear_region_unlocked(drawn_lines_);
    bars_.push_back(bar_state{ .sequence_id = event.sequence_id,
                               .current = event.current,
                               .total = event.total,
                               .description = event.description,
                               .start_time = now });
    out += draw_region_unlocked(now);
    write_unlocked(out);
    drawn_lines_ = static_cast<int>(bars_.size());
    dirty_ = false;
    cursor_hidden_ = true;
    return progress_disposition::share(event);
  }

  // No START seen by this writer (e.g. it was opened mid-iteration): nothing to draw.
  if (it == bars_.end()) { return progress_disposition::share(event); }

  it->current = std::max(it->current, event.current);
  if (event.total) { it->total = event.total; }
  if (event.phase == progress_phase::description_change) { it->description = event.description; }

  std::size_t const index{ static_cast<std::size_t>(it - bars_.begin()) };

  if (event.phase != progress_phase::finish) {
    if (options_.async) {
      dirty_ = true;
    } else {
      write_unlocked(redraw_line_unlocked(index, now));
    }
    return progress_disposition::share(event);
  }

  it->finished = true;

  // Final state is always drawn synchronously; in async mode this also catches up any
  // coalesced updates of the other bars.
  std::string out{ dirty_ ? repaint_region_unlocked(now) : redraw_line_unlocked(index, now) };
  int const lines{ dirty_ ? static_cast<int>(bars_.size()) : drawn_lines_ };

  if (bars_.size() == 1) {
    // Outermost bar: its final line stays on screen, later output starts below it.
    out += "\n";
    bars_.clear();
  } else {
    out += clear_region_unlocked(lines);
    bars_.erase(bars_.begin() + static_cast<std::ptrdiff_t>(index));
    out += draw_region_unlocked(now);
  }

  bool const show_cursor{ bars_.empty() && cursor_hidden_ };
  if (show_cursor) { out += kShowCursor; }

  write_unlocked(out);
  drawn_lines_ = static_cast<int>(bars_.size());
  dirty_ = false;
  if (show_cursor) { cursor_hidden_ = false; }
  return progress_disposition::share(event);
}

void text_writer::worker_loop() {
  std::unique_lock lock{ mutex_ };

  while (!stop_requested_) {
    cv_.wait_for(lock, options_.refresh_interval, [this] { return stop_requested_.load(); });
    if (stop_requested_ || !dirty_) { continue; }

    try {
      write_unlocked(repaint_region_unlocked(get_now()));
      drawn_lines_ = static_cast<int>(bars_.size());
      dirty_ = false;
    } catch (...) {
      // Surfaced on the caller thread by the next emission or by close().
      worker_error_ = std::current_exception();
      return;
    }
  }
}

void text_writer::stop_worker() {
  if (!worker_.joinable()) { return; }
  {
    std::lock_guard lock{ mutex_ };
    stop_requested_ = true;
  }
  cv_.notify_all();
  worker_.join();
}

void text_writer::rethrow_worker_error() {
  std::lock_guard lock{ mutex_ };
  if (worker_error_) { std::rethrow_exception(std::exchange(worker_error_, nullptr)); }
}

std::string text_writer::clear_region_unlocked(int lines) const {
  if (lines == 0) { return {}; }

  std::string out{ "\r" };
  if (lines > 1) { out += cursor_up(lines - 1); }
  out += kClearToScreenEnd;
  return out;
}

std::string text_writer::draw_region_unlocked(std::chrono::steady_clock::time_point now) const {
  if (bars_.empty()) { return {}; }

  int const width{ sink_->width() };
  std::string out{ "\r" };
  for (std::size_t i{ 0 }; i < bars_.size(); ++i) {
    if (i > 0) { out += "\n"; }
    out += format_progress_line(bars_[i], width, now);
    out += kClearToLineEnd;
  }
  return out;
}

std::string text_writer::repaint_region_unlocked(
    std::chrono::steady_clock::time_point now) const {
  if (drawn_lines_ != static_cast<int>(bars_.size())) {
    return clear_region_unlocked(drawn_lines_) + draw_region_unlocked(now);
  }

  // Same line count: overwrite in place from the top of the region.
  std::string out{ "\r" };
  if (drawn_lines_ > 1) { out += cursor_up(drawn_lines_ - 1); }
  return out + draw_region_unlocked(now);
}

std::string text_writer::redraw_line_unlocked(std::size_t index,
                                              std::chrono::steady_clock::time_point now) const {
  int const lines_below{ drawn_lines_ - 1 - static_cast<int>(index) };

  std::string out{ "\r" };
  if (lines_below > 0) { out += cursor_up(lines_below); }
  out += format_progress_line(bars_[index], sink_->width(), now);
  out += kClearToLineEnd;
  if (lines_below > 0) { out += cursor_down(lines_below); }
  return out;
}

void text_writer::write_unlocked(std::string const &bytes) {
  if (bytes.empty()) { return; }
  sink_->write(bytes);
  sink_->flush();
}

}  // namespace fxlog

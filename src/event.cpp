#include "event.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace fxlog {

std::string level_name(log_level level) {
  switch (level) {
    case log_level::LOG_DEBUG: return "DEBUG";
    case log_level::LOG_INFO: return "INFO";
    case log_level::LOG_WARNING: return "WARNING";
    case log_level::LOG_ERROR: return "ERROR";
  }
  return "LEVEL" + std::to_string(static_cast<int>(level));
}

std::string_view phase_name(progress_phase phase) {
  switch (phase) {
    case progress_phase::start: return "start";
    case progress_phase::advance: return "advance";
    case progress_phase::description_change: return "description_change";
    case progress_phase::finish: return "finish";
  }
  return "unknown";
}

lazy_message::lazy_message(std::string text) : state_{ std::make_shared<state>() } {
  state_->text = std::move(text);
}

lazy_message::lazy_message(char const *text)
    : lazy_message{ std::string{ text ? text : "" } } {}

std::string const &lazy_message::str() const {
  if (state_->producer) {
    std::call_once(state_->once, [this] { state_->text = state_->producer(); });
  }
  return state_->text;
}

bool lazy_message::is_deferred() const { return static_cast<bool>(state_->producer); }

log_event log_event::with_level(log_level new_level) const {
  return log_event{ .level = new_level, .message = message, .fallback = fallback };
}

log_event log_event::with_message(lazy_message new_message) const {
  return log_event{ .level = level, .message = std::move(new_message), .fallback = fallback };
}

log_event make_log(log_level level, lazy_message message) {
  return log_event{ .level = level, .message = std::move(message) };
}

progress_event make_progress(std::uint64_t sequence_id,
                             std::optional<std::uint64_t> total,
                             std::int64_t current,
                             std::string description,
                             progress_phase phase) {
  if (current < 0) {
    throw std::invalid_argument("make_progress: current must be non-negative, got " +
                                std::to_string(current));
  }

  return progress_event{ .sequence_id = sequence_id,
                         .total = total,
                         .current = static_cast<std::uint64_t>(current),
                         .description = std::move(description),
                         .phase = phase };
}

}  // namespace fxlog

#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace fxlog {

// Severity ordinal. Named levels are spaced so callers can slot custom levels
// between them; any int is a valid level and sorts by value.
enum class log_level : int { LOG_DEBUG = 0, LOG_INFO = 10, LOG_WARNING = 50, LOG_ERROR = 100 };

// "DEBUG", "INFO", "WARNING", "ERROR", or "LEVEL<n>" for unnamed values.
std::string level_name(log_level level);

// Message text whose formatting may be deferred. A producer runs at most once, on the
// first str() call; copies share the produced text.
class lazy_message {
 public:
  lazy_message(std::string text);
  lazy_message(char const *text);

  template <typename F>
    requires std::invocable<F &> &&
             std::convertible_to<std::invoke_result_t<F &>, std::string>
  lazy_message(F producer) : state_{ std::make_shared<state>() } {
    state_->producer = std::move(producer);
  }

  std::string const &str() const;
  bool is_deferred() const;

 private:
  struct state {
    std::function<std::string()> producer;
    std::once_flag once;
    std::string text;
  };

  std::shared_ptr<state> state_;
};

struct log_event {
  log_level level;
  lazy_message message;
  bool fallback{ false };  // set on the fallback re-emission; never re-enters fallback

  log_event with_level(log_level new_level) const;
  log_event with_message(lazy_message new_message) const;
};

enum class progress_phase { start, advance, description_change, finish };

std::string_view phase_name(progress_phase phase);

struct progress_event {
  std::uint64_t sequence_id;
  std::optional<std::uint64_t> total;
  std::uint64_t current;
  std::string description;
  progress_phase phase;
};

log_event make_log(log_level level, lazy_message message);

// Throws std::invalid_argument if current is negative.
progress_event make_progress(std::uint64_t sequence_id,
                             std::optional<std::uint64_t> total,
                             std::int64_t current,
                             std::string description,
                             progress_phase phase);

}  // namespace fxlog

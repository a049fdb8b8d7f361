#pragma once

#include "event.h"
#include "util.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace fxlog {

// A handler's verdict on one event.
//   ignore   - not interested; the event continues unchanged, not a delivery
//   forward  - continue outward with a (possibly rewritten) event, not a delivery
//   share    - delivered here, and the event continues so sibling renderers see it
//   consume  - delivered here, propagation stops
template <typename Event>
class disposition {
 public:
  enum class kind { ignore, forward, share, consume };

  static disposition ignore() { return disposition{ kind::ignore, std::nullopt }; }
  static disposition forward(Event event) { return disposition{ kind::forward, std::move(event) }; }
  static disposition share(Event event) { return disposition{ kind::share, std::move(event) }; }
  static disposition consume() { return disposition{ kind::consume, std::nullopt }; }

  kind verdict() const { return kind_; }
  bool delivered() const { return kind_ == kind::share || kind_ == kind::consume; }
  bool propagates() const { return kind_ != kind::consume; }

  // Replacement event for forward/share; empty for ignore/consume.
  std::optional<Event> &event() { return event_; }

 private:
  disposition(kind k, std::optional<Event> event) : kind_{ k }, event_{ std::move(event) } {}

  kind kind_;
  std::optional<Event> event_;
};

using log_disposition = disposition<log_event>;
using progress_disposition = disposition<progress_event>;

// Base for anything installed in a context. Both hooks default to ignore.
class handler {
 public:
  virtual ~handler() = default;

  virtual log_disposition on_log(log_event const &event);
  virtual progress_disposition on_progress(progress_event const &event);
};

// Explicit handler stack. Events are offered innermost (most recently installed)
// first. Installs and removals must happen on one thread; emission is re-entrant, so
// a handler may emit into the context it is installed in.
class context : unmovable {
 public:
  // Scoped installation; destroying it removes exactly its handler wherever it sits.
  class registration : uncopyable {
   public:
    registration() = default;
    ~registration();
    registration(registration &&other) noexcept;
    registration &operator=(registration &&other) noexcept;

    void reset();
    explicit operator bool() const { return ctx_ != nullptr; }

   private:
    friend class context;
    registration(context *ctx, handler *h) : ctx_{ ctx }, handler_{ h } {}

    context *ctx_{ nullptr };
    handler *handler_{ nullptr };
  };

  context() = default;

  // Throws std::logic_error if the handler is already installed here.
  registration install(handler &h);

  // Returns true if some handler delivered (shared or consumed) the event. An
  // undelivered log event is re-emitted once as a WARNING tagged as fallback; an
  // undelivered fallback event is dropped. Undelivered progress events are no-ops.
  bool emit(log_event const &event);
  bool emit(progress_event const &event);

  std::uint64_t next_sequence_id();
  std::size_t depth() const { return handlers_.size(); }

 private:
  void remove(handler *h) noexcept;

  std::vector<handler *> handlers_;  // outermost first
  std::atomic<std::uint64_t> next_sequence_id_{ 1 };
};

}  // namespace fxlog

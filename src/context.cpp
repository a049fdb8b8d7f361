#include "context.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace fxlog {

namespace {

// Walks the handlers installed when emission began, innermost-first. A handler may emit
// re-entrantly or remove others while it runs, so each one is re-checked against the
// live stack before it is offered the event.
template <typename Event, typename Offer>
bool dispatch(std::vector<handler *> const &handlers, Event const &event, Offer offer) {
  std::vector<handler *> const snapshot{ handlers };
  std::optional<Event> rewritten;
  bool delivered{ false };

  for (auto it{ snapshot.rbegin() }; it != snapshot.rend(); ++it) {
    if (std::ranges::find(handlers, *it) == handlers.end()) { continue; }

    Event const &current{ rewritten ? *rewritten : event };
    auto verdict{ offer(**it, current) };
    delivered = delivered || verdict.delivered();
    if (!verdict.propagates()) { break; }
    if (verdict.event()) { rewritten = std::move(*verdict.event()); }
  }

  return delivered;
}

}  // namespace

log_disposition handler::on_log(log_event const &) { return log_disposition::ignore(); }

progress_disposition handler::on_progress(progress_event const &) {
  return progress_disposition::ignore();
}

context::registration::~registration() { reset(); }

context::registration::registration(registration &&other) noexcept
    : ctx_{ std::exchange(other.ctx_, nullptr) },
      handler_{ std::exchange(other.handler_, nullptr) } {}

context::registration &context::registration::operator=(registration &&other) noexcept {
  if (this != &other) {
    reset();
    ctx_ = std::exchange(other.ctx_, nullptr);
    handler_ = std::exchange(other.handler_, nullptr);
  }
  return *this;
}

void context::registration::reset() {
  if (ctx_) { ctx_->remove(handler_); }
  ctx_ = nullptr;
  handler_ = nullptr;
}

context::registration context::install(handler &h) {
  if (std::ranges::find(handlers_, &h) != handlers_.end()) {
    throw std::logic_error{ "fxlog::context::install: handler already installed" };
  }
  handlers_.push_back(&h);
  return registration{ this, &h };
}

void context::remove(handler *h) noexcept {
  if (auto it{ std::ranges::find(handlers_, h) }; it != handlers_.end()) {
    handlers_.erase(it);
  }
}

bool context::emit(log_event const &event) {
  bool const delivered{ dispatch(handlers_, event, [](handler &h, log_event const &e) {
    return h.on_log(e);
  }) };
  if (delivered || event.fallback) { return delivered; }

  log_event fallback_event{ make_log(log_level::LOG_WARNING, lazy_message{ [event] {
    return "No handler processed log message (level=" + level_name(event.level) +
           "): " + event.message.str();
  } }) };
  fallback_event.fallback = true;

  dispatch(handlers_, fallback_event, [](handler &h, log_event const &e) {
    return h.on_log(e);
  });
  return false;
}

bool context::emit(progress_event const &event) {
  return dispatch(handlers_, event, [](handler &h, progress_event const &e) {
    return h.on_progress(e);
  });
}

std::uint64_t context::next_sequence_id() {
  return next_sequence_id_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace fxlog

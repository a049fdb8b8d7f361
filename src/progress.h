#pragma once

#include "context.h"
#include "event.h"
#include "util.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <utility>

namespace fxlog {

// Emits the events of one progress operation into a context. The sequence id is
// allocated at construction. If start() was called, destruction emits FINISH when
// finish() has not run yet, so abandoning a loop early still closes the bar.
class progress_tracker : unmovable {
 public:
  progress_tracker(context &ctx,
                   std::optional<std::uint64_t> total,
                   std::string description = {});
  ~progress_tracker();

  void start();  // throws std::logic_error when called twice
  void advance(std::uint64_t count = 1);
  void set_description(std::string description);
  void finish();  // idempotent

  std::uint64_t sequence_id() const { return sequence_id_; }
  std::uint64_t current() const { return current_; }
  std::optional<std::uint64_t> total() const { return total_; }
  bool finished() const { return finished_; }

 private:
  void emit(progress_phase phase);

  context &ctx_;
  std::uint64_t sequence_id_;
  std::optional<std::uint64_t> total_;
  std::uint64_t current_{ 0 };
  std::string description_;
  bool started_{ false };
  bool finished_{ false };
};

template <typename T>
struct progress_options {
  std::string description;
  std::optional<std::uint64_t> total;  // overrides the range's own size
  std::function<std::string(T const &)> describe;  // description for the upcoming element
};

// Single-pass view that reports consumption of `V` as progress events.
//   begin()    -> START, then DESCRIPTION_CHANGE for the first element (if describe set)
//   ++it       -> ADVANCE (after the loop body), then DESCRIPTION_CHANGE for the next one
//   exhaustion -> FINISH; leaving the loop early -> FINISH from the destructor
// Iteration is identical whether or not any handler renders the events.
template <std::ranges::input_range V>
  requires std::ranges::view<V>
class progress_range : unmovable {
 public:
  using element_t = std::ranges::range_value_t<V>;
  using options_t = progress_options<element_t>;

  struct sentinel {};

  class iterator {
   public:
    using iterator_concept = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = element_t;

    decltype(auto) operator*() const { return **owner_->current_; }

    iterator &operator++() {
      owner_->step();
      return *this;
    }
    void operator++(int) { ++*this; }

    friend bool operator==(iterator const &it, sentinel) { return it.exhausted(); }

   private:
    friend class progress_range;
    explicit iterator(progress_range *owner) : owner_{ owner } {}

    bool exhausted() const { return owner_->at_end(); }

    progress_range *owner_;
  };

  progress_range(context &ctx, V view, options_t options)
      : view_{ std::move(view) },
        options_{ std::move(options) },
        tracker_{ ctx, resolve_total(view_, options_.total), options_.description } {}

  iterator begin() {
    if (current_) {
      throw std::logic_error{ "fxlog::progress_range is single-pass; begin() called twice" };
    }
    current_.emplace(std::ranges::begin(view_));
    tracker_.start();
    arrive();
    return iterator{ this };
  }

  sentinel end() const { return {}; }

  progress_tracker const &tracker() const { return tracker_; }

 private:
  static std::optional<std::uint64_t> resolve_total(V &view,
                                                    std::optional<std::uint64_t> requested) {
    if (requested) { return requested; }
    if constexpr (std::ranges::sized_range<V>) {
      return static_cast<std::uint64_t>(std::ranges::size(view));
    } else {
      return std::nullopt;
    }
  }

  bool at_end() { return *current_ == std::ranges::end(view_); }

  void step() {
    ++*current_;
    tracker_.advance();
    arrive();
  }

  void arrive() {
    if (at_end()) {
      tracker_.finish();
    } else if (options_.describe) {
      tracker_.set_description(options_.describe(**current_));
    }
  }

  V view_;
  options_t options_;
  progress_tracker tracker_;
  std::optional<std::ranges::iterator_t<V>> current_;
};

// Wrap `range` so that iterating it reports progress through `ctx`:
//
//   for (auto const &file : fxlog::progressbar(ctx, files, { .description = "copy" })) {
//     copy(file);
//   }
//
// Lvalue ranges are referenced, rvalue ranges are moved into the returned view.
template <std::ranges::viewable_range R>
  requires std::ranges::input_range<R>
progress_range<std::views::all_t<R>> progressbar(
    context &ctx,
    R &&range,
    progress_options<std::ranges::range_value_t<R>> options = {}) {
  return progress_range<std::views::all_t<R>>{ ctx,
                                               std::views::all(std::forward<R>(range)),
                                               std::move(options) };
}

}  // namespace fxlog

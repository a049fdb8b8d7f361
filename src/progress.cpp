#include "progress.h"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

namespace fxlog {

progress_tracker::progress_tracker(context &ctx,
                                   std::optional<std::uint64_t> total,
                                   std::string description)
    : ctx_{ ctx },
      sequence_id_{ ctx.next_sequence_id() },
      total_{ total },
      description_{ std::move(description) } {}

progress_tracker::~progress_tracker() {
  if (!started_ || finished_) { return; }
  try {
    finish();
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[fxlog progress %llu finish failed: %s]\n",
                 static_cast<unsigned long long>(sequence_id_), e.what());
    std::fflush(stderr);
  }
}

void progress_tracker::start() {
  if (started_) { throw std::logic_error{ "fxlog::progress_tracker::start called twice" }; }
  started_ = true;
  emit(progress_phase::start);
}

void progress_tracker::advance(std::uint64_t count) {
  if (!started_) {
    throw std::logic_error{ "fxlog::progress_tracker::advance called before start" };
  }
  if (finished_) { return; }
  current_ += count;
  emit(progress_phase::advance);
}

void progress_tracker::set_description(std::string description) {
  if (!started_) {
    throw std::logic_error{ "fxlog::progress_tracker::set_description called before start" };
  }
  if (finished_) { return; }
  description_ = std::move(description);
  emit(progress_phase::description_change);
}

void progress_tracker::finish() {
  if (!started_ || finished_) { return; }
  finished_ = true;
  emit(progress_phase::finish);
}

void progress_tracker::emit(progress_phase phase) {
  ctx_.emit(make_progress(sequence_id_,
                          total_,
                          static_cast<std::int64_t>(current_),
                          description_,
                          phase));
}

}  // namespace fxlog

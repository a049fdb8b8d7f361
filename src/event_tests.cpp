#include "event.h"

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>

TEST_CASE("level_name covers named and custom levels") {
  CHECK(fxlog::level_name(fxlog::log_level::LOG_DEBUG) == "DEBUG");
  CHECK(fxlog::level_name(fxlog::log_level::LOG_INFO) == "INFO");
  CHECK(fxlog::level_name(fxlog::log_level::LOG_WARNING) == "WARNING");
  CHECK(fxlog::level_name(fxlog::log_level::LOG_ERROR) == "ERROR");
  CHECK(fxlog::level_name(fxlog::log_level{ 42 }) == "LEVEL42");
}

TEST_CASE("log levels order by value") {
  CHECK(fxlog::log_level::LOG_DEBUG < fxlog::log_level::LOG_INFO);
  CHECK(fxlog::log_level::LOG_INFO < fxlog::log_level{ 20 });
  CHECK(fxlog::log_level{ 20 } < fxlog::log_level::LOG_WARNING);
  CHECK(fxlog::log_level::LOG_WARNING < fxlog::log_level::LOG_ERROR);
}

TEST_CASE("lazy_message defers the producer until first read") {
  int calls{ 0 };
  fxlog::lazy_message const message{ [&calls] {
    ++calls;
    return std::string{ "expensive" };
  } };

  CHECK(message.is_deferred());
  CHECK(calls == 0);

  CHECK(message.str() == "expensive");
  CHECK(message.str() == "expensive");
  CHECK(calls == 1);
}

TEST_CASE("lazy_message copies share produced text") {
  int calls{ 0 };
  fxlog::lazy_message const source{ [&calls] {
    ++calls;
    return std::string{ "shared" };
  } };
  fxlog::lazy_message const copy{ source };

  CHECK(copy.str() == "shared");
  CHECK(source.str() == "shared");
  CHECK(calls == 1);
}

TEST_CASE("lazy_message from plain text") {
  fxlog::lazy_message const from_literal{ "literal" };
  fxlog::lazy_message const from_string{ std::string{ "owned" } };
  fxlog::lazy_message const from_null{ static_cast<char const *>(nullptr) };

  CHECK_FALSE(from_literal.is_deferred());
  CHECK(from_literal.str() == "literal");
  CHECK(from_string.str() == "owned");
  CHECK(from_null.str().empty());
}

TEST_CASE("log_event rewrites keep the other fields") {
  auto event{ fxlog::make_log(fxlog::log_level::LOG_INFO, "hello") };
  event.fallback = true;

  auto const raised{ event.with_level(fxlog::log_level::LOG_ERROR) };
  CHECK(raised.level == fxlog::log_level::LOG_ERROR);
  CHECK(raised.message.str() == "hello");
  CHECK(raised.fallback);

  auto const reworded{ event.with_message("goodbye") };
  CHECK(reworded.level == fxlog::log_level::LOG_INFO);
  CHECK(reworded.message.str() == "goodbye");
  CHECK(reworded.fallback);

  CHECK(event.message.str() == "hello");
}

TEST_CASE("make_progress validates current") {
  auto const event{
    fxlog::make_progress(7, 10, 3, "copy", fxlog::progress_phase::advance)
  };
  CHECK(event.sequence_id == 7);
  REQUIRE(event.total.has_value());
  CHECK(*event.total == 10);
  CHECK(event.current == 3);
  CHECK(event.description == "copy");
  CHECK(event.phase == fxlog::progress_phase::advance);

  CHECK_THROWS_AS(
      fxlog::make_progress(7, std::nullopt, -1, "", fxlog::progress_phase::advance),
      std::invalid_argument);
}

TEST_CASE("phase_name") {
  CHECK(fxlog::phase_name(fxlog::progress_phase::start) == "start");
  CHECK(fxlog::phase_name(fxlog::progress_phase::advance) == "advance");
  CHECK(fxlog::phase_name(fxlog::progress_phase::description_change) ==
        "description_change");
  CHECK(fxlog::phase_name(fxlog::progress_phase::finish) == "finish");
}
